// ==================== client.cpp ====================
// Sends 1 command line to the server and prints the reply.
// Usage examples:
//   ./euler_client CHECK 44,117,125 '|' 117,240,267
//   ./euler_client -p 6000 HYP 5,3,4
// ====================================================

#include <arpa/inet.h>    // inet_pton
#include <getopt.h>       // getopt
#include <netinet/in.h>   // sockaddr_in
#include <sys/socket.h>   // socket/connect/send/recv
#include <unistd.h>       // close, shutdown

#include <cstdint>        // uint16_t
#include <cstdio>         // perror
#include <cstdlib>        // std::atoi
#include <iostream>       // std::cout, std::cerr
#include <sstream>        // std::ostringstream
#include <string>         // std::string

static constexpr const char* kDefaultIP   = "127.0.0.1"; // server IP
static constexpr const char* kDefaultPort = "5555";      // server port (string)

static int usage(const char* prog) {
    std::cout
      << "Usage:\n"
      << "  " << prog << " [-i <ip>] [-p <port>] CHECK <triple1> '|' <triple2>\n"
      << "  " << prog << " [-i <ip>] [-p <port>] VALID <triple>\n"
      << "  " << prog << " [-i <ip>] [-p <port>] HYP <triple>\n";
    return 1;
}

int main(int argc, char** argv) {
    std::string ip = kDefaultIP, port = kDefaultPort;
    // '+' stops at the first command word so triples like -3,4,5 are not taken as flags
    for (int opt; (opt = getopt(argc, argv, "+i:p:")) != -1; ) {
        if (opt == 'i') ip = optarg;
        else if (opt == 'p') port = optarg;
        else return usage(argv[0]);
    }

    // Require at least one token after the options.
    if (optind >= argc) return usage(argv[0]);

    // Reconstruct the exact line the server expects, terminated by '\n'.
    std::ostringstream oss;
    for (int i = optind; i < argc; ++i) {
        if (i > optind) oss << ' ';
        oss << argv[i];
    }
    oss << '\n';
    const std::string line = oss.str();

    // --- connect to server ---
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) { perror("socket"); return 1; }

    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(static_cast<uint16_t>(std::atoi(port.c_str()))); // port string -> network byte order
    if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) <= 0) {
        std::cerr << "[client] bad address: " << ip << "\n"; ::close(fd); return 1;
    }
    if (connect(fd, (sockaddr*)&sa, sizeof(sa)) < 0) { perror("connect"); ::close(fd); return 1; }

    // --- send request ---
    if (::send(fd, line.c_str(), line.size(), 0) != (ssize_t)line.size()) {
        perror("send"); ::close(fd); return 1;
    }

    // --- receive single reply (up to 4 KB) ---
    char buf[4096];
    const ssize_t n = ::recv(fd, buf, sizeof(buf) - 1, 0);
    if (n < 0) { perror("recv"); ::close(fd); return 1; }
    if (n > 0) { buf[n] = '\0'; std::cout << buf; }

    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
    return 0;
}
