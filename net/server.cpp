// ==================== server.cpp ====================
// TCP server using poll(); accepts one-line requests:
//   CHECK <triple1> | <triple2>
//   VALID <triple>
//   HYP <triple>
// Replies with a human-readable, newline-terminated result.
// Options: -i <ip> -p <port> [--strict]
// ====================================================

#include "algo/EulerBrick.hpp"                // EulerBrick::evaluate
#include "algo/Pythagorean.hpp"               // findHypotenuse, isValidPythagorean
#include "triple/Triple.hpp"                  // Triple::parse

#include <arpa/inet.h>                        // htons, inet_ntop, inet_pton
#include <getopt.h>                           // getopt_long
#include <netdb.h>                            // getaddrinfo/freeaddrinfo
#include <poll.h>                             // poll(), struct pollfd
#include <sys/socket.h>                       // socket/bind/listen/accept
#include <unistd.h>                           // close(), read(), write()

#include <algorithm>                          // remove_if
#include <cctype>                             // std::tolower
#include <cerrno>                             // errno
#include <csignal>                            // std::signal
#include <cstdio>                             // perror
#include <cstdlib>                            // std::exit
#include <iostream>                           // std::cout, std::cerr
#include <sstream>                            // std::(i/o)stringstream
#include <string>                             // std::string
#include <vector>                             // std::vector

// ---------- defaults (overridable on the command line) ----------
static constexpr const char* kDefaultIP   = "127.0.0.1"; // bind address (loopback)
static constexpr const char* kDefaultPort = "5555";      // TCP port (string)
static constexpr int         kBacklog     = 16;          // listen backlog
static constexpr int         kBufSize     = 4096;        // I/O buffer size
static constexpr int         kNoTimeout   = -1;          // poll timeout (-1 = infinite)

static const char* kUsageReply =
    "Unknown. Use:\n"
    "  CHECK <triple1> | <triple2>\n"
    "  VALID <triple>\n"
    "  HYP <triple>\n";

// Keep active sockets here; index 0 is the listening socket.
static std::vector<pollfd> g_fds;                      // global so signal handler can close

// --------- tiny helpers ---------
static std::string lower(std::string s){               // lower-case helper
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}
static void send_all(int fd, const std::string& s) {   // send entire string (best effort)
    const char* p = s.c_str(); std::size_t left = s.size();
    while (left) { ssize_t n = ::send(fd, p, left, 0); if (n <= 0) return; p += n; left -= (std::size_t)n; }
}
static void close_all() {                               // close all tracked fds
    for (auto& p : g_fds) if (p.fd != -1) ::close(p.fd);
    g_fds.clear();
}
static void on_sigint(int){                             // SIGINT handler
    std::cout << "\n[server] SIGINT -> shutdown\n";
    close_all();
    std::_Exit(0);
}
static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [-i <ip>] [-p <port>] [--strict]\n";
    std::exit(1);
}

// ---------- Command handler: one request line -> one reply ----------
static std::string handle_command(const EulerBrick& checker, const std::string& line) {
    std::istringstream iss(line);                                 // tokenize
    std::string kw; iss >> kw;                                    // first word
    std::string rest; std::getline(iss, rest);                    // everything after the keyword
    kw = lower(kw);

    if (kw == "check") {                                          // CHECK a | b
        const auto bar = rest.find('|');
        if (bar == std::string::npos) return "Error: expected CHECK <triple1> | <triple2>\n";
        const auto v = checker.evaluate(rest.substr(0, bar), rest.substr(bar + 1));
        return (v.status == EulerBrick::Status::Ok ? "" : "Error: ") + v.message + "\n";
    }

    if (kw == "valid" || kw == "hyp") {                           // single-triple queries
        const auto t = Triple::parse(rest);
        if (!t) return "Error: expected a triple such as 3,4,5\n";
        if (kw == "valid") {
            return t->label() + (isValidPythagorean(*t) ? " is" : " is not")
                   + " a valid Pythagorean triple\n";
        }
        const auto h = findHypotenuse(*t);
        if (!h) return "No hypotenuse.\n";
        return "Hypotenuse: " + std::to_string(*h) + "\n";
    }

    return kUsageReply;                                           // unknown keyword
}

// ---------- accept a client ----------
static void accept_client(int sfd) {
    sockaddr_storage a{}; socklen_t alen = sizeof(a);             // peer addr storage
    int cfd = ::accept(sfd, (sockaddr*)&a, &alen);                // accept()
    if (cfd < 0) { perror("accept"); return; }                    // guard
    g_fds.push_back({cfd, POLLIN, 0});                            // watch for reads
    std::cout << "[server] client fd=" << cfd << " connected\n";  // log
}

// ---------- read one request from a client and process ----------
static void read_once(const EulerBrick& checker, std::size_t idx) {
    auto& p = g_fds[idx];                                         // pollfd ref
    char buf[kBufSize];                                           // recv buffer
    ssize_t n = ::recv(p.fd, buf, sizeof(buf) - 1, 0);            // receive bytes
    if (n <= 0) {                                                 // disconnect or error
        std::cout << "[server] client " << p.fd << " disconnected\n"; // log
        ::close(p.fd); p.fd = -1; p.events = 0; p.revents = 0;    // mark as closed
        return;                                                   // done
    }
    buf[n] = '\0';                                                // null-terminate buffer
    std::string line(buf);                                        // convert to std::string
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) // trim CR/LF
        line.pop_back();                                          // drop trailing newline
    std::cout << "[server] fd=" << p.fd << " cmd: " << line << "\n"; // log
    send_all(p.fd, handle_command(checker, line));                // parse + execute + reply
}

int main(int argc, char* argv[]) {
    std::string ip = kDefaultIP, port = kDefaultPort; bool strict = false; int li = 0;
    option lo[] = {{"strict", no_argument, nullptr, 'S'}, {nullptr, 0, nullptr, 0}};
    for (int opt; (opt = getopt_long(argc, argv, "i:p:", lo, &li)) != -1; ) {
        if (opt == 'i') ip = optarg;                              // bind address
        else if (opt == 'p') port = optarg;                       // port
        else if (opt == 'S') strict = true;                       // positivity gate
        else usage(argv[0]);
    }

    EulerBrick::Options opts; opts.requirePositive = strict;
    const EulerBrick checker(opts);

    std::signal(SIGINT, on_sigint);                               // install Ctrl+C handler

    addrinfo hints{};                                             // zero-init hints
    hints.ai_family   = AF_INET;                                   // IPv4
    hints.ai_socktype = SOCK_STREAM;                               // TCP
    hints.ai_flags    = AI_PASSIVE;                                // we will bind

    addrinfo* res = nullptr;                                       // result list
    if (getaddrinfo(ip.c_str(), port.c_str(), &hints, &res) != 0) { // resolve bind address
        std::cerr << "[server] cannot resolve " << ip << ":" << port << "\n";
        return 1;
    }

    int sfd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol); // create socket
    if (sfd < 0) { perror("socket"); freeaddrinfo(res); return 1; }         // guard

    int yes = 1;                                                    // opt value
    if (::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0)
        perror("setsockopt");                                       // not fatal: bind may still work

    if (::bind(sfd, res->ai_addr, res->ai_addrlen) < 0) {           // bind to ip:port
        perror("bind"); ::close(sfd); freeaddrinfo(res); return 1;  // cleanup on error
    }
    if (::listen(sfd, kBacklog) < 0) {                              // start listening
        perror("listen"); ::close(sfd); freeaddrinfo(res); return 1;// cleanup on error
    }
    freeaddrinfo(res);                                              // free addr list

    g_fds.push_back({sfd, POLLIN, 0});                              // watch the listener
    std::cout << "[server] listening on " << ip << ":" << port
              << (strict ? " (strict)" : "") << "\n";               // banner

    while (true) {                                                  // event loop
        int nready = ::poll(g_fds.data(), g_fds.size(), kNoTimeout);// wait for events
        if (nready < 0) {                                           // poll error
            if (errno == EINTR) continue;                           // interrupted -> resume
            perror("poll"); break;                                  // otherwise bail
        }
        for (std::size_t i = 0; i < g_fds.size() && nready > 0; ++i) { // scan fds
            auto& p = g_fds[i];                                     // ref
            if (!(p.revents & POLLIN)) continue;                    // only handle readable
            --nready;                                               // one event handled
            if (p.fd == sfd) accept_client(sfd);                    // new connection
            else              read_once(checker, i);                // client data
        }
        g_fds.erase(std::remove_if(g_fds.begin(), g_fds.end(),      // compact vector
                    [](const pollfd& x){ return x.fd == -1; }),
                    g_fds.end());
    }

    close_all();                                                    // close sockets
    return 0;                                                       // done
}
