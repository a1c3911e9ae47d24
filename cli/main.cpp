// ==========================
// euler_check: command-line front end
// ==========================
// Parses: -a <triple> -b <triple> [--strict] [--example]
// Checks whether the two triples can be adjacent faces of an Euler brick.
// Exit code: 0 = Euler face pair, 2 = not a pair, 1 = usage or input error.
// ==========================

#include "algo/EulerBrick.hpp"  // EulerBrick::evaluate
#include <getopt.h>             // getopt_long for command-line parsing
#include <cstdlib>              // std::exit
#include <iostream>             // I/O
#include <string>               // std::string

static constexpr const char* kExample1 = "44,117,125";   // preset used by --example
static constexpr const char* kExample2 = "117,240,267";

static void usage(const char* prog) {                      // print usage and exit
    std::cerr << "Usage: " << prog
              << " -a <triple> -b <triple> [--strict] [--example]\n"
              << "  triples: 3,4,5 or (3,4,5) or [3,4,5] or \"3 4 5\"\n";
    std::exit(1);
}

int main(int argc, char* argv[]) {                         // entry point
    std::string first, second; bool strict = false, example = false; int li = 0; // parsing state
    option lo[] = {{"strict",  no_argument, nullptr, 'S'},
                   {"example", no_argument, nullptr, 'X'},
                   {"help",    no_argument, nullptr, 'h'},
                   {nullptr, 0, nullptr, 0}};               // long options

    for (int opt; (opt = getopt_long(argc, argv, "a:b:h", lo, &li)) != -1; ) { // parse flags
        if (opt == 'a') first = optarg;                    // first triple
        else if (opt == 'b') second = optarg;              // second triple
        else if (opt == 'S') strict = true;                // positivity gate
        else if (opt == 'X') example = true;               // preset pair
        else usage(argv[0]);                               // -h or invalid flag
    }

    if (example) {                                         // preset fills only what is missing
        if (first.empty()) first = kExample1;
        if (second.empty()) second = kExample2;
    }
    if (first.empty() || second.empty() || optind != argc) usage(argv[0]); // both triples required

    EulerBrick::Options opts; opts.requirePositive = strict;
    const EulerBrick checker(opts);
    const auto v = checker.evaluate(first, second);        // parse, validate, decide

    if (v.status != EulerBrick::Status::Ok) {              // rejected input
        std::cerr << v.message << "\n";
        return 1;
    }
    std::cout << v.message << "\n";                        // verdict
    return v.euler ? 0 : 2;
}
