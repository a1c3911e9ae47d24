// ==========================
// Triple.cpp
// ==========================
// Out-of-line methods of the Triple class: label() and parse().
// ==========================

#include "triple/Triple.hpp"   // include the Triple class declaration
#include <cctype>              // std::isspace, std::isdigit
#include <cerrno>              // errno for strtoll overflow detection
#include <cstdlib>             // std::strtoll
#include <sstream>             // used for building strings in label()
#include <vector>              // token list

// --------------------------
// label
// --------------------------
// Returns "(a, b, c)" in input order.
std::string Triple::label() const {
    std::ostringstream oss;
    oss << "(" << m_v[0] << ", " << m_v[1] << ", " << m_v[2] << ")";
    return oss.str();
}

// ---------- helper: strip leading/trailing whitespace ----------
static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// ---------- helper: strict base-10 integer, optional sign, must fit in long long ----------
static bool to_value(const std::string& tok, Triple::Value& out) {
    if (tok.empty()) return false;
    std::size_t i = (tok[0] == '+' || tok[0] == '-') ? 1 : 0;
    if (i == tok.size()) return false;                     // sign without digits
    for (std::size_t k = i; k < tok.size(); ++k)
        if (!std::isdigit(static_cast<unsigned char>(tok[k]))) return false;

    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(tok.c_str(), &end, 10);
    if (errno == ERANGE || end != tok.c_str() + tok.size()) return false;
    out = v;
    return true;
}

// --------------------------
// parse
// --------------------------
// Purpose:
//   Turn user text into a Triple.
//   1) drop brackets and parentheses
//   2) split on commas (tokens are trimmed)
//   3) a single comma token falls back to splitting on whitespace
//   4) exactly three integer tokens are required
// Returns:
//   the Triple, or std::nullopt on any malformed input.
std::optional<Triple> Triple::parse(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text)
        if (c != '(' && c != ')' && c != '[' && c != ']') cleaned.push_back(c);

    std::vector<std::string> parts;
    std::size_t from = 0;
    for (;;) {
        const std::size_t comma = cleaned.find(',', from);
        parts.push_back(trim(cleaned.substr(from, comma - from)));
        if (comma == std::string::npos) break;
        from = comma + 1;
    }

    if (parts.size() == 1) {                                // no comma: whitespace separated
        parts.clear();
        std::istringstream iss(cleaned);
        std::string t;
        while (iss >> t) parts.push_back(t);
    }

    if (parts.size() != size()) return std::nullopt;

    Values v{};
    for (std::size_t i = 0; i < size(); ++i)
        if (!to_value(parts[i], v[i])) return std::nullopt;
    return Triple(v);
}
