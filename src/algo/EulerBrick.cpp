#include "algo/EulerBrick.hpp"                // include our header so the compiler sees the class
#include "algo/Pythagorean.hpp"               // findHypotenuse, isValidPythagorean, exact squares
#include <sstream>                            // ostringstream to format messages
#include <vector>                             // remaining-leg lists

static constexpr const char* kFormatHint =
    "Please enter valid triples in the format: 3,4,5 or (3,4,5) or [3,4,5]";

// -----------------------------
// Brick label
// -----------------------------
std::string Brick::label() const {
    std::ostringstream oss;
    oss << edges[0] << " x " << edges[1] << " x " << edges[2]
        << " (face diagonals " << diagonal1 << ", " << diagonal2 << ", " << diagonal3 << ")";
    return oss.str();
}

// -----------------------------
// Helper: elements of t other than the hypotenuse and the shared edge,
// in input order (duplicates are kept so degenerate triples are caught)
// -----------------------------
static std::vector<Triple::Value> remaining_legs(const Triple& t, Triple::Value hyp, Triple::Value shared) {
    std::vector<Triple::Value> legs;
    for (Triple::Value x : t)
        if (x != hyp && x != shared) legs.push_back(x);
    return legs;
}

// -----------------------------
// Core predicate
// -----------------------------
std::optional<Brick> EulerBrick::assemble(const Triple& t1, const Triple& t2) {
    // 1) exactly one value in common between the two element sets
    const auto s1 = t1.distinct();
    const auto s2 = t2.distinct();
    std::vector<Triple::Value> common;
    for (Triple::Value x : s1)
        if (s2.count(x)) common.push_back(x);
    if (common.size() != 1) return std::nullopt;
    const Triple::Value shared = common.front();

    // 2) both triples need a hypotenuse under some ordering
    const auto hyp1 = findHypotenuse(t1);
    const auto hyp2 = findHypotenuse(t2);
    if (!hyp1 || !hyp2) return std::nullopt;

    // 3) the shared value must be an edge, not a face diagonal, in both faces
    if (shared == *hyp1 || shared == *hyp2) return std::nullopt;

    // 4) one leg left over on each face
    const auto legs1 = remaining_legs(t1, *hyp1, shared);
    const auto legs2 = remaining_legs(t2, *hyp2, shared);
    if (legs1.size() != 1 || legs2.size() != 1) return std::nullopt;
    const Triple::Value dim1 = legs1.front();
    const Triple::Value dim3 = legs2.front();

    // 5) the third face diagonal must be an integer (exact test, no floating point)
    const Wide third2 = square(dim1) + square(dim3);
    const Wide third  = isqrt(third2);
    if (third * third != third2) return std::nullopt;

    Brick b;
    b.edges     = Triple::Values{{dim1, shared, dim3}};
    b.diagonal1 = *hyp1;
    b.diagonal2 = *hyp2;
    b.diagonal3 = static_cast<unsigned long long>(third);     // < 2^64 since third2 < 2^127
    return b;
}

bool EulerBrick::isEulerPair(const Triple& t1, const Triple& t2) {
    return assemble(t1, t2).has_value();
}

// -----------------------------
// Input gate used by evaluate()
// -----------------------------
bool EulerBrick::acceptable(const Triple& t) const {
    if (m_opts.requirePositive && !isPositive(t)) return false;
    return isValidPythagorean(t);
}

EulerBrick::Verdict EulerBrick::evaluate(const std::string& text1, const std::string& text2) const {
    const auto t1 = Triple::parse(text1);
    const auto t2 = Triple::parse(text2);
    if (!t1 || !t2) {
        Verdict v;
        v.status  = Status::ParseError;
        v.message = kFormatHint;
        return v;
    }
    return evaluate(*t1, *t2);
}

EulerBrick::Verdict EulerBrick::evaluate(const Triple& t1, const Triple& t2) const {
    Verdict v;

    if (t1 == t2) {
        v.status  = Status::IdenticalTriples;
        v.message = "Please enter two different triples";
        return v;
    }
    if (!acceptable(t1)) {
        v.status  = Status::FirstInvalid;
        v.message = "First triple " + t1.label() + " is not a valid Pythagorean triple";
        return v;
    }
    if (!acceptable(t2)) {
        v.status  = Status::SecondInvalid;
        v.message = "Second triple " + t2.label() + " is not a valid Pythagorean triple";
        return v;
    }

    v.status = Status::Ok;
    v.brick  = assemble(t1, t2);
    v.euler  = v.brick.has_value();

    std::ostringstream oss;
    if (v.euler) {
        oss << "Yes: " << t1.label() << " and " << t2.label()
            << " can be two faces of an Euler brick: " << v.brick->label();
    } else {
        oss << "No: " << t1.label() << " and " << t2.label()
            << " cannot be two faces of an Euler brick";
    }
    v.message = oss.str();
    return v;
}
