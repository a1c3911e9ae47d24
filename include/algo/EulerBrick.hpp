#pragma once                              // ensure this header is included only once per translation unit
#include "triple/Triple.hpp"              // Triple value type used by every entry point
#include <optional>                       // assemble() returns an optional Brick
#include <string>                         // messages for the presentation layers

/**
 * @brief A cuboid recovered from two face triples.
 *        edges = {leg of face 1, shared edge, leg of face 2}.
 */
struct Brick {
    Triple::Values     edges;             // the three edge lengths
    Triple::Value      diagonal1;         // hypotenuse of the first face
    Triple::Value      diagonal2;         // hypotenuse of the second face
    unsigned long long diagonal3;         // diagonal of the face spanned by the two unshared legs

    // "44 x 117 x 240 (face diagonals 125, 267, 244)"
    std::string label() const;
};

/**
 * @brief Decides whether two Pythagorean triples can be adjacent faces of an Euler brick.
 *        isEulerPair()/assemble() are the pure predicate; evaluate() adds the
 *        input checks every front end performs before asking it.
 */
class EulerBrick {
public:
    struct Options {
        bool requirePositive = false;     // also reject triples with zero or negative values
    };

    enum class Status { Ok, ParseError, IdenticalTriples, FirstInvalid, SecondInvalid };

    struct Verdict {
        Status               status = Status::Ok;
        bool                 euler  = false;  // meaningful only when status == Ok
        std::optional<Brick> brick;           // set when euler is true
        std::string          message;         // user-facing text
    };

    EulerBrick() : m_opts() {}
    explicit EulerBrick(Options opts) : m_opts(opts) {}

    const Options& options() const noexcept { return m_opts; }

    // True iff the triples share exactly one value, it is a leg of both, and
    // the two remaining legs have an integer diagonal. Never throws.
    static bool isEulerPair(const Triple& t1, const Triple& t2);

    // Same decision, returning the brick on success.
    static std::optional<Brick> assemble(const Triple& t1, const Triple& t2);

    // Parse both texts, reject malformed/identical/non-Pythagorean input, then decide.
    Verdict evaluate(const std::string& text1, const std::string& text2) const;

    // As above for already parsed triples.
    Verdict evaluate(const Triple& t1, const Triple& t2) const;

private:
    Options m_opts;

    bool acceptable(const Triple& t) const;
};
