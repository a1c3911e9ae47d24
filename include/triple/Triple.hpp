#pragma once                              // ensure this header is included only once per translation unit

#include <array>         // fixed storage for the three values
#include <cstddef>       // defines std::size_t type
#include <optional>      // parse() reports failure as an empty optional
#include <set>           // distinct() returns the element set
#include <stdexcept>     // defines std::out_of_range
#include <string>        // used for std::string in label()

// ==========================
// Triple
// ==========================
// An ordered group of three integers read as the sides of a right
// triangle in no particular order (two legs and a hypotenuse).
// - Immutable once constructed
// - Positional equality: (3,4,5) != (4,3,5)
// - distinct() gives the set view used for shared-edge detection
// ==========================

class Triple {
public:
    // Type aliases for readability
    using Value  = long long;                  // side length type
    using Values = std::array<Value, 3>;       // storage type

    // ---- Constructors ----

    Triple(Value a, Value b, Value c) : m_v{{a, b, c}} {}

    explicit Triple(const Values& v) : m_v(v) {}

    // ---- Public API ----

    // Number of elements (always 3)
    static constexpr std::size_t size() noexcept { return 3; }

    // Unchecked element access
    Value operator[](std::size_t i) const { return m_v[i]; }

    // Checked element access
    Value at(std::size_t i) const {
        checkIndex(i);
        return m_v[i];
    }

    const Values& values() const noexcept { return m_v; }

    Values::const_iterator begin() const noexcept { return m_v.begin(); }
    Values::const_iterator end() const noexcept { return m_v.end(); }

    // Element set; repeated values collapse into one entry
    std::set<Value> distinct() const { return std::set<Value>(m_v.begin(), m_v.end()); }

    bool operator==(const Triple& o) const noexcept { return m_v == o.m_v; }
    bool operator!=(const Triple& o) const noexcept { return !(*this == o); }

    // Return a human-readable form "(a, b, c)" (implemented in Triple.cpp)
    std::string label() const;

    // Parse free-form text such as "3,4,5", "(3,4,5)", "[3, 4, 5]" or "3 4 5"
    // (implemented in Triple.cpp). Never throws.
    static std::optional<Triple> parse(const std::string& text);

private:
    Values m_v;                                // the three values, input order

    // Helper: check if element index is valid
    static void checkIndex(std::size_t i) {
        if (i >= size())
            throw std::out_of_range("triple index out of range");
    }
}; // end class Triple
