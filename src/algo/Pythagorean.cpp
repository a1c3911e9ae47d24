#include "algo/Pythagorean.hpp"           // declarations for this file
#include <algorithm>                      // std::sort, std::all_of

Wide square(Triple::Value v) {
    // magnitude without negating LLONG_MIN
    const unsigned long long m = v < 0 ? 0ULL - static_cast<unsigned long long>(v)
                                       : static_cast<unsigned long long>(v);
    return static_cast<Wide>(m) * m;
}

// -----------------------------
// Integer square root (floor), Newton iteration from an over-estimate
// -----------------------------
Wide isqrt(Wide n) {
    if (n < 2) return n;                                          // 0 and 1 are their own roots

    int bits = 0;                                                 // bit length of n
    for (Wide t = n; t != 0; t >>= 1) ++bits;

    Wide x = static_cast<Wide>(1) << ((bits + 1) / 2);            // 2^ceil(bits/2) >= sqrt(n)
    Wide y = (x + n / x) / 2;                                     // first Newton step
    while (y < x) {                                               // decreases monotonically to floor(sqrt(n))
        x = y;
        y = (x + n / x) / 2;
    }
    return x;
}

bool isPerfectSquare(Wide n) {
    const Wide r = isqrt(n);
    return r * r == n;
}

std::optional<Triple::Value> findHypotenuse(const Triple& t) {
    const Wide a2 = square(t[0]), b2 = square(t[1]), c2 = square(t[2]);
    if (a2 + b2 == c2) return t[2];
    if (a2 + c2 == b2) return t[1];
    if (b2 + c2 == a2) return t[0];
    return std::nullopt;                                          // not a Pythagorean triple in any order
}

bool isValidPythagorean(const Triple& t) {
    Triple::Values v = t.values();
    std::sort(v.begin(), v.end());
    return square(v[0]) + square(v[1]) == square(v[2]);
}

bool isPositive(const Triple& t) {
    return std::all_of(t.begin(), t.end(), [](Triple::Value x) { return x > 0; });
}
