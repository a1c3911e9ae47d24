#pragma once
#include "triple/Triple.hpp"    // Triple value type
#include <optional>

// Exact arithmetic for squared side lengths. Any Triple::Value squared, and
// the sum of two such squares, fits without overflow.
using Wide = unsigned __int128;

// v*v computed exactly (sign is irrelevant)
Wide square(Triple::Value v);

// Floor of the square root of n, exact for every 128-bit n (Newton's method)
Wide isqrt(Wide n);

// True if n is k*k for some integer k
bool isPerfectSquare(Wide n);

// Which element is the hypotenuse? Tries a²+b²==c², a²+c²==b², b²+c²==a²
// in that order and returns the first designated value. Empty if none holds.
// Zero and negative values are not rejected here.
std::optional<Triple::Value> findHypotenuse(const Triple& t);

// Sorted check: smallest² + middle² == largest². Accepts (0,0,0).
bool isValidPythagorean(const Triple& t);

// All three values strictly positive
bool isPositive(const Triple& t);
