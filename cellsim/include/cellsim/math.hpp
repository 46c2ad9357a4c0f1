#pragma once

#include <cmath>
#include <limits>

namespace csim {
namespace math {

template <typename T>
T constexpr pi = 3.1415926535897932384626433832795l;

template <typename T = double>
T constexpr infinity = std::numeric_limits<T>::infinity();

template <typename T>
T constexpr square(T a) {
    return a*a;
}

// Area of circle radius r.
template <typename T>
T constexpr area_circle(T r) {
    return pi<T> * square(r);
}

// Lateral surface area of a cylinder of length L and diameter d.
template <typename T>
T constexpr area_cylinder(T L, T d) {
    return pi<T> * d * L;
}

// Linear interpolation by u in interval [a,b]: (1-u)*a + u*b.
template <typename T, typename U>
T lerp(T a, T b, U u) {
    return std::fma(T(u), b, std::fma(T(-u), a, a));
}

// Value of x/(exp(x)-1) with care taken to handle x=0 case
template <typename T>
inline
T exprelr(T x) {
    // If abs(x) is less than epsilon return 1, else calculate the result directly.
    return (T(1)==T(1)+x)? T(1): x/std::expm1(x);
}

} // namespace math
} // namespace csim
