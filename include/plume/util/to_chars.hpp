#ifndef PLUME_TO_CHARS_HPP
#define PLUME_TO_CHARS_HPP

#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "plume/fwd.hpp"

namespace plume {

using Big_Integer = boost::multiprecision::cpp_int;

/// @brief Appends the decimal representation of `x` to `out`.
void append_integer(std::u8string& out, Integer x);

/// @brief Appends the digits of the magnitude of `x` in the given `base` to `out`,
/// without sign or prefix.
/// `base` shall be one of 2, 8, 10, or 16.
void append_integer_magnitude(std::u8string& out, const Big_Integer& x, int base, bool to_upper);

/// @brief Appends the decimal representation of `x` to `out`.
void append_big_integer(std::u8string& out, const Big_Integer& x);

/// @brief Appends the shortest representation of `x` which round-trips,
/// which is the form used by `stringify` and `representation`:
/// fixed notation with at least one fractional digit (`10.0`, `0.001`) for
/// decimal exponents in [-4, 16), and scientific notation with a signed exponent of at least
/// two digits otherwise (`1e+16`, `1.5e-05`).
/// Infinities and NaN are written as `inf`, `-inf`, and `nan`.
void append_float_shortest(std::u8string& out, Float x);

enum struct Float_Notation : unsigned char {
    /// @brief `printf`-style `%f`.
    fixed,
    /// @brief `printf`-style `%e`.
    scientific,
    /// @brief `printf`-style `%g`.
    general,
};

/// @brief Appends `x` in the given notation with the given precision,
/// like the corresponding `printf` conversion, to `out`.
/// If `alternate` is `true`, the result always contains a decimal point,
/// and trailing zeros are not removed in general notation.
/// Infinities and NaN are written in lowercase unless `to_upper` is set.
void append_float(
    std::u8string& out,
    Float x,
    Float_Notation notation,
    int precision,
    bool alternate,
    bool to_upper
);

} // namespace plume

#endif
