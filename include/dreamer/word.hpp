#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace dreamer
{

using word = std::uint64_t;

constexpr std::size_t bits_per_byte = 8;
constexpr std::size_t word_bytes = std::numeric_limits<word>::digits / bits_per_byte;

// checked arithmetic over the machine word, empty on overflow, underflow or zero divisor
inline std::optional<word> checked_add(word a, word b)
{
  if(a > std::numeric_limits<word>::max() - b)
    return std::nullopt;
  return a + b;
}

inline std::optional<word> checked_sub(word a, word b)
{
  if(a < b)
    return std::nullopt;
  return a - b;
}

inline std::optional<word> checked_mul(word a, word b)
{
  if(a != 0 && b > std::numeric_limits<word>::max() / a)
    return std::nullopt;
  return a * b;
}

inline std::optional<word> checked_div(word a, word b)
{
  if(b == 0)
    return std::nullopt;
  return a / b;
}

inline std::optional<word> checked_mod(word a, word b)
{
  if(b == 0)
    return std::nullopt;
  return a % b;
}

}
