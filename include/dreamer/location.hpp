#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <cstddef>
#include <ostream>
#include <string>

namespace dreamer
{

/**
 * Where a diagnostic points to. For decoding problems the offset is a byte
 * offset into the input, for execution problems it is the program counter.
 */
struct location
{
  std::string module;
  std::size_t offset { 0 };

  location() = default;

  location(std::string module, std::size_t offset);

  std::string to_string() const;

  bool operator==(const location& other) const
  { return module == other.module && offset == other.offset; }

  friend std::ostream& operator<<(std::ostream& os, const location& loc);
};

void to_json(nlohmann::json& j, const location& l);
void from_json(const nlohmann::json& j, location& l);

}

namespace std
{
  template<>
  struct hash<::dreamer::location>
  {
    std::size_t operator()(const ::dreamer::location& l) const
    {
      return ((std::hash<std::string>()(l.module)
               ^ (std::hash<std::size_t>()(l.offset) << 1)) >> 1);
    }
  };
}
