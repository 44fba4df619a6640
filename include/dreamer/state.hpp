#pragma once

#include <dreamer/memory.hpp>
#include <dreamer/stack.hpp>
#include <dreamer/word.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace dreamer
{

/**
 * Everything an instruction may observe or change. A fresh state is all
 * zero: pc at the first instruction, empty register, stack and memory.
 */
struct state
{
  word pc { 0 };
  word reg { 0 };

  dreamer::stack stack;
  dreamer::memory memory;

  word program_counter() const
  { return pc; }

  std::string to_string() const;

  bool operator==(const state& other) const
  { return pc == other.pc && reg == other.reg && stack == other.stack && memory == other.memory; }
  bool operator!=(const state& other) const
  { return !(*this == other); }

  friend std::ostream& operator<<(std::ostream& os, const state& st);
};

void to_json(nlohmann::json& j, const state& s);
void from_json(const nlohmann::json& j, state& s);

}
