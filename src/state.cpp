#include <dreamer/state.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iterator>

namespace dreamer
{

std::string state::to_string() const
{
  fmt::memory_buffer buf;

  fmt::format_to(std::back_inserter(buf), "pc: {}, reg: {}, stack: [{}], memory: {{",
                 pc, reg, fmt::join(stack.elements(), ", "));

  const auto cells = memory.sorted();
  for(auto it = cells.begin(); it != cells.end(); ++it)
  {
    fmt::format_to(std::back_inserter(buf), "{}{}: {}",
                   it == cells.begin() ? "" : ", ", it->first, it->second);
  }
  fmt::format_to(std::back_inserter(buf), "}}");

  return fmt::to_string(buf);
}

std::ostream& operator<<(std::ostream& os, const state& st)
{
  return os << st.to_string();
}

void to_json(nlohmann::json& j, const state& s)
{
  j = nlohmann::json{
    { "pc", s.pc },
    { "reg", s.reg },
    { "stack", s.stack },
    { "memory", s.memory },
  };
}

void from_json(const nlohmann::json& j, state& s)
{
  s.pc = j["pc"].get<word>();
  s.reg = j["reg"].get<word>();
  s.stack = j["stack"].get<stack>();
  s.memory = j["memory"].get<memory>();
}

}
