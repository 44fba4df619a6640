#include <dreamer/stack.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace dreamer
{

bool stack::push(word elem)
{
  if(full())
    return false;

  data.push_back(elem);
  return true;
}

std::optional<word> stack::pop()
{
  if(data.empty())
    return std::nullopt;

  const word top = data.back();
  data.pop_back();
  return top;
}

std::optional<word> stack::peek() const
{
  if(data.empty())
    return std::nullopt;
  return data.back();
}

void to_json(nlohmann::json& j, const stack& s)
{
  j = s.elements();
}

void from_json(const nlohmann::json& j, stack& s)
{
  s = stack();
  for(auto& v : j)
  {
    if(!s.push(v.get<word>()))
      throw std::length_error(fmt::format("stack holds at most {} elements", stack::max_depth));
  }
}

}
