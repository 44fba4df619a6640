#pragma once

#include <dreamer/word.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace dreamer
{

struct stack
{
public:
  static constexpr std::size_t max_depth = 65535;
public:
  stack() : data()
  {  }

  // false if the stack already holds max_depth elements
  bool push(word elem);
  std::optional<word> pop();
  std::optional<word> peek() const;

  std::size_t depth() const
  { return data.size(); }

  bool full() const
  { return data.size() == max_depth; }

  bool empty() const
  { return data.empty(); }

  // bottom to top
  const std::vector<word>& elements() const
  { return data; }

  bool operator==(const stack& other) const
  { return data == other.data; }
  bool operator!=(const stack& other) const
  { return !(*this == other); }
private:
  std::vector<word> data;
};

void to_json(nlohmann::json& j, const stack& s);
void from_json(const nlohmann::json& j, stack& s);

}
