#include <dreamer/memory.hpp>

#include <algorithm>

namespace dreamer
{

word memory::read(word address) const
{
  auto it = cells.find(address);
  if(it == cells.end())
    return 0;
  return it->second;
}

void memory::write(word address, word data)
{
  cells[address] = data;
}

std::vector<std::pair<word, word>> memory::sorted() const
{
  std::vector<std::pair<word, word>> v(cells.begin(), cells.end());

  std::sort(v.begin(), v.end(), [](auto& lhs, auto& rhs) { return lhs.first < rhs.first; });
  return v;
}

void to_json(nlohmann::json& j, const memory& m)
{
  j = m.sorted();
}

void from_json(const nlohmann::json& j, memory& m)
{
  m = memory();
  for(auto& cell : j.get<std::vector<std::pair<word, word>>>())
    m.write(cell.first, cell.second);
}

}
