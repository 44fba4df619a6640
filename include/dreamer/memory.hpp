#pragma once

#include <dreamer/word.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>

#include <utility>
#include <vector>

namespace dreamer
{

/**
 * Sparse word-addressed memory. Cells that were never written read as zero,
 * and nothing is ever removed.
 */
struct memory
{
  memory() : cells()
  {  }

  word read(word address) const;
  void write(word address, word data);

  // number of cells that have been written
  std::size_t size() const
  { return cells.size(); }

  // written cells ordered by address
  std::vector<std::pair<word, word>> sorted() const;

  bool operator==(const memory& other) const
  { return cells == other.cells; }
  bool operator!=(const memory& other) const
  { return !(*this == other); }
private:
  tsl::robin_map<word, word> cells;
};

void to_json(nlohmann::json& j, const memory& m);
void from_json(const nlohmann::json& j, memory& m);

}
