#pragma once

#include <dreamer/config.hpp>
#include <dreamer/state.hpp>

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace dreamer
{

// whole file as raw bytes, empty optional if it cannot be read
std::optional<std::vector<unsigned char>> read_program(const std::string& path);

void write_state(std::FILE* file, const state& st, output_format format);

/**
 * Loads, decodes and executes the program named in the global config and
 * writes the final state. Every failure ends up in the diagnostics.
 */
struct runner
{
  void go();
};

}
