#pragma once

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace dreamer
{

enum class output_format
{
  undef,
  text,
  json,
};

NLOHMANN_JSON_SERIALIZE_ENUM( output_format, {
  { output_format::undef, "undef" },
  { output_format::text, "text" },
  { output_format::json, "json" },
})

struct config_t
{
  bool print_help { false };
  bool trace { false };

  output_format format { output_format::text };

  std::string program_file;
  std::string output_file; // empty means stdout
};

inline config_t config;

}
