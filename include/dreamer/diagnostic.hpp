#pragma once

#include <dreamer/location.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>

#include <string_view>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace dreamer
{

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const location& loc,
                     std::uint_fast16_t code, const std::string_view& message);

nlohmann::json warn(const location& loc,
                    std::uint_fast16_t code, const std::string_view& message);

nlohmann::json info(const location& loc,
                    std::uint_fast16_t code, const std::string_view& message);
}

struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  bool empty() const { return data.empty(); }

  // all messages logged at the given location, in logging order
  const std::vector<nlohmann::json>& at(const location& loc) const;

  void print(std::FILE* file);
  int error_code() const;

  inline void reset() { err = 0; printed = false; data.clear(); }
private:
  tsl::robin_map<location, std::vector<nlohmann::json>> data;

  int err { 0 };

  bool printed { false };
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();

}
