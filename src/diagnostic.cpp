#include <dreamer/diagnostic.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cassert>

namespace dreamer
{

namespace mk_diag
{

static nlohmann::json make(diag_level level, const location& loc,
                           std::uint_fast16_t code, const std::string_view& message)
{
  nlohmann::json j;

  j["location"] = loc;

  j["level"] = level;

  j["code"] = code;
  j["message"] = message;

  return j;
}

nlohmann::json error(const location& loc,
                     std::uint_fast16_t code, const std::string_view& message)
{ return make(diag_level::error, loc, code, message); }

nlohmann::json warn(const location& loc,
                    std::uint_fast16_t code, const std::string_view& message)
{ return make(diag_level::warn, loc, code, message); }

nlohmann::json info(const location& loc,
                    std::uint_fast16_t code, const std::string_view& message)
{ return make(diag_level::info, loc, code, message); }

}

diagnostics_manager::~diagnostics_manager()
{ assert((printed || data.empty()) && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  data[msg["location"].get<location>()].push_back(msg);
  printed = false;

  return *this;
}

const std::vector<nlohmann::json>& diagnostics_manager::at(const location& loc) const
{
  static const std::vector<nlohmann::json> none;

  auto it = data.find(loc);
  if(it == data.end())
    return none;
  return it->second;
}

void diagnostics_manager::print(std::FILE* file)
{
  if(printed)
    return;
  for(auto& w : data)
  {
    for(auto& v : w.second)
    {
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}:{}: ",
          v["location"]["module"].get<std::string>(),
          v["location"]["offset"].get<std::size_t>());

      auto lv = v["level"].get<diag_level>();

      switch(lv)
      {
      default:
      case diag_level::error:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(DR-{}) ", v["code"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::info:
        {
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::warn:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(DR-{}) ", v["code"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;
      }
      fmt::print(file, fg(fmt::color::white), "\n");
    }
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}

}
