#include <dreamer/location.hpp>

#include <utility>

namespace dreamer
{

location::location(std::string module, std::size_t offset)
  : module(std::move(module)), offset(offset)
{  }

std::string location::to_string() const
{
  return module + ":" + std::to_string(offset);
}

std::ostream& operator<<(std::ostream& os, const location& loc)
{
  return os << loc.to_string();
}

void to_json(nlohmann::json& j, const location& l)
{
  j = nlohmann::json{
    { "module", l.module },
    { "offset", l.offset },
  };
}

void from_json(const nlohmann::json& j, location& l)
{
  l = location { j["module"].get<std::string>(),
                 j["offset"].get<std::size_t>() };
}

}
