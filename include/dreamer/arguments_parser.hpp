#pragma once

#include <functional>
#include <string_view>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace dreamer
{

namespace arguments
{

// fills the global config, problems end up in the diagnostics
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  using option_parser = std::function<std::any(const std::vector<std::string_view>&)>;

  /**
   * One command line option. Names are separated by commas, a name starting
   * with '-' is a long option ("--name"), the empty name marks the option
   * that receives arguments not preceded by any option. A trailing '='
   * allows "--name=value".
   */
  struct CmdOption
  {
    std::vector<std::string_view> opt;
    std::string_view description;

    std::any default_value;
    std::string_view default_value_str;

    std::size_t argc;
    option_parser parser;

    bool has_equals;
  };

  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      CmdOptionsAdder& operator()(std::string_view opt_list, std::string_view description,
                                  std::any default_value, std::string_view default_value_str,
                                  std::size_t argc, const option_parser& f);

      CmdOptions* ot;
    };
    friend struct CmdParse;
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}

}
