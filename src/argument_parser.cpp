#include <dreamer/arguments_parser.hpp>
#include <dreamer/diagnostic_db.hpp>
#include <dreamer/diagnostic.hpp>
#include <dreamer/config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <cassert>

using namespace std::string_view_literals;

namespace dreamer
{

namespace arguments
{

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("dreamer", "Executes a Dreamer program.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", 0, [](auto){ return std::make_any<bool>(true); })
    ("t,-trace", "Prints the state after every executed instruction.", std::make_any<bool>(false), "false", 0,
      [](auto){ return std::make_any<bool>(true); })
    (",p,-program", "Program file to execute.", std::make_any<std::string>(), "", 1,
      [](auto x){ return std::make_any<std::string>(x.front()); })
    ("o,-output", "File to write the final state to.", std::make_any<std::string>(), "stdout", 1,
      [](auto x){ return std::make_any<std::string>(x.front()); })
    ("-format=", "Format of the final state, \"text\" or \"json\".", std::make_any<output_format>(output_format::text), "text", 1,
      [](auto x)
      {
        assert(x.size() == 1);
        auto& v = x.front();

        nlohmann::json easy_conversion = v;
        if(easy_conversion.get<output_format>() != output_format::undef)
          return std::make_any<output_format>(easy_conversion.get<output_format>());

        diagnostic <<= diagnostic_db::args::format_not_present(location { "args", 0 }, v);
        return std::make_any<output_format>(output_format::text);
      })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
    return;
  }
  config.trace = std::any_cast<bool>(map["t"]);
  config.program_file = std::any_cast<std::string>(map["p"]);
  config.output_file = std::any_cast<std::string>(map["o"]);
  config.format = std::any_cast<output_format>(map["-format="]);

  if(config.program_file.empty())
    diagnostic <<= diagnostic_db::args::no_program(location { "args", 0 });
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, std::size_t argc, const option_parser& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;

  auto it = opt_list.find(',');
  while(it != std::string_view::npos)
  {
    opts.emplace_back(opt_list.substr(0, it));
    opt_list.remove_prefix(it + 1); // + 1 to remove comma

    it = opt_list.find(',');
  }
  opts.emplace_back(opt_list);

  for(auto& opt : opts)
  {
    if(!opt.empty() && opt.back() == '=')
    {
      opt.remove_suffix(1); // <- get rid of equals
      has_equals = true;
    }
  }

  ot->data.push_back(CmdOption { opts, description, default_value, default_value_str, argc, f, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  void reset_cur_opt()
  {
    cur_opt = std::nullopt;
    opt_args.clear();

    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f.empty()) // if we have an implicit argument, make this the initial current option
          cur_opt = v;
      }
    }
  }

  std::map<std::string, std::any>& parse()
  {
    for(auto& str : *args)
    {
      if(str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str);
    }
    check_pending();

    return *map;
  }

  // an option still waiting for its arguments never got them
  void check_pending()
  {
    if(!cur_opt.has_value() || opt_args.size() == cur_opt->argc)
      return;
    if(std::find(cur_opt->opt.begin(), cur_opt->opt.end(), ""sv) != cur_opt->opt.end())
      return;

    diagnostic <<= diagnostic_db::args::missing_value(location { "args", 0 }, fmt::format("-{}", cur_opt->opt.back()));
  }

  void store()
  {
    std::any a = cur_opt->parser(opt_args);
    for(auto& o : cur_opt->opt)
      (*map)[static_cast<std::string>(o) + (cur_opt->has_equals ? "=" : "")] = a;
  }

  void parse_arg(const std::string_view& str)
  {
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(location { "args", 0 });
      return;
    }
    opt_args.push_back(str);

    // options take a fixed number of arguments, afterwards we are back to the implicit one
    if(opt_args.size() == cur_opt->argc)
    {
      store();
      reset_cur_opt();
    }
  }

  void parse_option(const std::string_view& str)
  {
    check_pending();

    cur_opt = std::nullopt;
    opt_args.clear();
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.find(f) == 1 && str.size() - 1 == f.size()) // first char of str is `-`, after that it should match
          cur_opt = v;
      }
    }
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(location { "args", 0 });
      reset_cur_opt();
    }
    else if(cur_opt->argc == 0)
    {
      store();
      reset_cur_opt();
    }
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::optional<CmdOption> cur_opt;
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = v.default_value;
    }
  }
  if(argc - 1 == 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split at equals
    std::string_view v = argv[i];
    if(auto it = v.find('='); v.size() > 1 && v[0] == '-' && it != std::string_view::npos)
    {
      // grab the option
      args.push_back(v.substr(0, it));

      // grab its argument
      args.push_back(v.substr(it + 1)); // + 1 to remove equals
    }
    else
      args.push_back(v);
  }

  return CmdParse(args, map, *this);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto it = v.opt.begin(); it != v.opt.end(); ++it)
    {
      if(it->empty())
        continue;
      args += (it->front() == '-' ? "-" : "") + std::string("-") + std::string(*it);
      if(std::next(it) != v.opt.end())
        args += ", ";
    }
    fmt::print(f, "  {:<24} {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}

}
