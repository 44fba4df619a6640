#include <dreamer/diagnostic_db.hpp>
#include <dreamer/diagnostic.hpp>
#include <dreamer/machine.hpp>
#include <dreamer/program.hpp>
#include <dreamer/report.hpp>
#include <dreamer/runner.hpp>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <utility>

namespace dreamer
{

std::optional<std::vector<unsigned char>> read_program(const std::string& path)
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if(!file.is_open())
    return std::nullopt;

  std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());
  if(file.bad())
    return std::nullopt;

  return bytes;
}

void write_state(std::FILE* file, const state& st, output_format format)
{
  switch(format)
  {
  default:
  case output_format::text:
    fmt::print(file, "{}\n", st.to_string());
    break;

  case output_format::json:
    fmt::print(file, "{}\n", nlohmann::json(st).dump());
    break;
  }
}

void runner::go()
{
  auto bytes = read_program(config.program_file);
  if(!bytes.has_value())
  {
    diagnostic <<= diagnostic_db::args::cannot_read(location { "args", 0 }, config.program_file);
    return;
  }

  auto decoded = decode(*bytes);
  if(std::holds_alternative<decode_error>(decoded))
  {
    diagnostic <<= to_diagnostic(std::get<decode_error>(decoded), config.program_file, *bytes);
    return;
  }
  auto& prog = std::get<program>(decoded);

  if(prog.empty())
    diagnostic <<= diagnostic_db::decode::empty_program(location { config.program_file, 0 });

  std::unique_ptr<std::FILE, decltype(&std::fclose)> outfile(nullptr, &std::fclose);
  if(!config.output_file.empty())
  {
    outfile.reset(std::fopen(config.output_file.c_str(), "w"));
    if(outfile == nullptr)
    {
      diagnostic <<= diagnostic_db::args::cannot_write(location { "args", 0 }, config.output_file);
      return;
    }
  }
  std::FILE* out = outfile != nullptr ? outfile.get() : stdout;

  machine mach(std::move(prog));

  run_result result = [&mach]()
  {
    if(!config.trace)
      return mach.run();

    fmt::print("{}\n", mach.current_state().to_string());
    return mach.run([](const state& st, const instruction& instr)
                    { fmt::print("[{}] {}\n", instr.to_string(), st.to_string()); });
  }();

  // a failed run still reports the last good state
  if(!result.ok())
    diagnostic <<= to_diagnostic(*result.error, config.program_file);

  write_state(out, result.final_state, config.format);
}

}
