#include <dreamer/diagnostic_db.hpp>
#include <dreamer/report.hpp>

#include <cassert>

namespace dreamer
{

static nlohmann::json describe(const decode_error& err, const location& loc,
                               const std::vector<unsigned char>& bytes)
{
  const unsigned byte = err.offset < bytes.size() ? bytes[err.offset] : 0U;

  switch(err.kind)
  {
  case instruction_error::no_data:
    return diagnostic_db::decode::no_data(loc);
  case instruction_error::invalid_opcode:
    return diagnostic_db::decode::invalid_opcode(loc, byte);
  case instruction_error::missing_literal:
    return diagnostic_db::decode::missing_literal(loc);
  case instruction_error::inappropriate_literal:
    return diagnostic_db::decode::inappropriate_literal(loc, opcode_to_str(byte_to_opcode(byte)));
  case instruction_error::incomplete_literal:
    return diagnostic_db::decode::incomplete_literal(loc, bytes.size() - err.offset - 1);
  }
  assert(false && "unreachable");
  return diagnostic_db::decode::no_data(loc);
}

static nlohmann::json describe(const machine_error& err, const location& loc)
{
  const auto name = opcode_to_str(err.opcode);

  switch(err.kind)
  {
  case machine_error_kind::insufficient_arguments:
    return diagnostic_db::exec::insufficient_arguments(loc, name, arity(err.opcode));
  case machine_error_kind::stack_full:
    return diagnostic_db::exec::stack_full(loc, name);
  case machine_error_kind::stack_empty:
    return diagnostic_db::exec::stack_empty(loc, name);
  case machine_error_kind::arithmetic_overflow:
    return diagnostic_db::exec::arithmetic_overflow(loc, name);
  case machine_error_kind::illegal_instruction:
    return diagnostic_db::exec::illegal_instruction(loc, name);
  }
  assert(false && "unreachable");
  return diagnostic_db::exec::illegal_instruction(loc, name);
}

nlohmann::json to_diagnostic(const decode_error& err, const std::string& module,
                             const std::vector<unsigned char>& bytes)
{
  auto j = describe(err, location { module, err.offset }, bytes);
  j["kind"] = err.kind;

  return j;
}

nlohmann::json to_diagnostic(const machine_error& err, const std::string& module)
{
  auto j = describe(err, location { module, static_cast<std::size_t>(err.pc) });
  j["kind"] = err.kind;

  return j;
}

}
