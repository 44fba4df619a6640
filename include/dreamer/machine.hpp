#pragma once

#include <dreamer/instruction.hpp>
#include <dreamer/program.hpp>
#include <dreamer/state.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <variant>

namespace dreamer
{

enum class machine_error_kind : unsigned char
{
  insufficient_arguments,
  stack_full,
  stack_empty,
  arithmetic_overflow,
  illegal_instruction,
};

NLOHMANN_JSON_SERIALIZE_ENUM( machine_error_kind, {
  { machine_error_kind::insufficient_arguments, "insufficient-arguments" },
  { machine_error_kind::stack_full, "stack-full" },
  { machine_error_kind::stack_empty, "stack-empty" },
  { machine_error_kind::arithmetic_overflow, "arithmetic-overflow" },
  { machine_error_kind::illegal_instruction, "illegal-instruction" },
})

struct machine_error
{
  machine_error_kind kind;

  word pc;        // index of the failing instruction
  op_code opcode;
};

struct run_result
{
  state final_state; // last good state if error is set
  std::optional<machine_error> error;

  bool ok() const
  { return !error.has_value(); }
};

// invoked with the post-step state after every executed instruction
using observer = std::function<void(const state&, const instruction&)>;

// number of stack elements an opcode consumes
std::size_t arity(op_code op);

struct machine
{
public:
  machine(program prog, state initial = state());

  // pure transition function
  static std::variant<state, machine_error> step(state st, const instruction& instr);

  run_result run();
  run_result run(const observer& obs);

  // executes a single instruction, false once the machine has stopped
  bool run_next_instr();

  bool stopped() const
  { return is_stopped; }

  const state& current_state() const
  { return st; }

  const std::optional<machine_error>& last_error() const
  { return err; }
private:
  bool advance(const observer* obs);

  // leaves st untouched if an error is returned
  static std::optional<machine_error_kind> apply(state& st, const instruction& instr);
  static std::optional<machine_error_kind> apply_binary(state& st, op_code op);
private:
  program prog;
  state st;

  bool is_stopped { false };
  std::optional<machine_error> err;
};

}
