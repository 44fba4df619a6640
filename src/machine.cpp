#include <dreamer/machine.hpp>

#include <cassert>
#include <utility>

namespace dreamer
{

std::size_t arity(op_code op)
{
  switch(op)
  {
  default:
    return 0;

  case op_code::LOAD:
  case op_code::JUMP:
  case op_code::NOT:
    return 1;

  case op_code::STORE:
  case op_code::ADD:
  case op_code::SUB:
  case op_code::MUL:
  case op_code::DIV:
  case op_code::MOD:
  case op_code::CMP:
  case op_code::AND:
  case op_code::OR:
  case op_code::XOR:
    return 2;
  }
}

machine::machine(program prog, state initial)
  : prog(std::move(prog)), st(std::move(initial))
{  }

std::variant<state, machine_error> machine::step(state st, const instruction& instr)
{
  const word pc = st.pc;
  if(auto kind = apply(st, instr); kind.has_value())
    return machine_error { *kind, pc, instr.opcode() };

  return st;
}

run_result machine::run()
{
  while(advance(nullptr))
    ;
  return run_result { st, err };
}

run_result machine::run(const observer& obs)
{
  while(advance(&obs))
    ;
  return run_result { st, err };
}

bool machine::run_next_instr()
{ return advance(nullptr); }

bool machine::advance(const observer* obs)
{
  if(is_stopped)
    return false;

  // running off the end of the program is a normal stop
  if(st.pc >= prog.size())
  {
    is_stopped = true;
    return false;
  }

  const instruction& instr = prog[st.pc];
  if(auto kind = apply(st, instr); kind.has_value())
  {
    err = machine_error { *kind, st.pc, instr.opcode() };
    is_stopped = true;
    return false;
  }

  if(obs != nullptr && *obs)
    (*obs)(st, instr);

  if(instr.opcode() == op_code::HALT)
    is_stopped = true;

  return !is_stopped;
}

std::optional<machine_error_kind> machine::apply(state& st, const instruction& instr)
{
  const op_code op = instr.opcode();
  if(st.stack.depth() < arity(op))
    return machine_error_kind::insufficient_arguments;

  switch(op)
  {
  default:
    return machine_error_kind::illegal_instruction;

  case op_code::NOP:
    ++st.pc;
    break;

  case op_code::HALT:
    break;

  case op_code::LOAD:
    {
      const word address = *st.stack.pop();

      // just popped, so there is room for the result
      st.stack.push(st.memory.read(address));
      ++st.pc;
    } break;

  case op_code::STORE:
    {
      const word address = *st.stack.pop();
      const word data = *st.stack.pop();

      st.memory.write(address, data);
      ++st.pc;
    } break;

  case op_code::PUSH:
    {
      if(!st.stack.push(st.reg))
        return machine_error_kind::stack_full;
      ++st.pc;
    } break;

  case op_code::POP:
    {
      auto top = st.stack.pop();
      if(!top.has_value())
        return machine_error_kind::stack_empty;

      st.reg = *top;
      ++st.pc;
    } break;

  case op_code::SET:
    st.reg = instr.literal();
    ++st.pc;
    break;

  // no pc increment, the target is taken as is
  case op_code::JUMP:
    st.pc = *st.stack.pop();
    break;

  case op_code::NOT:
    {
      const word a = *st.stack.pop();

      st.stack.push(~a);
      ++st.pc;
    } break;

  case op_code::ADD:
  case op_code::SUB:
  case op_code::MUL:
  case op_code::DIV:
  case op_code::MOD:
  case op_code::CMP:
  case op_code::AND:
  case op_code::OR:
  case op_code::XOR:
    return apply_binary(st, op);
  }
  return std::nullopt;
}

std::optional<machine_error_kind> machine::apply_binary(state& st, op_code op)
{
  // a is the top of the stack, b the element beneath it
  const auto& elems = st.stack.elements();
  assert(elems.size() >= 2);

  const word a = elems[elems.size() - 1];
  const word b = elems[elems.size() - 2];

  std::optional<word> c;
  switch(op)
  {
  default:
    assert(false && "not a binary opcode");
    return machine_error_kind::illegal_instruction;

  case op_code::ADD: c = checked_add(a, b); break;
  case op_code::SUB: c = checked_sub(a, b); break;
  case op_code::MUL: c = checked_mul(a, b); break;
  case op_code::DIV: c = checked_div(a, b); break;
  case op_code::MOD: c = checked_mod(a, b); break;
  case op_code::CMP: c = a == b ? 1 : 0; break;
  case op_code::AND: c = a & b; break;
  case op_code::OR:  c = a | b; break;
  case op_code::XOR: c = a ^ b; break;
  }
  if(!c.has_value())
    return machine_error_kind::arithmetic_overflow;

  st.stack.pop();
  st.stack.pop();
  st.stack.push(*c);
  ++st.pc;

  return std::nullopt;
}

}
