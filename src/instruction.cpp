#include <dreamer/instruction.hpp>

#include <fmt/format.h>

#include <cassert>

namespace dreamer
{

std::string_view opcode_to_str(op_code op)
{
  switch(op)
  {
  case op_code::NOP:     return "nop";
  case op_code::HALT:    return "halt";
  case op_code::LOAD:    return "load";
  case op_code::STORE:   return "store";
  case op_code::PUSH:    return "push";
  case op_code::POP:     return "pop";
  case op_code::SET:     return "set";
  case op_code::READ:    return "read";
  case op_code::WRITE:   return "write";
  case op_code::JUMP:    return "jump";
  case op_code::JUMP_IF: return "jumpif";
  case op_code::ADD:     return "add";
  case op_code::SUB:     return "sub";
  case op_code::MUL:     return "mul";
  case op_code::DIV:     return "div";
  case op_code::MOD:     return "mod";
  case op_code::CMP:     return "cmp";
  case op_code::AND:     return "and";
  case op_code::OR:      return "or";
  case op_code::NOT:     return "not";
  case op_code::XOR:     return "xor";
  case op_code::UNKNOWN: return "unknown";
  }
  assert(false && "unreachable");
  return "unknown";
}

std::variant<instruction, instruction_error> instruction::from_bytes(const unsigned char* data, std::size_t len)
{
  if(len == 0)
    return instruction_error::no_data;

  const op_code op = byte_to_opcode(data[0]);
  if(len > 1)
  {
    if(op != op_code::SET)
      return instruction_error::inappropriate_literal;
    if(len != encoded_size(op_code::SET))
      return instruction_error::incomplete_literal;

    // payload is big-endian
    word value = 0;
    for(std::size_t i = 1; i < len; ++i)
      value = (value << bits_per_byte) | data[i];

    return instruction::set(value);
  }

  if(op == op_code::SET)
    return instruction_error::missing_literal;
  if(op == op_code::UNKNOWN)
    return instruction_error::invalid_opcode;

  return instruction(op);
}

std::vector<unsigned char> instruction::to_u8_vec() const
{
  std::vector<unsigned char> bytes;
  bytes.reserve(encoded_size(opc));

  bytes.push_back(opcode_to_byte(opc));
  if(opc == op_code::SET)
  {
    for(std::size_t i = word_bytes; i --> 0; )
      bytes.push_back(static_cast<unsigned char>((lit >> (i * bits_per_byte)) & 0xFF));
  }
  return bytes;
}

std::string instruction::to_string() const
{
  if(opc == op_code::SET)
    return fmt::format("{} {}", opcode_to_str(opc), lit);
  return std::string(opcode_to_str(opc));
}

}
