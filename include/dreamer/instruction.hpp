#pragma once

#include <dreamer/word.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <string>
#include <cstdint>
#include <cassert>
#include <variant>
#include <vector>

namespace dreamer
{

enum class op_code : unsigned char
{
  NOP     = 0x00,
  HALT    = 0x01,
  LOAD    = 0x02,
  STORE   = 0x03,
  PUSH    = 0x04,
  POP     = 0x05,
  SET     = 0x06,
  READ    = 0x07,
  WRITE   = 0x08,
  JUMP    = 0x09,
  JUMP_IF = 0x0A,
  ADD     = 0x0B,
  SUB     = 0x0C,
  MUL     = 0x0D,
  DIV     = 0x0E,
  MOD     = 0x0F,
  CMP     = 0x10,
  AND     = 0x11,
  OR      = 0x12,
  NOT     = 0x13,
  XOR     = 0x14,
  UNKNOWN
};

constexpr op_code byte_to_opcode(unsigned char byte)
{
  if(byte >= static_cast<unsigned char>(op_code::UNKNOWN))
    return op_code::UNKNOWN;
  return static_cast<op_code>(byte);
}

constexpr unsigned char opcode_to_byte(op_code op)
{ return static_cast<unsigned char>(op); }

std::string_view opcode_to_str(op_code op);

enum class instruction_error : unsigned char
{
  no_data,
  invalid_opcode,
  missing_literal,
  inappropriate_literal,
  incomplete_literal,
};

NLOHMANN_JSON_SERIALIZE_ENUM( instruction_error, {
  { instruction_error::no_data, "no-data" },
  { instruction_error::invalid_opcode, "invalid-opcode" },
  { instruction_error::missing_literal, "missing-literal" },
  { instruction_error::inappropriate_literal, "inappropriate-literal" },
  { instruction_error::incomplete_literal, "incomplete-literal" },
})

/**
 * A decoded instruction. Only SET carries a payload, the literal
 * is zero for every other opcode.
 */
struct instruction
{
  // SET needs its literal, see instruction::set
  instruction(op_code op) : opc(op), lit(0)
  { assert(op != op_code::SET && "SET is built through instruction::set"); }

  static instruction set(word value)
  { return instruction(op_code::SET, value); }

  // decodes exactly one encoded instruction occupying the whole slice
  static std::variant<instruction, instruction_error> from_bytes(const unsigned char* data, std::size_t len);

  std::vector<unsigned char> to_u8_vec() const;

  // mnemonic, followed by the literal for SET
  std::string to_string() const;

  op_code opcode() const
  { return opc; }

  word literal() const
  { return lit; }

  bool operator==(const instruction& other) const
  { return opc == other.opc && lit == other.lit; }
  bool operator!=(const instruction& other) const
  { return !(*this == other); }
private:
  instruction(op_code op, word value) : opc(op), lit(value)
  {  }
private:
  op_code opc;
  word lit;
};

// encoded length of an instruction that starts with the given opcode
constexpr std::size_t encoded_size(op_code op)
{ return op == op_code::SET ? 1 + word_bytes : 1; }

}
