#pragma once

#include <dreamer/instruction.hpp>

#include <cstddef>
#include <variant>
#include <vector>

namespace dreamer
{

/**
 * Ordered sequence of decoded instructions. The program counter
 * indexes into this sequence, never into the raw bytes.
 */
struct program
{
  program(const std::vector<instruction>& instr) : instructions(instr)
  {  }

  program() : instructions()
  {  }

  std::size_t size() const
  { return instructions.size(); }

  bool empty() const
  { return instructions.empty(); }

  const instruction& operator[](std::size_t idx) const
  { return instructions[idx]; }

  std::vector<unsigned char> to_u8_vec() const;
private:
  std::vector<instruction> instructions;
};

struct decode_error
{
  instruction_error kind;
  std::size_t offset; // byte offset of the failing opcode
};

std::variant<program, decode_error> decode(const std::vector<unsigned char>& bytes);

inline std::vector<unsigned char> encode(const program& prog)
{ return prog.to_u8_vec(); }

}
