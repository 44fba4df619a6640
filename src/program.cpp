#include <dreamer/program.hpp>

#include <algorithm>
#include <iterator>

namespace dreamer
{

std::vector<unsigned char> program::to_u8_vec() const
{
  std::vector<unsigned char> v;
  v.reserve(instructions.size());

  for(auto& instr : instructions)
  {
    const auto& intermediate = instr.to_u8_vec();

    std::move(intermediate.begin(), intermediate.end(), std::back_inserter(v));
  }

  v.shrink_to_fit();
  return v;
}

std::variant<program, decode_error> decode(const std::vector<unsigned char>& bytes)
{
  std::vector<instruction> instrs;

  std::size_t pos = 0;
  while(pos < bytes.size())
  {
    const op_code op = byte_to_opcode(bytes[pos]);

    // SET takes the opcode plus its literal, everything else a single byte.
    // A truncated literal hands over whatever tail is left.
    std::size_t len = encoded_size(op);
    if(pos + len > bytes.size())
      len = bytes.size() - pos;

    if(op == op_code::SET && len == 1)
      return decode_error { instruction_error::incomplete_literal, pos };

    auto res = instruction::from_bytes(bytes.data() + pos, len);
    if(std::holds_alternative<instruction_error>(res))
      return decode_error { std::get<instruction_error>(res), pos };

    instrs.push_back(std::get<instruction>(res));
    pos += len;
  }
  return program(instrs);
}

}
