#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <dreamer/instruction.hpp>
#include <dreamer/program.hpp>

#include <limits>
#include <vector>

using namespace dreamer;

namespace
{

std::vector<unsigned char> set_bytes(word w)
{ return instruction::set(w).to_u8_vec(); }

decode_error decode_failure(const std::vector<unsigned char>& bytes)
{
  auto res = decode(bytes);
  REQUIRE(std::holds_alternative<decode_error>(res));
  return std::get<decode_error>(res);
}

program decode_success(const std::vector<unsigned char>& bytes)
{
  auto res = decode(bytes);
  REQUIRE(std::holds_alternative<program>(res));
  return std::get<program>(res);
}

}

TEST_CASE( "single byte instructions", "[instruction]" ) {

  SECTION( "every payload free opcode decodes and encodes back" ) {
    for(unsigned byte = 0x00; byte <= 0x14; ++byte)
    {
      if(byte == 0x06)
        continue;

      const std::vector<unsigned char> bytes = { static_cast<unsigned char>(byte) };
      auto prog = decode_success(bytes);

      REQUIRE(prog.size() == 1);
      REQUIRE(prog[0] == instruction(static_cast<op_code>(byte)));
      REQUIRE(prog[0].literal() == 0);
      REQUIRE(prog.to_u8_vec() == bytes);
    }
  }

  SECTION( "opcode bytes" ) {
    REQUIRE(opcode_to_byte(op_code::NOP) == 0x00);
    REQUIRE(opcode_to_byte(op_code::SET) == 0x06);
    REQUIRE(opcode_to_byte(op_code::JUMP_IF) == 0x0A);
    REQUIRE(opcode_to_byte(op_code::XOR) == 0x14);

    REQUIRE(byte_to_opcode(0x0B) == op_code::ADD);
    REQUIRE(byte_to_opcode(0x15) == op_code::UNKNOWN);
    REQUIRE(byte_to_opcode(0xFF) == op_code::UNKNOWN);
  }

  SECTION( "mnemonics" ) {
    REQUIRE(instruction(op_code::JUMP_IF).to_string() == "jumpif");
    REQUIRE(instruction::set(42).to_string() == "set 42");
    REQUIRE(opcode_to_str(op_code::MOD) == "mod");
  }
}

TEST_CASE( "literal load", "[instruction]" ) {

  SECTION( "payload is big-endian" ) {
    auto bytes = set_bytes(0x0102030405060708ULL);

    REQUIRE((bytes == std::vector<unsigned char>{ 0x06, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 }));
  }

  SECTION( "boundary values survive the 9 byte encoding" ) {
    for(word w : { word(0), word(1), word(0xFF), word(0x100), word(0x8000000000000000ULL),
                   std::numeric_limits<word>::max() })
    {
      auto prog = decode_success(set_bytes(w));

      REQUIRE(prog.size() == 1);
      REQUIRE(prog[0].opcode() == op_code::SET);
      REQUIRE(prog[0].literal() == w);
      REQUIRE(prog[0].to_u8_vec().size() == 9);
    }
  }

  SECTION( "literals only matter for SET" ) {
    REQUIRE(instruction::set(3) != instruction::set(4));
    REQUIRE(instruction::set(0) != instruction(op_code::NOP));
  }

  SECTION( "SET always carries its literal" ) {
    auto zero = instruction::set(0);

    REQUIRE(zero.opcode() == op_code::SET);
    REQUIRE(zero.literal() == 0);
    REQUIRE((zero.to_u8_vec() == std::vector<unsigned char>{ 0x06, 0, 0, 0, 0, 0, 0, 0, 0 }));
    REQUIRE(zero.to_string() == "set 0");
  }
}

TEST_CASE( "decoding a single slice", "[instruction]" ) {
  auto error_of = [](const std::vector<unsigned char>& bytes)
  {
    auto res = instruction::from_bytes(bytes.data(), bytes.size());
    REQUIRE(std::holds_alternative<instruction_error>(res));
    return std::get<instruction_error>(res);
  };

  SECTION( "empty slice" ) {
    auto res = instruction::from_bytes(nullptr, 0);
    REQUIRE(std::holds_alternative<instruction_error>(res));
    REQUIRE(std::get<instruction_error>(res) == instruction_error::no_data);
  }

  SECTION( "unknown byte" ) {
    REQUIRE(error_of({ 0x15 }) == instruction_error::invalid_opcode);
    REQUIRE(error_of({ 0xAB }) == instruction_error::invalid_opcode);
  }

  SECTION( "SET without literal" ) {
    REQUIRE(error_of({ 0x06 }) == instruction_error::missing_literal);
  }

  SECTION( "SET with a short literal" ) {
    REQUIRE(error_of({ 0x06, 0x00, 0x00 }) == instruction_error::incomplete_literal);
  }

  SECTION( "SET with a long literal" ) {
    REQUIRE(error_of({ 0x06, 0, 0, 0, 0, 0, 0, 0, 0, 0 }) == instruction_error::incomplete_literal);
  }

  SECTION( "literal on an opcode without payload" ) {
    REQUIRE(error_of({ 0x0B, 0x01 }) == instruction_error::inappropriate_literal);
  }
}

TEST_CASE( "decoding programs", "[decoder]" ) {

  SECTION( "set push set push add halt" ) {
    std::vector<unsigned char> bytes;
    for(auto& part : { set_bytes(5), std::vector<unsigned char>{ 0x04 },
                       set_bytes(3), std::vector<unsigned char>{ 0x04, 0x0B, 0x01 } })
      bytes.insert(bytes.end(), part.begin(), part.end());

    auto prog = decode_success(bytes);

    REQUIRE(prog.size() == 6);
    REQUIRE(prog[0] == instruction::set(5));
    REQUIRE(prog[1] == instruction(op_code::PUSH));
    REQUIRE(prog[2] == instruction::set(3));
    REQUIRE(prog[3] == instruction(op_code::PUSH));
    REQUIRE(prog[4] == instruction(op_code::ADD));
    REQUIRE(prog[5] == instruction(op_code::HALT));

    REQUIRE(encode(prog) == bytes);
  }

  SECTION( "empty input is an empty program" ) {
    auto prog = decode_success({});

    REQUIRE(prog.empty());
    REQUIRE(prog.to_u8_vec().empty());
  }

  SECTION( "incomplete literal is reported at the opcode" ) {
    auto err = decode_failure({ 0x06, 0x00, 0x00, 0x00, 0x01 });

    REQUIRE(err.kind == instruction_error::incomplete_literal);
    REQUIRE(err.offset == 0);
  }

  SECTION( "lone SET at the end" ) {
    auto err = decode_failure({ 0x00, 0x00, 0x06 });

    REQUIRE(err.kind == instruction_error::incomplete_literal);
    REQUIRE(err.offset == 2);
  }

  SECTION( "unknown opcode after a literal" ) {
    auto bytes = set_bytes(7);
    bytes.push_back(0x04);
    bytes.push_back(0x42);
    bytes.push_back(0x01);

    auto err = decode_failure(bytes);

    REQUIRE(err.kind == instruction_error::invalid_opcode);
    REQUIRE(err.offset == 10);
  }

  SECTION( "literal bytes are never read as opcodes" ) {
    // payload full of invalid opcode bytes
    auto prog = decode_success(set_bytes(0xFFFFFFFFFFFFFFFFULL));

    REQUIRE(prog.size() == 1);
  }

  SECTION( "reserved opcodes decode" ) {
    auto prog = decode_success({ 0x07, 0x08, 0x0A });

    REQUIRE(prog.size() == 3);
    REQUIRE(prog[0].opcode() == op_code::READ);
    REQUIRE(prog[1].opcode() == op_code::WRITE);
    REQUIRE(prog[2].opcode() == op_code::JUMP_IF);
  }
}
