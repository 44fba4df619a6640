#pragma once

#include <dreamer/diagnostic.hpp>
#include <dreamer/location.hpp>

#include <fmt/format.h>

namespace dreamer
{

namespace diagnostic_db
{

#define DREAMER_DB_ENTRY(lv, name, txt) static const auto name = [](const location& loc) \
{ return mk_diag::lv(loc, __COUNTER__, txt); }

#define DREAMER_DB_ENTRY_ARG(lv, name, txt) static const auto name = [](const location& loc, auto t) \
{ return mk_diag::lv(loc, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define DREAMER_DB_ENTRY_ARG2(lv, name, txt) static const auto name = [](const location& loc, auto t1, auto t2) \
{ return mk_diag::lv(loc, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

namespace args
{

DREAMER_DB_ENTRY(error, unknown_arg, "Unknown command line argument!");
DREAMER_DB_ENTRY(error, no_program, "No program file given.");
DREAMER_DB_ENTRY_ARG(error, format_not_present, "Selected output format \"{}\" is unknown!");
DREAMER_DB_ENTRY_ARG(error, missing_value, "Option \"{}\" expects a value.");
DREAMER_DB_ENTRY_ARG(error, cannot_read, "Cannot read program file \"{}\".");
DREAMER_DB_ENTRY_ARG(error, cannot_write, "Cannot open \"{}\" for writing.");

}

namespace decode
{

DREAMER_DB_ENTRY(error, no_data, "Nothing to decode.");
DREAMER_DB_ENTRY_ARG(error, invalid_opcode, "Byte 0x{:02X} is not a valid opcode.");
DREAMER_DB_ENTRY(error, missing_literal, "\"set\" expects an 8 byte literal, but none is present.");
DREAMER_DB_ENTRY_ARG(error, inappropriate_literal, "\"{}\" does not take a literal.");
DREAMER_DB_ENTRY_ARG(error, incomplete_literal, "\"set\" expects an 8 byte literal, instead got {} byte(s).");
DREAMER_DB_ENTRY(info, empty_program, "Program is empty, nothing will be executed.");

}

namespace exec
{

DREAMER_DB_ENTRY_ARG2(error, insufficient_arguments, "\"{}\" expects {} stack element(s), instead got less.");
DREAMER_DB_ENTRY_ARG(error, stack_full, "\"{}\" on a full stack.");
DREAMER_DB_ENTRY_ARG(error, stack_empty, "\"{}\" on an empty stack.");
DREAMER_DB_ENTRY_ARG(error, arithmetic_overflow, "\"{}\" overflows or divides by zero.");
DREAMER_DB_ENTRY_ARG(error, illegal_instruction, "\"{}\" can not be executed.");

}

#undef DREAMER_DB_ENTRY
#undef DREAMER_DB_ENTRY_ARG
#undef DREAMER_DB_ENTRY_ARG2

}

}
