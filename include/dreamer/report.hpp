#pragma once

#include <dreamer/machine.hpp>
#include <dreamer/program.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace dreamer
{

// turns a failed decode into a diagnostic, the bytes are needed to name the culprit
nlohmann::json to_diagnostic(const decode_error& err, const std::string& module,
                             const std::vector<unsigned char>& bytes);

nlohmann::json to_diagnostic(const machine_error& err, const std::string& module);

}
