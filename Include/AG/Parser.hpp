#pragma once

#include "AG/AST.hpp"
#include <string>
#include <string_view>
#include <stdexcept>

namespace ag {

struct ParseError final : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Parse a knowledge base from a string (full file content)
Program parseProgram(std::string_view source);

// Convenience: parse a file from disk
Program parseFile(const std::string& path);

} // namespace ag
