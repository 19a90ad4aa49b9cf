// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#pragma once

#include "nb_token.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace nbimport {

// Splits one unit of nbscript into tokens. The result always ends with a
// Tok::End token. Malformed input raises ParseError naming `origin`
// ("<path> [cell 3]", "<stdin>").
std::vector<Token> Scan(std::string_view source, const std::string& origin = "<input>");

} // namespace nbimport
