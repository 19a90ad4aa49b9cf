// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_input_transformer.hpp
 * @brief Rewrites interactive cell syntax into plain script source.
 *
 * Handles classic `>>> ` / `... ` prompts, `%name args` line magics and
 * `%%name args` cell magics. Native source passes through unchanged and
 * line numbers are preserved for everything except cell magics.
 */

#pragma once

#include <string>
#include <string_view>

namespace nbimport {

class InputTransformer {
public:
    std::string TransformCell(std::string_view raw) const;

    // Removes `>>> ` / `... ` prefixes when the first non-blank line has one.
    static std::string StripClassicPrompts(std::string_view raw);

    // Quotes `text` as a script string literal.
    static std::string EscapeString(std::string_view text);
};

} // namespace nbimport
