// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file nb_token.hpp
 * @brief Lexical units of nbscript cells.
 *
 * Literal tokens arrive decoded: integers and floats carry their value,
 * strings carry their contents with escapes resolved. Every token knows the
 * line and column it started at inside its cell.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace nbimport {

enum class Tok : uint8_t {
    End,            // end of the cell
    Name,
    Int,
    Real,
    Text,

    // keywords
    KwFunc, KwVar, KwLet, KwIf, KwElse, KwWhile, KwReturn,
    KwImport, KwThrow, KwTrue, KwFalse, KwNil,

    // punctuation
    Plus, Minus, Star, Slash, Percent,
    Assign, PlusAssign, MinusAssign, StarAssign, SlashAssign, PercentAssign,
    Eq, Ne, Lt, Gt, Le, Ge,
    AndAnd, OrOr, Bang,
    LParen, RParen, LBrace, RBrace, Comma, Dot, Semi,
};

struct SourcePos {
    uint32_t line{1};
    uint32_t column{1};
};

struct Token {
    Tok kind{Tok::End};
    SourcePos pos;
    std::string text;                                    // spelling; decoded contents for Text
    std::variant<std::monostate, int64_t, double> number;

    bool is(Tok k) const { return kind == k; }
    int64_t int_value() const { return std::get<int64_t>(number); }
    double real_value() const { return std::get<double>(number); }
};

// How a token kind is named in diagnostics: "'+='", "name", "end of input".
const char* describe(Tok kind);

// Keyword kind for `word`, or Tok::Name when it is not reserved.
Tok keyword_or_name(const std::string& word);

} // namespace nbimport
