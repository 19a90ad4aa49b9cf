#include "pch.h"
#include "nb_token.hpp"

namespace nbimport {

namespace {

struct Spelling {
    Tok kind;
    const char* text;
};

constexpr Spelling kKeywords[] = {
    {Tok::KwFunc, "func"},     {Tok::KwVar, "var"},       {Tok::KwLet, "let"},
    {Tok::KwIf, "if"},         {Tok::KwElse, "else"},     {Tok::KwWhile, "while"},
    {Tok::KwReturn, "return"}, {Tok::KwImport, "import"}, {Tok::KwThrow, "throw"},
    {Tok::KwTrue, "true"},     {Tok::KwFalse, "false"},   {Tok::KwNil, "nil"},
};

constexpr Spelling kPunctuation[] = {
    {Tok::Plus, "'+'"},          {Tok::Minus, "'-'"},          {Tok::Star, "'*'"},
    {Tok::Slash, "'/'"},         {Tok::Percent, "'%'"},        {Tok::Assign, "'='"},
    {Tok::PlusAssign, "'+='"},   {Tok::MinusAssign, "'-='"},   {Tok::StarAssign, "'*='"},
    {Tok::SlashAssign, "'/='"},  {Tok::PercentAssign, "'%='"}, {Tok::Eq, "'=='"},
    {Tok::Ne, "'!='"},           {Tok::Lt, "'<'"},             {Tok::Gt, "'>'"},
    {Tok::Le, "'<='"},           {Tok::Ge, "'>='"},            {Tok::AndAnd, "'&&'"},
    {Tok::OrOr, "'||'"},         {Tok::Bang, "'!'"},           {Tok::LParen, "'('"},
    {Tok::RParen, "')'"},        {Tok::LBrace, "'{'"},         {Tok::RBrace, "'}'"},
    {Tok::Comma, "','"},         {Tok::Dot, "'.'"},            {Tok::Semi, "';'"},
};

} // anonymous namespace

const char* describe(Tok kind) {
    switch (kind) {
        case Tok::End:  return "end of input";
        case Tok::Name: return "name";
        case Tok::Int:  return "integer";
        case Tok::Real: return "number";
        case Tok::Text: return "string";
        default:        break;
    }
    for (const auto& kw : kKeywords) {
        if (kw.kind == kind) return kw.text;
    }
    for (const auto& p : kPunctuation) {
        if (p.kind == kind) return p.text;
    }
    return "token";
}

Tok keyword_or_name(const std::string& word) {
    for (const auto& kw : kKeywords) {
        if (word == kw.text) return kw.kind;
    }
    return Tok::Name;
}

} // namespace nbimport
