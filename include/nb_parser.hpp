#pragma once

#include "nb_ast.hpp"
#include "nb_errors.hpp"
#include "nb_token.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace nbimport {

    // Recursive-descent parser over the tokens of one cell or script.
    // Errors are raised as ParseError carrying the origin and position.
    class Parser {
    public:
        // Blocks and sub-expressions nested deeper than this are rejected.
        static constexpr int kMaxNesting = 256;

        explicit Parser(std::vector<Token> tokens, std::string origin = "<input>");

        Program parse();

    private:
        class NestingGuard;

        std::vector<Token> toks_;
        std::string origin_;
        size_t pos_ = 0;
        int depth_ = 0;

        // ---- Token cursor ----
        const Token& cur() const { return toks_[pos_]; }
        const Token& prev() const { return toks_[pos_ - 1]; }
        bool at(Tok kind) const { return cur().kind == kind; }
        bool accept(Tok kind);
        const Token& expect(Tok kind, const char* context);
        [[noreturn]] void fail(const Token& where, const std::string& message) const;
        void deepen();  // one level deeper; raises past kMaxNesting

        // ---- Statements ----
        StmtPtr parse_statement();
        StmtPtr parse_binding(bool constant);
        StmtPtr parse_function();
        StmtPtr parse_import();
        StmtPtr parse_if();
        StmtPtr parse_while();
        StmtPtr parse_return();
        StmtList parse_braced(const char* context);
        bool bare_return_ends() const;

        // ---- Expressions ----
        ExprPtr parse_expr();
        ExprPtr parse_binary(int min_prec);
        ExprPtr parse_prefix();
        ExprPtr parse_postfix(ExprPtr expr);
        ExprPtr parse_atom();
    };

    // Scans and parses `source` in one step.
    Program Parse(std::string_view source, const std::string& origin = "<input>");

} // namespace nbimport
