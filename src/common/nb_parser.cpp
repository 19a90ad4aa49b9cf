#include "pch.h"
#include "nb_parser.hpp"
#include "nb_scanner.hpp"

namespace nbimport {

    namespace {

        struct InfixRule {
            Tok token;
            BinaryOp op;
            int prec;
        };

        constexpr InfixRule kInfix[] = {
            {Tok::OrOr, BinaryOp::Or, 1},
            {Tok::AndAnd, BinaryOp::And, 2},
            {Tok::Eq, BinaryOp::Eq, 3},      {Tok::Ne, BinaryOp::Ne, 3},
            {Tok::Lt, BinaryOp::Lt, 4},      {Tok::Gt, BinaryOp::Gt, 4},
            {Tok::Le, BinaryOp::Le, 4},      {Tok::Ge, BinaryOp::Ge, 4},
            {Tok::Plus, BinaryOp::Add, 5},   {Tok::Minus, BinaryOp::Sub, 5},
            {Tok::Star, BinaryOp::Mul, 6},   {Tok::Slash, BinaryOp::Div, 6},
            {Tok::Percent, BinaryOp::Mod, 6},
        };

        const InfixRule* infix_rule(Tok kind) {
            for (const auto& rule : kInfix) {
                if (rule.token == kind) return &rule;
            }
            return nullptr;
        }

        // Assignment operators; nullopt marks plain '='.
        bool assignment_op(Tok kind, std::optional<BinaryOp>& compound) {
            switch (kind) {
                case Tok::Assign:        compound.reset(); return true;
                case Tok::PlusAssign:    compound = BinaryOp::Add; return true;
                case Tok::MinusAssign:   compound = BinaryOp::Sub; return true;
                case Tok::StarAssign:    compound = BinaryOp::Mul; return true;
                case Tok::SlashAssign:   compound = BinaryOp::Div; return true;
                case Tok::PercentAssign: compound = BinaryOp::Mod; return true;
                default:                 return false;
            }
        }

        std::string found(const Token& tok) {
            switch (tok.kind) {
                case Tok::Name: return "name '" + tok.text + "'";
                case Tok::Int:
                case Tok::Real: return "number " + tok.text;
                case Tok::Text: return "string \"" + tok.text + "\"";
                default:        return describe(tok.kind);
            }
        }

        template <typename N>
        ExprPtr make_expr(N node, uint32_t line) {
            auto expr = std::make_unique<Expr>();
            expr->node = std::move(node);
            expr->line = line;
            return expr;
        }

        template <typename N>
        StmtPtr make_stmt(N node, uint32_t line) {
            auto stmt = std::make_unique<Stmt>();
            stmt->node = std::move(node);
            stmt->line = line;
            return stmt;
        }

    } // anonymous namespace

    class Parser::NestingGuard {
    public:
        explicit NestingGuard(Parser& parser) : parser_(parser) { parser_.deepen(); }
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        Parser& parser_;
    };

    Parser::Parser(std::vector<Token> tokens, std::string origin)
        : toks_(std::move(tokens)), origin_(std::move(origin)) {
        if (toks_.empty() || !toks_.back().is(Tok::End)) {
            Token end;
            if (!toks_.empty()) end.pos = toks_.back().pos;
            toks_.push_back(std::move(end));
        }
    }

    Program Parser::parse() {
        Program program;
        while (!at(Tok::End)) {
            program.push_back(parse_statement());
        }
        return program;
    }

    // ============================================================
    //  Token cursor
    // ============================================================

    bool Parser::accept(Tok kind) {
        if (!at(kind)) return false;
        if (!at(Tok::End)) ++pos_;
        return true;
    }

    const Token& Parser::expect(Tok kind, const char* context) {
        if (!at(kind)) {
            fail(cur(), std::string("expected ") + describe(kind) + " " + context + ", found " + found(cur()));
        }
        return toks_[pos_++];
    }

    void Parser::deepen() {
        if (++depth_ > kMaxNesting) {
            --depth_;
            fail(cur(), "code is nested too deeply");
        }
    }

    void Parser::fail(const Token& where, const std::string& message) const {
        throw ParseError(origin_, message, where.pos.line, where.pos.column);
    }

    // ============================================================
    //  Statements
    // ============================================================

    StmtPtr Parser::parse_statement() {
        const uint32_t line = cur().pos.line;
        StmtPtr stmt;

        if (accept(Tok::KwFunc)) {
            stmt = parse_function();
        }
        else if (accept(Tok::KwVar)) {
            stmt = parse_binding(false);
        }
        else if (accept(Tok::KwLet)) {
            stmt = parse_binding(true);
        }
        else if (accept(Tok::KwIf)) {
            stmt = parse_if();
        }
        else if (accept(Tok::KwWhile)) {
            stmt = parse_while();
        }
        else if (accept(Tok::KwReturn)) {
            stmt = parse_return();
        }
        else if (accept(Tok::KwImport)) {
            stmt = parse_import();
        }
        else if (accept(Tok::KwThrow)) {
            stmt = make_stmt(ast::Throw{parse_expr()}, line);
        }
        else if (at(Tok::LBrace)) {
            stmt = make_stmt(ast::Block{parse_braced("to open a block")}, line);
        }
        else {
            stmt = make_stmt(ast::Eval{parse_expr()}, line);
        }

        accept(Tok::Semi);
        return stmt;
    }

    StmtPtr Parser::parse_binding(bool constant) {
        const uint32_t line = prev().pos.line;
        ast::Bind bind;
        bind.constant = constant;
        bind.name = expect(Tok::Name, "after 'var' or 'let'").text;

        if (accept(Tok::Assign)) {
            bind.init = parse_expr();
        }
        else if (constant) {
            fail(cur(), "constant '" + bind.name + "' needs an initial value");
        }
        return make_stmt(std::move(bind), line);
    }

    StmtPtr Parser::parse_function() {
        const uint32_t line = prev().pos.line;
        ast::Function fn;
        fn.name = expect(Tok::Name, "after 'func'").text;

        expect(Tok::LParen, "after the function name");
        if (!at(Tok::RParen)) {
            do {
                const Token& param = expect(Tok::Name, "in the parameter list");
                if (std::find(fn.params.begin(), fn.params.end(), param.text) != fn.params.end()) {
                    fail(param, "duplicate parameter '" + param.text + "'");
                }
                fn.params.push_back(param.text);
            } while (accept(Tok::Comma));
        }
        expect(Tok::RParen, "to close the parameter list");
        fn.body = parse_braced("to open the function body");
        return make_stmt(std::move(fn), line);
    }

    StmtPtr Parser::parse_import() {
        const uint32_t line = prev().pos.line;
        ast::Import import;
        import.module = expect(Tok::Name, "after 'import'").text;
        import.alias = import.module;
        while (accept(Tok::Dot)) {
            const std::string& part = expect(Tok::Name, "after '.' in a module name").text;
            import.module += '.';
            import.module += part;
            import.alias = part;
        }
        return make_stmt(std::move(import), line);
    }

    StmtPtr Parser::parse_if() {
        const uint32_t line = prev().pos.line;
        ast::If branch;
        branch.cond = parse_expr();
        branch.then_body = parse_braced("after the if condition");

        if (accept(Tok::KwElse)) {
            if (accept(Tok::KwIf)) {
                NestingGuard guard(*this);
                branch.else_body.push_back(parse_if());
            }
            else {
                branch.else_body = parse_braced("after 'else'");
            }
        }
        return make_stmt(std::move(branch), line);
    }

    StmtPtr Parser::parse_while() {
        const uint32_t line = prev().pos.line;
        ast::While loop;
        loop.cond = parse_expr();
        loop.body = parse_braced("after the while condition");
        return make_stmt(std::move(loop), line);
    }

    StmtPtr Parser::parse_return() {
        const uint32_t line = prev().pos.line;
        ast::Return ret;
        if (!bare_return_ends()) {
            ret.value = parse_expr();
        }
        return make_stmt(std::move(ret), line);
    }

    // A bare `return` stops at a closing brace, a semicolon or a new line.
    bool Parser::bare_return_ends() const {
        if (at(Tok::End) || at(Tok::RBrace) || at(Tok::Semi)) return true;
        return cur().pos.line != prev().pos.line;
    }

    StmtList Parser::parse_braced(const char* context) {
        expect(Tok::LBrace, context);
        NestingGuard guard(*this);

        StmtList body;
        while (!at(Tok::RBrace) && !at(Tok::End)) {
            body.push_back(parse_statement());
        }
        expect(Tok::RBrace, "to close the block");
        return body;
    }

    // ============================================================
    //  Expressions
    // ============================================================

    ExprPtr Parser::parse_expr() {
        NestingGuard guard(*this);
        ExprPtr lhs = parse_binary(1);

        std::optional<BinaryOp> compound;
        if (!assignment_op(cur().kind, compound)) {
            return lhs;
        }

        const Token& op = toks_[pos_++];
        auto* name = std::get_if<ast::Name>(&lhs->node);
        if (!name) {
            fail(op, "cannot assign to this expression");
        }
        ast::Assign assign{name->id, compound, parse_expr()};
        return make_expr(std::move(assign), op.pos.line);
    }

    // Precedence climbing over kInfix; every level is left-associative.
    // Each fold deepens the tree by one and counts toward kMaxNesting.
    ExprPtr Parser::parse_binary(int min_prec) {
        ExprPtr lhs = parse_prefix();
        const int entry_depth = depth_;
        for (;;) {
            const InfixRule* rule = infix_rule(cur().kind);
            if (!rule || rule->prec < min_prec) {
                depth_ = entry_depth;
                return lhs;
            }
            deepen();
            const uint32_t line = cur().pos.line;
            ++pos_;
            ExprPtr rhs = parse_binary(rule->prec + 1);
            lhs = make_expr(ast::Binary{rule->op, std::move(lhs), std::move(rhs)}, line);
        }
    }

    ExprPtr Parser::parse_prefix() {
        NestingGuard guard(*this);
        const uint32_t line = cur().pos.line;
        if (accept(Tok::Bang)) {
            return make_expr(ast::Unary{UnaryOp::Not, parse_prefix()}, line);
        }
        if (accept(Tok::Minus)) {
            return make_expr(ast::Unary{UnaryOp::Negate, parse_prefix()}, line);
        }
        return parse_postfix(parse_atom());
    }

    ExprPtr Parser::parse_postfix(ExprPtr expr) {
        const int entry_depth = depth_;
        for (;;) {
            const uint32_t line = cur().pos.line;
            if (at(Tok::LParen) || at(Tok::Dot)) {
                deepen();
            }
            if (accept(Tok::LParen)) {
                ast::Call call{std::move(expr), {}};
                if (!at(Tok::RParen)) {
                    do {
                        call.args.push_back(parse_expr());
                    } while (accept(Tok::Comma));
                }
                expect(Tok::RParen, "to close the argument list");
                expr = make_expr(std::move(call), line);
            }
            else if (accept(Tok::Dot)) {
                const Token& name = expect(Tok::Name, "after '.'");
                expr = make_expr(ast::Member{std::move(expr), name.text}, name.pos.line);
            }
            else {
                depth_ = entry_depth;
                return expr;
            }
        }
    }

    ExprPtr Parser::parse_atom() {
        const Token& tok = cur();
        const uint32_t line = tok.pos.line;

        switch (tok.kind) {
            case Tok::KwTrue:
                ++pos_;
                return make_expr(ast::Literal{Value::from_bool(true)}, line);
            case Tok::KwFalse:
                ++pos_;
                return make_expr(ast::Literal{Value::from_bool(false)}, line);
            case Tok::KwNil:
                ++pos_;
                return make_expr(ast::Literal{Value::null()}, line);
            case Tok::Int:
                ++pos_;
                return make_expr(ast::Literal{Value::from_int(tok.int_value())}, line);
            case Tok::Real:
                ++pos_;
                return make_expr(ast::Literal{Value::from_float(tok.real_value())}, line);
            case Tok::Text:
                ++pos_;
                return make_expr(ast::Literal{Value::from_string(tok.text)}, line);
            case Tok::Name:
                ++pos_;
                return make_expr(ast::Name{tok.text}, line);
            case Tok::LParen: {
                ++pos_;
                ExprPtr inner = parse_expr();
                expect(Tok::RParen, "to close the parenthesis");
                return inner;
            }
            default:
                fail(tok, "expected an expression, found " + found(tok));
        }
    }

    Program Parse(std::string_view source, const std::string& origin) {
        Parser parser(Scan(source, origin), origin);
        return parser.parse();
    }

} // namespace nbimport
