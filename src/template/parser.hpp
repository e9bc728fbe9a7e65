#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "template/ast.hpp"
#include "template/lexer.hpp"

namespace ptatemp::templating {

// Recursive descent parser from the token stream to a node tree.
class Parser
{
public:
    explicit Parser(std::vector<Token> tokens);

    NodeList parse();

private:
    NodeList parseUntil(std::initializer_list<const char *> endTags, std::string *foundTag);
    NodePtr parseIf(int line);
    NodePtr parseFor(int line);
    NodePtr parseSet(int line);

    ExprPtr parseExpression(bool allowConditional = true);
    ExprPtr parseOr();
    ExprPtr parseAnd();
    ExprPtr parseNot();
    ExprPtr parseCompare();
    ExprPtr parseConcat();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePower();
    ExprPtr parsePostfix(bool allowFilters = true);
    ExprPtr parsePrimary();
    void parseArguments(Expr &call);

    const Token &peek(size_t offset = 0) const;
    const Token &next();
    bool atName(const char *name, size_t offset = 0) const;
    bool atOperator(const char *op, size_t offset = 0) const;
    bool atBareTestArgument() const;
    const Token &expect(TokenType type, const char *what);
    void expectOperator(const char *op);
    void expectName(const char *name);
    [[noreturn]] void fail(const std::string &message) const;

    std::vector<Token> m_tokens;
    size_t m_pos = 0;
};

} // namespace ptatemp::templating
