#include "template/parser.hpp"

#include <utility>

#include "template/errors.hpp"

namespace ptatemp::templating {

namespace {

ExprPtr makeExpr(ExprKind kind, int line)
{
    auto expr = std::make_unique<Expr>();
    expr->kind = kind;
    expr->line = line;
    return expr;
}

ExprPtr makeBinary(const std::string &op, ExprPtr lhs, ExprPtr rhs, int line)
{
    auto expr = makeExpr(ExprKind::Binary, line);
    expr->name = op;
    expr->children.push_back(std::move(lhs));
    expr->children.push_back(std::move(rhs));
    return expr;
}

NodePtr makeNode(NodeKind kind, int line)
{
    auto node = std::make_unique<Node>();
    node->kind = kind;
    node->line = line;
    return node;
}

std::string describe(const Token &token)
{
    if (token.type == TokenType::Name || token.type == TokenType::Operator) {
        return "'" + token.text + "'";
    }
    return tokenTypeName(token.type);
}

} // namespace

Parser::Parser(std::vector<Token> tokens)
    : m_tokens(std::move(tokens))
{
    if (m_tokens.empty() || m_tokens.back().type != TokenType::End) {
        Token end;
        end.type = TokenType::End;
        end.line = m_tokens.empty() ? 1 : m_tokens.back().line;
        m_tokens.push_back(end);
    }
}

NodeList Parser::parse()
{
    return parseUntil({}, nullptr);
}

const Token &Parser::peek(size_t offset) const
{
    const size_t index = m_pos + offset;
    return index < m_tokens.size() ? m_tokens[index] : m_tokens.back();
}

const Token &Parser::next()
{
    const Token &token = peek();
    if (m_pos < m_tokens.size() - 1) {
        ++m_pos;
    }
    return token;
}

bool Parser::atName(const char *name, size_t offset) const
{
    const Token &token = peek(offset);
    return token.type == TokenType::Name && token.text == name;
}

bool Parser::atOperator(const char *op, size_t offset) const
{
    const Token &token = peek(offset);
    return token.type == TokenType::Operator && token.text == op;
}

void Parser::fail(const std::string &message) const
{
    throw TemplateError(message, peek().line);
}

const Token &Parser::expect(TokenType type, const char *what)
{
    if (peek().type != type) {
        fail(std::string("expected ") + what + ", got " + describe(peek()));
    }
    return next();
}

void Parser::expectOperator(const char *op)
{
    if (!atOperator(op)) {
        fail(std::string("expected '") + op + "', got " + describe(peek()));
    }
    next();
}

void Parser::expectName(const char *name)
{
    if (!atName(name)) {
        fail(std::string("expected '") + name + "', got " + describe(peek()));
    }
    next();
}

NodeList Parser::parseUntil(std::initializer_list<const char *> endTags, std::string *foundTag)
{
    NodeList nodes;
    while (true) {
        const Token &token = peek();
        switch (token.type) {
        case TokenType::End:
            if (endTags.size() != 0) {
                std::string expected;
                for (const char *tag : endTags) {
                    expected += expected.empty() ? tag : std::string(" or ") + tag;
                }
                fail("unexpected end of template, expected " + expected);
            }
            return nodes;
        case TokenType::Text: {
            auto node = makeNode(NodeKind::Text, token.line);
            node->text = token.text;
            next();
            nodes.push_back(std::move(node));
            break;
        }
        case TokenType::VariableBegin: {
            auto node = makeNode(NodeKind::Output, token.line);
            next();
            node->expr = parseExpression();
            expect(TokenType::VariableEnd, "'}}'");
            nodes.push_back(std::move(node));
            break;
        }
        case TokenType::BlockBegin: {
            const int line = token.line;
            next();
            const Token &keyword = expect(TokenType::Name, "a block keyword");
            for (const char *tag : endTags) {
                if (keyword.text == tag) {
                    if (foundTag) {
                        *foundTag = keyword.text;
                    }
                    return nodes;
                }
            }
            if (keyword.text == "if") {
                nodes.push_back(parseIf(line));
            } else if (keyword.text == "for") {
                nodes.push_back(parseFor(line));
            } else if (keyword.text == "set") {
                nodes.push_back(parseSet(line));
            } else {
                throw TemplateError("unknown block tag '" + keyword.text + "'", line);
            }
            break;
        }
        default:
            fail("unexpected " + describe(token));
        }
    }
}

NodePtr Parser::parseIf(int line)
{
    auto node = makeNode(NodeKind::If, line);
    std::string tag;

    IfBranch first;
    first.condition = parseExpression();
    expect(TokenType::BlockEnd, "'%}'");
    first.body = parseUntil({"elif", "else", "endif"}, &tag);
    node->branches.push_back(std::move(first));

    while (tag == "elif") {
        IfBranch branch;
        branch.condition = parseExpression();
        expect(TokenType::BlockEnd, "'%}'");
        branch.body = parseUntil({"elif", "else", "endif"}, &tag);
        node->branches.push_back(std::move(branch));
    }

    if (tag == "else") {
        expect(TokenType::BlockEnd, "'%}'");
        node->elseBody = parseUntil({"endif"}, &tag);
    }
    expect(TokenType::BlockEnd, "'%}'");
    return node;
}

NodePtr Parser::parseFor(int line)
{
    auto node = makeNode(NodeKind::For, line);
    node->targets.push_back(expect(TokenType::Name, "a loop variable").text);
    while (atOperator(",")) {
        next();
        node->targets.push_back(expect(TokenType::Name, "a loop variable").text);
    }
    expectName("in");

    // No conditional expression here: a trailing "if" filters the loop.
    node->expr = parseExpression(false);
    if (atName("if")) {
        next();
        node->condition = parseExpression(false);
    }
    expect(TokenType::BlockEnd, "'%}'");

    std::string tag;
    node->body = parseUntil({"else", "endfor"}, &tag);
    if (tag == "else") {
        expect(TokenType::BlockEnd, "'%}'");
        node->elseBody = parseUntil({"endfor"}, &tag);
    }
    expect(TokenType::BlockEnd, "'%}'");
    return node;
}

NodePtr Parser::parseSet(int line)
{
    auto node = makeNode(NodeKind::Set, line);
    node->targets.push_back(expect(TokenType::Name, "a variable name").text);
    expectOperator("=");
    node->expr = parseExpression();
    expect(TokenType::BlockEnd, "'%}'");
    return node;
}

ExprPtr Parser::parseExpression(bool allowConditional)
{
    ExprPtr expr = parseOr();
    if (!allowConditional || !atName("if")) {
        return expr;
    }

    const int line = next().line;
    auto conditional = makeExpr(ExprKind::Conditional, line);
    conditional->children.push_back(std::move(expr));
    conditional->children.push_back(parseOr());
    if (atName("else")) {
        next();
        conditional->children.push_back(parseExpression());
    }
    return conditional;
}

ExprPtr Parser::parseOr()
{
    ExprPtr lhs = parseAnd();
    while (atName("or")) {
        const int line = next().line;
        lhs = makeBinary("or", std::move(lhs), parseAnd(), line);
    }
    return lhs;
}

ExprPtr Parser::parseAnd()
{
    ExprPtr lhs = parseNot();
    while (atName("and")) {
        const int line = next().line;
        lhs = makeBinary("and", std::move(lhs), parseNot(), line);
    }
    return lhs;
}

ExprPtr Parser::parseNot()
{
    if (atName("not")) {
        const int line = next().line;
        auto expr = makeExpr(ExprKind::Unary, line);
        expr->name = "not";
        expr->children.push_back(parseNot());
        return expr;
    }
    return parseCompare();
}

ExprPtr Parser::parseCompare()
{
    ExprPtr lhs = parseConcat();
    while (true) {
        const Token &token = peek();
        if (token.type == TokenType::Operator
            && (token.text == "==" || token.text == "!=" || token.text == "<"
                || token.text == "<=" || token.text == ">" || token.text == ">=")) {
            const std::string op = token.text;
            const int line = next().line;
            lhs = makeBinary(op, std::move(lhs), parseConcat(), line);
        } else if (atName("in")) {
            const int line = next().line;
            lhs = makeBinary("in", std::move(lhs), parseConcat(), line);
        } else if (atName("not") && atName("in", 1)) {
            const int line = next().line;
            next();
            lhs = makeBinary("not in", std::move(lhs), parseConcat(), line);
        } else if (atName("is")) {
            const int line = next().line;
            auto test = makeExpr(ExprKind::Test, line);
            if (atName("not")) {
                next();
                test->negated = true;
            }
            test->name = expect(TokenType::Name, "a test name").text;
            test->children.push_back(std::move(lhs));
            if (atOperator("(")) {
                parseArguments(*test);
            } else if (atBareTestArgument()) {
                // "x is divisibleby 3" takes one argument without parentheses.
                test->children.push_back(parsePostfix(false));
                test->argNames.push_back(std::string());
            }
            lhs = std::move(test);
        } else {
            return lhs;
        }
    }
}

ExprPtr Parser::parseConcat()
{
    ExprPtr lhs = parseAdditive();
    while (atOperator("~")) {
        const int line = next().line;
        lhs = makeBinary("~", std::move(lhs), parseAdditive(), line);
    }
    return lhs;
}

ExprPtr Parser::parseAdditive()
{
    ExprPtr lhs = parseMultiplicative();
    while (atOperator("+") || atOperator("-")) {
        const Token &token = next();
        const std::string op = token.text;
        const int line = token.line;
        lhs = makeBinary(op, std::move(lhs), parseMultiplicative(), line);
    }
    return lhs;
}

ExprPtr Parser::parseMultiplicative()
{
    ExprPtr lhs = parseUnary();
    while (atOperator("*") || atOperator("/") || atOperator("//") || atOperator("%")) {
        const Token &token = next();
        const std::string op = token.text;
        const int line = token.line;
        lhs = makeBinary(op, std::move(lhs), parseUnary(), line);
    }
    return lhs;
}

ExprPtr Parser::parseUnary()
{
    if (atOperator("-") || atOperator("+")) {
        const Token &token = next();
        auto expr = makeExpr(ExprKind::Unary, token.line);
        expr->name = token.text;
        expr->children.push_back(parseUnary());
        return expr;
    }
    return parsePower();
}

ExprPtr Parser::parsePower()
{
    ExprPtr base = parsePostfix();
    if (atOperator("**")) {
        const int line = next().line;
        return makeBinary("**", std::move(base), parseUnary(), line);
    }
    return base;
}

void Parser::parseArguments(Expr &call)
{
    expectOperator("(");
    while (!atOperator(")")) {
        std::string keyword;
        if (peek().type == TokenType::Name && atOperator("=", 1)) {
            keyword = next().text;
            next();
        } else if (!call.argNames.empty() && !call.argNames.back().empty()) {
            fail("positional argument follows keyword argument");
        }
        call.children.push_back(parseExpression());
        call.argNames.push_back(keyword);
        if (!atOperator(",")) {
            break;
        }
        next();
    }
    expectOperator(")");
}

bool Parser::atBareTestArgument() const
{
    const Token &token = peek();
    switch (token.type) {
    case TokenType::Integer:
    case TokenType::Float:
    case TokenType::String:
        return true;
    case TokenType::Name:
        return token.text != "and" && token.text != "or" && token.text != "not"
            && token.text != "else" && token.text != "if" && token.text != "in"
            && token.text != "is";
    case TokenType::Operator:
        return token.text == "[" || token.text == "{";
    default:
        return false;
    }
}

ExprPtr Parser::parsePostfix(bool allowFilters)
{
    ExprPtr expr = parsePrimary();
    while (true) {
        if (atOperator(".")) {
            const int line = next().line;
            auto attr = makeExpr(ExprKind::GetAttr, line);
            const Token &name = peek();
            if (name.type == TokenType::Name) {
                attr->name = name.text;
            } else if (name.type == TokenType::Integer) {
                // foo.0 is the same as foo[0].
                attr->kind = ExprKind::GetItem;
                auto index = makeExpr(ExprKind::Literal, name.line);
                index->literal = name.intValue;
                attr->children.push_back(std::move(expr));
                attr->children.push_back(std::move(index));
                next();
                expr = std::move(attr);
                continue;
            } else {
                fail("expected attribute name after '.', got " + describe(name));
            }
            next();
            attr->children.push_back(std::move(expr));
            expr = std::move(attr);
        } else if (atOperator("[")) {
            const int line = next().line;
            auto item = makeExpr(ExprKind::GetItem, line);
            item->children.push_back(std::move(expr));
            item->children.push_back(parseExpression());
            expectOperator("]");
            expr = std::move(item);
        } else if (atOperator("(")) {
            auto call = makeExpr(ExprKind::Call, peek().line);
            call->children.push_back(std::move(expr));
            parseArguments(*call);
            expr = std::move(call);
        } else if (allowFilters && atOperator("|")) {
            const int line = next().line;
            auto filter = makeExpr(ExprKind::Filter, line);
            filter->name = expect(TokenType::Name, "a filter name").text;
            filter->children.push_back(std::move(expr));
            if (atOperator("(")) {
                parseArguments(*filter);
            }
            expr = std::move(filter);
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::parsePrimary()
{
    const Token &token = peek();
    switch (token.type) {
    case TokenType::Name: {
        auto expr = makeExpr(ExprKind::Literal, token.line);
        if (token.text == "true" || token.text == "True") {
            expr->literal = true;
        } else if (token.text == "false" || token.text == "False") {
            expr->literal = false;
        } else if (token.text == "none" || token.text == "None") {
            expr->literal = nullptr;
        } else {
            expr->kind = ExprKind::Name;
            expr->name = token.text;
        }
        next();
        return expr;
    }
    case TokenType::Integer: {
        auto expr = makeExpr(ExprKind::Literal, token.line);
        expr->literal = token.intValue;
        next();
        return expr;
    }
    case TokenType::Float: {
        auto expr = makeExpr(ExprKind::Literal, token.line);
        expr->literal = token.floatValue;
        next();
        return expr;
    }
    case TokenType::String: {
        auto expr = makeExpr(ExprKind::Literal, token.line);
        std::string value = token.text;
        next();
        // Adjacent string literals are concatenated.
        while (peek().type == TokenType::String) {
            value += next().text;
        }
        expr->literal = value;
        return expr;
    }
    case TokenType::Operator:
        break;
    default:
        fail("unexpected " + describe(token) + " in expression");
    }

    const int line = token.line;
    if (atOperator("(")) {
        next();
        ExprPtr first = parseExpression();
        if (!atOperator(",")) {
            expectOperator(")");
            return first;
        }
        // A parenthesised tuple evaluates to a list.
        auto tuple = makeExpr(ExprKind::List, line);
        tuple->children.push_back(std::move(first));
        while (atOperator(",")) {
            next();
            if (atOperator(")")) {
                break;
            }
            tuple->children.push_back(parseExpression());
        }
        expectOperator(")");
        return tuple;
    }
    if (atOperator("[")) {
        next();
        auto list = makeExpr(ExprKind::List, line);
        while (!atOperator("]")) {
            list->children.push_back(parseExpression());
            if (!atOperator(",")) {
                break;
            }
            next();
        }
        expectOperator("]");
        return list;
    }
    if (atOperator("{")) {
        next();
        auto dict = makeExpr(ExprKind::Dict, line);
        while (!atOperator("}")) {
            dict->children.push_back(parseExpression());
            expectOperator(":");
            dict->children.push_back(parseExpression());
            if (!atOperator(",")) {
                break;
            }
            next();
        }
        expectOperator("}");
        return dict;
    }

    fail("unexpected " + describe(token) + " in expression");
}

} // namespace ptatemp::templating
