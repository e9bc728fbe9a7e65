#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ptatemp::templating {

enum class TokenType {
    Text,
    VariableBegin,
    VariableEnd,
    BlockBegin,
    BlockEnd,
    Name,
    Integer,
    Float,
    String,
    Operator,
    End
};

struct Token {
    TokenType type = TokenType::End;
    // Text, name, operator or decoded string literal.
    std::string text;
    int64_t intValue = 0;
    double floatValue = 0.0;
    int line = 1;
};

struct LexerOptions {
    // Remove the first newline after a block tag ({% ... %}).
    bool trimBlocks = false;
    // Keep a single trailing newline at the end of the source.
    bool keepTrailingNewline = false;
};

// Splits template source into text and tag tokens. Comments are dropped,
// {% raw %} content becomes text, and '-' whitespace control is applied to
// the neighbouring text. Throws TemplateError on malformed input.
std::vector<Token> tokenize(const std::string &source, const LexerOptions &options = {});

const char *tokenTypeName(TokenType type);

} // namespace ptatemp::templating
