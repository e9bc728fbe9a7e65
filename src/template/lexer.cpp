#include "template/lexer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "template/errors.hpp"

namespace ptatemp::templating {

namespace {

// Longest operators first so "//" wins over "/".
constexpr const char *kOperators[] = {
    "//", "**", "==", "!=", "<=", ">=",
    "+", "-", "*", "/", "%", "<", ">", "=", "(", ")", "[", "]",
    "{", "}", ",", ".", ":", "|", "~"
};

bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool isNameStart(char ch)
{
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool isNameChar(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool isDigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

void trimLeft(std::string &text)
{
    size_t start = 0;
    while (start < text.size() && isSpace(text[start])) {
        ++start;
    }
    text.erase(0, start);
}

void trimRight(std::string &text)
{
    size_t end = text.size();
    while (end > 0 && isSpace(text[end - 1])) {
        --end;
    }
    text.erase(end);
}

class Lexer
{
public:
    Lexer(const std::string &source, const LexerOptions &options)
        : m_src(source)
        , m_options(options)
    {
        if (!m_options.keepTrailingNewline && !m_src.empty() && m_src.back() == '\n') {
            m_src.pop_back();
            if (!m_src.empty() && m_src.back() == '\r') {
                m_src.pop_back();
            }
        }
    }

    std::vector<Token> run()
    {
        while (m_pos < m_src.size()) {
            const size_t open = findTagOpen(m_pos);
            const int textLine = m_line;
            std::string text = m_src.substr(m_pos, open == std::string::npos
                                                       ? std::string::npos
                                                       : open - m_pos);
            if (m_stripNext) {
                trimLeft(text);
                m_stripNext = false;
            }

            if (open == std::string::npos) {
                advanceTo(m_src.size());
                emitText(text, textLine);
                break;
            }

            const char kind = m_src[open + 1];
            const bool stripBefore = open + 2 < m_src.size() && m_src[open + 2] == '-';
            if (stripBefore) {
                trimRight(text);
            }
            emitText(text, textLine);
            advanceTo(open + 2 + (stripBefore ? 1 : 0));

            if (kind == '#') {
                lexComment();
            } else if (kind == '{') {
                lexTag(TokenType::VariableBegin, TokenType::VariableEnd, "}}");
            } else if (!lexRaw()) {
                lexTag(TokenType::BlockBegin, TokenType::BlockEnd, "%}");
            }
        }

        Token end;
        end.type = TokenType::End;
        end.line = m_line;
        m_tokens.push_back(end);
        return std::move(m_tokens);
    }

private:
    size_t findTagOpen(size_t from) const
    {
        size_t pos = m_src.find('{', from);
        while (pos != std::string::npos && pos + 1 < m_src.size()) {
            const char next = m_src[pos + 1];
            if (next == '{' || next == '%' || next == '#') {
                return pos;
            }
            pos = m_src.find('{', pos + 1);
        }
        return std::string::npos;
    }

    bool startsWith(const char *text, size_t at) const
    {
        return m_src.compare(at, std::char_traits<char>::length(text), text) == 0;
    }

    void advanceTo(size_t target)
    {
        while (m_pos < target && m_pos < m_src.size()) {
            if (m_src[m_pos] == '\n') {
                ++m_line;
            }
            ++m_pos;
        }
    }

    void skipSpaces()
    {
        size_t pos = m_pos;
        while (pos < m_src.size() && isSpace(m_src[pos])) {
            ++pos;
        }
        advanceTo(pos);
    }

    void emitText(const std::string &text, int line)
    {
        if (text.empty()) {
            return;
        }
        Token token;
        token.type = TokenType::Text;
        token.text = text;
        token.line = line;
        m_tokens.push_back(std::move(token));
    }

    void push(TokenType type, int line, std::string text = std::string())
    {
        Token token;
        token.type = type;
        token.text = std::move(text);
        token.line = line;
        m_tokens.push_back(std::move(token));
    }

    void lexComment()
    {
        const int startLine = m_line;
        const size_t close = m_src.find("#}", m_pos);
        if (close == std::string::npos) {
            throw TemplateError("unterminated comment", startLine);
        }
        m_stripNext = close > m_pos && m_src[close - 1] == '-';
        advanceTo(close + 2);
    }

    // Matches "[ws]name[ws][-]%}" at pos; returns the position after "%}".
    size_t matchBlockKeyword(size_t pos, const char *name, bool &stripAfter) const
    {
        while (pos < m_src.size() && isSpace(m_src[pos])) {
            ++pos;
        }
        if (!startsWith(name, pos)) {
            return std::string::npos;
        }
        pos += std::char_traits<char>::length(name);
        if (pos < m_src.size() && isNameChar(m_src[pos])) {
            return std::string::npos;
        }
        while (pos < m_src.size() && isSpace(m_src[pos])) {
            ++pos;
        }
        stripAfter = pos < m_src.size() && m_src[pos] == '-';
        if (stripAfter) {
            ++pos;
        }
        if (!startsWith("%}", pos)) {
            return std::string::npos;
        }
        return pos + 2;
    }

    bool lexRaw()
    {
        bool stripContentStart = false;
        const size_t contentStart = matchBlockKeyword(m_pos, "raw", stripContentStart);
        if (contentStart == std::string::npos) {
            return false;
        }

        const int startLine = m_line;
        size_t search = contentStart;
        while (true) {
            const size_t open = m_src.find("{%", search);
            if (open == std::string::npos) {
                throw TemplateError("unterminated raw block", startLine);
            }
            const bool stripContentEnd = open + 2 < m_src.size() && m_src[open + 2] == '-';
            bool stripAfter = false;
            const size_t after = matchBlockKeyword(open + 2 + (stripContentEnd ? 1 : 0),
                                                   "endraw", stripAfter);
            if (after == std::string::npos) {
                search = open + 2;
                continue;
            }

            std::string content = m_src.substr(contentStart, open - contentStart);
            if (stripContentStart) {
                trimLeft(content);
            }
            if (stripContentEnd) {
                trimRight(content);
            }
            advanceTo(contentStart);
            emitText(content, m_line);
            advanceTo(after);
            m_stripNext = stripAfter;
            return true;
        }
    }

    void lexTag(TokenType beginType, TokenType endType, const char *close)
    {
        const int startLine = m_line;
        push(beginType, startLine);

        const std::string stripClose = std::string("-") + close;
        while (true) {
            skipSpaces();
            if (m_pos >= m_src.size()) {
                throw TemplateError(endType == TokenType::VariableEnd
                                        ? "unterminated variable tag"
                                        : "unterminated block tag",
                                    startLine);
            }

            if (startsWith(stripClose.c_str(), m_pos)) {
                push(endType, m_line);
                advanceTo(m_pos + 3);
                m_stripNext = true;
                return;
            }
            if (startsWith(close, m_pos)) {
                push(endType, m_line);
                advanceTo(m_pos + 2);
                if (endType == TokenType::BlockEnd && m_options.trimBlocks
                    && m_pos < m_src.size() && m_src[m_pos] == '\n') {
                    advanceTo(m_pos + 1);
                }
                return;
            }

            const char ch = m_src[m_pos];
            if (isNameStart(ch)) {
                lexName();
            } else if (isDigit(ch)) {
                lexNumber();
            } else if (ch == '"' || ch == '\'') {
                lexString(ch);
            } else {
                lexOperator();
            }
        }
    }

    void lexName()
    {
        size_t end = m_pos;
        while (end < m_src.size() && isNameChar(m_src[end])) {
            ++end;
        }
        push(TokenType::Name, m_line, m_src.substr(m_pos, end - m_pos));
        advanceTo(end);
    }

    void lexNumber()
    {
        size_t end = m_pos;
        bool isFloat = false;
        while (end < m_src.size() && isDigit(m_src[end])) {
            ++end;
        }
        if (end + 1 < m_src.size() && m_src[end] == '.' && isDigit(m_src[end + 1])) {
            isFloat = true;
            ++end;
            while (end < m_src.size() && isDigit(m_src[end])) {
                ++end;
            }
        }
        if (end < m_src.size() && (m_src[end] == 'e' || m_src[end] == 'E')) {
            size_t exp = end + 1;
            if (exp < m_src.size() && (m_src[exp] == '+' || m_src[exp] == '-')) {
                ++exp;
            }
            if (exp < m_src.size() && isDigit(m_src[exp])) {
                isFloat = true;
                end = exp;
                while (end < m_src.size() && isDigit(m_src[end])) {
                    ++end;
                }
            }
        }

        const std::string literal = m_src.substr(m_pos, end - m_pos);
        Token token;
        token.line = m_line;
        token.text = literal;
        errno = 0;
        if (isFloat) {
            token.type = TokenType::Float;
            token.floatValue = std::strtod(literal.c_str(), nullptr);
        } else {
            token.type = TokenType::Integer;
            token.intValue = std::strtoll(literal.c_str(), nullptr, 10);
        }
        if (errno == ERANGE) {
            throw TemplateError("number literal out of range: " + literal, m_line);
        }
        m_tokens.push_back(std::move(token));
        advanceTo(end);
    }

    void lexString(char quote)
    {
        const int startLine = m_line;
        std::string value;
        size_t pos = m_pos + 1;
        while (true) {
            if (pos >= m_src.size()) {
                throw TemplateError("unterminated string literal", startLine);
            }
            const char ch = m_src[pos];
            if (ch == quote) {
                ++pos;
                break;
            }
            if (ch == '\\' && pos + 1 < m_src.size()) {
                const char escaped = m_src[pos + 1];
                switch (escaped) {
                case 'n':
                    value.push_back('\n');
                    break;
                case 't':
                    value.push_back('\t');
                    break;
                case 'r':
                    value.push_back('\r');
                    break;
                default:
                    value.push_back(escaped);
                    break;
                }
                pos += 2;
                continue;
            }
            value.push_back(ch);
            ++pos;
        }
        push(TokenType::String, startLine, std::move(value));
        advanceTo(pos);
    }

    void lexOperator()
    {
        for (const char *op : kOperators) {
            if (startsWith(op, m_pos)) {
                push(TokenType::Operator, m_line, op);
                advanceTo(m_pos + std::char_traits<char>::length(op));
                return;
            }
        }
        throw TemplateError(std::string("unexpected character '") + m_src[m_pos] + "'",
                            m_line);
    }

    std::string m_src;
    LexerOptions m_options;
    size_t m_pos = 0;
    int m_line = 1;
    bool m_stripNext = false;
    std::vector<Token> m_tokens;
};

} // namespace

std::vector<Token> tokenize(const std::string &source, const LexerOptions &options)
{
    Lexer lexer(source, options);
    return lexer.run();
}

const char *tokenTypeName(TokenType type)
{
    switch (type) {
    case TokenType::Text:
        return "text";
    case TokenType::VariableBegin:
        return "'{{'";
    case TokenType::VariableEnd:
        return "'}}'";
    case TokenType::BlockBegin:
        return "'{%'";
    case TokenType::BlockEnd:
        return "'%}'";
    case TokenType::Name:
        return "name";
    case TokenType::Integer:
        return "integer";
    case TokenType::Float:
        return "float";
    case TokenType::String:
        return "string";
    case TokenType::Operator:
        return "operator";
    case TokenType::End:
        return "end of template";
    }
    return "token";
}

} // namespace ptatemp::templating
