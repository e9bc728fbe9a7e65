#pragma once

#include <stdexcept>
#include <string>

namespace ptatemp::templating {

// Raised while lexing, parsing or rendering a template. Line is 1-based and
// points at the tag or expression that failed.
class TemplateError : public std::runtime_error
{
public:
    TemplateError(const std::string &message, int line)
        : std::runtime_error("line " + std::to_string(line) + ": " + message)
        , m_message(message)
        , m_line(line)
    {
    }

    const std::string &message() const { return m_message; }
    int line() const { return m_line; }

private:
    std::string m_message;
    int m_line;
};

// Raised by value operations that have no source position; the renderer
// rethrows it as a TemplateError with the line of the failing node.
class ValueError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace ptatemp::templating
