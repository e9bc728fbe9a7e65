#pragma once

#include <memory>
#include <string>

#include "template/ast.hpp"
#include "template/lexer.hpp"
#include "template/value.hpp"

namespace ptatemp::templating {

class Template
{
public:
    std::string render(const Value &context) const;

private:
    friend class Environment;
    explicit Template(std::shared_ptr<const NodeList> nodes);

    std::shared_ptr<const NodeList> m_nodes;
};

// Entry point of the template engine: compiles source text and renders it.
class Environment
{
public:
    Environment() = default;
    explicit Environment(const LexerOptions &options);

    void setTrimBlocks(bool enabled) { m_options.trimBlocks = enabled; }
    void setKeepTrailingNewline(bool enabled) { m_options.keepTrailingNewline = enabled; }

    // Throws TemplateError on syntax errors.
    Template compile(const std::string &source) const;

    // Compiles and renders in one step. The context must be a JSON object
    // (or null for an empty context); throws TemplateError otherwise.
    std::string renderString(const std::string &source, const Value &context) const;

private:
    LexerOptions m_options;
};

} // namespace ptatemp::templating
