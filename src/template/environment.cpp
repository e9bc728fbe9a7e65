#include "template/environment.hpp"

#include <utility>

#include "template/errors.hpp"
#include "template/parser.hpp"
#include "template/renderer.hpp"

namespace ptatemp::templating {

Template::Template(std::shared_ptr<const NodeList> nodes)
    : m_nodes(std::move(nodes))
{
}

std::string Template::render(const Value &context) const
{
    if (!context.is_object() && !context.is_null()) {
        throw TemplateError("render context must be a map, got " + typeName(context), 1);
    }
    Renderer renderer(context);
    return renderer.render(*m_nodes);
}

Environment::Environment(const LexerOptions &options)
    : m_options(options)
{
}

Template Environment::compile(const std::string &source) const
{
    Parser parser(tokenize(source, m_options));
    return Template(std::make_shared<const NodeList>(parser.parse()));
}

std::string Environment::renderString(const std::string &source, const Value &context) const
{
    return compile(source).render(context);
}

} // namespace ptatemp::templating
