#pragma once

#include <string>
#include <vector>

#include "template/ast.hpp"
#include "template/value.hpp"

namespace ptatemp::templating {

// Walks a parsed template against a context object and produces the output
// text. A renderer is single use; construct one per render.
class Renderer
{
public:
    explicit Renderer(const Value &context);

    std::string render(const NodeList &nodes);

private:
    void renderNodes(const NodeList &nodes, std::string &out);
    void renderNode(const Node &node, std::string &out);
    void renderFor(const Node &node, std::string &out);

    Value evaluate(const Expr &expr);
    Value evaluateBinary(const Expr &expr);
    Value evaluateCall(const Expr &expr);
    Value getAttribute(const Value &object, const std::string &name) const;
    Value getItem(const Value &object, const Value &index) const;

    Value lookup(const std::string &name) const;
    void assign(const std::string &name, Value value);
    void bindTargets(const std::vector<std::string> &targets, const Value &item);

    // Innermost scope last; the context is the outermost scope.
    std::vector<Value> m_scopes;
};

} // namespace ptatemp::templating
