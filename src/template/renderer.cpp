#include "template/renderer.hpp"

#include <utility>

#include "template/errors.hpp"
#include "template/filters.hpp"

namespace ptatemp::templating {

namespace {

class ScopeGuard
{
public:
    explicit ScopeGuard(std::vector<Value> &scopes)
        : m_scopes(scopes)
    {
        m_scopes.push_back(Value::object());
    }

    ~ScopeGuard()
    {
        m_scopes.pop_back();
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

private:
    std::vector<Value> &m_scopes;
};

Value loopInfo(size_t index, size_t length)
{
    const auto i = static_cast<int64_t>(index);
    const auto n = static_cast<int64_t>(length);
    return Value{
        {"index", i + 1},
        {"index0", i},
        {"revindex", n - i},
        {"revindex0", n - i - 1},
        {"first", i == 0},
        {"last", i == n - 1},
        {"length", n}
    };
}

} // namespace

Renderer::Renderer(const Value &context)
{
    m_scopes.push_back(context.is_object() ? context : Value::object());
}

std::string Renderer::render(const NodeList &nodes)
{
    std::string out;
    renderNodes(nodes, out);
    return out;
}

void Renderer::renderNodes(const NodeList &nodes, std::string &out)
{
    for (const auto &node : nodes) {
        renderNode(*node, out);
    }
}

void Renderer::renderNode(const Node &node, std::string &out)
{
    try {
        switch (node.kind) {
        case NodeKind::Text:
            out += node.text;
            break;
        case NodeKind::Output:
            out += toDisplayString(evaluate(*node.expr));
            break;
        case NodeKind::If:
            for (const auto &branch : node.branches) {
                if (isTruthy(evaluate(*branch.condition))) {
                    renderNodes(branch.body, out);
                    return;
                }
            }
            renderNodes(node.elseBody, out);
            break;
        case NodeKind::For:
            renderFor(node, out);
            break;
        case NodeKind::Set:
            assign(node.targets.front(), evaluate(*node.expr));
            break;
        }
    } catch (const ValueError &e) {
        throw TemplateError(e.what(), node.line);
    } catch (const nlohmann::json::exception &e) {
        throw TemplateError(e.what(), node.line);
    }
}

void Renderer::renderFor(const Node &node, std::string &out)
{
    std::vector<Value> items = iterate(evaluate(*node.expr));

    if (node.condition) {
        std::vector<Value> kept;
        for (auto &item : items) {
            ScopeGuard scope(m_scopes);
            bindTargets(node.targets, item);
            if (isTruthy(evaluate(*node.condition))) {
                kept.push_back(std::move(item));
            }
        }
        items = std::move(kept);
    }

    if (items.empty()) {
        renderNodes(node.elseBody, out);
        return;
    }

    for (size_t i = 0; i < items.size(); ++i) {
        // Each iteration gets a fresh scope so {% set %} does not leak.
        ScopeGuard scope(m_scopes);
        assign("loop", loopInfo(i, items.size()));
        bindTargets(node.targets, items[i]);
        renderNodes(node.body, out);
    }
}

Value Renderer::lookup(const std::string &name) const
{
    for (auto it = m_scopes.rbegin(); it != m_scopes.rend(); ++it) {
        const auto found = it->find(name);
        if (found != it->end()) {
            return *found;
        }
    }
    return makeUndefined();
}

void Renderer::assign(const std::string &name, Value value)
{
    m_scopes.back()[name] = std::move(value);
}

void Renderer::bindTargets(const std::vector<std::string> &targets, const Value &item)
{
    if (targets.size() == 1) {
        assign(targets.front(), item);
        return;
    }
    if (!item.is_array() || item.size() != targets.size()) {
        throw ValueError("cannot unpack " + typeName(item) + " into "
                         + std::to_string(targets.size()) + " loop variables");
    }
    for (size_t i = 0; i < targets.size(); ++i) {
        assign(targets[i], item.at(i));
    }
}

Value Renderer::evaluate(const Expr &expr)
{
    switch (expr.kind) {
    case ExprKind::Literal:
        return expr.literal;
    case ExprKind::Name:
        return lookup(expr.name);
    case ExprKind::List: {
        Value list = Value::array();
        for (const auto &child : expr.children) {
            list.push_back(evaluate(*child));
        }
        return list;
    }
    case ExprKind::Dict: {
        Value dict = Value::object();
        for (size_t i = 0; i + 1 < expr.children.size(); i += 2) {
            const Value key = evaluate(*expr.children[i]);
            if (!key.is_string()) {
                throw ValueError("map keys must be strings, got " + typeName(key));
            }
            dict[key.get<std::string>()] = evaluate(*expr.children[i + 1]);
        }
        return dict;
    }
    case ExprKind::Unary: {
        const Value operand = evaluate(*expr.children.front());
        if (expr.name == "not") {
            return !isTruthy(operand);
        }
        if (expr.name == "-") {
            return negate(operand);
        }
        if (!isNumber(operand)) {
            throw ValueError("unsupported operand type for unary +: " + typeName(operand));
        }
        return operand;
    }
    case ExprKind::Binary:
        return evaluateBinary(expr);
    case ExprKind::Conditional:
        if (isTruthy(evaluate(*expr.children[1]))) {
            return evaluate(*expr.children[0]);
        }
        return expr.children.size() > 2 ? evaluate(*expr.children[2]) : makeUndefined();
    case ExprKind::GetAttr:
        return getAttribute(evaluate(*expr.children.front()), expr.name);
    case ExprKind::GetItem:
        return getItem(evaluate(*expr.children[0]), evaluate(*expr.children[1]));
    case ExprKind::Call:
        return evaluateCall(expr);
    case ExprKind::Filter:
    case ExprKind::Test: {
        const Value operand = evaluate(*expr.children.front());
        Arguments args;
        for (size_t i = 1; i < expr.children.size(); ++i) {
            const std::string &keyword = expr.argNames[i - 1];
            if (keyword.empty()) {
                args.positional.push_back(evaluate(*expr.children[i]));
            } else {
                args.keyword[keyword] = evaluate(*expr.children[i]);
            }
        }
        if (expr.kind == ExprKind::Filter) {
            return applyFilter(expr.name, operand, args);
        }
        return applyTest(expr.name, operand, args) != expr.negated;
    }
    }
    throw ValueError("unsupported expression");
}

Value Renderer::evaluateBinary(const Expr &expr)
{
    const std::string &op = expr.name;
    const Value lhs = evaluate(*expr.children[0]);

    if (op == "and") {
        return isTruthy(lhs) ? evaluate(*expr.children[1]) : lhs;
    }
    if (op == "or") {
        return isTruthy(lhs) ? lhs : evaluate(*expr.children[1]);
    }

    const Value rhs = evaluate(*expr.children[1]);
    if (op == "+") {
        return add(lhs, rhs);
    }
    if (op == "-") {
        return subtract(lhs, rhs);
    }
    if (op == "*") {
        return multiply(lhs, rhs);
    }
    if (op == "/") {
        return divide(lhs, rhs);
    }
    if (op == "//") {
        return floorDivide(lhs, rhs);
    }
    if (op == "%") {
        return modulo(lhs, rhs);
    }
    if (op == "**") {
        return power(lhs, rhs);
    }
    if (op == "~") {
        return toDisplayString(lhs) + toDisplayString(rhs);
    }
    if (op == "==") {
        return valuesEqual(lhs, rhs);
    }
    if (op == "!=") {
        return !valuesEqual(lhs, rhs);
    }
    if (op == "<") {
        return compareValues(lhs, rhs) < 0;
    }
    if (op == "<=") {
        return compareValues(lhs, rhs) <= 0;
    }
    if (op == ">") {
        return compareValues(lhs, rhs) > 0;
    }
    if (op == ">=") {
        return compareValues(lhs, rhs) >= 0;
    }
    if (op == "in") {
        return contains(rhs, lhs);
    }
    if (op == "not in") {
        return !contains(rhs, lhs);
    }
    throw ValueError("unknown operator " + op);
}

Value Renderer::evaluateCall(const Expr &expr)
{
    Arguments args;
    for (size_t i = 1; i < expr.children.size(); ++i) {
        const std::string &keyword = expr.argNames[i - 1];
        if (keyword.empty()) {
            args.positional.push_back(evaluate(*expr.children[i]));
        } else {
            args.keyword[keyword] = evaluate(*expr.children[i]);
        }
    }

    const Expr &callee = *expr.children.front();
    if (callee.kind == ExprKind::Name) {
        return callFunction(callee.name, args);
    }
    if (callee.kind == ExprKind::GetAttr) {
        return callMethod(evaluate(*callee.children.front()), callee.name, args);
    }
    throw ValueError("expression is not callable");
}

Value Renderer::getAttribute(const Value &object, const std::string &name) const
{
    if (isUndefined(object)) {
        throw ValueError("cannot read attribute '" + name + "' of undefined value");
    }
    if (object.is_null()) {
        throw ValueError("cannot read attribute '" + name + "' of none");
    }
    if (object.is_object()) {
        const auto it = object.find(name);
        return it == object.end() ? makeUndefined() : *it;
    }
    return makeUndefined();
}

Value Renderer::getItem(const Value &object, const Value &index) const
{
    if (isUndefined(object)) {
        throw ValueError("cannot index undefined value");
    }
    if (object.is_null()) {
        throw ValueError("cannot index none");
    }
    if (object.is_object()) {
        if (!index.is_string()) {
            return makeUndefined();
        }
        const auto it = object.find(index.get<std::string>());
        return it == object.end() ? makeUndefined() : *it;
    }
    if ((object.is_array() || object.is_string()) && isInteger(index)) {
        const std::vector<Value> items = object.is_array()
            ? std::vector<Value>(object.begin(), object.end())
            : iterate(object);
        int64_t position = toInt64(index);
        const auto size = static_cast<int64_t>(items.size());
        if (position < 0) {
            position += size;
        }
        if (position < 0 || position >= size) {
            return makeUndefined();
        }
        return items[static_cast<size_t>(position)];
    }
    return makeUndefined();
}

} // namespace ptatemp::templating
