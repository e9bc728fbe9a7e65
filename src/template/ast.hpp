#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ptatemp::templating {

enum class ExprKind {
    Literal,
    Name,
    List,
    Dict,
    Unary,
    Binary,
    Conditional,
    GetAttr,
    GetItem,
    Call,
    Filter,
    Test
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

// One node type for every expression; which fields are used depends on kind:
//   Literal      literal
//   Name         name
//   List, Dict   children (Dict: key, value, key, value, ...)
//   Unary        name = operator, children[0]
//   Binary       name = operator, children[0..1]
//   Conditional  children = then, condition[, else]
//   GetAttr      name = attribute, children[0] = object
//   GetItem      children = object, index
//   Call         children[0] = callee, then arguments
//   Filter/Test  name, children[0] = operand, then arguments
// Arguments carry a keyword in argNames (empty for positional ones),
// aligned with children starting at index 1.
struct Expr {
    ExprKind kind = ExprKind::Literal;
    int line = 1;
    nlohmann::json literal;
    std::string name;
    std::vector<ExprPtr> children;
    std::vector<std::string> argNames;
    bool negated = false;
};

enum class NodeKind {
    Text,
    Output,
    If,
    For,
    Set
};

struct Node;
using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

struct IfBranch {
    ExprPtr condition;
    NodeList body;
};

struct Node {
    NodeKind kind = NodeKind::Text;
    int line = 1;
    std::string text;
    // Output value, For iterable, Set value.
    ExprPtr expr;
    // For: loop filter ("for x in xs if cond").
    ExprPtr condition;
    // For: loop variables, Set: assigned name.
    std::vector<std::string> targets;
    std::vector<IfBranch> branches;
    NodeList body;
    NodeList elseBody;
};

} // namespace ptatemp::templating
