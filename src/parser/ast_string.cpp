//! # Tree Rendering
//!
//! Renders nodes back to source-like text.
//!
//! - a list renders each child in parentheses: `(1)(2)`
//! - a number renders its literal text verbatim
//! - a binary node renders `left OP right`
//! - an object renders `ident p1 p2 @ l1 l2`; the `@` part is left out when
//!   there are no location parameters
//!
//! Operands of a binary node get parentheses only where the grammar needs
//! them to read the rendering back as the same tree: a looser operator on
//! either side, or an operator of the same level on the right. Object
//! parameters get them when they are operators or objects with arguments.

#include "parser/ast.hpp"

#include <string_view>
#include <type_traits>
#include <vector>

namespace sml::parser {

namespace {

/// A node still to render, or a piece of text to write as it is.
struct RenderItem {
    const Node* node = nullptr;
    std::string_view text;
};

auto binds_looser(const Node& operand, int level, bool right_side) -> bool {
    if (!operand.is<BinaryNode>()) {
        return false;
    }
    int operand_level = binary_op_precedence(operand.as<BinaryNode>().op);
    return right_side ? operand_level <= level : operand_level < level;
}

auto needs_param_parens(const Node& param) -> bool {
    if (param.is<BinaryNode>()) {
        return true;
    }
    if (param.is<ObjectNode>()) {
        const auto& object = param.as<ObjectNode>();
        return !object.params.empty() || !object.location_params.empty();
    }
    return false;
}

void add_grouped(std::vector<RenderItem>& parts, const Node& node, bool grouped) {
    if (grouped) {
        parts.push_back({.text = "("});
        parts.push_back({.node = &node});
        parts.push_back({.text = ")"});
    } else {
        parts.push_back({.node = &node});
    }
}

void add_params(std::vector<RenderItem>& parts, const std::vector<NodePtr>& params) {
    for (const auto& param : params) {
        parts.push_back({.text = " "});
        add_grouped(parts, *param, needs_param_parens(*param));
    }
}

/// Splits one node into its text pieces and child nodes, in output order.
void expand(const Node& node, std::vector<RenderItem>& parts) {
    std::visit(
        [&parts](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ListNode>) {
                for (const auto& child : n.nodes) {
                    add_grouped(parts, *child, true);
                }
            } else if constexpr (std::is_same_v<T, NumberNode>) {
                parts.push_back({.text = n.text});
            } else if constexpr (std::is_same_v<T, BinaryNode>) {
                int level = binary_op_precedence(n.op);
                add_grouped(parts, *n.left, binds_looser(*n.left, level, false));
                parts.push_back({.text = " "});
                parts.push_back({.text = binary_op_symbol(n.op)});
                parts.push_back({.text = " "});
                add_grouped(parts, *n.right, binds_looser(*n.right, level, true));
            } else {
                parts.push_back({.text = n.ident});
                add_params(parts, n.params);
                if (!n.location_params.empty()) {
                    parts.push_back({.text = " @"});
                    add_params(parts, n.location_params);
                }
            }
        },
        node.kind);
}

} // namespace

auto Node::to_string() const -> std::string {
    std::string out;
    std::vector<RenderItem> pending{RenderItem{.node = this}};
    std::vector<RenderItem> parts;
    while (!pending.empty()) {
        RenderItem item = pending.back();
        pending.pop_back();
        if (!item.node) {
            out += item.text;
            continue;
        }
        parts.clear();
        expand(*item.node, parts);
        pending.insert(pending.end(), parts.rbegin(), parts.rend());
    }
    return out;
}

} // namespace sml::parser
