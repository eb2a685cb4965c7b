//! # AST Factory Functions
//!
//! Node construction, type queries and deep copy.
//!
//! ## Factory Functions
//!
//! | Function      | Creates                              |
//! |---------------|--------------------------------------|
//! | `make_list`   | List of nodes                        |
//! | `make_number` | Number literal (see `number.cpp`)    |
//! | `make_binary` | Diff, intersection or union          |
//! | `make_object` | Object with params and location      |

#include "parser/ast.hpp"

#include <type_traits>

namespace sml::parser {

auto node_type_to_string(NodeType type) -> std::string_view {
    switch (type) {
    case NodeType::List:
        return "list";
    case NodeType::Number:
        return "number";
    case NodeType::Diff:
        return "diff";
    case NodeType::Intersection:
        return "intersection";
    case NodeType::Union:
        return "union";
    case NodeType::Object:
        return "object";
    }
    return "unknown";
}

auto binary_op_symbol(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Diff:
        return "-";
    case BinaryOp::Intersection:
        return "&&";
    case BinaryOp::Union:
        return "||";
    }
    return "?";
}

auto binary_op_precedence(BinaryOp op) -> int {
    switch (op) {
    case BinaryOp::Union:
        return precedence::UNION;
    case BinaryOp::Diff:
    case BinaryOp::Intersection:
        return precedence::INTERSECTION;
    }
    return precedence::NONE;
}

void ListNode::append(NodePtr node) {
    nodes.push_back(std::move(node));
}

// ============================================================================
// Factories
// ============================================================================

auto make_node(Node node) -> NodePtr {
    return NodePtr(new Node(std::move(node)));
}

auto make_list(Pos pos, std::vector<NodePtr> nodes) -> NodePtr {
    return make_node(Node{.kind = ListNode{.nodes = std::move(nodes)}, .pos = pos});
}

auto make_binary(BinaryOp op, NodePtr left, NodePtr right, Pos pos) -> NodePtr {
    return make_node(Node{
        .kind = BinaryNode{.op = op, .left = std::move(left), .right = std::move(right)},
        .pos = pos});
}

auto make_object(Pos pos, std::string ident, std::vector<NodePtr> params,
                 std::vector<NodePtr> location_params) -> NodePtr {
    return make_node(Node{.kind = ObjectNode{.ident = std::move(ident),
                                             .params = std::move(params),
                                             .location_params = std::move(location_params)},
                          .pos = pos});
}

// ============================================================================
// Deletion
// ============================================================================

void NodeDeleter::operator()(Node* node) const {
    std::vector<Node*> pending{node};
    while (!pending.empty()) {
        Node* current = pending.back();
        pending.pop_back();
        if (!current) {
            continue;
        }
        // Detach the children first so deleting `current` cannot recurse.
        std::visit(
            [&pending](auto& n) {
                using T = std::decay_t<decltype(n)>;
                if constexpr (std::is_same_v<T, ListNode>) {
                    for (auto& child : n.nodes) {
                        pending.push_back(child.release());
                    }
                } else if constexpr (std::is_same_v<T, BinaryNode>) {
                    pending.push_back(n.left.release());
                    pending.push_back(n.right.release());
                } else if constexpr (std::is_same_v<T, ObjectNode>) {
                    for (auto& param : n.params) {
                        pending.push_back(param.release());
                    }
                    for (auto& param : n.location_params) {
                        pending.push_back(param.release());
                    }
                }
            },
            current->kind);
        delete current;
    }
}

// ============================================================================
// Queries
// ============================================================================

auto Node::type() const -> NodeType {
    return std::visit(
        [](const auto& n) -> NodeType {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ListNode>) {
                return NodeType::List;
            } else if constexpr (std::is_same_v<T, NumberNode>) {
                return NodeType::Number;
            } else if constexpr (std::is_same_v<T, BinaryNode>) {
                switch (n.op) {
                case BinaryOp::Diff:
                    return NodeType::Diff;
                case BinaryOp::Intersection:
                    return NodeType::Intersection;
                case BinaryOp::Union:
                    return NodeType::Union;
                }
                return NodeType::Diff;
            } else {
                return NodeType::Object;
            }
        },
        kind);
}

// ============================================================================
// Deep Copy
// ============================================================================

auto copy_shell(const Node& node, std::vector<CopyTask>& pending) -> NodePtr {
    return std::visit(
        [&node, &pending](const auto& n) -> NodePtr {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ListNode>) {
                auto list = make_list(node.pos, std::vector<NodePtr>(n.nodes.size()));
                auto& slots = list->as<ListNode>().nodes;
                for (size_t i = n.nodes.size(); i-- > 0;) {
                    pending.push_back(CopyTask{.source = n.nodes[i].get(), .slot = &slots[i]});
                }
                return list;
            } else if constexpr (std::is_same_v<T, NumberNode>) {
                return make_node(Node{.kind = n, .pos = node.pos});
            } else if constexpr (std::is_same_v<T, BinaryNode>) {
                auto binary = make_binary(n.op, nullptr, nullptr, node.pos);
                auto& shell = binary->template as<BinaryNode>();
                pending.push_back(CopyTask{.source = n.right.get(), .slot = &shell.right});
                pending.push_back(CopyTask{.source = n.left.get(), .slot = &shell.left});
                return binary;
            } else {
                auto object =
                    make_object(node.pos, n.ident, std::vector<NodePtr>(n.params.size()),
                                std::vector<NodePtr>(n.location_params.size()));
                auto& shell = object->template as<ObjectNode>();
                for (size_t i = n.location_params.size(); i-- > 0;) {
                    pending.push_back(CopyTask{.source = n.location_params[i].get(),
                                               .slot = &shell.location_params[i]});
                }
                for (size_t i = n.params.size(); i-- > 0;) {
                    pending.push_back(
                        CopyTask{.source = n.params[i].get(), .slot = &shell.params[i]});
                }
                return object;
            }
        },
        node.kind);
}

auto Node::copy() const -> NodePtr {
    NodePtr root;
    std::vector<CopyTask> pending{CopyTask{.source = this, .slot = &root}};
    while (!pending.empty()) {
        CopyTask task = pending.back();
        pending.pop_back();
        *task.slot = copy_shell(*task.source, pending);
    }
    return root;
}

auto operator<<(std::ostream& os, const Node& node) -> std::ostream& {
    return os << node.to_string();
}

} // namespace sml::parser
