//! # Syntax Tree
//!
//! This module defines the node types of the SML syntax tree.
//!
//! ## Node Variants
//!
//! | Variant      | Source                 | Rendering               |
//! |--------------|------------------------|-------------------------|
//! | `ListNode`   | produced by reduction  | `(a)(b)`                |
//! | `NumberNode` | `42`, `0x1A`, `1+2i`   | literal text            |
//! | `BinaryNode` | `a - b`, `a && b`, `a \|\| b` | `left OP right`  |
//! | `ObjectNode` | `rect 1 2 @ 3 4`       | `ident params @ locs`   |
//!
//! `BinaryNode` carries one of three operators; `Node::type()` reports it
//! as `NodeType::Diff`, `NodeType::Intersection` or `NodeType::Union`.
//!
//! ## Ownership
//!
//! Every child is owned through a `NodePtr`; a node never shares a child
//! with another node. `copy()` is always deep.
//!
//! Long operator chains fold into deep left spines, so no pass over a tree
//! recurses: copy, rendering, reduction and deletion all walk the tree with
//! an explicit work list.
//!
//! ## Reduction
//!
//! `reduce()` builds a new tree and never touches the receiver:
//!
//! - a list reduces each child, left to right
//! - numbers and objects reduce to a copy of themselves
//! - a binary node reduces to the list `[reduce(left), reduce(right)]`

#ifndef SML_PARSER_AST_HPP
#define SML_PARSER_AST_HPP

#include "common.hpp"
#include "lexer/token.hpp"

#include <complex>
#include <memory>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace sml::parser {

struct Node;

/// Deletes a node and all its descendants without recursing.
struct NodeDeleter {
    void operator()(Node* node) const;
};

/// Owning pointer to a node.
using NodePtr = std::unique_ptr<Node, NodeDeleter>;

/// Identifies the variant of a node.
enum class NodeType : uint8_t {
    List,
    Number,
    Diff,
    Intersection,
    Union,
    Object,
};

/// Converts a node type to its name (e.g. "intersection").
[[nodiscard]] auto node_type_to_string(NodeType type) -> std::string_view;

/// Set operators.
enum class BinaryOp : uint8_t {
    Diff,         ///< `-`
    Intersection, ///< `&&`
    Union,        ///< `||`
};

/// Returns the operator's source symbol.
[[nodiscard]] auto binary_op_symbol(BinaryOp op) -> std::string_view;

// Operator precedence levels (higher = tighter binding)
namespace precedence {
constexpr int NONE = 0;
constexpr int UNION = 1;        // ||
constexpr int INTERSECTION = 2; // &&, -
} // namespace precedence

[[nodiscard]] auto binary_op_precedence(BinaryOp op) -> int;

/// An error raised while reducing a tree.
struct ReduceError {
    std::string message;
    Pos pos;
};

// ============================================================================
// Node Variants
// ============================================================================

/// Ordered sequence of nodes.
struct ListNode {
    std::vector<NodePtr> nodes; ///< The element nodes in order.

    void append(NodePtr node);
};

/// A numeric constant: signed or unsigned integer, float, or complex.
///
/// The value is stored under every representation that holds it exactly.
/// At least one of the `is_*` flags is set on a well-formed node.
struct NumberNode {
    bool is_int = false;     ///< Number has an integral value.
    bool is_uint = false;    ///< Number has an unsigned integral value.
    bool is_float = false;   ///< Number has a floating-point value.
    bool is_complex = false; ///< Number is complex.
    int64_t int64 = 0;
    uint64_t uint64 = 0;
    double float64 = 0.0;
    std::complex<double> complex128;
    std::string text; ///< The original literal text.

    /// Populates the float (and, when integral, the int/uint) view of a
    /// complex value whose imaginary part is zero.
    void simplify_complex();
};

/// A set operation with exclusively owned operands.
struct BinaryNode {
    BinaryOp op;
    NodePtr left;
    NodePtr right;
};

/// A placed geometric object: `rect 1 2 @ 3 4`.
///
/// A bare identifier used as a parameter is an object without parameters.
struct ObjectNode {
    std::string ident;
    std::vector<NodePtr> params;
    std::vector<NodePtr> location_params; ///< Parameters after `@`.
};

/// A syntax tree node.
struct Node {
    std::variant<ListNode, NumberNode, BinaryNode, ObjectNode> kind;
    Pos pos; ///< Byte offset of the start of the node.

    /// Checks if this node is of kind `T`.
    ///
    /// # Example
    /// ```cpp
    /// if (node.is<ObjectNode>()) { ... }
    /// ```
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this node as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    [[nodiscard]] auto type() const -> NodeType;

    [[nodiscard]] auto position() const -> Pos {
        return pos;
    }

    /// Renders the node as source-like text.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Deep copy of this node and all its descendants.
    [[nodiscard]] auto copy() const -> NodePtr;

    /// Builds the reduced form of this node. The receiver is left untouched.
    ///
    /// Fails with `operation cancelled` when `cancel` is signalled.
    [[nodiscard]] auto reduce(const CancellationToken* cancel = nullptr) const
        -> Result<NodePtr, ReduceError>;
};

auto operator<<(std::ostream& os, const Node& node) -> std::ostream&;

/// One step of a tree build: construct the node for `source` into `slot`.
struct CopyTask {
    const Node* source;
    NodePtr* slot;
};

/// Copies `node` with empty child slots and queues a task for each child,
/// so that popping the queue fills the children in source order.
[[nodiscard]] auto copy_shell(const Node& node, std::vector<CopyTask>& pending) -> NodePtr;

// ============================================================================
// Factory Functions
// ============================================================================

/// Moves `node` onto the heap.
[[nodiscard]] auto make_node(Node node) -> NodePtr;

[[nodiscard]] auto make_list(Pos pos, std::vector<NodePtr> nodes = {}) -> NodePtr;

/// Classifies a numeric literal.
///
/// `kind` is the token kind the literal was scanned as (`Number` or
/// `Complex`). Fails with `illegal number syntax: "<text>"` when the text
/// fits none of the representations.
[[nodiscard]] auto make_number(Pos pos, std::string text, lexer::TokenKind kind)
    -> Result<NodePtr, std::string>;

[[nodiscard]] auto make_binary(BinaryOp op, NodePtr left, NodePtr right, Pos pos) -> NodePtr;

[[nodiscard]] auto make_object(Pos pos, std::string ident, std::vector<NodePtr> params = {},
                               std::vector<NodePtr> location_params = {}) -> NodePtr;

} // namespace sml::parser

#endif // SML_PARSER_AST_HPP
