//! # Reduction
//!
//! `Node::reduce()` normalises a tree into a new, independent tree.
//!
//! | Node     | Reduces to                            |
//! |----------|---------------------------------------|
//! | List     | copy with every child reduced in turn |
//! | Number   | copy                                  |
//! | Object   | copy                                  |
//! | Diff     | list `[reduce(left), reduce(right)]`  |
//! | Intersection, Union | same as Diff               |
//!
//! Operators are collected, not evaluated: no set arithmetic happens here.
//! The first error aborts the whole call and the partly built result is
//! dropped.

#include "log/log.hpp"
#include "parser/ast.hpp"

#include <vector>

namespace sml::parser {

auto Node::reduce(const CancellationToken* cancel) const -> Result<NodePtr, ReduceError> {
    NodePtr root;
    std::vector<CopyTask> pending{CopyTask{.source = this, .slot = &root}};

    // Pre-order, left to right. Only operators change shape; every other
    // node is rebuilt as it is and its children are reduced in its slots.
    while (!pending.empty()) {
        CopyTask task = pending.back();
        pending.pop_back();
        const Node& node = *task.source;

        if (cancel && cancel->is_cancelled()) {
            return ReduceError{.message = CANCELLED_MESSAGE, .pos = node.pos};
        }
        SML_LOG_TRACE("reduce", node_type_to_string(node.type()) << " at " << node.pos);

        if (node.is<BinaryNode>()) {
            const auto& binary = node.as<BinaryNode>();
            auto list = make_list(node.pos, std::vector<NodePtr>(2));
            auto& slots = list->as<ListNode>().nodes;
            pending.push_back(CopyTask{.source = binary.right.get(), .slot = &slots[1]});
            pending.push_back(CopyTask{.source = binary.left.get(), .slot = &slots[0]});
            *task.slot = std::move(list);
        } else if (node.is<ListNode>()) {
            *task.slot = copy_shell(node, pending);
        } else {
            *task.slot = node.copy();
        }
    }
    return root;
}

} // namespace sml::parser
