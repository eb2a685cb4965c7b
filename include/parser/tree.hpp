//! # Documents
//!
//! A `Tree` is one parsed SML document: its name, its source text and the
//! root node. `parse()` is the front end's entry point; `DocumentSet` keeps
//! the trees of several documents under unique names.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parser::parse("shapes", "rect 1 2 @ 3 4 - rect 1 1 @ 3 4");
//! if (is_ok(result)) {
//!     auto& tree = unwrap(result);
//!     std::cout << *tree.root << "\n";
//!     auto reduced = tree.root->reduce();
//! }
//! ```

#ifndef SML_PARSER_TREE_HPP
#define SML_PARSER_TREE_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token_stream.hpp"
#include "parser/ast.hpp"
#include "parser/parser.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sml::parser {

/// A parsed document. Immutable once built; reduction produces new nodes.
struct Tree {
    std::string name;
    lexer::Source source;
    NodePtr root;

    /// Deep copy; the copy shares no node with this tree.
    [[nodiscard]] auto copy() const -> Tree;
};

/// Scans and parses one document.
///
/// The scanner runs according to `mode`; the resulting tree is the same in
/// both modes. Fails with the first scan or parse error.
[[nodiscard]] auto parse(std::string name, std::string text, lexer::ScanMode mode,
                         const CancellationToken* cancel = nullptr) -> Result<Tree, ParseError>;

/// Scans and parses one document in the mode chosen by `ParseOptions`.
[[nodiscard]] auto parse(std::string name, std::string text) -> Result<Tree, ParseError>;

/// Named collection of parsed documents.
///
/// Names are unique. All members may be called from several threads; the
/// stored trees are shared read-only.
class DocumentSet {
public:
    /// Adds a parsed tree under its name.
    auto add(Tree tree) -> Result<Rc<const Tree>, ParseError>;

    /// Parses `text` and adds the tree under `name`.
    auto parse_into(std::string name, std::string text, lexer::ScanMode mode,
                    const CancellationToken* cancel = nullptr)
        -> Result<Rc<const Tree>, ParseError>;

    /// Returns the tree stored under `name`, or nullptr.
    [[nodiscard]] auto find(std::string_view name) const -> Rc<const Tree>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto size() const -> size_t;

    /// Document names in ascending order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Rc<const Tree>, std::less<>> trees_;

    [[nodiscard]] static auto duplicate_error(const std::string& name) -> ParseError;
};

} // namespace sml::parser

#endif // SML_PARSER_TREE_HPP
