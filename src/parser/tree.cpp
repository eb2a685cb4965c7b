#include "parser/tree.hpp"

#include "log/log.hpp"

namespace sml::parser {

auto Tree::copy() const -> Tree {
    return Tree{.name = name, .source = source, .root = root ? root->copy() : nullptr};
}

auto parse(std::string name, std::string text, lexer::ScanMode mode,
           const CancellationToken* cancel) -> Result<Tree, ParseError> {
    lexer::Source source(name, std::move(text));

    Result<NodePtr, ParseError> root = ParseError{};
    {
        // The stream is closed and its scanner joined before the source moves.
        auto tokens = lexer::open_token_stream(source, mode);
        Parser parser(source, *tokens, cancel);
        root = parser.parse();
    }
    if (is_err(root)) {
        return std::move(unwrap_err(root));
    }
    return Tree{.name = std::move(name),
                .source = std::move(source),
                .root = std::move(unwrap(root))};
}

auto parse(std::string name, std::string text) -> Result<Tree, ParseError> {
    return parse(std::move(name), std::move(text), lexer::default_scan_mode());
}

// ============================================================================
// DocumentSet
// ============================================================================

auto DocumentSet::duplicate_error(const std::string& name) -> ParseError {
    return ParseError{.message = "document \"" + name + "\" already defined",
                      .pos = 0,
                      .line = 0,
                      .column = 0,
                      .document = name};
}

auto DocumentSet::add(Tree tree) -> Result<Rc<const Tree>, ParseError> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (trees_.contains(tree.name)) {
        return duplicate_error(tree.name);
    }
    std::string name = tree.name;
    auto shared = make_rc<const Tree>(std::move(tree));
    trees_.emplace(std::move(name), shared);
    SML_LOG_DEBUG("parser", "registered document " << shared->name);
    return shared;
}

auto DocumentSet::parse_into(std::string name, std::string text, lexer::ScanMode mode,
                             const CancellationToken* cancel)
    -> Result<Rc<const Tree>, ParseError> {
    if (contains(name)) {
        return duplicate_error(name);
    }
    auto result = parse(std::move(name), std::move(text), mode, cancel);
    if (is_err(result)) {
        return std::move(unwrap_err(result));
    }
    return add(std::move(unwrap(result)));
}

auto DocumentSet::find(std::string_view name) const -> Rc<const Tree> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trees_.find(name);
    if (it == trees_.end()) {
        return nullptr;
    }
    return it->second;
}

auto DocumentSet::contains(std::string_view name) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return trees_.find(name) != trees_.end();
}

auto DocumentSet::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return trees_.size();
}

auto DocumentSet::names() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(trees_.size());
    for (const auto& [name, tree] : trees_) {
        out.push_back(name);
    }
    return out;
}

} // namespace sml::parser
