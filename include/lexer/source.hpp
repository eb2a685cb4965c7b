//! # Source Documents
//!
//! A `Source` owns one named document's text and converts byte offsets to
//! line/column positions for diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("rect 1 2\n@ 3 4", "shapes");
//! SourceLocation loc = source.location(9); // line 2, column 1
//! ```

#ifndef SML_LEXER_SOURCE_HPP
#define SML_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sml::lexer {

/// A named SML document with a line index.
///
/// String views returned by `content()` and `slice()` stay valid
/// as long as the Source object exists and is not moved from.
class Source {
public:
    Source(std::string name, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// The document name; used only for error reports.
    [[nodiscard]] auto name() const -> std::string_view {
        return name_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns a substring from `start` to `end` (exclusive), clamped to bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(Pos offset) const -> SourceLocation;

    /// Loads a document from disk. The document name is the path.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string name_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace sml::lexer

#endif // SML_LEXER_SOURCE_HPP
