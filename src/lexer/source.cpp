#include "lexer/source.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace sml::lexer {

Source::Source(std::string name, std::string content)
    : name_(std::move(name)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.clear();
    line_offsets_.push_back(0);

    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (start >= content_.size()) {
        return {};
    }
    end = std::min(end, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

auto Source::location(Pos offset) const -> SourceLocation {
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    if (it != line_offsets_.begin()) {
        --it;
    }

    auto line_index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), it));
    auto column = static_cast<uint32_t>(offset - *it);

    return SourceLocation{.file = name_,
                          .line = line_index + 1,
                          .column = column + 1,
                          .offset = static_cast<uint32_t>(offset)};
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.fail() && !file.eof()) {
        return "failed to read file: " + path;
    }

    return Source(path, buffer.str());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace sml::lexer
