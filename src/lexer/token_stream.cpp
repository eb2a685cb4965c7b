#include "lexer/token_stream.hpp"

#include "log/log.hpp"

namespace sml::lexer {

ConcurrentTokenStream::ConcurrentTokenStream(const Source& source) : lexer_(source) {
    worker_ = std::thread([this] { run(); });
}

ConcurrentTokenStream::~ConcurrentTokenStream() {
    handoff_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto ConcurrentTokenStream::next() -> std::optional<Token> {
    return handoff_.pop();
}

void ConcurrentTokenStream::run() {
    while (auto token = lexer_.next()) {
        if (!handoff_.push(std::move(*token))) {
            SML_LOG_DEBUG("lexer", "consumer went away, stopping scanner");
            break;
        }
    }
    handoff_.close();
}

auto default_scan_mode() -> ScanMode {
    return ParseOptions::concurrent_scan ? ScanMode::Concurrent : ScanMode::Synchronous;
}

auto open_token_stream(const Source& source, ScanMode mode) -> Box<TokenSource> {
    if (mode == ScanMode::Concurrent) {
        return make_box<ConcurrentTokenStream>(source);
    }
    return make_box<Lexer>(source);
}

} // namespace sml::lexer
