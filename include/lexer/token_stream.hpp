//! # Concurrent Token Stream
//!
//! Runs the scanner on its own thread so scanning overlaps with parsing.
//!
//! ## Hand-Off
//!
//! Tokens travel from the scanner thread to the consumer through a
//! `HandOff<Token>`, a blocking queue of capacity one:
//!
//! - `push()` blocks while the slot is occupied
//! - `pop()` blocks while the slot is empty
//! - `close()` wakes both sides; a closed hand-off still delivers the item
//!   already in the slot, then reports end of stream
//!
//! The scanner therefore never runs more than one token ahead of the
//! consumer. The tokens are identical to those of a synchronous `Lexer`.
//!
//! ## Shutdown
//!
//! Destroying a `ConcurrentTokenStream` before the stream is drained (for
//! example after a parse error) closes the hand-off, which unblocks the
//! scanner thread, and joins it.

#ifndef SML_LEXER_TOKEN_STREAM_HPP
#define SML_LEXER_TOKEN_STREAM_HPP

#include "lexer/lexer.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace sml::lexer {

/// Thread-safe single-slot queue between one producer and one consumer.
template <typename T> class HandOff {
public:
    HandOff() = default;
    HandOff(const HandOff&) = delete;
    auto operator=(const HandOff&) -> HandOff& = delete;

    /// Places an item in the slot, waiting until it is free.
    ///
    /// Returns false (and drops the item) if the hand-off was closed.
    auto push(T item) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !slot_.has_value() || closed_; });
        if (closed_) {
            return false;
        }
        slot_ = std::move(item);
        cv_.notify_all();
        return true;
    }

    /// Takes the item from the slot, waiting until one is available.
    ///
    /// Returns `std::nullopt` once the hand-off is closed and empty.
    [[nodiscard]] auto pop() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return slot_.has_value() || closed_; });
        if (!slot_.has_value()) {
            return std::nullopt;
        }
        std::optional<T> item = std::move(slot_);
        slot_.reset();
        cv_.notify_all();
        return item;
    }

    /// Closes the hand-off. Safe to call more than once.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    [[nodiscard]] auto is_closed() -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> slot_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

/// A token source whose scanner runs on a dedicated thread.
class ConcurrentTokenStream : public TokenSource {
public:
    /// Starts scanning immediately. The source must outlive the stream.
    explicit ConcurrentTokenStream(const Source& source);
    ~ConcurrentTokenStream() override;

    ConcurrentTokenStream(const ConcurrentTokenStream&) = delete;
    auto operator=(const ConcurrentTokenStream&) -> ConcurrentTokenStream& = delete;

    [[nodiscard]] auto next() -> std::optional<Token> override;

private:
    /// Scanner thread body.
    void run();

    Lexer lexer_;
    HandOff<Token> handoff_;
    std::thread worker_;
};

/// How a document is scanned.
enum class ScanMode {
    Concurrent,  ///< Scanner thread behind a `HandOff`.
    Synchronous, ///< Tokens pulled from a `Lexer` on the caller's thread.
};

/// Returns the scan mode selected by `ParseOptions::concurrent_scan`.
[[nodiscard]] auto default_scan_mode() -> ScanMode;

/// Opens a token stream over `source` in the given mode. The source must
/// outlive the stream.
[[nodiscard]] auto open_token_stream(const Source& source, ScanMode mode) -> Box<TokenSource>;

} // namespace sml::lexer

#endif // SML_LEXER_TOKEN_STREAM_HPP
