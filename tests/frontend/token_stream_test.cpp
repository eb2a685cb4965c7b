#include "lexer/token_stream.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace sml;
using namespace sml::lexer;

// ============================================================================
// HandOff
// ============================================================================

TEST(HandOffTest, DeliversItemsInOrder) {
    HandOff<int> handoff;
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) {
            EXPECT_TRUE(handoff.push(i));
        }
        handoff.close();
    });

    std::vector<int> received;
    while (auto item = handoff.pop()) {
        received.push_back(*item);
    }
    producer.join();

    ASSERT_EQ(received.size(), 100);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

TEST(HandOffTest, ItemInSlotSurvivesClose) {
    HandOff<int> handoff;
    EXPECT_TRUE(handoff.push(7));
    handoff.close();
    EXPECT_TRUE(handoff.is_closed());

    auto item = handoff.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 7);
    EXPECT_FALSE(handoff.pop().has_value());
}

TEST(HandOffTest, PushAfterCloseFails) {
    HandOff<int> handoff;
    handoff.close();
    EXPECT_FALSE(handoff.push(1));
    EXPECT_FALSE(handoff.pop().has_value());
}

TEST(HandOffTest, CloseUnblocksWaitingProducer) {
    HandOff<int> handoff;
    EXPECT_TRUE(handoff.push(1)); // fills the slot

    bool pushed = true;
    std::thread producer([&] { pushed = handoff.push(2); });
    handoff.close();
    producer.join();

    EXPECT_FALSE(pushed);
}

TEST(HandOffTest, CloseUnblocksWaitingConsumer) {
    HandOff<int> handoff;
    std::optional<int> popped = 0;
    std::thread consumer([&] { popped = handoff.pop(); });
    handoff.close();
    consumer.join();

    EXPECT_FALSE(popped.has_value());
}

// ============================================================================
// ConcurrentTokenStream
// ============================================================================

class TokenStreamTest : public ::testing::Test {
protected:
    static auto drain(TokenSource& tokens) -> std::vector<Token> {
        std::vector<Token> out;
        while (auto token = tokens.next()) {
            out.push_back(std::move(*token));
        }
        return out;
    }

    static void expect_same(const std::vector<Token>& a, const std::vector<Token>& b) {
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(a[i].kind, b[i].kind) << i;
            EXPECT_EQ(a[i].pos, b[i].pos) << i;
            EXPECT_EQ(a[i].text, b[i].text) << i;
        }
    }
};

TEST_F(TokenStreamTest, MatchesSynchronousLexer) {
    for (const char* code : {"rect 1 2 @ 3 4", "(a || b) && c - 1", "", "1 +", "a # b",
                             "/* c */ rect 0x10 @ 1+2i // end"}) {
        auto source = Source::from_string(code);
        Lexer lexer(source);
        auto expected = lexer.tokenize();

        ConcurrentTokenStream stream(source);
        expect_same(drain(stream), expected);
    }
}

TEST_F(TokenStreamTest, EndsAfterErrorToken) {
    auto source = Source::from_string("1 + 2");
    ConcurrentTokenStream stream(source);
    auto tokens = drain(stream);
    ASSERT_FALSE(tokens.empty());
    EXPECT_TRUE(tokens.back().is_error());
    EXPECT_FALSE(stream.next().has_value());
}

TEST_F(TokenStreamTest, EarlyDestructionStopsScanner) {
    std::string code;
    for (int i = 0; i < 10000; ++i) {
        code += "rect 1 2 @ 3 4 || ";
    }
    code += "a";
    auto source = Source::from_string(code);

    {
        ConcurrentTokenStream stream(source);
        auto first = stream.next();
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(first->kind, TokenKind::KwRect);
    }
    SUCCEED();
}

TEST_F(TokenStreamTest, OpenTokenStreamModes) {
    auto source = Source::from_string("a && b");
    auto sync = open_token_stream(source, ScanMode::Synchronous);
    auto concurrent = open_token_stream(source, ScanMode::Concurrent);
    expect_same(drain(*concurrent), drain(*sync));
}

TEST_F(TokenStreamTest, DefaultModeFollowsOptions) {
    bool saved = ParseOptions::concurrent_scan;

    ParseOptions::concurrent_scan = true;
    EXPECT_EQ(default_scan_mode(), ScanMode::Concurrent);
    ParseOptions::concurrent_scan = false;
    EXPECT_EQ(default_scan_mode(), ScanMode::Synchronous);

    ParseOptions::concurrent_scan = saved;
}
