#include "parser/tree.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace sml;
using namespace sml::parser;

class ReduceTest : public ::testing::Test {
protected:
    auto parse_root(const std::string& code) -> NodePtr {
        auto result = parse("doc", code, lexer::ScanMode::Synchronous);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return nullptr;
        }
        return std::move(unwrap(result).root);
    }

    auto reduce(const Node& node, const CancellationToken* cancel = nullptr) -> NodePtr {
        auto result = node.reduce(cancel);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        if (is_err(result)) {
            return nullptr;
        }
        return std::move(unwrap(result));
    }
};

TEST_F(ReduceTest, DiffBecomesList) {
    auto root = parse_root("1 - 2");
    ASSERT_NE(root, nullptr);
    auto reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    EXPECT_EQ(reduced->type(), NodeType::List);
    EXPECT_EQ(reduced->to_string(), "(1)(2)");
    EXPECT_EQ(reduced->as<ListNode>().nodes.size(), 2u);
}

TEST_F(ReduceTest, ReceiverIsUnchanged) {
    auto root = parse_root("1 - 2");
    ASSERT_NE(root, nullptr);
    auto reduced = reduce(*root);
    EXPECT_EQ(root->type(), NodeType::Diff);
    EXPECT_EQ(root->to_string(), "1 - 2");
}

TEST_F(ReduceTest, ObjectReducesToCopy) {
    auto root = parse_root("rect 1 2 @ 3 4");
    ASSERT_NE(root, nullptr);
    auto reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    EXPECT_EQ(reduced->type(), NodeType::Object);
    EXPECT_EQ(reduced->to_string(), "rect 1 2 @ 3 4");
    EXPECT_NE(reduced.get(), root.get());

    reduced->as<ObjectNode>().ident = "square";
    EXPECT_EQ(root->as<ObjectNode>().ident, "rect");
}

TEST_F(ReduceTest, NumberReducesToCopy) {
    auto root = parse_root("3.5");
    ASSERT_NE(root, nullptr);
    auto reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    EXPECT_TRUE(reduced->as<NumberNode>().is_float);
    EXPECT_DOUBLE_EQ(reduced->as<NumberNode>().float64, 3.5);
    EXPECT_NE(reduced.get(), root.get());
}

TEST_F(ReduceTest, EveryOperatorIsCollected) {
    auto root = parse_root("a || b && c");
    ASSERT_NE(root, nullptr);
    auto reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    EXPECT_EQ(reduced->to_string(), "(a)((b)(c))");

    root = parse_root("1 - 2 - 3");
    ASSERT_NE(root, nullptr);
    reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    EXPECT_EQ(reduced->to_string(), "((1)(2))(3)");
}

TEST_F(ReduceTest, ListTakesBinaryNodePosition) {
    auto root = parse_root("  a - b");
    ASSERT_NE(root, nullptr);
    auto reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    EXPECT_EQ(reduced->position(), 2u);
    EXPECT_EQ(reduced->as<ListNode>().nodes[1]->position(), 6u);
}

TEST_F(ReduceTest, ListReducesEachChild) {
    std::vector<NodePtr> nodes;
    nodes.push_back(make_binary(BinaryOp::Diff, make_object(0, "a"), make_object(4, "b"), 0));
    nodes.push_back(make_object(8, "c"));
    auto list = make_list(0, std::move(nodes));

    auto reduced = reduce(*list);
    ASSERT_NE(reduced, nullptr);
    EXPECT_EQ(reduced->to_string(), "((a)(b))(c)");
    EXPECT_EQ(list->to_string(), "(a - b)(c)");
}

TEST_F(ReduceTest, SecondReductionIsFixedPoint) {
    for (const char* code : {"1 - 2", "rect 1 2 @ 3 4", "a || b && c - d", "(a || b) && (c || d)",
                             "rect (w - 1) 2 @ 0 0 || x"}) {
        auto root = parse_root(code);
        ASSERT_NE(root, nullptr);
        auto once = reduce(*root);
        ASSERT_NE(once, nullptr);
        auto twice = reduce(*once);
        ASSERT_NE(twice, nullptr);
        EXPECT_EQ(twice->to_string(), once->to_string()) << code;
    }
}

TEST_F(ReduceTest, LongUnionChain) {
    constexpr size_t terms = 5000;
    std::string chain = "1";
    for (size_t i = 1; i < terms; ++i) {
        chain += " || 1";
    }
    auto root = parse_root(chain);
    ASSERT_NE(root, nullptr);

    auto reduced = reduce(*root);
    ASSERT_NE(reduced, nullptr);
    std::string expected = std::string(terms - 1, '(') + "1";
    for (size_t i = 1; i < terms; ++i) {
        expected += ")(1)";
    }
    EXPECT_EQ(reduced->to_string(), expected);
    EXPECT_EQ(root->to_string(), chain);

    auto again = reduce(*reduced);
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(again->to_string(), expected);
}

TEST_F(ReduceTest, Cancelled) {
    auto root = parse_root("a || b");
    ASSERT_NE(root, nullptr);
    CancellationToken cancel;
    cancel.cancel();

    auto result = root->reduce(&cancel);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "operation cancelled");
    EXPECT_EQ(unwrap_err(result).pos, 0u);
}

TEST_F(ReduceTest, ConcurrentReductionOfSharedTree) {
    auto root = parse_root("rect 1 2 @ 3 4 - (a || b) && c");
    ASSERT_NE(root, nullptr);
    auto expected = reduce(*root)->to_string();

    std::vector<std::string> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            auto result = root->reduce();
            if (is_ok(result)) {
                results[i] = unwrap(result)->to_string();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& result : results) {
        EXPECT_EQ(result, expected);
    }
}
