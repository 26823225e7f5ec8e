#include <gtest/gtest.h>
#include "recorder/coverage.h"

using namespace testsieve;

// ========== InMemoryCoverage ==========

TEST(CoverageTest, test_lines_are_recorded_per_context) {
    InMemoryCoverage coverage;
    coverage.start();
    coverage.switch_context("test_a");
    coverage.record("src/a.py", 3);
    coverage.record("src/a.py", std::set<int>{4, 5});
    coverage.switch_context("test_b");
    coverage.record("src/b.py", 1);

    auto data = coverage.data();
    ASSERT_EQ(data.size(), 2u);
    EXPECT_EQ(data["test_a"]["src/a.py"], (std::set<int>{3, 4, 5}));
    EXPECT_EQ(data["test_b"]["src/b.py"], (std::set<int>{1}));
}

TEST(CoverageTest, test_stopped_collector_ignores_lines) {
    InMemoryCoverage coverage;
    coverage.switch_context("test_a");
    coverage.record("src/a.py", 3);
    EXPECT_TRUE(coverage.data().empty());

    coverage.start();
    coverage.record("src/a.py", 3);
    coverage.stop();
    coverage.record("src/a.py", 9);
    EXPECT_EQ(coverage.data()["test_a"]["src/a.py"], (std::set<int>{3}));
}

TEST(CoverageTest, test_add_lines_merges_into_current_context) {
    InMemoryCoverage coverage;
    coverage.switch_context("outer");
    coverage.add_lines({{"src/a.py", {1, 2}}});
    coverage.add_lines({{"src/a.py", {2, 3}}, {"src/b.py", {7}}});
    auto data = coverage.data();
    EXPECT_EQ(data["outer"]["src/a.py"], (std::set<int>{1, 2, 3}));
    EXPECT_EQ(data["outer"]["src/b.py"], (std::set<int>{7}));
}

TEST(CoverageTest, test_erase) {
    InMemoryCoverage coverage;
    coverage.start();
    coverage.record("src/a.py", 1);
    coverage.erase();
    EXPECT_TRUE(coverage.data().empty());
    EXPECT_TRUE(coverage.started());
}

// ========== CoverageStack ==========

TEST(CoverageTest, test_push_pauses_outer_collector) {
    InMemoryCoverage outer;
    InMemoryCoverage inner;
    CoverageStack stack;

    stack.push(outer);
    EXPECT_TRUE(outer.started());
    EXPECT_EQ(stack.top(), &outer);
    EXPECT_EQ(stack.parent(), nullptr);

    stack.push(inner);
    EXPECT_FALSE(outer.started());
    EXPECT_TRUE(inner.started());
    EXPECT_EQ(stack.top(), &inner);
    EXPECT_EQ(stack.parent(), &outer);
    EXPECT_EQ(stack.size(), 2u);
}

TEST(CoverageTest, test_push_same_collector_twice_keeps_one_entry) {
    InMemoryCoverage coverage;
    CoverageStack stack;
    stack.push(coverage);
    stack.push(coverage);
    EXPECT_EQ(stack.size(), 1u);
    EXPECT_TRUE(coverage.started());
}

TEST(CoverageTest, test_release_resumes_outer_collector) {
    InMemoryCoverage outer;
    InMemoryCoverage inner;
    CoverageStack stack;
    stack.push(outer);
    stack.push(inner);

    stack.release(inner);
    EXPECT_FALSE(inner.started());
    EXPECT_TRUE(outer.started());
    EXPECT_EQ(stack.size(), 1u);
    EXPECT_FALSE(stack.contains(inner));
}

TEST(CoverageTest, test_release_pops_collectors_above) {
    InMemoryCoverage a;
    InMemoryCoverage b;
    InMemoryCoverage c;
    CoverageStack stack;
    stack.push(a);
    stack.push(b);
    stack.push(c);

    stack.release(b);
    EXPECT_EQ(stack.size(), 1u);
    EXPECT_FALSE(c.started());
    EXPECT_FALSE(b.started());
    EXPECT_TRUE(a.started());
}

TEST(CoverageTest, test_release_unknown_collector_is_noop) {
    InMemoryCoverage a;
    InMemoryCoverage other;
    CoverageStack stack;
    stack.push(a);
    stack.release(other);
    EXPECT_EQ(stack.size(), 1u);
    EXPECT_TRUE(a.started());
}
