//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_scope_strategy.cpp
// Purpose: Tests for scope strategy parsing and the exact/hierarchic/wildcard matchers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "authgate/ScopeStrategy.hpp"

using namespace authgate;

TEST(ScopeStrategy, FromString_KnownNamesCaseInsensitive) {
    EXPECT_EQ(ScopeStrategyFromString("").value(), ScopeStrategy::None);
    EXPECT_EQ(ScopeStrategyFromString("none").value(), ScopeStrategy::None);
    EXPECT_EQ(ScopeStrategyFromString("EXACT").value(), ScopeStrategy::Exact);
    EXPECT_EQ(ScopeStrategyFromString("Hierarchic").value(), ScopeStrategy::Hierarchic);
    EXPECT_EQ(ScopeStrategyFromString("wildcard").value(), ScopeStrategy::Wildcard);
    EXPECT_FALSE(ScopeStrategyFromString("regex").has_value());
    EXPECT_EQ(std::string(ScopeStrategyName(ScopeStrategy::Hierarchic)), std::string("hierarchic"));
}

TEST(ScopeStrategy, ResolveMatcher_NoneDisablesClientSideCheck) {
    EXPECT_FALSE(static_cast<bool>(ResolveScopeMatcher(ScopeStrategy::None)));
    EXPECT_TRUE(static_cast<bool>(ResolveScopeMatcher(ScopeStrategy::Exact)));
    EXPECT_TRUE(static_cast<bool>(ResolveScopeMatcher(ScopeStrategy::Hierarchic)));
    EXPECT_TRUE(static_cast<bool>(ResolveScopeMatcher(ScopeStrategy::Wildcard)));
}

TEST(ScopeStrategy, Exact_Membership) {
    const std::vector<std::string> granted{"read", "write"};
    EXPECT_TRUE(ExactScopeMatch(granted, "read"));
    EXPECT_TRUE(ExactScopeMatch(granted, "write"));
    EXPECT_FALSE(ExactScopeMatch(granted, "rea"));
    EXPECT_FALSE(ExactScopeMatch(granted, "read.all"));
    EXPECT_FALSE(ExactScopeMatch({}, "read"));
}

TEST(ScopeStrategy, Hierarchic_ParentGrantsChild) {
    const std::vector<std::string> granted{"foo", "bar.baz"};
    EXPECT_TRUE(HierarchicScopeMatch(granted, "foo"));
    EXPECT_TRUE(HierarchicScopeMatch(granted, "foo.bar"));
    EXPECT_TRUE(HierarchicScopeMatch(granted, "foo.bar.baz"));
    EXPECT_TRUE(HierarchicScopeMatch(granted, "bar.baz.qux"));
    EXPECT_FALSE(HierarchicScopeMatch(granted, "bar"));
    EXPECT_FALSE(HierarchicScopeMatch(granted, "foobar"));
    EXPECT_FALSE(HierarchicScopeMatch(granted, "baz"));
}

TEST(ScopeStrategy, Wildcard_Segments) {
    EXPECT_TRUE(WildcardScopeMatch({"foo.*"}, "foo.bar"));
    EXPECT_TRUE(WildcardScopeMatch({"foo.*"}, "foo.bar.baz"));
    EXPECT_FALSE(WildcardScopeMatch({"foo.*"}, "foo"));
    EXPECT_TRUE(WildcardScopeMatch({"foo.*.baz"}, "foo.bar.baz"));
    EXPECT_FALSE(WildcardScopeMatch({"foo.*.baz"}, "foo.bar.qux"));
    EXPECT_FALSE(WildcardScopeMatch({"foo.*.baz"}, "foo.bar.baz.qux"));
    EXPECT_TRUE(WildcardScopeMatch({"*"}, "anything"));
    EXPECT_TRUE(WildcardScopeMatch({"*"}, "any.thing"));
    EXPECT_FALSE(WildcardScopeMatch({"foo.*"}, "foo."));
    EXPECT_TRUE(WildcardScopeMatch({"read", "write"}, "write"));
    EXPECT_FALSE(WildcardScopeMatch({"foo.bar"}, "foo"));
}
