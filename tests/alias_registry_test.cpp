#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>

#include "system/ireg/alias_registry.hpp"

using ireg::AliasRegistry;

TEST(AliasRegistryTest, RejectsEmptyNames)
{
    AliasRegistry aliases;
    EXPECT_EQ(aliases.registerAlias("", "a").code(), ResultCode::InvalidArgument);
    EXPECT_EQ(aliases.registerAlias("a", "").code(), ResultCode::InvalidArgument);
    EXPECT_FALSE(aliases.isAlias(""));
}

TEST(AliasRegistryTest, CanonicalizeFollowsChain)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("dataSource", "ds"));
    ASSERT_TRUE(aliases.registerAlias("ds", "db"));

    EXPECT_EQ(aliases.canonicalize("db"), "dataSource");
    EXPECT_EQ(aliases.canonicalize("ds"), "dataSource");
    EXPECT_EQ(aliases.canonicalize("dataSource"), "dataSource");
    EXPECT_EQ(aliases.canonicalize("unknown"), "unknown");
    EXPECT_TRUE(aliases.hasAlias("dataSource", "db"));
    EXPECT_FALSE(aliases.hasAlias("db", "dataSource"));
}

TEST(AliasRegistryTest, SelfAliasLeavesNoEdge)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("x", "x"));
    EXPECT_FALSE(aliases.isAlias("x"));

    // 기존 alias 도 제거된다
    ASSERT_TRUE(aliases.registerAlias("y", "x"));
    ASSERT_TRUE(aliases.isAlias("x"));
    ASSERT_TRUE(aliases.registerAlias("x", "x"));
    EXPECT_FALSE(aliases.isAlias("x"));
}

TEST(AliasRegistryTest, ReRegisteringSameTargetIsIdempotent)
{
    AliasRegistry aliases(false);
    ASSERT_TRUE(aliases.registerAlias("a", "b"));
    EXPECT_TRUE(aliases.registerAlias("a", "b"));
    EXPECT_EQ(aliases.getAliases("a").size(), 1u);
}

TEST(AliasRegistryTest, OverridingPolicy)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("first", "alias"));
    ASSERT_TRUE(aliases.registerAlias("second", "alias"));
    EXPECT_EQ(aliases.canonicalize("alias"), "second");

    aliases.setAllowOverriding(false);
    auto r = aliases.registerAlias("third", "alias");
    EXPECT_EQ(r.code(), ResultCode::AlreadyExists);
    EXPECT_EQ(aliases.canonicalize("alias"), "second");
}

TEST(AliasRegistryTest, CycleIsRejectedWithoutPartialEdge)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("b", "a"));
    ASSERT_TRUE(aliases.registerAlias("c", "b"));

    auto r = aliases.registerAlias("a", "c");
    EXPECT_EQ(r.code(), ResultCode::CircularAlias);
    EXPECT_FALSE(aliases.isAlias("c"));
    EXPECT_EQ(aliases.canonicalize("a"), "c");
}

TEST(AliasRegistryTest, DirectCycleIsRejected)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("b", "a"));
    EXPECT_EQ(aliases.registerAlias("a", "b").code(), ResultCode::CircularAlias);
    EXPECT_FALSE(aliases.isAlias("b"));
}

TEST(AliasRegistryTest, RemoveAlias)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("service", "svc"));
    EXPECT_TRUE(aliases.removeAlias("svc"));
    EXPECT_FALSE(aliases.isAlias("svc"));
    EXPECT_EQ(aliases.removeAlias("svc").code(), ResultCode::NotFound);
}

TEST(AliasRegistryTest, GetAliasesIsTransitive)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("root", "a"));
    ASSERT_TRUE(aliases.registerAlias("a", "b"));
    ASSERT_TRUE(aliases.registerAlias("root", "c"));
    ASSERT_TRUE(aliases.registerAlias("other", "d"));

    auto result = aliases.getAliases("root");
    std::sort(result.begin(), result.end());
    EXPECT_EQ(result, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(aliases.getAliases("none").empty());
}

TEST(AliasRegistryTest, ResolveAllRenamesAliases)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("${svc}", "${short}"));

    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "${svc}") return std::string("service");
        if (s == "${short}") return std::string("svc");
        return s;
    });
    ASSERT_TRUE(r) << to_string(r);
    EXPECT_FALSE(aliases.isAlias("${short}"));
    EXPECT_EQ(aliases.canonicalize("svc"), "service");
}

TEST(AliasRegistryTest, ResolveAllDropsAliasPointingToItself)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("name", "${placeholder}"));

    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "${placeholder}") return std::string("name");
        return s;
    });
    ASSERT_TRUE(r);
    EXPECT_FALSE(aliases.isAlias("${placeholder}"));
    EXPECT_FALSE(aliases.isAlias("name"));
}

TEST(AliasRegistryTest, ResolveAllDropsRedundantAlias)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("target", "alias"));
    ASSERT_TRUE(aliases.registerAlias("target", "${alias}"));

    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "${alias}") return std::string("alias");
        return s;
    });
    ASSERT_TRUE(r);
    EXPECT_FALSE(aliases.isAlias("${alias}"));
    EXPECT_EQ(aliases.canonicalize("alias"), "target");
}

TEST(AliasRegistryTest, ResolveAllConflictLeavesMapUntouched)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("one", "alias"));
    ASSERT_TRUE(aliases.registerAlias("two", "${alias}"));

    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "${alias}") return std::string("alias");
        return s;
    });
    EXPECT_EQ(r.code(), ResultCode::ResolutionConflict);
    EXPECT_TRUE(aliases.isAlias("${alias}"));
    EXPECT_EQ(aliases.canonicalize("alias"), "one");
}

TEST(AliasRegistryTest, ResolveAllDropsAliasWithoutResolvedValue)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("target", "gone"));
    ASSERT_TRUE(aliases.registerAlias("target", "kept"));

    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "gone") return std::nullopt;
        return s;
    });
    ASSERT_TRUE(r);
    EXPECT_FALSE(aliases.isAlias("gone"));
    EXPECT_TRUE(aliases.isAlias("kept"));
}

TEST(AliasRegistryTest, ResolveAllRejectsCycleFromRetargetedAlias)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("y", "x"));
    ASSERT_TRUE(aliases.registerAlias("z", "y"));

    // y -> z 가 y -> x 로 바뀌면 x -> y -> x 순환이 된다
    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "z") return std::string("x");
        return s;
    });
    EXPECT_EQ(r.code(), ResultCode::CircularAlias);
    EXPECT_EQ(aliases.canonicalize("x"), "z");
    EXPECT_EQ(aliases.canonicalize("y"), "z");
}

TEST(AliasRegistryTest, ResolveAllRetargetsAliasInPlace)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("${target}", "alias"));

    auto r = aliases.resolveAll([](const std::string& s) -> std::optional<std::string> {
        if (s == "${target}") return std::string("target");
        return s;
    });
    ASSERT_TRUE(r) << to_string(r);
    EXPECT_EQ(aliases.canonicalize("alias"), "target");
}
