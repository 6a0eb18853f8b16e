#include <gtest/gtest.h>

#include <set>
#include <string>

#include "system/ireg/alias_registry.hpp"
#include "system/ireg/dependency_graph.hpp"

using ireg::AliasRegistry;
using ireg::DependencyGraph;

using Names = std::set<std::string>;

TEST(DependencyGraphTest, RegisterDependencyIsIdempotent)
{
    AliasRegistry aliases;
    DependencyGraph graph(aliases);

    graph.registerDependency("repository", "service");
    graph.registerDependency("repository", "service");

    EXPECT_EQ(graph.dependentsOf("repository"), Names{"service"});
    EXPECT_EQ(graph.dependenciesOf("service"), Names{"repository"});
    EXPECT_TRUE(graph.hasDependents("repository"));
    EXPECT_FALSE(graph.hasDependents("service"));
}

TEST(DependencyGraphTest, ContainmentImpliesDependency)
{
    AliasRegistry aliases;
    DependencyGraph graph(aliases);

    graph.registerContainment("inner", "outer");
    graph.registerContainment("inner", "outer");

    EXPECT_EQ(graph.containedOf("outer"), Names{"inner"});
    EXPECT_EQ(graph.dependentsOf("inner"), Names{"outer"});
    EXPECT_EQ(graph.dependenciesOf("outer"), Names{"inner"});
}

TEST(DependencyGraphTest, IsDependentFollowsTransitiveEdges)
{
    AliasRegistry aliases;
    DependencyGraph graph(aliases);

    graph.registerDependency("a", "b");
    graph.registerDependency("b", "c");
    graph.registerDependency("c", "d");

    EXPECT_TRUE(graph.isDependent("a", "b"));
    EXPECT_TRUE(graph.isDependent("a", "d"));
    EXPECT_FALSE(graph.isDependent("d", "a"));
    EXPECT_FALSE(graph.isDependent("unknown", "a"));
}

TEST(DependencyGraphTest, IsDependentTerminatesOnCycles)
{
    AliasRegistry aliases;
    DependencyGraph graph(aliases);

    graph.registerDependency("a", "b");
    graph.registerDependency("b", "a");
    graph.registerDependency("b", "c");

    EXPECT_TRUE(graph.isDependent("a", "a"));
    EXPECT_TRUE(graph.isDependent("a", "c"));
    EXPECT_FALSE(graph.isDependent("a", "x"));
}

TEST(DependencyGraphTest, AliasesAreCanonicalized)
{
    AliasRegistry aliases;
    ASSERT_TRUE(aliases.registerAlias("dataSource", "ds"));
    DependencyGraph graph(aliases);

    graph.registerDependency("ds", "repository");

    EXPECT_EQ(graph.dependentsOf("dataSource"), Names{"repository"});
    EXPECT_TRUE(graph.dependentsOf("ds").empty());
    EXPECT_TRUE(graph.isDependent("ds", "repository"));
    EXPECT_TRUE(graph.isDependent("dataSource", "repository"));
}

TEST(DependencyGraphTest, TakeAndScrubRemoveEdges)
{
    AliasRegistry aliases;
    DependencyGraph graph(aliases);

    graph.registerDependency("a", "b");
    graph.registerDependency("c", "b");
    graph.registerContainment("inner", "b");

    EXPECT_EQ(graph.takeContained("b"), Names{"inner"});
    EXPECT_TRUE(graph.containedOf("b").empty());

    EXPECT_EQ(graph.takeDependents("a"), Names{"b"});
    EXPECT_FALSE(graph.hasDependents("a"));

    graph.scrub("b");
    EXPECT_FALSE(graph.hasDependents("c"));
    EXPECT_FALSE(graph.hasDependents("inner"));
    EXPECT_TRUE(graph.dependenciesOf("b").empty());
}

TEST(DependencyGraphTest, ClearDropsEverything)
{
    AliasRegistry aliases;
    DependencyGraph graph(aliases);

    graph.registerContainment("inner", "outer");
    graph.registerDependency("a", "b");
    graph.clear();

    EXPECT_TRUE(graph.containedOf("outer").empty());
    EXPECT_FALSE(graph.hasDependents("a"));
    EXPECT_TRUE(graph.dependenciesOf("b").empty());
}
