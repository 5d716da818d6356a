#include <gtest/gtest.h>
#include <agenthub/agenthub.hpp>

using namespace agenthub;

// ===========================================================================
// Helpers
// ===========================================================================

static StateEntry entry_owned_by(const AgentId& owner, Value value) {
    StateEntry e;
    e.key = "k";
    e.scope = StateScope::Global;
    e.value = std::move(value);
    e.owner = owner;
    e.version = 1;
    e.refresh_checksum();
    return e;
}

class PriorityModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        priorities.load_default_roles();
    }

    PriorityModel priorities;
};

// ===========================================================================
// Role hierarchy
// ===========================================================================

TEST_F(PriorityModelTest, DefaultRolesAreRanked) {
    EXPECT_EQ(priorities.role_of("security_validator"), AgentRole::Security);
    EXPECT_EQ(priorities.role_of("intent_router"), AgentRole::Orchestrator);
    EXPECT_EQ(priorities.role_of("research_agent"), AgentRole::Information);
    EXPECT_EQ(priorities.role_of("stranger"), AgentRole::None);

    EXPECT_EQ(priorities.priority_of("security_validator"), 1);
    EXPECT_EQ(priorities.priority_of("research_agent"), 7);
    EXPECT_EQ(priorities.priority_of("stranger"), PriorityModel::UNRANKED);
}

TEST_F(PriorityModelTest, SecurityAlwaysWins) {
    EXPECT_EQ(priorities.resolve({"research_agent", "security_validator", "intent_router"}),
              "security_validator");
}

TEST_F(PriorityModelTest, SecurityWinsEvenWhenOverridden) {
    priorities.set_priority("security_validator", 50);
    priorities.set_priority("intent_router", 0);
    EXPECT_EQ(priorities.resolve({"intent_router", "security_validator"}), "security_validator");
}

TEST_F(PriorityModelTest, HighestRankWinsWithoutSecurity) {
    EXPECT_EQ(priorities.resolve({"code_engineer", "audit_agent", "product_architect"}),
              "audit_agent");
}

TEST_F(PriorityModelTest, FirstAgentWinsTies) {
    priorities.assign_role("engineer_a", AgentRole::Implementation);
    priorities.assign_role("engineer_b", AgentRole::Implementation);
    EXPECT_EQ(priorities.resolve({"engineer_b", "engineer_a"}), "engineer_b");
}

TEST_F(PriorityModelTest, NoRankedAgentEscalatesToHuman) {
    EXPECT_EQ(priorities.resolve({"stranger_a", "stranger_b"}), HUMAN_OVERSIGHT);
    EXPECT_EQ(priorities.resolve({}), HUMAN_OVERSIGHT);
}

TEST_F(PriorityModelTest, AscendingAuthorityOrdersLowestFirst) {
    auto ordered = priorities.ascending_authority(
        {"security_validator", "research_agent", "stranger", "audit_agent"});
    ASSERT_EQ(ordered.size(), 4u);
    EXPECT_EQ(ordered[0], "stranger");
    EXPECT_EQ(ordered[1], "research_agent");
    EXPECT_EQ(ordered[2], "audit_agent");
    EXPECT_EQ(ordered[3], "security_validator");
}

TEST_F(PriorityModelTest, RemoveForgetsRoleAndOverride) {
    priorities.set_priority("code_engineer", 3);
    priorities.remove("code_engineer");
    EXPECT_EQ(priorities.role_of("code_engineer"), AgentRole::None);
    EXPECT_EQ(priorities.priority_of("code_engineer"), PriorityModel::UNRANKED);
}

// ===========================================================================
// Resolvers
// ===========================================================================

TEST_F(PriorityModelTest, LastWriterWinsAcceptsAnything) {
    LastWriterWinsResolver lww;
    auto existing = entry_owned_by("security_validator", Value(1));
    auto result = lww.resolve(existing, Value(2), "stranger");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->asInt(), 2);
}

TEST_F(PriorityModelTest, VersionVectorBehavesLikeLastWriterWins) {
    VersionVectorResolver vv;
    auto existing = entry_owned_by("a", Value("old"));
    auto result = vv.resolve(existing, Value("new"), "b");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->asString(), "new");
    EXPECT_EQ(vv.strategy(), ConflictStrategy::VersionVector);
}

TEST_F(PriorityModelTest, AgentPriorityRejectsLowerRankedWriter) {
    AgentPriorityResolver resolver(priorities);
    auto existing = entry_owned_by("audit_agent", Value("compliance"));

    EXPECT_FALSE(resolver.resolve(existing, Value("x"), "code_engineer").has_value());
    EXPECT_TRUE(resolver.resolve(existing, Value("x"), "intent_router").has_value());
    // Equal priority is accepted
    priorities.assign_role("auditor_two", AgentRole::Compliance);
    EXPECT_TRUE(resolver.resolve(existing, Value("x"), "auditor_two").has_value());
}

TEST_F(PriorityModelTest, AgentPriorityAcceptsOwnerRewrite) {
    AgentPriorityResolver resolver(priorities);
    auto existing = entry_owned_by("stranger", Value(1));
    EXPECT_TRUE(resolver.resolve(existing, Value(2), "stranger").has_value());
}

TEST_F(PriorityModelTest, MergeCombinesTopLevelKeys) {
    MergeResolver merge;
    Value old_value(Json::objectValue);
    old_value["a"] = 1;
    old_value["nested"]["x"] = 1;
    Value incoming(Json::objectValue);
    incoming["b"] = 2;
    incoming["nested"]["y"] = 2;

    auto result = merge.resolve(entry_owned_by("a", old_value), incoming, "b");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["a"].asInt(), 1);
    EXPECT_EQ((*result)["b"].asInt(), 2);
    // Shallow: nested objects are replaced, not merged
    EXPECT_FALSE((*result)["nested"].isMember("x"));
    EXPECT_EQ((*result)["nested"]["y"].asInt(), 2);
}

TEST_F(PriorityModelTest, MergeOverwritesNonObjects) {
    MergeResolver merge;
    auto result = merge.resolve(entry_owned_by("a", Value(5)), Value("text"), "b");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->asString(), "text");
}

TEST_F(PriorityModelTest, HumanInterventionRejects) {
    HumanInterventionResolver human;
    EXPECT_FALSE(human.resolve(entry_owned_by("a", Value(1)), Value(2), "b").has_value());
}

TEST_F(PriorityModelTest, FactoryBuildsEveryStrategy) {
    for (auto strategy : {ConflictStrategy::LastWriterWins, ConflictStrategy::VersionVector,
                          ConflictStrategy::AgentPriority, ConflictStrategy::Merge,
                          ConflictStrategy::HumanIntervention}) {
        auto resolver = make_resolver(strategy, priorities);
        ASSERT_NE(resolver, nullptr);
        EXPECT_EQ(resolver->strategy(), strategy);
    }
}
