#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/GoalCatalog.h"
#include "core/ModuleRegistry.h"
#include "core/Errors.h"

namespace revkit {

using ::testing::ElementsAre;

class GoalCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.add({"pre-deploy", "Before shipping", {"deploy-checklist", "secrets"}, {"deploy"}});
        catalog.add({"api", "API review", {"owasp-core"}, {"web", "deploy"}});
    }

    GoalCatalog catalog;
};

TEST_F(GoalCatalogTest, AddRejectsDuplicateName) {
    EXPECT_FALSE(catalog.add({"api", "", {"x"}, {}}));
    EXPECT_EQ(catalog.goals().size(), 2u);
}

TEST_F(GoalCatalogTest, LookupByName) {
    ASSERT_NE(catalog.find("api"), nullptr);
    EXPECT_EQ(catalog.at("api").title, "API review");
    EXPECT_EQ(catalog.find("nope"), nullptr);
    try {
        catalog.at("nope");
        FAIL() << "expected UnknownGoalError";
    } catch (const UnknownGoalError& e) {
        EXPECT_EQ(e.name(), "nope");
        EXPECT_EQ(e.exit_code(), ExitCode::UnknownModule);
    }
}

TEST_F(GoalCatalogTest, ExpandMergesPresetsWithoutDuplicates) {
    SelectionCriteria in;
    in.explicit_ids = {"secrets"};
    in.goal_tags = {"web"};
    in.presets = {"pre-deploy", "api"};
    in.token_budget = 5000;

    SelectionCriteria out = catalog.expand(in);
    EXPECT_THAT(out.explicit_ids, ElementsAre("secrets", "deploy-checklist", "owasp-core"));
    EXPECT_THAT(out.goal_tags, ElementsAre("web", "deploy"));
    EXPECT_TRUE(out.presets.empty());
    EXPECT_EQ(out.token_budget, 5000);
}

TEST_F(GoalCatalogTest, ExpandUnknownPreset) {
    SelectionCriteria in;
    in.presets = {"missing"};
    EXPECT_THROW(catalog.expand(in), UnknownGoalError);
}

TEST_F(GoalCatalogTest, ValidateAgainstRegistry) {
    ModuleRegistry registry;
    Module m;
    m.id = "owasp-core";
    m.token_estimate = 10;
    registry.register_module(m);
    registry.seal();
    try {
        catalog.validate(registry);
        FAIL() << "expected UnknownModuleError";
    } catch (const UnknownModuleError& e) {
        EXPECT_THAT(e.ids(), ElementsAre("deploy-checklist", "secrets"));
    }
}

} // namespace revkit

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
