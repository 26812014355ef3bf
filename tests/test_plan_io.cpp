#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/PlanIO.h"
#include "core/ModuleRegistry.h"
#include "core/Resolver.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace revkit {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class PlanIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        add("A", ModuleCategory::Core, 1000, {});
        add("B", ModuleCategory::Specialized, 2000, {"A"});
        add("C", ModuleCategory::Checklist, 500, {});
        registry.seal();
    }

    void add(const std::string& id, ModuleCategory cat, long long tokens, std::vector<std::string> deps) {
        Module m;
        m.id = id;
        m.category = cat;
        m.token_estimate = tokens;
        m.dependencies = std::move(deps);
        registry.register_module(std::move(m));
    }

    ModuleRegistry registry;
};

TEST_F(PlanIOTest, WritesResolvedPlan) {
    SelectionCriteria c;
    c.explicit_ids = {"B", "C"};
    c.token_budget = 3000;
    ExecutionPlan plan = Resolver(registry).resolve(c);

    std::string text = planio::plan_to_string(plan);
    EXPECT_THAT(text, HasSubstr("plan_version=1\n"));
    EXPECT_THAT(text, HasSubstr("total_tokens=3000\nmodule=A\nmodule=B\ndropped=C\nwarning=dropped 'C'"));

    ExecutionPlan back = planio::parse_plan(text, "plan.txt", registry);
    EXPECT_EQ(back.ordered_ids(), plan.ordered_ids());
    EXPECT_EQ(back.total_tokens, 3000);
    EXPECT_EQ(back.dropped_modules, plan.dropped_modules);
    EXPECT_EQ(back.warnings, plan.warnings);
}

TEST_F(PlanIOTest, MissingOrWrongVersion) {
    EXPECT_THROW(planio::parse_plan("module=A\n", "p", registry), FormatError);
    EXPECT_THROW(planio::parse_plan("plan_version=2\nmodule=A\n", "p", registry), FormatError);
}

TEST_F(PlanIOTest, UnknownModuleInPlan) {
    try {
        planio::parse_plan("plan_version=1\nmodule=A\nmodule=Z\n", "p", registry);
        FAIL() << "expected UnknownModuleError";
    } catch (const UnknownModuleError& e) {
        EXPECT_THAT(e.ids(), ElementsAre("Z"));
    }
}

TEST_F(PlanIOTest, DependencyOrderEnforced) {
    try {
        planio::parse_plan("plan_version=1\nmodule=B\nmodule=A\n", "p", registry);
        FAIL() << "expected InvalidDependencyError";
    } catch (const InvalidDependencyError& e) {
        EXPECT_EQ(e.module_id(), "B");
        EXPECT_THAT(e.missing(), ElementsAre("A"));
    }
    EXPECT_THROW(planio::parse_plan("plan_version=1\nmodule=B\n", "p", registry), InvalidDependencyError);
}

TEST_F(PlanIOTest, DuplicateAndUnknownKeysRejected) {
    EXPECT_THROW(planio::parse_plan("plan_version=1\nmodule=A\nmodule=A\n", "p", registry), FormatError);
    EXPECT_THROW(planio::parse_plan("plan_version=1\nbudget=10\n", "p", registry), FormatError);
}

TEST_F(PlanIOTest, StaleTotalIsRecomputedWithWarning) {
    ExecutionPlan plan = planio::parse_plan("plan_version=1\ntotal_tokens=42\nmodule=A\nmodule=C\n", "p", registry);
    EXPECT_EQ(plan.total_tokens, 1500);
    ASSERT_EQ(plan.warnings.size(), 1u);
    EXPECT_THAT(plan.warnings[0], HasSubstr("total_tokens=42"));
}

TEST_F(PlanIOTest, ReadPlanFromFile) {
    fs::path path = fs::temp_directory_path() / ("revkit_plan_" + std::to_string(::getpid()) + ".plan");
    {
        std::ofstream f(path);
        f << "# saved\nplan_version=1\ntotal_tokens=1000\nmodule=A\n";
    }
    ExecutionPlan plan = planio::read_plan(path.string(), registry);
    EXPECT_THAT(plan.ordered_ids(), ElementsAre("A"));
    EXPECT_TRUE(plan.warnings.empty());
    fs::remove(path);
    EXPECT_THROW(planio::read_plan(path.string(), registry), Error);
}

} // namespace revkit

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
