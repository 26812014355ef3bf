#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/ManifestLoader.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace revkit {

using ::testing::ElementsAre;

class ManifestLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }

    void load(const std::string& text) {
        loader.load_text(text, "test.manifest", registry, goals);
    }

    ManifestLoader loader;
    ModuleRegistry registry;
    GoalCatalog goals;
};

const char* kManifest =
    "# security review modules\n"
    "id=owasp-core\n"
    "title=OWASP basics\n"
    "category=core\n"
    "tokens=1200\n"
    "tags=security, web\n"
    "\n"
    "id=sql-injection\n"
    "category=specialized\n"
    "tokens=800\n"
    "depends=owasp-core\n"
    "tags=web,db\n"
    "\n"
    "id=deploy-checklist\n"
    "category=checklist\n"
    "tokens=300\n"
    "checklist_items=20\n"
    "\n"
    "goal=pre-deploy\n"
    "title=Before shipping\n"
    "modules=deploy-checklist\n"
    "tags=db\n";

TEST_F(ManifestLoaderTest, LoadsModulesAndGoals) {
    load(kManifest);
    EXPECT_TRUE(registry.sealed());
    ASSERT_EQ(registry.size(), 3u);

    const Module& core = registry.at("owasp-core");
    EXPECT_EQ(core.title, "OWASP basics");
    EXPECT_EQ(core.category, ModuleCategory::Core);
    EXPECT_EQ(core.token_estimate, 1200);
    EXPECT_TRUE(core.has_tag("security"));
    EXPECT_TRUE(core.has_tag("web"));

    const Module& sqli = registry.at("sql-injection");
    EXPECT_EQ(sqli.title, "sql-injection"); // defaults to id
    EXPECT_THAT(sqli.dependencies, ElementsAre("owasp-core"));

    const Module& cl = registry.at("deploy-checklist");
    EXPECT_EQ(cl.category, ModuleCategory::Checklist);
    ASSERT_TRUE(cl.checklist_items.has_value());
    EXPECT_EQ(*cl.checklist_items, 20);

    const Goal& g = goals.at("pre-deploy");
    EXPECT_EQ(g.title, "Before shipping");
    EXPECT_THAT(g.module_ids, ElementsAre("deploy-checklist"));
    EXPECT_THAT(g.tags, ElementsAre("db"));
}

TEST_F(ManifestLoaderTest, MissingTokensIsFormatError) {
    try {
        load("id=a\ncategory=core\n");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.line(), 1u);
        EXPECT_EQ(e.exit_code(), ExitCode::InvalidManifest);
    }
    EXPECT_FALSE(registry.sealed());
}

TEST_F(ManifestLoaderTest, BadValuesAreFormatErrors) {
    EXPECT_THROW(load("id=a\ncategory=core\ntokens=lots\n"), FormatError);
    EXPECT_THROW(loader.load_text("id=a\ncategory=misc\ntokens=5\n", "m", registry, goals), FormatError);
}

TEST_F(ManifestLoaderTest, UnknownKeyAndStrayHeaderRejected) {
    EXPECT_THROW(load("id=a\ncategory=core\ntokens=5\ncolour=red\n"), FormatError);
    ModuleRegistry r2;
    GoalCatalog g2;
    EXPECT_THROW(loader.load_text("tokens=5\nid=a\ncategory=core\n", "m", r2, g2), FormatError);
}

TEST_F(ManifestLoaderTest, NonPositiveTokensIsInvalidModule) {
    EXPECT_THROW(load("id=a\ncategory=core\ntokens=0\n"), InvalidModuleError);
}

TEST_F(ManifestLoaderTest, CycleSurfacesFromSeal) {
    try {
        load("id=A\ncategory=core\ntokens=5\ndepends=B\n"
             "id=B\ncategory=core\ntokens=5\ndepends=A\n");
        FAIL() << "expected CyclicDependencyError";
    } catch (const CyclicDependencyError& e) {
        EXPECT_THAT(e.cycle(), ElementsAre("A", "B", "A"));
    }
}

TEST_F(ManifestLoaderTest, DuplicateModuleAndGoal) {
    EXPECT_THROW(load("id=a\ncategory=core\ntokens=5\nid=a\ncategory=core\ntokens=6\n"), DuplicateIdError);

    ModuleRegistry r2;
    GoalCatalog g2;
    EXPECT_THROW(loader.load_text("id=a\ncategory=core\ntokens=5\n"
                                  "goal=g\nmodules=a\ngoal=g\ntags=x\n", "m", r2, g2), FormatError);
}

TEST_F(ManifestLoaderTest, GoalNamingUnknownModule) {
    EXPECT_THROW(load("id=a\ncategory=core\ntokens=5\ngoal=g\nmodules=a,ghost\n"), UnknownModuleError);
    EXPECT_FALSE(registry.sealed());
}

TEST_F(ManifestLoaderTest, EmptyGoalRejected) {
    EXPECT_THROW(load("id=a\ncategory=core\ntokens=5\ngoal=g\ntitle=nothing\n"), FormatError);
}

TEST_F(ManifestLoaderTest, LoadFromFile) {
    fs::path path = fs::temp_directory_path() / ("revkit_manifest_" + std::to_string(::getpid()) + ".modules");
    {
        std::ofstream f(path);
        f << kManifest;
    }
    loader.load_file(path.string(), registry, goals);
    EXPECT_EQ(registry.size(), 3u);
    fs::remove(path);

    ModuleRegistry r2;
    GoalCatalog g2;
    EXPECT_THROW(loader.load_file(path.string(), r2, g2), Error);
}

} // namespace revkit

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
