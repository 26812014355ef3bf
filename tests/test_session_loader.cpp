#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/SessionLoader.h"
#include "core/Scorer.h"
#include "core/ModuleRegistry.h"
#include "core/Errors.h"
#include "core/Logging.h"

namespace revkit {

class SessionLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        for (const char* id : {"owasp-core", "deploy-checklist"}) {
            Module m;
            m.id = id;
            m.category = ModuleCategory::Checklist;
            m.token_estimate = 100;
            m.checklist_items = 10;
            registry.register_module(m);
        }
        registry.seal();
    }

    ModuleRegistry registry;
    FindingsAggregator aggregator{registry};
};

TEST_F(SessionLoaderTest, ReplaysFindings) {
    ReviewSession s = SessionLoader(aggregator).load_text(
        "session=payments-review\n"
        "\n"
        "module=owasp-core\n"
        "severity=P1\n"
        "category=injection\n"
        "description=Unparameterized query\n"
        "location=src/db/query.cpp:88\n"
        "\n"
        "module=deploy-checklist\n"
        "severity=p3\n", "s.findings");

    EXPECT_EQ(s.name(), "payments-review");
    EXPECT_EQ(s.status(), SessionStatus::InProgress);
    ASSERT_EQ(s.findings().size(), 2u);
    const Finding& f = s.findings()[0];
    EXPECT_EQ(f.module_id, "owasp-core");
    EXPECT_EQ(f.severity, Severity::P1);
    EXPECT_EQ(f.category, "injection");
    EXPECT_EQ(f.description, "Unparameterized query");
    ASSERT_TRUE(f.location.has_value());
    EXPECT_EQ(f.location->line, 88);
    EXPECT_EQ(s.findings()[1].severity, Severity::P3);
    EXPECT_FALSE(s.findings()[1].location.has_value());

    ScoreReport r = aggregator.finalize(s);
    EXPECT_EQ(r.risk_level, RiskLevel::High);
    EXPECT_DOUBLE_EQ(*r.checklist_percentage, 95.0);
}

TEST_F(SessionLoaderTest, DefaultSessionName) {
    ReviewSession s = SessionLoader(aggregator).load_text("", "empty");
    EXPECT_EQ(s.name(), "review");
    EXPECT_EQ(s.status(), SessionStatus::Created);
}

TEST_F(SessionLoaderTest, SeverityRequiredAndValidated) {
    SessionLoader loader(aggregator);
    EXPECT_THROW(loader.load_text("module=owasp-core\ncategory=x\n", "s"), FormatError);
    EXPECT_THROW(loader.load_text("module=owasp-core\nseverity=P7\n", "s"), FormatError);
}

TEST_F(SessionLoaderTest, UnknownKeysRejected) {
    SessionLoader loader(aggregator);
    EXPECT_THROW(loader.load_text("owner=me\nmodule=owasp-core\nseverity=P1\n", "s"), FormatError);
    EXPECT_THROW(loader.load_text("module=owasp-core\nseverity=P1\nscore=3\n", "s"), FormatError);
}

TEST_F(SessionLoaderTest, UnknownModuleRejected) {
    EXPECT_THROW(SessionLoader(aggregator).load_text("module=ghost\nseverity=P0\n", "s"), UnknownModuleError);
}

TEST_F(SessionLoaderTest, MissingFile) {
    EXPECT_THROW(SessionLoader(aggregator).load_file("/non/existent/session"), Error);
}

} // namespace revkit

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
