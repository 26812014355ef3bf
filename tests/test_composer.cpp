#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/Composer.h"
#include "core/ModuleRegistry.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "core/Utils.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace revkit {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

class MockContentLoader : public ContentLoader {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, load, (const std::string& module_id), (override));
};

class ComposerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        add("intro", 10);
        add("body", 20);
        registry.seal();
        plan.ordered_modules = {&registry.at("intro"), &registry.at("body")};
        plan.total_tokens = 30;
        EXPECT_CALL(loader, name()).WillRepeatedly(Return("mock"));
    }

    void add(const std::string& id, long long tokens) {
        Module m;
        m.id = id;
        m.category = ModuleCategory::Core;
        m.token_estimate = tokens;
        registry.register_module(std::move(m));
    }

    ModuleRegistry registry;
    ExecutionPlan plan;
    MockContentLoader loader;
};

TEST_F(ComposerTest, ConcatenatesInPlanOrder) {
    {
        InSequence seq;
        EXPECT_CALL(loader, load("intro")).WillOnce(Return(std::string(40, 'a')));
        EXPECT_CALL(loader, load("body")).WillOnce(Return(std::string(81, 'b')));
    }
    Composition out = Composer(loader).compose(plan);

    EXPECT_EQ(out.artifact, std::string(40, 'a') + std::string(81, 'b'));
    const auto& man = out.manifest;
    ASSERT_EQ(man.entries.size(), 2u);
    EXPECT_EQ(man.entries[0].id, "intro");
    EXPECT_EQ(man.entries[0].offset, 0u);
    EXPECT_EQ(man.entries[0].length, 40u);
    EXPECT_EQ(man.entries[0].measured_tokens, 10);
    EXPECT_EQ(man.entries[1].offset, 40u);
    EXPECT_EQ(man.entries[1].measured_tokens, 21); // ceil(81 / 4)
    EXPECT_EQ(man.declared_tokens, 30);
    EXPECT_EQ(man.measured_tokens, 31);
    EXPECT_EQ(man.artifact_bytes, 121u);
    EXPECT_EQ(man.sha256, utils::sha256_hex(out.artifact));
    EXPECT_TRUE(man.warnings.empty()); // 31 is within 10% of 30
}

TEST_F(ComposerTest, WarnsWhenMeasuredExceedsTolerance) {
    EXPECT_CALL(loader, load("intro")).WillOnce(Return(std::string(40, 'a')));
    EXPECT_CALL(loader, load("body")).WillOnce(Return(std::string(100, 'b')));

    Composition out = Composer(loader).compose(plan);
    EXPECT_EQ(out.manifest.measured_tokens, 35);
    ASSERT_EQ(out.manifest.warnings.size(), 1u);
    EXPECT_EQ(out.manifest.warnings[0], "measured size 35 tokens exceeds declared 30 by 16.7%");
}

TEST_F(ComposerTest, SmallerContentIsNotAWarning) {
    EXPECT_CALL(loader, load(_)).WillRepeatedly(Return(std::string("x")));
    Composition out = Composer(loader).compose(plan);
    EXPECT_EQ(out.manifest.measured_tokens, 2);
    EXPECT_TRUE(out.manifest.warnings.empty());
}

TEST_F(ComposerTest, MissingContentPropagates) {
    EXPECT_CALL(loader, load("intro")).WillOnce(Throw(ContentLoadError("intro", "gone")));
    EXPECT_CALL(loader, load("body")).Times(0);
    EXPECT_THROW(Composer(loader).compose(plan), ContentLoadError);
}

TEST_F(ComposerTest, EmptyPlanComposesEmptyArtifact) {
    ExecutionPlan empty;
    Composition out = Composer(loader).compose(empty);
    EXPECT_TRUE(out.artifact.empty());
    EXPECT_EQ(out.manifest.sha256, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_TRUE(out.manifest.warnings.empty());
}

TEST(ComposerEstimateTest, EstimateTokensRoundsUp) {
    EXPECT_EQ(Composer::estimate_tokens(""), 0);
    EXPECT_EQ(Composer::estimate_tokens("abc"), 1);
    EXPECT_EQ(Composer::estimate_tokens("abcd"), 1);
    EXPECT_EQ(Composer::estimate_tokens("abcde"), 2);
}

class DirectoryContentLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("revkit_content_" + std::to_string(::getpid()));
        fs::create_directories(dir);
        std::ofstream f(dir / "owasp-core.md", std::ios::binary);
        f << "# OWASP\n";
    }
    void TearDown() override {
        fs::remove_all(dir);
    }
    fs::path dir;
};

TEST_F(DirectoryContentLoaderTest, LoadsById) {
    DirectoryContentLoader loader(dir.string());
    EXPECT_EQ(loader.load("owasp-core"), "# OWASP\n");
    EXPECT_EQ(loader.path_for("x"), (dir / "x.md").string());
}

TEST_F(DirectoryContentLoaderTest, MissingAndEscapingIdsFail) {
    DirectoryContentLoader loader(dir.string());
    EXPECT_THROW(loader.load("absent"), ContentLoadError);
    EXPECT_THROW(loader.load("../etc/passwd"), ContentLoadError);
    EXPECT_THROW(loader.load("sub/dir"), ContentLoadError);
    EXPECT_THROW(loader.load("sub\\dir"), ContentLoadError);
    EXPECT_THROW(loader.load(".."), ContentLoadError);
    EXPECT_THROW(loader.load("."), ContentLoadError);
    EXPECT_THROW(loader.load(""), ContentLoadError);
}

TEST_F(DirectoryContentLoaderTest, DottedIdsAreFileNames) {
    {
        std::ofstream f(dir / "owasp..v2.md", std::ios::binary);
        f << "v2";
    }
    DirectoryContentLoader loader(dir.string());
    EXPECT_EQ(loader.load("owasp..v2"), "v2");
}

} // namespace revkit

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
