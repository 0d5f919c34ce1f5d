#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

using namespace po::config;
using po::library::SortPolicy;

TEST(ConfigTest, ParsesFullDocument) {
    const auto cfg = parseConfig(R"(
inputs:
  - /media/card/DCIM
  - /home/me/Downloads
output: /srv/photos
extensions: [jpg, png, cr2]
sort_policy: date
logging:
  log_file: /var/log/po.log
  levels:
    console_log_level: warn
    file_log_level: trace
    subsystem_levels:
      library: debug
      scan: error
)");

    ASSERT_EQ(cfg.inputs.size(), 2u);
    EXPECT_EQ(cfg.inputs[0], "/media/card/DCIM");
    EXPECT_EQ(cfg.inputs[1], "/home/me/Downloads");
    EXPECT_EQ(cfg.output, "/srv/photos");
    EXPECT_EQ(cfg.extensions, (std::vector<std::string>{"jpg", "png", "cr2"}));
    EXPECT_EQ(cfg.sort_policy, SortPolicy::Date);
    EXPECT_EQ(cfg.logging.log_file, "/var/log/po.log");

    const auto& levels = cfg.logging.levels;
    EXPECT_EQ(levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(levels.file_log_level, spdlog::level::trace);
    EXPECT_EQ(levels.subsystem_levels.library, spdlog::level::debug);
    EXPECT_EQ(levels.subsystem_levels.scan, spdlog::level::err);
    EXPECT_EQ(levels.subsystem_levels.shell, spdlog::level::warn); // untouched default
}

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = parseConfig("");
    EXPECT_TRUE(cfg.inputs.empty());
    EXPECT_TRUE(cfg.output.empty());
    EXPECT_TRUE(cfg.extensions.empty());
    EXPECT_EQ(cfg.sort_policy, SortPolicy::MoveToRoot);
    EXPECT_TRUE(cfg.logging.log_file.empty());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::info);
}

TEST(ConfigTest, SingleInputMayBeAScalar) {
    const auto cfg = parseConfig("inputs: /media/card\noutput: out\n");
    ASSERT_EQ(cfg.inputs.size(), 1u);
    EXPECT_EQ(cfg.inputs[0], "/media/card");
}

TEST(ConfigTest, SortPolicyAliasNone) {
    EXPECT_EQ(parseConfig("sort_policy: none").sort_policy, SortPolicy::MoveToRoot);
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_ANY_THROW(parseConfig("sort_policy: weekly"));
    EXPECT_ANY_THROW(parseConfig("logging: {levels: {console_log_level: chatty}}"));
    EXPECT_ANY_THROW(parseConfig("- just\n- a list\n"));
}

TEST(ConfigTest, ParseLevel) {
    EXPECT_EQ(parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLevel("off"), spdlog::level::off);
    EXPECT_THROW(parseLevel("verbose"), std::invalid_argument);
}

TEST(ConfigTest, YamlRoundTrip) {
    Config cfg;
    cfg.inputs = {"in/a", "in b"};
    cfg.output = "library";
    cfg.extensions = {"jpg", "heic"};
    cfg.sort_policy = SortPolicy::Date;
    cfg.logging.log_file = "po.log";
    cfg.logging.levels.subsystem_levels.library = spdlog::level::trace;

    const auto back = parseConfig(cfg.toYaml());
    EXPECT_EQ(back.inputs, cfg.inputs);
    EXPECT_EQ(back.output, cfg.output);
    EXPECT_EQ(back.extensions, cfg.extensions);
    EXPECT_EQ(back.sort_policy, cfg.sort_policy);
    EXPECT_EQ(back.logging.log_file, cfg.logging.log_file);
    EXPECT_EQ(back.logging.levels.subsystem_levels.library, spdlog::level::trace);
    EXPECT_EQ(back.logging.levels.subsystem_levels.shell, spdlog::level::warn);
}

class ConfigFileTest : public po::test::TempDirTest {};

TEST_F(ConfigFileTest, LoadsFromDisk) {
    const auto path = writeFile(root / "po.yaml", "output: sorted\nextensions: [jpg]\n");
    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.output, "sorted");
    EXPECT_EQ(cfg.extensions, std::vector<std::string>{"jpg"});
}

TEST_F(ConfigFileTest, MissingFileNamesThePath) {
    const auto path = root / "nope.yaml";
    try {
        (void)loadConfig(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

TEST_F(ConfigFileTest, MalformedYamlIsReported) {
    const auto path = writeFile(root / "bad.yaml", "output: [unterminated\n");
    EXPECT_THROW((void)loadConfig(path), std::runtime_error);
}

TEST(ConfigRegistryTest, InitializedByTestMain) {
    ASSERT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().logging.levels.console_log_level, spdlog::level::warn);
}
