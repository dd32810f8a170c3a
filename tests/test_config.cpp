#include "test_support.hpp"
#include <core/config.hpp>
#include <cstdlib>
#include <limits>

class ConfigTest : public TempDirTest {
protected:
    fs::path config_path() const { return test_dir / "config.yaml"; }
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    auto r = Config::load(config_path());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.syncer();
    EXPECT_DOUBLE_EQ(s.wait, 1);
    EXPECT_DOUBLE_EQ(s.sync.timeout, 120);
    EXPECT_EQ(s.max_workers, 1);
    EXPECT_EQ(s.sync.sync_command, (std::vector<std::string>{"wandb", "sync"}));
    EXPECT_TRUE(s.sync.wandb_options.empty());
    EXPECT_FALSE(s.sync.dry_run);
    EXPECT_FALSE(s.single_pass);
    EXPECT_EQ(s.command_dir, default_command_dir());
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    write_file(config_path(),
        "command_dir: /scratch/osh\n"
        "wait: 0.5\n"
        "timeout: 30\n"
        "max_workers: 4\n"
        "sync_command: [wandb, sync]\n"
        "wandb_options: [\"--include-offline\", \"--no-mark-synced\"]\n"
        "dry_run: true\n"
        "log_level: debug\n");

    auto r = Config::load(config_path());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.syncer();
    EXPECT_EQ(s.command_dir, fs::path("/scratch/osh"));
    EXPECT_DOUBLE_EQ(s.wait, 0.5);
    EXPECT_DOUBLE_EQ(s.sync.timeout, 30);
    EXPECT_EQ(s.max_workers, 4);
    EXPECT_EQ(s.sync.wandb_options,
              (std::vector<std::string>{"--include-offline", "--no-mark-synced"}));
    EXPECT_TRUE(s.sync.dry_run);
    EXPECT_EQ(s.log_level, "debug");
}

TEST_F(ConfigTest, OptionsAsPlainString) {
    write_file(config_path(), "wandb_options: \"--project  demo --entity me\"\n");
    auto r = Config::load(config_path());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.syncer().sync.wandb_options,
              (std::vector<std::string>{"--project", "demo", "--entity", "me"}));
}

TEST_F(ConfigTest, EmptyFileGivesDefaults) {
    write_file(config_path(), "");
    auto r = Config::load(config_path());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.syncer().max_workers, 1);
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    write_file(config_path(), "wait: [1, 2\n");
    auto r = Config::load(config_path());
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigTest, WrongTypeIsAnError) {
    write_file(config_path(), "max_workers: lots\n");
    EXPECT_TRUE(Config::load(config_path()).is_err());
}

TEST_F(ConfigTest, TopLevelListIsAnError) {
    write_file(config_path(), "- wait\n- timeout\n");
    EXPECT_TRUE(Config::load(config_path()).is_err());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    SyncerConfig s = Config::defaults().syncer();
    EXPECT_TRUE(validate(s).is_ok());

    s.max_workers = 0;
    auto r = validate(s);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("max_workers"), std::string::npos);

    s = Config::defaults().syncer();
    s.wait = -1;
    EXPECT_TRUE(validate(s).is_err());

    s = Config::defaults().syncer();
    s.sync.sync_command.clear();
    EXPECT_TRUE(validate(s).is_err());

    s = Config::defaults().syncer();
    s.wait = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(validate(s).is_err());

    s = Config::defaults().syncer();
    s.wait = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(validate(s).is_err());

    s = Config::defaults().syncer();
    s.sync.timeout = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(validate(s).is_err());

    // Non-positive timeouts mean "no timeout" and are fine
    s = Config::defaults().syncer();
    s.sync.timeout = 0;
    EXPECT_TRUE(validate(s).is_ok());
}

TEST_F(ConfigTest, CommandDirFromEnvironment) {
    const char* old = std::getenv("WANDB_OSH_COMMAND_DIR");
    std::string saved = old ? old : "";

    setenv("WANDB_OSH_COMMAND_DIR", (test_dir / "cmds").c_str(), 1);
    EXPECT_EQ(default_command_dir(), test_dir / "cmds");
    EXPECT_EQ(Config::defaults().syncer().command_dir, test_dir / "cmds");

    unsetenv("WANDB_OSH_COMMAND_DIR");
    EXPECT_EQ(default_command_dir(), platform::home_dir() / ".wandb_osh_command_dir");

    if (old) setenv("WANDB_OSH_COMMAND_DIR", saved.c_str(), 1);
}

TEST_F(ConfigTest, DefaultConfigRoundTrips) {
    ASSERT_TRUE(create_default_config(config_path()).is_ok());
    ASSERT_TRUE(fs::exists(config_path()));

    auto r = Config::load(config_path());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.syncer().max_workers, 1);
    EXPECT_DOUBLE_EQ(r.value.syncer().sync.timeout, 120);
    EXPECT_EQ(r.value.syncer().sync.sync_command, (std::vector<std::string>{"wandb", "sync"}));
}

TEST_F(ConfigTest, DefaultConfigDoesNotOverwrite) {
    write_file(config_path(), "max_workers: 3\n");
    ASSERT_TRUE(create_default_config(config_path()).is_ok());
    EXPECT_EQ(Config::load(config_path()).value.syncer().max_workers, 3);
}
