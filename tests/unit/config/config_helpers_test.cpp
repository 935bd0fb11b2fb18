#include <gtest/gtest.h>
#include <bsplink/config/config_helpers.h>

#include "common/bsp_test_helpers.h"

#include <cstdlib>
#include <optional>

namespace bsplink::config::test {

namespace {

// Sets or clears an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            ::unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST(ConfigHelpers, TrimAndUnquote) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
}

TEST(ConfigHelpers, EnvTruthy) {
    EXPECT_TRUE(env_truthy("1"));
    EXPECT_TRUE(env_truthy("TRUE"));
    EXPECT_TRUE(env_truthy("yes"));
    EXPECT_FALSE(env_truthy("0"));
    EXPECT_FALSE(env_truthy(""));
    EXPECT_FALSE(env_truthy(nullptr));
}

TEST(ConfigHelpers, SanitizeReplacesControlBytes) {
    EXPECT_EQ(sanitize_for_terminal("ok\x1b[31m\n"), "ok?[31m\n");
}

TEST(ConfigHelpers, ParsesSectionsKeysAndComments) {
    bsplink::tests::TempDir dir;
    auto path = bsplink::tests::write_file(dir / "config.toml", R"(
# bsplink configuration
[client]
endpoint = "local:///run/bsp.sock"   
request_timeout_ms = 5000 # five seconds

[server]
binary = '~/bin/bsplink-server'
client.readiness = probe
)");
    EXPECT_EQ(parse_config_value(path, "client", "endpoint"), "local:///run/bsp.sock");
    EXPECT_EQ(parse_config_value(path, "client", "request_timeout_ms"), "5000");
    EXPECT_EQ(parse_config_value(path, "server", "binary"), "~/bin/bsplink-server");
    // Dotted keys are found from any section
    EXPECT_EQ(parse_config_value(path, "client", "readiness"), "probe");
    EXPECT_EQ(parse_config_value(path, "server", "endpoint"), "");
    EXPECT_EQ(parse_config_value(dir / "missing.toml", "client", "endpoint"), "");
}

TEST(ConfigHelpers, EnvMillisecondsRequiresPositiveNumber) {
    {
        ScopedEnv env("BSPLINK_TEST_MS", "250");
        auto ms = env_milliseconds("BSPLINK_TEST_MS");
        ASSERT_TRUE(ms.has_value());
        EXPECT_EQ(ms->count(), 250);
    }
    {
        ScopedEnv env("BSPLINK_TEST_MS", "-3");
        EXPECT_FALSE(env_milliseconds("BSPLINK_TEST_MS").has_value());
    }
    {
        ScopedEnv env("BSPLINK_TEST_MS", "soon");
        EXPECT_FALSE(env_milliseconds("BSPLINK_TEST_MS").has_value());
    }
}

TEST(ConfigHelpers, ConfigPathPrecedence) {
    ScopedEnv cfg("BSPLINK_CONFIG", "/etc/bsplink.toml");
    EXPECT_EQ(get_config_path(), "/etc/bsplink.toml");
    EXPECT_EQ(get_config_path("/explicit.toml"), "/explicit.toml");

    ScopedEnv noCfg("BSPLINK_CONFIG", nullptr);
    ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
    EXPECT_EQ(get_config_path(), "/xdg/bsplink/config.toml");
}

TEST(ConfigHelpers, ExpandTilde) {
    ScopedEnv home("HOME", "/home/dev");
    EXPECT_EQ(expand_tilde("~"), "/home/dev");
    EXPECT_EQ(expand_tilde("~/bin/x"), "/home/dev/bin/x");
    EXPECT_EQ(expand_tilde("/abs"), "/abs");
}

TEST(ConfigHelpers, EndpointResolutionOrder) {
    bsplink::tests::TempDir dir;
    auto path = bsplink::tests::write_file(dir / "config.toml",
                                           "[client]\nendpoint = \"tcp://127.0.0.1:9000\"\n");
    ScopedEnv cfg("BSPLINK_CONFIG", path.c_str());
    {
        ScopedEnv env("BSPLINK_ENDPOINT", "stdio");
        EXPECT_EQ(resolve_endpoint_from_config(), "stdio");
    }
    ScopedEnv noEnv("BSPLINK_ENDPOINT", nullptr);
    EXPECT_EQ(resolve_endpoint_from_config(), "tcp://127.0.0.1:9000");

    ScopedEnv missing("BSPLINK_CONFIG", (dir / "none.toml").c_str());
    ScopedEnv runtime("XDG_RUNTIME_DIR", "/run/user/1000");
    EXPECT_EQ(resolve_endpoint_from_config(), "local:///run/user/1000/bsplink/bsp.sock");
}

} // namespace bsplink::config::test
