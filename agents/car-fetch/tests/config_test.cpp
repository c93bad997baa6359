#include "../include/cli.hpp"
#include "../include/config.hpp"
#include "../include/deps.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* key, const char* value) : key_(key) {
        if (const char* old = std::getenv(key)) { had_ = true; old_ = old; }
        ::setenv(key, value, 1);
    }
    ~ScopedEnv() {
        if (had_) ::setenv(key_.c_str(), old_.c_str(), 1);
        else ::unsetenv(key_.c_str());
    }

private:
    std::string key_;
    std::string old_;
    bool had_{false};
};

CliOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "car-fetch");
    return parse_cli((int)args.size(), args.data(), FetchConfig{});
}

ErrorKind parse_error(std::vector<const char*> args) {
    try {
        parse(std::move(args));
    } catch (const FetchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a usage error";
    return ErrorKind::io;
}

}  // namespace

TEST(ConfigTest, DefaultsMatchServiceConventions)
{
    FetchConfig cfg;
    EXPECT_EQ(cfg.api_base, "https://api.sp-tool.allocator.tech");
    EXPECT_EQ(cfg.poll.initial, std::chrono::seconds(2));
    EXPECT_EQ(cfg.poll.ceiling, std::chrono::seconds(15));
    EXPECT_EQ(cfg.job_timeout, std::chrono::seconds(900));
    EXPECT_EQ(cfg.sync_timeout, std::chrono::seconds(900));
    EXPECT_FALSE(cfg.allow_copy);
    EXPECT_FALSE(cfg.prefer_ipfs_car);
}

TEST(ConfigTest, ReadsEnvironment)
{
    ScopedEnv a("API_BASE", "http://localhost:9999");
    ScopedEnv b("POLL_INTERVAL", "1");
    ScopedEnv c("POLL_MAX_INTERVAL", "4");
    ScopedEnv d("POLL_TIMEOUT", "60");
    ScopedEnv e("SYNC_TIMEOUT", "30");
    ScopedEnv f("ALLOW_COPY", "1");
    ScopedEnv g("PREFER_IPFS_CAR", "1");
    ScopedEnv h("OS_FAMILY", "arch");

    FetchConfig cfg = config_from_env();
    EXPECT_EQ(cfg.api_base, "http://localhost:9999");
    EXPECT_EQ(cfg.poll.initial, std::chrono::seconds(1));
    EXPECT_EQ(cfg.poll.ceiling, std::chrono::seconds(4));
    EXPECT_EQ(cfg.job_timeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.sync_timeout, std::chrono::seconds(30));
    EXPECT_TRUE(cfg.allow_copy);
    EXPECT_TRUE(cfg.prefer_ipfs_car);
    EXPECT_EQ(cfg.os_family, "arch");
}

TEST(ConfigTest, MalformedNumberIsUsageError)
{
    ScopedEnv a("POLL_TIMEOUT", "15m");
    try {
        config_from_env();
        FAIL();
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::usage);
    }
}

TEST(CliTest, EndToEndMode)
{
    auto o = parse({"--client", "f01", "--provider", "f02", "--dir", "out", "--timeout", "5",
                    "--sync-timeout", "7", "--api-base", "http://x", "--allow-copy"});
    EXPECT_EQ(o.mode, RunMode::fetch);
    EXPECT_EQ(o.client, "f01");
    EXPECT_EQ(o.provider, "f02");
    EXPECT_EQ(o.dir, std::filesystem::path("out"));
    EXPECT_EQ(o.config.job_timeout, std::chrono::seconds(5));
    EXPECT_EQ(o.config.sync_timeout, std::chrono::seconds(7));
    EXPECT_EQ(o.config.api_base, "http://x");
    EXPECT_TRUE(o.config.allow_copy);
}

TEST(CliTest, UnpackOnlyDefaultsToCurrentDirectory)
{
    auto o = parse({"--unpack-only", "bundle", "--prefer-ipfs-car"});
    EXPECT_EQ(o.mode, RunMode::unpack);
    EXPECT_EQ(o.unpack_path, std::filesystem::path("bundle"));
    EXPECT_EQ(o.dir, std::filesystem::path("."));
    EXPECT_TRUE(o.config.prefer_ipfs_car);
}

TEST(CliTest, InstallDepsMode)
{
    EXPECT_EQ(parse({"--install-deps", "--os", "fedora"}).mode, RunMode::install_deps);
    EXPECT_EQ(parse({"--install-deps-only"}).mode, RunMode::install_deps);
    EXPECT_EQ(parse({"--help"}).mode, RunMode::help);
}

TEST(CliTest, RejectsBadInvocations)
{
    EXPECT_EQ(parse_error({}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--client", "c"}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--dir", "d"}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--client"}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--bogus"}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--client", "c", "--dir", "d", "--unpack-only", "x"}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--install-deps", "--unpack-only", "x"}), ErrorKind::usage);
    EXPECT_EQ(parse_error({"--client", "c", "--dir", "d", "--timeout", "-1"}), ErrorKind::usage);
}

TEST(UtilTest, FileNameFromUrl)
{
    EXPECT_EQ(file_name_from_url("https://cdn.test/a/b/bafy.car"), "bafy.car");
    EXPECT_EQ(file_name_from_url("https://cdn.test/a/bafy.car?sig=1/2#frag"), "bafy.car");
    EXPECT_EQ(file_name_from_url("https://cdn.test/a/piece#x"), "piece");
    EXPECT_EQ(file_name_from_url("https://cdn.test/dir/"), "dir");
}

TEST(UtilTest, HttpUrlAndTrim)
{
    EXPECT_TRUE(is_http_url("http://a"));
    EXPECT_TRUE(is_http_url("https://a"));
    EXPECT_FALSE(is_http_url("ftp://a"));
    EXPECT_FALSE(is_http_url(" https://a"));
    EXPECT_EQ(trim("  id\r\n"), "id");
    EXPECT_EQ(trim(" \n"), "");
}

TEST(OsFamilyTest, ParsesOsRelease)
{
    EXPECT_EQ(os_family_from_release("ID=ubuntu\nID_LIKE=debian\n"), OsFamily::debian);
    EXPECT_EQ(os_family_from_release("ID=debian\n"), OsFamily::debian);
    EXPECT_EQ(os_family_from_release("ID=\"rocky\"\nID_LIKE=\"rhel centos fedora\"\n"), OsFamily::fedora);
    EXPECT_EQ(os_family_from_release("ID=fedora\n"), OsFamily::fedora);
    EXPECT_EQ(os_family_from_release("ID=arch\n"), OsFamily::arch);
    EXPECT_EQ(os_family_from_release("ID=manjaro\nID_LIKE=arch\n"), OsFamily::arch);
    EXPECT_EQ(os_family_from_release("ID=alpine\n"), OsFamily::unknown);
}

TEST(OsFamilyTest, NamesRoundTripAndPlans)
{
    for (auto f : {OsFamily::macos, OsFamily::debian, OsFamily::fedora, OsFamily::arch, OsFamily::windows}) {
        EXPECT_EQ(parse_os_family(os_family_name(f)), f);
    }
    EXPECT_EQ(parse_os_family("solaris"), OsFamily::unknown);

    auto debian = system_package_plan(OsFamily::debian, false);
    ASSERT_EQ(debian.size(), 2u);
    EXPECT_TRUE(debian[0].privileged);
    EXPECT_EQ(debian[1].argv[0], "apt-get");

    EXPECT_EQ(system_package_plan(OsFamily::fedora, true)[0].argv[0], "dnf");
    EXPECT_EQ(system_package_plan(OsFamily::fedora, false)[0].argv[0], "yum");
    EXPECT_FALSE(system_package_plan(OsFamily::macos, false)[0].privileged);
    EXPECT_TRUE(system_package_plan(OsFamily::windows, false).empty());
}
