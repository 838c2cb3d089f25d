#include <gtest/gtest.h>
#include <backup/verify.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Cryptochecksum, FindsLastChecksumLine) {
    std::string config =
        ": Saved\n"
        "hostname asa1\n"
        "Cryptochecksum:0123abcd\n"
        "Cryptochecksum:feedbeef\r\n"
        ": end\n";
    auto sum = find_cryptochecksum(config);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(*sum, "feedbeef");
}

TEST(Cryptochecksum, IgnoresEmbeddedMentions) {
    EXPECT_FALSE(find_cryptochecksum("banner motd Cryptochecksum:abc is shown\n").has_value());
    EXPECT_FALSE(find_cryptochecksum("").has_value());
}

class VerifyTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "asabackup_verify_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& name, const std::string& content) {
        std::ofstream(test_dir / name) << content;
    }

    static UnitOutcome unit(UnitKind kind, const std::string& source, const std::string& filename,
                            UnitStatus status = UnitStatus::Ok) {
        UnitOutcome o;
        o.unit = BackupUnit{kind, std::nullopt, source, filename};
        o.status = status;
        return o;
    }

    static UnitOutcome context_config(const std::string& ctx, const std::string& filename,
                                      FailoverRole role) {
        UnitOutcome o;
        o.unit = BackupUnit{UnitKind::ContextConfig, ctx, "", filename, role};
        return o;
    }

    RunReport legacy_report() const {
        RunReport report;
        report.suffix = "daily_3";
        report.units.push_back(unit(UnitKind::TechSupport, "", "tech-support_daily_3.txt"));
        report.units.push_back(unit(UnitKind::LegacyConfig, "running-config", "running-config_daily_3.cfg"));
        report.units.push_back(unit(UnitKind::LegacyConfig, "startup-config", "startup-config_daily_3.cfg"));
        return report;
    }
};

TEST_F(VerifyTest, AllArtifactsPresent) {
    write_file("tech-support_daily_3.txt", "show tech\n");
    write_file("running-config_daily_3.cfg", "hostname asa1\nCryptochecksum:aa11\n");
    write_file("startup-config_daily_3.cfg", "hostname asa1\nCryptochecksum:aa11\n");

    auto result = verify_destination(test_dir, legacy_report());
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.artifacts.size(), 3u);
    EXPECT_TRUE(result.artifacts[0].exists);
    EXPECT_GT(result.artifacts[0].size, 0u);
}

TEST_F(VerifyTest, MissingAndEmptyFilesAreFlagged) {
    write_file("running-config_daily_3.cfg", "");
    write_file("startup-config_daily_3.cfg", "Cryptochecksum:aa11\n");

    auto result = verify_destination(test_dir, legacy_report());
    EXPECT_FALSE(result.ok());
    ASSERT_GE(result.warnings.size(), 2u);
    EXPECT_NE(result.warnings[0].find("tech-support_daily_3.txt is missing"), std::string::npos);
    EXPECT_NE(result.warnings[1].find("running-config_daily_3.cfg is empty"), std::string::npos);
}

TEST_F(VerifyTest, UnsavedRunningConfigIsReported) {
    write_file("tech-support_daily_3.txt", "show tech\n");
    write_file("running-config_daily_3.cfg", "hostname asa1\nCryptochecksum:aa11\n");
    write_file("startup-config_daily_3.cfg", "hostname asa1\nCryptochecksum:bb22\n");

    auto result = verify_destination(test_dir, legacy_report());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("write memory"), std::string::npos);
    EXPECT_NE(result.warnings[0].find("aa11"), std::string::npos);
}

TEST_F(VerifyTest, FailedUnitsAreNotChecked) {
    RunReport report = legacy_report();
    report.units[0].status = UnitStatus::Failed;
    report.units[2].status = UnitStatus::Skipped;
    write_file("running-config_daily_3.cfg", "Cryptochecksum:aa11\n");

    auto result = verify_destination(test_dir, report);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.artifacts.size(), 1u);
}

TEST_F(VerifyTest, StandbyConfigurationsAreComparedSeparately) {
    RunReport report = legacy_report();
    auto running = unit(UnitKind::LegacyConfig, "running-config", "running-config_standby_daily_3.cfg");
    auto startup = unit(UnitKind::LegacyConfig, "startup-config", "startup-config_standby_daily_3.cfg");
    running.unit.role = FailoverRole::Standby;
    startup.unit.role = FailoverRole::Standby;
    report.units.push_back(running);
    report.units.push_back(startup);

    write_file("tech-support_daily_3.txt", "show tech\n");
    write_file("running-config_daily_3.cfg", "Cryptochecksum:aa11\n");
    write_file("startup-config_daily_3.cfg", "Cryptochecksum:aa11\n");
    write_file("running-config_standby_daily_3.cfg", "Cryptochecksum:aa11\n");
    write_file("startup-config_standby_daily_3.cfg", "Cryptochecksum:cc33\n");

    auto result = verify_destination(test_dir, report);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("running-config_standby_daily_3.cfg"), std::string::npos);
    EXPECT_NE(result.warnings[0].find("write memory"), std::string::npos);
}

TEST_F(VerifyTest, ContextConfigsDifferingBetweenUnitsAreReported) {
    RunReport report;
    report.suffix = "daily_3";
    report.units.push_back(context_config("web1", "context_web1_daily_3.cfg", FailoverRole::Active));
    report.units.push_back(context_config("web2", "context_web2_daily_3.cfg", FailoverRole::Active));
    report.units.push_back(context_config("web1", "context_web1_standby_daily_3.cfg", FailoverRole::Standby));
    report.units.push_back(context_config("web2", "context_web2_standby_daily_3.cfg", FailoverRole::Standby));

    write_file("context_web1_daily_3.cfg", "Cryptochecksum:aa11\n");
    write_file("context_web1_standby_daily_3.cfg", "Cryptochecksum:aa11\n");
    write_file("context_web2_daily_3.cfg", "Cryptochecksum:bb22\n");
    write_file("context_web2_standby_daily_3.cfg", "Cryptochecksum:dd44\n");

    auto result = verify_destination(test_dir, report);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("context_web2_daily_3.cfg"), std::string::npos);
    EXPECT_NE(result.warnings[0].find("replication"), std::string::npos);
}
