#include "upload_guard/config/config_validator.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>

using namespace upload_guard;
using namespace upload_guard::test_support;

namespace {

bool mentions(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

}

TEST(ConfigValidatorTest, DefaultsAreValidWithScanWarning) {
    config::ConfigValidator validator;
    auto result = validator.validate(common::Config::createDefaultConfig());

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(mentions(result.warnings, "malware_scan.enabled"));
}

TEST(ConfigValidatorTest, EntryFormatsAreChecked) {
    EXPECT_TRUE(config::ConfigValidator::validateExtension("jpeg"));
    EXPECT_FALSE(config::ConfigValidator::validateExtension(""));
    EXPECT_FALSE(config::ConfigValidator::validateExtension("tar.gz"));
    EXPECT_FALSE(config::ConfigValidator::validateExtension("PNG"));

    EXPECT_TRUE(config::ConfigValidator::validateMimeType("application/vnd.ms-excel"));
    EXPECT_TRUE(config::ConfigValidator::validateMimeType("image/svg+xml"));
    EXPECT_FALSE(config::ConfigValidator::validateMimeType("image"));
    EXPECT_FALSE(config::ConfigValidator::validateMimeType("image/"));

    EXPECT_TRUE(config::ConfigValidator::validateTimeout(1));
    EXPECT_TRUE(config::ConfigValidator::validateTimeout(600));
    EXPECT_FALSE(config::ConfigValidator::validateTimeout(0));
    EXPECT_FALSE(config::ConfigValidator::validateTimeout(601));
}

TEST(ConfigValidatorTest, ReportsEveryInvalidField) {
    auto config = common::Config::createDefaultConfig();
    config.validator.max_file_size = 0;
    config.validator.allowed_extensions.insert("bad ext");
    config.validator.allowed_mime_types.insert("nonsense");
    config.validator.magic_database = "/nonexistent/magic.mgc";
    config.logging.max_files = 0;

    config::ConfigValidator validator;
    auto result = validator.validate(config);

    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(mentions(result.errors, "validator.max_file_size"));
    EXPECT_TRUE(mentions(result.errors, "'bad ext'"));
    EXPECT_TRUE(mentions(result.errors, "'nonsense'"));
    EXPECT_TRUE(mentions(result.errors, "validator.magic_database"));
    EXPECT_TRUE(mentions(result.errors, "logging.max_files"));
}

TEST(ConfigValidatorTest, ScannerSettingsCheckedOnlyWhenEnabled) {
    auto config = common::Config::createDefaultConfig();
    config.validator.scanner.command.clear();
    config.validator.scanner.scan_timeout_seconds = 0;
    config.validator.scanner.temp_dir = "/nonexistent/scan-tmp";

    config::ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);

    config.validator.scanner.enabled = true;
    auto result = validator.validate(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(mentions(result.errors, "malware_scan.command"));
    EXPECT_TRUE(mentions(result.errors, "malware_scan.scan_timeout_seconds"));
    EXPECT_TRUE(mentions(result.errors, "malware_scan.temp_dir"));
    EXPECT_FALSE(mentions(result.warnings, "malware_scan.enabled"));
}

TEST(ConfigValidatorTest, UnreachableExtensionIsWarning) {
    auto config = common::Config::createDefaultConfig();
    config.validator.allowed_mime_types.erase("application/pdf");

    config::ConfigValidator validator;
    auto result = validator.validate(config);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(mentions(result.warnings, "'.pdf'"));
}

TEST(ConfigValidatorTest, ValidatesFilesOnDisk) {
    TempDir dir;
    config::ConfigValidator validator;

    auto missing = validator.validateFile((dir.path() / "absent.toml").string());
    EXPECT_FALSE(missing.is_valid);

    auto broken = dir.writeFile("broken.toml", "[validator\n");
    auto parse_failure = validator.validateFile(broken.string());
    EXPECT_FALSE(parse_failure.is_valid);
    EXPECT_TRUE(mentions(parse_failure.errors, "Failed to parse configuration file"));

    auto good = dir.writeFile("good.toml", "[validator]\nprofile = \"image\"\n");
    EXPECT_TRUE(validator.validateFile(good.string()).is_valid);
}

TEST(ConfigValidatorTest, SizeCeilingAboveInMemoryLimitIsError) {
    auto config = common::Config::createDefaultConfig();
    config.validator.max_file_size = std::numeric_limits<uint64_t>::max();

    config::ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(mentions(result.errors, "validator.max_file_size: Must not exceed"));

    config.validator.max_file_size = 4ULL * 1024 * 1024 * 1024;
    EXPECT_TRUE(validator.validate(config).is_valid);
}
