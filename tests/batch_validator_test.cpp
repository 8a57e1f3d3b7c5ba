#include "upload_guard/validate/batch_validator.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <limits>
#include <unistd.h>

using namespace upload_guard;
using namespace upload_guard::test_support;
using core::ValidationErrorCode;

class BatchValidatorTest : public ::testing::Test {
protected:
    validate::FileValidator validator_{defaultValidatorConfig()};
    validate::BatchValidator batch_{validator_};
    TempDir dir_;
};

TEST_F(BatchValidatorTest, ValidatesFileByItsName) {
    auto path = dir_.writeFile("photo.png", makePng());
    auto report = batch_.validateFile(path);

    EXPECT_EQ(report.name, "photo.png");
    EXPECT_EQ(report.path, path.string());
    EXPECT_FALSE(report.read_error.has_value());
    ASSERT_TRUE(report.result.has_value());
    EXPECT_TRUE(report.result->is_valid);
    EXPECT_EQ(report.result->detected_mime, "image/png");
}

TEST_F(BatchValidatorTest, DisplayNameOverridesExtension) {
    auto path = dir_.writeFile("upload.bin", makePng());

    auto as_stored = batch_.validateFile(path);
    ASSERT_TRUE(as_stored.result.has_value());
    EXPECT_EQ(*as_stored.result->error_code, ValidationErrorCode::EXTENSION_NOT_ALLOWED);

    auto as_uploaded = batch_.validateFile(path, std::string("holiday.png"), std::string("image/png"));
    ASSERT_TRUE(as_uploaded.result.has_value());
    EXPECT_TRUE(as_uploaded.result->is_valid);
    EXPECT_EQ(as_uploaded.name, "holiday.png");
}

TEST_F(BatchValidatorTest, OversizedFileReportsActualSize) {
    auto config = defaultValidatorConfig();
    config.max_file_size = 4096;
    validate::FileValidator validator(config);
    validate::BatchValidator batch(validator);

    std::string png = makePng();
    auto path = dir_.writeFile("big.png", png);
    auto report = batch.validateFile(path);

    ASSERT_TRUE(report.result.has_value());
    EXPECT_EQ(*report.result->error_code, ValidationErrorCode::FILE_TOO_LARGE);
    EXPECT_EQ(report.result->file_size, png.size());
}

TEST_F(BatchValidatorTest, MissingFileIsUnreadable) {
    auto report = batch_.validateFile(dir_.path() / "gone.png");

    EXPECT_FALSE(report.result.has_value());
    ASSERT_TRUE(report.read_error.has_value());
    EXPECT_FALSE(report.read_error->empty());
}

TEST_F(BatchValidatorTest, DirectorySummaryCountsOutcomes) {
    dir_.writeFile("a.png", makePng());
    dir_.writeFile("b.pdf", makePdf());
    dir_.writeFile("c.png", makePolyglotPng());
    dir_.writeFile("d.sh", makeText());
    dir_.writeFile("e.png", insertAt(makePng(), 100, "onload = go()"));

    validate::BatchOptions options;
    options.max_threads = 2;
    auto summary = batch_.validateDirectory(dir_.path(), options);

    EXPECT_EQ(summary.total_files, 5u);
    EXPECT_EQ(summary.accepted, 3u);
    EXPECT_EQ(summary.warned, 1u);
    EXPECT_EQ(summary.rejected, 2u);
    EXPECT_EQ(summary.unreadable, 0u);

    ASSERT_EQ(summary.reports.size(), 5u);
    EXPECT_EQ(summary.reports[0].name, "a.png");
    EXPECT_EQ(summary.reports[2].name, "c.png");
    EXPECT_EQ(*summary.reports[2].result->error_code, ValidationErrorCode::POLYGLOT_DETECTED);
    EXPECT_EQ(*summary.reports[3].result->error_code, ValidationErrorCode::EXTENSION_NOT_ALLOWED);
}

TEST_F(BatchValidatorTest, RecursionIsOptIn) {
    dir_.writeFile("top.png", makePng());
    std::filesystem::create_directories(dir_.path() / "nested");
    dir_.writeFile("nested/inner.jpg", makeJpeg());

    validate::BatchOptions flat;
    EXPECT_EQ(validate::BatchValidator::collectFiles(dir_.path(), flat).size(), 1u);

    validate::BatchOptions deep;
    deep.recursive = true;
    auto files = validate::BatchValidator::collectFiles(dir_.path(), deep);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename(), "inner.jpg");
    EXPECT_EQ(files[1].filename(), "top.png");

    deep.max_recursion_depth = 0;
    EXPECT_EQ(validate::BatchValidator::collectFiles(dir_.path(), deep).size(), 1u);
}

TEST_F(BatchValidatorTest, SymlinksAreNotFollowed) {
    auto target = dir_.writeFile("real.png", makePng());
    ASSERT_EQ(::symlink(target.c_str(), (dir_.path() / "link.png").c_str()), 0);

    validate::BatchOptions options;
    auto files = validate::BatchValidator::collectFiles(dir_.path(), options);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename(), "real.png");
}

TEST_F(BatchValidatorTest, ClaimedContentTypeAppliesToEveryFile) {
    dir_.writeFile("a.png", makePng());
    dir_.writeFile("b.jpg", makeJpeg());

    validate::BatchOptions options;
    options.claimed_content_type = "application/pdf";
    auto summary = batch_.validateDirectory(dir_.path(), options);

    EXPECT_EQ(summary.accepted, 2u);
    EXPECT_EQ(summary.warned, 2u);
}

TEST_F(BatchValidatorTest, NonDirectoryYieldsEmptySummary) {
    auto file = dir_.writeFile("a.png", makePng());
    validate::BatchOptions options;

    auto summary = batch_.validateDirectory(file, options);
    EXPECT_EQ(summary.total_files, 0u);
    EXPECT_TRUE(summary.reports.empty());
}

TEST_F(BatchValidatorTest, UnboundedCeilingStillReadsWholeFile) {
    auto config = defaultValidatorConfig();
    config.max_file_size = std::numeric_limits<uint64_t>::max();
    validate::FileValidator validator(config);
    validate::BatchValidator batch(validator);

    std::string png = makePng();
    auto report = batch.validateFile(dir_.writeFile("photo.png", png));

    ASSERT_TRUE(report.result.has_value());
    EXPECT_TRUE(report.result->is_valid);
    EXPECT_EQ(report.result->file_size, png.size());
    EXPECT_EQ(report.result->detected_mime, "image/png");
}
