#include "upload_guard/detect/polyglot_detector.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>

using namespace upload_guard;
using namespace upload_guard::test_support;

TEST(PolyglotDetectorTest, CheckpointsCoverHeadQuartersAndTail) {
    auto points = detect::PolyglotDetector::checkpoints(18489, 2048);
    EXPECT_EQ(points, (std::vector<size_t>{0, 4622, 9244, 13866, 16441}));
}

TEST(PolyglotDetectorTest, SmallBuffersCollapseDuplicateCheckpoints) {
    EXPECT_EQ(detect::PolyglotDetector::checkpoints(100, 2048), (std::vector<size_t>{0, 25, 50, 75}));
    EXPECT_EQ(detect::PolyglotDetector::checkpoints(1, 2048), (std::vector<size_t>{0}));
    EXPECT_TRUE(detect::PolyglotDetector::checkpoints(0, 2048).empty());
}

TEST(PolyglotDetectorTest, ConsistentFormatsPass) {
    detect::SignatureSniffer sniffer;
    detect::PolyglotDetector detector(sniffer, 2048);

    std::string png = makePng();
    std::string jpeg = makeJpeg();
    std::string pdf = makePdf();
    std::string text = makeText();

    EXPECT_FALSE(detector.check(bytes(png), png.size(), "image/png").has_value());
    EXPECT_FALSE(detector.check(bytes(jpeg), jpeg.size(), "image/jpeg").has_value());
    EXPECT_FALSE(detector.check(bytes(pdf), pdf.size(), "application/pdf").has_value());
    EXPECT_FALSE(detector.check(bytes(text), text.size(), "text/plain").has_value());
}

TEST(PolyglotDetectorTest, HtmlInsideImageIsReportedWithOffset) {
    detect::SignatureSniffer sniffer;
    detect::PolyglotDetector detector(sniffer, 2048);

    std::string polyglot = makePolyglotPng();
    auto finding = detector.check(bytes(polyglot), polyglot.size(), "image/png");

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->offset, polyglotHtmlOffset());
    EXPECT_EQ(finding->expected_mime, "image/png");
    EXPECT_EQ(finding->found_mime, "text/html");
}

TEST(PolyglotDetectorTest, HeaderMismatchIsReportedAtOffsetZero) {
    detect::SignatureSniffer sniffer;
    detect::PolyglotDetector detector(sniffer, 2048);

    std::string pdf = makePdf();
    auto finding = detector.check(bytes(pdf), pdf.size(), "image/png");

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->offset, 0u);
    EXPECT_EQ(finding->found_mime, "application/pdf");
}

TEST(PolyglotDetectorTest, EmbeddedSignaturesFindMarkupAndMagicStarts) {
    std::string data = "xx<HTML>yy%PDF-1.7 zz<ScRiPt>" + std::string("\x7f" "ELF", 4) + "<xml";
    auto offsets = detect::PolyglotDetector::embeddedSignatures(bytes(data), data.size(), 0, data.size());
    EXPECT_EQ(offsets, (std::vector<size_t>{2, 10, 21, 29}));

    // A token starting inside the range is found even when it runs past the end.
    offsets = detect::PolyglotDetector::embeddedSignatures(bytes(data), data.size(), 3, 12);
    EXPECT_EQ(offsets, (std::vector<size_t>{10}));

    std::string png = makePng();
    EXPECT_TRUE(detect::PolyglotDetector::embeddedSignatures(bytes(png), png.size(), 0, png.size()).empty());
}

TEST(PolyglotDetectorTest, HtmlOffsetFromCheckpointIsStillReported) {
    detect::SignatureSniffer sniffer;
    detect::PolyglotDetector detector(sniffer, 2048);

    struct Case { size_t inserted_at; size_t expected_offset; };
    const std::vector<Case> cases = {
        {polyglotHtmlOffset() + 7, 9251},
        {polyglotHtmlOffset() - 100, 9144},
        {polyglotHtmlOffset() + 3000, 12244},
        {500, 500},
    };

    for (const auto& c : cases) {
        std::string polyglot = makePolyglotPngAt(c.inserted_at);
        auto finding = detector.check(bytes(polyglot), polyglot.size(), "image/png");

        ASSERT_TRUE(finding.has_value()) << "inserted at " << c.inserted_at;
        EXPECT_EQ(finding->offset, c.expected_offset);
        EXPECT_EQ(finding->expected_mime, "image/png");
        EXPECT_EQ(finding->found_mime, "text/html");
    }
}

TEST(PolyglotDetectorTest, ExecutableInsideImageIsReported) {
    detect::SignatureSniffer sniffer;
    detect::PolyglotDetector detector(sniffer, 2048);

    std::string polyglot = insertAt(makePng(), polyglotHtmlOffset() + 333, makeElf());
    auto finding = detector.check(bytes(polyglot), polyglot.size(), "image/png");

    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->offset, 9577u);
    EXPECT_EQ(finding->found_mime, "application/x-executable");
}

TEST(PolyglotDetectorTest, MarkupInsidePlainTextIsNotPolyglot) {
    detect::SignatureSniffer sniffer;
    detect::PolyglotDetector detector(sniffer, 2048);

    std::string text = insertAt(makeText(), 4000, makeHtml());
    EXPECT_FALSE(detector.check(bytes(text), text.size(), "text/plain").has_value());
}
