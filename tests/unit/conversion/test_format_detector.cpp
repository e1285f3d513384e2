/**
 * @file test_format_detector.cpp
 * @brief Unit tests for format detection and the default conversion service
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/conversion/conversion_service.h>
#include <kcenon/p2p_convert/conversion/format_detector.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace kcenon::p2p_convert::test {

namespace {

auto bytes_of(std::string_view text) -> byte_buffer {
    byte_buffer out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

}  // namespace

class FormatDetectorTest : public ::testing::Test {};

TEST_F(FormatDetectorTest, PdfSignature) {
    EXPECT_EQ(format_detector::detect(bytes_of("%PDF-1.7\n%binary")), file_format::pdf);
}

TEST_F(FormatDetectorTest, PlainText) {
    EXPECT_EQ(format_detector::detect(bytes_of("Hello, world.\nSecond line\t\n")),
              file_format::text);
}

TEST_F(FormatDetectorTest, Utf8TextWithMostlyAscii) {
    EXPECT_EQ(format_detector::detect(bytes_of("Gr\xC3\xBC\xC3\x9F" "e aus Berlin, sch\xC3\xB6n!")),
              file_format::text);
}

TEST_F(FormatDetectorTest, ByteOrderMarkIsText) {
    EXPECT_EQ(format_detector::detect(bytes_of("\xEF\xBB\xBF\xE4\xBD\xA0\xE5\xA5\xBD")),
              file_format::text);
}

TEST_F(FormatDetectorTest, EmptyIsUnknown) {
    EXPECT_EQ(format_detector::detect(byte_buffer{}), file_format::unknown);
}

TEST_F(FormatDetectorTest, NulByteIsUnknown) {
    auto data = bytes_of("text with a");
    data.push_back(std::byte{0});
    data.push_back(std::byte{'x'});
    EXPECT_EQ(format_detector::detect(data), file_format::unknown);
}

TEST_F(FormatDetectorTest, InvalidUtf8IsUnknown) {
    EXPECT_EQ(format_detector::detect(bytes_of("abc\xC3(def")), file_format::unknown);
    EXPECT_EQ(format_detector::detect(bytes_of("abc\xFF")), file_format::unknown);
}

TEST_F(FormatDetectorTest, MostlyNonPrintableIsUnknown) {
    EXPECT_EQ(format_detector::detect(bytes_of("\x01\x02\x03\x04\x05\x06\x07\x08" "ab")),
              file_format::unknown);
}

TEST_F(FormatDetectorTest, RandomBinaryIsUnknown) {
    byte_buffer data(4096);
    std::mt19937 gen(5);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    data[0] = std::byte{0x00};
    EXPECT_EQ(format_detector::detect(data), file_format::unknown);
}

TEST_F(FormatDetectorTest, OnlyFirstKilobyteIsSampled) {
    std::string text(format_detector::sample_size, 'a');
    auto data = bytes_of(text);
    data.push_back(std::byte{0});  // beyond the sample
    EXPECT_EQ(format_detector::detect(data), file_format::text);
}

TEST_F(FormatDetectorTest, CharacterCutAtSampleBoundaryTolerated) {
    std::string text(format_detector::sample_size - 1, 'a');
    text += "\xC3\xBC";  // two-byte character straddling the boundary
    EXPECT_EQ(format_detector::detect(bytes_of(text)), file_format::text);

    std::string short_text = "abc\xC3";
    EXPECT_EQ(format_detector::detect(bytes_of(short_text)), file_format::unknown);
}

TEST_F(FormatDetectorTest, DetectFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("p2p_convert_detect_" + std::to_string(std::random_device{}()) + ".pdf");
    {
        std::ofstream out(path, std::ios::binary);
        out << "%PDF-1.4\n";
    }

    auto detected = format_detector::detect_file(path);
    ASSERT_TRUE(detected.has_value());
    EXPECT_EQ(detected.value(), file_format::pdf);

    std::filesystem::remove(path);
    auto missing = format_detector::detect_file(path);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::file_not_found);
}

// =============================================================================
// conversion_service
// =============================================================================

class ConversionServiceTest : public ::testing::Test {};

TEST_F(ConversionServiceTest, ParseTargetFormat) {
    EXPECT_EQ(parse_target_format("pdf"), file_format::pdf);
    EXPECT_EQ(parse_target_format("PDF"), file_format::pdf);
    EXPECT_EQ(parse_target_format("txt"), file_format::text);
    EXPECT_EQ(parse_target_format("Text"), file_format::text);
    EXPECT_EQ(parse_target_format("docx"), file_format::unknown);
    EXPECT_EQ(parse_target_format(""), file_format::unknown);
}

TEST_F(ConversionServiceTest, ExtensionFor) {
    EXPECT_EQ(extension_for(file_format::pdf), "pdf");
    EXPECT_EQ(extension_for(file_format::text), "txt");
    EXPECT_EQ(extension_for(file_format::unknown), "bin");
}

TEST_F(ConversionServiceTest, DefaultServiceDetectsButDoesNotConvert) {
    auto service = make_default_conversion_service();
    ASSERT_NE(service, nullptr);

    auto data = bytes_of("plain text");
    EXPECT_EQ(service->detect_format(data), file_format::text);

    auto converted = service->convert(data, file_format::text, file_format::pdf);
    ASSERT_FALSE(converted.has_value());
    EXPECT_EQ(converted.error().code, error_code::unsupported_conversion);
    EXPECT_EQ(converted.error().message, "Unsupported conversion: Text to PDF");
}

}  // namespace kcenon::p2p_convert::test
