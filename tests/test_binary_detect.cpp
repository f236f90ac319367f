#include <gtest/gtest.h>
#include <deploy/binary_detect.hpp>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace std::string_literals;

TEST(BinaryDetectTest, PlainTextIsText) {
    EXPECT_FALSE(looks_binary("<!doctype html>\n<html><body>Hello</body></html>\n"));
    EXPECT_FALSE(looks_binary("body { color: #333; }\r\n\tmargin: 0;\n"));
}

TEST(BinaryDetectTest, EmptyIsText) {
    EXPECT_FALSE(looks_binary(""));
}

TEST(BinaryDetectTest, NulByteIsBinary) {
    EXPECT_TRUE(looks_binary("abc\0def"s));
}

TEST(BinaryDetectTest, PngHeaderIsBinary) {
    EXPECT_TRUE(looks_binary("\x89PNG\r\n\x1a\n\0\0\0\rIHDR"s));
}

TEST(BinaryDetectTest, PdfIsBinary) {
    EXPECT_TRUE(looks_binary("%PDF-1.7\nplain looking body"));
}

TEST(BinaryDetectTest, Utf8TextIsText) {
    EXPECT_FALSE(looks_binary("Caf\xC3\xA9 na\xC3\xAFve \xE2\x82\xAC 10 \xE2\x80\x94 ok\n"));
}

TEST(BinaryDetectTest, ByteOrderMarkIsText) {
    EXPECT_FALSE(looks_binary("\xEF\xBB\xBFtitle: home\n"));
    EXPECT_FALSE(looks_binary("\xFF\xFEh\0i\0"s));
}

TEST(BinaryDetectTest, ManyControlBytesIsBinary) {
    std::string noisy;
    for (int i = 0; i < 100; i++) noisy += "\x01\x02\x03";
    EXPECT_TRUE(looks_binary(noisy));
}

TEST(BinaryDetectTest, SuspiciousRatioJustAboveTenPercent) {
    // 52/512 is 10.16%, 51/512 is 9.96%
    std::string above = std::string(460, 'a') + std::string(52, '\x01');
    std::string below = std::string(461, 'a') + std::string(51, '\x01');
    EXPECT_TRUE(looks_binary(above));
    EXPECT_FALSE(looks_binary(below));
}

class BinaryFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sitedeploy_binary_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(BinaryFileTest, SniffsFiles) {
    std::ofstream(test_dir / "a.png", std::ios::binary) << "\x89PNG\r\n\x1a\n\0\0\0\rIHDR"s;
    std::ofstream(test_dir / "a.txt") << "hello\n";
    std::ofstream(test_dir / "empty.txt");

    auto png = is_binary_file(test_dir / "a.png");
    auto txt = is_binary_file(test_dir / "a.txt");
    auto empty = is_binary_file(test_dir / "empty.txt");
    ASSERT_TRUE(png.is_ok());
    ASSERT_TRUE(txt.is_ok());
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(png.value);
    EXPECT_FALSE(txt.value);
    EXPECT_FALSE(empty.value);
}

TEST_F(BinaryFileTest, MissingFile) {
    EXPECT_TRUE(is_binary_file(test_dir / "gone.bin").is_err());
}
