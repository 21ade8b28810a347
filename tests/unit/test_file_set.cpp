/**
 * @file test_file_set.cpp
 * @brief Unit tests for file decoding, naming and validation.
 */

#include "workspace/file_set.hpp"
#include "runtime/registry.hpp"

#include <gtest/gtest.h>

using namespace codebox;

class FileSetTest : public ::testing::Test {
protected:
    RuntimeRegistry registry_ = RuntimeRegistry::create(RuntimeRegistry::builtin_runtimes()).value();
    RuntimeDescriptor python_ = registry_.describe("python").value();
    RuntimeDescriptor java_ = registry_.describe("java").value();
};

TEST_F(FileSetTest, UnnamedEntryFileGetsDefaultName) {
    auto staged = prepare_files({SourceFile{"", "print(1)"}}, python_);
    ASSERT_TRUE(staged.has_value()) << staged.error().message;
    ASSERT_EQ(staged->size(), 1u);
    EXPECT_EQ(staged->front().name, "main.py");
    EXPECT_EQ(staged->front().data, "print(1)");
}

TEST_F(FileSetTest, JavaEntryFileIsCapitalized) {
    auto staged = prepare_files({SourceFile{"", "public class Main {}"}}, java_);
    ASSERT_TRUE(staged.has_value());
    EXPECT_EQ(staged->front().name, "Main.java");
}

TEST_F(FileSetTest, EntryFileGetsExtensionAppended) {
    auto staged = prepare_files({SourceFile{"solution", "x"},
                                 SourceFile{"helper", "y"},
                                 SourceFile{"", "z"}}, python_);
    ASSERT_TRUE(staged.has_value());
    EXPECT_EQ((*staged)[0].name, "solution.py");
    EXPECT_EQ((*staged)[1].name, "helper");
    EXPECT_EQ((*staged)[2].name, "file2.py");
}

TEST_F(FileSetTest, DecodesBase64AndHex) {
    auto staged = prepare_files({SourceFile{"main.py", "cHJpbnQoMSk=", FileEncoding::Base64},
                                 SourceFile{"data.bin", "00ff41", FileEncoding::Hex}}, python_);
    ASSERT_TRUE(staged.has_value()) << staged.error().message;
    EXPECT_EQ((*staged)[0].data, "print(1)");
    EXPECT_EQ((*staged)[1].data, std::string("\x00\xff" "A", 3));
}

TEST_F(FileSetTest, RejectsEmptyFileSet) {
    auto staged = prepare_files({}, python_);
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code, ErrorCode::InvalidRequest);
}

TEST_F(FileSetTest, RejectsPathTraversal) {
    for (const char* name : {"../etc/passwd", "a/b.py", "..", "dir\\file.py"}) {
        auto staged = prepare_files({SourceFile{"main.py", "x"}, SourceFile{name, "y"}}, python_);
        ASSERT_FALSE(staged.has_value()) << name;
        EXPECT_EQ(staged.error().code, ErrorCode::InvalidRequest);
    }
}

TEST_F(FileSetTest, RejectsNonUtf8Names) {
    auto staged = prepare_files({SourceFile{"main.py", "x"},
                                 SourceFile{std::string("data\xff.txt"), "y"}}, python_);
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code, ErrorCode::InvalidRequest);
    EXPECT_NE(staged.error().message.find("UTF-8"), std::string::npos);
}

TEST_F(FileSetTest, RejectsDuplicateNames) {
    auto staged = prepare_files({SourceFile{"main.py", "x"}, SourceFile{"main.py", "y"}}, python_);
    ASSERT_FALSE(staged.has_value());
    EXPECT_NE(staged.error().message.find("Duplicate"), std::string::npos);
}

TEST_F(FileSetTest, RejectsUndecodableContent) {
    auto staged = prepare_files({SourceFile{"main.py", "not base64!", FileEncoding::Base64}}, python_);
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code, ErrorCode::InvalidRequest);
}

TEST(DecodeTest, Base64) {
    EXPECT_EQ(decode_base64("aGVsbG8=").value(), "hello");
    EXPECT_EQ(decode_base64("aGVsbG8h").value(), "hello!");
    EXPECT_EQ(decode_base64("aGVs\nbG8=").value(), "hello");
    EXPECT_FALSE(decode_base64("aGVsbG8=x").has_value());
    EXPECT_FALSE(decode_base64("a").has_value());
}

TEST(DecodeTest, Hex) {
    EXPECT_EQ(decode_hex("48656C6c6f").value(), "Hello");
    EXPECT_FALSE(decode_hex("abc").has_value());
    EXPECT_FALSE(decode_hex("zz").has_value());
}

TEST(DecodeTest, SafeFileNames) {
    EXPECT_TRUE(is_safe_file_name("main.py"));
    EXPECT_TRUE(is_safe_file_name(".hidden"));
    EXPECT_FALSE(is_safe_file_name(""));
    EXPECT_FALSE(is_safe_file_name("."));
    EXPECT_FALSE(is_safe_file_name(std::string_view{"a\0b", 3}));
    EXPECT_FALSE(is_safe_file_name(std::string(256, 'a')));
}
