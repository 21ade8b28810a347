/**
 * @file test_request_codec.cpp
 * @brief Unit tests for JSON request decoding and result encoding.
 */

#include "orchestrator/request_codec.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace codebox;
using json = nlohmann::json;

TEST(RequestCodecTest, DecodesFullRequest) {
    auto request = RequestCodec::decode_request(R"json({
        "language": "python",
        "version": "3.12.0",
        "files": [
            {"name": "main.py", "content": "print(input())"},
            {"content": "NDI=", "encoding": "base64"}
        ],
        "stdin": "hello\n",
        "args": ["1", "two"],
        "run_timeout": 3000,
        "compile_timeout": -1,
        "run_memory_limit": 67108864,
        "compile_memory_limit": -1
    })json");
    ASSERT_TRUE(request.has_value()) << request.error().message;

    EXPECT_EQ(request->language, "python");
    EXPECT_EQ(request->version, "3.12.0");
    ASSERT_EQ(request->files.size(), 2u);
    EXPECT_EQ(request->files[0].name, "main.py");
    EXPECT_EQ(request->files[0].encoding, FileEncoding::Utf8);
    EXPECT_TRUE(request->files[1].name.empty());
    EXPECT_EQ(request->files[1].encoding, FileEncoding::Base64);
    EXPECT_EQ(request->stdin_data, "hello\n");
    EXPECT_EQ(request->args, (std::vector<std::string>{"1", "two"}));
    EXPECT_EQ(request->run_timeout_ms, 3000);
    EXPECT_EQ(request->compile_timeout_ms, -1);
    EXPECT_EQ(request->memory_limit_bytes, 67108864);
}

TEST(RequestCodecTest, OptionalFieldsMayBeAbsentOrNull) {
    auto request = RequestCodec::decode_request(R"json({
        "language": "js", "version": "*",
        "files": [{"content": "console.log(1)"}],
        "stdin": null, "run_timeout": null
    })json");
    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_TRUE(request->stdin_data.empty());
    EXPECT_TRUE(request->args.empty());
    EXPECT_FALSE(request->run_timeout_ms.has_value());
    EXPECT_FALSE(request->memory_limit_bytes.has_value());
}

TEST(RequestCodecTest, RejectsMalformedShapes) {
    const char* bad[] = {
        "not json",
        "[]",
        R"({"version": "3", "files": [{"content": "x"}]})",
        R"({"language": 3, "version": "3", "files": [{"content": "x"}]})",
        R"({"language": "py", "version": "3", "files": []})",
        R"({"language": "py", "version": "3"})",
        R"({"language": "py", "version": "3", "files": [{"name": "a"}]})",
        R"({"language": "py", "version": "3", "files": ["x"]})",
        R"({"language": "py", "version": "3", "files": [{"content": "x", "encoding": "rot13"}]})",
        R"({"language": "py", "version": "3", "files": [{"content": "x"}], "args": "a b"})",
        R"({"language": "py", "version": "3", "files": [{"content": "x"}], "args": [1]})",
        R"({"language": "py", "version": "3", "files": [{"content": "x"}], "run_timeout": "10"})",
        R"({"language": "py", "version": "3", "files": [{"content": "x"}], "run_timeout": 2.5})",
        R"({"language": "py", "version": "3", "files": [{"content": "x"}], "compile_memory_limit": "big"})",
    };
    for (const char* body : bad) {
        auto request = RequestCodec::decode_request(body);
        ASSERT_FALSE(request.has_value()) << body;
        EXPECT_EQ(request.error().code, ErrorCode::InvalidRequest) << body;
    }
}

TEST(RequestCodecTest, EncodeRequestDecodesBack) {
    ExecutionRequest request;
    request.language = "c";
    request.version = "13.2.0";
    request.files = {SourceFile{"main.c", "int main(){}", FileEncoding::Utf8}};
    request.args = {"x"};
    request.run_timeout_ms = 500;

    auto decoded = RequestCodec::decode_request(RequestCodec::encode_request(request));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->files.front().name, "main.c");
    EXPECT_EQ(decoded->run_timeout_ms, 500);
    EXPECT_FALSE(decoded->memory_limit_bytes.has_value());
}

TEST(RequestCodecTest, EncodesExitedResult) {
    ExecutionResult result;
    result.language = "python";
    result.version = "3.12.0";
    result.stdout_data = "Hello, World!\n";
    result.output = "Hello, World!\n";
    result.exit_code = 0;
    result.wall_time = Duration{120};

    auto doc = json::parse(RequestCodec::encode_result(result));
    EXPECT_EQ(doc["language"], "python");
    EXPECT_EQ(doc["version"], "3.12.0");
    const auto& run = doc["run"];
    EXPECT_EQ(run["stdout"], "Hello, World!\n");
    EXPECT_EQ(run["stderr"], "");
    EXPECT_EQ(run["output"], "Hello, World!\n");
    EXPECT_EQ(run["code"], 0);
    EXPECT_TRUE(run["signal"].is_null());
    EXPECT_EQ(run["timed_out"], false);
    EXPECT_EQ(run["wall_time"], 120);
}

TEST(RequestCodecTest, EncodesSignalledResultWithNullCode) {
    ExecutionResult result;
    result.signal = "terminated";
    result.timed_out = true;

    auto doc = json::parse(RequestCodec::encode_result(result));
    EXPECT_TRUE(doc["run"]["code"].is_null());
    EXPECT_EQ(doc["run"]["signal"], "terminated");
    EXPECT_EQ(doc["run"]["timed_out"], true);
}

TEST(RequestCodecTest, InvalidUtf8OutputDoesNotThrow) {
    ExecutionResult result;
    result.stdout_data = std::string("ok \xff\xfe", 5);
    result.exit_code = 0;

    std::string encoded;
    ASSERT_NO_THROW(encoded = RequestCodec::encode_result(result));
    auto doc = json::parse(encoded);
    EXPECT_EQ(doc["run"]["stdout"].get<std::string>().substr(0, 3), "ok ");
}

TEST(RequestCodecTest, InvalidUtf8RequestFieldsDoNotThrow) {
    ExecutionRequest request;
    request.language = "python";
    request.version = "*";
    request.files = {SourceFile{"main.py", "print(1)", FileEncoding::Utf8}};
    request.stdin_data = std::string("\xc3\x28", 2);
    request.args = {std::string("\xff", 1)};

    std::string encoded;
    ASSERT_NO_THROW(encoded = RequestCodec::encode_request(request));
    EXPECT_TRUE(RequestCodec::decode_request(encoded).has_value());

    RuntimeDescriptor odd;
    odd.language = std::string("lang\xfe", 5);
    odd.version = "1.0.0";
    ASSERT_NO_THROW((void)RequestCodec::encode_runtimes({odd}));
}

TEST(RequestCodecTest, EncodesRuntimesAndErrors) {
    RuntimeDescriptor js;
    js.language = "javascript";
    js.version = "20.0.0";
    js.aliases = {"js", "node"};
    js.runtime = "node";
    RuntimeDescriptor py;
    py.language = "python";
    py.version = "3.12.0";

    auto runtimes = json::parse(RequestCodec::encode_runtimes({js, py}));
    ASSERT_EQ(runtimes.size(), 2u);
    EXPECT_EQ(runtimes[0]["language"], "javascript");
    EXPECT_EQ(runtimes[0]["aliases"], json::array({"js", "node"}));
    EXPECT_EQ(runtimes[0]["runtime"], "node");
    EXPECT_FALSE(runtimes[1].contains("runtime"));

    auto error = json::parse(RequestCodec::encode_error(
        Error{ErrorCode::NotFound, "Unsupported language: cobol"}));
    EXPECT_EQ(error["message"], "Unsupported language: cobol");
    EXPECT_EQ(error["code"], "not_found");
}
