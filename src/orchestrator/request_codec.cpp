/**
 * @file request_codec.cpp
 * @brief RequestCodec implementation over nlohmann::json.
 */

#include "orchestrator/request_codec.hpp"

#include <nlohmann/json.hpp>

namespace codebox {

namespace {

using json = nlohmann::json;

Error invalid(const std::string& message) {
    return Error{ErrorCode::InvalidRequest, message};
}

Result<std::string> required_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return invalid(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

/// Absent or null -> nullopt; integers pass; anything else is rejected.
Result<std::optional<int64_t>> optional_integer(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::optional<int64_t>{};
    if (it->is_number_integer()) {
        return std::optional<int64_t>{it->get<int64_t>()};
    }
    return invalid(std::string("'") + key + "' must be an integer");
}

Result<FileEncoding> parse_encoding(const json& file) {
    auto it = file.find("encoding");
    if (it == file.end() || it->is_null()) return FileEncoding::Utf8;
    if (!it->is_string()) return invalid("'encoding' must be a string");

    const auto name = it->get<std::string>();
    if (name == "utf8") return FileEncoding::Utf8;
    if (name == "base64") return FileEncoding::Base64;
    if (name == "hex") return FileEncoding::Hex;
    return invalid("Unknown encoding '" + name + "'");
}

json to_json(const RuntimeDescriptor& runtime) {
    json out = {
        {"language", runtime.language},
        {"version", runtime.version},
        {"aliases", runtime.aliases}
    };
    if (runtime.runtime) out["runtime"] = *runtime.runtime;
    return out;
}

}  // anonymous namespace

Result<ExecutionRequest> RequestCodec::decode_request(std::string_view json_text) {
    auto doc = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) return invalid("Request body is not valid JSON");
    if (!doc.is_object()) return invalid("Request body must be a JSON object");

    ExecutionRequest request;

    auto language = required_string(doc, "language");
    if (!language) return language.error();
    request.language = std::move(*language);

    auto version = required_string(doc, "version");
    if (!version) return version.error();
    request.version = std::move(*version);

    auto files_it = doc.find("files");
    if (files_it == doc.end() || !files_it->is_array() || files_it->empty()) {
        return invalid("'files' must be a non-empty array");
    }
    for (const auto& entry : *files_it) {
        if (!entry.is_object()) return invalid("Each file must be an object");

        SourceFile file;
        if (auto name = entry.find("name"); name != entry.end() && !name->is_null()) {
            if (!name->is_string()) return invalid("'name' must be a string");
            file.name = name->get<std::string>();
        }
        auto content = required_string(entry, "content");
        if (!content) return content.error();
        file.content = std::move(*content);

        auto encoding = parse_encoding(entry);
        if (!encoding) return encoding.error();
        file.encoding = *encoding;

        request.files.push_back(std::move(file));
    }

    if (auto it = doc.find("stdin"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) return invalid("'stdin' must be a string");
        request.stdin_data = it->get<std::string>();
    }

    if (auto it = doc.find("args"); it != doc.end() && !it->is_null()) {
        if (!it->is_array()) return invalid("'args' must be an array of strings");
        for (const auto& arg : *it) {
            if (!arg.is_string()) return invalid("'args' must be an array of strings");
            request.args.push_back(arg.get<std::string>());
        }
    }

    auto run_timeout = optional_integer(doc, "run_timeout");
    if (!run_timeout) return run_timeout.error();
    request.run_timeout_ms = *run_timeout;

    auto compile_timeout = optional_integer(doc, "compile_timeout");
    if (!compile_timeout) return compile_timeout.error();
    request.compile_timeout_ms = *compile_timeout;

    auto memory = optional_integer(doc, "run_memory_limit");
    if (!memory) return memory.error();
    request.memory_limit_bytes = *memory;

    // Accepted for compatibility; compilation shares the run limit.
    if (auto compile_memory = optional_integer(doc, "compile_memory_limit"); !compile_memory) {
        return compile_memory.error();
    }

    return request;
}

std::string RequestCodec::encode_request(const ExecutionRequest& request) {
    json files = json::array();
    for (const auto& file : request.files) {
        json entry = {
            {"content", file.content},
            {"encoding", std::string(to_string(file.encoding))}
        };
        if (!file.name.empty()) entry["name"] = file.name;
        files.push_back(std::move(entry));
    }

    json out = {
        {"language", request.language},
        {"version", request.version},
        {"files", files},
        {"stdin", request.stdin_data},
        {"args", request.args}
    };
    if (request.run_timeout_ms) out["run_timeout"] = *request.run_timeout_ms;
    if (request.compile_timeout_ms) out["compile_timeout"] = *request.compile_timeout_ms;
    if (request.memory_limit_bytes) out["run_memory_limit"] = *request.memory_limit_bytes;
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string RequestCodec::encode_result(const ExecutionResult& result) {
    json run = {
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"output", result.output},
        {"code", result.exit_code ? json(*result.exit_code) : json(nullptr)},
        {"signal", result.signal ? json(*result.signal) : json(nullptr)},
        {"timed_out", result.timed_out},
        {"oom_killed", result.oom_killed},
        {"stdout_truncated", result.stdout_truncated},
        {"stderr_truncated", result.stderr_truncated},
        {"wall_time", result.wall_time.count()}
    };
    json out = {
        {"language", result.language},
        {"version", result.version},
        {"run", run}
    };
    // Program output is arbitrary bytes; never throw on invalid UTF-8.
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string RequestCodec::encode_runtimes(const std::vector<RuntimeDescriptor>& runtimes) {
    json out = json::array();
    for (const auto& runtime : runtimes) {
        out.push_back(to_json(runtime));
    }
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string RequestCodec::encode_error(const Error& error) {
    json out = {
        {"message", error.message},
        {"code", std::string(to_string(error.code))}
    };
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace codebox
