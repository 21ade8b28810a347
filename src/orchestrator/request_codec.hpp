/**
 * @file request_codec.hpp
 * @brief Piston v2 compatible JSON encoding of requests and results.
 *
 * Request:
 *   {"language", "version", "files": [{"name"?, "content", "encoding"?}],
 *    "stdin"?, "args"?, "run_timeout"?, "compile_timeout"?,
 *    "run_memory_limit"?, "compile_memory_limit"?}
 *   Timeouts in ms, memory in bytes, -1 or null for the default.
 *
 * Response:
 *   {"language", "version", "run": {"stdout", "stderr", "output", "code",
 *    "signal", "timed_out", "oom_killed", "stdout_truncated",
 *    "stderr_truncated", "wall_time"}}
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codebox {

struct RequestCodec {
    /// Parse and type-check a request; any shape error is InvalidRequest.
    static Result<ExecutionRequest> decode_request(std::string_view json_text);

    static std::string encode_request(const ExecutionRequest& request);
    static std::string encode_result(const ExecutionResult& result);
    /// [{"language", "version", "aliases", "runtime"?}]
    static std::string encode_runtimes(const std::vector<RuntimeDescriptor>& runtimes);
    /// {"message", "code"}
    static std::string encode_error(const Error& error);
};

}  // namespace codebox
