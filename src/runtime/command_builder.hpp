/**
 * @file command_builder.hpp
 * @brief Expansion of a runtime's command template into an argument vector.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codebox {

/**
 * @brief Inputs to one command expansion.
 */
struct CommandContext {
    std::string mount_path;          ///< Sandbox path of the workspace, e.g. "/code"
    std::string entry_file;          ///< File name of the entry point inside the workspace
    std::string entry_content;       ///< Decoded entry file, for {classname}
    std::vector<std::string> args;   ///< Caller arguments
};

/**
 * @brief Expand @p descriptor's command template.
 *
 * Each placeholder maps to whole argv elements; caller-supplied strings are
 * never spliced into another element. When the template has no {args}
 * placeholder, arguments are appended.
 */
[[nodiscard]] std::vector<std::string> build_command(const RuntimeDescriptor& descriptor,
                                                     const CommandContext& ctx);

/**
 * @brief Check caller arguments before they reach the engine.
 *
 * Arguments travel as JSON strings in the create request and become argv
 * elements, so each must be valid UTF-8 without NUL bytes.
 */
Result<void> validate_args(const std::vector<std::string>& args);

/// Strict UTF-8 check, as applied by the JSON encoder.
[[nodiscard]] bool is_valid_utf8(std::string_view text);

/// Public class name declared in Java source, "Main" when none is found.
[[nodiscard]] std::string extract_java_classname(std::string_view source);

/// True when the template needs the entry file's class name.
[[nodiscard]] bool uses_classname(const RuntimeDescriptor& descriptor);

}  // namespace codebox
