/**
 * @file file_set.hpp
 * @brief Decoding, naming and validation of caller-submitted files.
 *
 * Runs before admission: everything here is a pure function of the request
 * and the resolved runtime, so a malformed file set never costs a slot.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codebox {

/**
 * @brief A decoded file with its final on-disk name.
 */
struct StagedFile {
    std::string name;
    std::string data;
};

/**
 * @brief Decode and name every file; the first one is the entry point.
 *
 * An unnamed entry file becomes main<ext> (Main<ext> for runtimes that need
 * a class name); an entry file lacking the runtime's extension gets it
 * appended. Other unnamed files become file<N><ext>.
 */
Result<std::vector<StagedFile>> prepare_files(const std::vector<SourceFile>& files,
                                              const RuntimeDescriptor& runtime);

Result<std::string> decode_content(const SourceFile& file);
Result<std::string> decode_base64(std::string_view encoded);
Result<std::string> decode_hex(std::string_view encoded);

/// A single path component: non-empty, not "." or "..", no '/', '\\' or NUL.
[[nodiscard]] bool is_safe_file_name(std::string_view name) noexcept;

}  // namespace codebox
