/**
 * @file registry.hpp
 * @brief Immutable catalog of executable language runtimes.
 *
 * Built once at startup from the built-in catalog plus [[runtime]] entries
 * in the configuration, then only read. Lookups are case-insensitive exact
 * matches on the canonical language name or one of its aliases.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codebox {

class RuntimeRegistry {
public:
    /**
     * @brief Build a registry, rejecting aliases claimed by two languages.
     *
     * @param min_memory_bytes  Floor every container gets; a runtime whose
     *                          memory limits sit below it is rejected.
     */
    static Result<RuntimeRegistry> create(std::vector<RuntimeDescriptor> descriptors,
                                          uint64_t min_memory_bytes = 0);

    /// The five runtimes shipped with codebox (python, javascript, c, c++, java).
    static std::vector<RuntimeDescriptor> builtin_runtimes();

    /**
     * @brief Overlay @p configured on top of @p base.
     *
     * A configured descriptor with the same (language, version) replaces the
     * base one; new pairs are appended.
     */
    static std::vector<RuntimeDescriptor> merge(std::vector<RuntimeDescriptor> base,
                                                const std::vector<RuntimeDescriptor>& configured);

    /**
     * @brief Resolve a (language-or-alias, version-or-alias) pair.
     *
     * The version "*" or "latest" selects the highest registered version.
     * Fails with ErrorCode::NotFound; never consults the container engine.
     */
    [[nodiscard]] Result<RuntimeDescriptor> resolve(std::string_view language,
                                                    std::string_view version) const;

    /// Highest registered version of a language.
    [[nodiscard]] Result<RuntimeDescriptor> describe(std::string_view language) const;

    /// All descriptors ordered by language, then descending version.
    [[nodiscard]] const std::vector<RuntimeDescriptor>& list() const noexcept { return descriptors_; }

    [[nodiscard]] size_t size() const noexcept { return descriptors_.size(); }

private:
    RuntimeRegistry() = default;

    std::vector<RuntimeDescriptor> descriptors_;
    /// Normalized language or alias -> canonical language.
    std::unordered_map<std::string, std::string> names_;
    /// Canonical language -> descriptor indices, highest version first.
    std::unordered_map<std::string, std::vector<size_t>> by_language_;
    std::map<std::pair<std::string, std::string>, size_t> by_version_;
};

/// Lowercase ASCII copy used for every registry key.
[[nodiscard]] std::string normalize_key(std::string_view text);

/**
 * @brief Compare dotted numeric versions ("3.12.0" < "3.13").
 *
 * Non-numeric components compare lexicographically.
 * @return negative, zero or positive like strcmp.
 */
[[nodiscard]] int compare_versions(std::string_view lhs, std::string_view rhs);

}  // namespace codebox
