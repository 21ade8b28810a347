/**
 * @file registry.cpp
 * @brief RuntimeRegistry implementation and the built-in runtime catalog.
 */

#include "runtime/registry.hpp"

#include <algorithm>
#include <cctype>

namespace codebox {

namespace {

std::vector<std::string_view> split_version(std::string_view version) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= version.size()) {
        auto dot = version.find('.', start);
        if (dot == std::string_view::npos) dot = version.size();
        parts.push_back(version.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

int compare_component(std::string_view a, std::string_view b) {
    if (all_digits(a) && all_digits(b)) {
        while (a.size() > 1 && a.front() == '0') a.remove_prefix(1);
        while (b.size() > 1 && b.front() == '0') b.remove_prefix(1);
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    }
    int cmp = a.compare(b);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

/// Fixed compile-then-exec script; file and arguments arrive as "$@".
std::vector<std::string> compile_and_run(std::string script) {
    return {"/bin/sh", "-c", std::move(script), "sh", "{file}"};
}

}  // anonymous namespace

std::string normalize_key(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int compare_versions(std::string_view lhs, std::string_view rhs) {
    auto a = split_version(lhs);
    auto b = split_version(rhs);
    const size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        std::string_view ca = i < a.size() ? a[i] : std::string_view{"0"};
        std::string_view cb = i < b.size() ? b[i] : std::string_view{"0"};
        if (int cmp = compare_component(ca, cb); cmp != 0) return cmp;
    }
    return 0;
}

// ─────────────────────────────────────────────
// Built-in Catalog
// ─────────────────────────────────────────────

std::vector<RuntimeDescriptor> RuntimeRegistry::builtin_runtimes() {
    std::vector<RuntimeDescriptor> runtimes;

    RuntimeDescriptor python;
    python.language = "python";
    python.version = "3.12.0";
    python.aliases = {"python3", "py"};
    python.image = "codebox-python-runner";
    python.extension = ".py";
    python.command = {"python3", "{file}", "{args}"};
    runtimes.push_back(std::move(python));

    RuntimeDescriptor javascript;
    javascript.language = "javascript";
    javascript.version = "20.0.0";
    javascript.aliases = {"js", "node", "node-js"};
    javascript.image = "codebox-node-runner";
    javascript.extension = ".js";
    javascript.runtime = "node";
    javascript.command = {"node", "{file}", "{args}"};
    runtimes.push_back(std::move(javascript));

    RuntimeDescriptor c;
    c.language = "c";
    c.version = "13.2.0";
    c.aliases = {"gcc"};
    c.image = "codebox-c-runner";
    c.extension = ".c";
    c.compiled = true;
    c.command = compile_and_run(R"(gcc -o /tmp/program "$1" -lm && shift && exec /tmp/program "$@")");
    c.command.emplace_back("{args}");
    runtimes.push_back(std::move(c));

    RuntimeDescriptor cpp;
    cpp.language = "c++";
    cpp.version = "13.2.0";
    cpp.aliases = {"cpp", "g++", "cplusplus"};
    cpp.image = "codebox-cpp-runner";
    cpp.extension = ".cpp";
    cpp.compiled = true;
    cpp.command = compile_and_run(R"(g++ -o /tmp/program "$1" -lm && shift && exec /tmp/program "$@")");
    cpp.command.emplace_back("{args}");
    runtimes.push_back(std::move(cpp));

    RuntimeDescriptor java;
    java.language = "java";
    java.version = "21.0.0";
    java.aliases = {"jdk"};
    java.image = "codebox-java-runner";
    java.extension = ".java";
    java.compiled = true;
    java.command = compile_and_run(R"(javac -d /tmp "$1" && shift && exec java -cp /tmp "$@")");
    java.command.emplace_back("{classname}");
    java.command.emplace_back("{args}");
    runtimes.push_back(std::move(java));

    return runtimes;
}

std::vector<RuntimeDescriptor> RuntimeRegistry::merge(std::vector<RuntimeDescriptor> base,
                                                      const std::vector<RuntimeDescriptor>& configured) {
    for (const auto& rt : configured) {
        auto existing = std::find_if(base.begin(), base.end(), [&](const RuntimeDescriptor& b) {
            return normalize_key(b.language) == normalize_key(rt.language)
                && normalize_key(b.version) == normalize_key(rt.version);
        });
        if (existing != base.end()) {
            *existing = rt;
        } else {
            base.push_back(rt);
        }
    }
    return base;
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<RuntimeRegistry> RuntimeRegistry::create(std::vector<RuntimeDescriptor> descriptors,
                                                uint64_t min_memory_bytes) {
    std::sort(descriptors.begin(), descriptors.end(),
        [](const RuntimeDescriptor& a, const RuntimeDescriptor& b) {
            auto la = normalize_key(a.language);
            auto lb = normalize_key(b.language);
            if (la != lb) return la < lb;
            return compare_versions(a.version, b.version) > 0;
        });

    RuntimeRegistry registry;
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& rt = descriptors[i];
        if (rt.language.empty() || rt.version.empty() || rt.image.empty() || rt.command.empty()) {
            return Error{ErrorCode::InvalidRequest,
                         "Runtime descriptor is incomplete: " + rt.language + " " + rt.version};
        }
        for (const auto& memory : {rt.limits.max_memory_bytes, rt.limits.default_memory_bytes}) {
            if (memory && *memory < min_memory_bytes) {
                return Error{ErrorCode::InvalidRequest,
                             "Runtime " + rt.language + " " + rt.version + " memory limit "
                             + std::to_string(*memory) + " is below the floor of "
                             + std::to_string(min_memory_bytes) + " bytes"};
            }
        }

        const auto language = normalize_key(rt.language);
        const auto version = normalize_key(rt.version);
        if (!registry.by_version_.emplace(std::make_pair(language, version), i).second) {
            return Error{ErrorCode::InvalidRequest,
                         "Duplicate runtime: " + rt.language + " " + rt.version};
        }
        registry.by_language_[language].push_back(i);

        std::vector<std::string> keys{language};
        for (const auto& alias : rt.aliases) keys.push_back(normalize_key(alias));
        for (const auto& key : keys) {
            auto [it, inserted] = registry.names_.emplace(key, language);
            if (!inserted && it->second != language) {
                return Error{ErrorCode::InvalidRequest,
                             "Alias '" + key + "' claimed by both " + it->second + " and " + language};
            }
        }
    }
    registry.descriptors_ = std::move(descriptors);
    return registry;
}

// ─────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────

Result<RuntimeDescriptor> RuntimeRegistry::resolve(std::string_view language,
                                                   std::string_view version) const {
    auto name = names_.find(normalize_key(language));
    if (name == names_.end()) {
        return Error{ErrorCode::NotFound, "Unsupported language: " + std::string{language}};
    }

    const auto wanted = normalize_key(version);
    if (wanted == "*" || wanted == "latest") {
        return descriptors_[by_language_.at(name->second).front()];
    }

    auto it = by_version_.find(std::make_pair(name->second, wanted));
    if (it == by_version_.end()) {
        return Error{ErrorCode::NotFound,
                     "Unsupported version: " + std::string{language} + " " + std::string{version}};
    }
    return descriptors_[it->second];
}

Result<RuntimeDescriptor> RuntimeRegistry::describe(std::string_view language) const {
    return resolve(language, "latest");
}

}  // namespace codebox
