/**
 * @file command_builder.cpp
 * @brief Command template expansion.
 */

#include "runtime/command_builder.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <regex>

namespace codebox {

namespace {

constexpr std::string_view kFile = "{file}";
constexpr std::string_view kClassname = "{classname}";
constexpr std::string_view kArgs = "{args}";

}  // anonymous namespace

bool is_valid_utf8(std::string_view text) {
    try {
        (void)nlohmann::json(std::string(text)).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

Result<void> validate_args(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].find('\0') != std::string::npos) {
            return Error{ErrorCode::InvalidRequest,
                         "Argument " + std::to_string(i) + " contains a NUL byte"};
        }
        if (!is_valid_utf8(args[i])) {
            return Error{ErrorCode::InvalidRequest,
                         "Argument " + std::to_string(i) + " is not valid UTF-8"};
        }
    }
    return {};
}

std::vector<std::string> build_command(const RuntimeDescriptor& descriptor,
                                       const CommandContext& ctx) {
    std::vector<std::string> argv;
    argv.reserve(descriptor.command.size() + ctx.args.size());
    bool args_placed = false;

    std::string file_path = ctx.mount_path;
    if (file_path.empty() || file_path.back() != '/') file_path += '/';
    file_path += ctx.entry_file;

    for (const auto& part : descriptor.command) {
        if (part == kFile) {
            argv.push_back(file_path);
        } else if (part == kClassname) {
            argv.push_back(extract_java_classname(ctx.entry_content));
        } else if (part == kArgs) {
            argv.insert(argv.end(), ctx.args.begin(), ctx.args.end());
            args_placed = true;
        } else {
            argv.push_back(part);
        }
    }

    if (!args_placed) {
        argv.insert(argv.end(), ctx.args.begin(), ctx.args.end());
    }
    return argv;
}

std::string extract_java_classname(std::string_view source) {
    static const std::regex kPublicClass{
        R"(public\s+(?:(?:final|abstract|static)\s+)*class\s+([A-Za-z_$][A-Za-z0-9_$]*))"};

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(source.begin(), source.end(), match, kPublicClass)) {
        return match[1].str();
    }
    return "Main";
}

bool uses_classname(const RuntimeDescriptor& descriptor) {
    return std::find(descriptor.command.begin(), descriptor.command.end(), kClassname)
        != descriptor.command.end();
}

}  // namespace codebox
