/**
 * @file file_set.cpp
 * @brief File decoding and naming.
 */

#include "workspace/file_set.hpp"

#include "runtime/command_builder.hpp"

#include <array>
#include <unordered_set>

namespace codebox {

namespace {

constexpr size_t kMaxFileNameLength = 255;

/// Reverse lookup for the standard base64 alphabet; -1 marks invalid input.
constexpr std::array<int8_t, 256> make_base64_table() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    constexpr std::string_view alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (size_t i = 0; i < alphabet.size(); ++i) {
        table[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto kBase64Table = make_base64_table();

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool ends_with(std::string_view text, std::string_view suffix) noexcept {
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // anonymous namespace

Result<std::string> decode_base64(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : encoded) {
        if (c == '\n' || c == '\r' || c == ' ') continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return Error{ErrorCode::InvalidRequest, "Invalid base64: data after padding"};
        }
        int8_t value = kBase64Table[static_cast<unsigned char>(c)];
        if (value < 0) {
            return Error{ErrorCode::InvalidRequest, "Invalid base64 character"};
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    if (padding > 2 || bits >= 6) {
        return Error{ErrorCode::InvalidRequest, "Invalid base64 length"};
    }
    return out;
}

Result<std::string> decode_hex(std::string_view encoded) {
    if (encoded.size() % 2 != 0) {
        return Error{ErrorCode::InvalidRequest, "Invalid hex: odd length"};
    }
    std::string out;
    out.reserve(encoded.size() / 2);
    for (size_t i = 0; i < encoded.size(); i += 2) {
        int hi = hex_value(encoded[i]);
        int lo = hex_value(encoded[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::InvalidRequest, "Invalid hex character"};
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

Result<std::string> decode_content(const SourceFile& file) {
    switch (file.encoding) {
        case FileEncoding::Utf8:   return file.content;
        case FileEncoding::Base64: return decode_base64(file.content);
        case FileEncoding::Hex:    return decode_hex(file.content);
    }
    return Error{ErrorCode::InvalidRequest, "Unknown file encoding"};
}

bool is_safe_file_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxFileNameLength) return false;
    if (name == "." || name == "..") return false;
    return name.find_first_of(std::string_view{"/\\\0", 3}) == std::string_view::npos;
}

Result<std::vector<StagedFile>> prepare_files(const std::vector<SourceFile>& files,
                                              const RuntimeDescriptor& runtime) {
    if (files.empty()) {
        return Error{ErrorCode::InvalidRequest, "At least one file is required"};
    }

    std::vector<StagedFile> staged;
    staged.reserve(files.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];

        auto data = decode_content(file);
        if (!data) {
            return Error{ErrorCode::InvalidRequest,
                         "File " + std::to_string(i) + ": " + data.error().message};
        }

        std::string name = file.name;
        if (name.empty()) {
            if (i == 0) {
                name = (uses_classname(runtime) ? "Main" : "main") + runtime.extension;
            } else {
                name = "file" + std::to_string(i) + runtime.extension;
            }
        } else if (i == 0 && !runtime.extension.empty() && !ends_with(name, runtime.extension)) {
            name += runtime.extension;
        }

        if (!is_safe_file_name(name)) {
            return Error{ErrorCode::InvalidRequest, "Invalid file name: " + name};
        }
        if (!is_valid_utf8(name)) {
            return Error{ErrorCode::InvalidRequest,
                         "File " + std::to_string(i) + ": name is not valid UTF-8"};
        }
        if (!seen.insert(name).second) {
            return Error{ErrorCode::InvalidRequest, "Duplicate file name: " + name};
        }

        staged.push_back(StagedFile{std::move(name), std::move(*data)});
    }
    return staged;
}

}  // namespace codebox
