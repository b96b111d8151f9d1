#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace sc {

enum class InputFormat { Text, Jsonl, Zip, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.txt | .log | .jsonl | .ndjson | .zip).
InputFormat detect_format(std::string_view path);

const char* content_type_for(InputFormat fmt) noexcept;

// Slug generation: "hashprefix", "basename", or "keypath".
std::string make_slug(std::string_view key, std::string_view mode, int len);

// Lowercase hex of the SHA-256 of `data`, cut to `len` characters.
std::string hex_hash_prefix(std::string_view data, int len);

}
