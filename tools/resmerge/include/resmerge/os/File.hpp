#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace resmerge::os {

struct ReadResult {
    bool ok = false;
    std::string data{};
    std::string err{};
};

/// Reads the file as bytes; no newline translation.
ReadResult read_file(const std::filesystem::path& path);

/// Writes through `<path>.tmp` and a rename.
bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& err);

/// Leaves `path` untouched (mtime included) when it already holds `data`.
/// `changed` reports whether a write happened.
bool write_if_changed(const std::filesystem::path& path, std::string_view data, bool& changed, std::string& err);

} // namespace resmerge::os
