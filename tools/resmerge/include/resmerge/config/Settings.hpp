#pragma once

#include <resmerge/config/TomlLite.hpp>
#include <resmerge/diag/DiagCode.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::config {

/// Machine-level settings read from `--config`. Unset fields leave the built-in
/// defaults alone; command-line flags override all of them.
struct Settings {
    std::optional<std::string> aapt2{};
    std::optional<std::string> cwebp{};
    std::optional<int64_t> jobs{};
    std::optional<std::filesystem::path> debug_root{};
    std::optional<bool> keep_workspace{};
    std::optional<std::string> color{};
    std::optional<bool> progress{};
    std::optional<bool> verbose{};
    std::vector<std::string> ignored_stderr{};
};

bool is_known_key(std::string_view key);

/// Unknown keys become warnings; values of the wrong type are errors.
bool materialize(const FlatMap& values, std::string_view source, Settings& out, diag::Bag& bag);

bool load_settings(const std::filesystem::path& path, Settings& out, diag::Bag& bag);

} // namespace resmerge::config
