#pragma once

#include <resmerge/link/RunConfig.hpp>
#include <resmerge/log/Reporter.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace resmerge::cli {

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kRun,
};

/// Flags that may also come from the settings file. Only set when given on the
/// command line, so the driver can layer them over the file.
struct AmbientFlags {
    std::optional<std::string> aapt2{};
    std::optional<std::string> cwebp{};
    std::optional<uint32_t> jobs{};
    std::optional<std::filesystem::path> debug_root{};
    std::optional<bool> keep_workspace{};
    std::optional<log::ColorMode> color{};
    std::optional<bool> progress{};
    std::optional<bool> verbose{};
    std::vector<std::string> ignored_stderr{};
};

struct Options {
    Mode mode = Mode::kUsage;
    link::RunConfig run{};
    AmbientFlags ambient{};
    std::optional<std::filesystem::path> config_path{};

    bool ok = true;
    std::string error{};
};

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);

} // namespace resmerge::cli
