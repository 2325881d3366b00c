#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/link/RunConfig.hpp>
#include <resmerge/link/Workspace.hpp>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::log {
class Reporter;
}

namespace resmerge::link {

/// aapt2 warns about resources targeting API levels below minSdk; that is expected.
inline constexpr std::string_view k_ignored_configuration_pattern = "ignoring configuration .* for (styleable|attribute)";

/// Drops informational stderr lines before they reach diagnostics.
class StderrFilter {
public:
    static std::optional<StderrFilter> create(const std::vector<std::string>& extra_patterns, diag::Bag& bag);

    std::string apply(std::string_view text) const;

private:
    StderrFilter() = default;
    std::vector<llvm::Regex> patterns_{};
};

/// Runs external tools, turning non-zero exits into diagnostics.
class ToolRunner {
public:
    ToolRunner(const StderrFilter& filter, log::Reporter& reporter)
        : filter_(filter), reporter_(reporter) {}

    bool run(const std::vector<std::string>& argv, std::string_view what, diag::Bag& bag, std::string* out = nullptr) const;

private:
    const StderrFilter& filter_;
    log::Reporter& reporter_;
};

struct LinkInputs {
    std::filesystem::path manifest{};
    std::string manifest_package{};
    std::optional<uint32_t> package_id{};
    bool stable_ids = false;
    std::vector<std::filesystem::path> partials{};
};

std::vector<std::string> compile_command(std::string_view aapt2,
                                         const std::filesystem::path& dir,
                                         const std::filesystem::path& out);

std::vector<std::string> link_command(const RunConfig& cfg, const StagedPaths& staged, const LinkInputs& in);

std::vector<std::string> convert_command(std::string_view aapt2,
                                         const std::filesystem::path& arsc_out,
                                         const std::filesystem::path& proto_in);

std::vector<std::string> optimize_command(const RunConfig& cfg,
                                          const StagedPaths& staged,
                                          const std::filesystem::path& in,
                                          bool with_obfuscation_config);

std::vector<std::string> dump_resources_command(std::string_view aapt2, const std::filesystem::path& archive);

} // namespace resmerge::link
