#include <resmerge/config/Settings.hpp>

#include <array>

namespace resmerge::config {

namespace {

constexpr std::array<std::string_view, 9> k_known_keys{
    "toolchain.aapt2",
    "toolchain.cwebp",
    "pool.jobs",
    "workspace.debug_root",
    "workspace.keep",
    "ui.color",
    "ui.progress",
    "ui.verbose",
    "link.ignored_stderr",
};

template <typename T>
bool take(const FlatMap& values, std::string_view key, std::string_view source, std::optional<T>& out, diag::Bag& bag) {
    const auto it = values.find(std::string(key));
    if (it == values.end()) return true;
    if (const T* v = std::get_if<T>(&it->second)) {
        out = *v;
        return true;
    }
    bag.error(diag::Code::kConfigurationContradiction, std::string(source),
              "'" + std::string(key) + "' has the wrong type (" + value_kind(it->second) + ")");
    return false;
}

} // namespace

bool is_known_key(std::string_view key) {
    for (const auto k : k_known_keys) {
        if (k == key) return true;
    }
    return false;
}

bool materialize(const FlatMap& values, std::string_view source, Settings& out, diag::Bag& bag) {
    for (const auto& [key, _] : values) {
        if (!is_known_key(key)) {
            bag.warning(diag::Code::kConfigurationContradiction, std::string(source), "unknown settings key '" + key + "' ignored");
        }
    }

    bool ok = take(values, "toolchain.aapt2", source, out.aapt2, bag);
    ok = take(values, "toolchain.cwebp", source, out.cwebp, bag) && ok;
    ok = take(values, "pool.jobs", source, out.jobs, bag) && ok;
    ok = take(values, "workspace.keep", source, out.keep_workspace, bag) && ok;
    ok = take(values, "ui.color", source, out.color, bag) && ok;
    ok = take(values, "ui.progress", source, out.progress, bag) && ok;
    ok = take(values, "ui.verbose", source, out.verbose, bag) && ok;

    std::optional<std::string> debug_root{};
    ok = take(values, "workspace.debug_root", source, debug_root, bag) && ok;
    if (debug_root && !debug_root->empty()) out.debug_root = std::filesystem::path(*debug_root);

    std::optional<std::vector<std::string>> ignored{};
    ok = take(values, "link.ignored_stderr", source, ignored, bag) && ok;
    if (ignored) out.ignored_stderr = std::move(*ignored);

    if (out.jobs && *out.jobs <= 0) {
        bag.error(diag::Code::kConfigurationContradiction, std::string(source), "'pool.jobs' must be positive");
        ok = false;
    }
    return ok;
}

bool load_settings(const std::filesystem::path& path, Settings& out, diag::Bag& bag) {
    FlatMap values{};
    std::vector<std::string> warnings{};
    std::string err{};
    if (!toml_lite::parse_file(path, values, warnings, err)) {
        std::error_code ec{};
        const auto code = std::filesystem::exists(path, ec) ? diag::Code::kConfigurationContradiction : diag::Code::kMissingResource;
        bag.error(code, path.string(), err);
        return false;
    }
    for (auto& w : warnings) bag.warning(diag::Code::kConfigurationContradiction, path.string(), std::move(w));
    return materialize(values, path.string(), out, bag);
}

} // namespace resmerge::config
