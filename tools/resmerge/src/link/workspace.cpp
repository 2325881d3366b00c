#include <resmerge/link/Workspace.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <vector>

namespace resmerge::link {

namespace fs = std::filesystem;

Workspace::~Workspace() {
    if (keep_ || root_.empty()) return;
    std::error_code ec;
    fs::remove_all(root_, ec);
}

bool Workspace::create(const std::optional<fs::path>& debug_root,
                       const std::string& run_name,
                       bool keep,
                       std::string& err) {
    std::error_code ec{};
    if (debug_root.has_value()) {
        const fs::path name(run_name);
        if (run_name.empty() || name.has_parent_path() || run_name == "." || run_name == "..") {
            err = "invalid debug workspace name '" + run_name + "'";
            return false;
        }
        root_ = *debug_root / name;
        keep_ = true;
        fs::remove_all(root_, ec);
        if (ec) {
            err = "failed to clear debug workspace " + root_.string() + ": " + ec.message();
            return false;
        }
        fs::create_directories(root_, ec);
        if (ec) {
            err = "failed to create debug workspace " + root_.string() + ": " + ec.message();
            return false;
        }
    } else {
        const auto base = fs::temp_directory_path(ec);
        if (ec) {
            err = "failed to resolve temp directory: " + ec.message();
            return false;
        }
        std::string tmpl = (base / "resmerge-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            err = "failed to create temp workspace under " + base.string() + ": " + std::strerror(errno);
            return false;
        }
        root_ = fs::path(buf.data());
        keep_ = keep;
    }

    for (const auto& d : {deps_dir(), partials_dir(), root_ / "out"}) {
        fs::create_directories(d, ec);
        if (ec) {
            err = "failed to create " + d.string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

StagedPaths Workspace::staged() const {
    const fs::path out = root_ / "out";
    StagedPaths p{};
    p.arsc = out / "arsc.ap_";
    p.proto = out / "proto.ap_";
    p.optimized = out / "optimized.ap_";
    p.r_txt = out / "R.txt";
    p.proguard = out / "proguard.txt";
    p.proguard_main_dex = out / "proguard_main_dex.txt";
    p.emit_ids = out / "ids.txt";
    p.info = out / "resources.info";
    p.stable_ids = out / "stable_ids.txt";
    p.obfuscation_config = out / "aapt2.config";
    p.path_map = out / "path_map.txt";
    p.normalized_manifest = out / "AndroidManifest.normalized.xml";
    return p;
}

} // namespace resmerge::link
