#include <resmerge/tree/ResourceTree.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace resmerge::tree {

namespace fs = std::filesystem;

namespace {

bool ensure_parent(const fs::path& p, std::string& err) {
    if (!p.has_parent_path()) return true;
    std::error_code ec{};
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
        err = "cannot create directory " + p.parent_path().string() + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

DiskTree::DiskTree(std::string label, fs::path root)
    : label_(std::move(label)), root_(std::move(root)) {}

fs::path DiskTree::resolve(std::string_view rel) const {
    return root_ / fs::path(std::string(rel));
}

std::vector<std::string> DiskTree::list_files() const {
    std::vector<std::string> out{};
    std::error_code ec{};
    if (!fs::is_directory(root_, ec)) return out;

    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        out.push_back(it->path().lexically_relative(root_).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool DiskTree::exists(std::string_view rel) const {
    std::error_code ec{};
    return fs::exists(resolve(rel), ec);
}

bool DiskTree::read(std::string_view rel, std::string& out, std::string& err) const {
    const auto p = resolve(rel);
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs.is_open()) {
        err = "cannot open " + p.string();
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return true;
}

bool DiskTree::write(std::string_view rel, std::string_view data, std::string& err) {
    const auto p = resolve(rel);
    if (!ensure_parent(p, err)) return false;
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        err = "cannot write " + p.string();
        return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs.good()) {
        err = "short write to " + p.string();
        return false;
    }
    return true;
}

bool DiskTree::copy(std::string_view from, std::string_view to, std::string& err) {
    const auto src = resolve(from);
    const auto dst = resolve(to);
    if (!ensure_parent(dst, err)) return false;
    std::error_code ec{};
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        err = "cannot copy " + src.string() + " to " + dst.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool DiskTree::move(std::string_view from, std::string_view to, std::string& err) {
    const auto src = resolve(from);
    const auto dst = resolve(to);
    if (!ensure_parent(dst, err)) return false;
    std::error_code ec{};
    fs::rename(src, dst, ec);
    if (ec) {
        err = "cannot move " + src.string() + " to " + dst.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool DiskTree::remove(std::string_view rel, std::string& err) {
    const auto p = resolve(rel);
    std::error_code ec{};
    if (!fs::remove(p, ec)) {
        err = "cannot remove " + p.string() + (ec ? ": " + ec.message() : std::string{});
        return false;
    }
    return true;
}

std::optional<fs::path> DiskTree::host_path(std::string_view rel) const {
    return resolve(rel);
}

} // namespace resmerge::tree
