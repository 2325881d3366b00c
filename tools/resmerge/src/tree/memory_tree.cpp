#include <resmerge/tree/ResourceTree.hpp>

#include <utility>

namespace resmerge::tree {

MemoryTree::MemoryTree(std::string label)
    : label_(std::move(label)) {}

MemoryTree::MemoryTree(std::string label, std::map<std::string, std::string> files)
    : label_(std::move(label)) {
    for (auto& [k, v] : files) files_.emplace(k, std::move(v));
}

std::vector<std::string> MemoryTree::list_files() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out{};
    out.reserve(files_.size());
    for (const auto& [k, _] : files_) out.push_back(k);
    return out;
}

bool MemoryTree::exists(std::string_view rel) const {
    std::lock_guard<std::mutex> lock(mu_);
    return files_.find(rel) != files_.end();
}

bool MemoryTree::read(std::string_view rel, std::string& out, std::string& err) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = files_.find(rel);
    if (it == files_.end()) {
        err = "no such file: " + std::string(rel);
        return false;
    }
    out = it->second;
    return true;
}

bool MemoryTree::write(std::string_view rel, std::string_view data, std::string&) {
    std::lock_guard<std::mutex> lock(mu_);
    files_.insert_or_assign(std::string(rel), std::string(data));
    return true;
}

bool MemoryTree::copy(std::string_view from, std::string_view to, std::string& err) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = files_.find(from);
    if (it == files_.end()) {
        err = "no such file: " + std::string(from);
        return false;
    }
    std::string data = it->second;
    files_.insert_or_assign(std::string(to), std::move(data));
    return true;
}

bool MemoryTree::move(std::string_view from, std::string_view to, std::string& err) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = files_.find(from);
    if (it == files_.end()) {
        err = "no such file: " + std::string(from);
        return false;
    }
    std::string data = std::move(it->second);
    files_.erase(it);
    files_.insert_or_assign(std::string(to), std::move(data));
    return true;
}

bool MemoryTree::remove(std::string_view rel, std::string& err) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = files_.find(rel);
    if (it == files_.end()) {
        err = "no such file: " + std::string(rel);
        return false;
    }
    files_.erase(it);
    return true;
}

std::map<std::string, std::string> MemoryTree::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return std::map<std::string, std::string>(files_.begin(), files_.end());
}

} // namespace resmerge::tree
