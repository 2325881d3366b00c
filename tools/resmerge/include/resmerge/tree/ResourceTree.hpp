#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::tree {

/// A resource root seen as a set of `/`-separated relative file paths.
/// Paths are always relative; directories exist only implicitly.
class ResourceTree {
public:
    virtual ~ResourceTree() = default;

    /// Stable name of the tree; prefixes paths when matching filter patterns.
    virtual const std::string& label() const = 0;

    /// Sorted list of every file in the tree.
    virtual std::vector<std::string> list_files() const = 0;
    virtual bool exists(std::string_view rel) const = 0;

    virtual bool read(std::string_view rel, std::string& out, std::string& err) const = 0;
    virtual bool write(std::string_view rel, std::string_view data, std::string& err) = 0;
    virtual bool copy(std::string_view from, std::string_view to, std::string& err) = 0;
    virtual bool move(std::string_view from, std::string_view to, std::string& err) = 0;
    virtual bool remove(std::string_view rel, std::string& err) = 0;

    /// Host filesystem location of `rel`, for tools that need a real file.
    virtual std::optional<std::filesystem::path> host_path(std::string_view rel) const = 0;
};

class MemoryTree final : public ResourceTree {
public:
    explicit MemoryTree(std::string label);
    MemoryTree(std::string label, std::map<std::string, std::string> files);

    const std::string& label() const override { return label_; }
    std::vector<std::string> list_files() const override;
    bool exists(std::string_view rel) const override;
    bool read(std::string_view rel, std::string& out, std::string& err) const override;
    bool write(std::string_view rel, std::string_view data, std::string& err) override;
    bool copy(std::string_view from, std::string_view to, std::string& err) override;
    bool move(std::string_view from, std::string_view to, std::string& err) override;
    bool remove(std::string_view rel, std::string& err) override;
    std::optional<std::filesystem::path> host_path(std::string_view) const override { return std::nullopt; }

    std::map<std::string, std::string> snapshot() const;

private:
    std::string label_{};
    mutable std::mutex mu_{};
    std::map<std::string, std::string, std::less<>> files_{};
};

class DiskTree final : public ResourceTree {
public:
    DiskTree(std::string label, std::filesystem::path root);

    const std::string& label() const override { return label_; }
    const std::filesystem::path& root() const { return root_; }

    std::vector<std::string> list_files() const override;
    bool exists(std::string_view rel) const override;
    bool read(std::string_view rel, std::string& out, std::string& err) const override;
    bool write(std::string_view rel, std::string_view data, std::string& err) override;
    bool copy(std::string_view from, std::string_view to, std::string& err) override;
    bool move(std::string_view from, std::string_view to, std::string& err) override;
    bool remove(std::string_view rel, std::string& err) override;
    std::optional<std::filesystem::path> host_path(std::string_view rel) const override;

private:
    std::filesystem::path resolve(std::string_view rel) const;

    std::string label_{};
    std::filesystem::path root_{};
};

} // namespace resmerge::tree
