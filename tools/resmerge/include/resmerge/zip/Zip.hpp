#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::zip {

enum class Method : uint16_t {
    kStored = 0,
    kDeflated = 8,
};

struct Entry {
    std::string name{};
    uint16_t method = 0;
    uint16_t flags = 0;
    uint16_t mod_time = 0;
    uint16_t mod_date = 0;
    uint32_t crc32 = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_offset = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/// Read-only view of a zip archive held in memory. Zip64 archives are rejected.
class ZipReader {
public:
    bool open(const std::filesystem::path& path, std::string& err);
    bool open_bytes(std::string data, std::string& err);

    const std::vector<Entry>& entries() const { return entries_; }

    /// Uncompressed contents of `e`, CRC-checked.
    bool read(const Entry& e, std::string& out, std::string& err) const;
    /// Compressed payload of `e` exactly as stored in the archive.
    bool raw(const Entry& e, std::string_view& out, std::string& err) const;

private:
    bool parse_central_directory(std::string& err);

    std::string data_{};
    std::vector<Entry> entries_{};
};

/// Builds a deterministic archive: entries keep insertion order and carry a fixed
/// timestamp unless copied raw from another archive.
class ZipWriter {
public:
    bool add(std::string name, std::string_view data, Method method, std::string& err);
    void add_raw(const Entry& e, std::string_view payload);

    std::string finish() const;
    bool write(const std::filesystem::path& path, std::string& err) const;

    size_t size() const { return items_.size(); }

private:
    struct Item {
        Entry entry{};
        std::string payload{};
    };
    std::vector<Item> items_{};
};

/// Extracts every file entry below `dest`. Names escaping `dest` are rejected.
bool extract_all(const std::filesystem::path& archive,
                 const std::filesystem::path& dest,
                 std::vector<std::string>* names,
                 std::string& err);

/// Rewrites `in` to `out` with entries ordered by name.
bool sort_zip(const std::filesystem::path& in, const std::filesystem::path& out, std::string& err);

/// Lists file entries (directories omitted) of an archive on disk.
bool list_names(const std::filesystem::path& archive, std::vector<std::string>& out, std::string& err);

} // namespace resmerge::zip
