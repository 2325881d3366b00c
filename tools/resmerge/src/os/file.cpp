#include <resmerge/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace resmerge::os {

ReadResult read_file(const std::filesystem::path& path) {
    ReadResult r{};

    std::FILE* fp = std::fopen(path.c_str(), "rb");
    if (!fp) {
        r.err = "cannot open " + path.string() + ": " + std::strerror(errno);
        return r;
    }

    std::fseek(fp, 0, SEEK_END);
    const long sz = std::ftell(fp);
    std::fseek(fp, 0, SEEK_SET);
    if (sz < 0) {
        std::fclose(fp);
        r.err = "cannot read size of " + path.string();
        return r;
    }

    r.data.resize(static_cast<std::size_t>(sz));
    const std::size_t n = std::fread(r.data.data(), 1, r.data.size(), fp);
    std::fclose(fp);

    if (n != r.data.size()) {
        r.data.clear();
        r.err = "short read from " + path.string();
        return r;
    }
    r.ok = true;
    return r;
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& err) {
    std::error_code ec{};
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            err = "cannot create " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    const std::filesystem::path tmp = path.string() + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            err = "cannot open " + tmp.string() + " for writing";
            return false;
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!ofs.good()) {
            err = "short write to " + tmp.string();
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        err = "cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message();
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

bool write_if_changed(const std::filesystem::path& path, std::string_view data, bool& changed, std::string& err) {
    changed = false;
    std::error_code ec{};
    if (std::filesystem::is_regular_file(path, ec)) {
        const auto existing = read_file(path);
        if (existing.ok && existing.data == data) return true;
    }
    if (!write_file_atomic(path, data, err)) return false;
    changed = true;
    return true;
}

} // namespace resmerge::os
