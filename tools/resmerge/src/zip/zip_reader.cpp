#include <resmerge/zip/Zip.hpp>

#include <resmerge/os/File.hpp>

#include <zlib.h>

#include <algorithm>

namespace resmerge::zip {

namespace {

constexpr uint32_t kEOCDSignature = 0x06054b50;
constexpr size_t kEOCDLen = 22;
constexpr size_t kEOCDNumEntries = 10;
constexpr size_t kEOCDSize = 12;
constexpr size_t kEOCDFileOffset = 16;
constexpr size_t kMaxCommentLen = 65535;

constexpr uint32_t kLFHSignature = 0x04034b50;
constexpr size_t kLFHLen = 30;
constexpr size_t kLFHNameLen = 26;
constexpr size_t kLFHExtraLen = 28;

constexpr uint32_t kCDESignature = 0x02014b50;
constexpr size_t kCDELen = 46;
constexpr size_t kCDEFlags = 8;
constexpr size_t kCDEMethod = 10;
constexpr size_t kCDEModTime = 12;
constexpr size_t kCDEModDate = 14;
constexpr size_t kCDECRC = 16;
constexpr size_t kCDECompLen = 20;
constexpr size_t kCDEUncompLen = 24;
constexpr size_t kCDENameLen = 28;
constexpr size_t kCDEExtraLen = 30;
constexpr size_t kCDECommentLen = 32;
constexpr size_t kCDELocalOffset = 42;

uint16_t get2le(const std::string& d, size_t at) {
    return static_cast<uint16_t>(static_cast<unsigned char>(d[at]) |
                                 (static_cast<unsigned char>(d[at + 1]) << 8));
}

uint32_t get4le(const std::string& d, size_t at) {
    return static_cast<uint32_t>(static_cast<unsigned char>(d[at])) |
           (static_cast<uint32_t>(static_cast<unsigned char>(d[at + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<unsigned char>(d[at + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<unsigned char>(d[at + 3])) << 24);
}

bool inflate_raw(std::string_view in, size_t uncompressed_size, std::string& out, std::string& err) {
    out.assign(uncompressed_size, '\0');

    z_stream zs{};
    zs.zalloc = Z_NULL;
    zs.zfree = Z_NULL;
    zs.opaque = Z_NULL;
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    zs.data_type = Z_UNKNOWN;

    // Negative window bits: raw deflate data without a zlib header.
    int zerr = inflateInit2(&zs, -MAX_WBITS);
    if (zerr != Z_OK) {
        err = "inflateInit2 failed (" + std::to_string(zerr) + ")";
        return false;
    }
    zerr = inflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    inflateEnd(&zs);

    if (zerr != Z_STREAM_END) {
        err = "inflate failed (" + std::to_string(zerr) + ")";
        return false;
    }
    if (produced != uncompressed_size) {
        err = "size mismatch on inflate";
        return false;
    }
    return true;
}

} // namespace

bool ZipReader::open(const std::filesystem::path& path, std::string& err) {
    auto r = os::read_file(path);
    if (!r.ok) {
        err = r.err;
        return false;
    }
    if (!open_bytes(std::move(r.data), err)) {
        err = path.string() + ": " + err;
        return false;
    }
    return true;
}

bool ZipReader::open_bytes(std::string data, std::string& err) {
    data_ = std::move(data);
    entries_.clear();
    return parse_central_directory(err);
}

bool ZipReader::parse_central_directory(std::string& err) {
    if (data_.size() < kEOCDLen) {
        err = "too small to be a zip archive";
        return false;
    }

    // Scan backwards for the end-of-central-directory record; a trailing comment may follow it.
    const size_t search = std::min(data_.size(), kMaxCommentLen + kEOCDLen);
    const size_t floor = data_.size() - search;
    size_t eocd = std::string::npos;
    for (size_t i = data_.size() - kEOCDLen + 1; i-- > floor;) {
        if (data_[i] == 0x50 && get4le(data_, i) == kEOCDSignature) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        err = "end of central directory not found";
        return false;
    }

    const uint16_t num_entries = get2le(data_, eocd + kEOCDNumEntries);
    const uint32_t dir_size = get4le(data_, eocd + kEOCDSize);
    const uint32_t dir_offset = get4le(data_, eocd + kEOCDFileOffset);
    if (num_entries == 0xffff || dir_offset == 0xffffffffu) {
        err = "zip64 archives are not supported";
        return false;
    }
    if (static_cast<size_t>(dir_offset) + dir_size > eocd) {
        err = "bad central directory offset";
        return false;
    }

    size_t p = dir_offset;
    entries_.reserve(num_entries);
    for (uint16_t i = 0; i < num_entries; ++i) {
        if (p + kCDELen > eocd || get4le(data_, p) != kCDESignature) {
            err = "bad central directory entry " + std::to_string(i);
            return false;
        }
        Entry e{};
        e.flags = get2le(data_, p + kCDEFlags);
        e.method = get2le(data_, p + kCDEMethod);
        e.mod_time = get2le(data_, p + kCDEModTime);
        e.mod_date = get2le(data_, p + kCDEModDate);
        e.crc32 = get4le(data_, p + kCDECRC);
        e.compressed_size = get4le(data_, p + kCDECompLen);
        e.uncompressed_size = get4le(data_, p + kCDEUncompLen);
        e.local_offset = get4le(data_, p + kCDELocalOffset);
        const uint16_t name_len = get2le(data_, p + kCDENameLen);
        const uint16_t extra_len = get2le(data_, p + kCDEExtraLen);
        const uint16_t comment_len = get2le(data_, p + kCDECommentLen);
        if (p + kCDELen + name_len > eocd) {
            err = "truncated central directory entry " + std::to_string(i);
            return false;
        }
        e.name = data_.substr(p + kCDELen, name_len);
        if (e.compressed_size == 0xffffffffu || e.uncompressed_size == 0xffffffffu ||
            e.local_offset == 0xffffffffu) {
            err = "zip64 entry not supported: " + e.name;
            return false;
        }
        entries_.push_back(std::move(e));
        p += kCDELen + name_len + extra_len + comment_len;
    }
    return true;
}

bool ZipReader::raw(const Entry& e, std::string_view& out, std::string& err) const {
    const size_t lfh = e.local_offset;
    if (lfh + kLFHLen > data_.size() || get4le(data_, lfh) != kLFHSignature) {
        err = "bad local header for " + e.name;
        return false;
    }
    const size_t start = lfh + kLFHLen + get2le(data_, lfh + kLFHNameLen) + get2le(data_, lfh + kLFHExtraLen);
    if (start + e.compressed_size > data_.size()) {
        err = "truncated data for " + e.name;
        return false;
    }
    out = std::string_view(data_).substr(start, e.compressed_size);
    return true;
}

bool ZipReader::read(const Entry& e, std::string& out, std::string& err) const {
    std::string_view payload{};
    if (!raw(e, payload, err)) return false;

    if (e.method == static_cast<uint16_t>(Method::kStored)) {
        if (e.compressed_size != e.uncompressed_size) {
            err = "stored entry size mismatch: " + e.name;
            return false;
        }
        out.assign(payload.data(), payload.size());
    } else if (e.method == static_cast<uint16_t>(Method::kDeflated)) {
        if (!inflate_raw(payload, e.uncompressed_size, out, err)) {
            err = e.name + ": " + err;
            return false;
        }
    } else {
        err = "unsupported compression method " + std::to_string(e.method) + " for " + e.name;
        return false;
    }

    const uLong crc = crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(out.data()),
                            static_cast<uInt>(out.size()));
    if (static_cast<uint32_t>(crc) != e.crc32) {
        err = "CRC mismatch for " + e.name;
        return false;
    }
    return true;
}

bool list_names(const std::filesystem::path& archive, std::vector<std::string>& out, std::string& err) {
    ZipReader reader{};
    if (!reader.open(archive, err)) return false;
    out.clear();
    for (const auto& e : reader.entries()) {
        if (!e.is_directory()) out.push_back(e.name);
    }
    return true;
}

} // namespace resmerge::zip
