#include <resmerge/zip/Zip.hpp>

#include <resmerge/os/File.hpp>

#include <zlib.h>

#include <algorithm>

namespace resmerge::zip {

namespace {

constexpr uint32_t kLFHSignature = 0x04034b50;
constexpr uint32_t kCDESignature = 0x02014b50;
constexpr uint32_t kEOCDSignature = 0x06054b50;
constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kDataDescriptorFlag = 0x0008;

// 1980-01-01 00:00:00, the DOS epoch.
constexpr uint16_t kFixedTime = 0;
constexpr uint16_t kFixedDate = (1 << 5) | 1;

void put2le(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put4le(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
    out.push_back(static_cast<char>((v >> 16) & 0xff));
    out.push_back(static_cast<char>((v >> 24) & 0xff));
}

bool deflate_raw(std::string_view in, std::string& out, std::string& err) {
    z_stream zs{};
    zs.zalloc = Z_NULL;
    zs.zfree = Z_NULL;
    zs.opaque = Z_NULL;
    int zerr = deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (zerr != Z_OK) {
        err = "deflateInit2 failed (" + std::to_string(zerr) + ")";
        return false;
    }
    out.assign(deflateBound(&zs, static_cast<uLong>(in.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    zerr = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);
    if (zerr != Z_STREAM_END) {
        err = "deflate failed (" + std::to_string(zerr) + ")";
        return false;
    }
    out.resize(produced);
    return true;
}

} // namespace

bool ZipWriter::add(std::string name, std::string_view data, Method method, std::string& err) {
    Item item{};
    item.entry.name = std::move(name);
    item.entry.method = static_cast<uint16_t>(method);
    item.entry.mod_time = kFixedTime;
    item.entry.mod_date = kFixedDate;
    item.entry.crc32 = static_cast<uint32_t>(
        crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
    item.entry.uncompressed_size = static_cast<uint32_t>(data.size());

    if (method == Method::kDeflated) {
        if (!deflate_raw(data, item.payload, err)) {
            err = item.entry.name + ": " + err;
            return false;
        }
    } else {
        item.payload.assign(data.data(), data.size());
    }
    item.entry.compressed_size = static_cast<uint32_t>(item.payload.size());
    items_.push_back(std::move(item));
    return true;
}

void ZipWriter::add_raw(const Entry& e, std::string_view payload) {
    Item item{};
    item.entry = e;
    // Sizes and CRC go in the local header, so no trailing descriptor is written.
    item.entry.flags = static_cast<uint16_t>(e.flags & ~kDataDescriptorFlag);
    item.entry.compressed_size = static_cast<uint32_t>(payload.size());
    item.payload.assign(payload.data(), payload.size());
    items_.push_back(std::move(item));
}

std::string ZipWriter::finish() const {
    std::string out{};
    std::vector<uint32_t> offsets{};
    offsets.reserve(items_.size());

    for (const auto& item : items_) {
        const Entry& e = item.entry;
        offsets.push_back(static_cast<uint32_t>(out.size()));
        put4le(out, kLFHSignature);
        put2le(out, kVersionNeeded);
        put2le(out, e.flags);
        put2le(out, e.method);
        put2le(out, e.mod_time);
        put2le(out, e.mod_date);
        put4le(out, e.crc32);
        put4le(out, e.compressed_size);
        put4le(out, e.uncompressed_size);
        put2le(out, static_cast<uint16_t>(e.name.size()));
        put2le(out, 0);
        out += e.name;
        out += item.payload;
    }

    const uint32_t dir_offset = static_cast<uint32_t>(out.size());
    for (size_t i = 0; i < items_.size(); ++i) {
        const Entry& e = items_[i].entry;
        put4le(out, kCDESignature);
        put2le(out, kVersionNeeded);
        put2le(out, kVersionNeeded);
        put2le(out, e.flags);
        put2le(out, e.method);
        put2le(out, e.mod_time);
        put2le(out, e.mod_date);
        put4le(out, e.crc32);
        put4le(out, e.compressed_size);
        put4le(out, e.uncompressed_size);
        put2le(out, static_cast<uint16_t>(e.name.size()));
        put2le(out, 0);
        put2le(out, 0);
        put2le(out, 0);
        put2le(out, 0);
        put4le(out, 0);
        put4le(out, offsets[i]);
        out += e.name;
    }
    const uint32_t dir_size = static_cast<uint32_t>(out.size()) - dir_offset;

    put4le(out, kEOCDSignature);
    put2le(out, 0);
    put2le(out, 0);
    put2le(out, static_cast<uint16_t>(items_.size()));
    put2le(out, static_cast<uint16_t>(items_.size()));
    put4le(out, dir_size);
    put4le(out, dir_offset);
    put2le(out, 0);
    return out;
}

bool ZipWriter::write(const std::filesystem::path& path, std::string& err) const {
    if (items_.size() >= 0xffff) {
        err = "too many entries for a non-zip64 archive: " + path.string();
        return false;
    }
    return os::write_file_atomic(path, finish(), err);
}

bool sort_zip(const std::filesystem::path& in, const std::filesystem::path& out, std::string& err) {
    ZipReader reader{};
    if (!reader.open(in, err)) return false;

    std::vector<const Entry*> order{};
    order.reserve(reader.entries().size());
    for (const auto& e : reader.entries()) order.push_back(&e);
    std::stable_sort(order.begin(), order.end(),
                     [](const Entry* a, const Entry* b) { return a->name < b->name; });

    ZipWriter writer{};
    for (const Entry* e : order) {
        std::string_view payload{};
        if (!reader.raw(*e, payload, err)) return false;
        writer.add_raw(*e, payload);
    }
    return writer.write(out, err);
}

bool extract_all(const std::filesystem::path& archive,
                 const std::filesystem::path& dest,
                 std::vector<std::string>* names,
                 std::string& err) {
    ZipReader reader{};
    if (!reader.open(archive, err)) return false;

    for (const auto& e : reader.entries()) {
        if (e.is_directory()) continue;

        const std::filesystem::path rel = std::filesystem::path(e.name).lexically_normal();
        if (rel.is_absolute() || rel.empty() || *rel.begin() == "..") {
            err = archive.string() + ": entry escapes extraction root: " + e.name;
            return false;
        }

        std::string data{};
        if (!reader.read(e, data, err)) {
            err = archive.string() + ": " + err;
            return false;
        }
        if (!os::write_file_atomic(dest / rel, data, err)) return false;
        if (names != nullptr) names->push_back(rel.generic_string());
    }
    return true;
}

} // namespace resmerge::zip
