#include <resmerge/ledger/LedgerWriter.hpp>

#include <resmerge/os/File.hpp>
#include <resmerge/text/Strings.hpp>

namespace resmerge::ledger {

std::filesystem::path upstream_ledger_path(const std::filesystem::path& archive) {
    return archive.string() + ".info";
}

bool LedgerWriter::claim(std::string_view new_path, std::string_view original, std::string_view source,
                         diag::Bag& bag) {
    const auto it = claims_.find(new_path);
    if (it == claims_.end()) {
        claims_.emplace(std::string(new_path), Claim{std::string(original), std::string(source)});
        lines_.insert(format_rename_line(new_path, original));
        return true;
    }
    if (it->second.original == original) return true;
    bag.error(diag::Code::kInvariantViolation, std::string(new_path),
              "mapped to " + it->second.original + " by " + it->second.source + " and to " + std::string(original) +
                  " by " + std::string(source));
    return false;
}

bool LedgerWriter::add(const RenameLedger& ledger, std::string_view source, diag::Bag& bag) {
    if (!check_open(bag, source)) return false;
    bool ok = true;
    for (const auto& e : ledger.entries()) ok = claim(e.new_path, e.original_path, source, bag) && ok;
    return ok;
}

bool LedgerWriter::add_lines(const std::vector<std::string>& lines, std::string_view source, diag::Bag& bag) {
    static constexpr std::string_view kRename = "Rename:";
    if (!check_open(bag, source)) return false;
    bool ok = true;
    for (const auto& raw : lines) {
        const std::string line = text::trim(raw);
        if (line.empty()) continue;
        if (line.compare(0, kRename.size(), kRename) != 0) {
            lines_.insert(line);
            continue;
        }
        const std::string_view body = std::string_view(line).substr(kRename.size());
        const size_t comma = body.find(',');
        if (comma == std::string_view::npos || comma == 0 || comma + 1 == body.size()) {
            bag.error(diag::Code::kInvariantViolation, std::string(source), "malformed ledger line: " + line);
            ok = false;
            continue;
        }
        ok = claim(body.substr(0, comma), body.substr(comma + 1), source, bag) && ok;
    }
    return ok;
}

bool LedgerWriter::add_upstream(const std::filesystem::path& archive, diag::Bag& bag) {
    if (!check_open(bag, archive.string())) return false;
    const auto info = upstream_ledger_path(archive);
    std::error_code ec{};
    if (!std::filesystem::exists(info, ec)) return true;

    const auto r = os::read_file(info);
    if (!r.ok) {
        bag.error(diag::Code::kIoFailure, info.string(), r.err);
        return false;
    }
    return add_lines(text::split_lines(r.data), info.string(), bag);
}

std::vector<std::string> LedgerWriter::lines() const {
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

std::string LedgerWriter::render() const {
    std::string out{};
    for (const auto& line : lines_) {
        out += line;
        out.push_back('\n');
    }
    return out;
}

bool LedgerWriter::check_open(diag::Bag& bag, std::string_view subject) {
    if (!sealed_) return true;
    bag.error(diag::Code::kInvariantViolation, std::string(subject), "rename ledger already written");
    return false;
}

bool LedgerWriter::write(const std::filesystem::path& path, diag::Bag& bag) {
    if (!check_open(bag, path.string())) return false;
    std::string err{};
    if (!os::write_file_atomic(path, render(), err)) {
        bag.error(diag::Code::kIoFailure, path.string(), err);
        return false;
    }
    sealed_ = true;
    return true;
}

} // namespace resmerge::ledger
