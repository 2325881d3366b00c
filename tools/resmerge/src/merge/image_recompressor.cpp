#include <resmerge/merge/ImageRecompressor.hpp>

#include <resmerge/log/Reporter.hpp>
#include <resmerge/proc/Process.hpp>
#include <resmerge/res/ResourcePath.hpp>
#include <resmerge/text/Strings.hpp>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>

#include <array>

namespace resmerge::merge {

namespace {

struct WorkItem {
    size_t target = 0;
    std::string png{};
    std::string webp{};
};

const std::array<llvm::Regex, 3>& exclusion_patterns() {
    static const std::array<llvm::Regex, 3> k{
        llvm::Regex("star_gray\\.png$"),
        llvm::Regex("\\.9\\.png$"),
        llvm::Regex("daydream_icon_.*\\.png$"),
    };
    return k;
}

} // namespace

CwebpEncoder::CwebpEncoder(std::string binary, log::Reporter* reporter)
    : binary_(std::move(binary)), reporter_(reporter) {}

std::vector<std::string> CwebpEncoder::command(std::string_view binary, std::string_view png, std::string_view webp) {
    return {std::string(binary), std::string(png), "-mt", "-quiet", "-m", "6", "-q", "100",
            "-lossless", "-o", std::string(webp)};
}

bool CwebpEncoder::convert(tree::ResourceTree& tree, std::string_view src, std::string_view dst, std::string& err) {
    const auto in = tree.host_path(src);
    const auto out = tree.host_path(dst);
    if (!in || !out) {
        err = "tree '" + tree.label() + "' has no files on disk for cwebp";
        return false;
    }
    const auto argv = command(binary_, in->string(), out->string());
    if (reporter_ != nullptr) reporter_->command(argv);

    proc::Captured cap{};
    if (!proc::run_argv_capture(argv, cap, err)) return false;
    if (cap.exit_code != 0) {
        err = "cwebp exited with " + std::to_string(cap.exit_code);
        const std::string detail = text::trim(cap.err);
        if (!detail.empty()) err += ": " + detail;
        return false;
    }
    return true;
}

bool is_recompression_excluded(std::string_view rel) {
    for (const auto& re : exclusion_patterns()) {
        if (re.match(rel)) return true;
    }
    return false;
}

bool recompress_images(const std::vector<RecompressTarget>& targets,
                       ImageEncoder& encoder,
                       const exec::WorkerPool& pool,
                       diag::Bag& bag) {
    std::vector<WorkItem> items{};
    bool collision = false;
    for (size_t t = 0; t < targets.size(); ++t) {
        auto& tree = *targets[t].tree;
        for (const auto& rel : tree.list_files()) {
            const auto path = res::classify(rel);
            if (!path.governed || path.extension != ".png" || is_recompression_excluded(rel)) continue;
            std::string webp = res::with_extension(path, ".webp").str();
            if (tree.exists(webp)) {
                bag.error(diag::Code::kInvariantViolation, tree.label() + "/" + webp,
                          "cannot convert " + rel + ": destination already exists");
                collision = true;
                continue;
            }
            items.push_back(WorkItem{t, rel, std::move(webp)});
        }
    }
    if (collision) return false;

    std::vector<exec::TaskFailure> failures{};
    const bool ok = pool.run(items.size(), [&](size_t i, std::string& err) {
        const auto& item = items[i];
        return encoder.convert(*targets[item.target].tree, item.png, item.webp, err);
    }, failures);

    if (!ok) {
        for (const auto& f : failures) {
            const auto& item = items[f.index];
            bag.error(diag::Code::kExternalToolFailure,
                      targets[item.target].tree->label() + "/" + item.png, f.message);
        }
        return false;
    }

    // Single-threaded from here on: ledger order follows the sorted file listing.
    for (const auto& item : items) {
        auto& target = targets[item.target];
        std::string err{};
        if (!target.tree->remove(item.png, err)) {
            bag.error(diag::Code::kIoFailure, target.tree->label() + "/" + item.png, err);
            return false;
        }
        target.delta->moved(item.png, item.webp);
    }
    return true;
}

} // namespace resmerge::merge
