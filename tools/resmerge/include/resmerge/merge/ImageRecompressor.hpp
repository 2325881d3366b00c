#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/exec/WorkerPool.hpp>
#include <resmerge/ledger/RenameLedger.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace resmerge::log {
class Reporter;
}

namespace resmerge::merge {

/// Writes a lossless re-encoding of `src` to `dst` within `tree`. Called from worker
/// threads, one file per call; must not touch other paths.
class ImageEncoder {
public:
    virtual ~ImageEncoder() = default;
    virtual bool convert(tree::ResourceTree& tree, std::string_view src, std::string_view dst, std::string& err) = 0;
};

/// `cwebp <png> -mt -quiet -m 6 -q 100 -lossless -o <webp>` on trees backed by disk.
class CwebpEncoder final : public ImageEncoder {
public:
    explicit CwebpEncoder(std::string binary, log::Reporter* reporter = nullptr);

    bool convert(tree::ResourceTree& tree, std::string_view src, std::string_view dst, std::string& err) override;

    static std::vector<std::string> command(std::string_view binary, std::string_view png, std::string_view webp);

private:
    std::string binary_{};
    log::Reporter* reporter_ = nullptr;
};

/// Nine-patches and assets that break on some legacy decoders stay PNG.
bool is_recompression_excluded(std::string_view rel);

struct RecompressTarget {
    tree::ResourceTree* tree = nullptr;
    ledger::LedgerDelta* delta = nullptr;
};

/// Converts every governed `.png` of every target to `.webp` and removes the PNG. The
/// whole stage fails when any single conversion fails; nothing is removed then.
bool recompress_images(const std::vector<RecompressTarget>& targets,
                       ImageEncoder& encoder,
                       const exec::WorkerPool& pool,
                       diag::Bag& bag);

} // namespace resmerge::merge
