#pragma once

#include <resmerge/diag/DiagCode.hpp>
#include <resmerge/res/ResourcePath.hpp>
#include <resmerge/tree/ResourceTree.hpp>

#include <llvm/Support/GlobPattern.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Regex.h>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::merge {

struct KeepPolicy {
    /// POSIX extended regex searched anywhere in `<label>/<path>`; empty keeps everything.
    std::string blacklist_regex{};
    /// Globs over `<label>/<path>` exempted from the blacklist. `*` crosses `/`.
    std::vector<std::string> exception_globs{};
};

/// Decides which files survive the merge. Dotfiles never do. Blacklisted files do only
/// when they are mipmaps, match an exception glob, or share their name with a drawable
/// that survives in some other density.
class KeepFilter {
public:
    static std::optional<KeepFilter> create(const KeepPolicy& policy, diag::Bag& bag);

    /// Adds the surviving drawable names of `tree` to the density closure. Every tree
    /// of the run must be observed before `keep` is asked.
    void observe(const tree::ResourceTree& tree);

    bool naive_keep(std::string_view label, const res::ResourcePath& path) const;
    bool keep(std::string_view label, std::string_view rel) const;

    const std::set<std::string>& kept_drawables() const { return kept_drawables_; }

private:
    KeepFilter() = default;

    std::unique_ptr<llvm::Regex> blacklist_{};
    std::vector<llvm::GlobPattern> exceptions_{};
    std::set<std::string> kept_drawables_{};
};

} // namespace resmerge::merge
