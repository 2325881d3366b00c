#include <resmerge/merge/KeepFilter.hpp>

#include <llvm/Support/Error.h>

namespace resmerge::merge {

namespace {

std::string subject_of(std::string_view label, std::string_view rel) {
    std::string s(label);
    s.push_back('/');
    s.append(rel);
    return s;
}

bool is_drawable(const res::ResourcePath& path) {
    return path.governed && path.type == "drawable";
}

} // namespace

std::optional<KeepFilter> KeepFilter::create(const KeepPolicy& policy, diag::Bag& bag) {
    KeepFilter out{};
    bool ok = true;

    if (!policy.blacklist_regex.empty()) {
        auto re = std::make_unique<llvm::Regex>(policy.blacklist_regex);
        std::string err{};
        if (!re->isValid(err)) {
            bag.error(diag::Code::kConfigurationContradiction, policy.blacklist_regex,
                      "invalid resource blacklist regex: " + err);
            ok = false;
        } else {
            out.blacklist_ = std::move(re);
        }
    }

    for (const auto& glob : policy.exception_globs) {
        auto pat = llvm::GlobPattern::create(glob);
        if (!pat) {
            bag.error(diag::Code::kConfigurationContradiction, glob,
                      "invalid blacklist exception glob: " + llvm::toString(pat.takeError()));
            ok = false;
            continue;
        }
        out.exceptions_.push_back(std::move(*pat));
    }

    if (!ok) return std::nullopt;
    return out;
}

bool KeepFilter::naive_keep(std::string_view label, const res::ResourcePath& path) const {
    if (res::is_dotfile(path.raw)) return false;
    if (!blacklist_) return true;

    const std::string subject = subject_of(label, path.raw);
    if (!blacklist_->match(subject)) return true;
    if (res::is_mipmap(path)) return true;
    for (const auto& g : exceptions_) {
        if (g.match(subject)) return true;
    }
    return false;
}

void KeepFilter::observe(const tree::ResourceTree& tree) {
    for (const auto& rel : tree.list_files()) {
        const auto path = res::classify(rel);
        if (is_drawable(path) && naive_keep(tree.label(), path)) kept_drawables_.insert(path.name);
    }
}

bool KeepFilter::keep(std::string_view label, std::string_view rel) const {
    if (res::is_dotfile(rel)) return false;
    const auto path = res::classify(rel);
    if (naive_keep(label, path)) return true;
    return is_drawable(path) && kept_drawables_.contains(path.name);
}

} // namespace resmerge::merge
