#include <resmerge/merge/LocaleStringFilter.hpp>

#include <resmerge/res/Locale.hpp>
#include <resmerge/res/ResourcePath.hpp>
#include <resmerge/text/Strings.hpp>
#include <resmerge/xml/StringsXml.hpp>

namespace resmerge::merge {

namespace {

bool resolve_one(const std::vector<std::string>& entries,
                 const std::vector<std::string>& extra,
                 std::optional<std::set<std::string>>& out,
                 diag::Bag& bag) {
    if (entries.empty()) return true;
    std::set<std::string> resolved{};
    std::string err{};
    if (!res::resolve_locale_list(entries, resolved, err)) {
        bag.error(diag::Code::kConfigurationContradiction, text::join(entries, ","), err);
        return false;
    }
    resolved.insert(extra.begin(), extra.end());
    out = std::move(resolved);
    return true;
}

} // namespace

bool resolve_locale_policy(const std::vector<std::string>& wanted,
                           const std::vector<std::string>& shared,
                           const std::vector<std::string>& extra,
                           LocalePolicy& out,
                           diag::Bag& bag) {
    const bool a = resolve_one(wanted, extra, out.wanted, bag);
    const bool b = resolve_one(shared, extra, out.shared, bag);
    return a && b;
}

const char* fate_name(LocaleFate fate) {
    switch (fate) {
        case LocaleFate::kKeepAll: return "keep";
        case LocaleFate::kNonSharedOnly: return "non-shared-only";
        case LocaleFate::kSharedOnly: return "shared-only";
        case LocaleFate::kRemove: return "remove";
    }
    return "keep";
}

std::set<std::string> observed_locales(const std::vector<const tree::ResourceTree*>& trees) {
    std::set<std::string> out{};
    for (const auto* t : trees) {
        for (const auto& rel : t->list_files()) {
            if (auto loc = res::string_table_locale(res::classify(rel)); loc.has_value()) out.insert(*loc);
        }
    }
    return out;
}

LocalePartition partition_locales(const std::set<std::string>& observed, const LocalePolicy& policy) {
    LocalePartition out{};
    for (const auto& locale : observed) {
        const bool wanted = !policy.wanted.has_value() || policy.wanted->contains(locale);
        const std::set<std::string>* shared_set = policy.shared.has_value() ? &*policy.shared
                                                : policy.wanted.has_value() ? &*policy.wanted
                                                : nullptr;
        const bool shared = shared_set == nullptr || shared_set->contains(locale);

        if (wanted && shared) out.emplace(locale, LocaleFate::kKeepAll);
        else if (wanted) out.emplace(locale, LocaleFate::kNonSharedOnly);
        else if (shared) out.emplace(locale, LocaleFate::kSharedOnly);
        else out.emplace(locale, LocaleFate::kRemove);
    }
    return out;
}

bool filter_locale_strings(tree::ResourceTree& tree,
                           const LocalePartition& partition,
                           const std::set<std::string>& shared_names,
                           ledger::LedgerDelta& delta,
                           diag::Bag& bag,
                           StringFilterStats* stats) {
    StringFilterStats local{};
    for (const auto& rel : tree.list_files()) {
        const auto locale = res::string_table_locale(res::classify(rel));
        if (!locale) continue;
        const auto it = partition.find(*locale);
        if (it == partition.end() || it->second == LocaleFate::kKeepAll) continue;

        const std::string subject = tree.label() + "/" + rel;
        std::string err{};
        if (it->second == LocaleFate::kRemove) {
            if (!tree.remove(rel, err)) {
                bag.error(diag::Code::kIoFailure, subject, err);
                return false;
            }
            delta.removed(rel);
            ++local.removed_files;
            continue;
        }

        const bool want_shared = it->second == LocaleFate::kSharedOnly;
        std::string doc{};
        if (!tree.read(rel, doc, err)) {
            bag.error(diag::Code::kIoFailure, subject, err);
            return false;
        }
        xml::FilterResult filtered{};
        const auto keep = [&](std::string_view name) {
            return shared_names.contains(std::string(name)) == want_shared;
        };
        if (!xml::filter_strings(doc, keep, filtered, err)) {
            bag.error(diag::Code::kIoFailure, subject, "malformed string table: " + err);
            return false;
        }
        if (filtered.dropped == 0) continue;
        if (!tree.write(rel, filtered.text, err)) {
            bag.error(diag::Code::kIoFailure, subject, err);
            return false;
        }
        ++local.rewritten_files;
        local.dropped_strings += filtered.dropped;
    }
    if (stats != nullptr) *stats = local;
    return true;
}

} // namespace resmerge::merge
