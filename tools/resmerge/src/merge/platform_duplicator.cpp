#include <resmerge/merge/PlatformDuplicator.hpp>

#include <resmerge/res/Locale.hpp>
#include <resmerge/res/ResourcePath.hpp>

namespace resmerge::merge {

bool check_duplication_policy(const DuplicationRule& rule,
                              const std::vector<std::string>& allow_list,
                              diag::Bag& bag) {
    bool ok = true;
    for (const auto& entry : allow_list) {
        auto q = res::to_android_qualifier(entry);
        if (!q) {
            if (const auto c = res::canonicalize_qualifier(entry); c.has_value()) q = c->qualifier;
        }
        if (q && *q == rule.to_locale) {
            bag.error(diag::Code::kConfigurationContradiction, entry,
                      "locale allow-list already contains " + rule.to_locale +
                          ", which is synthesized from " + rule.from_locale);
            ok = false;
        }
    }
    return ok;
}

bool duplicate_locale(tree::ResourceTree& tree,
                      const DuplicationRule& rule,
                      ledger::LedgerDelta& delta,
                      diag::Bag& bag) {
    for (const auto& rel : tree.list_files()) {
        const auto path = res::classify(rel);
        const auto target = res::with_locale_replaced(path, rule.from_locale, rule.to_locale);
        if (!target) continue;

        const std::string dst = target->str();
        if (tree.exists(dst)) {
            bag.note(tree.label() + "/" + dst, "already shipped, not duplicated from " + rel);
            continue;
        }
        std::string err{};
        if (!tree.copy(rel, dst, err)) {
            bag.error(diag::Code::kIoFailure, tree.label() + "/" + rel, err);
            return false;
        }
        delta.copied(rel, dst);
    }
    return true;
}

} // namespace resmerge::merge
