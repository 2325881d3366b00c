#include <resmerge/merge/LocaleNormalizer.hpp>

#include <resmerge/res/Locale.hpp>
#include <resmerge/res/ResourcePath.hpp>

namespace resmerge::merge {

bool normalize_locales(tree::ResourceTree& tree,
                       ledger::LedgerDelta& delta,
                       diag::Bag& bag,
                       NormalizeStats* stats) {
    NormalizeStats local{};
    for (const auto& rel : tree.list_files()) {
        const auto path = res::classify(rel);
        const auto locale = res::string_table_locale(path);
        if (!locale) continue;

        const auto canonical = res::canonicalize_qualifier(*locale);
        if (!canonical) {
            ++local.untranslatable;
            bag.warning(diag::Code::kPolicyMismatch, tree.label() + "/" + rel,
                        "locale qualifier '" + *locale + "' has no canonical form, left as is");
            continue;
        }
        if (canonical->qualifier == *locale) continue;

        const std::string dst = res::with_qualifier_suffix(path, canonical->qualifier).str();
        if (dst == rel) {
            bag.error(diag::Code::kConfigurationContradiction, tree.label() + "/" + rel,
                      "cannot substitute locale " + *locale + " with " + canonical->qualifier);
            return false;
        }
        if (tree.exists(dst)) {
            ++local.skipped;
            bag.note(tree.label() + "/" + rel, dst + " already present, not renamed");
            continue;
        }

        std::string err{};
        if (!tree.move(rel, dst, err)) {
            bag.error(diag::Code::kIoFailure, tree.label() + "/" + rel, err);
            return false;
        }
        delta.moved(rel, dst);
        ++local.renamed;
        bag.note(tree.label() + "/" + rel,
                 std::string("renamed to ") + dst + " (" + res::rule_name(canonical->rule) + ")");
    }
    if (stats != nullptr) *stats = local;
    return true;
}

} // namespace resmerge::merge
