#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace resmerge::res {

/// One `R.txt` line: `<java-type> <resource-type> <name> <value...>`.
struct Symbol {
    std::string java_type{};
    std::string type{};
    std::string name{};
    std::string value{};
};

struct SymbolTable {
    std::vector<Symbol> symbols{};

    std::set<std::string> names_of_type(std::string_view type) const;
};

SymbolTable parse_symbol_table(std::string_view text);
std::optional<SymbolTable> load_symbol_table(const std::filesystem::path& path, std::string& err);

} // namespace resmerge::res
