#include <resmerge/res/SymbolTable.hpp>

#include <resmerge/text/Strings.hpp>

#include <fstream>
#include <iterator>

namespace resmerge::res {

std::set<std::string> SymbolTable::names_of_type(std::string_view type) const {
    std::set<std::string> out{};
    for (const auto& s : symbols) {
        if (s.type == type) out.insert(s.name);
    }
    return out;
}

SymbolTable parse_symbol_table(std::string_view text) {
    SymbolTable out{};
    for (const auto& line : text::split_lines(text)) {
        const auto fields = text::split_ws(line);
        if (fields.size() < 3) continue;
        Symbol sym{};
        sym.java_type = fields[0];
        sym.type = fields[1];
        sym.name = fields[2];
        if (fields.size() > 3) {
            sym.value = text::join(std::vector<std::string>(fields.begin() + 3, fields.end()), " ");
        }
        out.symbols.push_back(std::move(sym));
    }
    return out;
}

std::optional<SymbolTable> load_symbol_table(const std::filesystem::path& path, std::string& err) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        err = "cannot open symbol table: " + path.string();
        return std::nullopt;
    }
    const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse_symbol_table(text);
}

} // namespace resmerge::res
