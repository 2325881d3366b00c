#include <resmerge/xml/Manifest.hpp>

#include <resmerge/text/Strings.hpp>

#include <expat.h>

#include <algorithm>
#include <cstdint>
#include <cstring>

namespace resmerge::xml {

namespace {

struct PackageState {
    XML_Parser parser = nullptr;
    bool seen_root = false;
    bool is_manifest = false;
    std::string package{};
};

void root_start(void* user_data, const char* name, const char** atts) {
    auto* st = static_cast<PackageState*>(user_data);
    if (st->seen_root) return;
    st->seen_root = true;
    st->is_manifest = std::strcmp(name, "manifest") == 0;
    for (size_t i = 0; atts[i] != nullptr; i += 2) {
        if (std::strcmp(atts[i], "package") == 0) {
            st->package = atts[i + 1];
            break;
        }
    }
    ::XML_StopParser(st->parser, XML_FALSE);
}

std::string rstrip(std::string_view s) {
    size_t n = s.size();
    while (n > 0 && (s[n - 1] == ' ' || s[n - 1] == '\t' || s[n - 1] == '\r')) --n;
    return std::string(s.substr(0, n));
}

} // namespace

bool read_manifest_package(std::string_view doc, std::string& out, std::string& err) {
    out.clear();
    XML_Parser parser = ::XML_ParserCreate(nullptr);
    if (parser == nullptr) {
        err = "failed to create XML parser";
        return false;
    }
    PackageState st{};
    st.parser = parser;
    ::XML_SetUserData(parser, &st);
    ::XML_SetStartElementHandler(parser, root_start);

    const XML_Status status = ::XML_Parse(parser, doc.data(), static_cast<int>(doc.size()), 1);
    // Stopping after the root tag is reported as XML_STATUS_ERROR with XML_ERROR_ABORTED.
    if (status != XML_STATUS_OK && ::XML_GetErrorCode(parser) != XML_ERROR_ABORTED) {
        err = std::string(::XML_ErrorString(::XML_GetErrorCode(parser))) + " at line " +
              std::to_string(::XML_GetCurrentLineNumber(parser));
        ::XML_ParserFree(parser);
        return false;
    }
    ::XML_ParserFree(parser);

    if (!st.is_manifest) {
        err = "root element is not <manifest>";
        return false;
    }
    out = std::move(st.package);
    return true;
}

std::string normalize_manifest_text(std::string_view doc) {
    std::vector<std::string> lines{};
    for (const auto& line : text::split_lines(doc)) lines.push_back(rstrip(line));
    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    std::string out{};
    for (const auto& line : lines) {
        out += line;
        out.push_back('\n');
    }
    return out;
}

std::vector<std::string> diff_lines(std::string_view expected, std::string_view actual) {
    const auto a = text::split_lines(expected);
    const auto b = text::split_lines(actual);
    const size_t n = a.size();
    const size_t m = b.size();

    // Longest common subsequence table, suffix form.
    std::vector<std::vector<uint32_t>> lcs(n + 1, std::vector<uint32_t>(m + 1, 0));
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            lcs[i][j] = (a[i] == b[j]) ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    std::vector<std::string> out{};
    size_t i = 0;
    size_t j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && a[i] == b[j]) {
            ++i;
            ++j;
        } else if (j < m && (i == n || lcs[i][j + 1] >= lcs[i + 1][j])) {
            out.push_back("+" + b[j++]);
        } else {
            out.push_back("-" + a[i++]);
        }
    }
    return out;
}

} // namespace resmerge::xml
