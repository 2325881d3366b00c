#include <resmerge/xml/StringsXml.hpp>

#include <expat.h>

#include <cstring>

namespace resmerge::xml {

namespace {

struct ScanState {
    XML_Parser parser = nullptr;
    int depth = 0;
    bool in_string = false;
    StringElement current{};
    std::vector<StringElement>* out = nullptr;
};

void start_element(void* user_data, const char* name, const char** atts) {
    auto* st = static_cast<ScanState*>(user_data);
    if (st->depth == 1 && std::strcmp(name, "string") == 0) {
        st->in_string = true;
        st->current = StringElement{};
        st->current.begin = static_cast<size_t>(XML_GetCurrentByteIndex(st->parser));
        for (size_t i = 0; atts[i] != nullptr; i += 2) {
            if (std::strcmp(atts[i], "name") == 0) {
                st->current.name = atts[i + 1];
                break;
            }
        }
    }
    ++st->depth;
}

void end_element(void* user_data, const char* name) {
    auto* st = static_cast<ScanState*>(user_data);
    --st->depth;
    if (st->depth == 1 && st->in_string && std::strcmp(name, "string") == 0) {
        // For `<string/>` expat reports the end event as an empty span after the tag.
        st->current.end = static_cast<size_t>(XML_GetCurrentByteIndex(st->parser)) +
                          static_cast<size_t>(XML_GetCurrentByteCount(st->parser));
        st->out->push_back(std::move(st->current));
        st->in_string = false;
    }
}

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

} // namespace

bool scan_string_elements(std::string_view doc, std::vector<StringElement>& out, std::string& err) {
    out.clear();
    XML_Parser parser = ::XML_ParserCreate(nullptr);
    if (parser == nullptr) {
        err = "failed to create XML parser";
        return false;
    }

    ScanState st{};
    st.parser = parser;
    st.out = &out;
    ::XML_SetUserData(parser, &st);
    ::XML_SetElementHandler(parser, start_element, end_element);

    // One call over the whole document keeps byte indices relative to `doc`.
    const XML_Status status = ::XML_Parse(parser, doc.data(), static_cast<int>(doc.size()), 1);
    if (status != XML_STATUS_OK) {
        err = std::string(::XML_ErrorString(::XML_GetErrorCode(parser))) + " at line " +
              std::to_string(::XML_GetCurrentLineNumber(parser));
        ::XML_ParserFree(parser);
        return false;
    }
    ::XML_ParserFree(parser);
    return true;
}

bool filter_strings(std::string_view doc,
                    const std::function<bool(std::string_view)>& keep,
                    FilterResult& out,
                    std::string& err) {
    std::vector<StringElement> elements{};
    if (!scan_string_elements(doc, elements, err)) return false;

    out = FilterResult{};
    out.text.reserve(doc.size());
    size_t cursor = 0;
    for (const auto& e : elements) {
        if (keep(e.name)) {
            ++out.kept;
            continue;
        }
        ++out.dropped;

        size_t begin = e.begin;
        size_t end = e.end;
        size_t ls = begin;
        while (ls > cursor && is_blank(doc[ls - 1])) --ls;
        size_t te = end;
        while (te < doc.size() && (is_blank(doc[te]) || doc[te] == '\r')) ++te;
        const bool alone_on_line = (ls == 0 || doc[ls - 1] == '\n') && te < doc.size() && doc[te] == '\n';
        if (alone_on_line) {
            begin = ls;
            end = te + 1;
        }

        out.text.append(doc.substr(cursor, begin - cursor));
        cursor = end;
    }
    out.text.append(doc.substr(cursor));
    return true;
}

} // namespace resmerge::xml
