#include <report_render/escape.hpp>

namespace report_render {

namespace {

bool is_markup_special(char c) {
    switch (c) {
        case '\\': case '#': case '$': case '@': case '*': case '_':
        case '[': case ']': case '{': case '}': case '<': case '>':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string escape_markup(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (is_markup_special(c)) out += '\\';
        out += c;
    }
    return out;
}

std::string escape_string_literal(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '"') out += '\\';
        out += c;
    }
    return out;
}

std::string quote(std::string_view text) {
    return "\"" + escape_string_literal(text) + "\"";
}

} // namespace report_render
