#include <report_render/references.hpp>
#include <report_render/escape.hpp>
#include <report_render/markup_constants.hpp>
#include <cctype>

namespace report_render {

namespace {

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string record_path(const std::vector<std::string>& source) {
    std::string out(markup::record_root);
    for (const auto& key : source)
        out += "." + key;
    return out;
}

std::string guarded_block(const std::string& path, const std::string& expression) {
    return "#{ let v = " + path + "; if v == none { " + quote(markup::missing_value) + " } else { " + expression + " } }";
}

} // namespace

std::string render_field_reference(const report_ir::Field& field, const FormatOptions& options) {
    const std::string path = record_path(field.source);
    if (!field.format) return "#" + path;

    switch (*field.format) {
        case report_model::FieldFormat::Currency: {
            const int places = field.decimal_places.value_or(format_defaults::currency_decimal_places);
            return escape_markup(options.currency_symbol) +
                guarded_block(path, "calc.round(v, digits: " + std::to_string(places) + ")");
        }
        case report_model::FieldFormat::Percent: {
            const int places = field.decimal_places.value_or(format_defaults::percent_decimal_places);
            return guarded_block(path, "str(calc.round(v, digits: " + std::to_string(places) + ")) + \"%\"");
        }
        case report_model::FieldFormat::Number: {
            const int places = field.decimal_places.value_or(format_defaults::number_decimal_places);
            return guarded_block(path, "calc.round(v, digits: " + std::to_string(places) + ")");
        }
        case report_model::FieldFormat::Date:
        case report_model::FieldFormat::DateTime:
            break;
    }
    return "#" + path;
}

std::string render_label_references(const std::string& text) {
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '[') {
            std::size_t end = pos + 1;
            while (end < text.size() && is_identifier_char(text[end])) ++end;
            if (end > pos + 1 && end < text.size() && text[end] == ']') {
                out += "#" + std::string(markup::variables_root) + "." + text.substr(pos + 1, end - pos - 1);
                pos = end + 1;
                continue;
            }
        }
        out += escape_markup(std::string_view(&text[pos], 1));
        ++pos;
    }
    return out;
}

} // namespace report_render
