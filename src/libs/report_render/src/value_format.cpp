#include <report_render/value_format.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>

namespace report_render {

namespace {

struct CalendarValue {
    int year = 0;
    int month = 0;
    int day = 0;
    bool has_time = false;
    int hour = 0;
    int minute = 0;
    int second = 0;
    std::string fraction; // digits after the decimal point
    std::string zone;     // "Z", "+02:00" or empty
};

bool read_digits(const std::string& s, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

bool parse_zone(const std::string& s, std::size_t& pos, std::string& zone) {
    if (pos == s.size()) return true;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        zone = "Z";
        ++pos;
        return pos == s.size();
    }
    if (s[pos] != '+' && s[pos] != '-') return false;
    const char sign = s[pos++];
    int hours = 0;
    int minutes = 0;
    if (!read_digits(s, pos, 2, hours)) return false;
    if (pos < s.size() && s[pos] == ':') ++pos;
    if (!read_digits(s, pos, 2, minutes)) return false;
    if (hours > 23 || minutes > 59 || pos != s.size()) return false;
    zone = fmt::format("{}{:02}:{:02}", sign, hours, minutes);
    return true;
}

// ISO-8601 calendar date, optionally followed by a time (T or space separated).
std::optional<CalendarValue> parse_iso(const std::string& s) {
    CalendarValue v;
    std::size_t pos = 0;
    if (!read_digits(s, pos, 4, v.year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, v.month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, v.day))
        return std::nullopt;
    if (v.month < 1 || v.month > 12 || v.day < 1 || v.day > 31) return std::nullopt;
    if (pos == s.size()) return v;

    if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
    ++pos;
    v.has_time = true;
    if (!read_digits(s, pos, 2, v.hour) || !expect(s, pos, ':') || !read_digits(s, pos, 2, v.minute))
        return std::nullopt;
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!read_digits(s, pos, 2, v.second)) return std::nullopt;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
                v.fraction += s[pos++];
            if (v.fraction.empty()) return std::nullopt;
        }
    }
    if (v.hour > 23 || v.minute > 59 || v.second > 60) return std::nullopt;
    if (!parse_zone(s, pos, v.zone)) return std::nullopt;
    return v;
}

std::string date_part(const CalendarValue& v) {
    return fmt::format("{:04}-{:02}-{:02}", v.year, v.month, v.day);
}

bool is_empty_value(const nlohmann::json* value) {
    if (!value || value->is_null()) return true;
    return value->is_string() && value->get_ref<const std::string&>().empty();
}

} // namespace

const nlohmann::json* lookup_field(const nlohmann::json& data, const std::vector<std::string>& path) {
    if (path.empty()) return nullptr;
    const nlohmann::json* current = &data;
    for (const auto& key : path) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(key);
        if (it == current->end()) return nullptr;
        current = &*it;
    }
    return current;
}

std::string raw_value(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

std::string format_fixed(double value, int decimal_places) {
    return fmt::format("{:.{}f}", value, std::max(decimal_places, 0));
}

std::optional<std::string> format_date(const std::string& iso) {
    auto parsed = parse_iso(iso);
    if (!parsed) return std::nullopt;
    return date_part(*parsed);
}

std::optional<std::string> format_datetime(const std::string& iso) {
    auto parsed = parse_iso(iso);
    if (!parsed) return std::nullopt;
    if (!parsed->has_time) return date_part(*parsed);
    std::string out = fmt::format("{} {:02}:{:02}:{:02}", date_part(*parsed), parsed->hour, parsed->minute, parsed->second);
    if (!parsed->fraction.empty()) out += "." + parsed->fraction;
    return out + parsed->zone;
}

std::string format_value(const nlohmann::json* value,
                         std::optional<report_model::FieldFormat> format,
                         std::optional<int> decimal_places,
                         const FormatOptions& options) {
    if (is_empty_value(value)) return "";
    if (!format) return raw_value(*value);

    switch (*format) {
        case report_model::FieldFormat::Number:
            if (!value->is_number()) break;
            return format_fixed(value->get<double>(), decimal_places.value_or(format_defaults::number_decimal_places));
        case report_model::FieldFormat::Currency:
            if (!value->is_number()) break;
            return options.currency_symbol +
                format_fixed(value->get<double>(), decimal_places.value_or(format_defaults::currency_decimal_places));
        case report_model::FieldFormat::Percent:
            if (!value->is_number()) break;
            return format_fixed(value->get<double>() * 100.0,
                                decimal_places.value_or(format_defaults::percent_decimal_places)) + "%";
        case report_model::FieldFormat::Date:
            if (!value->is_string()) break;
            if (auto date = format_date(value->get<std::string>())) return *date;
            break;
        case report_model::FieldFormat::DateTime:
            if (!value->is_string()) break;
            if (auto datetime = format_datetime(value->get<std::string>())) return *datetime;
            break;
    }
    return raw_value(*value);
}

} // namespace report_render
