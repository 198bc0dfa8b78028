#include <report_transform/tracks.hpp>
#include <report_transform/defaults.hpp>
#include <report_transform/properties.hpp>
#include <type_traits>

namespace report_transform {

namespace {

std::string describe_declaration(const report_model::TrackDeclaration& declaration) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "nil";
        else if constexpr (std::is_same_v<T, report_model::AutoTrack>) return "auto";
        else if constexpr (std::is_same_v<T, std::int64_t>) return std::to_string(v);
        else if constexpr (std::is_same_v<T, double>) return format_number(v);
        else if constexpr (std::is_same_v<T, std::string>) return "\"" + v + "\"";
        else {
            std::string out = "[";
            for (const auto& size : v) {
                if (out.size() > 1) out += ", ";
                out += normalize_track_size(size);
            }
            return out + "]";
        }
    }, declaration);
}

} // namespace

const char* to_string(TrackAxis axis) {
    return axis == TrackAxis::Columns ? "columns" : "rows";
}

std::string normalize_track_size(const report_model::TrackSize& size) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, report_model::AutoTrack>)
            return std::string(defaults::auto_track);
        else if constexpr (std::is_same_v<T, report_model::FractionTrack>)
            return format_number(v.value) + std::string(defaults::fraction_unit);
        else if constexpr (std::is_same_v<T, std::string>)
            return v;
        else if constexpr (std::is_same_v<T, std::int64_t>)
            return std::to_string(v) + std::string(defaults::point_unit);
        else
            return format_number(v) + std::string(defaults::point_unit);
    }, size);
}

Result<std::vector<std::string>> normalize_tracks(const report_model::TrackDeclaration& declaration,
                                                  TrackAxis axis) {
    std::vector<std::string> tracks;

    if (std::holds_alternative<std::monostate>(declaration)) return tracks;

    if (std::holds_alternative<report_model::AutoTrack>(declaration)) {
        tracks.emplace_back(defaults::auto_track);
        return tracks;
    }

    if (const auto* count = std::get_if<std::int64_t>(&declaration)) {
        if (*count <= 0 || *count > defaults::max_track_count)
            return invalid_track_definition(to_string(axis), describe_declaration(declaration));
        tracks.assign(static_cast<std::size_t>(*count), std::string(defaults::auto_track));
        return tracks;
    }

    if (const auto* list = std::get_if<std::vector<report_model::TrackSize>>(&declaration)) {
        tracks.reserve(list->size());
        for (const auto& size : *list)
            tracks.push_back(normalize_track_size(size));
        return tracks;
    }

    return invalid_track_definition(to_string(axis), describe_declaration(declaration));
}

} // namespace report_transform
