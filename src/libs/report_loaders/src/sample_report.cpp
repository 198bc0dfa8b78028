#include <report_loaders/sample_report.hpp>
#include <memory>

namespace report_loaders {

report_model::ReportSpec generate_sample_report() {
    using namespace report_model;

    ReportSpec out;
    out.name = "Invoice (sample)";
    out.document.page_size = "a4";
    out.document.margin = "2cm";
    out.document.font_size = "10pt";

    auto label = [](const char* text, StyleSpec style = {}) {
        ElementSpec e;
        e.type = "label";
        e.text = text;
        e.style = std::move(style);
        return e;
    };
    auto field = [](std::initializer_list<const char*> path, std::optional<FieldFormat> format = std::nullopt,
                    std::optional<int> places = std::nullopt) {
        ElementSpec e;
        e.type = "field";
        e.source = std::vector<std::string>(path.begin(), path.end());
        e.format = format;
        e.decimal_places = places;
        return e;
    };
    auto cell = [](std::initializer_list<ElementSpec> elements) {
        CellSpec c;
        c.elements.assign(elements.begin(), elements.end());
        return c;
    };
    auto row = [](std::initializer_list<RowItem> items) {
        RowSpec r;
        r.items.assign(items.begin(), items.end());
        return r;
    };

    StyleSpec title_style;
    title_style.font_size = std::int64_t{ 16 };
    title_style.font_weight = std::string("bold");

    StyleSpec header_style;
    header_style.font_weight = std::string("bold");

    // Customer block: two label/value columns.
    LayoutSpec customer;
    customer.kind = LayoutKind::Grid;
    customer.name = "customer";
    customer.columns = std::vector<TrackSize>{ std::int64_t{ 80 }, FractionTrack{ 1 } };
    customer.gutter = std::string("4pt");
    customer.elements = {
        label("Customer:"), field({ "customer", "name" }),
        label("Date:"), field({ "issued_at" }, FieldFormat::Date),
    };

    ElementSpec customer_element;
    customer_element.type = "grid";
    customer_element.layout = std::make_shared<LayoutSpec>(std::move(customer));

    LayoutSpec heading;
    heading.kind = LayoutKind::Stack;
    heading.name = "heading";
    heading.dir = "ttb";
    heading.spacing = std::int64_t{ 8 };
    heading.elements = { label("Invoice", title_style), field({ "number" }), customer_element };

    LayoutSpec lines;
    lines.kind = LayoutKind::Table;
    lines.name = "lines";
    lines.columns = std::vector<TrackSize>{ FractionTrack{ 3 }, FractionTrack{ 1 }, FractionTrack{ 1 } };
    lines.align = Alignment{ "left" };

    HeaderSpec header;
    header.entries.emplace_back(row({
        cell({ label("Item", header_style) }),
        cell({ label("Qty", header_style) }),
        cell({ label("Amount", header_style) }),
    }));
    lines.headers.push_back(std::move(header));

    const char* items[] = { "first", "second", "third" };
    for (const char* item : items) {
        lines.row_entities.push_back(row({
            field({ "items", item, "description" }),
            field({ "items", item, "quantity" }, FieldFormat::Number),
            field({ "items", item, "amount" }, FieldFormat::Currency),
        }));
    }

    CellSpec total_label = cell({ label("Total", header_style) });
    total_label.colspan = 2;
    total_label.align = Alignment{ "right" };
    FooterSpec footer;
    footer.entries.emplace_back(row({ total_label, field({ "total" }, FieldFormat::Currency) }));
    lines.footers.push_back(std::move(footer));

    LineSpec rule;
    rule.orientation = LineOrientation::Horizontal;
    rule.position = 1;
    rule.stroke = std::string("1.5pt");
    lines.lines.push_back(rule);

    out.layouts.push_back(std::move(heading));
    out.layouts.push_back(std::move(lines));
    return out;
}

nlohmann::json generate_sample_data() {
    return nlohmann::json{
        { "number", "INV-2024-0042" },
        { "issued_at", "2024-03-15T09:30:00Z" },
        { "customer", { { "name", "Acme Corp" } } },
        { "items", {
            { "first", { { "description", "Consulting" }, { "quantity", 10 }, { "amount", 1500.0 } } },
            { "second", { { "description", "Support_plan" }, { "quantity", 1 }, { "amount", 249.5 } } },
            { "third", { { "description", "Travel" }, { "quantity", 2 }, { "amount", 310.25 } } },
        } },
        { "total", 2059.75 },
    };
}

} // namespace report_loaders
