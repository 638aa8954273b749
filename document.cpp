/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <document.hpp>
#include <jsonhelpers.hpp>
#include <utils.hpp>

#include <glib.h>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace {

const std::unordered_set<std::string> auto_expand_types{"paragraph", "text-label", "table"};

const std::unordered_map<std::string, PageSize> page_sizes{
    {"a3", PageSize{Length::from_mm(297), Length::from_mm(420)}},
    {"a4", PageSize{Length::from_mm(210), Length::from_mm(297)}},
    {"a5", PageSize{Length::from_mm(148), Length::from_mm(210)}},
    {"letter", PageSize{Length::from_mm(215.9), Length::from_mm(279.4)}},
    {"legal", PageSize{Length::from_mm(215.9), Length::from_mm(355.6)}},
    {"ledger", PageSize{Length::from_mm(431.8), Length::from_mm(279.4)}},
    {"tabloid", PageSize{Length::from_mm(279.4), Length::from_mm(431.8)}},
    {"executive", PageSize{Length::from_mm(184.15), Length::from_mm(266.7)}},
};

Color get_color(const json &props, const char *key, const Color &fallback) {
    auto text = get_optional_string(props, key);
    if(!text) {
        return fallback;
    }
    return parse_color(*text).value_or(fallback);
}

std::optional<Color> get_optional_color(const json &props, const char *key) {
    auto text = get_optional_string(props, key);
    if(!text) {
        return {};
    }
    return parse_color(*text);
}

bool is_bold_weight(const std::string &weight) {
    if(iequals(weight, "bold") || iequals(weight, "bolder")) {
        return true;
    }
    auto numeric = parse_double(weight);
    return numeric && *numeric >= 600;
}

std::vector<std::string> get_string_array(const json &props, const char *key) {
    std::vector<std::string> result;
    auto it = props.find(key);
    if(it == props.end() || !it->is_array()) {
        return result;
    }
    for(const auto &item : *it) {
        if(item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

// Non-string cells become empty so that column positions are kept.
std::vector<std::vector<std::string>> get_string_table(const json &props, const char *key) {
    std::vector<std::vector<std::string>> result;
    auto it = props.find(key);
    if(it == props.end() || !it->is_array()) {
        return result;
    }
    for(const auto &row : *it) {
        if(!row.is_array()) {
            continue;
        }
        std::vector<std::string> cells;
        for(const auto &cell : row) {
            cells.push_back(cell.is_string() ? cell.get<std::string>() : std::string{});
        }
        result.push_back(std::move(cells));
    }
    return result;
}

std::vector<double> get_double_array(const json &props, const char *key) {
    std::vector<double> result;
    auto it = props.find(key);
    if(it == props.end() || !it->is_array()) {
        return result;
    }
    for(const auto &item : *it) {
        if(item.is_number()) {
            result.push_back(item.get<double>());
        }
    }
    return result;
}

TextStyle parse_text_style(const json &props, double default_size, double default_line_height) {
    TextStyle style;
    style.font_family = get_string(props, "fontFamily", "Inter");
    style.font_size = get_double(props, "fontSize", default_size);
    style.bold = is_bold_weight(get_string(props, "fontWeight", "normal"));
    style.italic = get_bool(props, "italic", false);
    style.color = get_color(props, "color", Color{});
    style.background = get_optional_color(props, "backgroundColor");
    style.align = get_string(props, "textAlign", "left");
    style.line_height = get_double(props, "lineHeight", default_line_height);
    const auto decoration = get_string(props, "decoration", "none");
    style.underline = iequals(decoration, "underline");
    style.strikethrough = iequals(decoration, "line-through") || iequals(decoration, "strikethrough");
    return style;
}

TextLabelProps parse_text_label(const json &props) {
    TextLabelProps p;
    p.content = get_string(props, "content", "Text Label");
    p.style = parse_text_style(props, 12, 1.0);
    return p;
}

ParagraphProps parse_paragraph(const json &props) {
    ParagraphProps p;
    p.content = get_string(props, "content", "Paragraph text");
    p.style = parse_text_style(props, 11, 1.5);
    p.paragraph_spacing = get_double(props, "paragraphSpacing", 10);
    p.first_line_indent = get_double(props, "firstLineIndentation", 0);
    p.clamp_lines = get_int(props, "clampLines", 0);
    return p;
}

TableProps parse_table(const json &props) {
    TableProps p;
    p.headers = get_string_array(props, "headers");
    p.data = get_string_table(props, "data");
    p.show_header = get_bool(props, "showHeader", true);
    p.header_font_size = get_double(props, "headerFontSize", 10);
    p.cell_font_size = get_double(props, "cellFontSize", 10);
    p.cell_padding = get_double(props, "cellPadding", 5);
    p.header_bold = is_bold_weight(get_string(props, "headerFontWeight", "bold"));
    p.header_background = get_color(props, "headerBackground", p.header_background);
    p.header_text = get_color(props, "headerTextColor", p.header_text);
    p.cell_text = get_color(props, "cellTextColor", p.cell_text);
    p.alternate_rows = get_bool(props, "alternateRowColors", false);
    p.odd_row_background = get_color(props, "oddRowBackground", p.odd_row_background);
    p.border_style = get_string(props, "borderStyle", "all");
    p.border_color = get_color(props, "borderColor", p.border_color);
    p.border_width = get_double(props, "borderWidth", 1);
    return p;
}

TextFieldProps parse_text_field(const json &props) {
    TextFieldProps p;
    p.label = get_string(props, "label", "Field Label");
    p.placeholder = get_string(props, "placeholder", "");
    p.field_name = get_string(props, "fieldName", "field_name");
    p.required = get_bool(props, "required", false);
    p.label_font_size = get_double(props, "labelFontSize", 10);
    p.font_size = get_double(props, "fontSize", 12);
    p.input_height = get_double(props, "inputHeight", 8);
    p.label_color = get_color(props, "labelColor", p.label_color);
    p.placeholder_color = get_color(props, "placeholderColor", p.placeholder_color);
    p.border_color = get_color(props, "borderColor", p.border_color);
    p.border_width = get_double(props, "borderWidth", 1);
    return p;
}

DateFieldProps parse_date_field(const json &props) {
    DateFieldProps p;
    p.label = get_string(props, "label", "Date");
    p.format = get_string(props, "format", "MM/DD/YYYY");
    p.field_name = get_string(props, "fieldName", "date_field");
    p.required = get_bool(props, "required", false);
    p.label_font_size = get_double(props, "labelFontSize", 10);
    p.font_size = get_double(props, "fontSize", 12);
    p.input_height = get_double(props, "inputHeight", 8);
    p.label_color = get_color(props, "labelColor", p.label_color);
    p.placeholder_color = get_color(props, "placeholderColor", p.placeholder_color);
    p.border_color = get_color(props, "borderColor", p.border_color);
    p.border_width = get_double(props, "borderWidth", 1);
    return p;
}

CheckboxProps parse_checkbox(const json &props) {
    CheckboxProps p;
    p.label = get_string(props, "label", "Option");
    p.checked = get_bool(props, "checked", get_bool(props, "defaultChecked", false));
    p.size = get_string(props, "size", "medium");
    p.checked_color = get_color(props, "checkedColor", p.checked_color);
    p.border_color = get_color(props, "borderColor", p.border_color);
    p.border_width = get_double(props, "borderWidth", 1.5);
    p.label_font_size = get_double(props, "labelFontSize", 11);
    p.label_color = get_color(props, "labelColor", p.label_color);
    p.spacing = get_double(props, "spacing", 6);
    return p;
}

SignatureBoxProps parse_signature_box(const json &props) {
    SignatureBoxProps p;
    p.signer_name = get_string(props, "signerName", "Signer Name");
    p.signer_title = get_string(props, "signerTitle", "");
    p.show_line = get_bool(props, "showLine", true);
    p.date_required = get_bool(props, "dateRequired", true);
    p.date_label = get_string(props, "dateLabel", "Date");
    p.line_thickness = get_double(props, "lineThickness", 1);
    p.line_color = get_color(props, "lineColor", p.line_color);
    p.signer_name_font_size = get_double(props, "signerNameFontSize", 10);
    p.signer_title_font_size = get_double(props, "signerTitleFontSize", 9);
    return p;
}

DividerProps parse_divider(const json &props) {
    DividerProps p;
    p.thickness = get_double(props, "thickness", 1);
    p.color = get_color(props, "color", p.color);
    p.vertical = iequals(get_string(props, "orientation", "horizontal"), "vertical");
    p.dash_pattern = get_double_array(props, "dashPattern");
    return p;
}

ImageProps parse_image(const json &props) {
    ImageProps p;
    p.src = get_string(props, "src", "");
    p.fit_mode = get_string(props, "fitMode", "fitArea");
    return p;
}

BarcodeProps parse_barcode(const json &props) {
    BarcodeProps p;
    p.value = get_string(props, "value", "");
    p.barcode_type = get_string(props, "barcodeType", "qr-code");
    p.error_correction = get_string(props, "errorCorrectionLevel", "medium");
    p.quiet_zone = get_double(props, "quietZone", 2);
    p.show_value = get_bool(props, "showValue", true);
    p.value_font_size = get_double(props, "valueFontSize", 10);
    p.foreground = get_color(props, "foregroundColor", p.foreground);
    p.background = get_color(props, "backgroundColor", p.background);
    return p;
}

PlaceholderProps parse_placeholder(const json &props) {
    PlaceholderProps p;
    p.label = get_string(props, "label", "Placeholder");
    p.variant = get_string(props, "variant", "default");
    return p;
}

typedef std::function<ComponentProps(const json &)> PropsParser;

const std::unordered_map<std::string, PropsParser> props_parsers{
    {"text-label", parse_text_label},
    {"paragraph", parse_paragraph},
    {"table", parse_table},
    {"text-field", parse_text_field},
    {"date-field", parse_date_field},
    {"checkbox", parse_checkbox},
    {"signature-box", parse_signature_box},
    {"divider", parse_divider},
    {"image", parse_image},
    {"barcode", parse_barcode},
    {"placeholder", parse_placeholder},
};

Length non_negative_mm(const json &data, const char *key) {
    const double v = get_double(data, key, 0.0);
    return Length::from_mm(v > 0 ? v : 0.0);
}

std::vector<ComponentData> parse_components(const json &data) {
    std::vector<ComponentData> components;
    if(!data.is_array()) {
        return components;
    }
    for(const auto &c : data) {
        components.push_back(parse_component(c));
    }
    return components;
}

PageMargins parse_margins(const json &data) {
    PageMargins m;
    if(!data.is_object()) {
        return m;
    }
    m.top = non_negative_mm(data, "top");
    m.right = non_negative_mm(data, "right");
    m.bottom = non_negative_mm(data, "bottom");
    m.left = non_negative_mm(data, "left");
    return m;
}

PageSettings parse_page_settings(const json &data) {
    PageSettings s;
    if(!data.is_object()) {
        return s;
    }
    s.predefined_size = get_optional_string(data, "predefinedSize");
    s.width = non_negative_mm(data, "width");
    s.height = non_negative_mm(data, "height");
    s.orientation = get_optional_string(data, "orientation");
    s.background_color = get_optional_string(data, "backgroundColor");
    s.content_direction = get_optional_string(data, "contentDirection");
    auto margins = data.find("margins");
    if(margins != data.end()) {
        s.margins = parse_margins(*margins);
    }
    return s;
}

GlobalSettings parse_global_settings(const json &data) {
    GlobalSettings s;
    s.predefined_size = get_string(data, "predefinedSize", "a4");
    s.orientation = get_string(data, "orientation", "portrait");
    s.background_color = get_string(data, "backgroundColor", "#FFFFFF");
    s.content_direction = get_string(data, "contentDirection", "ltr");
    auto margins = data.find("margins");
    if(margins != data.end()) {
        s.margins = parse_margins(*margins);
    }
    return s;
}

HeaderFooterContent parse_header_footer_content(const json &data, Length default_height) {
    HeaderFooterContent content;
    content.height = Length::from_mm(get_double(data, "height", default_height.mm()));
    auto components = data.find("components");
    if(components != data.end()) {
        content.components = parse_components(*components);
    }
    return content;
}

std::optional<HeaderFooterContent> parse_optional_content(const json &data, const char *key) {
    auto it = data.find(key);
    if(it == data.end() || !it->is_object()) {
        return {};
    }
    return parse_header_footer_content(*it, Length::from_mm(20));
}

HeaderFooterConfig parse_header_footer(const json &data) {
    HeaderFooterConfig config;
    if(!data.is_object()) {
        return config;
    }
    auto header = data.find("defaultHeader");
    if(header != data.end() && header->is_object()) {
        config.default_header = parse_header_footer_content(*header, Length::from_mm(20));
    }
    auto footer = data.find("defaultFooter");
    if(footer != data.end() && footer->is_object()) {
        config.default_footer = parse_header_footer_content(*footer, Length::from_mm(20));
    }
    config.first_page_header = parse_optional_content(data, "firstPageHeader");
    config.first_page_footer = parse_optional_content(data, "firstPageFooter");
    config.compact_header = parse_optional_content(data, "compactHeader");
    config.compact_footer = parse_optional_content(data, "compactFooter");
    return config;
}

PageData parse_page(const json &data) {
    PageData page;
    page.id = get_string(data, "id", "");
    page.page_number = get_int(data, "pageNumber", 0);
    page.header_type = get_string(data, "headerType", "default");
    page.footer_type = get_string(data, "footerType", "default");
    auto components = data.find("components");
    if(components != data.end()) {
        page.components = parse_components(*components);
    }
    auto settings = data.find("pageSettings");
    if(settings != data.end()) {
        page.page_settings = parse_page_settings(*settings);
    }
    return page;
}

SimpleVariables parse_document_variables(const json &data) {
    SimpleVariables vars;
    if(!data.is_object()) {
        return vars;
    }
    for(auto it = data.begin(); it != data.end(); ++it) {
        vars[it.key()] = json_display_string(it.value());
    }
    return vars;
}

const HeaderFooterContent *select_content(const HeaderFooterContent &fallback,
                                          const std::optional<HeaderFooterContent> &first_page,
                                          const std::optional<HeaderFooterContent> &compact,
                                          std::string_view type) {
    const HeaderFooterContent *selected = &fallback;
    if(iequals(type, "none")) {
        return nullptr;
    } else if(iequals(type, "firstpage")) {
        selected = first_page ? &(*first_page) : &fallback;
    } else if(iequals(type, "compact")) {
        selected = compact ? &(*compact) : &fallback;
    }
    if(!selected->height.is_positive()) {
        return nullptr;
    }
    return selected;
}

Length pick_margin(Length own, Length global) {
    if(own.is_positive() || !global.is_positive()) {
        return own;
    }
    return global;
}

} // namespace

std::optional<Color> parse_color(std::string_view text) {
    const auto t = trim(text);
    if(t.size() < 2 || t.front() != '#') {
        return {};
    }
    std::string hex = t.substr(1);
    if(hex.size() == 3) {
        hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    }
    if(hex.size() != 6 && hex.size() != 8) {
        return {};
    }
    int channels[3];
    for(int i = 0; i < 3; ++i) {
        const int hi = g_ascii_xdigit_value(hex[2 * i]);
        const int lo = g_ascii_xdigit_value(hex[2 * i + 1]);
        if(hi < 0 || lo < 0) {
            return {};
        }
        channels[i] = hi * 16 + lo;
    }
    return Color{channels[0] / 255.0, channels[1] / 255.0, channels[2] / 255.0};
}

ComponentProps parse_component_props(std::string_view type, const json &properties) {
    const json &props = properties.is_object() ? properties : json::object();
    auto it = props_parsers.find(utf8_lower(type));
    if(it == props_parsers.end()) {
        return UnknownProps{std::string{type}};
    }
    return it->second(props);
}

bool supports_auto_expand(std::string_view type) {
    return auto_expand_types.count(utf8_lower(type)) > 0;
}

bool ComponentData::auto_expand() const {
    return layout && layout->auto_expand && supports_auto_expand(type);
}

ComponentData parse_component(const json &data) {
    if(!data.is_object()) {
        throw std::runtime_error("Component is not a JSON object.");
    }
    ComponentData c;
    c.id = get_string(data, "id", "");
    c.type = get_string(data, "type", "");
    auto position = data.find("position");
    if(position != data.end() && position->is_object()) {
        c.rect.pos.x = non_negative_mm(*position, "x");
        c.rect.pos.y = non_negative_mm(*position, "y");
    }
    auto size = data.find("size");
    if(size != data.end() && size->is_object()) {
        c.rect.size.w = non_negative_mm(*size, "width");
        c.rect.size.h = non_negative_mm(*size, "height");
    }
    auto props = data.find("properties");
    c.props = parse_component_props(c.type, props != data.end() ? *props : json::object());
    auto layout = data.find("layout");
    if(layout != data.end() && layout->is_object()) {
        c.layout = ComponentLayout{get_bool(*layout, "autoExpand", false),
                                   get_bool(*layout, "pushSiblings", true)};
    }
    auto condition = data.find("condition");
    if(condition != data.end() && condition->is_object()) {
        c.condition = parse_condition(*condition);
    }
    return c;
}

std::optional<PageSize> predefined_page_size(std::string_view name) {
    auto it = page_sizes.find(utf8_lower(name));
    if(it == page_sizes.end()) {
        return {};
    }
    return it->second;
}

PageSize page_size(const PageSettings &settings) {
    const auto preset = utf8_lower(settings.predefined_size.value_or("a4"));
    PageSize size = page_sizes.at("a4");
    if(preset == "custom" && settings.width.is_positive() && settings.height.is_positive()) {
        size = PageSize{settings.width, settings.height};
    } else if(auto known = predefined_page_size(preset)) {
        size = *known;
    }
    const bool landscape = iequals(settings.orientation.value_or("portrait"), "landscape");
    const auto short_side = min(size.w, size.h);
    const auto long_side = max(size.w, size.h);
    if(landscape) {
        return PageSize{long_side, short_side};
    }
    return PageSize{short_side, long_side};
}

const HeaderFooterContent *select_header(const HeaderFooterConfig &config, std::string_view type) {
    return select_content(
        config.default_header, config.first_page_header, config.compact_header, type);
}

const HeaderFooterContent *select_footer(const HeaderFooterConfig &config, std::string_view type) {
    return select_content(
        config.default_footer, config.first_page_footer, config.compact_footer, type);
}

Document parse_document(const json &content) {
    if(!content.is_object()) {
        throw std::runtime_error("Document content is not a JSON object.");
    }
    Document doc;
    auto pages = content.find("pages");
    if(pages != content.end() && pages->is_array() && !pages->empty()) {
        for(const auto &p : *pages) {
            doc.pages.push_back(parse_page(p));
        }
    } else {
        auto legacy = content.find("components");
        if(legacy == content.end() || !legacy->is_array() || legacy->empty()) {
            throw std::runtime_error("Document content has no pages.");
        }
        PageData page;
        page.id = "page-1";
        page.page_number = 1;
        page.components = parse_components(*legacy);
        page.page_settings.predefined_size = "a4";
        page.page_settings.orientation = "portrait";
        doc.pages.push_back(std::move(page));
    }
    auto header_footer = content.find("headerFooter");
    if(header_footer != content.end()) {
        doc.header_footer = parse_header_footer(*header_footer);
    }
    auto vars = content.find("variables");
    if(vars != content.end()) {
        doc.variables = parse_document_variables(*vars);
    }
    auto defs = content.find("variableDefinitions");
    if(defs != content.end()) {
        doc.variable_definitions = parse_variable_definitions(*defs);
    }
    auto settings = content.find("settings");
    if(settings != content.end() && settings->is_object()) {
        doc.settings = parse_global_settings(*settings);
    }
    return doc;
}

void apply_global_settings(Document &doc) {
    const GlobalSettings global = doc.settings.value_or(GlobalSettings{});
    for(auto &page : doc.pages) {
        auto &s = page.page_settings;
        if(!s.predefined_size) {
            s.predefined_size = global.predefined_size;
        }
        if(!s.orientation) {
            s.orientation = global.orientation;
        }
        if(!s.background_color || s.background_color->empty()) {
            s.background_color = global.background_color;
        }
        if(!s.content_direction || s.content_direction->empty()) {
            s.content_direction = global.content_direction;
        }
        s.margins.top = pick_margin(s.margins.top, global.margins.top);
        s.margins.right = pick_margin(s.margins.right, global.margins.right);
        s.margins.bottom = pick_margin(s.margins.bottom, global.margins.bottom);
        s.margins.left = pick_margin(s.margins.left, global.margins.left);
    }
    std::stable_sort(doc.pages.begin(), doc.pages.end(), [](const PageData &a, const PageData &b) {
        return a.page_number < b.page_number;
    });
}
