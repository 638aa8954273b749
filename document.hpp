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

#pragma once

#include <conditions.hpp>
#include <units.hpp>
#include <variables.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct Color {
    double r = 0;
    double g = 0;
    double b = 0;
};

// "#rrggbb" or "#rgb"
std::optional<Color> parse_color(std::string_view text);

struct TextStyle {
    std::string font_family{"Inter"};
    double font_size = 12;
    bool bold = false;
    bool italic = false;
    Color color;
    std::optional<Color> background;
    std::string align{"left"};
    double line_height = 1.0;
    bool underline = false;
    bool strikethrough = false;
};

struct TextLabelProps {
    std::string content{"Text Label"};
    TextStyle style;
};

struct ParagraphProps {
    std::string content{"Paragraph text"};
    TextStyle style;
    double paragraph_spacing = 10;
    double first_line_indent = 0;
    int clamp_lines = 0;
};

struct TableProps {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> data;
    bool show_header = true;
    double header_font_size = 10;
    double cell_font_size = 10;
    double cell_padding = 5;
    bool header_bold = true;
    Color header_background{0.941, 0.941, 0.941};
    Color header_text;
    Color cell_text;
    bool alternate_rows = false;
    Color odd_row_background{0.976, 0.976, 0.976};
    std::string border_style{"all"};
    Color border_color;
    double border_width = 1;
};

struct TextFieldProps {
    std::string label{"Field Label"};
    std::string placeholder;
    std::string field_name{"field_name"};
    bool required = false;
    double label_font_size = 10;
    double font_size = 12;
    double input_height = 8;
    Color label_color{0.4, 0.4, 0.4};
    Color placeholder_color{0.6, 0.6, 0.6};
    Color border_color;
    double border_width = 1;
};

struct DateFieldProps {
    std::string label{"Date"};
    std::string format{"MM/DD/YYYY"};
    std::string field_name{"date_field"};
    bool required = false;
    double label_font_size = 10;
    double font_size = 12;
    double input_height = 8;
    Color label_color{0.4, 0.4, 0.4};
    Color placeholder_color{0.6, 0.6, 0.6};
    Color border_color;
    double border_width = 1;
};

struct CheckboxProps {
    std::string label{"Option"};
    bool checked = false;
    std::string size{"medium"};
    Color checked_color{0.404, 0.314, 0.643};
    Color border_color{0.475, 0.455, 0.494};
    double border_width = 1.5;
    double label_font_size = 11;
    Color label_color{0.110, 0.106, 0.122};
    double spacing = 6;
};

struct SignatureBoxProps {
    std::string signer_name{"Signer Name"};
    std::string signer_title;
    bool show_line = true;
    bool date_required = true;
    std::string date_label{"Date"};
    double line_thickness = 1;
    Color line_color;
    double signer_name_font_size = 10;
    double signer_title_font_size = 9;
};

struct DividerProps {
    double thickness = 1;
    Color color;
    bool vertical = false;
    std::vector<double> dash_pattern;
};

struct ImageProps {
    std::string src;
    std::string fit_mode{"fitArea"};
};

struct BarcodeProps {
    std::string value;
    std::string barcode_type{"qr-code"};
    std::string error_correction{"medium"};
    // Empty border around the symbol, in points.
    double quiet_zone = 2;
    bool show_value = true;
    double value_font_size = 10;
    Color foreground;
    Color background{1, 1, 1};
};

struct PlaceholderProps {
    std::string label{"Placeholder"};
    std::string variant{"default"};
};

struct UnknownProps {
    std::string type_name;
};

typedef std::variant<TextLabelProps,
                     ParagraphProps,
                     TableProps,
                     TextFieldProps,
                     DateFieldProps,
                     CheckboxProps,
                     SignatureBoxProps,
                     DividerProps,
                     ImageProps,
                     BarcodeProps,
                     PlaceholderProps,
                     UnknownProps>
    ComponentProps;

ComponentProps parse_component_props(std::string_view type, const nlohmann::json &properties);

struct ComponentLayout {
    bool auto_expand = false;
    bool push_siblings = true;
};

struct ComponentData {
    std::string id;
    std::string type;
    Rect rect;
    ComponentProps props;
    std::optional<ComponentLayout> layout;
    std::optional<ConditionConfig> condition;

    bool auto_expand() const;
    bool pushes_siblings() const { return layout ? layout->push_siblings : true; }
};

// Only text bearing components may grow to fit their content.
bool supports_auto_expand(std::string_view type);

ComponentData parse_component(const nlohmann::json &data);

struct PageMargins {
    Length top;
    Length right;
    Length bottom;
    Length left;
};

struct PageSize {
    Length w;
    Length h;
};

// Unset entries are filled in from the document settings.
struct PageSettings {
    std::optional<std::string> predefined_size;
    Length width;
    Length height;
    std::optional<std::string> orientation;
    std::optional<std::string> background_color;
    std::optional<std::string> content_direction;
    PageMargins margins;
};

struct GlobalSettings {
    std::string predefined_size{"a4"};
    std::string orientation{"portrait"};
    std::string background_color{"#FFFFFF"};
    std::string content_direction{"ltr"};
    PageMargins margins;
};

std::optional<PageSize> predefined_page_size(std::string_view name);

// Unknown sizes are A4. Custom sizes need a positive width and height.
PageSize page_size(const PageSettings &settings);

struct HeaderFooterContent {
    Length height = Length::from_mm(20);
    std::vector<ComponentData> components;
};

struct HeaderFooterConfig {
    HeaderFooterContent default_header{Length::from_mm(25), {}};
    HeaderFooterContent default_footer{Length::from_mm(15), {}};
    std::optional<HeaderFooterContent> first_page_header;
    std::optional<HeaderFooterContent> first_page_footer;
    std::optional<HeaderFooterContent> compact_header;
    std::optional<HeaderFooterContent> compact_footer;
};

// Variants are "default", "firstPage", "compact" and "none". Missing variants
// use the default content, "none" and zero height content give a null pointer.
const HeaderFooterContent *select_header(const HeaderFooterConfig &config, std::string_view type);
const HeaderFooterContent *select_footer(const HeaderFooterConfig &config, std::string_view type);

struct PageData {
    std::string id;
    int page_number = 0;
    std::string header_type{"default"};
    std::string footer_type{"default"};
    std::vector<ComponentData> components;
    PageSettings page_settings;
};

struct Document {
    std::vector<PageData> pages;
    HeaderFooterConfig header_footer;
    SimpleVariables variables;
    std::vector<VariableDefinition> variable_definitions;
    std::optional<GlobalSettings> settings;
};

// Accepts the page based format and the legacy single page
// {"components": [...]} one. Throws std::runtime_error for anything else.
Document parse_document(const nlohmann::json &content);

void apply_global_settings(Document &doc);
