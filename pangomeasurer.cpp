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

#include <pangomeasurer.hpp>
#include <utils.hpp>

#include <algorithm>
#include <stdexcept>

namespace {

PangoAlignment pango_alignment(const std::string &align) {
    if(align == "center") {
        return PANGO_ALIGN_CENTER;
    }
    if(align == "right") {
        return PANGO_ALIGN_RIGHT;
    }
    return PANGO_ALIGN_LEFT;
}

TextStyle cell_style(double size, bool bold) {
    TextStyle style;
    style.font_size = size;
    style.bold = bold;
    return style;
}

} // namespace

void setup_pango(PangoLayout *layout, const TextStyle &style) {
    PangoFontDescription *desc = pango_font_description_from_string(style.font_family.c_str());
    pango_font_description_set_weight(desc, style.bold ? PANGO_WEIGHT_BOLD : PANGO_WEIGHT_NORMAL);
    pango_font_description_set_style(desc, style.italic ? PANGO_STYLE_ITALIC : PANGO_STYLE_NORMAL);
    pango_font_description_set_absolute_size(desc, style.font_size * PANGO_SCALE);
    pango_layout_set_font_description(layout, desc);
    pango_font_description_free(desc);
}

void set_layout_text(PangoLayout *layout, const std::string &text, const TextStyle &style, Length width) {
    setup_pango(layout, style);
    pango_layout_set_attributes(layout, nullptr);
    pango_layout_set_width(layout, width.is_positive() ? int(width.pt() * PANGO_SCALE) : -1);
    pango_layout_set_wrap(layout, PANGO_WRAP_WORD_CHAR);
    pango_layout_set_ellipsize(layout, PANGO_ELLIPSIZE_NONE);
    pango_layout_set_height(layout, -1);
    pango_layout_set_indent(layout, 0);
    pango_layout_set_justify(layout, style.align == "justify");
    pango_layout_set_alignment(layout, pango_alignment(style.align));
    pango_layout_set_line_spacing(layout, style.line_height > 0 ? float(style.line_height) : 1.0f);
    pango_layout_set_text(layout, text.c_str(), -1);
}

Length layout_height(PangoLayout *layout) {
    PangoRectangle r;
    pango_layout_get_extents(layout, nullptr, &r);
    return Length::from_pt(double(r.height) / PANGO_SCALE);
}

std::vector<std::string> split_paragraphs(const std::string &content) {
    std::vector<std::string> paragraphs = split(content, '\n');
    if(paragraphs.empty()) {
        paragraphs.emplace_back();
    }
    return paragraphs;
}

Length TableGeometry::total_height() const {
    Length total;
    for(const auto &h : row_heights) {
        total += h;
    }
    return total;
}

TableGeometry measure_table(PangoLayout *layout, const TableProps &table, Length width) {
    TableGeometry geometry;
    geometry.columns = table.headers.size();
    for(const auto &row : table.data) {
        geometry.columns = std::max(geometry.columns, row.size());
    }
    if(geometry.columns == 0) {
        return geometry;
    }
    geometry.column_width = width / double(geometry.columns);
    const Length padding = Length::from_pt(table.cell_padding);
    const Length text_width = max(geometry.column_width - 2 * padding, Length::from_pt(1));

    auto row_height = [&](const std::vector<std::string> &cells, const TextStyle &style) {
        Length tallest = Length::from_pt(style.font_size);
        for(const auto &cell : cells) {
            set_layout_text(layout, cell, style, text_width);
            tallest = max(tallest, layout_height(layout));
        }
        return tallest + 2 * padding;
    };

    if(table.show_header && !table.headers.empty()) {
        geometry.row_heights.push_back(
            row_height(table.headers, cell_style(table.header_font_size, table.header_bold)));
    }
    const auto body = cell_style(table.cell_font_size, false);
    for(const auto &row : table.data) {
        geometry.row_heights.push_back(row_height(row, body));
    }
    return geometry;
}

Length measure_paragraph(PangoLayout *layout, const ParagraphProps &paragraph, Length width) {
    Length total;
    const auto paragraphs = split_paragraphs(paragraph.content);
    for(size_t i = 0; i < paragraphs.size(); ++i) {
        set_layout_text(layout, paragraphs[i], paragraph.style, width);
        pango_layout_set_indent(layout, int(paragraph.first_line_indent * PANGO_SCALE));
        if(paragraph.clamp_lines > 0) {
            pango_layout_set_height(layout, -paragraph.clamp_lines);
            pango_layout_set_ellipsize(layout, PANGO_ELLIPSIZE_END);
        }
        total += layout_height(layout);
        if(i + 1 < paragraphs.size()) {
            total += Length::from_pt(paragraph.paragraph_spacing);
        }
    }
    return total;
}

PangoMeasurer::PangoMeasurer() {
    surf = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
    cr = cairo_create(surf);
    if(cairo_status(cr) != CAIRO_STATUS_SUCCESS) {
        cairo_destroy(cr);
        cairo_surface_destroy(surf);
        throw std::runtime_error("Could not create a Cairo context for text measurement.");
    }
    layout = pango_cairo_create_layout(cr);
    PangoContext *context = pango_layout_get_context(layout);
    pango_context_set_round_glyph_positions(context, FALSE);
}

PangoMeasurer::~PangoMeasurer() {
    g_object_unref(G_OBJECT(layout));
    cairo_destroy(cr);
    cairo_surface_destroy(surf);
}

Length PangoMeasurer::content_height(const ComponentData &component) {
    const Length width = component.rect.size.w;
    if(auto *p = std::get_if<TextLabelProps>(&component.props)) {
        set_layout_text(layout, p->content, p->style, width);
        return layout_height(layout);
    } else if(auto *p = std::get_if<ParagraphProps>(&component.props)) {
        return measure_paragraph(layout, *p, width);
    } else if(auto *p = std::get_if<TableProps>(&component.props)) {
        return measure_table(layout, *p, width).total_height();
    }
    return component.rect.size.h;
}
