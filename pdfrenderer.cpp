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

#include <pdfrenderer.hpp>
#include <barcode.hpp>
#include <pangomeasurer.hpp>
#include <utils.hpp>

#include <cairo-pdf.h>
#include <glib.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace {

const Color black{0, 0, 0};
const Color white{1, 1, 1};
const Color debug_red{0.9, 0.1, 0.1};
const Color placeholder_grey{0.6, 0.6, 0.6};
const Color placeholder_fill{0.95, 0.95, 0.95};

const std::unordered_map<std::string, double> checkbox_sizes{
    {"small", 10},
    {"medium", 14},
    {"large", 18},
};

// Signature space above the line, in points.
const double signature_area_height = 20;
const double element_spacing = 4;

struct PngStream {
    const guchar *data;
    gsize size;
    gsize offset;
};

cairo_status_t read_png_stream(void *closure, unsigned char *out, unsigned int length) {
    auto *stream = static_cast<PngStream *>(closure);
    if(stream->offset + length > stream->size) {
        return CAIRO_STATUS_READ_ERROR;
    }
    memcpy(out, stream->data + stream->offset, length);
    stream->offset += length;
    return CAIRO_STATUS_SUCCESS;
}

const char png_data_prefix[] = "data:image/png;base64,";

cairo_surface_t *load_png(const std::string &src) {
    if(istarts_with(src, png_data_prefix)) {
        gsize size = 0;
        guchar *decoded = g_base64_decode(src.c_str() + strlen(png_data_prefix), &size);
        PngStream stream{decoded, size, 0};
        cairo_surface_t *s = cairo_image_surface_create_from_png_stream(read_png_stream, &stream);
        g_free(decoded);
        return s;
    }
    return cairo_image_surface_create_from_png(src.c_str());
}

TextStyle plain_style(double size, const Color &color) {
    TextStyle style;
    style.font_size = size;
    style.color = color;
    return style;
}

} // namespace

PdfRenderer::PdfRenderer(const char *ofname, const GenerationSettings &settings_)
    : settings(settings_) {
    // A4 until the first page sets its own size.
    surf = cairo_pdf_surface_create(ofname, mm2pt(210), mm2pt(297));
    if(cairo_surface_status(surf) != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surf);
        throw std::runtime_error(std::string("Could not create PDF file ") + ofname + ".");
    }
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_TITLE, settings.title.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_AUTHOR, settings.author.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_SUBJECT, settings.subject.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_KEYWORDS, settings.keywords.c_str());
    cairo_pdf_surface_set_metadata(surf, CAIRO_PDF_METADATA_CREATOR, settings.creator.c_str());
    cr = cairo_create(surf);
    layout = pango_cairo_create_layout(cr);
    PangoContext *context = pango_layout_get_context(layout);
    pango_context_set_round_glyph_positions(context, FALSE);
    cairo_set_line_width(cr, 0.1);
}

PdfRenderer::~PdfRenderer() {
    for(auto &it : loaded_images) {
        cairo_surface_destroy(it.second);
    }
    g_object_unref(G_OBJECT(layout));
    cairo_destroy(cr);
    cairo_surface_destroy(surf);
}

void PdfRenderer::finish() {
    if(finished) {
        return;
    }
    finished = true;
    cairo_surface_finish(surf);
    if(cairo_surface_status(surf) != CAIRO_STATUS_SUCCESS) {
        throw std::runtime_error(std::string("Writing PDF failed: ") +
                                 cairo_status_to_string(cairo_surface_status(surf)));
    }
}

void PdfRenderer::render_document(const std::vector<ComposedPage> &composed) {
    for(const auto &page : composed) {
        render_page(page);
    }
}

void PdfRenderer::render_page(const ComposedPage &page) {
    if(finished) {
        throw std::runtime_error("Can not add pages to a finished PDF.");
    }
    cairo_pdf_surface_set_size(surf, page.size.w.pt(), page.size.h.pt());
    setup_direction(page.rtl);
    fill_box(Length::zero(), Length::zero(), page.size.w, page.size.h, page.background);

    if(page.header) {
        for(const auto &c : page.header->components) {
            draw_component(c);
        }
    }
    for(const auto &c : page.components) {
        draw_component(c);
    }
    if(page.footer) {
        for(const auto &c : page.footer->components) {
            draw_component(c);
        }
    }
    if(settings.debug_draw) {
        const auto &m = page.margins;
        draw_debug_frame(Rect{Position{m.left, m.top},
                              Size{page.size.w - m.left - m.right, page.size.h - m.top - m.bottom}});
    }
    cairo_show_page(cr);
    ++pages;
}

void PdfRenderer::setup_direction(bool rtl) {
    PangoContext *context = pango_layout_get_context(layout);
    pango_context_set_base_dir(context, rtl ? PANGO_DIRECTION_RTL : PANGO_DIRECTION_LTR);
    pango_layout_context_changed(layout);
}

void PdfRenderer::draw_component(const PlacedComponent &placed) {
    const auto &c = placed.component;
    const Rect &r = placed.rect;
    if(auto *p = std::get_if<TextLabelProps>(&c.props)) {
        draw_text_label(*p, r);
    } else if(auto *p = std::get_if<ParagraphProps>(&c.props)) {
        draw_paragraph(*p, r);
    } else if(auto *p = std::get_if<TableProps>(&c.props)) {
        draw_table(*p, r);
    } else if(auto *p = std::get_if<TextFieldProps>(&c.props)) {
        const Length label_h =
            draw_field_label(p->label, p->required, p->label_font_size, p->label_color, r);
        draw_input_box(p->placeholder,
                       p->font_size,
                       p->placeholder_color,
                       p->border_color,
                       p->border_width,
                       r.left(),
                       r.top() + label_h,
                       r.size.w,
                       Length::from_mm(p->input_height));
    } else if(auto *p = std::get_if<DateFieldProps>(&c.props)) {
        const Length label_h =
            draw_field_label(p->label, p->required, p->label_font_size, p->label_color, r);
        draw_input_box(p->format,
                       p->font_size,
                       p->placeholder_color,
                       p->border_color,
                       p->border_width,
                       r.left(),
                       r.top() + label_h,
                       r.size.w,
                       Length::from_mm(p->input_height));
    } else if(auto *p = std::get_if<CheckboxProps>(&c.props)) {
        draw_checkbox(*p, r);
    } else if(auto *p = std::get_if<SignatureBoxProps>(&c.props)) {
        draw_signature_box(*p, r);
    } else if(auto *p = std::get_if<DividerProps>(&c.props)) {
        draw_divider(*p, r);
    } else if(auto *p = std::get_if<ImageProps>(&c.props)) {
        draw_picture(*p, c.id, r);
    } else if(auto *p = std::get_if<BarcodeProps>(&c.props)) {
        draw_barcode(*p, r);
    } else if(auto *p = std::get_if<PlaceholderProps>(&c.props)) {
        draw_placeholder(p->label, r);
    } else if(auto *p = std::get_if<UnknownProps>(&c.props)) {
        draw_placeholder(p->type_name, r);
    }
    if(settings.debug_draw) {
        draw_debug_frame(r);
    }
}

void PdfRenderer::set_color(const Color &c) { cairo_set_source_rgb(cr, c.r, c.g, c.b); }

void PdfRenderer::show_layout(const TextStyle &style, Length x, Length y) {
    if(style.underline || style.strikethrough) {
        PangoAttrList *attrs = pango_attr_list_new();
        if(style.underline) {
            pango_attr_list_insert(attrs, pango_attr_underline_new(PANGO_UNDERLINE_SINGLE));
        }
        if(style.strikethrough) {
            pango_attr_list_insert(attrs, pango_attr_strikethrough_new(TRUE));
        }
        pango_layout_set_attributes(layout, attrs);
        pango_attr_list_unref(attrs);
    }
    cairo_save(cr);
    set_color(style.color);
    cairo_move_to(cr, x.pt(), y.pt());
    pango_cairo_update_layout(cr, layout);
    pango_cairo_show_layout(cr, layout);
    cairo_restore(cr);
}

Length PdfRenderer::show_text(
    const std::string &text, const TextStyle &style, Length x, Length y, Length w) {
    set_layout_text(layout, text, style, w);
    const Length h = layout_height(layout);
    show_layout(style, x, y);
    return h;
}

void PdfRenderer::draw_text_label(const TextLabelProps &label, const Rect &r) {
    if(label.style.background) {
        fill_box(r.left(), r.top(), r.size.w, r.size.h, *label.style.background);
    }
    show_text(label.content, label.style, r.left(), r.top(), r.size.w);
}

void PdfRenderer::draw_paragraph(const ParagraphProps &paragraph, const Rect &r) {
    if(paragraph.style.background) {
        fill_box(r.left(), r.top(), r.size.w, r.size.h, *paragraph.style.background);
    }
    Length y = r.top();
    for(const auto &text : split_paragraphs(paragraph.content)) {
        set_layout_text(layout, text, paragraph.style, r.size.w);
        pango_layout_set_indent(layout, int(paragraph.first_line_indent * PANGO_SCALE));
        if(paragraph.clamp_lines > 0) {
            pango_layout_set_height(layout, -paragraph.clamp_lines);
            pango_layout_set_ellipsize(layout, PANGO_ELLIPSIZE_END);
        }
        const Length h = layout_height(layout);
        show_layout(paragraph.style, r.left(), y);
        y += h + Length::from_pt(paragraph.paragraph_spacing);
    }
}

void PdfRenderer::draw_table(const TableProps &table, const Rect &r) {
    const auto geometry = measure_table(layout, table, r.size.w);
    if(geometry.columns == 0) {
        return;
    }
    const Length padding = Length::from_pt(table.cell_padding);
    const Length text_width = max(geometry.column_width - 2 * padding, Length::from_pt(1));
    const Length border = Length::from_pt(table.border_width);
    const bool has_header = table.show_header && !table.headers.empty();
    const Length table_w = geometry.column_width * double(geometry.columns);

    Length y = r.top();
    for(size_t row = 0; row < geometry.row_heights.size(); ++row) {
        const bool is_header = has_header && row == 0;
        const size_t data_row = has_header ? row - 1 : row;
        const Length h = geometry.row_heights[row];
        const auto &cells = is_header ? table.headers : table.data[data_row];

        TextStyle style;
        if(is_header) {
            fill_box(r.left(), y, table_w, h, table.header_background);
            style.font_size = table.header_font_size;
            style.bold = table.header_bold;
            style.color = table.header_text;
        } else {
            if(table.alternate_rows && data_row % 2 == 1) {
                fill_box(r.left(), y, table_w, h, table.odd_row_background);
            }
            style.font_size = table.cell_font_size;
            style.color = table.cell_text;
        }
        for(size_t col = 0; col < cells.size(); ++col) {
            const Length x = r.left() + geometry.column_width * double(col);
            show_text(cells[col], style, x + padding, y + padding, text_width);
        }
        if(table.border_style == "all" || table.border_style == "horizontal") {
            draw_line(r.left(), y, r.left() + table_w, y, border, table.border_color);
        }
        if(table.border_style == "all") {
            for(size_t col = 1; col < geometry.columns; ++col) {
                const Length x = r.left() + geometry.column_width * double(col);
                draw_line(x, y, x, y + h, border, table.border_color);
            }
        }
        y += h;
    }
    const Length table_h = y - r.top();
    if(table.border_style == "all" || table.border_style == "outer") {
        draw_box(r.left(), r.top(), table_w, table_h, border, table.border_color);
    } else if(table.border_style == "horizontal") {
        draw_line(r.left(), y, r.left() + table_w, y, border, table.border_color);
    }
}

Length PdfRenderer::draw_field_label(
    const std::string &label, bool required, double size, const Color &color, const Rect &r) {
    if(label.empty()) {
        return Length::zero();
    }
    const std::string text = required ? label + " *" : label;
    const Length h = show_text(text, plain_style(size, color), r.left(), r.top(), r.size.w);
    return h + Length::from_pt(element_spacing / 2);
}

void PdfRenderer::draw_input_box(const std::string &text,
                                 double font_size,
                                 const Color &text_color,
                                 const Color &border,
                                 double border_width,
                                 Length x,
                                 Length y,
                                 Length w,
                                 Length h) {
    draw_box(x, y, w, h, Length::from_pt(border_width), border);
    if(text.empty()) {
        return;
    }
    const Length padding = Length::from_pt(element_spacing);
    const auto style = plain_style(font_size, text_color);
    set_layout_text(layout, text, style, max(w - 2 * padding, Length::from_pt(1)));
    const Length text_h = layout_height(layout);
    show_layout(style, x + padding, y + max(Length::zero(), (h - text_h) / 2));
}

void PdfRenderer::draw_checkbox(const CheckboxProps &checkbox, const Rect &r) {
    auto it = checkbox_sizes.find(checkbox.size);
    const Length size = Length::from_pt(it != checkbox_sizes.end() ? it->second : checkbox_sizes.at("medium"));
    const Length box_y = r.top() + max(Length::zero(), (r.size.h - size) / 2);
    if(checkbox.checked) {
        fill_box(r.left(), box_y, size, size, checkbox.checked_color);
        cairo_save(cr);
        set_color(white);
        cairo_set_line_width(cr, std::max(1.0, size.pt() / 8));
        cairo_set_line_cap(cr, CAIRO_LINE_CAP_ROUND);
        cairo_move_to(cr, (r.left() + size * 0.22).pt(), (box_y + size * 0.52).pt());
        cairo_line_to(cr, (r.left() + size * 0.42).pt(), (box_y + size * 0.72).pt());
        cairo_line_to(cr, (r.left() + size * 0.78).pt(), (box_y + size * 0.30).pt());
        cairo_stroke(cr);
        cairo_restore(cr);
    } else {
        draw_box(r.left(), box_y, size, size, Length::from_pt(checkbox.border_width), checkbox.border_color);
    }
    if(checkbox.label.empty()) {
        return;
    }
    const Length text_x = r.left() + size + Length::from_pt(checkbox.spacing);
    const auto style = plain_style(checkbox.label_font_size, checkbox.label_color);
    set_layout_text(layout, checkbox.label, style, max(r.right() - text_x, Length::from_pt(1)));
    const Length text_h = layout_height(layout);
    show_layout(style, text_x, box_y + (size - text_h) / 2);
}

void PdfRenderer::draw_signature_box(const SignatureBoxProps &signature, const Rect &r) {
    const Length line_y = r.top() + min(Length::from_pt(signature_area_height), r.size.h);
    const bool with_date = signature.date_required;
    const Length sign_w = with_date ? r.size.w * 0.6 : r.size.w;
    if(signature.show_line) {
        draw_line(r.left(),
                  line_y,
                  r.left() + sign_w,
                  line_y,
                  Length::from_pt(signature.line_thickness),
                  signature.line_color);
    }
    Length y = line_y + Length::from_pt(element_spacing);
    if(!signature.signer_name.empty()) {
        TextStyle style = plain_style(signature.signer_name_font_size, black);
        style.bold = true;
        y += show_text(signature.signer_name, style, r.left(), y, sign_w);
    }
    if(!signature.signer_title.empty()) {
        show_text(signature.signer_title,
                  plain_style(signature.signer_title_font_size, placeholder_grey),
                  r.left(),
                  y,
                  sign_w);
    }
    if(with_date) {
        const Length date_x = r.left() + r.size.w * 0.7;
        const Length date_w = r.right() - date_x;
        if(signature.show_line) {
            draw_line(date_x,
                      line_y,
                      r.right(),
                      line_y,
                      Length::from_pt(signature.line_thickness),
                      signature.line_color);
        }
        show_text(signature.date_label,
                  plain_style(signature.signer_title_font_size, placeholder_grey),
                  date_x,
                  line_y + Length::from_pt(element_spacing),
                  date_w);
    }
}

void PdfRenderer::draw_divider(const DividerProps &divider, const Rect &r) {
    cairo_save(cr);
    if(!divider.dash_pattern.empty()) {
        cairo_set_dash(cr, divider.dash_pattern.data(), int(divider.dash_pattern.size()), 0.0);
    }
    const Length thickness = Length::from_pt(divider.thickness);
    if(divider.vertical) {
        const Length x = r.left() + r.size.w / 2;
        draw_line(x, r.top(), x, r.bottom(), thickness, divider.color);
    } else {
        const Length y = r.top() + r.size.h / 2;
        draw_line(r.left(), y, r.right(), y, thickness, divider.color);
    }
    cairo_restore(cr);
}

void PdfRenderer::draw_picture(const ImageProps &image, const std::string &id, const Rect &r) {
    if(image.src.empty()) {
        draw_placeholder("Image", r);
        return;
    }
    const auto info = get_image(image.src);
    if(!info.surf) {
        messages.push_back("Image of component '" + id + "' is not a readable PNG.");
        draw_placeholder("Image", r);
        return;
    }
    draw_image(info, r, image.fit_mode);
}

void PdfRenderer::draw_barcode(const BarcodeProps &barcode, const Rect &r) {
    const auto format = barcode_format(barcode.barcode_type);
    if(!format) {
        messages.push_back("Unknown barcode type: " + barcode.barcode_type);
        draw_placeholder("Barcode", r);
        return;
    }
    if(is_blank(barcode.value)) {
        draw_placeholder("Enter barcode value", r);
        return;
    }
    ZXing::BitMatrix matrix;
    try {
        matrix = encode_barcode(barcode.value, *format, barcode.error_correction);
    } catch(const std::exception &e) {
        messages.push_back(std::string("Barcode error: ") + e.what());
        draw_placeholder("Barcode", r);
        return;
    }
    fill_box(r.left(), r.top(), r.size.w, r.size.h, barcode.background);
    if(matrix.width() <= 0 || matrix.height() <= 0) {
        return;
    }

    const Length quiet = Length::from_pt(barcode.quiet_zone);
    const Length x0 = r.left() + quiet;
    const Length y0 = r.top() + quiet;
    const Length w = max(Length::zero(), r.size.w - quiet * 2);
    const Length h = max(Length::zero(), r.size.h - quiet * 2);
    const bool linear = is_linear_barcode(*format);
    const bool with_text = linear && barcode.show_value && barcode.value_font_size > 0;

    Length module_w = w / matrix.width();
    Length module_h;
    Length bars_h = h;
    Length left = x0;
    Length top = y0;
    if(linear) {
        if(with_text) {
            bars_h = max(h - Length::from_pt(barcode.value_font_size * 1.5), h / 2);
        }
        module_h = bars_h / matrix.height();
    } else {
        module_w = min(module_w, h / matrix.height());
        module_h = module_w;
        left = x0 + (w - module_w * matrix.width()) / 2;
        top = y0 + (h - module_h * matrix.height()) / 2;
    }

    cairo_save(cr);
    set_color(barcode.foreground);
    for(int y = 0; y < matrix.height(); ++y) {
        for(int x = 0; x < matrix.width(); ++x) {
            if(matrix.get(x, y)) {
                cairo_rectangle(cr,
                                (left + module_w * x).pt(),
                                (top + module_h * y).pt(),
                                module_w.pt(),
                                module_h.pt());
            }
        }
    }
    cairo_fill(cr);
    cairo_restore(cr);

    if(with_text) {
        TextStyle style = plain_style(barcode.value_font_size, barcode.foreground);
        style.align = "center";
        show_text(barcode.value, style, x0, y0 + bars_h, w);
    }
}

void PdfRenderer::draw_placeholder(const std::string &label, const Rect &r) {
    fill_box(r.left(), r.top(), r.size.w, r.size.h, placeholder_fill);
    cairo_save(cr);
    const double dashes[2] = {4.0, 2.0};
    cairo_set_dash(cr, dashes, 2, 0.0);
    draw_box(r.left(), r.top(), r.size.w, r.size.h, Length::from_pt(1), placeholder_grey);
    cairo_restore(cr);
    TextStyle style = plain_style(settings.default_font_size, placeholder_grey);
    style.font_family = settings.default_font_family;
    style.align = "center";
    set_layout_text(layout, label, style, r.size.w);
    const Length text_h = layout_height(layout);
    show_layout(style, r.left(), r.top() + max(Length::zero(), (r.size.h - text_h) / 2));
}

void PdfRenderer::draw_debug_frame(const Rect &r) {
    draw_box(r.left(), r.top(), r.size.w, r.size.h, Length::from_pt(0.3), debug_red);
}

void PdfRenderer::draw_box(Length x, Length y, Length w, Length h, Length thickness, const Color &color) {
    cairo_save(cr);
    cairo_set_line_width(cr, thickness.pt());
    set_color(color);
    cairo_move_to(cr, x.pt(), y.pt());
    cairo_line_to(cr, (x + w).pt(), y.pt());
    cairo_line_to(cr, (x + w).pt(), (y + h).pt());
    cairo_line_to(cr, x.pt(), (y + h).pt());
    cairo_close_path(cr);
    cairo_stroke(cr);
    cairo_restore(cr);
}

void PdfRenderer::fill_box(Length x, Length y, Length w, Length h, const Color &color) {
    cairo_save(cr);
    set_color(color);
    cairo_move_to(cr, x.pt(), y.pt());
    cairo_line_to(cr, (x + w).pt(), y.pt());
    cairo_line_to(cr, (x + w).pt(), (y + h).pt());
    cairo_line_to(cr, x.pt(), (y + h).pt());
    cairo_close_path(cr);
    cairo_fill(cr);
    cairo_restore(cr);
}

void PdfRenderer::draw_line(
    Length x0, Length y0, Length x1, Length y1, Length thickness, const Color &color) {
    cairo_save(cr);
    set_color(color);
    cairo_set_line_width(cr, thickness.pt());
    cairo_move_to(cr, x0.pt(), y0.pt());
    cairo_line_to(cr, x1.pt(), y1.pt());
    cairo_stroke(cr);
    cairo_restore(cr);
}

ImageInfo PdfRenderer::get_image(const std::string &src) {
    ImageInfo result{nullptr, 0, 0};
    auto it = loaded_images.find(src);
    if(it != loaded_images.end()) {
        result.surf = it->second;
    } else {
        cairo_surface_t *s = load_png(src);
        if(cairo_surface_status(s) != CAIRO_STATUS_SUCCESS) {
            cairo_surface_destroy(s);
            return result;
        }
        loaded_images[src] = s;
        result.surf = s;
    }
    result.w = cairo_image_surface_get_width(result.surf);
    result.h = cairo_image_surface_get_height(result.surf);
    return result;
}

void PdfRenderer::draw_image(const ImageInfo &image, const Rect &area, const std::string &fit_mode) {
    if(image.w <= 0 || image.h <= 0) {
        return;
    }
    double sx = area.size.w.pt() / image.w;
    double sy = area.size.h.pt() / image.h;
    if(fit_mode == "fitWidth") {
        sy = sx;
    } else if(fit_mode == "fitHeight") {
        sx = sy;
    } else if(fit_mode != "fitUnproportionally") {
        sx = sy = std::min(sx, sy);
    }
    cairo_save(cr);
    cairo_rectangle(cr, area.left().pt(), area.top().pt(), area.size.w.pt(), area.size.h.pt());
    cairo_clip(cr);
    cairo_translate(cr, area.left().pt(), area.top().pt());
    cairo_scale(cr, sx, sy);
    cairo_set_source_surface(cr, image.surf, 0, 0);
    cairo_paint(cr);
    cairo_restore(cr);
}
