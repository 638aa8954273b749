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

#include <generator.hpp>
#include <settings.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

#include <string>
#include <unordered_map>
#include <vector>

struct ImageInfo {
    cairo_surface_t *surf;
    int w, h;
};

class PdfRenderer {
public:
    explicit PdfRenderer(const char *ofname, const GenerationSettings &settings);
    ~PdfRenderer();

    PdfRenderer(const PdfRenderer &) = delete;
    PdfRenderer &operator=(const PdfRenderer &) = delete;

    void render_page(const ComposedPage &page);
    void render_document(const std::vector<ComposedPage> &pages);

    // Flushes the file. Throws if Cairo could not write it.
    void finish();

    int page_num() const { return pages; }
    const std::vector<std::string> &warnings() const { return messages; }

    void draw_box(Length x, Length y, Length w, Length h, Length thickness, const Color &color);
    void fill_box(Length x, Length y, Length w, Length h, const Color &color);
    void draw_line(Length x0, Length y0, Length x1, Length y1, Length thickness, const Color &color);

    // Returns a null surface if the source is not a readable PNG.
    ImageInfo get_image(const std::string &src);
    void draw_image(const ImageInfo &image, const Rect &area, const std::string &fit_mode);

private:
    void setup_direction(bool rtl);
    void draw_component(const PlacedComponent &placed);
    void draw_text_label(const TextLabelProps &label, const Rect &r);
    void draw_paragraph(const ParagraphProps &paragraph, const Rect &r);
    void draw_table(const TableProps &table, const Rect &r);
    Length draw_field_label(const std::string &label, bool required, double size, const Color &color, const Rect &r);
    void draw_input_box(const std::string &text,
                        double font_size,
                        const Color &text_color,
                        const Color &border,
                        double border_width,
                        Length x,
                        Length y,
                        Length w,
                        Length h);
    void draw_checkbox(const CheckboxProps &checkbox, const Rect &r);
    void draw_signature_box(const SignatureBoxProps &signature, const Rect &r);
    void draw_divider(const DividerProps &divider, const Rect &r);
    void draw_picture(const ImageProps &image, const std::string &id, const Rect &r);
    void draw_barcode(const BarcodeProps &barcode, const Rect &r);
    void draw_placeholder(const std::string &label, const Rect &r);
    void draw_debug_frame(const Rect &r);

    // Draws with the layout as set up by set_layout_text.
    void show_layout(const TextStyle &style, Length x, Length y);
    Length show_text(const std::string &text, const TextStyle &style, Length x, Length y, Length w);
    void set_color(const Color &c);

    GenerationSettings settings;
    int pages = 0;
    bool finished = false;
    cairo_t *cr;
    cairo_surface_t *surf;
    PangoLayout *layout;
    std::unordered_map<std::string, cairo_surface_t *> loaded_images;
    std::vector<std::string> messages;
};
