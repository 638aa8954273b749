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

#include <document.hpp>
#include <measurer.hpp>

#include <cairo.h>
#include <pango/pangocairo.h>

#include <string>
#include <vector>

void setup_pango(PangoLayout *layout, const TextStyle &style);

// Prepares a wrapping layout of the given width. The style is set up too.
void set_layout_text(PangoLayout *layout, const std::string &text, const TextStyle &style, Length width);

Length layout_height(PangoLayout *layout);

// Paragraphs are separated by newlines.
std::vector<std::string> split_paragraphs(const std::string &content);

struct TableGeometry {
    size_t columns = 0;
    Length column_width;
    // Header row first when shown.
    std::vector<Length> row_heights;

    Length total_height() const;
};

TableGeometry measure_table(PangoLayout *layout, const TableProps &table, Length width);

Length measure_paragraph(PangoLayout *layout, const ParagraphProps &paragraph, Length width);

class PangoMeasurer : public HeightMeasurer {
public:
    PangoMeasurer();
    ~PangoMeasurer();

    PangoMeasurer(const PangoMeasurer &) = delete;
    PangoMeasurer &operator=(const PangoMeasurer &) = delete;

    Length content_height(const ComponentData &component) override;

private:
    cairo_surface_t *surf;
    cairo_t *cr;
    PangoLayout *layout;
};
