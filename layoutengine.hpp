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

#include <vector>

struct LayoutComponent {
    const ComponentData *component;
    Length adjusted_y;
    Length actual_height;

    const Rect &rect() const { return component->rect; }
    bool is_auto_expand() const { return component->auto_expand(); }
    bool pushes_siblings() const { return component->pushes_siblings(); }
    Length adjusted_bottom() const { return adjusted_y + actual_height; }
    Length expansion() const { return actual_height - component->rect.size.h; }
};

/*
 * Layout is done in two steps. The provisional layout places components at
 * their declared positions and sizes, sorted by (y, x). After that the
 * content of auto expanding components is measured, and apply_measurements
 * moves every component below a grown one down by the amount it grew.
 *
 * The returned entries point to the argument, which must outlive them.
 */
std::vector<LayoutComponent> provisional_layout(const std::vector<ComponentData> &components);

void apply_measurements(std::vector<LayoutComponent> &layout, HeightMeasurer &measurer);

// Recomputes adjusted_y from the current actual heights.
void propagate_expansion(std::vector<LayoutComponent> &layout);

bool horizontal_overlap(const Rect &a, const Rect &b);

// b starts at or below the bottom of a and they overlap horizontally.
bool should_push_down(const Rect &a, const Rect &b);

bool has_overlap(const Rect &a, const Rect &b);

std::vector<const ComponentData *>
get_affected_components(const ComponentData &expander, const std::vector<ComponentData> &all);
