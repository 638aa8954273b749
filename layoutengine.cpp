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

#include <layoutengine.hpp>

#include <algorithm>

std::vector<LayoutComponent> provisional_layout(const std::vector<ComponentData> &components) {
    std::vector<LayoutComponent> layout;
    layout.reserve(components.size());
    for(const auto &c : components) {
        layout.push_back(LayoutComponent{&c, c.rect.top(), c.rect.size.h});
    }
    std::stable_sort(
        layout.begin(), layout.end(), [](const LayoutComponent &a, const LayoutComponent &b) {
            if(a.rect().top() != b.rect().top()) {
                return a.rect().top() < b.rect().top();
            }
            return a.rect().left() < b.rect().left();
        });
    return layout;
}

void apply_measurements(std::vector<LayoutComponent> &layout, HeightMeasurer &measurer) {
    for(auto &lc : layout) {
        if(!lc.is_auto_expand()) {
            continue;
        }
        // The declared height is the minimum.
        lc.actual_height = max(lc.rect().size.h, measurer.content_height(*lc.component));
    }
    propagate_expansion(layout);
}

void propagate_expansion(std::vector<LayoutComponent> &layout) {
    for(auto &lc : layout) {
        lc.adjusted_y = lc.rect().top();
    }
    for(size_t i = 0; i < layout.size(); ++i) {
        const auto &current = layout[i];
        if(!current.is_auto_expand() || !current.pushes_siblings()) {
            continue;
        }
        const auto delta = current.expansion();
        if(!delta.is_positive()) {
            continue;
        }
        for(size_t j = i + 1; j < layout.size(); ++j) {
            auto &below = layout[j];
            if(should_push_down(current.rect(), below.rect())) {
                below.adjusted_y += delta;
            }
        }
    }
}

bool horizontal_overlap(const Rect &a, const Rect &b) {
    return a.left() < b.right() && a.right() > b.left();
}

bool should_push_down(const Rect &a, const Rect &b) {
    if(b.top() < a.bottom()) {
        return false;
    }
    return horizontal_overlap(a, b);
}

bool has_overlap(const Rect &a, const Rect &b) {
    const bool vertical = a.top() < b.bottom() && a.bottom() > b.top();
    return horizontal_overlap(a, b) && vertical;
}

std::vector<const ComponentData *>
get_affected_components(const ComponentData &expander, const std::vector<ComponentData> &all) {
    std::vector<const ComponentData *> affected;
    for(const auto &c : all) {
        if(&c == &expander || c.id == expander.id) {
            continue;
        }
        if(should_push_down(expander.rect, c.rect)) {
            affected.push_back(&c);
        }
    }
    std::stable_sort(affected.begin(),
                     affected.end(),
                     [](const ComponentData *a, const ComponentData *b) {
                         return a->rect.top() < b->rect.top();
                     });
    return affected;
}
