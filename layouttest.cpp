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

#include <dependencychain.hpp>

#include <cstdio>
#include <cstdlib>
#include <map>

using json = nlohmann::json;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

class FixedMeasurer : public HeightMeasurer {
public:
    explicit FixedMeasurer(std::map<std::string, double> heights_mm) : heights(std::move(heights_mm)) {}

    Length content_height(const ComponentData &component) override {
        auto it = heights.find(component.id);
        if(it == heights.end()) {
            return component.rect.size.h;
        }
        return Length::from_mm(it->second);
    }

private:
    std::map<std::string, double> heights;
};

ComponentData component(const char *id,
                        const char *type,
                        double x,
                        double y,
                        double w,
                        double h,
                        bool expand = false,
                        bool push = true) {
    json data{{"id", id},
              {"type", type},
              {"position", {{"x", x}, {"y", y}}},
              {"size", {{"width", w}, {"height", h}}}};
    if(expand) {
        data["layout"] = {{"autoExpand", true}, {"pushSiblings", push}};
    }
    return parse_component(data);
}

Rect rect(double x, double y, double w, double h) {
    return Rect{Position{Length::from_mm(x), Length::from_mm(y)},
                Size{Length::from_mm(w), Length::from_mm(h)}};
}

const LayoutComponent &by_id(const std::vector<LayoutComponent> &layout, const std::string &id) {
    for(const auto &lc : layout) {
        if(lc.component->id == id) {
            return lc;
        }
    }
    printf("No component %s\n", id.c_str());
    std::abort();
}

const FlowItem &item_of(const std::vector<FlowItem> &items, const std::string &id) {
    for(const auto &i : items) {
        if(i.component->component->id == id) {
            return i;
        }
    }
    printf("No flow item %s\n", id.c_str());
    std::abort();
}

} // namespace

void test_geometry() {
    CHECK(horizontal_overlap(rect(0, 0, 100, 10), rect(50, 40, 100, 10)));
    CHECK(!horizontal_overlap(rect(0, 0, 100, 10), rect(100, 0, 10, 10)));
    CHECK(should_push_down(rect(0, 0, 100, 20), rect(0, 20, 100, 10)));
    CHECK(!should_push_down(rect(0, 0, 100, 20), rect(0, 19, 100, 10)));
    CHECK(!should_push_down(rect(0, 0, 100, 20), rect(150, 20, 20, 10)));
    CHECK(has_overlap(rect(0, 0, 100, 20), rect(50, 10, 100, 20)));
    CHECK(!has_overlap(rect(0, 0, 100, 20), rect(0, 20, 100, 20)));
}

void test_expansion_pushes_below() {
    const std::vector<ComponentData> components{
        component("A", "paragraph", 0, 0, 100, 20, true),
        component("B", "text-label", 0, 20, 100, 10),
        component("C", "text-label", 150, 20, 20, 10),
    };
    FixedMeasurer measurer({{"A", 30}});
    auto layout = provisional_layout(components);
    apply_measurements(layout, measurer);
    CHECK(by_id(layout, "A").actual_height == Length::from_mm(30));
    CHECK(by_id(layout, "A").adjusted_y == Length::from_mm(0));
    CHECK(by_id(layout, "B").adjusted_y == Length::from_mm(30));
    CHECK(by_id(layout, "C").adjusted_y == Length::from_mm(20));
}

void test_declared_height_is_minimum() {
    const std::vector<ComponentData> components{
        component("A", "paragraph", 0, 0, 100, 20, true),
        component("B", "text-label", 0, 30, 100, 10),
    };
    FixedMeasurer measurer({{"A", 5}});
    auto layout = provisional_layout(components);
    apply_measurements(layout, measurer);
    CHECK(by_id(layout, "A").actual_height == Length::from_mm(20));
    CHECK(by_id(layout, "B").adjusted_y == Length::from_mm(30));
}

void test_expansion_restrictions() {
    const std::vector<ComponentData> components{
        component("box", "checkbox", 0, 0, 100, 20, true),
        component("quiet", "paragraph", 200, 0, 100, 20, true, false),
        component("B", "text-label", 0, 20, 100, 10),
        component("C", "text-label", 200, 20, 100, 10),
    };
    FixedMeasurer measurer({{"box", 50}, {"quiet", 50}});
    auto layout = provisional_layout(components);
    apply_measurements(layout, measurer);
    CHECK(by_id(layout, "box").actual_height == Length::from_mm(20));
    CHECK(by_id(layout, "quiet").actual_height == Length::from_mm(50));
    CHECK(by_id(layout, "B").adjusted_y == Length::from_mm(20));
    CHECK(by_id(layout, "C").adjusted_y == Length::from_mm(20));
    CHECK(build_dependency_map(layout).empty());
}

void test_affected_components() {
    const std::vector<ComponentData> components{
        component("A", "paragraph", 0, 0, 100, 20, true),
        component("far", "text-label", 10, 80, 50, 10),
        component("near", "text-label", 0, 25, 100, 10),
        component("side", "text-label", 120, 25, 10, 10),
    };
    const auto affected = get_affected_components(components[0], components);
    CHECK(affected.size() == 2);
    CHECK(affected[0]->id == "near");
    CHECK(affected[1]->id == "far");
}

void test_dependency_groups() {
    const std::vector<ComponentData> components{
        component("A", "paragraph", 0, 0, 100, 20, true),
        component("B", "text-label", 0, 20, 100, 10),
        component("C", "text-label", 150, 20, 20, 10),
    };
    FixedMeasurer measurer({{"A", 30}});
    auto layout = provisional_layout(components);
    apply_measurements(layout, measurer);

    const auto deps = build_dependency_map(layout);
    CHECK(deps.size() == 1);
    CHECK(deps.at("A").size() == 1);
    CHECK(deps.at("A")[0] == "B");

    const auto groups = group_components_by_dependency(layout, deps);
    CHECK(groups.size() == 2);
    CHECK(groups[0].members.size() == 2);
    CHECK(groups[0].members[0]->component->id == "A");
    CHECK(groups[0].members[1]->component->id == "B");
    CHECK(groups[0].is_flow());
    CHECK(groups[1].members.size() == 1);
    CHECK(!groups[1].is_flow());

    const auto flow = flow_group(groups[0], deps);
    CHECK(flow.size() == 2);
    CHECK(item_of(flow, "A").placed.top() == Length::from_mm(0));
    CHECK(item_of(flow, "A").placed.size.h == Length::from_mm(30));
    CHECK(item_of(flow, "B").placed.top() == Length::from_mm(30));
    CHECK(item_of(flow, "B").placed.left() == Length::from_mm(0));

    const auto fixed = flow_group(groups[1], deps);
    CHECK(fixed.size() == 1);
    CHECK(fixed[0].placed.top() == Length::from_mm(20));
    CHECK(fixed[0].placed.left() == Length::from_mm(150));
}

void test_side_by_side_pushers() {
    // Two growing columns above one wide component. The component below
    // moves by the larger growth only.
    const std::vector<ComponentData> components{
        component("left", "paragraph", 0, 0, 50, 20, true),
        component("right", "paragraph", 60, 0, 50, 20, true),
        component("below", "table", 0, 30, 110, 10),
    };
    FixedMeasurer measurer({{"left", 40}, {"right", 25}});
    auto layout = provisional_layout(components);
    apply_measurements(layout, measurer);
    const auto deps = build_dependency_map(layout);
    const auto groups = group_components_by_dependency(layout, deps);
    CHECK(groups.size() == 1);
    CHECK(groups[0].members.size() == 3);

    const auto flow = flow_group(groups[0], deps);
    CHECK(item_of(flow, "left").placed.top() == Length::from_mm(0));
    CHECK(item_of(flow, "right").placed.top() == Length::from_mm(0));
    CHECK(item_of(flow, "below").placed.top() == Length::from_mm(50));
    CHECK(item_of(flow, "below").placed.size.h == Length::from_mm(10));
}

void test_chained_pushers() {
    const std::vector<ComponentData> components{
        component("A", "paragraph", 0, 0, 100, 20, true),
        component("B", "paragraph", 0, 20, 100, 10, true),
        component("C", "text-label", 0, 40, 100, 10),
    };
    FixedMeasurer measurer({{"A", 25}, {"B", 15}});
    auto layout = provisional_layout(components);
    apply_measurements(layout, measurer);
    const auto deps = build_dependency_map(layout);
    const auto groups = group_components_by_dependency(layout, deps);
    CHECK(groups.size() == 1);
    const auto flow = flow_group(groups[0], deps);
    CHECK(item_of(flow, "B").placed.top() == Length::from_mm(25));
    CHECK(item_of(flow, "C").placed.top() == Length::from_mm(50));
}

int main(int, char **) {
    printf("Running layout tests.\n");
    test_geometry();
    test_expansion_pushes_below();
    test_declared_height_is_minimum();
    test_expansion_restrictions();
    test_affected_components();
    test_dependency_groups();
    test_side_by_side_pushers();
    test_chained_pushers();
    return 0;
}
