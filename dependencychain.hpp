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

#include <layoutengine.hpp>

#include <map>
#include <string>
#include <vector>

// Component id -> ids of the components it pushes down when it grows.
typedef std::map<std::string, std::vector<std::string>> DependencyMap;

DependencyMap build_dependency_map(const std::vector<LayoutComponent> &layout);

struct DependencyGroup {
    // Sorted by y, then x.
    std::vector<const LayoutComponent *> members;

    // Lone components that do not grow are placed at their adjusted position directly.
    bool is_flow() const;
};

// Splits components into connected groups, following push edges in both
// directions. Groups are sorted by the y of their first member.
std::vector<DependencyGroup> group_components_by_dependency(const std::vector<LayoutComponent> &layout,
                                                            const DependencyMap &deps);

struct FlowItem {
    const LayoutComponent *component;
    Rect placed;
};

/*
 * Lays out one group as a vertical flow starting at the first member.
 * Every member keeps the declared distance to the components that push
 * it, so a member moves down by the growth of everything above it in the
 * chain. Members next to each other stay next to each other.
 */
std::vector<FlowItem> flow_group(const DependencyGroup &group, const DependencyMap &deps);
