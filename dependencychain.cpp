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

#include <algorithm>
#include <deque>
#include <unordered_map>

namespace {

bool by_position(const LayoutComponent *a, const LayoutComponent *b) {
    if(a->rect().top() != b->rect().top()) {
        return a->rect().top() < b->rect().top();
    }
    return a->rect().left() < b->rect().left();
}

} // namespace

DependencyMap build_dependency_map(const std::vector<LayoutComponent> &layout) {
    DependencyMap deps;
    for(const auto &a : layout) {
        if(!a.is_auto_expand() || !a.pushes_siblings()) {
            continue;
        }
        auto &pushed = deps[a.component->id];
        for(const auto &b : layout) {
            if(&a == &b) {
                continue;
            }
            if(should_push_down(a.rect(), b.rect())) {
                pushed.push_back(b.component->id);
            }
        }
    }
    return deps;
}

bool DependencyGroup::is_flow() const {
    return members.size() > 1 || (members.size() == 1 && members.front()->is_auto_expand());
}

std::vector<DependencyGroup> group_components_by_dependency(const std::vector<LayoutComponent> &layout,
                                                            const DependencyMap &deps) {
    std::unordered_map<std::string, size_t> index_of;
    for(size_t i = 0; i < layout.size(); ++i) {
        index_of.emplace(layout[i].component->id, i);
    }
    // Undirected, a component belongs with what it pushes and what pushes it.
    std::vector<std::vector<size_t>> neighbours(layout.size());
    for(const auto &[from, targets] : deps) {
        auto from_it = index_of.find(from);
        if(from_it == index_of.end()) {
            continue;
        }
        for(const auto &to : targets) {
            auto to_it = index_of.find(to);
            if(to_it == index_of.end()) {
                continue;
            }
            neighbours[from_it->second].push_back(to_it->second);
            neighbours[to_it->second].push_back(from_it->second);
        }
    }

    std::vector<DependencyGroup> groups;
    std::vector<bool> visited(layout.size(), false);
    for(size_t start = 0; start < layout.size(); ++start) {
        if(visited[start]) {
            continue;
        }
        DependencyGroup group;
        std::deque<size_t> pending{start};
        visited[start] = true;
        while(!pending.empty()) {
            const auto current = pending.front();
            pending.pop_front();
            group.members.push_back(&layout[current]);
            for(const auto next : neighbours[current]) {
                if(!visited[next]) {
                    visited[next] = true;
                    pending.push_back(next);
                }
            }
        }
        std::stable_sort(group.members.begin(), group.members.end(), by_position);
        groups.push_back(std::move(group));
    }
    std::stable_sort(groups.begin(), groups.end(), [](const DependencyGroup &a, const DependencyGroup &b) {
        return a.members.front()->rect().top() < b.members.front()->rect().top();
    });
    return groups;
}

std::vector<FlowItem> flow_group(const DependencyGroup &group, const DependencyMap &deps) {
    std::vector<FlowItem> items;
    if(group.members.empty()) {
        return items;
    }
    if(!group.is_flow()) {
        for(const auto *m : group.members) {
            items.push_back(FlowItem{
                m,
                Rect{Position{m->rect().left(), m->adjusted_y}, Size{m->rect().size.w, m->actual_height}}});
        }
        return items;
    }

    std::unordered_map<std::string, std::vector<const LayoutComponent *>> pushers;
    for(const auto *p : group.members) {
        auto it = deps.find(p->component->id);
        if(it == deps.end()) {
            continue;
        }
        for(const auto &target : it->second) {
            pushers[target].push_back(p);
        }
    }

    std::unordered_map<const LayoutComponent *, Length> shift;
    for(const auto *m : group.members) {
        Length s = Length::zero();
        auto it = pushers.find(m->component->id);
        if(it != pushers.end()) {
            for(const auto *p : it->second) {
                const auto growth = max(Length::zero(), p->expansion());
                s = max(s, shift[p] + growth);
            }
        }
        shift[m] = s;
        items.push_back(FlowItem{
            m,
            Rect{Position{m->rect().left(), m->rect().top() + s}, Size{m->rect().size.w, m->actual_height}}});
    }
    return items;
}
