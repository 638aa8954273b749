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

#include <computed.hpp>
#include <expression.hpp>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace {

enum class VisitState : int { Unvisited, Visiting, Done };

class TopologicalSorter {
public:
    explicit TopologicalSorter(const std::vector<const VariableDefinition *> &defs) {
        for(const auto *d : defs) {
            by_name[d->name] = d;
            state[d->name] = VisitState::Unvisited;
        }
    }

    void visit(const VariableDefinition *def) {
        auto &s = state[def->name];
        if(s == VisitState::Done) {
            return;
        }
        if(s == VisitState::Visiting) {
            mark_cycle(def->name);
            return;
        }
        s = VisitState::Visiting;
        stack.push_back(def->name);
        for(const auto &dep : def->depends_on) {
            auto it = by_name.find(dep);
            if(it != by_name.end()) {
                visit(it->second);
            }
        }
        stack.pop_back();
        state[def->name] = VisitState::Done;
        sorted.push_back(def);
    }

    ComputedSchedule result() const {
        ComputedSchedule schedule;
        for(const auto *d : sorted) {
            if(on_cycle.count(d->name) > 0) {
                schedule.cyclic.push_back(d);
            } else {
                schedule.order.push_back(d);
            }
        }
        return schedule;
    }

private:
    // Everything on the DFS stack from the revisited node onwards forms the cycle.
    void mark_cycle(const std::string &name) {
        auto it = std::find(stack.begin(), stack.end(), name);
        for(; it != stack.end(); ++it) {
            on_cycle.insert(*it);
        }
    }

    std::unordered_map<std::string, const VariableDefinition *> by_name;
    std::unordered_map<std::string, VisitState> state;
    std::vector<std::string> stack;
    std::unordered_set<std::string> on_cycle;
    std::vector<const VariableDefinition *> sorted;
};

std::string fallback_value(const VariableDefinition &def) {
    return def.default_value.value_or(std::string{});
}

} // namespace

bool is_evaluable(const VariableDefinition &def) { return def.is_computed && !def.expression.empty(); }

ComputedSchedule schedule_computed(const std::vector<VariableDefinition> &definitions) {
    std::vector<const VariableDefinition *> computed;
    for(const auto &d : definitions) {
        if(is_evaluable(d)) {
            computed.push_back(&d);
        }
    }
    TopologicalSorter sorter(computed);
    for(const auto *d : computed) {
        sorter.visit(d);
    }
    return sorter.result();
}

ComputedResult evaluate_computed(const std::vector<VariableDefinition> &definitions,
                                 const VariablePool &merged) {
    const auto schedule = schedule_computed(definitions);
    ComputedResult result{merged, {}};
    for(const auto *def : schedule.cyclic) {
        result.pool = result.pool.with_simple(def->name, fallback_value(*def));
        result.cyclic.push_back(def->name);
    }
    for(const auto *def : schedule.order) {
        ExpressionEvaluator evaluator(result.pool);
        auto value = evaluator.try_evaluate_to_string(def->expression, def->format);
        result.pool = result.pool.with_simple(def->name, value ? *value : fallback_value(*def));
    }
    return result;
}
