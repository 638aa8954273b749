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

#include <variables.hpp>

#include <string>
#include <vector>

struct ComputedSchedule {
    // Dependencies come before the definitions that use them.
    std::vector<const VariableDefinition *> order;
    // Definitions that lie on a dependency cycle. These are never evaluated.
    std::vector<const VariableDefinition *> cyclic;
};

struct ComputedResult {
    VariablePool pool;
    std::vector<std::string> cyclic;
};

bool is_evaluable(const VariableDefinition &def);

ComputedSchedule schedule_computed(const std::vector<VariableDefinition> &definitions);

// Evaluates computed definitions in schedule order. Every expression sees
// the values computed before it. A failing expression yields the default
// value of its definition, or an empty string.
ComputedResult evaluate_computed(const std::vector<VariableDefinition> &definitions,
                                 const VariablePool &merged);
