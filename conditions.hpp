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

#include <optional>
#include <string>
#include <vector>

struct ConditionRule {
    std::string variable;
    std::string op{"equals"};
    // Not used by is_empty, is_not_empty, is_true and is_false.
    std::optional<std::string> value;
};

struct ConditionConfig {
    bool enabled = true;
    // "all" or "any"
    std::string logic{"all"};
    std::vector<ConditionRule> rules;
};

ConditionConfig parse_condition(const nlohmann::json &data);

bool evaluate_rule(const ConditionRule &rule, const VariablePool &pool);

// Components without a condition, with a disabled one or without rules are always rendered.
bool should_render(const std::optional<ConditionConfig> &condition, const VariablePool &pool);
