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

#include <conditions.hpp>
#include <jsonhelpers.hpp>
#include <utils.hpp>

#include <functional>
#include <unordered_map>

using json = nlohmann::json;

namespace {

typedef std::function<bool(const std::optional<std::string> &, const std::string &)> RuleOp;

// Arrays take part in comparisons through their length.
std::optional<std::string> rule_value(const std::string &name, const VariablePool &pool) {
    if(auto simple = pool.find_simple(name)) {
        return simple;
    }
    const auto *node = pool.find_complex(name);
    if(!node || node->is_null()) {
        return {};
    }
    if(node->is_array()) {
        return std::to_string(node->size());
    }
    if(node->is_string()) {
        return node->get<std::string>();
    }
    if(node->is_boolean()) {
        return node->get<bool>() ? "true" : "false";
    }
    return node->dump();
}

bool switch_on(const std::optional<std::string> &value) {
    if(!value || is_blank(*value)) {
        return false;
    }
    const auto lowered = utf8_lower(trim(*value));
    if(lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if(lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    return true;
}

template<typename Compare>
bool compare_ordered(const std::optional<std::string> &value,
                     const std::string &expected,
                     Compare cmp) {
    const std::string text = value.value_or(std::string{});
    const auto a = parse_double(text);
    const auto b = parse_double(expected);
    if(a && b) {
        return cmp(*a, *b);
    }
    return cmp(icompare(text, expected), 0);
}

const std::unordered_map<std::string, RuleOp> rule_ops{
    {"equals",
     [](const std::optional<std::string> &v, const std::string &e) { return v && iequals(*v, e); }},
    {"not_equals",
     [](const std::optional<std::string> &v, const std::string &e) { return !v || !iequals(*v, e); }},
    {"contains",
     [](const std::optional<std::string> &v, const std::string &e) { return v && icontains(*v, e); }},
    {"not_contains",
     [](const std::optional<std::string> &v, const std::string &e) { return !v || !icontains(*v, e); }},
    {"starts_with",
     [](const std::optional<std::string> &v, const std::string &e) {
         return v && istarts_with(*v, e);
     }},
    {"ends_with",
     [](const std::optional<std::string> &v, const std::string &e) { return v && iends_with(*v, e); }},
    {"greater_than",
     [](const std::optional<std::string> &v, const std::string &e) {
         return compare_ordered(v, e, [](auto a, auto b) { return a > b; });
     }},
    {"less_than",
     [](const std::optional<std::string> &v, const std::string &e) {
         return compare_ordered(v, e, [](auto a, auto b) { return a < b; });
     }},
    {"greater_than_or_equals",
     [](const std::optional<std::string> &v, const std::string &e) {
         return compare_ordered(v, e, [](auto a, auto b) { return a >= b; });
     }},
    {"less_than_or_equals",
     [](const std::optional<std::string> &v, const std::string &e) {
         return compare_ordered(v, e, [](auto a, auto b) { return a <= b; });
     }},
    {"is_empty",
     [](const std::optional<std::string> &v, const std::string &) { return !v || is_blank(*v); }},
    {"is_not_empty",
     [](const std::optional<std::string> &v, const std::string &) { return v && !is_blank(*v); }},
    {"is_true", [](const std::optional<std::string> &v, const std::string &) { return switch_on(v); }},
    {"is_false",
     [](const std::optional<std::string> &v, const std::string &) { return !switch_on(v); }},
};

} // namespace

ConditionConfig parse_condition(const json &data) {
    ConditionConfig config;
    config.enabled = get_bool(data, "enabled", true);
    config.logic = get_string(data, "logic", "all");
    auto rules = data.find("rules");
    if(rules != data.end() && rules->is_array()) {
        for(const auto &r : *rules) {
            ConditionRule rule;
            rule.variable = get_string(r, "variable", "");
            rule.op = get_string(r, "operator", "equals");
            rule.value = get_optional_string(r, "value");
            config.rules.push_back(std::move(rule));
        }
    }
    return config;
}

bool evaluate_rule(const ConditionRule &rule, const VariablePool &pool) {
    if(rule.variable.empty()) {
        return true;
    }
    auto it = rule_ops.find(utf8_lower(rule.op));
    if(it == rule_ops.end()) {
        return true;
    }
    return it->second(rule_value(rule.variable, pool), rule.value.value_or(std::string{}));
}

bool should_render(const std::optional<ConditionConfig> &condition, const VariablePool &pool) {
    if(!condition || !condition->enabled || condition->rules.empty()) {
        return true;
    }
    if(iequals(condition->logic, "any")) {
        for(const auto &rule : condition->rules) {
            if(evaluate_rule(rule, pool)) {
                return true;
            }
        }
        return false;
    }
    for(const auto &rule : condition->rules) {
        if(!evaluate_rule(rule, pool)) {
            return false;
        }
    }
    return true;
}
