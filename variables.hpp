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

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class VariableType : int {
    String,
    Number,
    Boolean,
    Date,
    Currency,
    Array,
    Object,
    Unknown,
};

VariableType parse_variable_type(std::string_view type_name);

struct VariableDefinition {
    std::string name;
    std::string type_name{"string"};
    std::string label;
    std::string description;
    bool required = false;
    std::optional<std::string> default_value;
    std::optional<std::string> pattern;
    std::optional<std::string> format;
    std::string category;
    int order = 0;
    std::vector<VariableDefinition> item_schema;
    std::vector<VariableDefinition> properties;
    std::optional<int> min_items;
    std::optional<int> max_items;
    bool is_computed = false;
    std::string expression;
    std::vector<std::string> depends_on;

    VariableType type() const { return parse_variable_type(type_name); }
    const std::string &display_name() const { return label.empty() ? name : label; }
    bool has_default() const;
};

VariableDefinition parse_variable_definition(const nlohmann::json &data);
std::vector<VariableDefinition> parse_variable_definitions(const nlohmann::json &data);

typedef std::map<std::string, std::string, std::less<>> SimpleVariables;
typedef std::map<std::string, nlohmann::json, std::less<>> ComplexVariables;

// Result of a lookup that tells apart a missing name from one that is set to null.
struct Definedness {
    bool defined = false;
    std::optional<std::string> value;
};

// Text shown for a JSON value. Objects with "value" and "currency" members
// render as money, other objects and arrays as their JSON text.
std::string json_display_string(const nlohmann::json &value);

bool is_money_object(const nlohmann::json &value);

bool is_truthy_text(std::string_view value);
bool is_truthy(const nlohmann::json &value);

// Walks object members, trying an exact key match before a case-insensitive one.
const nlohmann::json *navigate_json(const nlohmann::json &root,
                                    const std::vector<std::string> &path);

std::vector<std::string> split_path(std::string_view path);

// The resolved variables of one generation. Values are never modified in
// place, every change produces a new pool that shares untouched data.
class VariablePool {
public:
    VariablePool();
    VariablePool(SimpleVariables simple_, ComplexVariables complex_);

    const SimpleVariables &simple() const { return *simple_vars; }
    const ComplexVariables &complex() const { return *complex_vars; }

    VariablePool with_simple(const std::string &name, std::string value) const;
    VariablePool with_complex(const std::string &name, nlohmann::json value) const;
    // Entries of the argument win over existing ones.
    VariablePool with_simple(const SimpleVariables &overrides) const;
    VariablePool with_complex(const ComplexVariables &overrides) const;

    std::optional<std::string> find_simple(std::string_view name) const;
    const nlohmann::json *find_complex(std::string_view name) const;

    std::optional<std::string> resolve(std::string_view name) const;
    std::optional<std::string> resolve_nested(std::string_view path) const;
    Definedness is_defined(std::string_view name) const;

    // Node reached by a dotted path rooted in a complex variable.
    const nlohmann::json *find_json(std::string_view path) const;

    // Truthiness of a block or inline condition. Unknown names are false.
    bool condition(std::string_view name) const;

private:
    VariablePool(std::shared_ptr<const SimpleVariables> s, std::shared_ptr<const ComplexVariables> c)
        : simple_vars(std::move(s)), complex_vars(std::move(c)) {}

    std::shared_ptr<const SimpleVariables> simple_vars;
    std::shared_ptr<const ComplexVariables> complex_vars;
};
