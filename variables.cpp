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

#include <variables.hpp>
#include <jsonhelpers.hpp>
#include <utils.hpp>
#include <valueformat.hpp>

#include <stdexcept>
#include <unordered_map>

using json = nlohmann::json;

namespace {

const std::unordered_map<std::string, VariableType> typemap{
    {"string", VariableType::String},
    {"number", VariableType::Number},
    {"boolean", VariableType::Boolean},
    {"date", VariableType::Date},
    {"currency", VariableType::Currency},
    {"array", VariableType::Array},
    {"object", VariableType::Object},
};

std::optional<std::string> scalar_as_string(const json &value) {
    if(value.is_null()) {
        return {};
    }
    if(value.is_string()) {
        return value.get<std::string>();
    }
    return json_display_string(value);
}

std::vector<VariableDefinition> parse_nested(const json &data, const char *key) {
    auto it = data.find(key);
    if(it == data.end() || !it->is_array()) {
        return {};
    }
    return parse_variable_definitions(*it);
}

} // namespace

VariableType parse_variable_type(std::string_view type_name) {
    auto it = typemap.find(utf8_lower(type_name));
    if(it == typemap.end()) {
        return VariableType::Unknown;
    }
    return it->second;
}

bool VariableDefinition::has_default() const {
    return default_value && !is_blank(*default_value);
}

VariableDefinition parse_variable_definition(const json &data) {
    if(!data.is_object()) {
        throw std::runtime_error("Variable definition is not an object.");
    }
    VariableDefinition def;
    def.name = get_string(data, "name");
    def.type_name = get_string(data, "type", "string");
    def.label = get_string(data, "label", "");
    def.description = get_string(data, "description", "");
    def.required = get_bool(data, "required", false);
    if(auto it = data.find("defaultValue"); it != data.end()) {
        def.default_value = scalar_as_string(*it);
    }
    def.pattern = get_optional_string(data, "pattern");
    def.format = get_optional_string(data, "format");
    def.category = get_string(data, "category", "");
    def.order = get_int(data, "order", 0);
    def.item_schema = parse_nested(data, "itemSchema");
    def.properties = parse_nested(data, "properties");
    def.min_items = get_optional_int(data, "minItems");
    def.max_items = get_optional_int(data, "maxItems");
    def.is_computed = get_bool(data, "isComputed", false);
    def.expression = get_string(data, "expression", "");
    if(auto it = data.find("dependsOn"); it != data.end() && it->is_array()) {
        for(const auto &dep : *it) {
            if(dep.is_string()) {
                def.depends_on.push_back(dep.get<std::string>());
            }
        }
    }
    return def;
}

std::vector<VariableDefinition> parse_variable_definitions(const json &data) {
    std::vector<VariableDefinition> definitions;
    if(!data.is_array()) {
        return definitions;
    }
    for(const auto &entry : data) {
        definitions.push_back(parse_variable_definition(entry));
    }
    return definitions;
}

bool is_money_object(const json &value) {
    return value.is_object() && value.contains("value") && value.contains("currency");
}

std::string json_display_string(const json &value) {
    if(is_money_object(value)) {
        const auto &amount_entry = value["value"];
        double amount = 0;
        if(amount_entry.is_number()) {
            amount = amount_entry.get<double>();
        } else if(amount_entry.is_string()) {
            amount = parse_double(amount_entry.get<std::string>()).value_or(0);
        }
        const auto &code_entry = value["currency"];
        const std::string code = code_entry.is_string() ? code_entry.get<std::string>() : "USD";
        return format_money(amount, code);
    }
    switch(value.type()) {
    case json::value_t::string:
        return value.get<std::string>();
    case json::value_t::boolean:
        return value.get<bool>() ? "true" : "false";
    case json::value_t::null:
    case json::value_t::discarded:
        return std::string{};
    default:
        return value.dump();
    }
}

bool is_truthy_text(std::string_view value) {
    if(is_blank(value)) {
        return false;
    }
    if(iequals(value, "false") || value == "0" || iequals(value, "no") || iequals(value, "null")) {
        return false;
    }
    return true;
}

bool is_truthy(const json &value) {
    switch(value.type()) {
    case json::value_t::boolean:
        return value.get<bool>();
    case json::value_t::string:
        return is_truthy_text(value.get_ref<const std::string &>());
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        return value.get<double>() != 0;
    case json::value_t::array:
        return !value.empty();
    case json::value_t::object:
        return true;
    default:
        return false;
    }
}

const json *navigate_json(const json &root, const std::vector<std::string> &path) {
    const json *current = &root;
    for(const auto &segment : path) {
        if(!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if(it != current->end()) {
            current = &(*it);
            continue;
        }
        const json *found = nullptr;
        for(auto member = current->begin(); member != current->end(); ++member) {
            if(iequals(member.key(), segment)) {
                found = &(*member);
                break;
            }
        }
        if(!found) {
            return nullptr;
        }
        current = found;
    }
    return current;
}

std::vector<std::string> split_path(std::string_view path) { return split(path, '.'); }

VariablePool::VariablePool()
    : simple_vars(std::make_shared<const SimpleVariables>()),
      complex_vars(std::make_shared<const ComplexVariables>()) {}

VariablePool::VariablePool(SimpleVariables simple_, ComplexVariables complex_)
    : simple_vars(std::make_shared<const SimpleVariables>(std::move(simple_))),
      complex_vars(std::make_shared<const ComplexVariables>(std::move(complex_))) {}

VariablePool VariablePool::with_simple(const std::string &name, std::string value) const {
    auto copy = std::make_shared<SimpleVariables>(*simple_vars);
    (*copy)[name] = std::move(value);
    return VariablePool(std::move(copy), complex_vars);
}

VariablePool VariablePool::with_complex(const std::string &name, json value) const {
    auto copy = std::make_shared<ComplexVariables>(*complex_vars);
    (*copy)[name] = std::move(value);
    return VariablePool(simple_vars, std::move(copy));
}

VariablePool VariablePool::with_simple(const SimpleVariables &overrides) const {
    if(overrides.empty()) {
        return *this;
    }
    auto copy = std::make_shared<SimpleVariables>(*simple_vars);
    for(const auto &[name, value] : overrides) {
        (*copy)[name] = value;
    }
    return VariablePool(std::move(copy), complex_vars);
}

VariablePool VariablePool::with_complex(const ComplexVariables &overrides) const {
    if(overrides.empty()) {
        return *this;
    }
    auto copy = std::make_shared<ComplexVariables>(*complex_vars);
    for(const auto &[name, value] : overrides) {
        (*copy)[name] = value;
    }
    return VariablePool(simple_vars, std::move(copy));
}

std::optional<std::string> VariablePool::find_simple(std::string_view name) const {
    auto it = simple_vars->find(name);
    if(it == simple_vars->end()) {
        return {};
    }
    return it->second;
}

const json *VariablePool::find_complex(std::string_view name) const {
    auto it = complex_vars->find(name);
    if(it == complex_vars->end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> VariablePool::resolve(std::string_view name) const {
    if(name.empty()) {
        return {};
    }
    if(name.find('.') != std::string_view::npos) {
        return resolve_nested(name);
    }
    if(auto value = find_simple(name)) {
        return value;
    }
    if(const auto *value = find_complex(name)) {
        return json_display_string(*value);
    }
    return {};
}

std::optional<std::string> VariablePool::resolve_nested(std::string_view path) const {
    const auto parts = split_path(path);
    if(const auto *root = find_complex(parts.front())) {
        const auto *node = navigate_json(*root, {parts.begin() + 1, parts.end()});
        if(node) {
            return json_display_string(*node);
        }
    }
    return find_simple(path);
}

Definedness VariablePool::is_defined(std::string_view name) const {
    if(name.empty()) {
        return Definedness{};
    }
    const json *node = nullptr;
    if(name.find('.') != std::string_view::npos) {
        node = find_json(name);
        if(!node) {
            if(auto flat = find_simple(name)) {
                return Definedness{true, std::move(flat)};
            }
            return Definedness{};
        }
    } else {
        if(auto value = find_simple(name)) {
            return Definedness{true, std::move(value)};
        }
        node = find_complex(name);
        if(!node) {
            return Definedness{};
        }
    }
    if(node->is_null()) {
        return Definedness{true, {}};
    }
    return Definedness{true, json_display_string(*node)};
}

const json *VariablePool::find_json(std::string_view path) const {
    const auto parts = split_path(path);
    const auto *root = find_complex(parts.front());
    if(!root) {
        return nullptr;
    }
    return navigate_json(*root, {parts.begin() + 1, parts.end()});
}

bool VariablePool::condition(std::string_view name) const {
    if(name.find('.') != std::string_view::npos) {
        const auto parts = split_path(name);
        if(const auto *root = find_complex(parts.front())) {
            const auto *node = navigate_json(*root, {parts.begin() + 1, parts.end()});
            return node && is_truthy(*node);
        }
        if(auto flat = find_simple(name)) {
            return is_truthy_text(*flat);
        }
        return false;
    }
    if(auto value = find_simple(name)) {
        return is_truthy_text(*value);
    }
    if(const auto *value = find_complex(name)) {
        return is_truthy(*value);
    }
    return false;
}
