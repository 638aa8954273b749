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

#include <variableservice.hpp>
#include <computed.hpp>
#include <jsonhelpers.hpp>
#include <regexutils.hpp>
#include <utils.hpp>
#include <valueformat.hpp>

#include <set>
#include <unordered_set>

using json = nlohmann::json;

namespace {

const std::unordered_set<std::string> builtin_names{
    "pageNumber", "totalPages", "date", "year", "time", "datetime", "today", "this"};

std::string quoted_name(const std::string &shown) {
    std::string result{"Variable '"};
    result += shown;
    result += '\'';
    return result;
}

bool is_currency_object_text(const std::string &text) {
    const auto parsed = json::parse(text, nullptr, false);
    if(parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    auto it = parsed.find("value");
    return it != parsed.end() && it->is_number() && it->get<double>() != 0;
}

bool matches_type(VariableType type, const std::string &text) {
    switch(type) {
    case VariableType::Number:
        return parse_double(text).has_value();
    case VariableType::Date:
        return parse_date(text).has_value();
    case VariableType::Boolean:
        return parse_bool(text).has_value() || text == "1" || text == "0";
    case VariableType::Currency:
        return parse_double(text).has_value() || is_currency_object_text(text);
    default:
        return true;
    }
}

void validate_entry(const VariableDefinition &def,
                    const std::string &path,
                    const std::string &shown,
                    const json *value,
                    std::vector<ValidationError> &errors);

void validate_members(const std::vector<VariableDefinition> &members,
                      const std::string &prefix,
                      const json &obj,
                      std::vector<ValidationError> &errors) {
    for(const auto &member : members) {
        const std::string path = prefix + "." + member.name;
        auto it = obj.find(member.name);
        validate_entry(member, path, path, it == obj.end() ? nullptr : &(*it), errors);
    }
}

void validate_items(const VariableDefinition &def,
                    const std::string &path,
                    const json &array,
                    std::vector<ValidationError> &errors) {
    if(def.item_schema.empty()) {
        return;
    }
    for(size_t i = 0; i < array.size(); ++i) {
        const std::string item_path = path + "[" + std::to_string(i) + "]";
        const auto &item = array[i];
        if(!item.is_object()) {
            errors.push_back(ValidationError{
                item_path, ValidationErrorKind::Type, quoted_name(item_path) + " must be an object."});
            continue;
        }
        validate_members(def.item_schema, item_path, item, errors);
    }
}

void validate_entry(const VariableDefinition &def,
                    const std::string &path,
                    const std::string &shown,
                    const json *value,
                    std::vector<ValidationError> &errors) {
    const auto text = value ? runtime_value_string(*value) : std::string{};
    const bool is_empty = is_blank(text);
    if(def.required && (!value || is_empty) && !def.has_default()) {
        errors.push_back(
            ValidationError{path, ValidationErrorKind::Required, quoted_name(shown) + " is required."});
        return;
    }
    if(!value || is_empty) {
        return;
    }
    const auto type = def.type();
    if(type == VariableType::Array) {
        auto array_errors = validate_array_variable(def, *value);
        for(auto &e : array_errors) {
            e.name = path;
            errors.push_back(std::move(e));
        }
        if(value->is_array()) {
            validate_items(def, path, *value, errors);
        }
        return;
    }
    if(type == VariableType::Object) {
        if(!value->is_object()) {
            errors.push_back(ValidationError{
                path, ValidationErrorKind::Type, quoted_name(shown) + " must be a valid object."});
            return;
        }
        validate_members(def.properties, path, *value, errors);
        return;
    }
    if(!matches_type(type, text)) {
        errors.push_back(ValidationError{path,
                                         ValidationErrorKind::Type,
                                         quoted_name(shown) + " must be a valid " + def.type_name +
                                             "."});
        return;
    }
    if(type == VariableType::String && def.pattern && !def.pattern->empty()) {
        // Broken patterns in a definition are not the caller's fault.
        auto regex = try_compile_regex(*def.pattern);
        if(regex && !regex_search(regex.get(), text)) {
            errors.push_back(ValidationError{path,
                                             ValidationErrorKind::Pattern,
                                             quoted_name(shown) +
                                                 " does not match the required pattern."});
        }
    }
}

std::string format_date_value(const std::string &text, const std::optional<std::string> &format) {
    const auto date = parse_date(text);
    if(!date) {
        return text;
    }
    auto formatted = format_date(*date, format.value_or("MMMM dd, yyyy"));
    if(!formatted) {
        return long_date(*date);
    }
    return *formatted;
}

std::string format_currency_value(const std::string &text, const json &original) {
    if(original.is_object()) {
        return format_money(get_double(original, "value", 0.0), get_string(original, "currency", "USD"));
    }
    if(auto amount = parse_double(text)) {
        return "$" + format_grouped(*amount, 2);
    }
    return text;
}

std::string format_number_value(const std::string &text, const std::optional<std::string> &format) {
    const auto number = parse_double(text);
    if(!number) {
        return text;
    }
    auto formatted = format_number(*number, format.value_or("N"));
    if(!formatted) {
        return format_double(*number);
    }
    return *formatted;
}

std::string format_boolean_value(const std::string &text) {
    const auto lowered = utf8_lower(text);
    return lowered == "true" || lowered == "1" || lowered == "yes" ? "Yes" : "No";
}

GRegex *placeholder_regex() {
    static re_handle regex = compile_regex(R"(\{\{(?!#|/|@)(\w+(?:\.\w+)*)\}\})");
    return regex.get();
}

void collect_strings(const json &node, std::string &out) {
    if(node.is_string()) {
        out += node.get<std::string>();
        out += '\n';
    } else if(node.is_array() || node.is_object()) {
        for(const auto &child : node) {
            collect_strings(child, out);
        }
    }
}

} // namespace

const char *kind_name(ValidationErrorKind kind) {
    switch(kind) {
    case ValidationErrorKind::Required:
        return "required";
    case ValidationErrorKind::Type:
        return "type";
    case ValidationErrorKind::Pattern:
        return "pattern";
    case ValidationErrorKind::MinItems:
        return "minItems";
    case ValidationErrorKind::MaxItems:
        return "maxItems";
    case ValidationErrorKind::CyclicDependency:
        return "cyclicDependency";
    }
    return "unknown";
}

RuntimeVariables runtime_variables_from_json(const json &obj) {
    RuntimeVariables result;
    if(!obj.is_object()) {
        return result;
    }
    for(auto it = obj.begin(); it != obj.end(); ++it) {
        result[it.key()] = it.value();
    }
    return result;
}

std::string runtime_value_string(const json &value) {
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

ValidationResult validate_variables(const std::vector<VariableDefinition> &definitions,
                                    const RuntimeVariables &provided) {
    ValidationResult result;
    for(const auto &def : definitions) {
        auto it = provided.find(def.name);
        validate_entry(def,
                       def.name,
                       def.display_name(),
                       it == provided.end() ? nullptr : &it->second,
                       result.errors);
    }
    for(const auto *def : schedule_computed(definitions).cyclic) {
        result.errors.push_back(ValidationError{def->name,
                                                ValidationErrorKind::CyclicDependency,
                                                "Computed variable '" + def->display_name() +
                                                    "' has a circular dependency."});
    }
    return result;
}

std::vector<ValidationError> validate_array_variable(const VariableDefinition &definition,
                                                     const json &value) {
    std::vector<ValidationError> errors;
    const auto shown = quoted_name(definition.display_name());
    if(!value.is_array()) {
        errors.push_back(
            ValidationError{definition.name, ValidationErrorKind::Type, shown + " must be an array."});
        return errors;
    }
    const auto count = int(value.size());
    if(definition.min_items && count < *definition.min_items) {
        errors.push_back(ValidationError{definition.name,
                                         ValidationErrorKind::MinItems,
                                         shown + " must have at least " +
                                             std::to_string(*definition.min_items) + " items."});
    }
    if(definition.max_items && count > *definition.max_items) {
        errors.push_back(ValidationError{definition.name,
                                         ValidationErrorKind::MaxItems,
                                         shown + " must have at most " +
                                             std::to_string(*definition.max_items) + " items."});
    }
    return errors;
}

std::string format_value(const VariableDefinition &definition, const json &value) {
    const auto text = runtime_value_string(value);
    switch(definition.type()) {
    case VariableType::Date:
        return format_date_value(text, definition.format);
    case VariableType::Currency:
        return format_currency_value(text, value);
    case VariableType::Number:
        return format_number_value(text, definition.format);
    case VariableType::Boolean:
        return format_boolean_value(text);
    default:
        return text;
    }
}

VariablePool default_variables(const std::vector<VariableDefinition> &definitions) {
    SimpleVariables defaults;
    for(const auto &def : definitions) {
        if(def.default_value && !def.default_value->empty()) {
            defaults[def.name] = *def.default_value;
        }
    }
    return VariablePool(std::move(defaults), ComplexVariables{});
}

VariablePool with_document_variables(const VariablePool &base, const SimpleVariables &document) {
    return base.with_simple(document);
}

ComplexVariables extract_complex_variables(const RuntimeVariables &provided) {
    ComplexVariables result;
    for(const auto &[name, value] : provided) {
        if(value.is_array() || value.is_object()) {
            result[name] = value;
        }
    }
    return result;
}

VariablePool with_runtime_variables(const VariablePool &base,
                                    const std::vector<VariableDefinition> &definitions,
                                    const RuntimeVariables &provided) {
    std::map<std::string, const VariableDefinition *, std::less<>> by_name;
    for(const auto &def : definitions) {
        by_name[def.name] = &def;
    }
    SimpleVariables simple;
    ComplexVariables complex = extract_complex_variables(provided);
    for(const auto &[name, value] : provided) {
        auto it = by_name.find(name);
        if(it == by_name.end()) {
            if(value.is_null()) {
                complex[name] = value;
            } else if(!value.is_array() && !value.is_object()) {
                simple[name] = runtime_value_string(value);
            }
            continue;
        }
        const auto type = it->second->type();
        if(type == VariableType::Array || type == VariableType::Object) {
            continue;
        }
        simple[name] = format_value(*it->second, value);
    }
    return base.with_simple(simple).with_complex(complex);
}

MergedVariables merge_variables(const std::vector<VariableDefinition> &definitions,
                                const SimpleVariables &document,
                                const RuntimeVariables &provided) {
    auto defaults = default_variables(definitions);
    auto doc = with_document_variables(defaults, document);
    auto runtime = with_runtime_variables(doc, definitions, provided);
    auto computed = evaluate_computed(definitions, runtime);
    return MergedVariables{std::move(defaults),
                           std::move(doc),
                           std::move(runtime),
                           std::move(computed.pool),
                           std::move(computed.cyclic)};
}

std::vector<std::string> extract_placeholders(std::string_view text) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    const std::string haystack{text};
    GMatchInfo *raw_match = nullptr;
    g_regex_match(placeholder_regex(), haystack.c_str(), GRegexMatchFlags(0), &raw_match);
    re_match minfo{raw_match};
    while(g_match_info_matches(minfo.get())) {
        const auto full = group_text(minfo.get(), 1);
        const auto root = full.substr(0, full.find('.'));
        if(builtin_names.count(root) == 0 && seen.insert(root).second) {
            names.push_back(root);
        }
        g_match_info_next(minfo.get(), nullptr);
    }
    return names;
}

VariableAnalysis analyze_variables(const json &content) {
    VariableAnalysis analysis;
    auto defs = content.find("variableDefinitions");
    if(defs != content.end()) {
        analysis.definitions = parse_variable_definitions(*defs);
    }
    std::string text;
    for(auto it = content.begin(); it != content.end(); ++it) {
        if(it.key() != "variableDefinitions") {
            collect_strings(it.value(), text);
        }
    }
    analysis.detected = extract_placeholders(text);

    std::set<std::string> declared;
    for(const auto &def : analysis.definitions) {
        declared.insert(def.name);
    }
    const std::set<std::string> used(analysis.detected.begin(), analysis.detected.end());
    for(const auto &name : analysis.detected) {
        if(declared.count(name) == 0) {
            analysis.undefined.push_back(name);
        }
    }
    for(const auto &def : analysis.definitions) {
        if(!def.is_computed && used.count(def.name) == 0) {
            analysis.unused.push_back(def.name);
        }
    }
    return analysis;
}

json snapshot_variables(const VariablePool &pool) {
    json snapshot = json::object();
    for(const auto &[name, value] : pool.simple()) {
        snapshot[name] = value;
    }
    for(const auto &[name, value] : pool.complex()) {
        snapshot[name] = value;
    }
    return snapshot;
}

VariablePool restore_variables(std::string_view snapshot_text) {
    const auto parsed = json::parse(snapshot_text, nullptr, false);
    if(parsed.is_discarded() || !parsed.is_object()) {
        return VariablePool{};
    }
    SimpleVariables simple;
    ComplexVariables complex;
    for(auto it = parsed.begin(); it != parsed.end(); ++it) {
        if(it->is_array() || it->is_object()) {
            complex[it.key()] = it.value();
        } else {
            simple[it.key()] = runtime_value_string(it.value());
        }
    }
    return VariablePool(std::move(simple), std::move(complex));
}
