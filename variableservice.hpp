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
#include <string_view>
#include <vector>

// Values supplied by the caller at generation time, arbitrarily nested.
typedef std::map<std::string, nlohmann::json, std::less<>> RuntimeVariables;

enum class ValidationErrorKind : int {
    Required,
    Type,
    Pattern,
    MinItems,
    MaxItems,
    CyclicDependency,
};

const char *kind_name(ValidationErrorKind kind);

struct ValidationError {
    std::string name;
    ValidationErrorKind kind;
    std::string message;
};

struct ValidationResult {
    std::vector<ValidationError> errors;

    bool is_valid() const { return errors.empty(); }
};

RuntimeVariables runtime_variables_from_json(const nlohmann::json &obj);

// Text form of a runtime value, numbers keep their JSON spelling.
std::string runtime_value_string(const nlohmann::json &value);

ValidationResult validate_variables(const std::vector<VariableDefinition> &definitions,
                                    const RuntimeVariables &provided);

std::vector<ValidationError> validate_array_variable(const VariableDefinition &definition,
                                                     const nlohmann::json &value);

std::string format_value(const VariableDefinition &definition, const nlohmann::json &value);

// Each stage of the merge is a pool of its own so that the precedence
// defaults < document < runtime < computed can be inspected step by step.
VariablePool default_variables(const std::vector<VariableDefinition> &definitions);

VariablePool with_document_variables(const VariablePool &base, const SimpleVariables &document);

VariablePool with_runtime_variables(const VariablePool &base,
                                    const std::vector<VariableDefinition> &definitions,
                                    const RuntimeVariables &provided);

ComplexVariables extract_complex_variables(const RuntimeVariables &provided);

struct MergedVariables {
    VariablePool defaults;
    VariablePool document;
    VariablePool runtime;
    VariablePool computed;
    std::vector<std::string> cyclic;

    const VariablePool &final_pool() const { return computed; }
};

MergedVariables merge_variables(const std::vector<VariableDefinition> &definitions,
                                const SimpleVariables &document,
                                const RuntimeVariables &provided);

// Root names of {{name}} and {{name.path}} tokens, without block tags,
// loop tokens and built-ins, in order of first appearance.
std::vector<std::string> extract_placeholders(std::string_view text);

struct VariableAnalysis {
    std::vector<VariableDefinition> definitions;
    std::vector<std::string> detected;
    // Used in the content but not declared.
    std::vector<std::string> undefined;
    // Declared, not computed and never used.
    std::vector<std::string> unused;
};

VariableAnalysis analyze_variables(const nlohmann::json &content);

nlohmann::json snapshot_variables(const VariablePool &pool);
VariablePool restore_variables(std::string_view snapshot_text);
