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
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

// Result of an expression. The monostate alternative is null.
typedef std::variant<std::monostate, bool, double, std::string> Value;

class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string &msg) : std::runtime_error(msg) {}
};

std::string value_to_string(const Value &v);
bool value_to_bool(const Value &v);
std::optional<double> value_to_number(const Value &v);

Value json_to_value(const nlohmann::json &j);
// Simple variables are stored as text, expressions see them as numbers
// or booleans when they parse as such.
Value typed_scalar(const std::string &text);

/*
 * Evaluates the small expression language of computed variables. The form
 * of an expression is decided by the first match of, in order:
 *
 *   array | function[:property[:separator]]
 *   condition ? a : b
 *   comparisons joined with "and" / "or"
 *   string concatenation with + when an operand is a string
 *   arithmetic with + - * / %
 *   a literal or a variable reference
 */
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(const VariablePool &pool_) : pool(pool_) {}

    // Throws EvaluationError for expressions that can not be computed.
    Value evaluate(std::string_view expression) const;

    std::optional<std::string> try_evaluate_to_string(std::string_view expression,
                                                      const std::optional<std::string> &format) const;

    // Never throws, failures produce an empty string.
    std::string evaluate_to_string(std::string_view expression,
                                   const std::optional<std::string> &format = {}) const;

private:
    Value evaluate_aggregate(std::string_view expression) const;
    Value evaluate_ternary(std::string_view expression) const;
    bool evaluate_comparison(std::string_view expression) const;
    Value evaluate_arithmetic(std::string_view expression) const;
    Value evaluate_concat(std::string_view expression) const;
    Value resolve_value(std::string_view expression) const;
    Value resolve_path(std::string_view path) const;
    const nlohmann::json *complex_node(std::string_view expression) const;

    bool has_string_operand(std::string_view expression) const;

    const VariablePool &pool;
};
