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

#include <expression.hpp>
#include <regexutils.hpp>
#include <utils.hpp>
#include <valueformat.hpp>

#include <cmath>

using json = nlohmann::json;

namespace {

const double equality_epsilon = 0.0001;

const char *comparison_operators[] = {"==", "!=", ">=", "<=", ">", "<"};

bool is_quote(char c) { return c == '"' || c == '\''; }

// Position of token outside of quoted text, or npos.
size_t find_unquoted(std::string_view expr, std::string_view token, bool ignore_case = false) {
    bool in_quote = false;
    char quote_char = ' ';
    for(size_t i = 0; i < expr.length(); ++i) {
        const char c = expr[i];
        if(is_quote(c) && !in_quote) {
            in_quote = true;
            quote_char = c;
            continue;
        }
        if(in_quote) {
            if(c == quote_char) {
                in_quote = false;
            }
            continue;
        }
        if(expr.length() - i < token.length()) {
            break;
        }
        const auto candidate = expr.substr(i, token.length());
        if(ignore_case ? g_ascii_strncasecmp(candidate.data(), token.data(), token.length()) == 0
                       : candidate == token) {
            return i;
        }
    }
    return std::string_view::npos;
}

bool contains_unquoted(std::string_view expr, std::string_view token, bool ignore_case = false) {
    return find_unquoted(expr, token, ignore_case) != std::string_view::npos;
}

// Splits on a caseless keyword such as " and ", leaving quoted text alone.
std::vector<std::string> split_unquoted_keyword(std::string_view expr, std::string_view keyword) {
    std::vector<std::string> parts;
    size_t index;
    while((index = find_unquoted(expr, keyword, true)) != std::string_view::npos) {
        parts.push_back(trim(expr.substr(0, index)));
        expr.remove_prefix(index + keyword.length());
    }
    parts.push_back(trim(expr));
    return parts;
}

std::vector<std::string> split_unquoted(std::string_view expr, char separator) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quote = false;
    char quote_char = ' ';
    for(const char c : expr) {
        if(is_quote(c) && !in_quote) {
            in_quote = true;
            quote_char = c;
        } else if(in_quote && c == quote_char) {
            in_quote = false;
        } else if(!in_quote && c == separator) {
            parts.emplace_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.emplace_back(std::move(current));
    return parts;
}

// The colon that belongs to the outermost ternary.
size_t find_ternary_colon(std::string_view expr) {
    int depth = 0;
    bool in_quote = false;
    char quote_char = ' ';
    for(size_t i = 0; i < expr.length(); ++i) {
        const char c = expr[i];
        if(is_quote(c) && !in_quote) {
            in_quote = true;
            quote_char = c;
        } else if(in_quote) {
            if(c == quote_char) {
                in_quote = false;
            }
        } else if(c == '?') {
            ++depth;
        } else if(c == ':') {
            if(depth == 0) {
                return i;
            }
            --depth;
        }
    }
    return std::string_view::npos;
}

bool contains_arithmetic_operator(std::string_view expr) {
    for(const char op : {'+', '-', '*', '/', '%'}) {
        if(contains_unquoted(expr, std::string_view(&op, 1))) {
            return true;
        }
    }
    return false;
}

bool contains_comparison_operator(std::string_view expr) {
    for(const char *op : comparison_operators) {
        if(contains_unquoted(expr, op)) {
            return true;
        }
    }
    return contains_unquoted(expr, " and ", true) || contains_unquoted(expr, " or ", true);
}

bool is_identifier(std::string_view text) {
    if(text.empty() || !(g_ascii_isalpha(text.front()) || text.front() == '_')) {
        return false;
    }
    for(const char c : text) {
        if(!(g_ascii_isalnum(c) || c == '_' || c == '.')) {
            return false;
        }
    }
    return true;
}

double value_to_double(const Value &v) { return value_to_number(v).value_or(0.0); }

const json *aggregate_target(const json &item, const std::optional<std::string> &property) {
    if(property && item.is_object()) {
        auto it = item.find(*property);
        if(it == item.end()) {
            return nullptr;
        }
        return &(*it);
    }
    return &item;
}

double numeric_item(const json &item, const std::optional<std::string> &property) {
    const json *target = aggregate_target(item, property);
    if(!target) {
        return 0;
    }
    if(target->is_number()) {
        return target->get<double>();
    }
    if(target->is_string()) {
        return parse_double(target->get<std::string>()).value_or(0);
    }
    return 0;
}

std::string string_item(const json &item, const std::optional<std::string> &property) {
    const json *target = aggregate_target(item, property);
    if(!target) {
        return std::string{};
    }
    if(target->is_string()) {
        return target->get<std::string>();
    }
    if(target->is_number()) {
        return format_double(target->get<double>());
    }
    if(target->is_boolean()) {
        return target->get<bool>() ? "true" : "false";
    }
    return std::string{};
}

Value array_item(const json &array, size_t index, const std::optional<std::string> &property) {
    if(index >= array.size()) {
        return Value{};
    }
    const auto &item = array[index];
    if(!property) {
        return json_to_value(item);
    }
    if(item.is_object()) {
        auto it = item.find(*property);
        if(it != item.end()) {
            return json_to_value(*it);
        }
    }
    return Value{};
}

struct ArithmeticToken {
    bool is_operator;
    char op;
    double operand;
};

GRegex *arithmetic_token_regex() {
    static re_handle regex = compile_regex(R"(([+\-*/%])|(\d+\.?\d*)|([a-zA-Z_][a-zA-Z0-9_.]*))");
    return regex.get();
}

} // namespace

std::string value_to_string(const Value &v) {
    if(std::holds_alternative<bool>(v)) {
        return std::get<bool>(v) ? "true" : "false";
    }
    if(std::holds_alternative<double>(v)) {
        return format_double(std::get<double>(v));
    }
    if(std::holds_alternative<std::string>(v)) {
        return std::get<std::string>(v);
    }
    return std::string{};
}

bool value_to_bool(const Value &v) {
    if(std::holds_alternative<bool>(v)) {
        return std::get<bool>(v);
    }
    if(std::holds_alternative<double>(v)) {
        return std::get<double>(v) != 0;
    }
    if(std::holds_alternative<std::string>(v)) {
        return is_truthy_text(std::get<std::string>(v));
    }
    return false;
}

std::optional<double> value_to_number(const Value &v) {
    if(std::holds_alternative<double>(v)) {
        return std::get<double>(v);
    }
    if(std::holds_alternative<std::string>(v)) {
        return parse_double(std::get<std::string>(v));
    }
    return {};
}

Value json_to_value(const json &j) {
    switch(j.type()) {
    case json::value_t::string:
        return j.get<std::string>();
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        return j.get<double>();
    case json::value_t::boolean:
        return j.get<bool>();
    case json::value_t::null:
    case json::value_t::discarded:
        return Value{};
    default:
        return j.dump();
    }
}

Value typed_scalar(const std::string &text) {
    if(auto d = parse_double(text)) {
        return *d;
    }
    if(auto b = parse_bool(text)) {
        return *b;
    }
    return text;
}

Value ExpressionEvaluator::evaluate(std::string_view expression) const {
    const auto expr = trim(expression);
    if(expr.empty()) {
        return Value{};
    }
    if(contains_unquoted(expr, "|")) {
        return evaluate_aggregate(expr);
    }
    if(contains_unquoted(expr, "?") && contains_unquoted(expr, ":")) {
        return evaluate_ternary(expr);
    }
    if(contains_comparison_operator(expr)) {
        return evaluate_comparison(expr);
    }
    if(contains_unquoted(expr, "+") && has_string_operand(expr)) {
        return evaluate_concat(expr);
    }
    if(contains_arithmetic_operator(expr)) {
        return evaluate_arithmetic(expr);
    }
    return resolve_value(expr);
}

std::optional<std::string>
ExpressionEvaluator::try_evaluate_to_string(std::string_view expression,
                                            const std::optional<std::string> &format) const {
    try {
        const auto result = evaluate(expression);
        if(std::holds_alternative<std::monostate>(result)) {
            return std::string{};
        }
        if(format && !format->empty() && std::holds_alternative<double>(result)) {
            auto formatted = format_number(std::get<double>(result), *format);
            if(!formatted) {
                throw EvaluationError("Invalid number format " + *format);
            }
            return formatted;
        }
        return value_to_string(result);
    } catch(const std::exception &) {
        return {};
    }
}

std::string ExpressionEvaluator::evaluate_to_string(std::string_view expression,
                                                    const std::optional<std::string> &format) const {
    return try_evaluate_to_string(expression, format).value_or(std::string{});
}

Value ExpressionEvaluator::evaluate_aggregate(std::string_view expression) const {
    const auto parts = split_unquoted(expression, '|');
    if(parts.size() != 2) {
        return Value{};
    }
    const auto array_name = trim(parts[0]);
    const json *array = array_name.find('.') == std::string::npos ? pool.find_complex(array_name)
                                                                  : pool.find_json(array_name);
    if(!array || !array->is_array()) {
        return Value{};
    }
    auto func_parts = split(trim(parts[1]), ':');
    for(auto &p : func_parts) {
        p = trim(p);
    }
    const auto function = utf8_lower(func_parts[0]);
    std::optional<std::string> property;
    if(func_parts.size() > 1) {
        property = func_parts[1];
    }
    const std::string separator = func_parts.size() > 2 ? func_parts[2] : ", ";

    if(function == "sum" || function == "avg" || function == "average") {
        double sum = 0;
        for(const auto &item : *array) {
            sum += numeric_item(item, property);
        }
        if(function == "sum") {
            return sum;
        }
        return array->empty() ? 0.0 : sum / array->size();
    }
    if(function == "min" || function == "max") {
        std::optional<double> best;
        for(const auto &item : *array) {
            const double value = numeric_item(item, property);
            if(!best || (function == "min" ? value < *best : value > *best)) {
                best = value;
            }
        }
        return best.value_or(0.0);
    }
    if(function == "count") {
        return double(array->size());
    }
    if(function == "first") {
        return array_item(*array, 0, property);
    }
    if(function == "last") {
        return array->empty() ? Value{} : array_item(*array, array->size() - 1, property);
    }
    if(function == "join" || function == "concat") {
        const std::string sep = function == "concat" ? std::string{} : separator;
        std::string result;
        bool first = true;
        for(const auto &item : *array) {
            const auto text = string_item(item, property);
            if(text.empty()) {
                continue;
            }
            if(!first) {
                result += sep;
            }
            result += text;
            first = false;
        }
        return result;
    }
    return Value{};
}

Value ExpressionEvaluator::evaluate_ternary(std::string_view expression) const {
    const auto question = find_unquoted(expression, "?");
    if(question == std::string_view::npos) {
        return Value{};
    }
    const auto condition = expression.substr(0, question);
    const auto rest = expression.substr(question + 1);
    const auto colon = find_ternary_colon(rest);
    if(colon == std::string_view::npos) {
        return Value{};
    }
    const auto *node = complex_node(condition);
    const bool is_true = node ? is_truthy(*node) : value_to_bool(evaluate(condition));
    return evaluate(is_true ? rest.substr(0, colon) : rest.substr(colon + 1));
}

bool ExpressionEvaluator::evaluate_comparison(std::string_view expression) const {
    const std::string expr = trim(expression);
    if(contains_unquoted(expr, " and ", true)) {
        for(const auto &part : split_unquoted_keyword(expr, " and ")) {
            if(!evaluate_comparison(part)) {
                return false;
            }
        }
        return true;
    }
    if(contains_unquoted(expr, " or ", true)) {
        for(const auto &part : split_unquoted_keyword(expr, " or ")) {
            if(evaluate_comparison(part)) {
                return true;
            }
        }
        return false;
    }
    for(const char *op : comparison_operators) {
        const auto index = find_unquoted(expr, op);
        if(index == std::string_view::npos || index == 0) {
            continue;
        }
        const std::string_view opv{op};
        const auto left = resolve_value(std::string_view(expr).substr(0, index));
        const auto right = resolve_value(std::string_view(expr).substr(index + opv.length()));
        const auto left_num = value_to_number(left);
        const auto right_num = value_to_number(right);
        if(left_num && right_num) {
            const double l = *left_num;
            const double r = *right_num;
            if(opv == "==") {
                return std::fabs(l - r) < equality_epsilon;
            } else if(opv == "!=") {
                return std::fabs(l - r) >= equality_epsilon;
            } else if(opv == ">=") {
                return l >= r;
            } else if(opv == "<=") {
                return l <= r;
            } else if(opv == ">") {
                return l > r;
            }
            return l < r;
        }
        const int rc = icompare(value_to_string(left), value_to_string(right));
        if(opv == "==") {
            return rc == 0;
        } else if(opv == "!=") {
            return rc != 0;
        } else if(opv == ">=") {
            return rc >= 0;
        } else if(opv == "<=") {
            return rc <= 0;
        } else if(opv == ">") {
            return rc > 0;
        }
        return rc < 0;
    }
    if(const auto *node = complex_node(expr)) {
        return is_truthy(*node);
    }
    return value_to_bool(resolve_value(expr));
}

Value ExpressionEvaluator::evaluate_arithmetic(std::string_view expression) const {
    const std::string expr{expression};
    std::vector<ArithmeticToken> tokens;
    double pending_sign = 1.0;
    GMatchInfo *raw_match = nullptr;
    g_regex_match(arithmetic_token_regex(), expr.c_str(), GRegexMatchFlags(0), &raw_match);
    re_match minfo{raw_match};
    while(g_match_info_matches(minfo.get())) {
        if(group_matched(minfo.get(), 1)) {
            const char op = group_text(minfo.get(), 1).front();
            const bool expects_operand = tokens.empty() || tokens.back().is_operator;
            if(expects_operand && (op == '-' || op == '+')) {
                if(op == '-') {
                    pending_sign = -pending_sign;
                }
            } else if(expects_operand) {
                throw EvaluationError("Missing operand in " + expr);
            } else {
                tokens.push_back(ArithmeticToken{true, op, 0});
            }
        } else {
            double operand;
            if(group_matched(minfo.get(), 2)) {
                operand = parse_double(group_text(minfo.get(), 2)).value_or(0);
            } else {
                operand = value_to_double(resolve_value(group_text(minfo.get(), 3)));
            }
            if(!tokens.empty() && !tokens.back().is_operator) {
                throw EvaluationError("Missing operator in " + expr);
            }
            tokens.push_back(ArithmeticToken{false, 0, pending_sign * operand});
            pending_sign = 1.0;
        }
        g_match_info_next(minfo.get(), nullptr);
    }
    if(tokens.empty()) {
        return Value{};
    }
    if(tokens.back().is_operator) {
        throw EvaluationError("Dangling operator in " + expr);
    }

    // Multiplicative operators first, then additive ones, both left to right.
    std::vector<ArithmeticToken> intermediate;
    for(size_t i = 0; i < tokens.size(); ++i) {
        const auto &t = tokens[i];
        if(t.is_operator && (t.op == '*' || t.op == '/' || t.op == '%')) {
            const double left = intermediate.back().operand;
            const double right = tokens[++i].operand;
            double result = 0;
            if(t.op == '*') {
                result = left * right;
            } else if(t.op == '/') {
                result = right != 0 ? left / right : 0;
            } else {
                result = right != 0 ? std::fmod(left, right) : 0;
            }
            intermediate.back().operand = result;
        } else {
            intermediate.push_back(t);
        }
    }
    double total = intermediate.front().operand;
    for(size_t i = 1; i + 1 < intermediate.size(); i += 2) {
        const double right = intermediate[i + 1].operand;
        if(intermediate[i].op == '+') {
            total += right;
        } else if(intermediate[i].op == '-') {
            total -= right;
        }
    }
    return total;
}

bool ExpressionEvaluator::has_string_operand(std::string_view expression) const {
    for(const auto &part : split_unquoted(expression, '+')) {
        const auto trimmed = trim(part);
        if(trimmed.empty()) {
            continue;
        }
        if(is_quote(trimmed.front())) {
            return true;
        }
        if(is_identifier(trimmed) && std::holds_alternative<std::string>(resolve_value(trimmed))) {
            return true;
        }
    }
    return false;
}

Value ExpressionEvaluator::evaluate_concat(std::string_view expression) const {
    std::string result;
    for(const auto &part : split_unquoted(expression, '+')) {
        result += value_to_string(evaluate(part));
    }
    return result;
}

Value ExpressionEvaluator::resolve_value(std::string_view expression) const {
    const auto expr = trim(expression);
    if(expr.length() >= 2 && is_quote(expr.front()) && expr.back() == expr.front()) {
        return expr.substr(1, expr.length() - 2);
    }
    if(auto d = parse_double(expr)) {
        return *d;
    }
    if(iequals(expr, "true")) {
        return true;
    }
    if(iequals(expr, "false")) {
        return false;
    }
    if(iequals(expr, "null")) {
        return Value{};
    }
    if(expr.find('.') != std::string::npos) {
        return resolve_path(expr);
    }
    if(auto simple = pool.find_simple(expr)) {
        return typed_scalar(*simple);
    }
    if(const auto *complex = pool.find_complex(expr)) {
        return json_to_value(*complex);
    }
    return Value{};
}

// The array or object a bare variable reference points to, if any.
const json *ExpressionEvaluator::complex_node(std::string_view expression) const {
    const auto expr = trim(expression);
    if(!is_identifier(expr)) {
        return nullptr;
    }
    if(expr.find('.') == std::string::npos && pool.find_simple(expr)) {
        return nullptr;
    }
    const auto *node = pool.find_json(expr);
    return node && (node->is_array() || node->is_object()) ? node : nullptr;
}

Value ExpressionEvaluator::resolve_path(std::string_view path) const {
    const auto parts = split_path(path);
    const std::vector<std::string> rest(parts.begin() + 1, parts.end());
    if(const auto *root = pool.find_complex(parts.front())) {
        const auto *node = navigate_json(*root, rest);
        return node ? json_to_value(*node) : Value{};
    }
    if(auto text = pool.find_simple(parts.front())) {
        // Simple variables may hold serialized JSON objects.
        const auto parsed = json::parse(*text, nullptr, false);
        if(!parsed.is_discarded() && parsed.is_object()) {
            const auto *node = navigate_json(parsed, rest);
            return node ? json_to_value(*node) : Value{};
        }
    }
    if(auto flat = pool.find_simple(path)) {
        return typed_scalar(*flat);
    }
    return Value{};
}
