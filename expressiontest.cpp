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
#include <variableservice.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>

using json = nlohmann::json;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

VariablePool test_pool() {
    SimpleVariables simple;
    simple["a"] = "10";
    simple["b"] = "4";
    simple["name"] = "Ann";
    ComplexVariables complex;
    complex["items"] = json::parse(R"([{"amount":10},{"amount":5},{"amount":"bad"}])");
    complex["tags"] = json::array({"x", "y", "z"});
    complex["isActive"] = false;
    return VariablePool(std::move(simple), std::move(complex));
}

double number_of(const Value &v) {
    CHECK(std::holds_alternative<double>(v));
    return std::get<double>(v);
}

std::string text_of(const Value &v) {
    CHECK(std::holds_alternative<std::string>(v));
    return std::get<std::string>(v);
}

bool bool_of(const Value &v) {
    CHECK(std::holds_alternative<bool>(v));
    return std::get<bool>(v);
}

} // namespace

void test_aggregates() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(number_of(e.evaluate("items | sum:amount")) == 15);
    CHECK(e.evaluate_to_string("items | sum:amount") == "15");
    CHECK(number_of(e.evaluate("items | avg:amount")) == 5);
    CHECK(number_of(e.evaluate("items | max:amount")) == 10);
    CHECK(number_of(e.evaluate("items | min:amount")) == 0);
    CHECK(number_of(e.evaluate("items | count:amount")) == 3);
    CHECK(text_of(e.evaluate("tags | join")) == "x, y, z");
    CHECK(text_of(e.evaluate("tags | concat")) == "xyz");
    CHECK(text_of(e.evaluate("tags | first")) == "x");
    CHECK(text_of(e.evaluate("tags | last")) == "z");
    CHECK(number_of(e.evaluate("items | first:amount")) == 10);
    CHECK(std::holds_alternative<std::monostate>(e.evaluate("missing | sum")));
    CHECK(std::holds_alternative<std::monostate>(e.evaluate("tags | explode")));
}

void test_ternary() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(text_of(e.evaluate(R"(isActive ? "Yes" : "No")")) == "No");
    CHECK(text_of(e.evaluate(R"(isMissing ? "Yes" : "No")")) == "No");
    CHECK(text_of(e.evaluate(R"(a > 5 ? "big" : "small")")) == "big");
    CHECK(text_of(e.evaluate(R"(a > 50 ? "big" : b > 2 ? "medium" : "small")")) == "medium");

    const auto active = pool.with_simple("isActive", "true");
    ExpressionEvaluator e2(active);
    CHECK(text_of(e2.evaluate(R"(isActive ? "Yes" : "No")")) == "Yes");
}

void test_truthiness() {
    ComplexVariables complex;
    complex["empty"] = json::array();
    complex["settings"] = json::object();
    complex["tags"] = json::array({"x"});
    const auto pool = test_pool()
                          .with_simple("answer", "no")
                          .with_simple("nul", "null")
                          .with_simple("blank", "  ")
                          .with_complex(complex);
    ExpressionEvaluator e(pool);
    CHECK(text_of(e.evaluate(R"(answer ? "T" : "F")")) == "F");
    CHECK(text_of(e.evaluate(R"(nul ? "T" : "F")")) == "F");
    CHECK(text_of(e.evaluate(R"(blank ? "T" : "F")")) == "F");
    CHECK(text_of(e.evaluate(R"(name ? "T" : "F")")) == "T");
    CHECK(text_of(e.evaluate(R"(empty ? "T" : "F")")) == "F");
    CHECK(text_of(e.evaluate(R"(settings ? "T" : "F")")) == "T");
    CHECK(text_of(e.evaluate(R"(tags ? "T" : "F")")) == "T");
    CHECK(!bool_of(e.evaluate("a > 5 and empty")));
    CHECK(bool_of(e.evaluate("a > 5 and tags")));
    CHECK(!bool_of(e.evaluate("a > 5 and answer")));

    const auto defs = parse_variable_definitions(json::parse(R"([{"name":"isMember","type":"boolean"}])"));
    const auto merged =
        merge_variables(defs, SimpleVariables{}, runtime_variables_from_json(json::parse(R"({"isMember":false})")));
    ExpressionEvaluator member(merged.final_pool());
    CHECK(*merged.final_pool().find_simple("isMember") == "No");
    CHECK(text_of(member.evaluate(R"(isMember ? "10%" : "0%")")) == "0%");
}

void test_comparison() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(bool_of(e.evaluate("a == 10.00001")));
    CHECK(!bool_of(e.evaluate("a != 10")));
    CHECK(bool_of(e.evaluate(R"(name == "ann")")));
    CHECK(bool_of(e.evaluate(R"(name < "bob")")));
    CHECK(bool_of(e.evaluate("a > 5 and b < 5")));
    CHECK(bool_of(e.evaluate("a < 5 or b < 5")));
    CHECK(!bool_of(e.evaluate("a < 5 AND b < 5")));
    CHECK(e.evaluate_to_string("a >= 10") == "true");

    const auto phrased = pool.with_simple("phrase", "x and y");
    ExpressionEvaluator quoted(phrased);
    CHECK(bool_of(quoted.evaluate(R"(a == 10 and phrase == "x and y")")));
    CHECK(bool_of(quoted.evaluate(R"(a == 1 or phrase == "x and y")")));
    CHECK(!bool_of(quoted.evaluate(R"(phrase == "x or z" or a == 1)")));
}

void test_arithmetic() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(number_of(e.evaluate("a + b * 2")) == 18);
    CHECK(number_of(e.evaluate("a - b - 1")) == 5);
    CHECK(number_of(e.evaluate("a / 0")) == 0);
    CHECK(number_of(e.evaluate("a % 3")) == 1);
    CHECK(number_of(e.evaluate("-a + 3")) == -7);
    CHECK(number_of(e.evaluate("unknown * 2 + 1")) == 1);
    CHECK(std::fabs(number_of(e.evaluate("b / 8")) - 0.5) < 1e-9);
}

void test_concatenation() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(text_of(e.evaluate(R"(name + " Smith")")) == "Ann Smith");
    CHECK(text_of(e.evaluate(R"("Total: " + a)")) == "Total: 10");
}

void test_literals() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(text_of(e.evaluate(R"("a+b")")) == "a+b");
    CHECK(text_of(e.evaluate(R"('x ? y : z')")) == "x ? y : z");
    CHECK(number_of(e.evaluate("12.5")) == 12.5);
    CHECK(bool_of(e.evaluate("TRUE")));
    CHECK(std::holds_alternative<std::monostate>(e.evaluate("null")));
    CHECK(std::holds_alternative<std::monostate>(e.evaluate("")));
    CHECK(number_of(e.evaluate("a")) == 10);
}

void test_malformed() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    bool thrown = false;
    try {
        e.evaluate("5 +");
    } catch(const EvaluationError &) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK(!e.try_evaluate_to_string("a * * b", {}));
    CHECK(e.evaluate_to_string("5 +") == "");
}

void test_number_format() {
    const auto pool = test_pool();
    ExpressionEvaluator e(pool);
    CHECK(e.evaluate_to_string("a * 123.45", std::string{"N2"}) == "1,234.50");
    CHECK(e.evaluate_to_string("b / 8", std::string{"P0"}) == "50%");
    CHECK(e.evaluate_to_string("name", std::string{"N2"}) == "Ann");
}

int main(int, char **) {
    printf("Running expression tests.\n");
    test_aggregates();
    test_ternary();
    test_truthiness();
    test_comparison();
    test_arithmetic();
    test_concatenation();
    test_literals();
    test_malformed();
    test_number_format();
    return 0;
}
