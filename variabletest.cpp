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

#include <computed.hpp>
#include <variableservice.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>

using json = nlohmann::json;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

std::vector<VariableDefinition> defs(const char *text) {
    return parse_variable_definitions(json::parse(text));
}

RuntimeVariables vars(const char *text) { return runtime_variables_from_json(json::parse(text)); }

size_t count_kind(const ValidationResult &r, ValidationErrorKind kind) {
    return std::count_if(r.errors.begin(), r.errors.end(), [kind](const ValidationError &e) {
        return e.kind == kind;
    });
}

const ValidationError *find_error(const ValidationResult &r, const std::string &name) {
    for(const auto &e : r.errors) {
        if(e.name == name) {
            return &e;
        }
    }
    return nullptr;
}

} // namespace

void test_topological_order() {
    const auto d = defs(R"([
        {"name":"c","isComputed":true,"expression":"b + 1","dependsOn":["b"]},
        {"name":"b","isComputed":true,"expression":"a * 2","dependsOn":["a"]},
        {"name":"a","isComputed":true,"expression":"1 + 1"},
        {"name":"plain"}
    ])");
    const auto schedule = schedule_computed(d);
    CHECK(schedule.cyclic.empty());
    CHECK(schedule.order.size() == 3);
    CHECK(schedule.order[0]->name == "a");
    CHECK(schedule.order[1]->name == "b");
    CHECK(schedule.order[2]->name == "c");

    const auto result = evaluate_computed(d, VariablePool{});
    CHECK(result.cyclic.empty());
    CHECK(*result.pool.find_simple("a") == "2");
    CHECK(*result.pool.find_simple("b") == "4");
    CHECK(*result.pool.find_simple("c") == "5");
}

void test_computed_fallbacks() {
    const auto d = defs(R"([
        {"name":"broken","isComputed":true,"expression":"5 +","defaultValue":"fallback"},
        {"name":"broken2","isComputed":true,"expression":"5 +"},
        {"name":"total","isComputed":true,"expression":"price * qty","format":"N2"},
        {"name":"empty","isComputed":true,"expression":""}
    ])");
    SimpleVariables simple;
    simple["price"] = "2.5";
    simple["qty"] = "3";
    const auto result = evaluate_computed(d, VariablePool(std::move(simple), {}));
    CHECK(*result.pool.find_simple("broken") == "fallback");
    CHECK(*result.pool.find_simple("broken2") == "");
    CHECK(*result.pool.find_simple("total") == "7.50");
    CHECK(!result.pool.find_simple("empty"));
}

void test_cycles() {
    const auto d = defs(R"([
        {"name":"x","isComputed":true,"expression":"y + 1","dependsOn":["y"],"defaultValue":"9"},
        {"name":"y","isComputed":true,"expression":"x + 1","dependsOn":["x"]},
        {"name":"z","isComputed":true,"expression":"2 * 2"}
    ])");
    const auto schedule = schedule_computed(d);
    CHECK(schedule.cyclic.size() == 2);
    CHECK(schedule.order.size() == 1);

    const auto result = evaluate_computed(d, VariablePool{});
    CHECK(result.cyclic.size() == 2);
    CHECK(*result.pool.find_simple("x") == "9");
    CHECK(*result.pool.find_simple("y") == "");
    CHECK(*result.pool.find_simple("z") == "4");

    const auto validation = validate_variables(d, {});
    CHECK(!validation.is_valid());
    CHECK(count_kind(validation, ValidationErrorKind::CyclicDependency) == 2);
    const auto *e = find_error(validation, "x");
    CHECK(e);
    CHECK(e->message == "Computed variable 'x' has a circular dependency.");
    CHECK(std::string(kind_name(e->kind)) == "cyclicDependency");
}

void test_required() {
    const auto with_default =
        defs(R"([{"name":"customer","required":true,"defaultValue":"Anonymous"}])");
    CHECK(validate_variables(with_default, {}).is_valid());

    const auto without_default = defs(R"([{"name":"customer","label":"Customer Name","required":true}])");
    const auto r = validate_variables(without_default, {});
    CHECK(r.errors.size() == 1);
    CHECK(r.errors[0].kind == ValidationErrorKind::Required);
    CHECK(r.errors[0].message == "Variable 'Customer Name' is required.");

    const auto blank = validate_variables(without_default, vars(R"({"customer":"   "})"));
    CHECK(blank.errors.size() == 1);
    CHECK(validate_variables(without_default, vars(R"({"customer":"Ann"})")).is_valid());
}

void test_types() {
    const auto d = defs(R"([
        {"name":"age","type":"number"},
        {"name":"ok","type":"boolean"},
        {"name":"when","type":"date"},
        {"name":"price","type":"currency"},
        {"name":"cost","type":"currency"}
    ])");
    auto r = validate_variables(
        d, vars(R"({"age":"abc","ok":"maybe","when":"2024-13-45","price":{"value":0,"currency":"EUR"},"cost":"x"})"));
    CHECK(r.errors.size() == 5);
    CHECK(count_kind(r, ValidationErrorKind::Type) == 5);
    CHECK(find_error(r, "age")->message == "Variable 'age' must be a valid number.");

    r = validate_variables(
        d, vars(R"({"age":42,"ok":"1","when":"2024-03-05","price":{"value":5,"currency":"EUR"},"cost":"12.5"})"));
    CHECK(r.is_valid());
}

void test_pattern() {
    const auto d = defs(R"([
        {"name":"code","pattern":"^[A-Z]{3}$"},
        {"name":"broken","pattern":"(["},
        {"name":"num","type":"number","pattern":"^x$"}
    ])");
    auto r = validate_variables(d, vars(R"({"code":"abc","broken":"anything","num":"5"})"));
    CHECK(r.errors.size() == 1);
    CHECK(r.errors[0].kind == ValidationErrorKind::Pattern);
    CHECK(r.errors[0].message == "Variable 'code' does not match the required pattern.");
    CHECK(validate_variables(d, vars(R"({"code":"ABC"})")).is_valid());
}

void test_array_limits() {
    const auto d = defs(R"([
        {"name":"few","type":"array","minItems":2},
        {"name":"many","type":"array","maxItems":1},
        {"name":"notarray","type":"array"}
    ])");
    const auto r = validate_variables(d, vars(R"({"few":[1],"many":[1,2],"notarray":"text"})"));
    CHECK(r.errors.size() == 3);
    CHECK(find_error(r, "few")->kind == ValidationErrorKind::MinItems);
    CHECK(find_error(r, "few")->message == "Variable 'few' must have at least 2 items.");
    CHECK(find_error(r, "many")->kind == ValidationErrorKind::MaxItems);
    CHECK(find_error(r, "many")->message == "Variable 'many' must have at most 1 items.");
    CHECK(find_error(r, "notarray")->message == "Variable 'notarray' must be an array.");
}

void test_nested_schema() {
    const auto d = defs(R"([
        {"name":"items","type":"array","itemSchema":[{"name":"amount","type":"number","required":true}]},
        {"name":"client","type":"object","properties":[{"name":"email","required":true}]}
    ])");
    auto r = validate_variables(
        d, vars(R"({"items":[{"amount":5},{"amount":"x"},{}],"client":{"name":"Ann"}})"));
    CHECK(r.errors.size() == 3);
    CHECK(find_error(r, "items[1].amount")->kind == ValidationErrorKind::Type);
    CHECK(find_error(r, "items[2].amount")->kind == ValidationErrorKind::Required);
    CHECK(find_error(r, "client.email")->kind == ValidationErrorKind::Required);

    r = validate_variables(d, vars(R"({"client":"nope"})"));
    CHECK(r.errors.size() == 1);
    CHECK(r.errors[0].message == "Variable 'client' must be a valid object.");
}

void test_format_value() {
    VariableDefinition date;
    date.name = "d";
    date.type_name = "date";
    CHECK(format_value(date, json("2024-03-05")) == "March 05, 2024");
    date.format = "yyyy/MM/dd";
    CHECK(format_value(date, json("2024-03-05")) == "2024/03/05");
    CHECK(format_value(date, json("not a date")) == "not a date");

    VariableDefinition money;
    money.type_name = "currency";
    CHECK(format_value(money, json("12.5")) == "$12.50");
    CHECK(format_value(money, json::parse(R"({"value":3,"currency":"GBP"})")) == "£3.00");

    VariableDefinition number;
    number.type_name = "number";
    CHECK(format_value(number, json(1234)) == "1,234.00");
    number.format = "F1";
    CHECK(format_value(number, json("2.26")) == "2.3");

    VariableDefinition flag;
    flag.type_name = "boolean";
    CHECK(format_value(flag, json(true)) == "Yes");
    CHECK(format_value(flag, json("YES")) == "Yes");
    CHECK(format_value(flag, json("0")) == "No");
}

void test_merge_precedence() {
    const auto d = defs(R"([
        {"name":"greeting","defaultValue":"Hello"},
        {"name":"fallback","defaultValue":"kept"},
        {"name":"note"},
        {"name":"count","type":"number"},
        {"name":"flag","type":"boolean"},
        {"name":"maybe"},
        {"name":"rows","type":"array"},
        {"name":"doubled","isComputed":true,"expression":"extra * 2"}
    ])");
    SimpleVariables document;
    document["greeting"] = "Hi";
    document["note"] = "doc";
    const auto merged = merge_variables(
        d,
        document,
        vars(R"({"note":"rt","count":1234,"flag":true,"maybe":null,"rows":[1,2],"extra":7,"list":["a"],"nul":null})"));

    CHECK(*merged.defaults.find_simple("greeting") == "Hello");
    CHECK(*merged.document.find_simple("greeting") == "Hi");
    CHECK(*merged.document.find_simple("note") == "doc");

    const auto &pool = merged.final_pool();
    CHECK(*pool.find_simple("greeting") == "Hi");
    CHECK(*pool.find_simple("fallback") == "kept");
    CHECK(*pool.find_simple("note") == "rt");
    CHECK(*pool.find_simple("count") == "1,234.00");
    CHECK(*pool.find_simple("flag") == "Yes");
    CHECK(*pool.find_simple("maybe") == "");
    CHECK(*pool.find_simple("extra") == "7");
    CHECK(*pool.find_simple("doubled") == "14");
    CHECK(!pool.find_simple("rows"));
    CHECK(pool.find_complex("rows")->size() == 2);
    CHECK(pool.find_complex("list"));
    CHECK(pool.find_complex("nul")->is_null());
    CHECK(merged.cyclic.empty());
}

void test_placeholders() {
    const auto names = extract_placeholders("{{name}} {{#if x}}{{user.city}}{{/if}} {{@index}} "
                                            "{{pageNumber}} {{this.x}} {{name}} {{ total }}");
    CHECK(names.size() == 2);
    CHECK(names[0] == "name");
    CHECK(names[1] == "user");
}

void test_analysis() {
    const auto content = json::parse(R"({
        "variableDefinitions":[
            {"name":"name"},
            {"name":"unused"},
            {"name":"calc","isComputed":true,"expression":"1"}
        ],
        "pages":[{"components":[{"properties":{"content":"Hi {{name}} {{ghost}}"}}]}]
    })");
    const auto analysis = analyze_variables(content);
    CHECK(analysis.definitions.size() == 3);
    CHECK(analysis.detected.size() == 2);
    CHECK(analysis.undefined.size() == 1);
    CHECK(analysis.undefined[0] == "ghost");
    CHECK(analysis.unused.size() == 1);
    CHECK(analysis.unused[0] == "unused");
}

void test_snapshot() {
    SimpleVariables simple;
    simple["a"] = "1";
    ComplexVariables complex;
    complex["list"] = json::array({1, 2});
    const VariablePool pool(std::move(simple), std::move(complex));

    const auto snapshot = snapshot_variables(pool);
    CHECK(snapshot["a"] == "1");
    CHECK(snapshot["list"].size() == 2);

    const auto restored = restore_variables(snapshot.dump());
    CHECK(*restored.find_simple("a") == "1");
    CHECK(restored.find_complex("list")->size() == 2);

    const auto broken = restore_variables("not json");
    CHECK(broken.simple().empty());
    CHECK(broken.complex().empty());
}

int main(int, char **) {
    printf("Running variable tests.\n");
    test_topological_order();
    test_computed_fallbacks();
    test_cycles();
    test_required();
    test_types();
    test_pattern();
    test_array_limits();
    test_nested_schema();
    test_format_value();
    test_merge_precedence();
    test_placeholders();
    test_analysis();
    test_snapshot();
    return 0;
}
