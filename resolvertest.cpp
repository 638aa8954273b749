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

#include <cstdio>
#include <cstdlib>

using json = nlohmann::json;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

VariablePool user_pool() {
    ComplexVariables complex;
    complex["user"] = json::parse(R"({"name":"Ann","address":{"city":"X"}})");
    return VariablePool({}, std::move(complex));
}

} // namespace

void test_dot_path() {
    const auto pool = user_pool();
    auto city = pool.resolve("user.address.city");
    CHECK(city);
    CHECK(*city == "X");
    CHECK(!pool.resolve("user.address.zip"));
    CHECK(!pool.resolve("user.name.first"));
    CHECK(!pool.resolve("nobody.name"));
}

void test_case_insensitive_fallback() {
    const auto pool = user_pool();
    auto city = pool.resolve_nested("user.Address.CITY");
    CHECK(city);
    CHECK(*city == "X");
}

void test_flattened_fallback() {
    SimpleVariables simple;
    simple["company.name"] = "Acme";
    const VariablePool pool(std::move(simple), {});
    auto name = pool.resolve("company.name");
    CHECK(name);
    CHECK(*name == "Acme");
}

void test_simple_before_complex() {
    SimpleVariables simple;
    simple["title"] = "from simple";
    ComplexVariables complex;
    complex["title"] = "from complex";
    complex["count"] = 3;
    complex["tags"] = json::array({"a", "b"});
    const VariablePool pool(std::move(simple), std::move(complex));
    CHECK(*pool.resolve("title") == "from simple");
    CHECK(*pool.resolve("count") == "3");
    CHECK(*pool.resolve("tags") == R"(["a","b"])");
}

void test_money_object() {
    ComplexVariables complex;
    complex["price"] = json::parse(R"({"value":1234.5,"currency":"EUR"})");
    complex["fee"] = json::parse(R"({"value":"2","currency":"XYZ"})");
    const VariablePool pool({}, std::move(complex));
    CHECK(*pool.resolve("price") == "€1,234.50");
    CHECK(*pool.resolve("fee") == "$2.00");
}

void test_definedness() {
    ComplexVariables complex;
    complex["nothing"] = nullptr;
    SimpleVariables simple;
    simple["empty"] = "";
    const VariablePool pool(std::move(simple), std::move(complex));

    auto d = pool.is_defined("nothing");
    CHECK(d.defined);
    CHECK(!d.value);

    d = pool.is_defined("empty");
    CHECK(d.defined);
    CHECK(d.value);
    CHECK(d.value->empty());

    d = pool.is_defined("missing");
    CHECK(!d.defined);
}

void test_truthiness() {
    CHECK(!is_truthy_text(""));
    CHECK(!is_truthy_text("   "));
    CHECK(!is_truthy_text("False"));
    CHECK(!is_truthy_text("0"));
    CHECK(!is_truthy_text("NO"));
    CHECK(!is_truthy_text("null"));
    CHECK(is_truthy_text("yes"));
    CHECK(is_truthy_text("anything"));

    CHECK(!is_truthy(json(nullptr)));
    CHECK(!is_truthy(json(0)));
    CHECK(is_truthy(json(2.5)));
    CHECK(!is_truthy(json::array()));
    CHECK(is_truthy(json::array({1})));
    CHECK(is_truthy(json::object()));
}

void test_condition_lookup() {
    SimpleVariables simple;
    simple["flag"] = "true";
    ComplexVariables complex;
    complex["user"] = json::parse(R"({"active":false,"roles":["admin"]})");
    const VariablePool pool(std::move(simple), std::move(complex));
    CHECK(pool.condition("flag"));
    CHECK(!pool.condition("user.active"));
    CHECK(pool.condition("user.roles"));
    CHECK(!pool.condition("unknown"));
}

void test_pool_is_immutable() {
    const auto base = user_pool();
    const auto extended = base.with_simple("extra", "1");
    CHECK(!base.find_simple("extra"));
    CHECK(*extended.find_simple("extra") == "1");
    CHECK(extended.find_complex("user"));

    SimpleVariables overrides;
    overrides["extra"] = "2";
    const auto overridden = extended.with_simple(overrides);
    CHECK(*extended.find_simple("extra") == "1");
    CHECK(*overridden.find_simple("extra") == "2");
}

int main(int, char **) {
    printf("Running resolver tests.\n");
    test_dot_path();
    test_case_insensitive_fallback();
    test_flattened_fallback();
    test_simple_before_complex();
    test_money_object();
    test_definedness();
    test_truthiness();
    test_condition_lookup();
    test_pool_is_immutable();
    return 0;
}
