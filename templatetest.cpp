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

#include <templateengine.hpp>

#include <cstdio>
#include <cstdlib>

using json = nlohmann::json;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

// 2024-06-15 12:00:00 UTC
const UDate fixed_now = 1718452800000.0;

VariablePool test_pool() {
    SimpleVariables simple;
    simple["name"] = "ann smith";
    simple["note"] = "";
    simple["flag"] = "true";
    simple["off"] = "no";
    simple["amount"] = "1234.5";
    simple["start"] = "2024-03-05";
    simple["company.name"] = "Acme";
    ComplexVariables complex;
    complex["items"] = json::array({"x", "y"});
    complex["people"] = json::parse(R"([{"name":"Ann","age":30},{"name":"Bob","age":40}])");
    complex["groups"] =
        json::parse(R"([{"title":"A","members":["x","y"]},{"title":"B","members":[]}])");
    complex["nothing"] = nullptr;
    complex["user"] = json::parse(R"({"active":true,"nick":""})");
    return VariablePool(std::move(simple), std::move(complex));
}

std::string run(std::string_view text, int page = 1, int total = 1) {
    const auto pool = test_pool();
    const TemplateEngine engine(pool, fixed_now);
    return engine.process(text, page, total);
}

} // namespace

void test_plain_text() {
    CHECK(run("No tokens here.") == "No tokens here.");
    CHECK(run("") == "");
    CHECK(run("Braces { and } alone") == "Braces { and } alone");
}

void test_builtins() {
    CHECK(run("Page {{pageNumber}} of {{totalPages}}", 2, 5) == "Page 2 of 5");
    const auto first = run("{{pageNumber}}", 3, 4);
    const auto second = run("{{pageNumber}}", 3, 4);
    CHECK(first == "3");
    CHECK(first == second);
    CHECK(run("(c) {{year}}") == "(c) 2024");
}

void test_each_indices() {
    CHECK(run("{{#each items}}{{@number}}:{{this}} {{/each}}") == "1:x 2:y ");
    CHECK(run("{{#each items}}{{@index}}{{@first}}{{@last}};{{/each}}") == "0truefalse;1falsetrue;");
}

void test_each_objects() {
    const auto out = run("{{#each people}}{{name}}({{this.age}}){{#if @last}}.{{/if}}"
                         "{{#unless @last}}, {{/unless}}{{/each}}");
    CHECK(out == "Ann(30), Bob(40).");
}

void test_nested_each() {
    const auto out = run("{{#each groups}}{{title}}:{{#each members}}[{{this}}]{{/each}};{{/each}}");
    CHECK(out == "A:[x][y];B:;");
}

void test_each_unknown_array() {
    CHECK(run("<{{#each nosuch}}x{{/each}}>") == "<>");
    CHECK(run("<{{#each name}}x{{/each}}>") == "<>");
    CHECK(run("<{{#each user.nick}}x{{/each}}>") == "<>");
}

void test_if_unless() {
    CHECK(run("{{#if flag}}on{{/if}}") == "on");
    CHECK(run("{{#if off}}on{{/if}}") == "");
    CHECK(run("{{#unless off}}shown{{/unless}}") == "shown");
    CHECK(run("{{#if user.active}}active{{/if}}") == "active");
    CHECK(run("{{#if user.nick}}nick{{/if}}") == "");
    CHECK(run("{{#if missing}}x{{/if}}") == "");
}

void test_nested_same_kind() {
    CHECK(run("{{#if flag}}1{{#if off}}2{{/if}}3{{/if}}") == "13");
    CHECK(run("{{#if flag}}1{{#if flag}}2{{/if}}3{{/if}}") == "123");
    CHECK(run("{{#if off}}1{{#if flag}}2{{/if}}3{{/if}}") == "");
}

void test_unmatched_tags() {
    CHECK(run("{{#if flag}}open") == "{{#if flag}}open");
    CHECK(run("text{{/if}}") == "text{{/if}}");
    CHECK(run("{{#if flag}}a{{/unless}}b{{/if}}") == "a{{/unless}}b");
}

void test_parse_blocks_tree() {
    const auto nodes = parse_blocks("a{{#if x}}b{{#each y}}c{{/each}}{{/if}}d");
    CHECK(nodes.size() == 3);
    CHECK(!nodes[0].kind);
    CHECK(nodes[0].text == "a");
    CHECK(nodes[1].kind == BlockKind::If);
    CHECK(nodes[1].text == "x");
    CHECK(nodes[1].children.size() == 2);
    CHECK(nodes[1].children[1].kind == BlockKind::Each);
    CHECK(nodes[1].children[1].children.size() == 1);
    CHECK(nodes[2].text == "d");
}

void test_inline_conditionals() {
    CHECK(run(R"({{note ?: "default"}})") == "default");
    CHECK(run(R"({{note ?? "default"}})") == "");
    CHECK(run(R"({{missing ?? 'fallback'}})") == "fallback");
    CHECK(run(R"({{nothing ?? "fallback"}})") == "fallback");
    CHECK(run(R"({{flag ? "on" : "off"}})") == "on");
    CHECK(run(R"({{off ? "on" : "off"}})") == "off");
    CHECK(run(R"({{flag ? name : "nobody"}})") == "ann smith");
    CHECK(run(R"({{name ?: "anon"}})") == "ann smith");
}

void test_formatted() {
    CHECK(run("{{name:upper}}") == "ANN SMITH");
    CHECK(run("{{name:title}}") == "Ann Smith");
    CHECK(run("{{amount:USD}}") == "$1,234.50");
    CHECK(run("{{amount:N2}}") == "1,234.50");
    CHECK(run("{{start:YYYY-MM-DD}}") == "2024-03-05");
    CHECK(run("{{start:MMMM d, yyyy}}") == "March 5, 2024");
    CHECK(run("{{missing:upper}}") == "{{missing:upper}}");
}

void test_simple_substitution() {
    CHECK(run("Hello {{name}}!") == "Hello ann smith!");
    CHECK(run("{{company.name}}") == "Acme");
    // Complex values are only reachable through blocks.
    CHECK(run("{{items}}") == "{{items}}");
    CHECK(run("{{unknown}}") == "{{unknown}}");
}

void test_process_template() {
    const auto pool = test_pool();
    CHECK(process_template("{{pageNumber}}/{{totalPages}} {{name}}", 1, 2, pool) == "1/2 ann smith");
}

int main(int, char **) {
    printf("Running template tests.\n");
    test_plain_text();
    test_builtins();
    test_each_indices();
    test_each_objects();
    test_nested_each();
    test_each_unknown_array();
    test_if_unless();
    test_nested_same_kind();
    test_unmatched_tags();
    test_parse_blocks_tree();
    test_inline_conditionals();
    test_formatted();
    test_simple_substitution();
    test_process_template();
    return 0;
}
