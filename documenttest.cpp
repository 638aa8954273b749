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

#include <generator.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

// 2024-06-15 12:00:00 UTC
const UDate fixed_now = 1718452800000.0;

// Paragraphs are 30 mm tall, everything else keeps its declared height.
class ParagraphMeasurer : public HeightMeasurer {
public:
    Length content_height(const ComponentData &component) override {
        if(std::holds_alternative<ParagraphProps>(component.props)) {
            return Length::from_mm(30);
        }
        return component.rect.size.h;
    }
};

bool parse_throws(const char *text) {
    try {
        parse_document(json::parse(text));
    } catch(const std::runtime_error &) {
        return true;
    }
    return false;
}

bool close_to(double a, double b) { return std::fabs(a - b) < 1e-6; }

const PlacedComponent *placed(const std::vector<PlacedComponent> &components, const std::string &id) {
    for(const auto &p : components) {
        if(p.component.id == id) {
            return &p;
        }
    }
    return nullptr;
}

const char *sample_document = R"({
    "pages": [
        {
            "id": "second",
            "pageNumber": 2,
            "footerType": "none",
            "components": []
        },
        {
            "id": "first",
            "pageNumber": 1,
            "components": [
                {"id": "p", "type": "paragraph", "position": {"x": 0, "y": 0},
                 "size": {"width": 100, "height": 20}, "layout": {"autoExpand": true},
                 "properties": {"content": "Hello {{name}}"}},
                {"id": "note", "type": "text-label", "position": {"x": 0, "y": 20},
                 "size": {"width": 100, "height": 10},
                 "properties": {"content": "Shown"},
                 "condition": {"rules": [{"variable": "show", "operator": "equals", "value": "yes"}]}},
                {"id": "x1", "type": "sparkle", "position": {"x": 120, "y": 0},
                 "size": {"width": 10, "height": 10}}
            ]
        }
    ],
    "headerFooter": {
        "defaultHeader": {"height": 20, "components": [
            {"id": "h", "type": "text-label", "position": {"x": 0, "y": 0},
             "size": {"width": 50, "height": 10}, "properties": {"content": "{{title}}"}}
        ]},
        "defaultFooter": {"height": 15, "components": [
            {"id": "f", "type": "text-label", "position": {"x": 5, "y": 2},
             "size": {"width": 50, "height": 10},
             "properties": {"content": "Page {{pageNumber}} of {{totalPages}}"}}
        ]}
    },
    "variables": {"title": "Acme"},
    "variableDefinitions": [{"name": "name", "required": true}],
    "settings": {"margins": {"top": 10, "right": 10, "bottom": 10, "left": 10}}
})";

} // namespace

void test_parse_pages() {
    auto doc = parse_document(json::parse(sample_document));
    CHECK(doc.pages.size() == 2);
    CHECK(doc.pages[0].id == "second");
    CHECK(doc.pages[1].components.size() == 3);
    CHECK(doc.pages[1].components[0].auto_expand());
    CHECK(doc.pages[1].components[1].condition);
    CHECK(doc.variables.at("title") == "Acme");
    CHECK(doc.variable_definitions.size() == 1);

    apply_global_settings(doc);
    CHECK(doc.pages[0].id == "first");
    CHECK(doc.pages[1].id == "second");
}

void test_legacy_format() {
    const auto doc = parse_document(json::parse(R"({"components": [{"id": "a", "type": "divider"}]})"));
    CHECK(doc.pages.size() == 1);
    CHECK(doc.pages[0].id == "page-1");
    CHECK(doc.pages[0].page_number == 1);
    CHECK(std::holds_alternative<DividerProps>(doc.pages[0].components[0].props));
}

void test_no_pages() {
    CHECK(parse_throws(R"({"pages": []})"));
    CHECK(parse_throws(R"({})"));
    CHECK(parse_throws(R"([])"));
    CHECK(parse_throws(R"({"components": []})"));
}

void test_page_sizes() {
    PageSettings s;
    s.predefined_size = "letter";
    s.orientation = "landscape";
    auto size = page_size(s);
    CHECK(close_to(size.w.mm(), 279.4));
    CHECK(close_to(size.h.mm(), 215.9));

    s.predefined_size = "nonsense";
    s.orientation = "portrait";
    size = page_size(s);
    CHECK(close_to(size.w.mm(), 210));
    CHECK(close_to(size.h.mm(), 297));

    s.predefined_size = "custom";
    s.width = Length::from_mm(100);
    s.height = Length::from_mm(50);
    size = page_size(s);
    CHECK(close_to(size.w.mm(), 50));
    CHECK(close_to(size.h.mm(), 100));

    s.width = Length::zero();
    size = page_size(s);
    CHECK(close_to(size.w.mm(), 210));
    CHECK(!predefined_page_size("b9"));
    CHECK(predefined_page_size("A3"));
}

void test_header_footer_selection() {
    HeaderFooterConfig config;
    config.first_page_header = HeaderFooterContent{Length::from_mm(40), {}};
    CHECK(select_header(config, "firstPage") == &(*config.first_page_header));
    CHECK(select_header(config, "compact") == &config.default_header);
    CHECK(select_header(config, "default") == &config.default_header);
    CHECK(select_header(config, "none") == nullptr);
    CHECK(select_footer(config, "firstPage") == &config.default_footer);

    config.default_footer.height = Length::zero();
    CHECK(select_footer(config, "default") == nullptr);
}

void test_global_settings() {
    auto doc = parse_document(json::parse(R"({
        "pages": [{"id": "a", "pageNumber": 1, "components": [],
                   "pageSettings": {"margins": {"top": 5}, "backgroundColor": "#000"}}],
        "settings": {"orientation": "landscape", "backgroundColor": "#eee",
                     "margins": {"top": 20, "left": 15}}
    })"));
    apply_global_settings(doc);
    const auto &s = doc.pages[0].page_settings;
    CHECK(*s.orientation == "landscape");
    CHECK(*s.background_color == "#000");
    CHECK(*s.content_direction == "ltr");
    CHECK(*s.predefined_size == "a4");
    CHECK(close_to(s.margins.top.mm(), 5));
    CHECK(close_to(s.margins.left.mm(), 15));
    CHECK(close_to(s.margins.right.mm(), 0));
}

void test_colors() {
    auto white = parse_color("#fff");
    CHECK(white);
    CHECK(close_to(white->r, 1) && close_to(white->g, 1) && close_to(white->b, 1));
    auto c = parse_color(" #336699 ");
    CHECK(c);
    CHECK(close_to(c->r, 0x33 / 255.0));
    CHECK(close_to(c->b, 0x99 / 255.0));
    CHECK(!parse_color("red"));
    CHECK(!parse_color("#12"));
    CHECK(!parse_color("#zzzzzz"));
}

void test_conditions() {
    SimpleVariables simple;
    simple["status"] = "active";
    simple["count"] = "5";
    simple["name"] = "Alice";
    simple["flag"] = "yes";
    ComplexVariables complex;
    complex["list"] = json::array({1, 2, 3});
    const VariablePool pool(std::move(simple), std::move(complex));

    auto rule = [&](const char *var, const char *op, const char *value = nullptr) {
        ConditionRule r;
        r.variable = var;
        r.op = op;
        if(value) {
            r.value = value;
        }
        return evaluate_rule(r, pool);
    };
    CHECK(rule("status", "equals", "ACTIVE"));
    CHECK(rule("status", "not_equals", "inactive"));
    CHECK(rule("missing", "not_equals", "x"));
    CHECK(rule("name", "contains", "LIC"));
    CHECK(!rule("name", "not_contains", "lic"));
    CHECK(rule("name", "starts_with", "al"));
    CHECK(rule("name", "ends_with", "ICE"));
    CHECK(rule("count", "greater_than", "3"));
    CHECK(!rule("count", "less_than", "5"));
    CHECK(rule("count", "less_than_or_equals", "5"));
    CHECK(rule("count", "greater_than", "10.5") == false);
    CHECK(rule("list", "greater_than_or_equals", "3"));
    CHECK(rule("missing", "is_empty"));
    CHECK(rule("name", "is_not_empty"));
    CHECK(rule("flag", "is_true"));
    CHECK(rule("missing", "is_false"));
    CHECK(rule("status", "no_such_operator", "x"));

    const auto any = parse_condition(json::parse(R"({"logic": "any", "rules": [
        {"variable": "status", "operator": "equals", "value": "closed"},
        {"variable": "count", "operator": "equals", "value": "5"}]})"));
    CHECK(should_render(any, pool));
    auto all = any;
    all.logic = "all";
    CHECK(!should_render(all, pool));
    all.enabled = false;
    CHECK(should_render(all, pool));
    CHECK(should_render(ConditionConfig{}, pool));
    CHECK(should_render(std::nullopt, pool));
}

void test_compose_document() {
    const auto doc = parse_document(json::parse(sample_document));
    ParagraphMeasurer measurer;
    RuntimeVariables vars;
    vars["name"] = "Ann";
    vars["show"] = "yes";
    const auto result = compose_document(doc, vars, measurer, fixed_now);
    CHECK(result.ok());
    CHECK(result.pages.size() == 2);

    const auto &first = result.pages[0];
    CHECK(first.page_number == 1);
    CHECK(first.header);
    CHECK(first.header->components.size() == 1);
    const auto &h = first.header->components[0];
    CHECK(std::get<TextLabelProps>(h.component.props).content == "Acme");
    CHECK(close_to(h.rect.left().mm(), 10));
    CHECK(close_to(h.rect.top().mm(), 10));

    CHECK(first.footer);
    const auto &f = first.footer->components[0];
    CHECK(std::get<TextLabelProps>(f.component.props).content == "Page 1 of 2");
    CHECK(close_to(f.rect.left().mm(), 15));
    CHECK(close_to(f.rect.top().mm(), 297 - 10 - 15 + 2));

    CHECK(first.components.size() == 3);
    const auto *p = placed(first.components, "p");
    CHECK(p);
    CHECK(std::get<ParagraphProps>(p->component.props).content == "Hello Ann");
    CHECK(close_to(p->rect.top().mm(), 30));
    CHECK(close_to(p->rect.size.h.mm(), 30));
    const auto *note = placed(first.components, "note");
    CHECK(note);
    CHECK(close_to(note->rect.top().mm(), 60));
    CHECK(close_to(note->rect.left().mm(), 10));

    CHECK(result.warnings.size() == 1);
    CHECK(result.warnings[0] == "Page 1: unknown component type 'sparkle' in component 'x1'.");

    const auto &second = result.pages[1];
    CHECK(second.page_number == 2);
    CHECK(second.header);
    CHECK(!second.footer);
    CHECK(second.components.empty());

    CHECK(*result.variables.final_pool().find_simple("title") == "Acme");
}

void test_condition_filtering() {
    const auto doc = parse_document(json::parse(sample_document));
    ParagraphMeasurer measurer;
    RuntimeVariables vars;
    vars["name"] = "Ann";
    vars["show"] = "no";
    const auto result = compose_document(doc, vars, measurer, fixed_now);
    CHECK(result.ok());
    CHECK(result.pages[0].components.size() == 2);
    CHECK(!placed(result.pages[0].components, "note"));
}

void test_validation_aborts() {
    const auto doc = parse_document(json::parse(sample_document));
    ParagraphMeasurer measurer;
    const auto result = compose_document(doc, {}, measurer, fixed_now);
    CHECK(!result.ok());
    CHECK(result.pages.empty());
    CHECK(result.validation.errors.size() == 1);
    CHECK(result.validation.errors[0].kind == ValidationErrorKind::Required);
}

void test_resolve_component_text() {
    SimpleVariables simple;
    simple["who"] = "Bob";
    const VariablePool pool(std::move(simple), {});
    const TemplateEngine engine(pool, fixed_now);

    const auto table = parse_component(json::parse(R"({"id": "t", "type": "table",
        "properties": {"headers": ["Name", "Page"], "data": [["{{who}}", "{{pageNumber}}"]]}})"));
    const auto resolved = resolve_component_text(table, engine, 3, 4);
    const auto &props = std::get<TableProps>(resolved.props);
    CHECK(props.headers[0] == "Name");
    CHECK(props.data[0][0] == "Bob");
    CHECK(props.data[0][1] == "3");

    const auto signature = parse_component(json::parse(R"({"id": "s", "type": "signature-box",
        "properties": {"signerName": "{{who}}", "signerTitle": "{{unknown}}"}})"));
    const auto &sig = std::get<SignatureBoxProps>(resolve_component_text(signature, engine, 1, 1).props);
    CHECK(sig.signer_name == "Bob");
    CHECK(sig.signer_title == "{{unknown}}");

    const auto barcode = parse_component(json::parse(R"({"id": "b", "type": "barcode",
        "properties": {"value": "INV-{{who}}", "barcodeType": "code-128", "errorCorrectionLevel": "high",
        "quietZone": 4}})"));
    const auto &code = std::get<BarcodeProps>(resolve_component_text(barcode, engine, 1, 1).props);
    CHECK(code.value == "INV-Bob");
    CHECK(code.barcode_type == "code-128");
    CHECK(code.error_correction == "high");
    CHECK(code.quiet_zone == 4);
    CHECK(code.show_value);
}

void test_invalid_background() {
    auto content = json::parse(sample_document);
    content["pages"][0]["pageSettings"] = {{"backgroundColor", "blue"}};
    const auto doc = parse_document(content);
    ParagraphMeasurer measurer;
    RuntimeVariables vars;
    vars["name"] = "Ann";
    const auto result = compose_document(doc, vars, measurer, fixed_now);
    CHECK(result.ok());
    CHECK(result.warnings.size() == 2);
    CHECK(result.warnings[0] == "Page 1: unknown component type 'sparkle' in component 'x1'.");
    CHECK(result.warnings[1] == "Page 2: invalid background color 'blue'.");
}

int main(int, char **) {
    printf("Running document tests.\n");
    test_parse_pages();
    test_legacy_format();
    test_no_pages();
    test_page_sizes();
    test_header_footer_selection();
    test_global_settings();
    test_colors();
    test_conditions();
    test_compose_document();
    test_condition_filtering();
    test_validation_aborts();
    test_resolve_component_text();
    test_invalid_background();
    return 0;
}
