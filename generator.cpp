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
#include <conditions.hpp>
#include <dependencychain.hpp>
#include <layoutengine.hpp>

namespace {

std::vector<ComponentData> visible_components(const std::vector<ComponentData> &components,
                                              const VariablePool &pool,
                                              const TemplateEngine &engine,
                                              int page_number,
                                              int total_pages) {
    std::vector<ComponentData> result;
    for(const auto &c : components) {
        if(!should_render(c.condition, pool)) {
            continue;
        }
        result.push_back(resolve_component_text(c, engine, page_number, total_pages));
    }
    return result;
}

void warn_unknown(const std::vector<ComponentData> &components,
                  int page_number,
                  std::vector<std::string> &warnings) {
    for(const auto &c : components) {
        if(auto *u = std::get_if<UnknownProps>(&c.props)) {
            warnings.push_back("Page " + std::to_string(page_number) + ": unknown component type '" +
                               u->type_name + "' in component '" + c.id + "'.");
        }
    }
}

std::optional<ComposedBand> compose_band(const HeaderFooterContent *content,
                                         Position origin,
                                         const VariablePool &pool,
                                         const TemplateEngine &engine,
                                         int page_number,
                                         int total_pages) {
    if(!content) {
        return {};
    }
    ComposedBand band;
    band.height = content->height;
    for(auto &c : visible_components(content->components, pool, engine, page_number, total_pages)) {
        Rect r = c.rect;
        r.pos.x += origin.x;
        r.pos.y += origin.y;
        band.components.push_back(PlacedComponent{std::move(c), r});
    }
    return band;
}

} // namespace

ComponentData resolve_component_text(const ComponentData &component,
                                     const TemplateEngine &engine,
                                     int page_number,
                                     int total_pages) {
    ComponentData resolved = component;
    auto process = [&](std::string &text) { text = engine.process(text, page_number, total_pages); };
    if(auto *p = std::get_if<TextLabelProps>(&resolved.props)) {
        process(p->content);
    } else if(auto *p = std::get_if<ParagraphProps>(&resolved.props)) {
        process(p->content);
    } else if(auto *p = std::get_if<TableProps>(&resolved.props)) {
        for(auto &h : p->headers) {
            process(h);
        }
        for(auto &row : p->data) {
            for(auto &cell : row) {
                process(cell);
            }
        }
    } else if(auto *p = std::get_if<TextFieldProps>(&resolved.props)) {
        process(p->label);
        process(p->placeholder);
    } else if(auto *p = std::get_if<DateFieldProps>(&resolved.props)) {
        process(p->label);
    } else if(auto *p = std::get_if<CheckboxProps>(&resolved.props)) {
        process(p->label);
    } else if(auto *p = std::get_if<SignatureBoxProps>(&resolved.props)) {
        process(p->signer_name);
        process(p->signer_title);
    } else if(auto *p = std::get_if<BarcodeProps>(&resolved.props)) {
        process(p->value);
    }
    return resolved;
}

GenerationResult compose_document(const Document &document,
                                  const RuntimeVariables &provided,
                                  HeightMeasurer &measurer,
                                  UDate now) {
    Document doc = document;
    apply_global_settings(doc);

    GenerationResult result;
    result.validation = validate_variables(doc.variable_definitions, provided);
    if(!result.ok()) {
        return result;
    }
    result.variables = merge_variables(doc.variable_definitions, doc.variables, provided);
    const VariablePool &pool = result.variables.final_pool();
    const TemplateEngine engine(pool, now);
    const int total_pages = (int)doc.pages.size();

    for(const auto &page : doc.pages) {
        ComposedPage composed;
        composed.page_number = page.page_number;
        composed.size = page_size(page.page_settings);
        composed.margins = page.page_settings.margins;
        if(page.page_settings.background_color) {
            if(auto color = parse_color(*page.page_settings.background_color)) {
                composed.background = *color;
            } else {
                result.warnings.push_back("Page " + std::to_string(page.page_number) +
                                          ": invalid background color '" +
                                          *page.page_settings.background_color + "'.");
            }
        }
        composed.rtl = page.page_settings.content_direction.value_or("ltr") == "rtl";

        const auto *header_content = select_header(doc.header_footer, page.header_type);
        const auto *footer_content = select_footer(doc.header_footer, page.footer_type);
        const Length header_height = header_content ? header_content->height : Length::zero();
        composed.header = compose_band(header_content,
                                       Position{composed.margins.left, composed.margins.top},
                                       pool,
                                       engine,
                                       page.page_number,
                                       total_pages);
        if(footer_content) {
            const Position footer_origin{composed.margins.left,
                                         composed.size.h - composed.margins.bottom -
                                             footer_content->height};
            composed.footer =
                compose_band(footer_content, footer_origin, pool, engine, page.page_number, total_pages);
        }

        const auto components =
            visible_components(page.components, pool, engine, page.page_number, total_pages);
        warn_unknown(components, page.page_number, result.warnings);

        auto layout = provisional_layout(components);
        apply_measurements(layout, measurer);
        const auto deps = build_dependency_map(layout);
        const Position origin{composed.margins.left, composed.margins.top + header_height};
        for(const auto &group : group_components_by_dependency(layout, deps)) {
            for(const auto &item : flow_group(group, deps)) {
                Rect r = item.placed;
                r.pos.x += origin.x;
                r.pos.y += origin.y;
                composed.components.push_back(PlacedComponent{*item.component->component, r});
            }
        }
        result.pages.push_back(std::move(composed));
    }
    return result;
}
