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

#include <document.hpp>
#include <measurer.hpp>
#include <templateengine.hpp>
#include <valueformat.hpp>
#include <variableservice.hpp>

#include <optional>
#include <string>
#include <vector>

struct PlacedComponent {
    // Text properties have all templates resolved.
    ComponentData component;
    // Absolute position on the page.
    Rect rect;
};

struct ComposedBand {
    Length height;
    std::vector<PlacedComponent> components;
};

struct ComposedPage {
    int page_number = 0;
    PageSize size;
    PageMargins margins;
    Color background{1, 1, 1};
    bool rtl = false;
    std::optional<ComposedBand> header;
    std::optional<ComposedBand> footer;
    std::vector<PlacedComponent> components;
};

struct GenerationResult {
    ValidationResult validation;
    MergedVariables variables;
    std::vector<ComposedPage> pages;
    std::vector<std::string> warnings;

    bool ok() const { return validation.is_valid(); }
};

ComponentData resolve_component_text(const ComponentData &component,
                                     const TemplateEngine &engine,
                                     int page_number,
                                     int total_pages);

// Validates and merges the variables, then lays out every page. When
// validation fails the result has no pages.
GenerationResult compose_document(const Document &document,
                                  const RuntimeVariables &provided,
                                  HeightMeasurer &measurer,
                                  UDate now = current_time());
