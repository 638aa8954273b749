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

#include <nlohmann/json.hpp>

#include <string>

struct GenerationSettings {
    std::string title{"Generated Document"};
    std::string author{"templatizer"};
    std::string subject;
    std::string keywords;
    std::string creator{"templatizer"};
    std::string default_font_family{"Inter"};
    double default_font_size = 11;
    // Outlines every component box, for checking layouts.
    bool debug_draw = false;
};

GenerationSettings parse_settings(const nlohmann::json &data);

GenerationSettings load_settings_json(const char *path);
