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

#include <settings.hpp>
#include <jsonhelpers.hpp>

#include <stdexcept>

GenerationSettings parse_settings(const nlohmann::json &data) {
    if(!data.is_object()) {
        throw std::runtime_error("Settings file must contain a JSON object.");
    }
    GenerationSettings s;
    s.title = get_string(data, "title", s.title);
    s.author = get_string(data, "author", s.author);
    s.subject = get_string(data, "subject", s.subject);
    s.keywords = get_string(data, "keywords", s.keywords);
    s.creator = get_string(data, "creator", s.creator);
    s.default_font_family = get_string(data, "defaultFontFamily", s.default_font_family);
    s.default_font_size = get_double(data, "defaultFontSize", s.default_font_size);
    if(s.default_font_size <= 0) {
        throw std::runtime_error("Default font size must be positive.");
    }
    s.debug_draw = get_bool(data, "debugDraw", false);
    return s;
}

GenerationSettings load_settings_json(const char *path) { return parse_settings(parse_json_file(path)); }
