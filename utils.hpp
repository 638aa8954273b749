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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

std::string trim(std::string_view in_text);
bool is_blank(std::string_view text);

std::vector<std::string> split(std::string_view text, char separator);

void replace_all(std::string &text, std::string_view from, std::string_view to);

// Case handling is UTF-8 aware and locale independent.
std::string utf8_upper(std::string_view text);
std::string utf8_lower(std::string_view text);
std::string title_case(std::string_view text);

bool iequals(std::string_view a, std::string_view b);
int icompare(std::string_view a, std::string_view b);
bool icontains(std::string_view haystack, std::string_view needle);
bool istarts_with(std::string_view text, std::string_view prefix);
bool iends_with(std::string_view text, std::string_view suffix);

// Accepts an optional sign, thousands separators, a decimal point and an exponent.
std::optional<double> parse_double(std::string_view text);
std::optional<bool> parse_bool(std::string_view text);

// Shortest representation that reads back to the same value, "15" rather than "15.0".
std::string format_double(double value);

std::string read_file(const char *path);
