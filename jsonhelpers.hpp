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

#include <optional>
#include <string>

// Required entries throw std::runtime_error when missing or mistyped,
// the others return the fallback.

std::string get_string(const nlohmann::json &data, const char *key);
std::string get_string(const nlohmann::json &data, const char *key, const std::string &fallback);
std::optional<std::string> get_optional_string(const nlohmann::json &data, const char *key);

double get_double(const nlohmann::json &data, const char *key);
double get_double(const nlohmann::json &data, const char *key, double fallback);

int get_int(const nlohmann::json &data, const char *key, int fallback);
std::optional<int> get_optional_int(const nlohmann::json &data, const char *key);

bool get_bool(const nlohmann::json &data, const char *key, bool fallback);
std::optional<bool> get_optional_bool(const nlohmann::json &data, const char *key);

nlohmann::json parse_json_file(const char *path);
