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

#include <jsonhelpers.hpp>
#include <utils.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace {

[[noreturn]] void bad_entry(const char *key, const char *what) {
    std::string msg{"Element "};
    msg += key;
    msg += ' ';
    msg += what;
    msg += '.';
    throw std::runtime_error(msg);
}

} // namespace

std::string get_string(const json &data, const char *key) {
    if(!data.is_object() || !data.contains(key)) {
        bad_entry(key, "is missing");
    }
    const auto &value = data[key];
    if(!value.is_string()) {
        bad_entry(key, "is not a string");
    }
    return value.get<std::string>();
}

std::string get_string(const json &data, const char *key, const std::string &fallback) {
    return get_optional_string(data, key).value_or(fallback);
}

std::optional<std::string> get_optional_string(const json &data, const char *key) {
    if(!data.is_object()) {
        return {};
    }
    auto it = data.find(key);
    if(it == data.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

double get_double(const json &data, const char *key) {
    if(!data.is_object() || !data.contains(key)) {
        bad_entry(key, "is missing");
    }
    const auto &value = data[key];
    if(!value.is_number()) {
        bad_entry(key, "is not a number");
    }
    return value.get<double>();
}

double get_double(const json &data, const char *key, double fallback) {
    if(!data.is_object()) {
        return fallback;
    }
    auto it = data.find(key);
    if(it == data.end()) {
        return fallback;
    }
    if(it->is_number()) {
        return it->get<double>();
    }
    if(it->is_string()) {
        return parse_double(it->get<std::string>()).value_or(fallback);
    }
    return fallback;
}

int get_int(const json &data, const char *key, int fallback) {
    return get_optional_int(data, key).value_or(fallback);
}

std::optional<int> get_optional_int(const json &data, const char *key) {
    if(!data.is_object()) {
        return {};
    }
    auto it = data.find(key);
    if(it == data.end() || !it->is_number()) {
        return {};
    }
    return int(it->get<double>());
}

bool get_bool(const json &data, const char *key, bool fallback) {
    return get_optional_bool(data, key).value_or(fallback);
}

std::optional<bool> get_optional_bool(const json &data, const char *key) {
    if(!data.is_object()) {
        return {};
    }
    auto it = data.find(key);
    if(it == data.end()) {
        return {};
    }
    if(it->is_boolean()) {
        return it->get<bool>();
    }
    if(it->is_string()) {
        return parse_bool(it->get<std::string>());
    }
    return {};
}

json parse_json_file(const char *path) {
    const auto contents = read_file(path);
    try {
        return json::parse(contents);
    } catch(const json::parse_error &e) {
        std::string msg{"Could not parse "};
        msg += path;
        msg += ": ";
        msg += e.what();
        throw std::runtime_error(msg);
    }
}
