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

#include <utils.hpp>
#include <glib.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

std::string glib_owned(gchar *str) {
    if(!str) {
        return std::string{};
    }
    std::string result{str};
    g_free(str);
    return result;
}

std::string utf8_casefold(std::string_view text) {
    if(!g_utf8_validate(text.data(), text.length(), nullptr)) {
        std::string result{text};
        for(auto &c : result) {
            c = g_ascii_tolower(c);
        }
        return result;
    }
    return glib_owned(g_utf8_casefold(text.data(), text.length()));
}

} // namespace

std::string trim(std::string_view in_text) {
    while(!in_text.empty() && is_space(in_text.front())) {
        in_text.remove_prefix(1);
    }
    while(!in_text.empty() && is_space(in_text.back())) {
        in_text.remove_suffix(1);
    }
    return std::string{in_text};
}

bool is_blank(std::string_view text) {
    for(const auto c : text) {
        if(!is_space(c)) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split(std::string_view text, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while(true) {
        const auto loc = text.find(separator, start);
        if(loc == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, loc - start));
        start = loc + 1;
    }
    return parts;
}

void replace_all(std::string &text, std::string_view from, std::string_view to) {
    if(from.empty()) {
        return;
    }
    size_t loc = 0;
    while((loc = text.find(from, loc)) != std::string::npos) {
        text.replace(loc, from.length(), to);
        loc += to.length();
    }
}

std::string utf8_upper(std::string_view text) {
    if(!g_utf8_validate(text.data(), text.length(), nullptr)) {
        return std::string{text};
    }
    return glib_owned(g_utf8_strup(text.data(), text.length()));
}

std::string utf8_lower(std::string_view text) {
    if(!g_utf8_validate(text.data(), text.length(), nullptr)) {
        return std::string{text};
    }
    return glib_owned(g_utf8_strdown(text.data(), text.length()));
}

std::string title_case(std::string_view text) {
    std::string result;
    const auto words = split(text, ' ');
    for(size_t i = 0; i < words.size(); ++i) {
        if(i > 0) {
            result += ' ';
        }
        const auto &w = words[i];
        if(w.empty() || !g_utf8_validate(w.c_str(), w.length(), nullptr)) {
            result += w;
            continue;
        }
        const gunichar first = g_unichar_totitle(g_utf8_get_char(w.c_str()));
        char buf[8];
        const auto num_bytes = g_unichar_to_utf8(first, buf);
        result.append(buf, num_bytes);
        const char *rest = g_utf8_next_char(w.c_str());
        result += utf8_lower(std::string_view(rest, w.c_str() + w.length() - rest));
    }
    return result;
}

bool iequals(std::string_view a, std::string_view b) { return icompare(a, b) == 0; }

int icompare(std::string_view a, std::string_view b) {
    const auto fa = utf8_casefold(a);
    const auto fb = utf8_casefold(b);
    const auto rc = fa.compare(fb);
    return rc < 0 ? -1 : (rc > 0 ? 1 : 0);
}

bool icontains(std::string_view haystack, std::string_view needle) {
    return utf8_casefold(haystack).find(utf8_casefold(needle)) != std::string::npos;
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    const auto ft = utf8_casefold(text);
    const auto fp = utf8_casefold(prefix);
    return ft.compare(0, fp.length(), fp) == 0;
}

bool iends_with(std::string_view text, std::string_view suffix) {
    const auto ft = utf8_casefold(text);
    const auto fs = utf8_casefold(suffix);
    return ft.length() >= fs.length() && ft.compare(ft.length() - fs.length(), fs.length(), fs) == 0;
}

std::optional<double> parse_double(std::string_view text) {
    const auto trimmed = trim(text);
    if(trimmed.empty()) {
        return {};
    }
    std::string cleaned;
    cleaned.reserve(trimmed.size());
    size_t i = 0;
    if(trimmed[i] == '+' || trimmed[i] == '-') {
        cleaned.push_back(trimmed[i]);
        ++i;
    }
    bool seen_digit = false;
    bool seen_point = false;
    bool seen_exponent = false;
    for(; i < trimmed.size(); ++i) {
        const char c = trimmed[i];
        if(c >= '0' && c <= '9') {
            seen_digit = true;
            cleaned.push_back(c);
        } else if(c == ',' && seen_digit && !seen_point && !seen_exponent) {
            // Grouping separator, dropped.
        } else if(c == '.' && !seen_point && !seen_exponent) {
            seen_point = true;
            cleaned.push_back(c);
        } else if((c == 'e' || c == 'E') && seen_digit && !seen_exponent) {
            seen_exponent = true;
            cleaned.push_back(c);
            if(i + 1 < trimmed.size() && (trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
                cleaned.push_back(trimmed[++i]);
            }
            if(i + 1 >= trimmed.size()) {
                return {};
            }
        } else {
            return {};
        }
    }
    if(!seen_digit) {
        return {};
    }
    char *end = nullptr;
    const double value = g_ascii_strtod(cleaned.c_str(), &end);
    if(end == cleaned.c_str() || *end != '\0' || !std::isfinite(value)) {
        return {};
    }
    return value;
}

std::optional<bool> parse_bool(std::string_view text) {
    const auto trimmed = trim(text);
    if(g_ascii_strcasecmp(trimmed.c_str(), "true") == 0) {
        return true;
    }
    if(g_ascii_strcasecmp(trimmed.c_str(), "false") == 0) {
        return false;
    }
    return {};
}

std::string format_double(double value) {
    if(value == 0) {
        return "0";
    }
    char buf[G_ASCII_DTOSTR_BUF_SIZE];
    g_ascii_formatd(buf, sizeof(buf), "%.15g", value);
    if(g_ascii_strtod(buf, nullptr) != value) {
        g_ascii_formatd(buf, sizeof(buf), "%.17g", value);
    }
    return std::string{buf};
}

std::string read_file(const char *path) {
    std::ifstream input(path, std::ios::binary);
    if(input.fail()) {
        std::string msg{"Could not open file "};
        msg += path;
        msg += '.';
        throw std::runtime_error(msg);
    }
    std::stringstream buf;
    buf << input.rdbuf();
    auto contents = buf.str();
    if(!g_utf8_validate(contents.c_str(), contents.length(), nullptr)) {
        std::string msg{"Invalid UTF-8 in "};
        msg += path;
        msg += '.';
        throw std::runtime_error(msg);
    }
    return contents;
}
