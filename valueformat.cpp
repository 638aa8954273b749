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

#include <valueformat.hpp>
#include <utils.hpp>

#include <glib.h>
#include <unicode/decimfmt.h>
#include <unicode/dcfmtsym.h>
#include <unicode/locid.h>
#include <unicode/parsepos.h>
#include <unicode/smpdtfmt.h>
#include <unicode/timezone.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <unordered_map>

namespace {

// Tried in order, the first one that consumes the whole input wins.
const char *date_patterns[] = {
    "yyyy-MM-dd'T'HH:mm:ss.SSSXXX",
    "yyyy-MM-dd'T'HH:mm:ssXXX",
    "yyyy-MM-dd'T'HH:mm:ss.SSS",
    "yyyy-MM-dd'T'HH:mm:ss",
    "yyyy-MM-dd'T'HH:mm",
    "yyyy-MM-dd HH:mm:ss",
    "yyyy-MM-dd HH:mm",
    "yyyy-MM-dd",
    "yyyy/MM/dd",
    "M/d/yyyy h:mm:ss a",
    "M/d/yyyy h:mm a",
    "M/d/yyyy",
    "EEEE, MMMM d, yyyy",
    "MMMM d, yyyy",
    "MMM d, yyyy",
    "d MMMM yyyy",
    "d MMM yyyy",
};

const std::unordered_map<char, const char *> standard_date_formats{
    {'d', "M/d/yyyy"},
    {'D', "EEEE, MMMM d, yyyy"},
    {'f', "EEEE, MMMM d, yyyy h:mm a"},
    {'F', "EEEE, MMMM d, yyyy h:mm:ss a"},
    {'g', "M/d/yyyy h:mm a"},
    {'G', "M/d/yyyy h:mm:ss a"},
    {'m', "MMMM d"},
    {'M', "MMMM d"},
    {'o', "yyyy-MM-dd'T'HH:mm:ss.SSSSSSSxxx"},
    {'O', "yyyy-MM-dd'T'HH:mm:ss.SSSSSSSxxx"},
    {'r', "EEE, dd MMM yyyy HH:mm:ss 'GMT'"},
    {'R', "EEE, dd MMM yyyy HH:mm:ss 'GMT'"},
    {'s', "yyyy-MM-dd'T'HH:mm:ss"},
    {'t', "h:mm a"},
    {'T', "h:mm:ss a"},
    {'u', "yyyy-MM-dd HH:mm:ss'Z'"},
    {'U', "EEEE, MMMM d, yyyy h:mm:ss a"},
    {'y', "MMMM yyyy"},
    {'Y', "MMMM yyyy"},
};

const std::unordered_map<std::string, std::string> currency_symbols{
    {"USD", "$"},
    {"EUR", "€"},
    {"GBP", "£"},
    {"JPY", "¥"},
    {"CNY", "¥"},
    {"CAD", "CA$"},
    {"AUD", "A$"},
    {"CHF", "CHF "},
    {"INR", "₹"},
    {"KRW", "₩"},
    {"BRL", "R$"},
    {"MXN", "MX$"},
};

void append_literal(std::string &out, std::string_view literal) {
    if(literal.empty()) {
        return;
    }
    out += '\'';
    for(const char c : literal) {
        if(c == '\'') {
            out += "''";
        } else {
            out += c;
        }
    }
    out += '\'';
}

std::string to_utf8(const icu::UnicodeString &ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

std::unique_ptr<icu::DecimalFormat> create_decimal_format(const icu::UnicodeString &pattern) {
    UErrorCode status = U_ZERO_ERROR;
    auto *symbols = new icu::DecimalFormatSymbols(icu::Locale::getUS(), status);
    if(U_FAILURE(status)) {
        delete symbols;
        return {};
    }
    // DecimalFormat takes ownership of the symbols even on failure.
    std::unique_ptr<icu::DecimalFormat> fmt(new icu::DecimalFormat(pattern, symbols, status));
    if(U_FAILURE(status)) {
        return {};
    }
    fmt->setRoundingMode(icu::DecimalFormat::kRoundHalfUp);
    return fmt;
}

std::optional<std::string> format_fixed(double value, int decimals, bool grouping) {
    auto fmt = create_decimal_format(grouping ? "#,##0" : "0");
    if(!fmt) {
        return {};
    }
    fmt->setMinimumFractionDigits(decimals);
    fmt->setMaximumFractionDigits(decimals);
    icu::UnicodeString out;
    fmt->format(value, out);
    return to_utf8(out);
}

std::optional<std::string> format_scientific(double value, int decimals, bool lower_case) {
    icu::UnicodeString pattern("0");
    if(decimals > 0) {
        pattern += u'.';
        for(int i = 0; i < decimals; ++i) {
            pattern += u'0';
        }
    }
    pattern += "E+000";
    auto fmt = create_decimal_format(pattern);
    if(!fmt) {
        return {};
    }
    icu::UnicodeString out;
    fmt->format(value, out);
    auto result = to_utf8(out);
    if(lower_case) {
        std::replace(result.begin(), result.end(), 'E', 'e');
    }
    return result;
}

std::optional<std::string> format_standard_number(double value, char code, int precision) {
    switch(code) {
    case 'N':
    case 'n':
        return format_fixed(value, precision < 0 ? 2 : precision, true);
    case 'F':
    case 'f':
        return format_fixed(value, precision < 0 ? 2 : precision, false);
    case 'C':
    case 'c': {
        auto body = format_fixed(std::fabs(value), precision < 0 ? 2 : precision, true);
        if(!body) {
            return {};
        }
        return (value < 0 ? "-$" : "$") + *body;
    }
    case 'P':
    case 'p': {
        auto body = format_fixed(value * 100, precision < 0 ? 2 : precision, true);
        if(!body) {
            return {};
        }
        return *body + "%";
    }
    case 'E':
    case 'e':
        return format_scientific(value, precision < 0 ? 6 : precision, code == 'e');
    case 'G':
    case 'g':
    case 'R':
    case 'r': {
        if(precision <= 0) {
            return format_double(value);
        }
        char fmtbuf[16];
        snprintf(fmtbuf, sizeof(fmtbuf), "%%.%dG", std::min(precision, 17));
        char buf[G_ASCII_DTOSTR_BUF_SIZE];
        g_ascii_formatd(buf, sizeof(buf), fmtbuf, value);
        return std::string{buf};
    }
    default:
        // Integer-only and hexadecimal formats do not apply to fractional values.
        return {};
    }
}

} // namespace

UDate current_time() {
    GDateTime *now = g_date_time_new_now_utc();
    const UDate result = double(g_date_time_to_unix(now)) * 1000.0 +
                         g_date_time_get_microsecond(now) / 1000;
    g_date_time_unref(now);
    return result;
}

std::optional<UDate> parse_date(std::string_view text) {
    const auto trimmed = trim(text);
    if(trimmed.empty()) {
        return {};
    }
    const auto ustr = icu::UnicodeString::fromUTF8(trimmed);
    for(const char *pattern : date_patterns) {
        UErrorCode status = U_ZERO_ERROR;
        icu::SimpleDateFormat fmt(icu::UnicodeString(pattern), icu::Locale::getUS(), status);
        if(U_FAILURE(status)) {
            continue;
        }
        fmt.setLenient(false);
        fmt.setTimeZone(*icu::TimeZone::getGMT());
        icu::ParsePosition pos(0);
        const UDate parsed = fmt.parse(ustr, pos);
        if(pos.getErrorIndex() < 0 && pos.getIndex() == ustr.length()) {
            return parsed;
        }
    }
    return {};
}

std::optional<std::string> translate_date_pattern(std::string_view fmt) {
    if(fmt.empty()) {
        return std::string{standard_date_formats.at('G')};
    }
    if(fmt.length() == 1) {
        auto it = standard_date_formats.find(fmt.front());
        if(it == standard_date_formats.end()) {
            return {};
        }
        return std::string{it->second};
    }
    std::string out;
    size_t i = 0;
    while(i < fmt.size()) {
        const char c = fmt[i];
        if(c == '\'' || c == '"') {
            const auto end = fmt.find(c, i + 1);
            if(end == std::string_view::npos) {
                return {};
            }
            append_literal(out, fmt.substr(i + 1, end - i - 1));
            i = end + 1;
            continue;
        }
        if(c == '\\') {
            if(i + 1 < fmt.size()) {
                append_literal(out, fmt.substr(i + 1, 1));
            }
            i += 2;
            continue;
        }
        if(c == '%') {
            ++i;
            continue;
        }
        size_t run = 1;
        while(i + run < fmt.size() && fmt[i + run] == c) {
            ++run;
        }
        switch(c) {
        case 'y':
            out += run <= 2 ? std::string("yy") : std::string(run, 'y');
            break;
        case 'M':
            out += std::string(std::min(run, size_t(4)), 'M');
            break;
        case 'd':
            if(run <= 2) {
                out += std::string(run, 'd');
            } else {
                out += run == 3 ? "EEE" : "EEEE";
            }
            break;
        case 'h':
        case 'H':
        case 'm':
        case 's':
            out += std::string(std::min(run, size_t(2)), c);
            break;
        case 'f':
        case 'F':
            out += std::string(std::min(run, size_t(7)), 'S');
            break;
        case 't':
            out += 'a';
            break;
        case 'z':
            out += "xxx";
            break;
        case 'K':
            out += "XXX";
            break;
        case 'g':
            out += 'G';
            break;
        default:
            if(g_ascii_isalpha(c)) {
                append_literal(out, std::string(run, c));
            } else {
                out.append(run, c);
            }
        }
        i += run;
    }
    return out;
}

std::string normalize_date_format(std::string_view user_format) {
    std::string result{user_format};
    replace_all(result, "YYYY", "yyyy");
    replace_all(result, "YY", "yy");
    replace_all(result, "DD", "dd");
    replace_all(result, " D,", " d,");
    replace_all(result, " D ", " d ");
    replace_all(result, ",D", ",d");
    if(result.length() >= 2 && result.compare(result.length() - 2, 2, " D") == 0) {
        result[result.length() - 1] = 'd';
    }
    return result;
}

std::optional<std::string> format_date(UDate date, std::string_view dotnet_format, DateZone zone) {
    const auto pattern = translate_date_pattern(dotnet_format);
    if(!pattern) {
        return {};
    }
    UErrorCode status = U_ZERO_ERROR;
    icu::SimpleDateFormat fmt(icu::UnicodeString::fromUTF8(*pattern), icu::Locale::getUS(), status);
    if(U_FAILURE(status)) {
        return {};
    }
    if(zone == DateZone::Utc) {
        fmt.setTimeZone(*icu::TimeZone::getGMT());
    }
    icu::UnicodeString out;
    fmt.format(date, out);
    return to_utf8(out);
}

std::string long_date(UDate date) { return format_date(date, "D").value_or(std::string{}); }

std::optional<std::string> format_number(double value, std::string_view dotnet_format) {
    if(dotnet_format.empty()) {
        return format_double(value);
    }
    const char code = dotnet_format.front();
    const auto digits = dotnet_format.substr(1);
    const bool is_standard = g_ascii_isalpha(code) && digits.length() <= 2 &&
                             std::all_of(digits.begin(), digits.end(), [](char c) {
                                 return c >= '0' && c <= '9';
                             });
    if(is_standard) {
        const int precision = digits.empty() ? -1 : atoi(std::string{digits}.c_str());
        return format_standard_number(value, code, precision);
    }
    auto fmt = create_decimal_format(icu::UnicodeString::fromUTF8(std::string{dotnet_format}));
    if(!fmt) {
        return {};
    }
    icu::UnicodeString out;
    fmt->format(value, out);
    return to_utf8(out);
}

std::string format_grouped(double value, int decimals) {
    return format_fixed(value, decimals, true).value_or(format_double(value));
}

std::optional<std::string> currency_symbol(std::string_view code) {
    auto it = currency_symbols.find(utf8_upper(code));
    if(it == currency_symbols.end()) {
        return {};
    }
    return it->second;
}

std::string format_money(double value, std::string_view code) {
    return currency_symbol(code).value_or("$") + format_grouped(value, 2);
}
