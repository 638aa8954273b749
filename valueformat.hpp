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

#include <unicode/utypes.h>

#include <optional>
#include <string>
#include <string_view>

// Format strings in documents follow the conventions of the editor, which
// are the .NET ones ("MMMM dd, yyyy", "N2", "#,##0.00"). Everything here
// renders them with ICU in the en_US locale.

enum class DateZone : int {
    Utc,
    Local,
};

// Milliseconds since the epoch, as ICU uses them.
UDate current_time();

// Parsed values carry no zone of their own and are treated as UTC.
std::optional<UDate> parse_date(std::string_view text);

std::optional<std::string> translate_date_pattern(std::string_view dotnet_format);

// "MMMM D, YYYY" -> "MMMM d, yyyy"
std::string normalize_date_format(std::string_view user_format);

std::optional<std::string>
format_date(UDate date, std::string_view dotnet_format, DateZone zone = DateZone::Utc);

std::string long_date(UDate date);

std::optional<std::string> format_number(double value, std::string_view dotnet_format);

// Grouped with a fixed number of decimals, like "N2".
std::string format_grouped(double value, int decimals = 2);

std::optional<std::string> currency_symbol(std::string_view code);

// Unknown currency codes fall back to the dollar sign.
std::string format_money(double value, std::string_view code);
