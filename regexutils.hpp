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

#include <glib.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct MatchDeleter final {
    void operator()(GMatchInfo *mi) { g_match_info_unref(mi); }
};

typedef std::unique_ptr<GMatchInfo, MatchDeleter> re_match;

struct RegexDeleter final {
    void operator()(GRegex *r) { g_regex_unref(r); }
};

typedef std::unique_ptr<GRegex, RegexDeleter> re_handle;

// Throws std::runtime_error if the pattern does not compile.
re_handle compile_regex(const char *pattern, GRegexCompileFlags flags = GRegexCompileFlags(0));

// Returns an empty handle if the pattern does not compile.
re_handle try_compile_regex(const std::string &pattern);

bool group_matched(const GMatchInfo *mi, int group);
std::string group_text(const GMatchInfo *mi, int group);
std::optional<std::string> optional_group(const GMatchInfo *mi, int group);

typedef std::function<std::string(const GMatchInfo *)> ReplaceFunc;

// Replaces every match with what the callback returns. Exceptions thrown by
// the callback stop the replacement and are rethrown to the caller.
std::string regex_replace_eval(GRegex *regex, const std::string &text, const ReplaceFunc &fn);

bool regex_search(GRegex *regex, const std::string &text);
