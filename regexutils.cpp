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

#include <regexutils.hpp>

#include <exception>
#include <stdexcept>

namespace {

struct EvalState {
    const ReplaceFunc *fn;
    std::exception_ptr error;
};

gboolean eval_callback(const GMatchInfo *mi, GString *result, gpointer user_data) {
    auto *state = static_cast<EvalState *>(user_data);
    try {
        const auto replacement = (*state->fn)(mi);
        g_string_append_len(result, replacement.data(), replacement.length());
    } catch(...) {
        // Can not unwind through GLib, carry the exception out instead.
        state->error = std::current_exception();
        return TRUE;
    }
    return FALSE;
}

} // namespace

re_handle compile_regex(const char *pattern, GRegexCompileFlags flags) {
    GError *err = nullptr;
    GRegex *r = g_regex_new(pattern, flags, GRegexMatchFlags(0), &err);
    if(!r) {
        std::string msg{"Invalid regular expression "};
        msg += pattern;
        if(err) {
            msg += ": ";
            msg += err->message;
            g_error_free(err);
        }
        throw std::runtime_error(msg);
    }
    return re_handle{r};
}

re_handle try_compile_regex(const std::string &pattern) {
    GError *err = nullptr;
    GRegex *r = g_regex_new(pattern.c_str(), GRegexCompileFlags(0), GRegexMatchFlags(0), &err);
    if(err) {
        g_error_free(err);
    }
    return re_handle{r};
}

bool group_matched(const GMatchInfo *mi, int group) {
    gint start_pos = -1, end_pos = -1;
    if(!g_match_info_fetch_pos(mi, group, &start_pos, &end_pos)) {
        return false;
    }
    return start_pos >= 0;
}

std::string group_text(const GMatchInfo *mi, int group) {
    return optional_group(mi, group).value_or(std::string{});
}

std::optional<std::string> optional_group(const GMatchInfo *mi, int group) {
    gint start_pos = -1, end_pos = -1;
    if(!g_match_info_fetch_pos(mi, group, &start_pos, &end_pos) || start_pos < 0) {
        return {};
    }
    const gchar *original = g_match_info_get_string(mi);
    return std::string(original + start_pos, end_pos - start_pos);
}

std::string regex_replace_eval(GRegex *regex, const std::string &text, const ReplaceFunc &fn) {
    EvalState state{&fn, nullptr};
    GError *err = nullptr;
    gchar *replaced = g_regex_replace_eval(
        regex, text.c_str(), text.length(), 0, GRegexMatchFlags(0), eval_callback, &state, &err);
    if(state.error) {
        g_free(replaced);
        if(err) {
            g_error_free(err);
        }
        std::rethrow_exception(state.error);
    }
    if(!replaced) {
        std::string msg{"Regular expression replacement failed"};
        if(err) {
            msg += ": ";
            msg += err->message;
            g_error_free(err);
        }
        throw std::runtime_error(msg);
    }
    std::string result{replaced};
    g_free(replaced);
    return result;
}

bool regex_search(GRegex *regex, const std::string &text) {
    return g_regex_match(regex, text.c_str(), GRegexMatchFlags(0), nullptr);
}
