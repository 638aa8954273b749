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

#include <variables.hpp>

#include <unicode/utypes.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class BlockKind : int {
    If,
    Unless,
    Each,
};

// Block structure of a template. Nodes without a kind are literal text,
// block nodes keep their argument in `text`.
struct TemplateNode {
    std::optional<BlockKind> kind;
    std::string text;
    std::vector<TemplateNode> children;
};

// Unmatched open and close tags end up as literal text.
std::vector<TemplateNode> parse_blocks(std::string_view text);

// Text transforms (upper, lower, title, trim), then date, currency code
// and numeric formats. Values that fit none of them are returned as is.
std::string apply_format(const std::string &value, std::string_view format);

/*
 * Resolves the {{...}} placeholders of document text. Processing goes in
 * a fixed order: built-in tokens, blocks (if, unless, each), inline
 * conditionals (?, ?:, ??), formatted variables and plain variables.
 * Placeholders that can not be resolved are left in the output.
 */
class TemplateEngine {
public:
    explicit TemplateEngine(const VariablePool &pool_);
    // The time used for date built-ins is fixed at construction.
    TemplateEngine(const VariablePool &pool_, UDate now_) : pool(pool_), now(now_) {}

    std::string process(std::string_view text, int page_number, int total_pages) const;

    std::string substitute_builtins(std::string_view text, int page_number, int total_pages) const;
    std::string expand_blocks(std::string_view text) const;
    std::string process_inline_conditionals(const std::string &text) const;
    std::string process_formatted(const std::string &text) const;
    std::string substitute_simple(const std::string &text) const;

private:
    struct LoopFrame;

    std::string render(const std::vector<TemplateNode> &nodes,
                       std::vector<LoopFrame> &frames) const;
    std::string render_each(const TemplateNode &node, std::vector<LoopFrame> &frames) const;
    bool block_condition(const std::string &name, const std::vector<LoopFrame> &frames) const;
    const nlohmann::json *loop_array(const std::string &name,
                                     const std::vector<LoopFrame> &frames) const;
    std::string branch_value(const std::optional<std::string> &quoted,
                             const std::optional<std::string> &variable) const;

    const VariablePool &pool;
    UDate now;
};

std::string process_template(std::string_view text,
                             int page_number,
                             int total_pages,
                             const VariablePool &pool);
