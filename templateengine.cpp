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

#include <templateengine.hpp>
#include <regexutils.hpp>
#include <utils.hpp>
#include <valueformat.hpp>

#include <unordered_map>

using json = nlohmann::json;

namespace {

const std::unordered_map<std::string, BlockKind> block_names{
    {"if", BlockKind::If},
    {"unless", BlockKind::Unless},
    {"each", BlockKind::Each},
};

GRegex *block_tag_regex() {
    static re_handle regex =
        compile_regex(R"(\{\{#(if|unless|each)\s+(@?[\w.]+)\s*\}\}|\{\{/(if|unless|each)\}\})");
    return regex.get();
}

// The value alternatives are shared by the three inline forms:
// "quoted", 'quoted' or a variable reference.
#define INLINE_OPERAND R"((?:"([^"]*)"|'([^']*)'|([\w.]+)))"

GRegex *ternary_regex() {
    static re_handle regex = compile_regex(R"(\{\{\s*([\w.]+)\s*\?\s*)" INLINE_OPERAND
                                           R"(\s*:\s*)" INLINE_OPERAND R"(\s*\}\})");
    return regex.get();
}

GRegex *elvis_regex() {
    static re_handle regex =
        compile_regex(R"(\{\{\s*([\w.]+)\s*\?:\s*)" INLINE_OPERAND R"(\s*\}\})");
    return regex.get();
}

GRegex *coalesce_regex() {
    static re_handle regex =
        compile_regex(R"(\{\{\s*([\w.]+)\s*\?\?\s*)" INLINE_OPERAND R"(\s*\}\})");
    return regex.get();
}

#undef INLINE_OPERAND

GRegex *formatted_regex() {
    static re_handle regex = compile_regex(R"(\{\{([\w.]+):([^}]+)\}\})");
    return regex.get();
}

GRegex *simple_regex() {
    static re_handle regex = compile_regex(R"(\{\{(\w+(?:\.\w+)*)\}\})");
    return regex.get();
}

std::string matched_text(const GMatchInfo *mi) { return group_text(mi, 0); }

std::optional<std::string> quoted_operand(const GMatchInfo *mi, int first_group) {
    if(group_matched(mi, first_group)) {
        return group_text(mi, first_group);
    }
    if(group_matched(mi, first_group + 1)) {
        return group_text(mi, first_group + 1);
    }
    return {};
}

void append_text(std::vector<TemplateNode> &nodes, std::string_view text) {
    if(text.empty()) {
        return;
    }
    if(!nodes.empty() && !nodes.back().kind) {
        nodes.back().text += text;
        return;
    }
    nodes.push_back(TemplateNode{{}, std::string{text}, {}});
}

void append_nodes(std::vector<TemplateNode> &nodes, std::vector<TemplateNode> &&extra) {
    for(auto &n : extra) {
        if(n.kind) {
            nodes.push_back(std::move(n));
        } else {
            append_text(nodes, n.text);
        }
    }
}

struct OpenBlock {
    BlockKind kind;
    std::string argument;
    std::string tag;
    std::vector<TemplateNode> children;
};

class BlockParser {
public:
    void text(std::string_view t) { append_text(current(), t); }

    void open(BlockKind kind, std::string argument, std::string tag) {
        stack.push_back(OpenBlock{kind, std::move(argument), std::move(tag), {}});
    }

    void close(BlockKind kind, std::string_view tag) {
        size_t depth = stack.size();
        while(depth > 0 && stack[depth - 1].kind != kind) {
            --depth;
        }
        if(depth == 0) {
            append_text(current(), tag);
            return;
        }
        while(stack.size() > depth) {
            unwind_top();
        }
        auto block = std::move(stack.back());
        stack.pop_back();
        current().push_back(
            TemplateNode{block.kind, std::move(block.argument), std::move(block.children)});
    }

    std::vector<TemplateNode> finish() {
        while(!stack.empty()) {
            unwind_top();
        }
        return std::move(root);
    }

private:
    std::vector<TemplateNode> &current() { return stack.empty() ? root : stack.back().children; }

    // An open tag that never got closed becomes plain text again.
    void unwind_top() {
        auto block = std::move(stack.back());
        stack.pop_back();
        append_text(current(), block.tag);
        append_nodes(current(), std::move(block.children));
    }

    std::vector<TemplateNode> root;
    std::vector<OpenBlock> stack;
};

std::string builtin(UDate now, std::string_view format) {
    return format_date(now, format, DateZone::Local).value_or(std::string{});
}

} // namespace

std::vector<TemplateNode> parse_blocks(std::string_view text) {
    const std::string haystack{text};
    BlockParser parser;
    GMatchInfo *raw_match = nullptr;
    g_regex_match(block_tag_regex(), haystack.c_str(), GRegexMatchFlags(0), &raw_match);
    re_match minfo{raw_match};
    size_t offset = 0;
    while(g_match_info_matches(minfo.get())) {
        gint start, end;
        g_match_info_fetch_pos(minfo.get(), 0, &start, &end);
        parser.text(std::string_view(haystack).substr(offset, size_t(start) - offset));
        const auto tag = haystack.substr(start, end - start);
        if(group_matched(minfo.get(), 1)) {
            parser.open(block_names.at(group_text(minfo.get(), 1)), group_text(minfo.get(), 2), tag);
        } else {
            parser.close(block_names.at(group_text(minfo.get(), 3)), tag);
        }
        offset = size_t(end);
        g_match_info_next(minfo.get(), nullptr);
    }
    parser.text(std::string_view(haystack).substr(offset));
    return parser.finish();
}

std::string apply_format(const std::string &value, std::string_view format) {
    const auto lowered = utf8_lower(format);
    if(lowered == "upper" || lowered == "uppercase") {
        return utf8_upper(value);
    }
    if(lowered == "lower" || lowered == "lowercase") {
        return utf8_lower(value);
    }
    if(lowered == "title" || lowered == "titlecase") {
        return title_case(value);
    }
    if(lowered == "trim") {
        return trim(value);
    }
    if(auto date = parse_date(value)) {
        return format_date(*date, normalize_date_format(format)).value_or(value);
    }
    if(auto number = parse_double(value)) {
        if(auto symbol = currency_symbol(format)) {
            return *symbol + format_grouped(*number, 2);
        }
        return format_number(*number, format).value_or(value);
    }
    return value;
}

struct TemplateEngine::LoopFrame {
    const json *item;
    size_t index;
    size_t count;

    void substitute(std::string &text) const {
        replace_all(text, "{{@index}}", std::to_string(index));
        replace_all(text, "{{@number}}", std::to_string(index + 1));
        replace_all(text, "{{@first}}", index == 0 ? "true" : "false");
        replace_all(text, "{{@last}}", index + 1 == count ? "true" : "false");
        if(item->is_string()) {
            replace_all(text, "{{this}}", item->get_ref<const std::string &>());
        } else if(item->is_number()) {
            replace_all(text, "{{this}}", item->dump());
        } else if(item->is_object()) {
            for(auto it = item->begin(); it != item->end(); ++it) {
                const auto value = json_display_string(it.value());
                replace_all(text, "{{this." + it.key() + "}}", value);
                replace_all(text, "{{" + it.key() + "}}", value);
            }
        }
    }

    // Lookup of "this", "this.a.b", "@first" and the like, or of an item member.
    std::optional<json> find(const std::string &name) const {
        if(name == "this") {
            return *item;
        }
        if(name == "@index" || name == "@number") {
            return json(name == "@index" ? index : index + 1);
        }
        if(name == "@first") {
            return json(index == 0);
        }
        if(name == "@last") {
            return json(index + 1 == count);
        }
        auto parts = split_path(name);
        if(parts.front() == "this") {
            parts.erase(parts.begin());
        } else if(!item->is_object() || !item->contains(parts.front())) {
            return {};
        }
        const auto *node = navigate_json(*item, parts);
        if(!node) {
            return {};
        }
        return *node;
    }
};

TemplateEngine::TemplateEngine(const VariablePool &pool_) : pool(pool_), now(current_time()) {}

std::string TemplateEngine::process(std::string_view text, int page_number, int total_pages) const {
    if(text.empty()) {
        return std::string{};
    }
    auto result = substitute_builtins(text, page_number, total_pages);
    result = expand_blocks(result);
    result = process_inline_conditionals(result);
    result = process_formatted(result);
    return substitute_simple(result);
}

std::string
TemplateEngine::substitute_builtins(std::string_view text, int page_number, int total_pages) const {
    std::string result{text};
    if(result.find("{{") == std::string::npos) {
        return result;
    }
    replace_all(result, "{{pageNumber}}", std::to_string(page_number));
    replace_all(result, "{{totalPages}}", std::to_string(total_pages));
    replace_all(result, "{{date}}", builtin(now, "d"));
    replace_all(result, "{{year}}", builtin(now, "yyyy"));
    replace_all(result, "{{time}}", builtin(now, "t"));
    replace_all(result, "{{datetime}}", builtin(now, "g"));
    replace_all(result, "{{today}}", builtin(now, "MMMM dd, yyyy"));
    return result;
}

std::string TemplateEngine::expand_blocks(std::string_view text) const {
    if(text.find("{{") == std::string_view::npos) {
        return std::string{text};
    }
    const auto nodes = parse_blocks(text);
    std::vector<LoopFrame> frames;
    return render(nodes, frames);
}

std::string TemplateEngine::render(const std::vector<TemplateNode> &nodes,
                                   std::vector<LoopFrame> &frames) const {
    std::string out;
    for(const auto &node : nodes) {
        if(!node.kind) {
            std::string text = node.text;
            for(auto it = frames.rbegin(); it != frames.rend(); ++it) {
                it->substitute(text);
            }
            out += text;
            continue;
        }
        switch(*node.kind) {
        case BlockKind::If:
            if(block_condition(node.text, frames)) {
                out += render(node.children, frames);
            }
            break;
        case BlockKind::Unless:
            if(!block_condition(node.text, frames)) {
                out += render(node.children, frames);
            }
            break;
        case BlockKind::Each:
            out += render_each(node, frames);
            break;
        }
    }
    return out;
}

std::string TemplateEngine::render_each(const TemplateNode &node,
                                        std::vector<LoopFrame> &frames) const {
    const auto *array = loop_array(node.text, frames);
    if(!array) {
        return std::string{};
    }
    std::string out;
    const size_t count = array->size();
    for(size_t i = 0; i < count; ++i) {
        frames.push_back(LoopFrame{&(*array)[i], i, count});
        out += render(node.children, frames);
        frames.pop_back();
    }
    return out;
}

bool TemplateEngine::block_condition(const std::string &name,
                                     const std::vector<LoopFrame> &frames) const {
    for(auto it = frames.rbegin(); it != frames.rend(); ++it) {
        if(auto value = it->find(name)) {
            return is_truthy(*value);
        }
    }
    return pool.condition(name);
}

const json *TemplateEngine::loop_array(const std::string &name,
                                       const std::vector<LoopFrame> &frames) const {
    for(auto it = frames.rbegin(); it != frames.rend(); ++it) {
        const auto *item = it->item;
        auto parts = split_path(name);
        if(parts.front() == "this") {
            parts.erase(parts.begin());
        } else if(!item->is_object() || !item->contains(parts.front())) {
            continue;
        }
        const auto *node = navigate_json(*item, parts);
        if(node && node->is_array()) {
            return node;
        }
    }
    if(name.find('.') != std::string::npos) {
        return nullptr;
    }
    const auto *value = pool.find_complex(name);
    if(!value || !value->is_array()) {
        return nullptr;
    }
    return value;
}

std::string TemplateEngine::branch_value(const std::optional<std::string> &quoted,
                                         const std::optional<std::string> &variable) const {
    if(quoted) {
        return *quoted;
    }
    if(variable) {
        return pool.resolve(*variable).value_or(std::string{});
    }
    return std::string{};
}

std::string TemplateEngine::process_inline_conditionals(const std::string &text) const {
    if(text.find('?') == std::string::npos) {
        return text;
    }
    auto result = regex_replace_eval(ternary_regex(), text, [this](const GMatchInfo *mi) {
        const bool condition = pool.condition(group_text(mi, 1));
        if(condition) {
            return branch_value(quoted_operand(mi, 2), optional_group(mi, 4));
        }
        return branch_value(quoted_operand(mi, 5), optional_group(mi, 7));
    });
    result = regex_replace_eval(elvis_regex(), result, [this](const GMatchInfo *mi) {
        const auto value = pool.resolve(group_text(mi, 1));
        if(value && is_truthy_text(*value)) {
            return *value;
        }
        return branch_value(quoted_operand(mi, 2), optional_group(mi, 4));
    });
    return regex_replace_eval(coalesce_regex(), result, [this](const GMatchInfo *mi) {
        const auto defined = pool.is_defined(group_text(mi, 1));
        if(defined.defined && defined.value) {
            return *defined.value;
        }
        return branch_value(quoted_operand(mi, 2), optional_group(mi, 4));
    });
}

std::string TemplateEngine::process_formatted(const std::string &text) const {
    if(text.find("{{") == std::string::npos) {
        return text;
    }
    return regex_replace_eval(formatted_regex(), text, [this](const GMatchInfo *mi) {
        const auto name = group_text(mi, 1);
        std::optional<std::string> value = pool.find_simple(name);
        if(!value) {
            if(const auto *node = pool.find_complex(name)) {
                value = json_display_string(*node);
            }
        }
        if(!value) {
            return matched_text(mi);
        }
        return apply_format(*value, group_text(mi, 2));
    });
}

std::string TemplateEngine::substitute_simple(const std::string &text) const {
    if(text.find("{{") == std::string::npos) {
        return text;
    }
    return regex_replace_eval(simple_regex(), text, [this](const GMatchInfo *mi) {
        if(auto value = pool.find_simple(group_text(mi, 1))) {
            return *value;
        }
        return matched_text(mi);
    });
}

std::string process_template(std::string_view text,
                             int page_number,
                             int total_pages,
                             const VariablePool &pool) {
    TemplateEngine engine(pool);
    return engine.process(text, page_number, total_pages);
}
