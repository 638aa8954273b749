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

#include <document.hpp>
#include <generator.hpp>
#include <jsonhelpers.hpp>
#include <pangomeasurer.hpp>
#include <pdfrenderer.hpp>
#include <settings.hpp>
#include <variableservice.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Options {
    std::string document_file;
    std::optional<std::string> variables_file;
    std::string output_file{"output.pdf"};
    std::optional<std::string> settings_file;
    std::optional<std::string> records_file;
    std::optional<std::string> snapshot_file;
    bool validate_only = false;
    bool analyze = false;
};

void print_usage(const char *prog) {
    printf("%s [options] <document.json> [variables.json]\n\n", prog);
    printf("  -o <file.pdf>           output file (default output.pdf)\n");
    printf("  --settings <file.json>  PDF metadata and font defaults\n");
    printf("  --records <file.json>   generate one PDF per record in a JSON array\n");
    printf("  --snapshot <file.json>  write the resolved variables\n");
    printf("  --validate              only validate the variables\n");
    printf("  --analyze               list declared, used, undefined and unused variables\n");
}

std::optional<Options> parse_args(int argc, char **argv) {
    Options opts;
    std::vector<std::string> positional;
    for(int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        auto next_value = [&]() -> const char * {
            if(i + 1 >= argc) {
                throw std::runtime_error(std::string("Option ") + arg + " needs a value.");
            }
            return argv[++i];
        };
        if(strcmp(arg, "-o") == 0) {
            opts.output_file = next_value();
        } else if(strcmp(arg, "--settings") == 0) {
            opts.settings_file = next_value();
        } else if(strcmp(arg, "--records") == 0) {
            opts.records_file = next_value();
        } else if(strcmp(arg, "--snapshot") == 0) {
            opts.snapshot_file = next_value();
        } else if(strcmp(arg, "--validate") == 0) {
            opts.validate_only = true;
        } else if(strcmp(arg, "--analyze") == 0) {
            opts.analyze = true;
        } else if(strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            return {};
        } else if(arg[0] == '-' && arg[1] != '\0') {
            throw std::runtime_error(std::string("Unknown option ") + arg + ".");
        } else {
            positional.emplace_back(arg);
        }
    }
    if(positional.empty() || positional.size() > 2) {
        return {};
    }
    opts.document_file = positional[0];
    if(positional.size() == 2) {
        opts.variables_file = positional[1];
    }
    return opts;
}

void print_list(const char *title, const std::vector<std::string> &names) {
    printf("%s (%d):\n", title, (int)names.size());
    for(const auto &n : names) {
        printf("  %s\n", n.c_str());
    }
}

void print_analysis(const nlohmann::json &content) {
    const auto analysis = analyze_variables(content);
    printf("Declared variables (%d):\n", (int)analysis.definitions.size());
    for(const auto &d : analysis.definitions) {
        printf("  %s%s\n", d.name.c_str(), d.is_computed ? " (computed)" : "");
    }
    print_list("Used in content", analysis.detected);
    print_list("Undefined", analysis.undefined);
    print_list("Unused", analysis.unused);
}

void print_errors(const ValidationResult &validation) {
    for(const auto &e : validation.errors) {
        fprintf(stderr, "  [%s] %s\n", kind_name(e.kind), e.message.c_str());
    }
}

void print_warnings(const std::vector<std::string> &warnings) {
    for(const auto &w : warnings) {
        fprintf(stderr, "Warning: %s\n", w.c_str());
    }
}

// Returns true if a PDF was written.
bool generate(const Document &doc,
              const RuntimeVariables &vars,
              const GenerationSettings &settings,
              const std::string &ofname,
              const std::optional<std::string> &snapshot_file) {
    PangoMeasurer measurer;
    auto result = compose_document(doc, vars, measurer);
    if(!result.ok()) {
        fprintf(stderr, "Variable validation failed for %s:\n", ofname.c_str());
        print_errors(result.validation);
        return false;
    }
    print_warnings(result.warnings);
    PdfRenderer renderer(ofname.c_str(), settings);
    renderer.render_document(result.pages);
    renderer.finish();
    print_warnings(renderer.warnings());
    if(snapshot_file) {
        std::ofstream out(*snapshot_file);
        out << snapshot_variables(result.variables.final_pool()).dump(2) << "\n";
        if(!out) {
            throw std::runtime_error("Could not write snapshot file " + *snapshot_file + ".");
        }
    }
    printf("Wrote %s (%d pages).\n", ofname.c_str(), renderer.page_num());
    return true;
}

RuntimeVariables layered(const RuntimeVariables &shared, const nlohmann::json &record) {
    RuntimeVariables vars = shared;
    for(auto &[name, value] : runtime_variables_from_json(record)) {
        vars[name] = value;
    }
    return vars;
}

std::string record_output_name(const std::string &ofname, size_t n) {
    const fs::path out(ofname);
    fs::path name = out.parent_path() / out.stem();
    name += "-" + std::to_string(n) + ".pdf";
    return name.string();
}

int run(const Options &opts) {
    const auto content = parse_json_file(opts.document_file.c_str());
    if(opts.analyze) {
        print_analysis(content);
        return 0;
    }
    const auto doc = parse_document(content);
    RuntimeVariables vars;
    if(opts.variables_file) {
        const auto data = parse_json_file(opts.variables_file->c_str());
        if(!data.is_object()) {
            throw std::runtime_error("Variables file must contain a JSON object.");
        }
        vars = runtime_variables_from_json(data);
    }
    const GenerationSettings settings =
        opts.settings_file ? load_settings_json(opts.settings_file->c_str()) : GenerationSettings{};

    if(opts.validate_only) {
        const auto validation = validate_variables(doc.variable_definitions, vars);
        if(validation.is_valid()) {
            printf("Variables are valid.\n");
            return 0;
        }
        printf("Found %d validation errors.\n", (int)validation.errors.size());
        print_errors(validation);
        return 1;
    }

    if(!opts.records_file) {
        return generate(doc, vars, settings, opts.output_file, opts.snapshot_file) ? 0 : 1;
    }

    const auto records = parse_json_file(opts.records_file->c_str());
    if(!records.is_array()) {
        throw std::runtime_error("Records file must contain a JSON array of objects.");
    }
    size_t failures = 0;
    for(size_t i = 0; i < records.size(); ++i) {
        const auto ofname = record_output_name(opts.output_file, i + 1);
        try {
            if(!records[i].is_object()) {
                throw std::runtime_error("record is not a JSON object");
            }
            if(!generate(doc, layered(vars, records[i]), settings, ofname, {})) {
                ++failures;
            }
        } catch(const std::exception &e) {
            fprintf(stderr, "Record %d failed: %s\n", int(i + 1), e.what());
            ++failures;
        }
    }
    printf("Generated %d of %d records.\n", int(records.size() - failures), (int)records.size());
    return failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char **argv) {
    try {
        const auto opts = parse_args(argc, argv);
        if(!opts) {
            print_usage(argv[0]);
            return 1;
        }
        return run(*opts);
    } catch(const std::exception &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
}
