// main.cpp - docx2tex-math command line tool
//
// Reads word/document.xml (or a bare m:oMath fragment), converts every
// formula and prints one fragment per line. Diagnostics go to stderr.

#include "input/input-omml.hpp"
#include "math/math_converter.hpp"
#include "../lib/arena.h"
#include "../lib/file.h"
#include "../lib/log.h"
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace docx2tex;

static void print_help(const char* prog) {
    printf("docx2tex-math - convert Office Math (OMML) formulas to LaTeX\n\n");
    printf("Usage: %s [options] <file.xml>\n", prog);
    printf("\nOptions:\n");
    printf("  -j <n>           Worker threads (1 = serial, 0 = one per CPU; default 1)\n");
    printf("  --depth <n>      Maximum formula nesting depth (default %d)\n", MATH_DEFAULT_MAX_DEPTH);
    printf("  --equation       Wrap display formulas in an equation environment\n");
    printf("  --raw            Print formula bodies without $ or \\[ wrapping\n");
    printf("  --no-clean       Keep the emitter's whitespace as is\n");
    printf("  --ast            Print the formula trees instead of LaTeX\n");
    printf("  -h, --help       Show this help message\n");
    printf("\nLogging is configured from ./log.conf when present.\n");
}

static bool parse_int_arg(const char* text, int* out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    long v = strtol(text, &end, 10);
    if (*end != '\0' || v < 0 || v > 4096) return false;
    *out = (int)v;
    return true;
}

static int dump_formula_trees(const std::vector<OmmlFormulaRef>& formulas, int max_depth) {
    for (size_t i = 0; i < formulas.size(); i++) {
        Arena* arena = arena_create_default();
        if (!arena) {
            log_error("main: out of memory");
            return 1;
        }
        MathDiagnostics diag((int)i);
        MathNode* ast = parse_omml_formula(formulas[i].root, arena, diag, max_depth);
        std::string out;
        math_ast_dump(ast, out);
        printf("# formula %zu (%s)\n%s", i, formulas[i].display ? "display" : "inline", out.c_str());
        arena_destroy(arena);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    MathConvertOptions options;
    MathWrapStyle wrap_style = MathWrapStyle::STANDARD;
    bool raw = false;
    bool dump_ast = false;
    const char* input_file = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            log_fini();
            return 0;
        } else if (strcmp(argv[i], "-j") == 0) {
            if (i + 1 >= argc || !parse_int_arg(argv[++i], &options.worker_count)) {
                fprintf(stderr, "Error: -j requires a non-negative number\n");
                log_fini();
                return 1;
            }
        } else if (strcmp(argv[i], "--depth") == 0) {
            if (i + 1 >= argc || !parse_int_arg(argv[++i], &options.max_depth) || options.max_depth == 0) {
                fprintf(stderr, "Error: --depth requires a positive number\n");
                log_fini();
                return 1;
            }
        } else if (strcmp(argv[i], "--equation") == 0) {
            wrap_style = MathWrapStyle::EQUATION;
        } else if (strcmp(argv[i], "--raw") == 0) {
            raw = true;
        } else if (strcmp(argv[i], "--no-clean") == 0) {
            options.clean_output = false;
        } else if (strcmp(argv[i], "--ast") == 0) {
            dump_ast = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            fprintf(stderr, "Error: unknown option %s\n", argv[i]);
            log_fini();
            return 1;
        } else if (!input_file) {
            input_file = argv[i];
        } else {
            fprintf(stderr, "Error: only one input file is accepted\n");
            log_fini();
            return 1;
        }
    }

    if (!input_file) {
        print_help(argv[0]);
        log_fini();
        return 1;
    }

    size_t len = 0;
    char* xml = read_text_file(input_file, &len);
    if (!xml) {
        fprintf(stderr, "Error: cannot read %s\n", input_file);
        log_fini();
        return 1;
    }

    std::string error;
    std::unique_ptr<OmmlElement> root = read_omml_xml(std::string(xml, len), &error);
    free(xml);
    if (!root) {
        fprintf(stderr, "Error: %s is not well-formed XML: %s\n", input_file, error.c_str());
        log_fini();
        return 1;
    }

    std::vector<OmmlFormulaRef> formulas = find_omml_formulas(root.get());
    log_info("main: %zu formulas in %s", formulas.size(), input_file);

    int exit_code = 0;
    if (dump_ast) {
        exit_code = dump_formula_trees(formulas, options.max_depth);
    } else {
        std::vector<FormulaResult> results = convert_formulas(formulas, options);
        for (const auto& r : results) {
            std::string line = raw ? r.latex : wrap_math_fragment(r.latex, r.display, wrap_style);
            printf("%s\n", line.c_str());
            for (const auto& d : r.diagnostics) {
                fprintf(stderr, "formula %d: %s: %s\n", d.formula_index, d.element.c_str(), d.reason.c_str());
            }
        }
    }

    log_fini();
    return exit_code;
}
