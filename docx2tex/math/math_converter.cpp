// math_converter.cpp - OMML formula to LaTeX conversion pipeline

#include "math_converter.hpp"
#include "../format/format-math-latex.hpp"
#include "../formula_thread_pool.h"
#include "../../lib/arena.h"
#include "../../lib/log.h"
#include <algorithm>
#include <cctype>
#include <exception>

namespace docx2tex {

namespace {

// one arena per formula, released on every exit path
struct FormulaArena {
    Arena* arena;
    FormulaArena() : arena(arena_create_default()) {}
    ~FormulaArena() { if (arena) arena_destroy(arena); }
    FormulaArena(const FormulaArena&) = delete;
    FormulaArena& operator=(const FormulaArena&) = delete;
};

} // namespace

// plain text of the formula, escaped; used when the AST could not be built
static std::string salvage_formula_text(const OmmlElement* root) {
    if (!root) return "{}";
    std::string text = root->collect_text();
    std::string latex = escape_math_text(text.c_str(), text.size());
    return latex.empty() ? "{}" : latex;
}

FormulaResult convert_formula(const OmmlElement* root, bool display, int index,
                              const MathConvertOptions& options) {
    FormulaResult result;
    result.index = index;
    result.display = display;

    MathDiagnostics diag(index);
    try {
        FormulaArena scope;
        MathNode* ast = scope.arena ? parse_omml_formula(root, scope.arena, diag, options.max_depth) : nullptr;
        if (!ast) {
            diag.report("m:oMath", "out of memory building the formula tree, kept as text");
            result.latex = salvage_formula_text(root);
        } else {
            MathFormatContext ctx{display, &diag};
            result.latex = format_math_latex(ast, ctx);
            if (options.clean_output) result.latex = clean_math_fragment(result.latex);
        }
    } catch (const std::exception& e) {
        log_error("math: formula %d: conversion failed: %s", index, e.what());
        diag.report("m:oMath", "conversion failed: %s", e.what());
        result.latex = salvage_formula_text(root);
    }

    result.degraded = !diag.empty();
    result.diagnostics = diag.take();
    log_debug("math: formula %d -> %s", index, result.latex.c_str());
    return result;
}

// ============================================================================
// Parallel conversion
// ============================================================================

struct FormulaJob {
    const OmmlFormulaRef* formula;
    int index;
    const MathConvertOptions* options;
    FormulaResult* slot;        // written by exactly one task
};

static void convert_formula_task(void* task_data) {
    FormulaJob* job = (FormulaJob*)task_data;
    *job->slot = convert_formula(job->formula->root, job->formula->display, job->index, *job->options);
}

std::vector<FormulaResult> convert_formulas(const std::vector<OmmlFormulaRef>& formulas,
                                            const MathConvertOptions& options) {
    std::vector<FormulaResult> results(formulas.size());
    int count = (int)formulas.size();

    FormulaThreadPool* pool = nullptr;
    if (options.worker_count != 1 && count > 1) {
        int workers = options.worker_count > 0 ? std::min(options.worker_count, count) : 0;
        pool = formula_pool_create(workers);
        if (!pool) log_warn("math: could not start worker pool, converting serially");
    }

    if (!pool) {
        for (int i = 0; i < count; i++) {
            results[i] = convert_formula(formulas[i].root, formulas[i].display, i, options);
        }
    } else {
        std::vector<FormulaJob> jobs(formulas.size());
        for (int i = 0; i < count; i++) {
            jobs[i] = FormulaJob{&formulas[i], i, &options, &results[i]};
            if (!formula_pool_enqueue(pool, convert_formula_task, &jobs[i])) {
                convert_formula_task(&jobs[i]);
            }
        }
        formula_pool_wait_all(pool);
        formula_pool_destroy(pool);
    }

    int degraded = 0;
    for (const auto& r : results) {
        if (r.degraded) degraded++;
    }
    log_info("math: converted %d formulas, %d degraded", count, degraded);
    return results;
}

// ============================================================================
// Fragment helpers
// ============================================================================

std::string clean_math_fragment(const std::string& latex) {
    std::string out;
    out.reserve(latex.size());
    bool pending_space = false;
    for (char c : latex) {
        if (isspace((unsigned char)c)) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            // keep a space that ends a control space ("\ ") and drop spaces
            // just inside braces or at the start
            bool after_open = !out.empty() && out.back() == '{' &&
                              !(out.size() > 1 && out[out.size() - 2] == '\\');
            bool control_space = !out.empty() && out.back() == '\\';
            if (!out.empty() && !after_open && (c != '}' || control_space)) out += ' ';
            pending_space = false;
        }
        out += c;
    }
    if (pending_space && !out.empty() && out.back() == '\\') out += ' ';
    return out.empty() ? "{}" : out;
}

std::string wrap_math_fragment(const std::string& latex, bool display, MathWrapStyle style) {
    if (!display) return "$" + latex + "$";
    switch (style) {
        case MathWrapStyle::STANDARD: return "\\[ " + latex + " \\]";
        case MathWrapStyle::EQUATION: return "\\begin{equation} " + latex + " \\end{equation}";
    }
    return "\\[ " + latex + " \\]";
}

} // namespace docx2tex
