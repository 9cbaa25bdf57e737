// format-math-latex.cpp - LaTeX emitter for MathNode trees
//
// Second half of the math pipeline:
//   MathNode tree -> LaTeX formula body
//
// Every node kind is handled in format_node_latex(); the switch has no
// default case so a new kind does not compile until it is handled here.
// Escaping of source text happens exactly once, when a run is written.

#include "format-math-latex.hpp"
#include "../math/math_delimiters.hpp"
#include "../math/math_symbols.hpp"
#include "../../lib/log.h"
#include "../../lib/utf.h"
#include <cctype>
#include <cstring>

namespace docx2tex {

// ============================================================================
// Forward declarations
// ============================================================================

static void format_node_latex(std::string& out, const MathNode* node, MathFormatContext& ctx);

// ============================================================================
// Output helpers
// ============================================================================

// true if out ends with a control word such as "\alpha"
static bool ends_with_control_word(const std::string& out) {
    size_t i = out.size();
    while (i > 0 && isalpha((unsigned char)out[i - 1])) i--;
    if (i == out.size() || i == 0) return false;
    return out[i - 1] == '\\';
}

// append LaTeX, separating a control word from a following letter
static void append_latex(std::string& out, const char* s, size_t len) {
    if (len == 0) return;
    if (isalpha((unsigned char)s[0]) && ends_with_control_word(out)) out += ' ';
    out.append(s, len);
}

static void append_latex(std::string& out, const char* s) {
    append_latex(out, s, strlen(s));
}

static void append_latex(std::string& out, const std::string& s) {
    append_latex(out, s.data(), s.size());
}

static std::string format_to_string(const MathNode* node, MathFormatContext& ctx) {
    std::string out;
    format_node_latex(out, node, ctx);
    return out;
}

// "{...}" around the emitted node; an absent node gives "{}"
static void format_braced(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    out += '{';
    format_node_latex(out, node, ctx);
    out += '}';
}

// base of a script or prescript: a single atom as is, anything else braced
static void format_script_base(std::string& out, const MathNode* base, MathFormatContext& ctx) {
    if (math_node_is_atom(base)) {
        format_node_latex(out, base, ctx);
    } else {
        format_braced(out, base, ctx);
    }
}

// ============================================================================
// Runs
// ============================================================================

// reserved characters with no symbol table entry
static const char* escape_reserved(uint32_t cp) {
    switch (cp) {
        case '#':  return "\\#";
        case '$':  return "\\$";
        case '%':  return "\\%";
        case '&':  return "\\&";
        case '_':  return "\\_";
        case '{':  return "\\{";
        case '}':  return "\\}";
        case '\\': return "\\backslash";
        case '~':  return "\\sim";
        case '^':  return "\\text{\\textasciicircum}";
        default:   return nullptr;
    }
}

// text-mode escaping for \text{} runs
static void append_text_mode(std::string& out, const char* text, size_t len) {
    for (size_t i = 0; i < len; i++) {
        char c = text[i];
        switch (c) {
            case '#': case '$': case '%': case '&': case '_': case '{': case '}':
                out += '\\';
                out += c;
                break;
            case '\\': out += "\\textbackslash{}"; break;
            case '~':  out += "\\textasciitilde{}"; break;
            case '^':  out += "\\textasciicircum{}"; break;
            default:   out += c; break;
        }
    }
}

// LaTeX for one codepoint of a math run; empty for invisible characters
static void append_math_char(std::string& out, const unsigned char* p, int bytes, uint32_t cp) {
    if (math_is_invisible_char(cp)) return;
    if (const MathSymbolDef* def = math_symbol_lookup(cp)) {
        append_latex(out, def->latex);
        return;
    }
    if (const char* esc = escape_reserved(cp)) {
        append_latex(out, esc);
        return;
    }
    append_latex(out, (const char*)p, (size_t)bytes);
}

static void append_escaped(std::string& out, const char* text, size_t len) {
    const unsigned char* p = (const unsigned char*)text;
    const unsigned char* end = p + len;
    while (p < end) {
        uint32_t cp = 0;
        int bytes = utf8_to_codepoint(p, &cp);
        if (bytes == 0) break;
        if (bytes < 0) bytes = 1;   // invalid byte: copied through
        append_math_char(out, p, bytes, cp);
        p += bytes;
    }
}

std::string escape_math_text(const char* text, size_t len) {
    std::string out;
    if (text) append_escaped(out, text, len);
    return out;
}

// style command for letter spans, nullptr for plain math italic
static const char* run_style_command(const MathRunStyle& style, size_t span_len) {
    switch (style.font) {
        case MathFont::ROMAN:         return "\\mathrm";
        case MathFont::SCRIPT:        return "\\mathcal";
        case MathFont::FRAKTUR:       return "\\mathfrak";
        case MathFont::DOUBLE_STRUCK: return "\\mathbb";
        case MathFont::SANS_SERIF:    return "\\mathsf";
        case MathFont::MONOSPACE:     return "\\mathtt";
        case MathFont::DEFAULT:       break;
    }
    if (style.bold && style.italic) return "\\boldsymbol";
    if (style.bold) return "\\mathbf";
    if (style.upright) return "\\mathrm";
    // single letters are math italic already
    if (style.italic && span_len > 1) return "\\mathit";
    return nullptr;
}

// letters of a styled run are wrapped span by span, so "∈R" in double-struck
// becomes "\in\mathbb{R}" and not "\mathbb{\in R}"
static void format_styled_run(std::string& out, const char* text, size_t len, const MathRunStyle& style) {
    const unsigned char* p = (const unsigned char*)text;
    const unsigned char* end = p + len;
    while (p < end) {
        if (isalpha(*p)) {
            const unsigned char* span = p;
            while (p < end && isalpha(*p)) p++;
            size_t span_len = (size_t)(p - span);
            const char* cmd = run_style_command(style, span_len);
            if (cmd) {
                append_latex(out, cmd);
                out += '{';
                out.append((const char*)span, span_len);
                out += '}';
            } else {
                append_latex(out, (const char*)span, span_len);
            }
            continue;
        }
        uint32_t cp = 0;
        int bytes = utf8_to_codepoint(p, &cp);
        if (bytes == 0) break;
        if (bytes < 0) bytes = 1;
        // ordinary symbols take the weight of the run; operators and relations do not
        const MathSymbolDef* def = style.bold ? math_symbol_lookup(cp) : nullptr;
        if (def && def->cls == MathSymbolClass::Ordinary && def->latex[0] == '\\') {
            append_latex(out, "\\boldsymbol{");
            out += def->latex;
            out += '}';
        } else {
            append_math_char(out, p, bytes, cp);
        }
        p += bytes;
    }
}

static void format_run_latex(std::string& out, const MathNode* node) {
    const MathRunStyle& style = node->run.style;
    if (style.normal_text) {
        append_latex(out, "\\text{");
        append_text_mode(out, node->run.text, node->run.len);
        out += '}';
        return;
    }
    if (style.function) {
        const char* fn = math_function_latex(node->run.text, node->run.len);
        if (fn) {
            append_latex(out, fn);
            return;
        }
    }
    format_styled_run(out, node->run.text, node->run.len, style);
}

// ============================================================================
// Fractions, radicals, scripts
// ============================================================================

static void format_fraction_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    switch (node->frac.kind) {
        case FractionKind::BAR:
            append_latex(out, "\\frac");
            break;
        case FractionKind::BINOMIAL:
            append_latex(out, "\\binom");
            break;
        case FractionKind::NO_BAR:
            append_latex(out, "\\genfrac{}{}{0pt}{}");
            break;
        case FractionKind::LINEAR:
            format_braced(out, node->frac.numer, ctx);
            out += '/';
            format_braced(out, node->frac.denom, ctx);
            return;
        case FractionKind::SKEWED:
            out += "{}^";
            format_braced(out, node->frac.numer, ctx);
            out += "/{}_";
            format_braced(out, node->frac.denom, ctx);
            return;
    }
    format_braced(out, node->frac.numer, ctx);
    format_braced(out, node->frac.denom, ctx);
}

static void format_radical_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    append_latex(out, "\\sqrt");
    if (node->radical.degree) {
        out += '[';
        format_node_latex(out, node->radical.degree, ctx);
        out += ']';
    }
    format_braced(out, node->radical.radicand, ctx);
}

static void format_scripts_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    if (node->kind == MathNodeKind::PRESCRIPT) {
        out += "{}_";
        format_braced(out, node->scripts.sub, ctx);
        out += '^';
        format_braced(out, node->scripts.sup, ctx);
        format_node_latex(out, node->scripts.base, ctx);
        return;
    }

    format_script_base(out, node->scripts.base, ctx);
    if (node->scripts.sub) {
        out += '_';
        format_braced(out, node->scripts.sub, ctx);
    }
    if (node->scripts.sup) {
        out += '^';
        format_braced(out, node->scripts.sup, ctx);
    }
}

// ============================================================================
// N-ary operators
// ============================================================================

static void format_nary_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    uint32_t op = node->nary.op_char;
    const char* op_latex = math_nary_latex(op);
    if (!op_latex) {
        const MathSymbolDef* def = math_symbol_lookup(op);
        op_latex = def ? def->latex : nullptr;
    }
    if (op_latex) {
        append_latex(out, op_latex);
    } else {
        char buf[8];
        if (unicode_to_utf8(op, buf) > 0) append_escaped(out, buf, strlen(buf));
    }

    const MathNode* lower = node->nary.lower;
    const MathNode* upper = node->nary.upper;
    if (lower || upper) {
        // LaTeX puts limits above/below sum-like operators in display style
        // only, and beside integrals always
        bool default_limits = ctx.display && !math_nary_is_integral(op);
        bool want_limits = default_limits;
        if (node->nary.placement == LimitPlacement::UNDER_OVER) want_limits = true;
        else if (node->nary.placement == LimitPlacement::SUB_SUP) want_limits = false;
        if (want_limits != default_limits) {
            out += want_limits ? "\\limits" : "\\nolimits";
        }
    }
    if (lower) {
        out += '_';
        format_braced(out, lower, ctx);
    }
    if (upper) {
        out += '^';
        format_braced(out, upper, ctx);
    }

    std::string operand = format_to_string(node->nary.operand, ctx);
    if (!operand.empty()) {
        out += ' ';
        out += operand;
    }
}

// ============================================================================
// Delimiters and tables
// ============================================================================

static void report_unknown_delimiters(const DelimiterResolution& res, uint32_t open_char,
                                      uint32_t close_char, MathFormatContext& ctx) {
    if (!ctx.diag) return;
    if (res.unknown_open) {
        ctx.diag->report("DELIMITED", "unrecognized opening delimiter U+%04X written invisible", open_char);
    }
    if (res.unknown_close) {
        ctx.diag->report("DELIMITED", "unrecognized closing delimiter U+%04X written invisible", close_char);
    }
}

static void format_separator(std::string& out, uint32_t sep, bool sized) {
    if (!sep) return;
    DelimiterGlyph glyph = delimiter_glyph_for(sep);
    if (sized && glyph != DelimiterGlyph::UNKNOWN) {
        out += " \\middle";
        out += delimiter_latex(sep);
        out += ' ';
        return;
    }
    char buf[8];
    if (unicode_to_utf8(sep, buf) > 0) append_escaped(out, buf, strlen(buf));
}

static void format_delimited_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    uint32_t open_char = node->delimited.open_char;
    uint32_t close_char = node->delimited.close_char;
    DelimiterResolution res = resolve_delimiters(open_char, close_char);
    report_unknown_delimiters(res, open_char, close_char, ctx);

    if (res.sized) {
        append_latex(out, res.open);
        out += ' ';
    }
    for (int i = 0; i < node->delimited.count; i++) {
        if (i > 0) format_separator(out, node->delimited.sep_char, res.sized);
        format_node_latex(out, node->delimited.items[i], ctx);
    }
    if (res.sized) {
        out += ' ';
        out += res.close;
    }
}

static void format_rows_latex(std::string& out, MathNode* const* cells, int rows, int cols,
                              MathFormatContext& ctx) {
    for (int r = 0; r < rows; r++) {
        if (r > 0) out += " \\\\ ";
        for (int c = 0; c < cols; c++) {
            if (c > 0) out += " & ";
            format_node_latex(out, cells[r * cols + c], ctx);
        }
    }
}

static void format_matrix_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    uint32_t open_char = node->matrix.open_char;
    uint32_t close_char = node->matrix.close_char;
    const char* env = resolve_matrix_environment(open_char, close_char);

    DelimiterResolution res{};
    if (!env) {
        // no dedicated environment: plain matrix inside sized delimiters
        env = "matrix";
        res = resolve_delimiters(open_char, close_char);
        report_unknown_delimiters(res, open_char, close_char, ctx);
        if (res.sized) {
            append_latex(out, res.open);
            out += ' ';
        }
    }

    append_latex(out, "\\begin{");
    out += env;
    out += "} ";
    format_rows_latex(out, node->matrix.cells, node->matrix.rows, node->matrix.cols, ctx);
    out += " \\end{";
    out += env;
    out += '}';

    if (res.sized) {
        out += ' ';
        out += res.close;
    }
}

static void format_eq_array_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    append_latex(out, "\\begin{aligned} ");
    format_rows_latex(out, node->group.items, node->group.count, 1, ctx);
    out += " \\end{aligned}";
}

// ============================================================================
// Accents, limits, functions, enclosures
// ============================================================================

static const struct {
    AccentKind kind;
    const char* narrow;
    const char* wide;       // for bases longer than one atom
} ACCENT_COMMANDS[] = {
    {AccentKind::HAT,              "\\hat",                "\\widehat"},
    {AccentKind::TILDE,            "\\tilde",              "\\widetilde"},
    {AccentKind::BAR,              "\\bar",                "\\overline"},
    {AccentKind::DOT,              "\\dot",                "\\dot"},
    {AccentKind::DDOT,             "\\ddot",               "\\ddot"},
    {AccentKind::DDDOT,            "\\dddot",              "\\dddot"},
    {AccentKind::VEC,              "\\vec",                "\\overrightarrow"},
    {AccentKind::BREVE,            "\\breve",              "\\breve"},
    {AccentKind::CHECK,            "\\check",              "\\check"},
    {AccentKind::ACUTE,            "\\acute",              "\\acute"},
    {AccentKind::GRAVE,            "\\grave",              "\\grave"},
    {AccentKind::RING,             "\\mathring",           "\\mathring"},
    {AccentKind::LEFT_ARROW,       "\\overleftarrow",      "\\overleftarrow"},
    {AccentKind::LEFT_RIGHT_ARROW, "\\overleftrightarrow", "\\overleftrightarrow"},
    {AccentKind::OVERLINE,         "\\overline",           "\\overline"},
    {AccentKind::UNDERLINE,        "\\underline",          "\\underline"},
    {AccentKind::OVERBRACE,        "\\overbrace",          "\\overbrace"},
    {AccentKind::UNDERBRACE,       "\\underbrace",         "\\underbrace"},
};

static void format_accent_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    bool wide = !math_node_is_atom(node->accent.base);
    const char* cmd = nullptr;
    for (const auto& entry : ACCENT_COMMANDS) {
        if (entry.kind == node->accent.kind) {
            cmd = wide ? entry.wide : entry.narrow;
            break;
        }
    }
    if (!cmd) {
        cmd = wide ? "\\widehat" : "\\hat";
        if (ctx.diag) {
            ctx.diag->report("ACCENT", "unrecognized accent character U+%04X, written as %s",
                             node->accent.accent_char, cmd + 1);
        }
    }
    append_latex(out, cmd);
    format_braced(out, node->accent.base, ctx);
}

static void format_limit_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    if (!node->limit.upper && math_node_is_function_name(node->limit.base)) {
        // lim, max, sup ... take the condition as a subscript
        format_node_latex(out, node->limit.base, ctx);
        out += '_';
        format_braced(out, node->limit.limit, ctx);
        return;
    }
    append_latex(out, node->limit.upper ? "\\overset" : "\\underset");
    format_braced(out, node->limit.limit, ctx);
    format_braced(out, node->limit.base, ctx);
}

static void format_function_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    const MathNode* name = node->func.name;
    while (name && name->kind == MathNodeKind::GROUP && name->group.count == 1) {
        name = name->group.items[0];
    }
    format_node_latex(out, name, ctx);

    bool operator_name = math_node_is_function_name(name) ||
                         (name && name->kind == MathNodeKind::LIMIT);
    std::string arg = format_to_string(node->func.argument, ctx);
    if (operator_name && !arg.empty()) out += "\\,";
    append_latex(out, arg);
}

static void format_enclosure_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    switch (node->enclosure.kind) {
        case EnclosureKind::BOXED:   append_latex(out, "\\boxed"); break;
        case EnclosureKind::PHANTOM: append_latex(out, "\\phantom"); break;
    }
    format_braced(out, node->enclosure.body, ctx);
}

// ============================================================================
// Dispatch
// ============================================================================

static void format_node_latex(std::string& out, const MathNode* node, MathFormatContext& ctx) {
    if (!node) return;

    switch (node->kind) {
        case MathNodeKind::RUN:
            format_run_latex(out, node);
            break;
        case MathNodeKind::GROUP:
            for (int i = 0; i < node->group.count; i++) {
                format_node_latex(out, node->group.items[i], ctx);
            }
            break;
        case MathNodeKind::FRACTION:
            format_fraction_latex(out, node, ctx);
            break;
        case MathNodeKind::RADICAL:
            format_radical_latex(out, node, ctx);
            break;
        case MathNodeKind::SUPERSCRIPT:
        case MathNodeKind::SUBSCRIPT:
        case MathNodeKind::SUBSUP:
        case MathNodeKind::PRESCRIPT:
            format_scripts_latex(out, node, ctx);
            break;
        case MathNodeKind::NARY:
            format_nary_latex(out, node, ctx);
            break;
        case MathNodeKind::DELIMITED:
            format_delimited_latex(out, node, ctx);
            break;
        case MathNodeKind::MATRIX:
            format_matrix_latex(out, node, ctx);
            break;
        case MathNodeKind::EQ_ARRAY:
            format_eq_array_latex(out, node, ctx);
            break;
        case MathNodeKind::ACCENT:
            format_accent_latex(out, node, ctx);
            break;
        case MathNodeKind::LIMIT:
            format_limit_latex(out, node, ctx);
            break;
        case MathNodeKind::FUNCTION:
            format_function_latex(out, node, ctx);
            break;
        case MathNodeKind::ENCLOSURE:
            format_enclosure_latex(out, node, ctx);
            break;
        case MathNodeKind::DEGRADED:
            append_escaped(out, node->degraded.text, node->degraded.len);
            break;
    }
}

std::string format_math_latex(const MathNode* root, MathFormatContext& ctx) {
    std::string out;
    format_node_latex(out, root, ctx);
    if (out.empty()) {
        log_debug("math: empty formula body, emitting {}");
        out = "{}";
    }
    return out;
}

} // namespace docx2tex
