// math_ast.cpp - MathNode construction, queries and debug dump
//
// Node constructors used by the OMML parser and by tests that build an AST
// directly. Every constructor allocates from the formula arena and returns
// nullptr only when the arena is exhausted.

#include "math_ast.hpp"
#include "math_symbols.hpp"
#include "../../lib/log.h"
#include "../../lib/utf.h"
#include <cstdio>
#include <cstring>

namespace docx2tex {

// ============================================================================
// Names for Debugging
// ============================================================================

const char* math_node_kind_name(MathNodeKind kind) {
    switch (kind) {
        case MathNodeKind::RUN:         return "RUN";
        case MathNodeKind::GROUP:       return "GROUP";
        case MathNodeKind::FRACTION:    return "FRACTION";
        case MathNodeKind::RADICAL:     return "RADICAL";
        case MathNodeKind::SUPERSCRIPT: return "SUPERSCRIPT";
        case MathNodeKind::SUBSCRIPT:   return "SUBSCRIPT";
        case MathNodeKind::SUBSUP:      return "SUBSUP";
        case MathNodeKind::PRESCRIPT:   return "PRESCRIPT";
        case MathNodeKind::NARY:        return "NARY";
        case MathNodeKind::DELIMITED:   return "DELIMITED";
        case MathNodeKind::MATRIX:      return "MATRIX";
        case MathNodeKind::EQ_ARRAY:    return "EQ_ARRAY";
        case MathNodeKind::ACCENT:      return "ACCENT";
        case MathNodeKind::LIMIT:       return "LIMIT";
        case MathNodeKind::FUNCTION:    return "FUNCTION";
        case MathNodeKind::ENCLOSURE:   return "ENCLOSURE";
        case MathNodeKind::DEGRADED:    return "DEGRADED";
    }
    return "UNKNOWN";
}

const char* math_accent_kind_name(AccentKind kind) {
    switch (kind) {
        case AccentKind::HAT:              return "hat";
        case AccentKind::TILDE:            return "tilde";
        case AccentKind::BAR:              return "bar";
        case AccentKind::DOT:              return "dot";
        case AccentKind::DDOT:             return "ddot";
        case AccentKind::DDDOT:            return "dddot";
        case AccentKind::VEC:              return "vec";
        case AccentKind::BREVE:            return "breve";
        case AccentKind::CHECK:            return "check";
        case AccentKind::ACUTE:            return "acute";
        case AccentKind::GRAVE:            return "grave";
        case AccentKind::RING:             return "ring";
        case AccentKind::LEFT_ARROW:       return "left-arrow";
        case AccentKind::LEFT_RIGHT_ARROW: return "left-right-arrow";
        case AccentKind::OVERLINE:         return "overline";
        case AccentKind::UNDERLINE:        return "underline";
        case AccentKind::OVERBRACE:        return "overbrace";
        case AccentKind::UNDERBRACE:       return "underbrace";
        case AccentKind::UNKNOWN:          return "unknown";
    }
    return "unknown";
}

// Combining marks as Word writes them, plus the spacing forms some
// producers use instead
static const struct {
    uint32_t codepoint;
    AccentKind kind;
} ACCENT_CHARS[] = {
    {0x0302, AccentKind::HAT},
    {0x005E, AccentKind::HAT},
    {0x02C6, AccentKind::HAT},
    {0x0303, AccentKind::TILDE},
    {0x007E, AccentKind::TILDE},
    {0x02DC, AccentKind::TILDE},
    {0x0304, AccentKind::BAR},
    {0x0305, AccentKind::BAR},
    {0x00AF, AccentKind::BAR},
    {0x0307, AccentKind::DOT},
    {0x02D9, AccentKind::DOT},
    {0x0308, AccentKind::DDOT},
    {0x00A8, AccentKind::DDOT},
    {0x20DB, AccentKind::DDDOT},
    {0x20D7, AccentKind::VEC},
    {0x2192, AccentKind::VEC},
    {0x0306, AccentKind::BREVE},
    {0x02D8, AccentKind::BREVE},
    {0x030C, AccentKind::CHECK},
    {0x02C7, AccentKind::CHECK},
    {0x0301, AccentKind::ACUTE},
    {0x00B4, AccentKind::ACUTE},
    {0x0300, AccentKind::GRAVE},
    {0x0060, AccentKind::GRAVE},
    {0x030A, AccentKind::RING},
    {0x02DA, AccentKind::RING},
    {0x20D6, AccentKind::LEFT_ARROW},
    {0x2190, AccentKind::LEFT_ARROW},
    {0x20E1, AccentKind::LEFT_RIGHT_ARROW},
    {0x2194, AccentKind::LEFT_RIGHT_ARROW},
    {0x0332, AccentKind::UNDERLINE},
    {0x23DE, AccentKind::OVERBRACE},
    {0x23DF, AccentKind::UNDERBRACE},
};

AccentKind math_accent_kind_for(uint32_t accent_char) {
    for (const auto& entry : ACCENT_CHARS) {
        if (entry.codepoint == accent_char) return entry.kind;
    }
    return AccentKind::UNKNOWN;
}

// ============================================================================
// Node Allocation
// ============================================================================

MathNode* alloc_math_node(Arena* arena, MathNodeKind kind) {
    MathNode* node = (MathNode*)arena_calloc(arena, sizeof(MathNode));
    if (!node) {
        log_error("math: arena exhausted allocating %s node", math_node_kind_name(kind));
        return nullptr;
    }
    node->kind = kind;
    return node;
}

MathNode** math_node_array(Arena* arena, const std::vector<MathNode*>& nodes) {
    if (nodes.empty()) return nullptr;
    MathNode** items = (MathNode**)arena_alloc(arena, nodes.size() * sizeof(MathNode*));
    if (!items) {
        log_error("math: arena exhausted allocating %zu child slots", nodes.size());
        return nullptr;
    }
    memcpy(items, nodes.data(), nodes.size() * sizeof(MathNode*));
    return items;
}

MathRunStyle math_default_run_style() {
    MathRunStyle style;
    style.font = MathFont::DEFAULT;
    style.bold = false;
    style.italic = false;
    style.upright = false;
    style.normal_text = false;
    style.function = false;
    return style;
}

// ============================================================================
// Node Constructors
// ============================================================================

MathNode* make_math_run(Arena* arena, const char* text, size_t len, MathRunStyle style) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::RUN);
    if (!node) return nullptr;
    node->run.text = arena_strndup(arena, text ? text : "", text ? len : 0);
    if (!node->run.text) return nullptr;
    node->run.len = strlen(node->run.text);
    node->run.style = style;
    return node;
}

MathNode* make_math_run(Arena* arena, const char* text) {
    return make_math_run(arena, text, text ? strlen(text) : 0, math_default_run_style());
}

MathNode* make_math_group(Arena* arena, const std::vector<MathNode*>& items) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::GROUP);
    if (!node) return nullptr;
    node->group.items = math_node_array(arena, items);
    node->group.count = node->group.items ? (int)items.size() : 0;
    return node;
}

MathNode* make_math_fraction(Arena* arena, MathNode* numer, MathNode* denom, FractionKind kind) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::FRACTION);
    if (!node) return nullptr;
    node->frac.numer = numer;
    node->frac.denom = denom;
    node->frac.kind = kind;
    return node;
}

MathNode* make_math_radical(Arena* arena, MathNode* radicand, MathNode* degree) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::RADICAL);
    if (!node) return nullptr;
    node->radical.radicand = radicand;
    node->radical.degree = degree;
    return node;
}

static MathNode* make_scripts(Arena* arena, MathNodeKind kind, MathNode* base, MathNode* sub, MathNode* sup) {
    MathNode* node = alloc_math_node(arena, kind);
    if (!node) return nullptr;
    node->scripts.base = base;
    node->scripts.sub = sub;
    node->scripts.sup = sup;
    return node;
}

MathNode* make_math_superscript(Arena* arena, MathNode* base, MathNode* sup) {
    return make_scripts(arena, MathNodeKind::SUPERSCRIPT, base, nullptr, sup);
}

MathNode* make_math_subscript(Arena* arena, MathNode* base, MathNode* sub) {
    return make_scripts(arena, MathNodeKind::SUBSCRIPT, base, sub, nullptr);
}

MathNode* make_math_subsup(Arena* arena, MathNode* base, MathNode* sub, MathNode* sup) {
    return make_scripts(arena, MathNodeKind::SUBSUP, base, sub, sup);
}

MathNode* make_math_prescript(Arena* arena, MathNode* base, MathNode* sub, MathNode* sup) {
    return make_scripts(arena, MathNodeKind::PRESCRIPT, base, sub, sup);
}

MathNode* make_math_nary(Arena* arena, uint32_t op_char, MathNode* lower, MathNode* upper,
                         MathNode* operand, LimitPlacement placement) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::NARY);
    if (!node) return nullptr;
    node->nary.op_char = op_char;
    node->nary.lower = lower;
    node->nary.upper = upper;
    node->nary.operand = operand;
    node->nary.placement = placement;
    return node;
}

MathNode* make_math_delimited(Arena* arena, uint32_t open_char, const std::vector<MathNode*>& items,
                              uint32_t close_char, uint32_t sep_char) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::DELIMITED);
    if (!node) return nullptr;
    node->delimited.items = math_node_array(arena, items);
    node->delimited.count = node->delimited.items ? (int)items.size() : 0;
    node->delimited.open_char = open_char;
    node->delimited.close_char = close_char;
    node->delimited.sep_char = sep_char;
    return node;
}

MathNode* make_math_matrix(Arena* arena, const std::vector<std::vector<MathNode*>>& rows,
                           uint32_t open_char, uint32_t close_char) {
    if (rows.empty() || rows[0].empty()) return nullptr;
    size_t cols = rows[0].size();
    std::vector<MathNode*> cells;
    cells.reserve(rows.size() * cols);
    for (const auto& row : rows) {
        if (row.size() != cols) return nullptr;   // ragged
        cells.insert(cells.end(), row.begin(), row.end());
    }

    MathNode* node = alloc_math_node(arena, MathNodeKind::MATRIX);
    if (!node) return nullptr;
    node->matrix.cells = math_node_array(arena, cells);
    if (!node->matrix.cells) return nullptr;
    node->matrix.rows = (int)rows.size();
    node->matrix.cols = (int)cols;
    node->matrix.open_char = open_char;
    node->matrix.close_char = close_char;
    return node;
}

MathNode* make_math_eq_array(Arena* arena, const std::vector<MathNode*>& rows) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::EQ_ARRAY);
    if (!node) return nullptr;
    node->group.items = math_node_array(arena, rows);
    node->group.count = node->group.items ? (int)rows.size() : 0;
    return node;
}

MathNode* make_math_accent(Arena* arena, MathNode* base, AccentKind kind, uint32_t accent_char) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::ACCENT);
    if (!node) return nullptr;
    node->accent.base = base;
    node->accent.kind = kind;
    node->accent.accent_char = accent_char;
    return node;
}

MathNode* make_math_limit(Arena* arena, MathNode* base, MathNode* limit, bool upper) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::LIMIT);
    if (!node) return nullptr;
    node->limit.base = base;
    node->limit.limit = limit;
    node->limit.upper = upper;
    return node;
}

MathNode* make_math_function(Arena* arena, MathNode* name, MathNode* argument) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::FUNCTION);
    if (!node) return nullptr;
    node->func.name = name;
    node->func.argument = argument;
    return node;
}

MathNode* make_math_enclosure(Arena* arena, MathNode* body, EnclosureKind kind) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::ENCLOSURE);
    if (!node) return nullptr;
    node->enclosure.body = body;
    node->enclosure.kind = kind;
    return node;
}

MathNode* make_math_degraded(Arena* arena, const char* text, size_t len) {
    MathNode* node = alloc_math_node(arena, MathNodeKind::DEGRADED);
    if (!node) return nullptr;
    node->degraded.text = arena_strndup(arena, text ? text : "", text ? len : 0);
    if (!node->degraded.text) return nullptr;
    node->degraded.len = strlen(node->degraded.text);
    return node;
}

// ============================================================================
// Queries
// ============================================================================

// unwrap groups that hold exactly one node
static const MathNode* single_item(const MathNode* node) {
    while (node && node->kind == MathNodeKind::GROUP && node->group.count == 1) {
        node = node->group.items[0];
    }
    return node;
}

bool math_node_is_atom(const MathNode* node) {
    node = single_item(node);
    if (!node || node->kind != MathNodeKind::RUN) return false;
    if (node->run.style.function) return false;
    return utf8_char_count(node->run.text) == 1;
}

bool math_node_is_function_name(const MathNode* node) {
    node = single_item(node);
    if (!node) return false;
    if (node->kind == MathNodeKind::RUN) {
        return node->run.style.function || math_is_function_name(node->run.text, node->run.len);
    }
    if (node->kind == MathNodeKind::DEGRADED) {
        return math_is_function_name(node->degraded.text, node->degraded.len);
    }
    return false;
}

static void plain_text_children(MathNode* const* items, int count, std::string& out) {
    for (int i = 0; i < count; i++) math_node_plain_text(items[i], out);
}

void math_node_plain_text(const MathNode* node, std::string& out) {
    if (!node) return;
    switch (node->kind) {
        case MathNodeKind::RUN:
            out.append(node->run.text, node->run.len);
            break;
        case MathNodeKind::DEGRADED:
            out.append(node->degraded.text, node->degraded.len);
            break;
        case MathNodeKind::GROUP:
        case MathNodeKind::EQ_ARRAY:
            plain_text_children(node->group.items, node->group.count, out);
            break;
        case MathNodeKind::FRACTION:
            math_node_plain_text(node->frac.numer, out);
            math_node_plain_text(node->frac.denom, out);
            break;
        case MathNodeKind::RADICAL:
            math_node_plain_text(node->radical.degree, out);
            math_node_plain_text(node->radical.radicand, out);
            break;
        case MathNodeKind::SUPERSCRIPT:
        case MathNodeKind::SUBSCRIPT:
        case MathNodeKind::SUBSUP:
        case MathNodeKind::PRESCRIPT:
            math_node_plain_text(node->scripts.base, out);
            math_node_plain_text(node->scripts.sub, out);
            math_node_plain_text(node->scripts.sup, out);
            break;
        case MathNodeKind::NARY:
            math_node_plain_text(node->nary.lower, out);
            math_node_plain_text(node->nary.upper, out);
            math_node_plain_text(node->nary.operand, out);
            break;
        case MathNodeKind::DELIMITED:
            plain_text_children(node->delimited.items, node->delimited.count, out);
            break;
        case MathNodeKind::MATRIX:
            plain_text_children(node->matrix.cells, node->matrix.rows * node->matrix.cols, out);
            break;
        case MathNodeKind::ACCENT:
            math_node_plain_text(node->accent.base, out);
            break;
        case MathNodeKind::LIMIT:
            math_node_plain_text(node->limit.base, out);
            math_node_plain_text(node->limit.limit, out);
            break;
        case MathNodeKind::FUNCTION:
            math_node_plain_text(node->func.name, out);
            math_node_plain_text(node->func.argument, out);
            break;
        case MathNodeKind::ENCLOSURE:
            math_node_plain_text(node->enclosure.body, out);
            break;
    }
}

// ============================================================================
// Debug Dump
// ============================================================================

static void dump_indent(std::string& out, int depth) {
    out.append((size_t)depth * 2, ' ');
}

static void dump_branch(const char* label, const MathNode* child, std::string& out, int depth) {
    if (!child) return;
    dump_indent(out, depth + 1);
    out += label;
    out += ":\n";
    math_ast_dump(child, out, depth + 2);
}

static void dump_list(MathNode* const* items, int count, std::string& out, int depth) {
    for (int i = 0; i < count; i++) math_ast_dump(items[i], out, depth + 1);
}

void math_ast_dump(const MathNode* node, std::string& out, int depth) {
    dump_indent(out, depth);
    if (!node) {
        out += "(null)\n";
        return;
    }
    out += math_node_kind_name(node->kind);

    char buf[128];
    switch (node->kind) {
        case MathNodeKind::RUN:
            out += " text='";
            out.append(node->run.text, node->run.len);
            out += "'";
            if (node->run.style.function) out += " function";
            if (node->run.style.normal_text) out += " text-mode";
            out += "\n";
            break;
        case MathNodeKind::DEGRADED:
            out += " text='";
            out.append(node->degraded.text, node->degraded.len);
            out += "'\n";
            break;
        case MathNodeKind::GROUP:
        case MathNodeKind::EQ_ARRAY:
            snprintf(buf, sizeof(buf), " count=%d\n", node->group.count);
            out += buf;
            dump_list(node->group.items, node->group.count, out, depth);
            break;
        case MathNodeKind::FRACTION:
            snprintf(buf, sizeof(buf), " kind=%d\n", (int)node->frac.kind);
            out += buf;
            dump_branch("numer", node->frac.numer, out, depth);
            dump_branch("denom", node->frac.denom, out, depth);
            break;
        case MathNodeKind::RADICAL:
            out += "\n";
            dump_branch("degree", node->radical.degree, out, depth);
            dump_branch("radicand", node->radical.radicand, out, depth);
            break;
        case MathNodeKind::SUPERSCRIPT:
        case MathNodeKind::SUBSCRIPT:
        case MathNodeKind::SUBSUP:
        case MathNodeKind::PRESCRIPT:
            out += "\n";
            dump_branch("base", node->scripts.base, out, depth);
            dump_branch("sub", node->scripts.sub, out, depth);
            dump_branch("sup", node->scripts.sup, out, depth);
            break;
        case MathNodeKind::NARY:
            snprintf(buf, sizeof(buf), " op=U+%04X placement=%d\n",
                     node->nary.op_char, (int)node->nary.placement);
            out += buf;
            dump_branch("lower", node->nary.lower, out, depth);
            dump_branch("upper", node->nary.upper, out, depth);
            dump_branch("operand", node->nary.operand, out, depth);
            break;
        case MathNodeKind::DELIMITED:
            snprintf(buf, sizeof(buf), " open=U+%04X close=U+%04X sep=U+%04X count=%d\n",
                     node->delimited.open_char, node->delimited.close_char,
                     node->delimited.sep_char, node->delimited.count);
            out += buf;
            dump_list(node->delimited.items, node->delimited.count, out, depth);
            break;
        case MathNodeKind::MATRIX:
            snprintf(buf, sizeof(buf), " %dx%d open=U+%04X close=U+%04X\n",
                     node->matrix.rows, node->matrix.cols,
                     node->matrix.open_char, node->matrix.close_char);
            out += buf;
            dump_list(node->matrix.cells, node->matrix.rows * node->matrix.cols, out, depth);
            break;
        case MathNodeKind::ACCENT:
            snprintf(buf, sizeof(buf), " kind=%s\n", math_accent_kind_name(node->accent.kind));
            out += buf;
            dump_branch("base", node->accent.base, out, depth);
            break;
        case MathNodeKind::LIMIT:
            out += node->limit.upper ? " upper\n" : " lower\n";
            dump_branch("base", node->limit.base, out, depth);
            dump_branch("limit", node->limit.limit, out, depth);
            break;
        case MathNodeKind::FUNCTION:
            out += "\n";
            dump_branch("name", node->func.name, out, depth);
            dump_branch("argument", node->func.argument, out, depth);
            break;
        case MathNodeKind::ENCLOSURE:
            out += node->enclosure.kind == EnclosureKind::BOXED ? " boxed\n" : " phantom\n";
            dump_branch("body", node->enclosure.body, out, depth);
            break;
    }
}

} // namespace docx2tex
