// math_ast_builder.cpp - Parse OMML element trees to MathAST
//
// First half of the math pipeline:
//   OmmlElement tree (m:oMath) -> MathNode tree
//
// One handler per OMML tag. Handlers build their argument containers first,
// check arity, then construct the node. A subtree that cannot be represented
// becomes a DEGRADED node carrying its text, and a diagnostic is recorded;
// siblings are never affected.

#include "math_ast.hpp"
#include "math_symbols.hpp"
#include "../omml_element.hpp"
#include "../../lib/log.h"
#include "../../lib/utf.h"
#include <cstdio>
#include <cstring>

namespace docx2tex {

// first codepoint of a UTF-8 string, 0 for an empty or invalid one
static uint32_t first_codepoint(const char* s) {
    if (!s || !*s) return 0;
    uint32_t cp = 0;
    int len = utf8_to_codepoint((const unsigned char*)s, &cp);
    return len > 0 ? cp : 0;
}

// delimiter marker: a missing m:val keeps the default, an empty one means none
static uint32_t marker_value(const OmmlElement* prop, uint32_t fallback) {
    const char* v = prop->val();
    return v ? first_codepoint(v) : fallback;
}

// OOXML on/off values: absent m:val means on
static bool onoff_value(const OmmlElement* prop) {
    if (!prop) return false;
    const char* v = prop->val();
    if (!v) return true;
    return !(strcmp(v, "0") == 0 || strcmp(v, "off") == 0 || strcmp(v, "false") == 0);
}

static bool ends_with_pr(const std::string& tag) {
    return tag.size() > 2 && tag.compare(tag.size() - 2, 2, "Pr") == 0;
}

// ============================================================================
// Builder
// ============================================================================

class OmmlMathBuilder {
public:
    OmmlMathBuilder(Arena* arena, MathDiagnostics& diag, int max_depth)
        : arena(arena), diag(diag), max_depth(max_depth) {}

    MathNode* build(const OmmlElement* root);

private:
    Arena* arena;
    MathDiagnostics& diag;
    int max_depth;

    MathNode* build_element(const OmmlElement* elem, int depth);
    void append_children(const OmmlElement* container, int depth, std::vector<MathNode*>& out);
    MathNode* build_container(const OmmlElement* container, int depth);
    MathNode* build_arg(const OmmlElement* parent, const char* tag, int depth);
    MathNode* degrade(const OmmlElement* elem, const char* reason);

    MathNode* build_run(const OmmlElement* elem);
    MathNode* build_foreign(const OmmlElement* elem);
    MathNode* build_fraction(const OmmlElement* elem, int depth);
    MathNode* build_radical(const OmmlElement* elem, int depth);
    MathNode* build_scripts(const OmmlElement* elem, MathNodeKind kind, int depth);
    MathNode* build_nary(const OmmlElement* elem, int depth);
    MathNode* build_delimiter(const OmmlElement* elem, int depth);
    MathNode* build_matrix(const OmmlElement* elem, int depth);
    MathNode* build_eq_array(const OmmlElement* elem, int depth);
    MathNode* build_accent(const OmmlElement* elem, int depth);
    MathNode* build_bar(const OmmlElement* elem, int depth);
    MathNode* build_group_chr(const OmmlElement* elem, int depth);
    MathNode* build_limit(const OmmlElement* elem, bool upper, int depth);
    MathNode* build_function(const OmmlElement* elem, int depth);
    MathNode* build_border_box(const OmmlElement* elem, int depth);
    MathNode* build_phantom(const OmmlElement* elem, int depth);
};

MathNode* OmmlMathBuilder::build(const OmmlElement* root) {
    if (!root) return make_math_group(arena, std::vector<MathNode*>());
    if (!root->is_math("oMath")) {
        log_debug("math: formula root is <%s>, not m:oMath", root->tag.c_str());
    }
    return build_container(root, 0);
}

MathNode* OmmlMathBuilder::degrade(const OmmlElement* elem, const char* reason) {
    std::string text = elem->collect_text();
    std::string element = elem->prefix.empty() ? elem->tag : elem->prefix + ":" + elem->tag;
    diag.report(element.c_str(), "%s", reason);
    return make_math_degraded(arena, text.c_str(), text.size());
}

void OmmlMathBuilder::append_children(const OmmlElement* container, int depth, std::vector<MathNode*>& out) {
    for (const auto& child : container->children) {
        MathNode* node = build_element(child.get(), depth + 1);
        if (node) out.push_back(node);
    }
}

MathNode* OmmlMathBuilder::build_container(const OmmlElement* container, int depth) {
    std::vector<MathNode*> items;
    append_children(container, depth, items);
    return make_math_group(arena, items);
}

// argument container (m:e, m:num, m:sub ...) as a GROUP; nullptr if absent
MathNode* OmmlMathBuilder::build_arg(const OmmlElement* parent, const char* tag, int depth) {
    const OmmlElement* container = parent->child(tag);
    if (!container) return nullptr;
    if (depth + 1 > max_depth) return degrade(container, "nesting depth limit reached, subtree truncated");
    return build_container(container, depth + 1);
}

// Returns nullptr for elements that contribute nothing (property elements,
// empty runs, foreign elements without text)
MathNode* OmmlMathBuilder::build_element(const OmmlElement* elem, int depth) {
    if (!elem->is_math()) return build_foreign(elem);

    const std::string& tag = elem->tag;
    if (ends_with_pr(tag)) return nullptr;

    if (depth > max_depth) {
        return degrade(elem, "nesting depth limit reached, subtree truncated");
    }

    if (tag == "r") return build_run(elem);
    if (tag == "f") return build_fraction(elem, depth);
    if (tag == "rad") return build_radical(elem, depth);
    if (tag == "sSup") return build_scripts(elem, MathNodeKind::SUPERSCRIPT, depth);
    if (tag == "sSub") return build_scripts(elem, MathNodeKind::SUBSCRIPT, depth);
    if (tag == "sSubSup") return build_scripts(elem, MathNodeKind::SUBSUP, depth);
    if (tag == "sPre") return build_scripts(elem, MathNodeKind::PRESCRIPT, depth);
    if (tag == "nary") return build_nary(elem, depth);
    if (tag == "d") return build_delimiter(elem, depth);
    if (tag == "m") return build_matrix(elem, depth);
    if (tag == "eqArr") return build_eq_array(elem, depth);
    if (tag == "acc") return build_accent(elem, depth);
    if (tag == "bar") return build_bar(elem, depth);
    if (tag == "groupChr") return build_group_chr(elem, depth);
    if (tag == "limLow") return build_limit(elem, false, depth);
    if (tag == "limUpp") return build_limit(elem, true, depth);
    if (tag == "func") return build_function(elem, depth);
    if (tag == "borderBox") return build_border_box(elem, depth);
    if (tag == "phant") return build_phantom(elem, depth);

    // transparent wrappers: a box only affects line breaking, the others are
    // containers that show up out of their usual place
    if (tag == "box" || tag == "oMath" || tag == "oMathPara" || tag == "e" ||
        tag == "num" || tag == "den" || tag == "sub" || tag == "sup" ||
        tag == "deg" || tag == "lim" || tag == "fName") {
        const OmmlElement* e = tag == "box" ? elem->child("e") : elem;
        if (!e) return degrade(elem, "box without m:e");
        return build_container(e, depth);
    }
    if (tag == "t") {
        if (elem->text.empty()) return nullptr;
        return make_math_run(arena, elem->text.c_str(), elem->text.size(), math_default_run_style());
    }

    return degrade(elem, "unrecognized math element");
}

// ============================================================================
// Runs
// ============================================================================

static void read_run_style(const OmmlElement* rpr, MathRunStyle& style) {
    if (!rpr) return;

    if (const OmmlElement* scr = rpr->child("scr")) {
        const char* v = scr->val();
        if (v) {
            if (strcmp(v, "roman") == 0) style.font = MathFont::ROMAN;
            else if (strcmp(v, "script") == 0) style.font = MathFont::SCRIPT;
            else if (strcmp(v, "fraktur") == 0) style.font = MathFont::FRAKTUR;
            else if (strcmp(v, "double-struck") == 0) style.font = MathFont::DOUBLE_STRUCK;
            else if (strcmp(v, "sans-serif") == 0) style.font = MathFont::SANS_SERIF;
            else if (strcmp(v, "monospace") == 0) style.font = MathFont::MONOSPACE;
        }
    }

    // m:sty: p plain, b bold, i italic, bi bold italic
    if (const OmmlElement* sty = rpr->child("sty")) {
        const char* v = sty->val();
        if (v) {
            if (strcmp(v, "p") == 0) {
                style.upright = true;
            } else if (strcmp(v, "b") == 0) {
                style.bold = true;
                style.upright = true;
            } else if (strcmp(v, "i") == 0) {
                style.italic = true;
            } else if (strcmp(v, "bi") == 0) {
                style.bold = true;
                style.italic = true;
            }
        }
    }

    if (onoff_value(rpr->child("nor"))) style.normal_text = true;
}

MathNode* OmmlMathBuilder::build_run(const OmmlElement* elem) {
    std::string text = elem->collect_text();
    if (text.empty()) return nullptr;

    MathRunStyle style = math_default_run_style();
    read_run_style(elem->child("rPr"), style);
    if (!style.normal_text && math_is_function_name(text.c_str(), text.size())) {
        style.function = true;
    }
    return make_math_run(arena, text.c_str(), text.size(), style);
}

// elements of other vocabularies (w:r, w:bookmarkStart, w:proofErr) keep
// their text and nothing else
MathNode* OmmlMathBuilder::build_foreign(const OmmlElement* elem) {
    std::string text = elem->collect_text();
    if (text.empty()) return nullptr;
    return make_math_run(arena, text.c_str(), text.size(), math_default_run_style());
}

// ============================================================================
// Fractions, radicals, scripts
// ============================================================================

MathNode* OmmlMathBuilder::build_fraction(const OmmlElement* elem, int depth) {
    FractionKind kind = FractionKind::BAR;
    if (const OmmlElement* fpr = elem->child("fPr")) {
        const OmmlElement* type = fpr->child("type");
        const char* v = type ? type->val() : nullptr;
        if (v) {
            if (strcmp(v, "noBar") == 0) kind = FractionKind::NO_BAR;
            else if (strcmp(v, "lin") == 0) kind = FractionKind::LINEAR;
            else if (strcmp(v, "skw") == 0) kind = FractionKind::SKEWED;
        }
    }

    MathNode* numer = build_arg(elem, "num", depth);
    MathNode* denom = build_arg(elem, "den", depth);
    if (!numer) return degrade(elem, "fraction without m:num");
    if (!denom) return degrade(elem, "fraction without m:den");
    return make_math_fraction(arena, numer, denom, kind);
}

MathNode* OmmlMathBuilder::build_radical(const OmmlElement* elem, int depth) {
    bool deg_hide = false;
    if (const OmmlElement* radpr = elem->child("radPr")) {
        deg_hide = onoff_value(radpr->child("degHide"));
    }

    MathNode* radicand = build_arg(elem, "e", depth);
    if (!radicand) return degrade(elem, "radical without m:e");

    MathNode* degree = deg_hide ? nullptr : build_arg(elem, "deg", depth);
    if (degree && degree->kind == MathNodeKind::GROUP && degree->group.count == 0) degree = nullptr;
    return make_math_radical(arena, radicand, degree);
}

MathNode* OmmlMathBuilder::build_scripts(const OmmlElement* elem, MathNodeKind kind, int depth) {
    MathNode* base = build_arg(elem, "e", depth);
    if (!base) return degrade(elem, "script without base m:e");

    bool need_sub = kind != MathNodeKind::SUPERSCRIPT;
    bool need_sup = kind != MathNodeKind::SUBSCRIPT;
    MathNode* sub = need_sub ? build_arg(elem, "sub", depth) : nullptr;
    MathNode* sup = need_sup ? build_arg(elem, "sup", depth) : nullptr;
    if (need_sub && !sub) return degrade(elem, "script without m:sub");
    if (need_sup && !sup) return degrade(elem, "script without m:sup");

    switch (kind) {
        case MathNodeKind::SUPERSCRIPT: return make_math_superscript(arena, base, sup);
        case MathNodeKind::SUBSCRIPT:   return make_math_subscript(arena, base, sub);
        case MathNodeKind::PRESCRIPT:   return make_math_prescript(arena, base, sub, sup);
        default:                        return make_math_subsup(arena, base, sub, sup);
    }
}

// ============================================================================
// N-ary operators
// ============================================================================

static bool is_empty_group(const MathNode* node) {
    return node && node->kind == MathNodeKind::GROUP && node->group.count == 0;
}

MathNode* OmmlMathBuilder::build_nary(const OmmlElement* elem, int depth) {
    uint32_t op_char = 0x222B;  // integral
    LimitPlacement placement = LimitPlacement::DEFAULT;
    bool sub_hide = false, sup_hide = false;

    if (const OmmlElement* pr = elem->child("naryPr")) {
        if (const OmmlElement* chr = pr->child("chr")) {
            uint32_t cp = first_codepoint(chr->val());
            if (cp) op_char = cp;
        }
        if (const OmmlElement* loc = pr->child("limLoc")) {
            const char* v = loc->val();
            if (v && strcmp(v, "undOvr") == 0) placement = LimitPlacement::UNDER_OVER;
            else if (v && strcmp(v, "subSup") == 0) placement = LimitPlacement::SUB_SUP;
        }
        sub_hide = onoff_value(pr->child("subHide"));
        sup_hide = onoff_value(pr->child("supHide"));
    }

    MathNode* operand = build_arg(elem, "e", depth);
    if (!operand) return degrade(elem, "n-ary operator without operand m:e");

    MathNode* lower = sub_hide ? nullptr : build_arg(elem, "sub", depth);
    MathNode* upper = sup_hide ? nullptr : build_arg(elem, "sup", depth);
    if (is_empty_group(lower)) lower = nullptr;
    if (is_empty_group(upper)) upper = nullptr;

    return make_math_nary(arena, op_char, lower, upper, operand, placement);
}

// ============================================================================
// Delimiters and tables
// ============================================================================

MathNode* OmmlMathBuilder::build_delimiter(const OmmlElement* elem, int depth) {
    uint32_t open_char = '(';
    uint32_t close_char = ')';
    uint32_t sep_char = '|';

    if (const OmmlElement* pr = elem->child("dPr")) {
        if (const OmmlElement* beg = pr->child("begChr")) open_char = marker_value(beg, open_char);
        if (const OmmlElement* end = pr->child("endChr")) close_char = marker_value(end, close_char);
        if (const OmmlElement* sep = pr->child("sepChr")) sep_char = marker_value(sep, sep_char);
    }

    std::vector<MathNode*> items;
    for (const auto& child : elem->children) {
        if (!child->is_math("e")) continue;
        if (depth + 1 > max_depth) {
            items.push_back(degrade(child.get(), "nesting depth limit reached, subtree truncated"));
        } else {
            items.push_back(build_container(child.get(), depth + 1));
        }
        if (!items.back()) items.pop_back();
    }
    if (items.empty()) return degrade(elem, "delimiter without m:e");

    if (items.size() == 1 && items[0]->kind == MathNodeKind::GROUP && items[0]->group.count == 1) {
        MathNode* only = items[0]->group.items[0];
        // a matrix takes the markers of its enclosing delimiter
        if (only->kind == MathNodeKind::MATRIX && !only->matrix.open_char && !only->matrix.close_char) {
            only->matrix.open_char = open_char;
            only->matrix.close_char = close_char;
            return only;
        }
        // a bar-less fraction in parentheses is a binomial coefficient
        if (only->kind == MathNodeKind::FRACTION && only->frac.kind == FractionKind::NO_BAR &&
            open_char == '(' && close_char == ')') {
            only->frac.kind = FractionKind::BINOMIAL;
            return only;
        }
    }

    return make_math_delimited(arena, open_char, items, close_char, items.size() > 1 ? sep_char : 0);
}

MathNode* OmmlMathBuilder::build_matrix(const OmmlElement* elem, int depth) {
    if (depth + 2 > max_depth) return degrade(elem, "nesting depth limit reached, subtree truncated");

    std::vector<std::vector<MathNode*>> rows;
    for (const auto& mr : elem->children) {
        if (!mr->is_math("mr")) continue;
        std::vector<MathNode*> cells;
        for (const auto& e : mr->children) {
            if (!e->is_math("e")) continue;
            MathNode* cell = build_container(e.get(), depth + 2);
            if (cell) cells.push_back(cell);
        }
        rows.push_back(std::move(cells));
    }

    if (rows.empty()) return degrade(elem, "matrix without rows");
    size_t cols = rows[0].size();
    if (cols == 0) return degrade(elem, "matrix row without cells");
    for (size_t i = 1; i < rows.size(); i++) {
        if (rows[i].size() != cols) {
            char reason[96];
            snprintf(reason, sizeof(reason), "ragged matrix: row %zu has %zu cells, expected %zu",
                     i + 1, rows[i].size(), cols);
            return degrade(elem, reason);
        }
    }
    return make_math_matrix(arena, rows);
}

MathNode* OmmlMathBuilder::build_eq_array(const OmmlElement* elem, int depth) {
    std::vector<MathNode*> rows;
    for (const auto& child : elem->children) {
        if (!child->is_math("e")) continue;
        if (depth + 1 > max_depth) return degrade(elem, "nesting depth limit reached, subtree truncated");
        MathNode* row = build_container(child.get(), depth + 1);
        if (row) rows.push_back(row);
    }
    if (rows.empty()) return degrade(elem, "equation array without rows");
    return make_math_eq_array(arena, rows);
}

// ============================================================================
// Accents, bars, group characters, limits
// ============================================================================

MathNode* OmmlMathBuilder::build_accent(const OmmlElement* elem, int depth) {
    uint32_t accent_char = 0x0302;  // combining circumflex
    if (const OmmlElement* pr = elem->child("accPr")) {
        if (const OmmlElement* chr = pr->child("chr")) {
            uint32_t cp = first_codepoint(chr->val());
            if (cp) accent_char = cp;
        }
    }

    MathNode* base = build_arg(elem, "e", depth);
    if (!base) return degrade(elem, "accent without m:e");
    return make_math_accent(arena, base, math_accent_kind_for(accent_char), accent_char);
}

MathNode* OmmlMathBuilder::build_bar(const OmmlElement* elem, int depth) {
    bool bottom = false;
    if (const OmmlElement* pr = elem->child("barPr")) {
        const OmmlElement* pos = pr->child("pos");
        const char* v = pos ? pos->val() : nullptr;
        bottom = v && strcmp(v, "bot") == 0;
    }

    MathNode* base = build_arg(elem, "e", depth);
    if (!base) return degrade(elem, "bar without m:e");
    return make_math_accent(arena, base, bottom ? AccentKind::UNDERLINE : AccentKind::OVERLINE);
}

MathNode* OmmlMathBuilder::build_group_chr(const OmmlElement* elem, int depth) {
    uint32_t chr = 0x23DF;      // bottom curly bracket
    bool top = false;
    if (const OmmlElement* pr = elem->child("groupChrPr")) {
        if (const OmmlElement* c = pr->child("chr")) {
            uint32_t cp = first_codepoint(c->val());
            if (cp) chr = cp;
        }
        const OmmlElement* pos = pr->child("pos");
        const char* v = pos ? pos->val() : nullptr;
        top = v && strcmp(v, "top") == 0;
    }

    MathNode* base = build_arg(elem, "e", depth);
    if (!base) return degrade(elem, "group character without m:e");
    AccentKind kind = (chr == 0x23DE || top) ? AccentKind::OVERBRACE : AccentKind::UNDERBRACE;
    return make_math_accent(arena, base, kind, chr);
}

MathNode* OmmlMathBuilder::build_limit(const OmmlElement* elem, bool upper, int depth) {
    MathNode* base = build_arg(elem, "e", depth);
    MathNode* limit = build_arg(elem, "lim", depth);
    if (!base) return degrade(elem, "limit without base m:e");
    if (!limit) return degrade(elem, "limit without m:lim");
    return make_math_limit(arena, base, limit, upper);
}

// ============================================================================
// Functions and enclosures
// ============================================================================

// mark the run naming a function, so the emitter writes the operator command
static void mark_function_run(MathNode* name) {
    while (name && name->kind == MathNodeKind::GROUP && name->group.count == 1) {
        name = name->group.items[0];
    }
    if (name && name->kind == MathNodeKind::RUN && !name->run.style.normal_text &&
        math_is_function_name(name->run.text, name->run.len)) {
        name->run.style.function = true;
    }
}

MathNode* OmmlMathBuilder::build_function(const OmmlElement* elem, int depth) {
    MathNode* name = build_arg(elem, "fName", depth);
    MathNode* argument = build_arg(elem, "e", depth);
    if (!name) return degrade(elem, "function without m:fName");
    if (!argument) return degrade(elem, "function without argument m:e");
    mark_function_run(name);
    return make_math_function(arena, name, argument);
}

MathNode* OmmlMathBuilder::build_border_box(const OmmlElement* elem, int depth) {
    MathNode* body = build_arg(elem, "e", depth);
    if (!body) return degrade(elem, "border box without m:e");
    return make_math_enclosure(arena, body, EnclosureKind::BOXED);
}

MathNode* OmmlMathBuilder::build_phantom(const OmmlElement* elem, int depth) {
    bool show = true;
    if (const OmmlElement* pr = elem->child("phantPr")) {
        if (const OmmlElement* s = pr->child("show")) show = onoff_value(s);
    }

    MathNode* body = build_arg(elem, "e", depth);
    if (!body) return degrade(elem, "phantom without m:e");
    return show ? body : make_math_enclosure(arena, body, EnclosureKind::PHANTOM);
}

// ============================================================================
// Entry Point
// ============================================================================

MathNode* parse_omml_formula(const OmmlElement* root, Arena* arena, MathDiagnostics& diag, int max_depth) {
    if (!arena) {
        log_error("math: parse_omml_formula called without an arena");
        return nullptr;
    }
    if (max_depth < 1) max_depth = 1;

    OmmlMathBuilder builder(arena, diag, max_depth);
    MathNode* ast = builder.build(root);
    if (!ast) {
        log_error("math: formula %d: out of memory building AST", diag.formula_index());
        return nullptr;
    }
    log_debug("math: formula %d: built AST with %d top-level nodes, %zu diagnostics",
              diag.formula_index(), ast->group.count, diag.size());
    return ast;
}

} // namespace docx2tex
