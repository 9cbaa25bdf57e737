// math_delimiters.cpp - Delimiter sizing and matrix environment selection

#include "math_delimiters.hpp"
#include "../../lib/log.h"

namespace docx2tex {

struct DelimiterDef {
    uint32_t codepoint;
    DelimiterGlyph glyph;
    const char* latex;
};

static const DelimiterDef DELIMITER_TABLE[] = {
    {'(',    DelimiterGlyph::PAREN,       "("},
    {')',    DelimiterGlyph::PAREN,       ")"},
    {'[',    DelimiterGlyph::BRACKET,     "["},
    {']',    DelimiterGlyph::BRACKET,     "]"},
    {'{',    DelimiterGlyph::BRACE,       "\\{"},
    {'}',    DelimiterGlyph::BRACE,       "\\}"},
    {'|',    DelimiterGlyph::VBAR,        "|"},
    {0x2223, DelimiterGlyph::VBAR,        "|"},          // divides
    {0x2016, DelimiterGlyph::DOUBLE_VBAR, "\\|"},
    {0x2225, DelimiterGlyph::DOUBLE_VBAR, "\\|"},        // parallel to
    {0x27E8, DelimiterGlyph::ANGLE,       "\\langle"},
    {0x27E9, DelimiterGlyph::ANGLE,       "\\rangle"},
    {0x2329, DelimiterGlyph::ANGLE,       "\\langle"},
    {0x232A, DelimiterGlyph::ANGLE,       "\\rangle"},
    {'<',    DelimiterGlyph::ANGLE,       "\\langle"},
    {'>',    DelimiterGlyph::ANGLE,       "\\rangle"},
    {0x2308, DelimiterGlyph::CEIL,        "\\lceil"},
    {0x2309, DelimiterGlyph::CEIL,        "\\rceil"},
    {0x230A, DelimiterGlyph::FLOOR,       "\\lfloor"},
    {0x230B, DelimiterGlyph::FLOOR,       "\\rfloor"},
};

static const DelimiterDef* find_delimiter(uint32_t codepoint) {
    for (const auto& def : DELIMITER_TABLE) {
        if (def.codepoint == codepoint) return &def;
    }
    return nullptr;
}

const char* delimiter_glyph_name(DelimiterGlyph glyph) {
    switch (glyph) {
        case DelimiterGlyph::NONE:        return "none";
        case DelimiterGlyph::PAREN:       return "paren";
        case DelimiterGlyph::BRACKET:     return "bracket";
        case DelimiterGlyph::BRACE:       return "brace";
        case DelimiterGlyph::VBAR:        return "vbar";
        case DelimiterGlyph::DOUBLE_VBAR: return "double-vbar";
        case DelimiterGlyph::ANGLE:       return "angle";
        case DelimiterGlyph::CEIL:        return "ceil";
        case DelimiterGlyph::FLOOR:       return "floor";
        case DelimiterGlyph::UNKNOWN:     return "unknown";
    }
    return "unknown";
}

DelimiterGlyph delimiter_glyph_for(uint32_t codepoint) {
    if (codepoint == 0) return DelimiterGlyph::NONE;
    const DelimiterDef* def = find_delimiter(codepoint);
    return def ? def->glyph : DelimiterGlyph::UNKNOWN;
}

const char* delimiter_latex(uint32_t codepoint) {
    const DelimiterDef* def = codepoint ? find_delimiter(codepoint) : nullptr;
    return def ? def->latex : ".";
}

DelimiterResolution resolve_delimiters(uint32_t open_char, uint32_t close_char) {
    DelimiterResolution res;
    res.unknown_open = delimiter_glyph_for(open_char) == DelimiterGlyph::UNKNOWN;
    res.unknown_close = delimiter_glyph_for(close_char) == DelimiterGlyph::UNKNOWN;

    const char* open = delimiter_latex(open_char);
    const char* close = delimiter_latex(close_char);
    res.sized = open[0] != '.' || close[0] != '.';
    if (res.sized) {
        res.open = std::string("\\left") + open;
        res.close = std::string("\\right") + close;
    }
    if (res.unknown_open || res.unknown_close) {
        log_debug("math: unrecognized delimiter pair U+%04X/U+%04X", open_char, close_char);
    }
    return res;
}

const char* resolve_matrix_environment(uint32_t open_char, uint32_t close_char) {
    DelimiterGlyph open = delimiter_glyph_for(open_char);
    DelimiterGlyph close = delimiter_glyph_for(close_char);
    if (open != close) return nullptr;
    // same glyph on both sides must also be the right way round: "]...[" is not a bmatrix
    if (open != DelimiterGlyph::NONE && open_char == close_char &&
        open != DelimiterGlyph::VBAR && open != DelimiterGlyph::DOUBLE_VBAR) {
        return nullptr;
    }

    switch (open) {
        case DelimiterGlyph::NONE:        return "matrix";
        case DelimiterGlyph::PAREN:       return open_char == '(' ? "pmatrix" : nullptr;
        case DelimiterGlyph::BRACKET:     return open_char == '[' ? "bmatrix" : nullptr;
        case DelimiterGlyph::BRACE:       return open_char == '{' ? "Bmatrix" : nullptr;
        case DelimiterGlyph::VBAR:        return "vmatrix";
        case DelimiterGlyph::DOUBLE_VBAR: return "Vmatrix";
        case DelimiterGlyph::ANGLE:
        case DelimiterGlyph::CEIL:
        case DelimiterGlyph::FLOOR:
        case DelimiterGlyph::UNKNOWN:
            return nullptr;
    }
    return nullptr;
}

} // namespace docx2tex
