// math_delimiters.hpp - Delimiter sizing and matrix environment selection
//
// Maps OMML delimiter markers (m:begChr / m:endChr codepoints) to LaTeX.
// The resolver guarantees that \left and \right always come in pairs: an
// invisible side is written as "\left." or "\right.".

#ifndef DOCX2TEX_MATH_DELIMITERS_HPP
#define DOCX2TEX_MATH_DELIMITERS_HPP

#include <cstdint>
#include <string>

namespace docx2tex {

enum class DelimiterGlyph : uint8_t {
    NONE,           // no visible marker
    PAREN,
    BRACKET,
    BRACE,
    VBAR,
    DOUBLE_VBAR,
    ANGLE,
    CEIL,
    FLOOR,
    UNKNOWN,        // a marker with no LaTeX delimiter form
};

const char* delimiter_glyph_name(DelimiterGlyph glyph);

// Glyph for a marker codepoint; 0 means NONE. Opening and closing forms of
// a pair map to the same glyph.
DelimiterGlyph delimiter_glyph_for(uint32_t codepoint);

// LaTeX delimiter token for one side, "." for an invisible one
const char* delimiter_latex(uint32_t codepoint);

struct DelimiterResolution {
    std::string open;           // "\left(" or "\left." (empty when unsized)
    std::string close;          // "\right)" or "\right."
    bool sized;                 // false when both sides are invisible
    bool unknown_open;          // open marker was unrecognized, written invisible
    bool unknown_close;
};

DelimiterResolution resolve_delimiters(uint32_t open_char, uint32_t close_char);

// Matrix environment for a marker pair: pmatrix, bmatrix, Bmatrix, vmatrix,
// Vmatrix, or matrix when there are no markers. nullptr when the pair has no
// dedicated environment; the caller then wraps a plain matrix in
// resolve_delimiters().
const char* resolve_matrix_environment(uint32_t open_char, uint32_t close_char);

} // namespace docx2tex

#endif // DOCX2TEX_MATH_DELIMITERS_HPP
