// math_symbols.hpp - Symbol lookup declarations for OMML -> LaTeX math
//
// This header provides lookup functions for converting Unicode math
// characters (and named glyphs such as function names) to LaTeX tokens,
// together with a coarse classification used for spacing and styling.

#ifndef DOCX2TEX_MATH_SYMBOLS_HPP
#define DOCX2TEX_MATH_SYMBOLS_HPP

#include <cstddef>
#include <cstdint>

namespace docx2tex {

// Symbol classification
enum class MathSymbolClass : uint8_t {
    Ordinary,       // letters, Greek, misc symbols
    Operator,       // binary and large operators: +, \times, \sum
    Relation,       // =, \leq, arrows
    Delimiter,      // (, \langle, \lceil
    FunctionName,   // sin, log, lim
};

const char* math_symbol_class_name(MathSymbolClass cls);

struct MathSymbolDef {
    uint32_t codepoint;     // Unicode codepoint (0 for named-only entries)
    const char* name;       // glyph name for named lookup (nullptr = none)
    const char* latex;      // LaTeX token emitted for the symbol
    MathSymbolClass cls;
};

// Look up a Unicode character; nullptr if the table has no entry
const MathSymbolDef* math_symbol_lookup(uint32_t codepoint);

// Look up a named glyph ("sin", "infty", "langle"); nullptr if unknown
const MathSymbolDef* math_symbol_lookup_name(const char* name, size_t len);

// Recognized function names (sin, cos, lim, max ...), case-insensitive
bool math_is_function_name(const char* name, size_t len);

// LaTeX for a function name: \sin for the standard set, otherwise \operatorname{name}
// Returns a string that lives for the process lifetime when name is recognized,
// nullptr otherwise.
const char* math_function_latex(const char* name, size_t len);

// N-ary (large) operators: U+2211 -> \sum, U+222B -> \int
const char* math_nary_latex(uint32_t codepoint);
bool math_nary_is_integral(uint32_t codepoint);

// Zero-width characters dropped from formula text
bool math_is_invisible_char(uint32_t codepoint);

// Number of entries in all tables (for tests and diagnostics)
size_t math_symbol_count();

} // namespace docx2tex

#endif // DOCX2TEX_MATH_SYMBOLS_HPP
