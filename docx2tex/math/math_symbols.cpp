// math_symbols.cpp - Symbol lookup tables for OMML -> LaTeX math
//
// Static tables mapping Unicode math characters to LaTeX tokens and a
// symbol class. The tables are immutable; the lookup index over them is
// built once on first use.

#include "math_symbols.hpp"
#include "../../lib/log.h"
#include <cctype>
#include <cstring>
#include <string>
#include <unordered_map>

namespace docx2tex {

using C = MathSymbolClass;

// ============================================================================
// Greek Letters
// ============================================================================

static const MathSymbolDef GREEK_LOWER[] = {
    {0x03B1, "alpha",      "\\alpha",      C::Ordinary},
    {0x03B2, "beta",       "\\beta",       C::Ordinary},
    {0x03B3, "gamma",      "\\gamma",      C::Ordinary},
    {0x03B4, "delta",      "\\delta",      C::Ordinary},
    {0x03B5, "varepsilon", "\\varepsilon", C::Ordinary},
    {0x03F5, "epsilon",    "\\epsilon",    C::Ordinary},  // lunate epsilon
    {0x03B6, "zeta",       "\\zeta",       C::Ordinary},
    {0x03B7, "eta",        "\\eta",        C::Ordinary},
    {0x03B8, "theta",      "\\theta",      C::Ordinary},
    {0x03D1, "vartheta",   "\\vartheta",   C::Ordinary},
    {0x03B9, "iota",       "\\iota",       C::Ordinary},
    {0x03BA, "kappa",      "\\kappa",      C::Ordinary},
    {0x03F0, "varkappa",   "\\varkappa",   C::Ordinary},
    {0x03BB, "lambda",     "\\lambda",     C::Ordinary},
    {0x03BC, "mu",         "\\mu",         C::Ordinary},
    {0x00B5, nullptr,      "\\mu",         C::Ordinary},  // micro sign
    {0x03BD, "nu",         "\\nu",         C::Ordinary},
    {0x03BE, "xi",         "\\xi",         C::Ordinary},
    {0x03BF, "omicron",    "o",            C::Ordinary},
    {0x03C0, "pi",         "\\pi",         C::Ordinary},
    {0x03D6, "varpi",      "\\varpi",      C::Ordinary},
    {0x03C1, "rho",        "\\rho",        C::Ordinary},
    {0x03F1, "varrho",     "\\varrho",     C::Ordinary},
    {0x03C3, "sigma",      "\\sigma",      C::Ordinary},
    {0x03C2, "varsigma",   "\\varsigma",   C::Ordinary},
    {0x03C4, "tau",        "\\tau",        C::Ordinary},
    {0x03C5, "upsilon",    "\\upsilon",    C::Ordinary},
    {0x03C6, "varphi",     "\\varphi",     C::Ordinary},
    {0x03D5, "phi",        "\\phi",        C::Ordinary},
    {0x03C7, "chi",        "\\chi",        C::Ordinary},
    {0x03C8, "psi",        "\\psi",        C::Ordinary},
    {0x03C9, "omega",      "\\omega",      C::Ordinary},
};

// Capitals that coincide with Latin letters have no LaTeX command
static const MathSymbolDef GREEK_UPPER[] = {
    {0x0391, nullptr,   "A",         C::Ordinary},
    {0x0392, nullptr,   "B",         C::Ordinary},
    {0x0393, "Gamma",   "\\Gamma",   C::Ordinary},
    {0x0394, "Delta",   "\\Delta",   C::Ordinary},
    {0x0395, nullptr,   "E",         C::Ordinary},
    {0x0396, nullptr,   "Z",         C::Ordinary},
    {0x0397, nullptr,   "H",         C::Ordinary},
    {0x0398, "Theta",   "\\Theta",   C::Ordinary},
    {0x0399, nullptr,   "I",         C::Ordinary},
    {0x039A, nullptr,   "K",         C::Ordinary},
    {0x039B, "Lambda",  "\\Lambda",  C::Ordinary},
    {0x039C, nullptr,   "M",         C::Ordinary},
    {0x039D, nullptr,   "N",         C::Ordinary},
    {0x039E, "Xi",      "\\Xi",      C::Ordinary},
    {0x039F, nullptr,   "O",         C::Ordinary},
    {0x03A0, "Pi",      "\\Pi",      C::Ordinary},
    {0x03A1, nullptr,   "P",         C::Ordinary},
    {0x03A3, "Sigma",   "\\Sigma",   C::Ordinary},
    {0x03A4, nullptr,   "T",         C::Ordinary},
    {0x03A5, "Upsilon", "\\Upsilon", C::Ordinary},
    {0x03A6, "Phi",     "\\Phi",     C::Ordinary},
    {0x03A7, nullptr,   "X",         C::Ordinary},
    {0x03A8, "Psi",     "\\Psi",     C::Ordinary},
    {0x03A9, "Omega",   "\\Omega",   C::Ordinary},
    {0x2126, nullptr,   "\\Omega",   C::Ordinary},  // ohm sign
};

// ============================================================================
// Binary Operators
// ============================================================================

static const MathSymbolDef BINARY_OPS[] = {
    {'+',    nullptr,    "+",           C::Operator},
    {'-',    nullptr,    "-",           C::Operator},
    {'*',    nullptr,    "*",           C::Operator},
    {'/',    nullptr,    "/",           C::Operator},
    {0x2212, nullptr,    "-",           C::Operator},  // minus sign
    {0x00D7, "times",    "\\times",     C::Operator},
    {0x00F7, "div",      "\\div",       C::Operator},
    {0x00B1, "pm",       "\\pm",        C::Operator},
    {0x2213, "mp",       "\\mp",        C::Operator},
    {0x00B7, "cdot",     "\\cdot",      C::Operator},
    {0x22C5, nullptr,    "\\cdot",      C::Operator},  // dot operator
    {0x2217, "ast",      "\\ast",       C::Operator},
    {0x22C6, "star",     "\\star",      C::Operator},
    {0x2218, "circ",     "\\circ",      C::Operator},
    {0x2219, nullptr,    "\\bullet",    C::Operator},
    {0x2022, "bullet",   "\\bullet",    C::Operator},
    {0x2295, "oplus",    "\\oplus",     C::Operator},
    {0x2297, "otimes",   "\\otimes",    C::Operator},
    {0x2296, "ominus",   "\\ominus",    C::Operator},
    {0x2298, "oslash",   "\\oslash",    C::Operator},
    {0x2299, "odot",     "\\odot",      C::Operator},
    {0x222A, "cup",      "\\cup",       C::Operator},
    {0x2229, "cap",      "\\cap",       C::Operator},
    {0x228E, "uplus",    "\\uplus",     C::Operator},
    {0x2293, "sqcap",    "\\sqcap",     C::Operator},
    {0x2294, "sqcup",    "\\sqcup",     C::Operator},
    {0x2216, "setminus", "\\setminus",  C::Operator},
    {0x2227, "land",     "\\land",      C::Operator},
    {0x2228, "lor",      "\\lor",       C::Operator},
    {0x22C4, "diamond",  "\\diamond",   C::Operator},
    {0x2240, "wr",       "\\wr",        C::Operator},
};

// ============================================================================
// Relations
// ============================================================================

static const MathSymbolDef RELATIONS[] = {
    {'=',    nullptr,      "=",             C::Relation},
    {'<',    nullptr,      "<",             C::Relation},
    {'>',    nullptr,      ">",             C::Relation},
    {0x2260, "neq",        "\\neq",         C::Relation},
    {0x2264, "leq",        "\\leq",         C::Relation},
    {0x2265, "geq",        "\\geq",         C::Relation},
    {0x2A7D, nullptr,      "\\leqslant",    C::Relation},
    {0x2A7E, nullptr,      "\\geqslant",    C::Relation},
    {0x226A, "ll",         "\\ll",          C::Relation},
    {0x226B, "gg",         "\\gg",          C::Relation},
    {0x2248, "approx",     "\\approx",      C::Relation},
    {0x2243, "simeq",      "\\simeq",       C::Relation},
    {0x2245, "cong",       "\\cong",        C::Relation},
    {0x2261, "equiv",      "\\equiv",       C::Relation},
    {0x223C, "sim",        "\\sim",         C::Relation},
    {0x221D, "propto",     "\\propto",      C::Relation},
    {0x227A, "prec",       "\\prec",        C::Relation},
    {0x227B, "succ",       "\\succ",        C::Relation},
    {0x2AAF, "preceq",     "\\preceq",      C::Relation},
    {0x2AB0, "succeq",     "\\succeq",      C::Relation},
    {0x2250, "doteq",      "\\doteq",       C::Relation},
    {0x225C, "triangleq",  "\\triangleq",   C::Relation},
    {0x2208, "in",         "\\in",          C::Relation},
    {0x2209, "notin",      "\\notin",       C::Relation},
    {0x220B, "ni",         "\\ni",          C::Relation},
    {0x2282, "subset",     "\\subset",      C::Relation},
    {0x2283, "supset",     "\\supset",      C::Relation},
    {0x2286, "subseteq",   "\\subseteq",    C::Relation},
    {0x2287, "supseteq",   "\\supseteq",    C::Relation},
    {0x228A, "subsetneq",  "\\subsetneq",   C::Relation},
    {0x228B, "supsetneq",  "\\supsetneq",   C::Relation},
    {0x22A2, "vdash",      "\\vdash",       C::Relation},
    {0x22A3, "dashv",      "\\dashv",       C::Relation},
    {0x22A8, "models",     "\\models",      C::Relation},
    {0x22A5, "perp",       "\\perp",        C::Relation},
    {0x2225, "parallel",   "\\parallel",    C::Relation},
    {0x2223, "mid",        "\\mid",         C::Relation},
    {':',    nullptr,      ":",             C::Relation},
};

// ============================================================================
// Arrows
// ============================================================================

static const MathSymbolDef ARROWS[] = {
    {0x2192, "rightarrow",          "\\rightarrow",          C::Relation},
    {0x2190, "leftarrow",           "\\leftarrow",           C::Relation},
    {0x2194, "leftrightarrow",      "\\leftrightarrow",      C::Relation},
    {0x21D2, "Rightarrow",          "\\Rightarrow",          C::Relation},
    {0x21D0, "Leftarrow",           "\\Leftarrow",           C::Relation},
    {0x21D4, "Leftrightarrow",      "\\Leftrightarrow",      C::Relation},
    {0x21A6, "mapsto",              "\\mapsto",              C::Relation},
    {0x2191, "uparrow",             "\\uparrow",             C::Relation},
    {0x2193, "downarrow",           "\\downarrow",           C::Relation},
    {0x21D1, "Uparrow",             "\\Uparrow",             C::Relation},
    {0x21D3, "Downarrow",           "\\Downarrow",           C::Relation},
    {0x2197, "nearrow",             "\\nearrow",             C::Relation},
    {0x2198, "searrow",             "\\searrow",             C::Relation},
    {0x2199, "swarrow",             "\\swarrow",             C::Relation},
    {0x2196, "nwarrow",             "\\nwarrow",             C::Relation},
    {0x27F5, "longleftarrow",       "\\longleftarrow",       C::Relation},
    {0x27F6, "longrightarrow",      "\\longrightarrow",      C::Relation},
    {0x27F7, "longleftrightarrow",  "\\longleftrightarrow",  C::Relation},
    {0x27F8, "Longleftarrow",       "\\Longleftarrow",       C::Relation},
    {0x27F9, "Longrightarrow",      "\\Longrightarrow",      C::Relation},
    {0x27FA, "Longleftrightarrow",  "\\Longleftrightarrow",  C::Relation},
    {0x21A9, "hookleftarrow",       "\\hookleftarrow",       C::Relation},
    {0x21AA, "hookrightarrow",      "\\hookrightarrow",      C::Relation},
    {0x21CC, "rightleftharpoons",   "\\rightleftharpoons",   C::Relation},
};

// ============================================================================
// Large Operators (n-ary)
// ============================================================================

static const MathSymbolDef LARGE_OPS[] = {
    {0x2211, "sum",       "\\sum",       C::Operator},
    {0x220F, "prod",      "\\prod",      C::Operator},
    {0x2210, "coprod",    "\\coprod",    C::Operator},
    {0x222B, "int",       "\\int",       C::Operator},
    {0x222C, "iint",      "\\iint",      C::Operator},
    {0x222D, "iiint",     "\\iiint",     C::Operator},
    {0x222E, "oint",      "\\oint",      C::Operator},
    {0x222F, "oiint",     "\\oiint",     C::Operator},
    {0x2230, "oiiint",    "\\oiiint",    C::Operator},
    {0x22C0, "bigwedge",  "\\bigwedge",  C::Operator},
    {0x22C1, "bigvee",    "\\bigvee",    C::Operator},
    {0x22C2, "bigcap",    "\\bigcap",    C::Operator},
    {0x22C3, "bigcup",    "\\bigcup",    C::Operator},
    {0x2A00, "bigodot",   "\\bigodot",   C::Operator},
    {0x2A01, "bigoplus",  "\\bigoplus",  C::Operator},
    {0x2A02, "bigotimes", "\\bigotimes", C::Operator},
    {0x2A04, "biguplus",  "\\biguplus",  C::Operator},
    {0x2A06, "bigsqcup",  "\\bigsqcup",  C::Operator},
};

// ============================================================================
// Delimiters
// ============================================================================

static const MathSymbolDef DELIMITERS[] = {
    {'(',    nullptr,   "(",          C::Delimiter},
    {')',    nullptr,   ")",          C::Delimiter},
    {'[',    nullptr,   "[",          C::Delimiter},
    {']',    nullptr,   "]",          C::Delimiter},
    {'{',    "lbrace",  "\\{",        C::Delimiter},
    {'}',    "rbrace",  "\\}",        C::Delimiter},
    {'|',    "vert",    "|",          C::Delimiter},
    {0x2016, "Vert",    "\\|",        C::Delimiter},
    {0x27E8, "langle",  "\\langle",   C::Delimiter},
    {0x27E9, "rangle",  "\\rangle",   C::Delimiter},
    {0x2329, nullptr,   "\\langle",   C::Delimiter},
    {0x232A, nullptr,   "\\rangle",   C::Delimiter},
    {0x2308, "lceil",   "\\lceil",    C::Delimiter},
    {0x2309, "rceil",   "\\rceil",    C::Delimiter},
    {0x230A, "lfloor",  "\\lfloor",   C::Delimiter},
    {0x230B, "rfloor",  "\\rfloor",   C::Delimiter},
};

// ============================================================================
// Miscellaneous symbols
// ============================================================================

static const MathSymbolDef MISC_SYMBOLS[] = {
    {0x2202, "partial",       "\\partial",       C::Ordinary},
    {0x221E, "infty",         "\\infty",         C::Ordinary},
    {0x2207, "nabla",         "\\nabla",         C::Ordinary},
    {0x2205, "emptyset",      "\\emptyset",      C::Ordinary},
    {0x2200, "forall",        "\\forall",        C::Ordinary},
    {0x2203, "exists",        "\\exists",        C::Ordinary},
    {0x2204, "nexists",       "\\nexists",       C::Ordinary},
    {0x00AC, "neg",           "\\neg",           C::Ordinary},
    {0x221A, "surd",          "\\surd",          C::Ordinary},
    {0x22A4, "top",           "\\top",           C::Ordinary},
    {0x2113, "ell",           "\\ell",           C::Ordinary},
    {0x210F, "hbar",          "\\hbar",          C::Ordinary},
    {0x211C, "Re",            "\\Re",            C::Ordinary},
    {0x2111, "Im",            "\\Im",            C::Ordinary},
    {0x2118, "wp",            "\\wp",            C::Ordinary},
    {0x2135, "aleph",         "\\aleph",         C::Ordinary},
    {0x2220, "angle",         "\\angle",         C::Ordinary},
    {0x2221, "measuredangle", "\\measuredangle", C::Ordinary},
    {0x22EE, "vdots",         "\\vdots",         C::Ordinary},
    {0x22EF, "cdots",         "\\cdots",         C::Ordinary},
    {0x22F1, "ddots",         "\\ddots",         C::Ordinary},
    {0x2026, "ldots",         "\\ldots",         C::Ordinary},
    {0x25A1, "square",        "\\square",        C::Ordinary},
    {0x25B3, "triangle",      "\\triangle",      C::Ordinary},
    {0x25BD, "triangledown",  "\\triangledown",  C::Ordinary},
    {0x2605, "bigstar",       "\\bigstar",       C::Ordinary},
    {0x2660, "spadesuit",     "\\spadesuit",     C::Ordinary},
    {0x2665, "heartsuit",     "\\heartsuit",     C::Ordinary},
    {0x2666, "diamondsuit",   "\\diamondsuit",   C::Ordinary},
    {0x2663, "clubsuit",      "\\clubsuit",      C::Ordinary},
    {0x2032, "prime",         "'",               C::Ordinary},
    {0x2033, nullptr,         "''",              C::Ordinary},
    {0x2034, nullptr,         "'''",             C::Ordinary},
    {0x00B0, "degree",        "^{\\circ}",       C::Ordinary},
    {0x00A0, nullptr,         "~",               C::Ordinary},  // no-break space
    {0x2009, nullptr,         "\\,",             C::Ordinary},  // thin space
    {0x2005, nullptr,         "\\:",             C::Ordinary},  // four-per-em space
    {0x2004, nullptr,         "\\;",             C::Ordinary},  // three-per-em space
    {0x2003, nullptr,         "\\quad",          C::Ordinary},  // em space
    {0x2102, nullptr,         "\\mathbb{C}",     C::Ordinary},
    {0x2115, nullptr,         "\\mathbb{N}",     C::Ordinary},
    {0x211A, nullptr,         "\\mathbb{Q}",     C::Ordinary},
    {0x211D, nullptr,         "\\mathbb{R}",     C::Ordinary},
    {0x2124, nullptr,         "\\mathbb{Z}",     C::Ordinary},
    {',',    nullptr,         ",",               C::Ordinary},
    {';',    nullptr,         ";",               C::Ordinary},
    {'!',    nullptr,         "!",               C::Ordinary},
};

// ============================================================================
// Unicode super/subscript characters
// ============================================================================

static const MathSymbolDef SCRIPT_CHARS[] = {
    {0x2070, nullptr, "^{0}", C::Ordinary},
    {0x00B9, nullptr, "^{1}", C::Ordinary},
    {0x00B2, nullptr, "^{2}", C::Ordinary},
    {0x00B3, nullptr, "^{3}", C::Ordinary},
    {0x2074, nullptr, "^{4}", C::Ordinary},
    {0x2075, nullptr, "^{5}", C::Ordinary},
    {0x2076, nullptr, "^{6}", C::Ordinary},
    {0x2077, nullptr, "^{7}", C::Ordinary},
    {0x2078, nullptr, "^{8}", C::Ordinary},
    {0x2079, nullptr, "^{9}", C::Ordinary},
    {0x207A, nullptr, "^{+}", C::Ordinary},
    {0x207B, nullptr, "^{-}", C::Ordinary},
    {0x207C, nullptr, "^{=}", C::Ordinary},
    {0x207D, nullptr, "^{(}", C::Ordinary},
    {0x207E, nullptr, "^{)}", C::Ordinary},
    {0x207F, nullptr, "^{n}", C::Ordinary},
    {0x2071, nullptr, "^{i}", C::Ordinary},
    {0x2080, nullptr, "_{0}", C::Ordinary},
    {0x2081, nullptr, "_{1}", C::Ordinary},
    {0x2082, nullptr, "_{2}", C::Ordinary},
    {0x2083, nullptr, "_{3}", C::Ordinary},
    {0x2084, nullptr, "_{4}", C::Ordinary},
    {0x2085, nullptr, "_{5}", C::Ordinary},
    {0x2086, nullptr, "_{6}", C::Ordinary},
    {0x2087, nullptr, "_{7}", C::Ordinary},
    {0x2088, nullptr, "_{8}", C::Ordinary},
    {0x2089, nullptr, "_{9}", C::Ordinary},
    {0x208A, nullptr, "_{+}", C::Ordinary},
    {0x208B, nullptr, "_{-}", C::Ordinary},
    {0x208C, nullptr, "_{=}", C::Ordinary},
    {0x208D, nullptr, "_{(}", C::Ordinary},
    {0x208E, nullptr, "_{)}", C::Ordinary},
};

// ============================================================================
// Function names (named glyphs only)
// ============================================================================

static const MathSymbolDef FUNCTION_NAMES[] = {
    {0, "sin",    "\\sin",    C::FunctionName},
    {0, "cos",    "\\cos",    C::FunctionName},
    {0, "tan",    "\\tan",    C::FunctionName},
    {0, "cot",    "\\cot",    C::FunctionName},
    {0, "sec",    "\\sec",    C::FunctionName},
    {0, "csc",    "\\csc",    C::FunctionName},
    {0, "sinh",   "\\sinh",   C::FunctionName},
    {0, "cosh",   "\\cosh",   C::FunctionName},
    {0, "tanh",   "\\tanh",   C::FunctionName},
    {0, "coth",   "\\coth",   C::FunctionName},
    {0, "sech",   "\\operatorname{sech}",   C::FunctionName},
    {0, "csch",   "\\operatorname{csch}",   C::FunctionName},
    {0, "arcsin", "\\arcsin", C::FunctionName},
    {0, "arccos", "\\arccos", C::FunctionName},
    {0, "arctan", "\\arctan", C::FunctionName},
    {0, "arccot", "\\operatorname{arccot}", C::FunctionName},
    {0, "asin",   "\\operatorname{asin}",   C::FunctionName},
    {0, "acos",   "\\operatorname{acos}",   C::FunctionName},
    {0, "atan",   "\\operatorname{atan}",   C::FunctionName},
    {0, "acot",   "\\operatorname{acot}",   C::FunctionName},
    {0, "exp",    "\\exp",    C::FunctionName},
    {0, "log",    "\\log",    C::FunctionName},
    {0, "ln",     "\\ln",     C::FunctionName},
    {0, "lg",     "\\lg",     C::FunctionName},
    {0, "lim",    "\\lim",    C::FunctionName},
    {0, "liminf", "\\liminf", C::FunctionName},
    {0, "limsup", "\\limsup", C::FunctionName},
    {0, "max",    "\\max",    C::FunctionName},
    {0, "min",    "\\min",    C::FunctionName},
    {0, "sup",    "\\sup",    C::FunctionName},
    {0, "inf",    "\\inf",    C::FunctionName},
    {0, "arg",    "\\arg",    C::FunctionName},
    {0, "det",    "\\det",    C::FunctionName},
    {0, "dim",    "\\dim",    C::FunctionName},
    {0, "gcd",    "\\gcd",    C::FunctionName},
    {0, "hom",    "\\hom",    C::FunctionName},
    {0, "ker",    "\\ker",    C::FunctionName},
    {0, "deg",    "\\deg",    C::FunctionName},
    {0, "Pr",     "\\Pr",     C::FunctionName},
    {0, "mod",    "\\operatorname{mod}",    C::FunctionName},
};

struct SymbolTableRef {
    const MathSymbolDef* defs;
    size_t count;
};

#define SYMBOL_TABLE(t) {t, sizeof(t) / sizeof((t)[0])}

// search order: earlier tables win when a codepoint appears twice
static const SymbolTableRef ALL_TABLES[] = {
    SYMBOL_TABLE(GREEK_LOWER),
    SYMBOL_TABLE(GREEK_UPPER),
    SYMBOL_TABLE(BINARY_OPS),
    SYMBOL_TABLE(RELATIONS),
    SYMBOL_TABLE(ARROWS),
    SYMBOL_TABLE(LARGE_OPS),
    SYMBOL_TABLE(DELIMITERS),
    SYMBOL_TABLE(MISC_SYMBOLS),
    SYMBOL_TABLE(SCRIPT_CHARS),
    SYMBOL_TABLE(FUNCTION_NAMES),
};

// ============================================================================
// Lookup index
// ============================================================================

static std::string lowercase(const char* s, size_t len) {
    std::string out(s, len);
    for (auto& c : out) c = (char)tolower((unsigned char)c);
    return out;
}

namespace {

struct SymbolIndex {
    std::unordered_map<uint32_t, const MathSymbolDef*> by_codepoint;
    std::unordered_map<std::string, const MathSymbolDef*> by_name;
    std::unordered_map<std::string, const MathSymbolDef*> functions;   // lowercased
    size_t total = 0;

    SymbolIndex() {
        for (const auto& table : ALL_TABLES) {
            for (size_t i = 0; i < table.count; i++) {
                const MathSymbolDef* def = &table.defs[i];
                total++;
                if (def->codepoint) by_codepoint.emplace(def->codepoint, def);
                if (def->name) by_name.emplace(def->name, def);
                if (def->cls == C::FunctionName) {
                    functions.emplace(lowercase(def->name, strlen(def->name)), def);
                }
            }
        }
        log_debug("math_symbols: indexed %zu symbols, %zu codepoints", total, by_codepoint.size());
    }
};

} // namespace

// built once; C++11 guarantees thread-safe initialization of the static
static const SymbolIndex& symbol_index() {
    static const SymbolIndex index;
    return index;
}

// ============================================================================
// Lookup functions
// ============================================================================

const char* math_symbol_class_name(MathSymbolClass cls) {
    switch (cls) {
        case C::Ordinary:     return "ordinary";
        case C::Operator:     return "operator";
        case C::Relation:     return "relation";
        case C::Delimiter:    return "delimiter";
        case C::FunctionName: return "function-name";
    }
    return "unknown";
}

const MathSymbolDef* math_symbol_lookup(uint32_t codepoint) {
    const auto& index = symbol_index().by_codepoint;
    auto it = index.find(codepoint);
    return it == index.end() ? nullptr : it->second;
}

const MathSymbolDef* math_symbol_lookup_name(const char* name, size_t len) {
    if (!name || len == 0) return nullptr;
    if (name[0] == '\\') {
        name++;
        len--;
    }
    const SymbolIndex& index = symbol_index();
    auto it = index.by_name.find(std::string(name, len));
    if (it != index.by_name.end()) return it->second;
    return nullptr;
}

static const MathSymbolDef* find_function(const char* name, size_t len) {
    if (!name || len == 0) return nullptr;
    const auto& functions = symbol_index().functions;
    auto it = functions.find(lowercase(name, len));
    return it == functions.end() ? nullptr : it->second;
}

bool math_is_function_name(const char* name, size_t len) {
    return find_function(name, len) != nullptr;
}

const char* math_function_latex(const char* name, size_t len) {
    const MathSymbolDef* def = find_function(name, len);
    return def ? def->latex : nullptr;
}

const char* math_nary_latex(uint32_t codepoint) {
    for (const auto& def : LARGE_OPS) {
        if (def.codepoint == codepoint) return def.latex;
    }
    return nullptr;
}

bool math_nary_is_integral(uint32_t codepoint) {
    return codepoint >= 0x222B && codepoint <= 0x2233;
}

bool math_is_invisible_char(uint32_t codepoint) {
    switch (codepoint) {
        case 0x200B:    // zero width space
        case 0x200C:    // zero width non-joiner
        case 0x200D:    // zero width joiner
        case 0x2060:    // word joiner
        case 0x2061:    // function application
        case 0x2062:    // invisible times
        case 0x2063:    // invisible separator
        case 0x2064:    // invisible plus
        case 0xFEFF:    // zero width no-break space (BOM)
            return true;
        default:
            return false;
    }
}

size_t math_symbol_count() {
    return symbol_index().total;
}

} // namespace docx2tex
