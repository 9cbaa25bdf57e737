// math_ast.hpp - Math AST for OMML formula conversion
//
// The AST is the markup-independent form of one formula. It is built
// bottom-up by the OMML parser (math_ast_builder.cpp) and consumed once by
// the LaTeX emitter (format-math-latex.cpp).
//
// Architecture:
//   OmmlElement tree -> parse_omml_formula() -> MathNode tree
//   MathNode tree    -> format_math_latex()  -> LaTeX fragment
//
// All nodes, child arrays and text of one formula live in a single Arena
// and are released together with it. The node set is closed: every
// consumer switches over MathNodeKind without a default case, so adding a
// kind is a compile error until every consumer handles it.

#ifndef DOCX2TEX_MATH_AST_HPP
#define DOCX2TEX_MATH_AST_HPP

#include "../../lib/arena.h"
#include "math_diagnostics.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docx2tex {

struct OmmlElement;

// ============================================================================
// Math Node Kinds
// ============================================================================

enum class MathNodeKind : uint8_t {
    RUN,            // text run: m:r
    GROUP,          // ordered sequence: m:oMath, m:e, argument containers
    FRACTION,       // m:f
    RADICAL,        // m:rad
    SUPERSCRIPT,    // m:sSup
    SUBSCRIPT,      // m:sSub
    SUBSUP,         // m:sSubSup
    PRESCRIPT,      // m:sPre
    NARY,           // m:nary (sum, integral, product ...)
    DELIMITED,      // m:d
    MATRIX,         // m:m
    EQ_ARRAY,       // m:eqArr
    ACCENT,         // m:acc, m:bar, m:groupChr
    LIMIT,          // m:limLow, m:limUpp
    FUNCTION,       // m:func
    ENCLOSURE,      // m:borderBox, m:phant
    DEGRADED,       // salvaged text of a subtree that could not be converted
};

// Get string name for debugging
const char* math_node_kind_name(MathNodeKind kind);

// ============================================================================
// Variant attributes
// ============================================================================

enum class MathFont : uint8_t {
    DEFAULT,
    ROMAN,
    SCRIPT,
    FRAKTUR,
    DOUBLE_STRUCK,
    SANS_SERIF,
    MONOSPACE,
};

struct MathRunStyle {
    MathFont font;
    bool bold;
    bool italic;
    bool upright;           // m:sty p: plain upright letters
    bool normal_text;       // m:nor: text, not math
    bool function;          // whole run is a recognized function name
};

enum class FractionKind : uint8_t {
    BAR,            // stacked with a rule
    NO_BAR,         // stacked without a rule
    BINOMIAL,       // no-bar fraction inside parentheses
    LINEAR,         // a/b
    SKEWED,         // diagonal
};

enum class LimitPlacement : uint8_t {
    DEFAULT,        // whatever LaTeX does for the operator
    UNDER_OVER,     // limits above and below
    SUB_SUP,        // limits as scripts
};

enum class AccentKind : uint8_t {
    HAT,
    TILDE,
    BAR,
    DOT,
    DDOT,
    DDDOT,
    VEC,
    BREVE,
    CHECK,
    ACUTE,
    GRAVE,
    RING,
    LEFT_ARROW,
    LEFT_RIGHT_ARROW,
    OVERLINE,
    UNDERLINE,
    OVERBRACE,
    UNDERBRACE,
    UNKNOWN,
};

const char* math_accent_kind_name(AccentKind kind);

// Accent kind for an OMML m:chr value; UNKNOWN when unmapped
AccentKind math_accent_kind_for(uint32_t accent_char);

enum class EnclosureKind : uint8_t {
    BOXED,          // m:borderBox
    PHANTOM,        // m:phant with m:show off
};

// ============================================================================
// MathNode
// ============================================================================

struct MathNode {
    MathNodeKind kind;

    union {
        // RUN
        struct {
            const char* text;       // UTF-8, NUL terminated, arena owned
            size_t len;
            MathRunStyle style;
        } run;

        // GROUP, EQ_ARRAY (items are rows)
        struct {
            MathNode** items;
            int count;
        } group;

        // FRACTION
        struct {
            MathNode* numer;
            MathNode* denom;
            FractionKind kind;
        } frac;

        // RADICAL
        struct {
            MathNode* radicand;
            MathNode* degree;       // nullptr for a square root
        } radical;

        // SUPERSCRIPT, SUBSCRIPT, SUBSUP, PRESCRIPT
        struct {
            MathNode* base;
            MathNode* sub;          // nullptr for SUPERSCRIPT
            MathNode* sup;          // nullptr for SUBSCRIPT
        } scripts;

        // NARY
        struct {
            uint32_t op_char;       // operator codepoint (U+2211, U+222B ...)
            MathNode* lower;        // nullptr when absent or hidden
            MathNode* upper;        // nullptr when absent or hidden
            MathNode* operand;
            LimitPlacement placement;
        } nary;

        // DELIMITED: one or more bodies separated by sep_char
        struct {
            MathNode** items;
            int count;
            uint32_t open_char;     // 0 = no visible marker
            uint32_t close_char;    // 0 = no visible marker
            uint32_t sep_char;      // 0 = no separator
        } delimited;

        // MATRIX: rows * cols cells, row major
        struct {
            MathNode** cells;
            int rows;
            int cols;
            uint32_t open_char;     // markers of an enclosing m:d, 0 = none
            uint32_t close_char;
        } matrix;

        // ACCENT
        struct {
            MathNode* base;
            AccentKind kind;
            uint32_t accent_char;
        } accent;

        // LIMIT
        struct {
            MathNode* base;
            MathNode* limit;
            bool upper;             // m:limUpp
        } limit;

        // FUNCTION
        struct {
            MathNode* name;
            MathNode* argument;
        } func;

        // ENCLOSURE
        struct {
            MathNode* body;
            EnclosureKind kind;
        } enclosure;

        // DEGRADED
        struct {
            const char* text;       // salvaged text, may be empty
            size_t len;
        } degraded;
    };
};

// ============================================================================
// Node Allocation and Creation
// ============================================================================

// Allocate a zeroed MathNode from arena
MathNode* alloc_math_node(Arena* arena, MathNodeKind kind);

// Copy a child list into the arena
MathNode** math_node_array(Arena* arena, const std::vector<MathNode*>& nodes);

MathRunStyle math_default_run_style();

MathNode* make_math_run(Arena* arena, const char* text, size_t len, MathRunStyle style);
MathNode* make_math_run(Arena* arena, const char* text);
MathNode* make_math_group(Arena* arena, const std::vector<MathNode*>& items);
MathNode* make_math_fraction(Arena* arena, MathNode* numer, MathNode* denom, FractionKind kind = FractionKind::BAR);
MathNode* make_math_radical(Arena* arena, MathNode* radicand, MathNode* degree = nullptr);
MathNode* make_math_superscript(Arena* arena, MathNode* base, MathNode* sup);
MathNode* make_math_subscript(Arena* arena, MathNode* base, MathNode* sub);
MathNode* make_math_subsup(Arena* arena, MathNode* base, MathNode* sub, MathNode* sup);
MathNode* make_math_prescript(Arena* arena, MathNode* base, MathNode* sub, MathNode* sup);
MathNode* make_math_nary(Arena* arena, uint32_t op_char, MathNode* lower, MathNode* upper,
                         MathNode* operand, LimitPlacement placement = LimitPlacement::DEFAULT);
MathNode* make_math_delimited(Arena* arena, uint32_t open_char, const std::vector<MathNode*>& items,
                              uint32_t close_char, uint32_t sep_char = 0);

// rows must all have the same length; returns nullptr for a ragged or empty
// matrix, which has no representation
MathNode* make_math_matrix(Arena* arena, const std::vector<std::vector<MathNode*>>& rows,
                           uint32_t open_char = 0, uint32_t close_char = 0);
MathNode* make_math_eq_array(Arena* arena, const std::vector<MathNode*>& rows);
MathNode* make_math_accent(Arena* arena, MathNode* base, AccentKind kind, uint32_t accent_char = 0);
MathNode* make_math_limit(Arena* arena, MathNode* base, MathNode* limit, bool upper);
MathNode* make_math_function(Arena* arena, MathNode* name, MathNode* argument);
MathNode* make_math_enclosure(Arena* arena, MathNode* body, EnclosureKind kind);
MathNode* make_math_degraded(Arena* arena, const char* text, size_t len);

// ============================================================================
// Queries
// ============================================================================

// true for a node that LaTeX treats as one atom when scripted or accented:
// a run of a single character, or a group holding exactly one such node
bool math_node_is_atom(const MathNode* node);

// true when the node (or a single-item group around it) is a run flagged as
// a function name, or a DEGRADED/RUN whose text is a recognized function
bool math_node_is_function_name(const MathNode* node);

// concatenated run and degraded text in document order
void math_node_plain_text(const MathNode* node, std::string& out);

// ============================================================================
// Parsing Entry Point
// ============================================================================

#define MATH_DEFAULT_MAX_DEPTH 64

// Build the AST of one m:oMath element. Always returns a GROUP; malformed
// subtrees become DEGRADED nodes and are reported to diag. Returns nullptr
// only when the arena is out of memory.
MathNode* parse_omml_formula(const OmmlElement* root, Arena* arena, MathDiagnostics& diag,
                             int max_depth = MATH_DEFAULT_MAX_DEPTH);

// ============================================================================
// Debug Utilities
// ============================================================================

// Dump AST tree for debugging, one node per line, indented by depth
void math_ast_dump(const MathNode* node, std::string& out, int depth = 0);

} // namespace docx2tex

#endif // DOCX2TEX_MATH_AST_HPP
