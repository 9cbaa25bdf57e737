// math_converter.hpp - OMML formula to LaTeX conversion pipeline
//
// Per formula: OmmlElement tree -> parse_omml_formula() -> format_math_latex().
// A formula never fails as a whole: whatever goes wrong inside it is turned
// into degraded output plus diagnostics, and the other formulas of the
// document are unaffected.

#ifndef DOCX2TEX_MATH_CONVERTER_HPP
#define DOCX2TEX_MATH_CONVERTER_HPP

#include "math_ast.hpp"
#include "math_diagnostics.hpp"
#include "../input/input-omml.hpp"
#include <string>
#include <vector>

namespace docx2tex {

struct MathConvertOptions {
    int max_depth = MATH_DEFAULT_MAX_DEPTH;  // deeper subtrees are truncated
    int worker_count = 1;                    // 1 = serial, 0 = one per CPU
    bool clean_output = true;                // collapse whitespace in the fragment
};

struct FormulaResult {
    int index = 0;                           // position in the input list
    bool display = false;
    std::string latex;                       // formula body, never empty
    bool degraded = false;                   // true when any diagnostic was recorded
    std::vector<MathDiagnostic> diagnostics;
};

// Convert one formula. Never throws.
FormulaResult convert_formula(const OmmlElement* root, bool display, int index,
                              const MathConvertOptions& options = MathConvertOptions());

// Convert a list of formulas; results are in input order whatever the
// number of workers
std::vector<FormulaResult> convert_formulas(const std::vector<OmmlFormulaRef>& formulas,
                                            const MathConvertOptions& options = MathConvertOptions());

// Collapse runs of whitespace, drop spaces just inside braces, trim
std::string clean_math_fragment(const std::string& latex);

enum class MathWrapStyle {
    STANDARD,       // inline $...$, display \[...\]
    EQUATION,       // inline $...$, display in a numbered equation environment
};

std::string wrap_math_fragment(const std::string& latex, bool display,
                               MathWrapStyle style = MathWrapStyle::STANDARD);

} // namespace docx2tex

#endif // DOCX2TEX_MATH_CONVERTER_HPP
