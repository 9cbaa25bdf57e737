// format-math-latex.hpp - LaTeX emitter for MathNode trees

#ifndef DOCX2TEX_FORMAT_MATH_LATEX_HPP
#define DOCX2TEX_FORMAT_MATH_LATEX_HPP

#include "../math/math_ast.hpp"
#include <string>

namespace docx2tex {

struct MathFormatContext {
    bool display;               // display formula: large operators default to limits above/below
    MathDiagnostics* diag;      // unknown accents and delimiters are reported here, may be null
};

// Emit the LaTeX formula body for an AST (no $ or \[ wrapping). The result
// is never empty: an empty formula gives "{}".
std::string format_math_latex(const MathNode* root, MathFormatContext& ctx);

// Escape text for a plain math run: reserved characters get their LaTeX
// form, characters in the symbol table their command, everything else
// passes through unchanged
std::string escape_math_text(const char* text, size_t len);

} // namespace docx2tex

#endif // DOCX2TEX_FORMAT_MATH_LATEX_HPP
