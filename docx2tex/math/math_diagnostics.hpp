// math_diagnostics.hpp - Advisory diagnostics collected while converting a formula
//
// Diagnostics never stop a conversion. The parser and the emitter report
// every degradation, truncation or unknown marker here; the pipeline hands
// the list back to the caller with the fragment.

#ifndef DOCX2TEX_MATH_DIAGNOSTICS_HPP
#define DOCX2TEX_MATH_DIAGNOSTICS_HPP

#include <string>
#include <utility>
#include <vector>

namespace docx2tex {

struct MathDiagnostic {
    int formula_index;      // position of the formula in its document
    std::string element;    // OMML tag or node kind the report refers to ("m:f", "ACCENT")
    std::string reason;
};

class MathDiagnostics {
public:
    explicit MathDiagnostics(int formula_index = 0) : formula_index_(formula_index) {}

    // record one diagnostic, printf-style reason; also logged at warn level
    void report(const char* element, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    int formula_index() const { return formula_index_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<MathDiagnostic>& items() const { return items_; }
    std::vector<MathDiagnostic> take() { return std::move(items_); }

private:
    int formula_index_;
    std::vector<MathDiagnostic> items_;
};

} // namespace docx2tex

#endif // DOCX2TEX_MATH_DIAGNOSTICS_HPP
