// input-omml.hpp - XML reader for OMML fragments and WordprocessingML bodies
//
// The document parser normally hands formulas over as element trees; this
// reader builds the same trees from XML text (word/document.xml or a bare
// m:oMath fragment) and locates the formulas inside a document body.

#ifndef DOCX2TEX_INPUT_OMML_HPP
#define DOCX2TEX_INPUT_OMML_HPP

#include "../omml_element.hpp"
#include <memory>
#include <string>
#include <vector>

namespace docx2tex {

// Parse XML text into an element tree. Returns nullptr on malformed input
// and stores a short reason in *error when error is non-null.
std::unique_ptr<OmmlElement> read_omml_xml(const std::string& xml, std::string* error = nullptr);

// One formula occurrence found in a document body
struct OmmlFormulaRef {
    const OmmlElement* root;    // the m:oMath element
    bool display;               // true inside m:oMathPara
};

// Formulas in document order. Each m:oMath inside an m:oMathPara is a
// display formula; a free-standing m:oMath is inline.
std::vector<OmmlFormulaRef> find_omml_formulas(const OmmlElement* root);

} // namespace docx2tex

#endif // DOCX2TEX_INPUT_OMML_HPP
