// omml_element.hpp - Raw element tree handed over by the document parser
//
// One OmmlElement tree is produced per formula occurrence (m:oMath) by the
// document parser, or by read_omml_xml() for a standalone XML fragment.
// The tree is a plain ownership hierarchy: every element owns its children.

#ifndef DOCX2TEX_OMML_ELEMENT_HPP
#define DOCX2TEX_OMML_ELEMENT_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace docx2tex {

// Namespace of Office Math Markup Language
extern const char* const OMML_NAMESPACE;
// WordprocessingML main namespace
extern const char* const WML_NAMESPACE;

struct OmmlAttribute {
    std::string name;       // local name, prefix stripped
    std::string prefix;     // namespace prefix as written ("m", "w", "" ...)
    std::string value;
};

struct OmmlElement {
    std::string ns;         // resolved namespace URI (empty if undeclared)
    std::string prefix;     // namespace prefix as written
    std::string tag;        // local name ("f", "num", "oMath")
    std::vector<OmmlAttribute> attrs;
    std::vector<std::unique_ptr<OmmlElement>> children;
    std::string text;       // character data (m:t, w:t)

    OmmlElement() = default;
    OmmlElement(std::string ns_uri, std::string prefix_name, std::string local_name)
        : ns(std::move(ns_uri)), prefix(std::move(prefix_name)), tag(std::move(local_name)) {}

    // true if the element lives in the OMML namespace; an undeclared "m"
    // prefix is accepted as OMML too, since fragments cut out of a
    // document often lose the xmlns declaration
    bool is_math() const;
    bool is_math(const char* local_name) const;

    // first direct child in the math namespace with the given local name
    const OmmlElement* child(const char* local_name) const;

    // attribute by local name, nullptr if absent
    const char* attr(const char* local_name) const;

    // shortcut for the m:val attribute of property elements
    const char* val() const { return attr("val"); }

    // concatenated text of all descendant m:t / w:t elements, document order
    std::string collect_text() const;
    void collect_text(std::string& out) const;

    // builders used by the XML reader and by tests
    OmmlElement* append_child(std::unique_ptr<OmmlElement> elem);
    void set_attr(const std::string& name, const std::string& value, const std::string& attr_prefix = "");
};

// build an element in the math namespace (used by tests and programmatic callers)
std::unique_ptr<OmmlElement> make_math_element(const char* local_name);

// build an m:r run holding one m:t with the given text
std::unique_ptr<OmmlElement> make_math_run(const char* text);

} // namespace docx2tex

#endif // DOCX2TEX_OMML_ELEMENT_HPP
