// omml_element.cpp - Raw element tree helpers

#include "omml_element.hpp"

namespace docx2tex {

const char* const OMML_NAMESPACE = "http://schemas.openxmlformats.org/officeDocument/2006/math";
const char* const WML_NAMESPACE = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

bool OmmlElement::is_math() const {
    if (!ns.empty()) return ns == OMML_NAMESPACE;
    return prefix == "m";
}

bool OmmlElement::is_math(const char* local_name) const {
    return is_math() && tag == local_name;
}

const OmmlElement* OmmlElement::child(const char* local_name) const {
    for (const auto& c : children) {
        if (c->is_math(local_name)) return c.get();
    }
    return nullptr;
}

const char* OmmlElement::attr(const char* local_name) const {
    for (const auto& a : attrs) {
        if (a.name == local_name) return a.value.c_str();
    }
    return nullptr;
}

std::string OmmlElement::collect_text() const {
    std::string out;
    collect_text(out);
    return out;
}

void OmmlElement::collect_text(std::string& out) const {
    // explicit stack: a crafted document may nest far deeper than the call stack allows
    std::vector<const OmmlElement*> stack;
    stack.push_back(this);
    while (!stack.empty()) {
        const OmmlElement* elem = stack.back();
        stack.pop_back();
        if (elem->tag == "t") {
            out += elem->text;
            continue;
        }
        for (auto it = elem->children.rbegin(); it != elem->children.rend(); ++it) {
            stack.push_back(it->get());
        }
    }
}

OmmlElement* OmmlElement::append_child(std::unique_ptr<OmmlElement> elem) {
    children.push_back(std::move(elem));
    return children.back().get();
}

void OmmlElement::set_attr(const std::string& name, const std::string& value, const std::string& attr_prefix) {
    for (auto& a : attrs) {
        if (a.name == name) {
            a.value = value;
            a.prefix = attr_prefix;
            return;
        }
    }
    attrs.push_back(OmmlAttribute{name, attr_prefix, value});
}

std::unique_ptr<OmmlElement> make_math_element(const char* local_name) {
    return std::make_unique<OmmlElement>(OMML_NAMESPACE, "m", local_name);
}

std::unique_ptr<OmmlElement> make_math_run(const char* text) {
    auto run = make_math_element("r");
    auto t = make_math_element("t");
    t->text = text ? text : "";
    run->append_child(std::move(t));
    return run;
}

} // namespace docx2tex
