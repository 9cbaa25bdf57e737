#include "input-omml.hpp"
#include "../../lib/log.h"
#include "../../lib/utf.h"
#include <cctype>
#include <cstring>
#include <memory>
#include <utility>

namespace docx2tex {

static const int XML_MAX_DEPTH = 512;

namespace {

struct NamespaceBinding {
    std::string prefix;
    std::string uri;
};

struct XmlReadContext {
    std::vector<NamespaceBinding> bindings;   // innermost declaration last
    std::string error;

    bool fail(const char* reason) {
        if (error.empty()) error = reason;
        return false;
    }

    const std::string* lookup(const std::string& prefix) const {
        for (auto it = bindings.rbegin(); it != bindings.rend(); ++it) {
            if (it->prefix == prefix) return &it->uri;
        }
        return nullptr;
    }
};

} // namespace

static void skip_whitespace(const char **xml) {
    while (**xml && isspace((unsigned char)**xml)) (*xml)++;
}

static bool is_name_char(char c) {
    return isalnum((unsigned char)c) || c == '_' || c == '-' || c == ':' || c == '.' ||
           (unsigned char)c >= 0x80;
}

static void split_qname(const std::string& qname, std::string& prefix, std::string& local) {
    size_t colon = qname.find(':');
    if (colon == std::string::npos) {
        prefix.clear();
        local = qname;
    } else {
        prefix = qname.substr(0, colon);
        local = qname.substr(colon + 1);
    }
}

// decode character data up to end_char, resolving the predefined entities
// and numeric character references
static std::string parse_string_content(const char **xml, char end_char) {
    std::string out;

    while (**xml && **xml != end_char) {
        if (**xml != '&') {
            out += **xml;
            (*xml)++;
            continue;
        }

        const char* entity_start = *xml;
        (*xml)++; // skip &

        if (**xml == '#') {
            (*xml)++; // skip #
            uint32_t value = 0;
            bool is_hex = false;
            bool any_digit = false;

            if (**xml == 'x' || **xml == 'X') {
                is_hex = true;
                (*xml)++;
            }

            while (**xml && **xml != ';') {
                char c = **xml;
                if (is_hex && isxdigit((unsigned char)c)) {
                    value = value * 16 + (uint32_t)(isdigit((unsigned char)c) ? c - '0' : (tolower(c) - 'a' + 10));
                } else if (!is_hex && isdigit((unsigned char)c)) {
                    value = value * 10 + (uint32_t)(c - '0');
                } else {
                    break;
                }
                any_digit = true;
                (*xml)++;
            }

            if (**xml == ';' && any_digit) {
                (*xml)++; // skip ;
                char utf8_buf[8];
                if (unicode_to_utf8(value, utf8_buf) > 0) {
                    out += utf8_buf;
                } else {
                    out += '?'; // invalid codepoint
                }
            } else {
                // invalid numeric reference, keep it literally
                *xml = entity_start + 1;
                out += '&';
            }
            continue;
        }

        const char* name_start = *xml;
        while (**xml && isalnum((unsigned char)**xml)) (*xml)++;
        size_t name_len = (size_t)(*xml - name_start);

        if (**xml == ';') {
            static const struct { const char* name; const char* decoded; } predefined[] = {
                {"lt", "<"}, {"gt", ">"}, {"amp", "&"}, {"quot", "\""}, {"apos", "'"},
            };
            const char* decoded = nullptr;
            for (const auto& e : predefined) {
                if (strlen(e.name) == name_len && strncmp(e.name, name_start, name_len) == 0) {
                    decoded = e.decoded;
                    break;
                }
            }
            (*xml)++; // skip ;
            if (decoded) {
                out += decoded;
            } else {
                // unknown entity, keep as written
                out.append(entity_start, (size_t)(*xml - entity_start));
            }
        } else {
            // bare ampersand
            *xml = entity_start + 1;
            out += '&';
        }
    }

    return out;
}

static bool parse_name(const char **xml, std::string& name) {
    const char* start = *xml;
    while (**xml && is_name_char(**xml)) (*xml)++;
    name.assign(start, (size_t)(*xml - start));
    return !name.empty();
}

// skip <!-- -->, <?...?>, <![CDATA[ ]]> handled by caller, <!DOCTYPE ...>
static bool skip_markup(XmlReadContext& ctx, const char **xml) {
    if (strncmp(*xml, "<!--", 4) == 0) {
        const char* end = strstr(*xml + 4, "-->");
        if (!end) return ctx.fail("unterminated comment");
        *xml = end + 3;
        return true;
    }
    if (strncmp(*xml, "<?", 2) == 0) {
        const char* end = strstr(*xml + 2, "?>");
        if (!end) return ctx.fail("unterminated processing instruction");
        *xml = end + 2;
        return true;
    }
    if (strncmp(*xml, "<!DOCTYPE", 9) == 0) {
        int nesting = 0;
        while (**xml) {
            if (**xml == '[') nesting++;
            else if (**xml == ']') nesting--;
            else if (**xml == '>' && nesting <= 0) {
                (*xml)++;
                return true;
            }
            (*xml)++;
        }
        return ctx.fail("unterminated DOCTYPE");
    }
    return ctx.fail("unexpected markup");
}

static bool parse_attributes(XmlReadContext& ctx, std::vector<OmmlAttribute>& raw, const char **xml) {
    skip_whitespace(xml);
    while (**xml && **xml != '>' && **xml != '/') {
        std::string qname;
        if (!parse_name(xml, qname)) return ctx.fail("invalid attribute name");

        skip_whitespace(xml);
        if (**xml != '=') return ctx.fail("attribute without value");
        (*xml)++; // skip =
        skip_whitespace(xml);

        char quote = **xml;
        if (quote != '"' && quote != '\'') return ctx.fail("unquoted attribute value");
        (*xml)++;
        std::string value = parse_string_content(xml, quote);
        if (**xml != quote) return ctx.fail("unterminated attribute value");
        (*xml)++;

        OmmlAttribute attr;
        attr.name = qname;      // split after namespace declarations are known
        attr.value = std::move(value);
        raw.push_back(std::move(attr));
        skip_whitespace(xml);
    }
    return true;
}

static std::unique_ptr<OmmlElement> parse_element(XmlReadContext& ctx, const char **xml, int depth) {
    if (depth > XML_MAX_DEPTH) {
        ctx.fail("element nesting too deep");
        return nullptr;
    }
    if (**xml != '<') {
        ctx.fail("expected element");
        return nullptr;
    }
    (*xml)++; // skip <

    std::string qname;
    if (!parse_name(xml, qname)) {
        ctx.fail("invalid element name");
        return nullptr;
    }

    std::vector<OmmlAttribute> raw_attrs;
    if (!parse_attributes(ctx, raw_attrs, xml)) return nullptr;

    // namespace declarations are scoped to this element and its content
    size_t scope_mark = ctx.bindings.size();
    for (const auto& a : raw_attrs) {
        if (a.name == "xmlns") {
            ctx.bindings.push_back(NamespaceBinding{"", a.value});
        } else if (a.name.compare(0, 6, "xmlns:") == 0) {
            ctx.bindings.push_back(NamespaceBinding{a.name.substr(6), a.value});
        }
    }

    auto elem = std::make_unique<OmmlElement>();
    split_qname(qname, elem->prefix, elem->tag);
    const std::string* uri = ctx.lookup(elem->prefix);
    if (uri) elem->ns = *uri;

    for (auto& a : raw_attrs) {
        if (a.name == "xmlns" || a.name.compare(0, 6, "xmlns:") == 0) continue;
        std::string prefix, local;
        split_qname(a.name, prefix, local);
        elem->set_attr(local, a.value, prefix);
    }

    auto close_scope = [&]() { ctx.bindings.resize(scope_mark); };

    if (**xml == '/') {
        (*xml)++;
        if (**xml != '>') {
            ctx.fail("malformed empty element");
            return nullptr;
        }
        (*xml)++;
        close_scope();
        return elem;
    }
    (*xml)++; // skip >

    std::string text;
    while (**xml) {
        if (**xml != '<') {
            text += parse_string_content(xml, '<');
            continue;
        }
        if (strncmp(*xml, "</", 2) == 0) {
            *xml += 2;
            std::string end_name;
            parse_name(xml, end_name);
            if (end_name != qname) {
                ctx.fail("mismatched end tag");
                return nullptr;
            }
            skip_whitespace(xml);
            if (**xml != '>') {
                ctx.fail("malformed end tag");
                return nullptr;
            }
            (*xml)++;

            // whitespace between elements is layout, not content, except in text holders
            bool blank = true;
            for (char c : text) {
                if (!isspace((unsigned char)c)) {
                    blank = false;
                    break;
                }
            }
            if (!blank || elem->tag == "t") elem->text = std::move(text);
            close_scope();
            return elem;
        }
        if (strncmp(*xml, "<![CDATA[", 9) == 0) {
            const char* end = strstr(*xml + 9, "]]>");
            if (!end) {
                ctx.fail("unterminated CDATA section");
                return nullptr;
            }
            text.append(*xml + 9, (size_t)(end - (*xml + 9)));
            *xml = end + 3;
            continue;
        }
        if ((*xml)[1] == '!' || (*xml)[1] == '?') {
            if (!skip_markup(ctx, xml)) return nullptr;
            continue;
        }
        auto child = parse_element(ctx, xml, depth + 1);
        if (!child) return nullptr;
        elem->append_child(std::move(child));
    }

    ctx.fail("unexpected end of input");
    return nullptr;
}

std::unique_ptr<OmmlElement> read_omml_xml(const std::string& xml, std::string* error) {
    XmlReadContext ctx;
    const char* cursor = xml.c_str();

    // prolog: declaration, comments, doctype
    while (true) {
        skip_whitespace(&cursor);
        if (cursor[0] == '<' && (cursor[1] == '?' || cursor[1] == '!')) {
            if (!skip_markup(ctx, &cursor)) break;
            continue;
        }
        break;
    }

    std::unique_ptr<OmmlElement> root;
    if (ctx.error.empty()) {
        if (*cursor != '<') {
            ctx.fail("no root element");
        } else {
            root = parse_element(ctx, &cursor, 0);
        }
    }

    if (!root) {
        log_warn("omml: xml read failed at offset %zu: %s",
                 (size_t)(cursor - xml.c_str()), ctx.error.c_str());
        if (error) *error = ctx.error;
        return nullptr;
    }
    log_debug("omml: read root <%s:%s>", root->prefix.c_str(), root->tag.c_str());
    return root;
}

std::vector<OmmlFormulaRef> find_omml_formulas(const OmmlElement* root) {
    std::vector<OmmlFormulaRef> formulas;
    if (!root) return formulas;

    struct Pending {
        const OmmlElement* elem;
        bool in_para;
    };
    std::vector<Pending> stack;
    stack.push_back(Pending{root, false});

    while (!stack.empty()) {
        Pending cur = stack.back();
        stack.pop_back();

        if (cur.elem->is_math("oMath")) {
            formulas.push_back(OmmlFormulaRef{cur.elem, cur.in_para});
            continue;
        }
        bool in_para = cur.in_para || cur.elem->is_math("oMathPara");
        for (auto it = cur.elem->children.rbegin(); it != cur.elem->children.rend(); ++it) {
            stack.push_back(Pending{it->get(), in_para});
        }
    }

    log_debug("omml: found %zu formulas", formulas.size());
    return formulas;
}

} // namespace docx2tex
