#include "kestrel/ktree/xml.hpp"
#include "kestrel/core/logging.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <memory>
#include <stdexcept>

namespace kestrel {

namespace {

struct XmlParserCtxtDeleter {
    void operator()(xmlParserCtxt* ctxt) const { xmlFreeParserCtxt(ctxt); }
};

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlBufferDeleter {
    void operator()(xmlBuffer* buffer) const { xmlBufferFree(buffer); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* str) const { xmlFree(str); }
};

using XmlParserCtxtPtr = std::unique_ptr<xmlParserCtxt, XmlParserCtxtDeleter>;
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlBufferPtr = std::unique_ptr<xmlBuffer, XmlBufferDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string toLower(std::string_view str) {
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

const xmlChar* xc(const std::string& str) {
    return reinterpret_cast<const xmlChar*>(str.c_str());
}

std::string fromXmlChar(const xmlChar* str) {
    return str ? std::string(reinterpret_cast<const char*>(str)) : std::string();
}

std::string trim(std::string_view str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return std::string(str.substr(begin, end - begin));
}

void appendChildren(Xml& out, const xmlNode* first);

Xml convertElement(const xmlNode* node) {
    Xml out = Xml::node(fromXmlChar(node->name));
    for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
        XmlCharPtr value(xmlNodeListGetString(node->doc, attr->children, 1));
        out.setAttribute(fromXmlChar(attr->name), fromXmlChar(value.get()));
    }
    appendChildren(out, node->children);
    return out;
}

void appendChildren(Xml& out, const xmlNode* first) {
    for (const xmlNode* child = first; child; child = child->next) {
        switch (child->type) {
            case XML_ELEMENT_NODE:
                out.addChild(convertElement(child));
                break;
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                out.addChild(Xml::text(fromXmlChar(child->content)));
                break;
            case XML_COMMENT_NODE:
                out.addChild(Xml::comment(fromXmlChar(child->content)));
                break;
            default:
                break;
        }
    }
}

xmlNode* buildNode(xmlDoc* doc, const Xml& xml) {
    switch (xml.type()) {
        case Xml::Type::Text:
            return xmlNewDocText(doc, xc(xml.content()));
        case Xml::Type::Comment:
            return xmlNewDocComment(doc, xc(xml.content()));
        case Xml::Type::Node:
        default: {
            xmlNode* node = xmlNewDocNode(doc, nullptr, xc(xml.name()), nullptr);
            if (!node) {
                throw std::runtime_error("libxml2: cannot create element <" + xml.name() + ">");
            }
            for (const auto& [name, value] : xml.attributes()) {
                xmlNewProp(node, xc(name), xc(value));
            }
            for (const Xml& child : xml.children()) {
                xmlAddChild(node, buildNode(doc, child));
            }
            return node;
        }
    }
}

} // namespace

Xml::Xml(Type type, std::string name, std::string content)
    : type_(type)
    , name_(std::move(name))
    , content_(std::move(content)) {
}

Xml Xml::node(std::string name, Attributes attributes, std::vector<Xml> children) {
    Xml xml(Type::Node, std::move(name), {});
    for (auto& [key, value] : attributes) {
        xml.setAttribute(std::move(key), std::move(value));
    }
    xml.children_ = std::move(children);
    return xml;
}

Xml Xml::text(std::string content) {
    return Xml(Type::Text, {}, std::move(content));
}

Xml Xml::comment(std::string content) {
    return Xml(Type::Comment, {}, std::move(content));
}

Xml Xml::parse(std::string_view text, size_t maxBytes) {
    size_t limit = std::min(maxBytes, MAX_PARSE_BYTES);
    if (text.size() > limit) {
        throw std::runtime_error("Failed to parse XML: document of " + std::to_string(text.size()) +
            " bytes exceeds the limit of " + std::to_string(limit));
    }
    if (text.empty()) {
        throw std::runtime_error("Failed to parse XML: document is empty");
    }

    XmlParserCtxtPtr ctxt(xmlNewParserCtxt());
    if (!ctxt) {
        throw std::runtime_error("Failed to parse XML: cannot create parser context");
    }
    XmlDocPtr doc(xmlCtxtReadMemory(ctxt.get(), text.data(), static_cast<int>(text.size()), "ktree.xml", nullptr,
                                    XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        const xmlError* error = xmlCtxtGetLastError(ctxt.get());
        if (!error || !error->message) {
            throw std::runtime_error("Failed to parse XML: unknown error");
        }
        throw std::runtime_error("Failed to parse XML: " + trim(error->message) +
            " (line " + std::to_string(error->line) + ")");
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        throw std::runtime_error("Failed to parse XML: document has no root element");
    }
    return convertElement(root);
}

std::string Xml::nameLC() const {
    return toLower(name_);
}

std::string Xml::textContent() const {
    if (type_ == Type::Text) {
        return content_;
    }
    std::string out;
    for (const Xml& child : children_) {
        if (child.type_ != Type::Comment) {
            out += child.textContent();
        }
    }
    return out;
}

std::vector<const Xml*> Xml::allNodeChildren() const {
    std::vector<const Xml*> out;
    for (const Xml& child : children_) {
        if (child.isNode()) {
            out.push_back(&child);
        }
    }
    return out;
}

bool Xml::hasAttribute(std::string_view name) const {
    return strNull(name).has_value();
}

std::optional<std::string> Xml::strNull(std::string_view name) const {
    for (const auto& [key, value] : attributes_) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string Xml::str(std::string_view name, const std::string& defaultValue) const {
    auto value = strNull(name);
    return value ? *value : defaultValue;
}

double Xml::double_(std::string_view name, double defaultValue) const {
    auto value = strNull(name);
    if (!value) {
        return defaultValue;
    }
    std::string trimmed = trim(*value);
    if (trimmed.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    double result = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) {
        KESTREL_WARN(LogCategory::Scene, "Attribute " + std::string(name) + "='" + *value +
            "' of <" + name_ + "> is not a number");
        return defaultValue;
    }
    return result;
}

int Xml::int_(std::string_view name, int defaultValue) const {
    double value = double_(name, static_cast<double>(defaultValue));
    // NaN fails both comparisons
    if (!(value > static_cast<double>(std::numeric_limits<int>::min()) - 1.0 &&
          value < static_cast<double>(std::numeric_limits<int>::max()) + 1.0)) {
        KESTREL_WARN(LogCategory::Scene, "Attribute " + std::string(name) + " of <" + name_ +
            "> is out of integer range");
        return defaultValue;
    }
    return static_cast<int>(value);
}

Xml& Xml::setAttribute(std::string name, std::string value) {
    for (auto& [key, existing] : attributes_) {
        if (equalsIgnoreCase(key, name)) {
            existing = std::move(value);
            return *this;
        }
    }
    attributes_.emplace_back(std::move(name), std::move(value));
    return *this;
}

Xml& Xml::addChild(Xml child) {
    children_.push_back(std::move(child));
    return *this;
}

std::string Xml::toXmlString(bool pretty) const {
    XmlDocPtr doc(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0")));
    if (!doc) {
        throw std::runtime_error("libxml2: cannot create document");
    }
    xmlNode* root = buildNode(doc.get(), *this);
    xmlDocSetRootElement(doc.get(), root);

    XmlBufferPtr buffer(xmlBufferCreate());
    if (!buffer) {
        throw std::runtime_error("libxml2: cannot create output buffer");
    }
    if (xmlNodeDump(buffer.get(), doc.get(), root, 0, pretty ? 1 : 0) < 0) {
        throw std::runtime_error("libxml2: cannot serialize <" + name_ + ">");
    }
    return fromXmlChar(xmlBufferContent(buffer.get()));
}

std::string Xml::formatNumber(double value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (result.ec != std::errc()) {
        throw std::runtime_error("Cannot format number");
    }
    return std::string(buffer, result.ptr);
}

} // namespace kestrel
