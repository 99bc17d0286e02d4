#pragma once

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kestrel {

/**
 * @brief Small immutable-ish XML DOM used for KTree documents
 *
 * Parsing and writing go through libxml2. Attribute names are matched
 * case-insensitively; their order is preserved.
 *
 * Usage:
 * @code
 * Xml xml = Xml::parse("<container><solidrect x='10' width='20'/></container>");
 * for (const Xml* child : xml.allNodeChildren()) {
 *     double x = child->double_("x", 0.0);
 * }
 *
 * Xml out = Xml::node("solidrect", {{"x", Xml::formatNumber(10.0)}});
 * std::string text = out.toXmlString();
 * @endcode
 */
class Xml {
public:
    enum class Type {
        Node,
        Text,
        Comment
    };

    using Attributes = std::vector<std::pair<std::string, std::string>>;

    static Xml node(std::string name, Attributes attributes = {}, std::vector<Xml> children = {});
    static Xml text(std::string content);
    static Xml comment(std::string content);

    /// Largest document parse() accepts by default
    static constexpr size_t MAX_PARSE_BYTES = static_cast<size_t>(std::numeric_limits<int>::max());

    /// @throws std::runtime_error on malformed input or input longer than @p maxBytes
    static Xml parse(std::string_view text, size_t maxBytes = MAX_PARSE_BYTES);

    Type type() const { return type_; }
    bool isNode() const { return type_ == Type::Node; }

    const std::string& name() const { return name_; }
    std::string nameLC() const;

    /// Text of a Text or Comment node
    const std::string& content() const { return content_; }

    /// Concatenated text of this node and its descendants
    std::string textContent() const;

    const Attributes& attributes() const { return attributes_; }
    const std::vector<Xml>& children() const { return children_; }

    /// Element children only (text and comments skipped)
    std::vector<const Xml*> allNodeChildren() const;

    bool hasAttribute(std::string_view name) const;

    /// Attribute value, or std::nullopt if absent
    std::optional<std::string> strNull(std::string_view name) const;
    std::string str(std::string_view name, const std::string& defaultValue = {}) const;

    /// Numeric attribute; absent or unparsable values give @p defaultValue
    double double_(std::string_view name, double defaultValue) const;
    /// Truncated toward zero; values outside the int range give @p defaultValue
    int int_(std::string_view name, int defaultValue) const;

    /// Set (or replace) an attribute
    Xml& setAttribute(std::string name, std::string value);

    Xml& addChild(Xml child);

    /// Serialize with libxml2 (no XML declaration)
    std::string toXmlString(bool pretty = false) const;

    /// Shortest decimal text that reads back to the same double
    static std::string formatNumber(double value);

private:
    Xml(Type type, std::string name, std::string content);

    Type type_;
    std::string name_;
    std::string content_;
    Attributes attributes_;
    std::vector<Xml> children_;
};

} // namespace kestrel
