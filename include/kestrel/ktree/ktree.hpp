#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/core/vfs.hpp"
#include "kestrel/ktree/xml.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace kestrel {

/**
 * @brief Anything that can hand out the KTreeSerializer to use
 *
 * Views implements it so scene files resolve registered custom views.
 */
class KTreeSerializerHolder {
public:
    virtual ~KTreeSerializerHolder() = default;
    virtual KTreeSerializer& serializer() = 0;
};

/**
 * @brief Converts between KTree XML documents and view trees
 *
 * Built-in nodes are solidrect, ellipse, container and image. Other node
 * names are offered to the registered deserializers in registration
 * order.
 *
 * Usage:
 * @code
 * KTreeSerializer serializer;
 * serializer.registerType(
 *     [](const Xml& xml) -> ViewPtr {
 *         if (xml.nameLC() != "marker") return nullptr;
 *         return std::make_unique<Marker>();
 *     },
 *     [](View& view, const KTreeSerializer::Properties& props) -> std::optional<Xml> {
 *         if (!dynamic_cast<Marker*>(&view)) return std::nullopt;
 *         return Xml::node("marker", props);
 *     });
 *
 * ViewPtr root = serializer.ktreeToViewTree(Xml::parse(text), VfsFile::memory());
 * Xml xml = serializer.viewTreeToKTree(*root, VfsFile::memory());
 * @endcode
 */
class KTreeSerializer : public KTreeSerializerHolder {
public:
    /// Ordered attribute name -> formatted value
    using Properties = Xml::Attributes;

    /// Returns a new view for the node, or nullptr if the node is not handled
    using Deserializer = std::function<ViewPtr(const Xml&)>;

    /// Returns the node for the view, or std::nullopt if the view is not handled
    using Serializer = std::function<std::optional<Xml>(View&, const Properties&)>;

    KTreeSerializer() = default;

    KTreeSerializer(const KTreeSerializer&) = delete;
    KTreeSerializer& operator=(const KTreeSerializer&) = delete;

    KTreeSerializer& serializer() override { return *this; }

    void registerType(Deserializer deserializer, Serializer serializer);

    size_t registrationCount() const { return registrations_.size(); }

    /**
     * @brief Build a view tree from a KTree node
     *
     * Image nodes load their sourceImage relative to @p currentVfs.
     * @throws std::runtime_error for a node nothing can deserialize
     */
    virtual ViewPtr ktreeToViewTree(const Xml& xml, const VfsFile& currentVfs);

    /**
     * @brief Build a KTree node from a view tree
     *
     * Only properties that differ from their defaults are written, except
     * the size of rectangles which is always written.
     * @throws std::runtime_error for a view nothing can serialize
     */
    virtual Xml viewTreeToKTree(View& view, const VfsFile& currentVfs);

private:
    struct Registration {
        Deserializer deserializer;
        Serializer serializer;
    };

    ViewPtr createView(const Xml& xml, const VfsFile& currentVfs);
    void readProperties(View& view, const Xml& xml);
    Properties collectProperties(View& view);

    std::vector<Registration> registrations_;
};

// Free helpers

ViewPtr ktreeToViewTree(const Xml& xml, Views& views);
Xml viewTreeToKTree(View& view, Views& views);

ViewPtr ktreeToViewTree(const Xml& xml, KTreeSerializerHolder& holder, const VfsFile& currentVfs);
Xml viewTreeToKTree(View& view, KTreeSerializerHolder& holder, const VfsFile& currentVfs);

/// Parse @p file and build its view tree; relative image paths resolve against the file's directory
ViewPtr readKTree(const VfsFile& file, KTreeSerializerHolder& holder);

/// Serialize @p view and write it to @p file
void writeKTree(const VfsFile& file, View& view, KTreeSerializerHolder& holder);

} // namespace kestrel
