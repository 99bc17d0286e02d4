#include "kestrel/ktree/ktree.hpp"
#include "kestrel/core/logging.hpp"
#include "kestrel/image/bitmap.hpp"
#include "kestrel/view/container.hpp"
#include "kestrel/view/ellipse.hpp"
#include "kestrel/view/image.hpp"
#include "kestrel/view/rect_base.hpp"
#include "kestrel/view/views.hpp"

#include <stdexcept>

namespace kestrel {

void KTreeSerializer::registerType(Deserializer deserializer, Serializer serializer) {
    if (!deserializer || !serializer) {
        throw std::invalid_argument("KTreeSerializer::registerType: both functions are required");
    }
    registrations_.push_back({std::move(deserializer), std::move(serializer)});
}

// ============================================================================
// Deserialization
// ============================================================================

ViewPtr KTreeSerializer::createView(const Xml& xml, const VfsFile& currentVfs) {
    std::string name = xml.nameLC();

    if (name == "solidrect") {
        return std::make_unique<SolidRect>(100.0, 100.0, Colors::RED);
    }
    if (name == "ellipse") {
        return std::make_unique<Ellipse>(50.0, 50.0, Colors::RED);
    }
    if (name == "container") {
        return std::make_unique<Container>();
    }
    if (name == "image") {
        auto image = std::make_unique<Image>(Bitmaps::transparent());
        image->forceLoadSourceImage(currentVfs, xml.strNull("sourceImage"));
        return image;
    }

    for (const auto& registration : registrations_) {
        ViewPtr view = registration.deserializer(xml);
        if (view) {
            return view;
        }
    }
    throw std::runtime_error("Unsupported node " + xml.name());
}

void KTreeSerializer::readProperties(View& view, const Xml& xml) {
    view.setName(xml.strNull("name"));
    view.setColorMul(Colors::get(xml.strNull("colorMul").value_or(Colors::WHITE.hexString())));
    view.setAlpha(xml.double_("alpha", 1.0));
    view.setSpeed(xml.double_("speed", 1.0));
    view.setRatio(xml.double_("ratio", 0.0));
    view.setX(xml.double_("x", 0.0));
    view.setY(xml.double_("y", 0.0));
    view.setRotationDegrees(xml.double_("rotationDegrees", 0.0));
    view.setScaleX(xml.double_("scaleX", 1.0));
    view.setScaleY(xml.double_("scaleY", 1.0));
    view.setSkewX(xml.double_("skewX", 0.0));
    view.setSkewY(xml.double_("skewY", 0.0));

    if (auto* rect = dynamic_cast<RectBase*>(&view)) {
        rect->setAnchorX(xml.double_("anchorX", 0.0));
        rect->setAnchorY(xml.double_("anchorY", 0.0));
        rect->setWidth(xml.double_("width", 100.0));
        rect->setHeight(xml.double_("height", 100.0));
    }
}

ViewPtr KTreeSerializer::ktreeToViewTree(const Xml& xml, const VfsFile& currentVfs) {
    if (!xml.isNode()) {
        throw std::invalid_argument("ktreeToViewTree: expected an element node");
    }

    ViewPtr view = createView(xml, currentVfs);
    readProperties(*view, xml);

    if (auto* container = dynamic_cast<Container*>(view.get())) {
        for (const Xml* child : xml.allNodeChildren()) {
            container->addChild(ktreeToViewTree(*child, currentVfs));
        }
    }

    KESTREL_TRACE(LogCategory::Scene, std::string("ktree: <") + xml.name() + "> -> " + view->typeName());
    return view;
}

// ============================================================================
// Serialization
// ============================================================================

KTreeSerializer::Properties KTreeSerializer::collectProperties(View& view) {
    Properties props;
    auto add = [&props](const char* name, double value) {
        props.emplace_back(name, Xml::formatNumber(value));
    };

    if (view.name()) props.emplace_back("name", *view.name());
    if (view.colorMul() != Colors::WHITE) props.emplace_back("colorMul", view.colorMul().hexString());
    if (view.alpha() != 1.0) add("alpha", view.alpha());
    if (view.speed() != 1.0) add("speed", view.speed());
    if (view.ratio() != 0.0) add("ratio", view.ratio());
    if (view.x() != 0.0) add("x", view.x());
    if (view.y() != 0.0) add("y", view.y());
    if (view.rotationDegrees() != 0.0) add("rotationDegrees", view.rotationDegrees());
    if (view.scaleX() != 1.0) add("scaleX", view.scaleX());
    if (view.scaleY() != 1.0) add("scaleY", view.scaleY());
    if (view.skewX() != 0.0) add("skewX", view.skewX());
    if (view.skewY() != 0.0) add("skewY", view.skewY());

    if (auto* rect = dynamic_cast<RectBase*>(&view)) {
        if (rect->anchorX() != 0.0) add("anchorX", rect->anchorX());
        if (rect->anchorY() != 0.0) add("anchorY", rect->anchorY());
        add("width", rect->width());
        add("height", rect->height());
    }
    if (auto* image = dynamic_cast<Image*>(&view)) {
        if (image->sourceImage()) props.emplace_back("sourceImage", *image->sourceImage());
    }
    return props;
}

Xml KTreeSerializer::viewTreeToKTree(View& view, const VfsFile& currentVfs) {
    Properties props = collectProperties(view);

    for (const auto& registration : registrations_) {
        std::optional<Xml> xml = registration.serializer(view, props);
        if (xml) {
            return std::move(*xml);
        }
    }

    if (dynamic_cast<Image*>(&view)) {
        return Xml::node("image", std::move(props));
    }
    if (dynamic_cast<Ellipse*>(&view)) {
        return Xml::node("ellipse", std::move(props));
    }
    if (dynamic_cast<SolidRect*>(&view)) {
        return Xml::node("solidrect", std::move(props));
    }
    if (auto* container = dynamic_cast<Container*>(&view)) {
        Xml xml = Xml::node("container", std::move(props));
        container->forEachChildren([&](View& child) {
            xml.addChild(viewTreeToKTree(child, currentVfs));
        });
        return xml;
    }
    throw std::runtime_error(std::string("Don't know how to serialize ") + view.typeName());
}

// ============================================================================
// Free helpers
// ============================================================================

ViewPtr ktreeToViewTree(const Xml& xml, Views& views) {
    return views.serializer().ktreeToViewTree(xml, views.currentVfs());
}

Xml viewTreeToKTree(View& view, Views& views) {
    return views.serializer().viewTreeToKTree(view, views.currentVfs());
}

ViewPtr ktreeToViewTree(const Xml& xml, KTreeSerializerHolder& holder, const VfsFile& currentVfs) {
    return holder.serializer().ktreeToViewTree(xml, currentVfs);
}

Xml viewTreeToKTree(View& view, KTreeSerializerHolder& holder, const VfsFile& currentVfs) {
    return holder.serializer().viewTreeToKTree(view, currentVfs);
}

ViewPtr readKTree(const VfsFile& file, KTreeSerializerHolder& holder) {
    KESTREL_DEBUG(LogCategory::Scene, "Reading KTree " + file.path());
    return ktreeToViewTree(Xml::parse(file.readString()), holder, file.parent());
}

void writeKTree(const VfsFile& file, View& view, KTreeSerializerHolder& holder) {
    KESTREL_DEBUG(LogCategory::Scene, "Writing KTree " + file.path());
    file.writeString(viewTreeToKTree(view, holder, file.parent()).toXmlString(true));
}

} // namespace kestrel
