/**
 * @file test_ktree.cpp
 * @brief KTree tests - XML DOM, scene deserialization and serialization
 */

#include <kestrel/kestrel.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kestrel;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

std::string ppmRedBlue() {
    std::string bytes = "P6\n2 1\n255\n";
    for (unsigned char v : {255, 0, 0, 0, 0, 255}) {
        bytes.push_back(static_cast<char>(v));
    }
    return bytes;
}

/// Custom view handled through a serializer registration
class Marker : public RectBase {
public:
    Marker() : RectBase(8, 8) {}
    const char* typeName() const override { return "Marker"; }

    std::string label;
};

/// View type nothing knows how to serialize
class Plain : public View {};

void registerMarker(KTreeSerializer& serializer) {
    serializer.registerType(
        [](const Xml& xml) -> ViewPtr {
            if (xml.nameLC() != "marker") {
                return nullptr;
            }
            auto marker = std::make_unique<Marker>();
            marker->label = xml.str("label", "none");
            return marker;
        },
        [](View& view, const KTreeSerializer::Properties& props) -> std::optional<Xml> {
            auto* marker = dynamic_cast<Marker*>(&view);
            if (!marker) {
                return std::nullopt;
            }
            Xml xml = Xml::node("marker", props);
            xml.setAttribute("label", marker->label);
            return xml;
        });
}

struct CapturedLog {
    std::vector<std::string> warnings;

    CapturedLog() {
        Logger::global().setSink([this](LogLevel level, LogCategory category, std::string_view message) {
            if (level == LogLevel::Warning && category == LogCategory::Scene) {
                warnings.emplace_back(message);
            }
        });
    }

    ~CapturedLog() {
        Logger::global().setSink(nullptr);
    }
};

} // namespace

// ============================================================================
// Xml
// ============================================================================

void test_xml_parse() {
    std::cout << "Testing: XML parsing and attribute lookup... ";

    Xml xml = Xml::parse(
        "<Container Name='root'>\n"
        "  <!-- note -->\n"
        "  <SolidRect X='10' width=' 20 ' height='abc'/>\n"
        "  hello\n"
        "</Container>");

    assert(xml.isNode());
    assert(xml.name() == "Container");
    assert(xml.nameLC() == "container");
    assert(xml.str("name") == "root");
    assert(xml.strNull("NAME") == std::optional<std::string>("root"));
    assert(!xml.strNull("missing"));
    assert(xml.str("missing", "fallback") == "fallback");

    std::vector<const Xml*> nodes = xml.allNodeChildren();
    assert(nodes.size() == 1);
    assert(xml.children().size() > nodes.size());
    assert(contains(xml.textContent(), "hello"));

    const Xml& rect = *nodes[0];
    assert(rect.hasAttribute("x"));
    assert(rect.double_("x", 0.0) == 10.0);
    assert(rect.double_("width", 0.0) == 20.0);
    assert(rect.int_("x", 0) == 10);
    assert(rect.double_("missing", 3.5) == 3.5);
    {
        CapturedLog log;
        assert(rect.double_("height", 7.0) == 7.0);
        assert(log.warnings.size() == 1);
        assert(contains(log.warnings[0], "height"));
    }

    bool thrown = false;
    try {
        Xml::parse("<a><b></a>");
    } catch (const std::runtime_error& e) {
        thrown = contains(e.what(), "Failed to parse XML");
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

void test_xml_parse_errors() {
    std::cout << "Testing: XML parse errors and integer range... ";

    auto parseError = [](std::string_view text, size_t maxBytes) {
        try {
            Xml::parse(text, maxBytes);
        } catch (const std::runtime_error& e) {
            return std::string(e.what());
        }
        return std::string();
    };

    std::string malformed = parseError("<a>\n<b></a>", Xml::MAX_PARSE_BYTES);
    assert(contains(malformed, "Failed to parse XML"));
    assert(!contains(malformed, "unknown error"));
    assert(contains(malformed, "line 2"));

    std::string empty = parseError("", Xml::MAX_PARSE_BYTES);
    assert(contains(empty, "empty"));
    assert(!contains(empty, "unknown error"));

    assert(contains(parseError("<a/>", 3), "exceeds the limit of 3"));
    assert(Xml::parse("<a/>", 4).name() == "a");

    Xml xml = Xml::parse("<a big='1e300' small='-1e300' bad='nan' neg='-5.7' edge='2147483647'/>");
    {
        CapturedLog log;
        assert(xml.int_("big", 7) == 7);
        assert(xml.int_("small", 7) == 7);
        assert(xml.int_("bad", 7) == 7);
        assert(log.warnings.size() == 3);
    }
    assert(xml.int_("neg", 0) == -5);
    assert(xml.int_("edge", 0) == 2147483647);

    std::cout << "PASSED\n";
}

void test_xml_write() {
    std::cout << "Testing: XML building and writing... ";

    Xml xml = Xml::node("container", {{"name", "root"}});
    xml.addChild(Xml::node("solidrect", {{"x", "10"}, {"width", "20"}}));
    xml.setAttribute("NAME", "renamed");
    assert(xml.attributes().size() == 1);
    assert(xml.str("name") == "renamed");

    assert(xml.toXmlString() ==
        "<container name=\"renamed\"><solidrect x=\"10\" width=\"20\"/></container>");

    std::string pretty = xml.toXmlString(true);
    assert(contains(pretty, "\n"));
    assert(Xml::parse(pretty).allNodeChildren().size() == 1);

    // Special characters are escaped and survive a parse
    Xml quoted = Xml::node("solidrect", {{"name", "a<b & \"c\""}});
    assert(Xml::parse(quoted.toXmlString()).str("name") == "a<b & \"c\"");

    assert(Xml::formatNumber(10.0) == "10");
    assert(Xml::formatNumber(0.1) == "0.1");
    assert(Xml::formatNumber(-2.5) == "-2.5");

    std::cout << "PASSED\n";
}

// ============================================================================
// Deserialization
// ============================================================================

void test_builtin_defaults() {
    std::cout << "Testing: Built-in nodes and property defaults... ";

    KTreeSerializer serializer;
    VfsFile vfs = VfsFile::memory();

    ViewPtr rectView = serializer.ktreeToViewTree(Xml::parse("<SolidRect/>"), vfs);
    auto* rect = dynamic_cast<SolidRect*>(rectView.get());
    assert(rect != nullptr);
    // colorMul defaults to white, replacing the constructor color
    assert(rect->colorMul() == Colors::WHITE);
    assert(rect->width() == 100.0 && rect->height() == 100.0);
    assert(rect->alpha() == 1.0 && rect->speed() == 1.0 && rect->ratio() == 0.0);
    assert(rect->scaleX() == 1.0 && rect->scaleY() == 1.0);
    assert(!rect->name());

    ViewPtr ellipseView = serializer.ktreeToViewTree(Xml::parse("<ellipse width='30'/>"), vfs);
    auto* ellipse = dynamic_cast<Ellipse*>(ellipseView.get());
    assert(ellipse != nullptr);
    assert(ellipse->color() == Colors::RED);
    assert(ellipse->width() == 30.0 && ellipse->height() == 100.0);

    ViewPtr full = serializer.ktreeToViewTree(Xml::parse(
        "<solidrect name='r' colorMul='#00ff00' alpha='0.5' speed='2' ratio='0.25' x='10' y='20' "
        "rotationDegrees='45' scaleX='3' scaleY='4' skewX='0.1' skewY='0.2' "
        "anchorX='0.5' anchorY='1' width='64' height='32'/>"), vfs);
    auto* r = dynamic_cast<SolidRect*>(full.get());
    assert(r->name() == std::optional<std::string>("r"));
    assert(r->colorMul() == RGBA(0, 255, 0, 255));
    assert(r->alpha() == 0.5 && r->speed() == 2.0 && r->ratio() == 0.25);
    assert(r->x() == 10.0 && r->y() == 20.0);
    assert(near(r->rotationDegrees(), 45.0));
    assert(r->scaleX() == 3.0 && r->scaleY() == 4.0);
    assert(r->skewX() == 0.1 && r->skewY() == 0.2);
    assert(r->anchorX() == 0.5 && r->anchorY() == 1.0);
    assert(r->width() == 64.0 && r->height() == 32.0);

    bool thrown = false;
    try {
        serializer.ktreeToViewTree(Xml::parse("<solidrect colorMul='nope'/>"), vfs);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

void test_container_tree() {
    std::cout << "Testing: Containers build their children in order... ";

    KTreeSerializer serializer;
    ViewPtr root = serializer.ktreeToViewTree(Xml::parse(
        "<container name='root' x='5'>"
        "  <solidrect name='a'/>"
        "  <!-- skipped -->"
        "  <container name='inner'><ellipse name='b'/></container>"
        "</container>"), VfsFile::memory());

    auto* container = dynamic_cast<Container*>(root.get());
    assert(container != nullptr);
    assert(container->x() == 5.0);
    assert(container->numChildren() == 2);
    assert(container->getChildAt(0).name() == std::optional<std::string>("a"));
    assert(container->getChildAt(0).parent() == container);

    auto& inner = dynamic_cast<Container&>(container->getChildAt(1));
    assert(inner.numChildren() == 1);
    assert(std::string(inner.getChildAt(0).typeName()) == "Ellipse");

    std::cout << "PASSED\n";
}

void test_unsupported_node() {
    std::cout << "Testing: Unknown nodes and views throw... ";

    KTreeSerializer serializer;
    bool thrown = false;
    try {
        serializer.ktreeToViewTree(Xml::parse("<container><Sprite/></container>"), VfsFile::memory());
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "Unsupported node Sprite";
    }
    assert(thrown);

    thrown = false;
    Plain plain;
    try {
        serializer.viewTreeToKTree(plain, VfsFile::memory());
    } catch (const std::runtime_error& e) {
        thrown = contains(e.what(), "Don't know how to serialize View");
    }
    assert(thrown);

    thrown = false;
    try {
        serializer.registerType(nullptr, nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    assert(serializer.registrationCount() == 0);

    std::cout << "PASSED\n";
}

void test_image_source() {
    std::cout << "Testing: Image nodes load their source relative to the VFS... ";

    VfsFile root = VfsFile::memory();
    root["scenes/images/rb.ppm"].writeString(ppmRedBlue());

    KTreeSerializer serializer;
    ViewPtr view = serializer.ktreeToViewTree(
        Xml::parse("<image sourceImage='images/rb.ppm' width='2' height='1'/>"), root["scenes"]);
    auto* image = dynamic_cast<Image*>(view.get());
    assert(image != nullptr);
    assert(image->sourceImage() == std::optional<std::string>("images/rb.ppm"));
    assert(image->bitmap().width() == 2 && image->bitmap().height() == 1);
    assert(image->bitmap().bmp()->get(0, 0) == Colors::RED);
    assert(image->bitmap().bmp()->get(1, 0) == Colors::BLUE);
    assert(image->width() == 2.0);

    // Size attributes default like any rectangle
    ViewPtr sized = serializer.ktreeToViewTree(Xml::parse("<image sourceImage='images/rb.ppm'/>"), root["scenes"]);
    assert(dynamic_cast<Image&>(*sized).width() == 100.0);

    CapturedLog log;
    ViewPtr missing = serializer.ktreeToViewTree(Xml::parse("<image sourceImage='nope.png'/>"), root);
    auto& broken = dynamic_cast<Image&>(*missing);
    assert(broken.bitmap().bmp()->get(0, 0) == Colors::TRANSPARENT_BLACK);
    assert(broken.sourceImage() == std::optional<std::string>("nope.png"));
    assert(log.warnings.size() == 1);
    assert(contains(log.warnings[0], "nope.png"));

    ViewPtr none = serializer.ktreeToViewTree(Xml::parse("<image/>"), root);
    assert(!dynamic_cast<Image&>(*none).sourceImage());

    std::cout << "PASSED\n";
}

// ============================================================================
// Serialization
// ============================================================================

void test_serialize_non_defaults() {
    std::cout << "Testing: Only non-default properties are written... ";

    KTreeSerializer serializer;
    VfsFile vfs = VfsFile::memory();

    SolidRect plainRect(100, 100);
    assert(serializer.viewTreeToKTree(plainRect, vfs).toXmlString() ==
        "<solidrect width=\"100\" height=\"100\"/>");

    SolidRect rect(64, 32, Colors::RED);
    rect.xy(10, 0);
    rect.anchor(0.5, 0);
    rect.setAlpha(0.25);
    rect.setName(std::string("r"));
    assert(serializer.viewTreeToKTree(rect, vfs).toXmlString() ==
        "<solidrect name=\"r\" colorMul=\"#ff0000ff\" alpha=\"0.25\" x=\"10\" anchorX=\"0.5\" "
        "width=\"64\" height=\"32\"/>");

    Ellipse ellipse(5, 10);
    assert(serializer.viewTreeToKTree(ellipse, vfs).toXmlString() ==
        "<ellipse width=\"10\" height=\"20\"/>");

    Image image(Bitmap32::create(4, 4));
    image.setSourceImage(std::string("a.png"));
    assert(serializer.viewTreeToKTree(image, vfs).toXmlString() ==
        "<image width=\"4\" height=\"4\" sourceImage=\"a.png\"/>");

    Container container;
    container.setSpeed(2);
    container.add<SolidRect>(1, 2);
    container.add<Container>().setName(std::string("empty"));
    assert(serializer.viewTreeToKTree(container, vfs).toXmlString() ==
        "<container speed=\"2\"><solidrect width=\"1\" height=\"2\"/><container name=\"empty\"/></container>");

    std::cout << "PASSED\n";
}

void test_round_trip() {
    std::cout << "Testing: Scene round trip keeps properties... ";

    KTreeSerializer serializer;
    VfsFile vfs = VfsFile::memory();
    std::string text =
        "<container name=\"root\"><solidrect colorMul=\"#0000ff80\" x=\"1.5\" y=\"-2\" scaleX=\"2\" "
        "width=\"10\" height=\"20\"/><ellipse skewY=\"0.3\" width=\"100\" height=\"100\"/></container>";

    ViewPtr view = serializer.ktreeToViewTree(Xml::parse(text), vfs);
    Xml out = serializer.viewTreeToKTree(*view, vfs);
    assert(out.toXmlString() == text);

    std::cout << "PASSED\n";
}

void test_custom_registrations() {
    std::cout << "Testing: Custom registrations... ";

    KTreeSerializer serializer;
    registerMarker(serializer);
    assert(serializer.registrationCount() == 1);

    VfsFile vfs = VfsFile::memory();
    ViewPtr view = serializer.ktreeToViewTree(
        Xml::parse("<container><Marker label='start' x='3'/></container>"), vfs);
    auto& marker = dynamic_cast<Marker&>(dynamic_cast<Container&>(*view).getChildAt(0));
    assert(marker.label == "start");
    assert(marker.x() == 3.0);
    assert(marker.width() == 100.0);

    assert(serializer.viewTreeToKTree(*view, vfs).toXmlString() ==
        "<container><marker x=\"3\" width=\"100\" height=\"100\" label=\"start\"/></container>");

    // The first registration returning a node wins, ahead of the built-ins
    int secondCalls = 0;
    serializer.registerType(
        [](const Xml&) -> ViewPtr { return nullptr; },
        [](View& v, const KTreeSerializer::Properties& props) -> std::optional<Xml> {
            if (!dynamic_cast<SolidRect*>(&v)) {
                return std::nullopt;
            }
            return Xml::node("box", props);
        });
    serializer.registerType(
        [](const Xml&) -> ViewPtr { return nullptr; },
        [&secondCalls](View&, const KTreeSerializer::Properties&) -> std::optional<Xml> {
            secondCalls++;
            return Xml::node("never");
        });

    SolidRect rect(1, 1);
    assert(serializer.viewTreeToKTree(rect, vfs).name() == "box");
    assert(secondCalls == 0);
    assert(serializer.viewTreeToKTree(marker, vfs).name() == "marker");

    // Built-in names are never offered to registrations
    ViewPtr builtin = serializer.ktreeToViewTree(Xml::parse("<solidrect/>"), vfs);
    assert(dynamic_cast<SolidRect*>(builtin.get()) != nullptr);

    std::cout << "PASSED\n";
}

void test_views_helpers() {
    std::cout << "Testing: Reading and writing scene files... ";

    LogAG ag;
    ViewsConfig config;
    config.vfs = VfsFile::memory();
    Views views(ag, config);
    registerMarker(views.serializer());

    VfsFile root = views.currentVfs();
    root["levels/art/rb.ppm"].writeString(ppmRedBlue());
    root["levels/one.ktree"].writeString(
        "<container name='level'>"
        "<image sourceImage='art/rb.ppm' width='2' height='1'/>"
        "<marker label='spawn'/>"
        "</container>");

    ViewPtr level = readKTree(root["levels/one.ktree"], views);
    auto& container = dynamic_cast<Container&>(*level);
    assert(container.numChildren() == 2);
    auto& image = dynamic_cast<Image&>(container.getChildAt(0));
    assert(image.bitmap().bmp()->get(1, 0) == Colors::BLUE);
    assert(dynamic_cast<Marker&>(container.getChildAt(1)).label == "spawn");

    writeKTree(root["out/level.ktree"], *level, views);
    std::string written = root["out/level.ktree"].readString();
    assert(contains(written, "sourceImage=\"art/rb.ppm\""));
    assert(contains(written, "label=\"spawn\""));

    Xml again = Xml::parse(written);
    assert(again.allNodeChildren().size() == 2);

    // Free helpers against the views VFS and serializer
    ViewPtr marker = ktreeToViewTree(Xml::parse("<marker label='x'/>"), views);
    assert(viewTreeToKTree(*marker, views).str("label") == "x");
    assert(ktreeToViewTree(Xml::parse("<container/>"), views, root)->typeName() == std::string("Container"));

    views.stage().addChild(std::move(level));
    views.frame(0.016);
    assert(ag.drawCount() >= 1);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "Kestrel - KTree Tests\n";
    std::cout << "========================================\n\n";

    try {
        test_xml_parse();
        test_xml_parse_errors();
        test_xml_write();
        test_builtin_defaults();
        test_container_tree();
        test_unsupported_node();
        test_image_source();
        test_serialize_non_defaults();
        test_round_trip();
        test_custom_registrations();
        test_views_helpers();

        std::cout << "\n========================================\n";
        std::cout << "All KTree tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTest FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
