/**
 * @file test_math_image.cpp
 * @brief Math and image tests - matrices, colors, bitmaps and slices
 */

#include <kestrel/kestrel.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace kestrel;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

std::vector<uint8_t> ppm2x1() {
    std::string header = "P6\n2 1\n255\n";
    std::vector<uint8_t> bytes(header.begin(), header.end());
    // red, blue
    for (uint8_t v : {255, 0, 0, 0, 0, 255}) {
        bytes.push_back(v);
    }
    return bytes;
}

} // namespace

void test_matrix_transform() {
    std::cout << "Testing: Matrix transform and multiply... ";

    Matrix m;
    assert(m.isIdentity());

    m.scale(2.0, 3.0).translate(10.0, 20.0);
    Point p = m.transform(Point(1.0, 1.0));
    assert(near(p.x, 12.0));
    assert(near(p.y, 23.0));

    // multiply(l, r) applies l first
    Matrix t(1, 0, 0, 1, 5, 0);
    Matrix s(2, 0, 0, 2, 0, 0);
    Matrix out;
    out.multiply(t, s);
    assert(near(out.transformX(0, 0), 10.0));

    Matrix r;
    r.rotate(std::acos(-1.0) / 2.0);
    Point q = r.transform(Point(1.0, 0.0));
    assert(near(q.x, 0.0));
    assert(near(q.y, 1.0));

    std::cout << "PASSED\n";
}

void test_matrix_invert() {
    std::cout << "Testing: Matrix inversion... ";

    Matrix m;
    m.setTransform(10.0, 5.0, 2.0, 4.0, 0.3, 0.0, 0.0);
    Matrix inv = m.inverted();
    Matrix id;
    id.multiply(m, inv);
    assert(near(id.a, 1.0) && near(id.b, 0.0) && near(id.c, 0.0) && near(id.d, 1.0));
    assert(near(id.tx, 0.0) && near(id.ty, 0.0));

    bool thrown = false;
    try {
        Matrix(0, 0, 0, 0, 1, 1).inverted();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

void test_keep_matrix() {
    std::cout << "Testing: keepMatrix restores the matrix... ";

    Matrix m(1, 0, 0, 1, 3, 4);
    m.keepMatrix([&] { m.translate(100, 100); });
    assert(m == Matrix(1, 0, 0, 1, 3, 4));

    std::cout << "PASSED\n";
}

void test_ortho_projection() {
    std::cout << "Testing: Orthographic projection... ";

    Matrix3D proj(1.0f);
    setToOrtho(proj, Rectangle().setBounds(0, 0, 200, 100), -1.0f, 1.0f);
    glm::vec4 topLeft = proj * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    glm::vec4 bottomRight = proj * glm::vec4(200.0f, 100.0f, 0.0f, 1.0f);
    assert(near(topLeft.x, -1.0, 1e-5) && near(topLeft.y, 1.0, 1e-5));
    assert(near(bottomRight.x, 1.0, 1e-5) && near(bottomRight.y, -1.0, 1e-5));

    // Negative height flips
    setToOrtho(proj, Rectangle().setBounds(0, 100, 200, 0), -1.0f, 1.0f);
    glm::vec4 flipped = proj * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    assert(near(flipped.y, -1.0, 1e-5));

    std::cout << "PASSED\n";
}

void test_colors() {
    std::cout << "Testing: Color parsing and formatting... ";

    assert(Colors::get("#f00") == Colors::RED);
    assert(Colors::get("#FF0000") == Colors::RED);
    assert(Colors::get("#ff000080") == RGBA(255, 0, 0, 128));
    assert(Colors::get("RED") == Colors::RED);
    assert(Colors::get("white") == Colors::WHITE);
    assert(Colors::RED.hexString() == "#ff0000ff");
    assert(!Colors::getOrNull("not-a-color"));

    bool thrown = false;
    try {
        Colors::get("#12");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    assert(Colors::WHITE * Colors::RED == Colors::RED);
    assert((Colors::RED * RGBA(128, 128, 128, 255)) == RGBA(128, 0, 0, 255));
    assert(Colors::RED.withA(0).a() == 0);
    assert(Colors::WHITE.withAlphaFactor(0.5).a() == 128);

    std::cout << "PASSED\n";
}

void test_bitmap_versions() {
    std::cout << "Testing: Bitmap content versions... ";

    Bitmap32 bmp(4, 2, Colors::BLUE);
    assert(bmp.width() == 4 && bmp.height() == 2);
    assert(bmp.get(3, 1) == Colors::BLUE);

    uint64_t v0 = bmp.contentVersion();
    bmp.set(0, 0, Colors::RED);
    uint64_t v1 = bmp.contentVersion();
    assert(v1 > v0);
    bmp.fill(Colors::GREEN);
    assert(bmp.contentVersion() > v1);
    uint64_t v2 = bmp.contentVersion();
    bmp.markDirty();
    assert(bmp.contentVersion() > v2);
    assert(bmp.get(0, 0) == Colors::GREEN);

    std::cout << "PASSED\n";
}

void test_bmp_slice_coords() {
    std::cout << "Testing: BmpSlice texture coordinates... ";

    auto bmp = Bitmap32::create(100, 50);
    BmpSlice whole(bmp);
    assert(whole.width() == 100 && whole.height() == 50);
    assert(whole.tlX() == 0.0f && whole.brY() == 1.0f);

    BmpSlice part = whole.slice(25, 10, 50, 20);
    assert(near(part.tlX(), 0.25) && near(part.tlY(), 0.2));
    assert(near(part.brX(), 0.75) && near(part.brY(), 0.6));

    // Clipped to the parent slice
    BmpSlice clipped = part.slice(40, 0, 100, 100);
    assert(clipped.width() == 10 && clipped.height() == 20);

    assert(Bitmaps::transparent().bmp()->get(0, 0) == Colors::TRANSPARENT_BLACK);
    assert(Bitmaps::white().bmp()->get(0, 0) == Colors::WHITE);

    std::cout << "PASSED\n";
}

void test_decode_bitmap() {
    std::cout << "Testing: Bitmap decoding... ";

    BitmapRef bmp = decodeBitmap(ppm2x1(), "test.ppm");
    assert(bmp->width() == 2 && bmp->height() == 1);
    assert(bmp->get(0, 0) == Colors::RED);
    assert(bmp->get(1, 0) == Colors::BLUE);

    bool thrown = false;
    try {
        decodeBitmap({1, 2, 3, 4}, "garbage");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "Kestrel - Math & Image Tests\n";
    std::cout << "========================================\n\n";

    try {
        test_matrix_transform();
        test_matrix_invert();
        test_keep_matrix();
        test_ortho_projection();
        test_colors();
        test_bitmap_versions();
        test_bmp_slice_coords();
        test_decode_bitmap();

        std::cout << "\n========================================\n";
        std::cout << "All math & image tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTest FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
