#include "Canvas.h"
#include "ImageCodec.h"
#include <catch2/catch.hpp>

TEST_CASE("Canvas pixel access", "[canvas]") {
    Canvas canvas(10, 6, Colors::BLACK);
    REQUIRE(canvas.width() == 10);
    REQUIRE(canvas.height() == 6);
    REQUIRE(canvas.data().size() == 10 * 6 * 3);

    SECTION("Writes outside the buffer are dropped") {
        canvas.setPixel(-1, 0, Colors::WHITE);
        canvas.setPixel(10, 0, Colors::WHITE);
        canvas.fillRect(8, 4, 10, 10, Colors::RED);
        REQUIRE(canvas.pixel(9, 5) == Colors::RED);
        REQUIRE(canvas.pixel(7, 5) == Colors::BLACK);
    }

    SECTION("Paste copies at an offset") {
        Canvas patch(2, 2, Colors::WHITE);
        canvas.paste(patch, 3, 1);
        REQUIRE(canvas.pixel(3, 1) == Colors::WHITE);
        REQUIRE(canvas.pixel(4, 2) == Colors::WHITE);
        REQUIRE(canvas.pixel(5, 1) == Colors::BLACK);
    }
}

TEST_CASE("Canvas downscale averages 2x2 blocks", "[canvas]") {
    Canvas canvas(4, 2, Colors::BLACK);
    canvas.setPixel(0, 0, RGB(200, 200, 200));
    canvas.setPixel(1, 1, RGB(200, 200, 200));
    Canvas small = canvas.downscaled(2);
    REQUIRE(small.width() == 2);
    REQUIRE(small.height() == 1);
    REQUIRE(small.pixel(0, 0) == RGB(100, 100, 100));
    REQUIRE(small.pixel(1, 0) == Colors::BLACK);
}

TEST_CASE("Canvas rotation is clockwise", "[canvas]") {
    Canvas canvas(3, 2, Colors::BLACK);
    canvas.setPixel(0, 0, Colors::RED);

    Canvas r90 = canvas.rotated(90);
    REQUIRE(r90.width() == 2);
    REQUIRE(r90.height() == 3);
    REQUIRE(r90.pixel(1, 0) == Colors::RED);

    Canvas r180 = canvas.rotated(180);
    REQUIRE(r180.pixel(2, 1) == Colors::RED);

    Canvas r270 = canvas.rotated(270);
    REQUIRE(r270.pixel(0, 2) == Colors::RED);
}

TEST_CASE("Image codec", "[canvas][codec]") {
    Canvas canvas(16, 8, Colors::BLUE);
    canvas.fillRect(0, 0, 8, 8, Colors::WHITE);

    SECTION("PNG decodes back to the same pixels") {
        std::vector<uint8_t> png = encode_png(canvas);
        REQUIRE(png.size() > 8);
        auto decoded = decode_image(png);
        REQUIRE(decoded != nullptr);
        REQUIRE(decoded->width() == 16);
        REQUIRE(decoded->height() == 8);
        REQUIRE(decoded->pixel(2, 2) == Colors::WHITE);
        REQUIRE(decoded->pixel(12, 2) == Colors::BLUE);
    }

    SECTION("JPEG output starts with the SOI marker") {
        std::vector<uint8_t> jpeg = encode_jpeg(canvas, 90);
        REQUIRE(jpeg.size() > 2);
        REQUIRE(jpeg[0] == 0xFF);
        REQUIRE(jpeg[1] == 0xD8);
    }

    SECTION("Garbage does not decode") {
        REQUIRE(decode_image({1, 2, 3, 4}) == nullptr);
        REQUIRE(decode_image({}) == nullptr);
    }
}
