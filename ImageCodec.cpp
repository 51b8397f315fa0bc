#include "ImageCodec.h"
#include <algorithm>
#include <iostream>

#include "stb_image.h"
#include "stb_image_write.h"

static void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

std::shared_ptr<Canvas> decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return nullptr;
    int w = 0, h = 0, ch = 0;
    unsigned char* img = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &w, &h, &ch, 3);
    if (!img) {
        std::cerr << "  [Image] Decode failed: " << stbi_failure_reason() << std::endl;
        return nullptr;
    }
    auto canvas = std::make_shared<Canvas>(w, h, Rgb{});
    std::copy(img, img + static_cast<size_t>(w) * h * 3, canvas->data().begin());
    stbi_image_free(img);
    return canvas;
}

std::vector<uint8_t> encode_jpeg(const Canvas& image, int quality) {
    std::vector<uint8_t> out;
    if (image.empty()) return out;
    int q = std::clamp(quality, 1, 100);
    if (!stbi_write_jpg_to_func(append_bytes, &out, image.width(), image.height(), 3,
                                image.data().data(), q)) {
        std::cerr << "  [Export] JPEG encoding failed" << std::endl;
        out.clear();
    }
    return out;
}

std::vector<uint8_t> encode_png(const Canvas& image) {
    std::vector<uint8_t> out;
    if (image.empty()) return out;
    if (!stbi_write_png_to_func(append_bytes, &out, image.width(), image.height(), 3,
                                image.data().data(), image.width() * 3)) {
        std::cerr << "  [Export] PNG encoding failed" << std::endl;
        out.clear();
    }
    return out;
}
