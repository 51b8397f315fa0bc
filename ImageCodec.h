#ifndef IMAGE_CODEC_H
#define IMAGE_CODEC_H

#include "Canvas.h"
#include <cstdint>
#include <memory>
#include <vector>

// Decodes PNG/JPEG/BMP/GIF payloads into an RGB canvas. Returns nullptr on failure.
std::shared_ptr<Canvas> decode_image(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> encode_jpeg(const Canvas& image, int quality);
std::vector<uint8_t> encode_png(const Canvas& image);

#endif // IMAGE_CODEC_H
