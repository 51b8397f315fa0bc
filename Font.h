#ifndef FONT_H
#define FONT_H

#include "Canvas.h"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct TextSize {
    int width = 0;
    int height = 0;
};

std::vector<uint32_t> decode_utf8(const std::string& text);
std::string encode_utf8(const std::vector<uint32_t>& codepoints);

// A face rasterized at one pixel size.
class Font {
public:
    virtual ~Font() = default;

    virtual int pixel_size() const = 0;
    virtual int ascent() const = 0;
    virtual int descent() const = 0;
    virtual int measure(const std::string& text) const = 0;
    // Draws with the baseline at `baseline`, pen starting at `x`.
    virtual void draw(Canvas& canvas, const std::string& text, int x, int baseline, Rgb color) const = 0;

    TextSize text_size(const std::string& text) const {
        return TextSize{measure(text), ascent() + descent()};
    }
};

using FontPtr = std::shared_ptr<const Font>;

class FontFace {
public:
    virtual ~FontFace() = default;
    virtual FontPtr at_size(int pixel_size) const = 0;
    virtual std::string name() const = 0;
};

using FontFacePtr = std::shared_ptr<const FontFace>;

// One source of font faces. Providers are tried in order until one answers.
class FontProvider {
public:
    virtual ~FontProvider() = default;
    virtual FontFacePtr load(bool bold) const = 0;
    virtual std::string describe() const = 0;
};

class FileFontProvider : public FontProvider {
public:
    FileFontProvider(std::vector<std::string> regular_paths, std::vector<std::string> bold_paths);

    FontFacePtr load(bool bold) const override;
    std::string describe() const override;

private:
    std::vector<std::string> regular_paths_;
    std::vector<std::string> bold_paths_;
};

// 5x7 bitmap glyphs compiled into the binary. Always succeeds.
class BuiltinFontProvider : public FontProvider {
public:
    FontFacePtr load(bool bold) const override;
    std::string describe() const override { return "builtin 5x7"; }
};

FontFacePtr load_truetype_face(const std::string& path);

class FontLibrary {
public:
    explicit FontLibrary(std::vector<std::unique_ptr<FontProvider>> providers);

    // PANEL_FONT / PANEL_FONT_BOLD, then well-known system fonts, then builtin.
    static std::unique_ptr<FontLibrary> CreateDefault();

    FontPtr get(int pixel_size, bool bold) const;
    const FontFace& face(bool bold) const;

private:
    FontFacePtr resolve(bool bold) const;

    std::vector<std::unique_ptr<FontProvider>> providers_;
    mutable FontFacePtr regular_;
    mutable FontFacePtr bold_;
    mutable std::map<std::pair<int, bool>, FontPtr> cache_;
};

#endif // FONT_H
