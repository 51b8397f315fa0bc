#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "Components.h"
#include "Font.h"
#include "IconCatalog.h"
#include "RenderContext.h"
#include "Renderer.h"
#include <memory>
#include <vector>

// Renderer backed by the builtin bitmap font only, so results do not depend on installed fonts.
struct TestRig {
    TestRig() : fonts(BuiltinFonts()), renderer(*fonts, icons) {}

    static std::unique_ptr<FontLibrary> BuiltinFonts() {
        std::vector<std::unique_ptr<FontProvider>> providers;
        providers.push_back(std::make_unique<BuiltinFontProvider>());
        return std::make_unique<FontLibrary>(std::move(providers));
    }

    std::unique_ptr<FontLibrary> fonts;
    IconCatalog icons;
    Renderer renderer;
};

// Leaf with a fixed natural size that records where it was placed.
class FixedBox : public Component {
public:
    FixedBox(int w, int h) : w_(w), h_(h) {}

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{std::min(w_, max_width), std::min(h_, max_height)};
    }
    void render(RenderContext&, int x, int y, int width, int height) const override {
        placed = {x, y, x + width, y + height};
    }

    mutable Rect placed;

private:
    int w_;
    int h_;
};

#endif // TEST_SUPPORT_H
