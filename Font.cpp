#include "Font.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

#include "stb_truetype.h"

// --- UTF-8 ---

std::vector<uint32_t> decode_utf8(const std::string& text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        uint32_t cp = 0;
        int extra = 0;
        if (c < 0x80) { cp = c; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else { cp = 0xFFFD; }
        ++i;
        for (int k = 0; k < extra; ++k) {
            if (i >= text.size() || (static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
                cp = 0xFFFD;
                break;
            }
            cp = (cp << 6) | (static_cast<unsigned char>(text[i]) & 0x3F);
            ++i;
        }
        out.push_back(cp);
    }
    return out;
}

std::string encode_utf8(const std::vector<uint32_t>& codepoints) {
    std::string out;
    for (uint32_t cp : codepoints) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

// --- TrueType (stb_truetype) ---

namespace {

class TrueTypeFace : public FontFace, public std::enable_shared_from_this<TrueTypeFace> {
public:
    TrueTypeFace(std::string path, std::vector<uint8_t> buffer)
        : path_(std::move(path)), buffer_(std::move(buffer)) {}

    bool init() {
        if (!stbtt_InitFont(&info_, buffer_.data(), stbtt_GetFontOffsetForIndex(buffer_.data(), 0))) {
            return false;
        }
        return true;
    }

    FontPtr at_size(int pixel_size) const override;
    std::string name() const override { return path_; }

    const stbtt_fontinfo* info() const { return &info_; }

private:
    std::string path_;
    std::vector<uint8_t> buffer_;
    stbtt_fontinfo info_{};
};

class TrueTypeFont : public Font {
public:
    TrueTypeFont(std::shared_ptr<const TrueTypeFace> face, int pixel_size)
        : face_(std::move(face)), size_(std::max(1, pixel_size)) {
        const stbtt_fontinfo* info = face_->info();
        scale_ = stbtt_ScaleForPixelHeight(info, static_cast<float>(size_));
        int ascent, descent, line_gap;
        stbtt_GetFontVMetrics(info, &ascent, &descent, &line_gap);
        ascent_ = static_cast<int>(std::ceil(ascent * scale_));
        descent_ = static_cast<int>(std::ceil(-descent * scale_));
    }

    int pixel_size() const override { return size_; }
    int ascent() const override { return ascent_; }
    int descent() const override { return descent_; }

    int measure(const std::string& text) const override {
        const stbtt_fontinfo* info = face_->info();
        auto cps = decode_utf8(text);
        float width = 0.0f;
        for (size_t i = 0; i < cps.size(); ++i) {
            int advance, lsb;
            stbtt_GetCodepointHMetrics(info, static_cast<int>(cps[i]), &advance, &lsb);
            width += advance * scale_;
            if (i + 1 < cps.size()) {
                width += stbtt_GetCodepointKernAdvance(info, static_cast<int>(cps[i]),
                                                       static_cast<int>(cps[i + 1])) * scale_;
            }
        }
        return static_cast<int>(std::ceil(width));
    }

    void draw(Canvas& canvas, const std::string& text, int x, int baseline, Rgb color) const override {
        const stbtt_fontinfo* info = face_->info();
        auto cps = decode_utf8(text);
        float pen = static_cast<float>(x);
        thread_local std::vector<uint8_t> bitmap;
        for (size_t k = 0; k < cps.size(); ++k) {
            int cp = static_cast<int>(cps[k]);
            int advance, lsb;
            stbtt_GetCodepointHMetrics(info, cp, &advance, &lsb);
            int c_x1, c_y1, c_x2, c_y2;
            stbtt_GetCodepointBitmapBox(info, cp, scale_, scale_, &c_x1, &c_y1, &c_x2, &c_y2);
            int w = c_x2 - c_x1;
            int h = c_y2 - c_y1;
            if (w > 0 && h > 0) {
                bitmap.assign(static_cast<size_t>(w * h), 0);
                stbtt_MakeCodepointBitmap(info, bitmap.data(), w, h, w, scale_, scale_, cp);
                int ox = static_cast<int>(std::lround(pen)) + c_x1;
                int oy = baseline + c_y1;
                for (int j = 0; j < h; ++j) {
                    for (int i = 0; i < w; ++i) {
                        canvas.blendPixel(ox + i, oy + j, color, bitmap[j * w + i]);
                    }
                }
            }
            pen += advance * scale_;
            if (k + 1 < cps.size()) {
                pen += stbtt_GetCodepointKernAdvance(info, cp, static_cast<int>(cps[k + 1])) * scale_;
            }
        }
    }

private:
    std::shared_ptr<const TrueTypeFace> face_;
    int size_;
    float scale_ = 1.0f;
    int ascent_ = 0;
    int descent_ = 0;
};

FontPtr TrueTypeFace::at_size(int pixel_size) const {
    return std::make_shared<TrueTypeFont>(shared_from_this(), pixel_size);
}

// --- Builtin bitmap font ---

// Rows top to bottom, bit 4 is the leftmost column. ASCII 32..126.
const uint8_t kGlyphs[95][7] = {
    {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}, // space
    {0x04, 0x04, 0x04, 0x04, 0x04, 0x00, 0x04}, // !
    {0x0A, 0x0A, 0x00, 0x00, 0x00, 0x00, 0x00}, // "
    {0x0A, 0x1F, 0x0A, 0x0A, 0x1F, 0x0A, 0x00}, // #
    {0x04, 0x0F, 0x14, 0x0E, 0x05, 0x1E, 0x04}, // $
    {0x18, 0x19, 0x02, 0x04, 0x08, 0x13, 0x03}, // %
    {0x0C, 0x12, 0x14, 0x08, 0x15, 0x12, 0x0D}, // &
    {0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00}, // '
    {0x02, 0x04, 0x08, 0x08, 0x08, 0x04, 0x02}, // (
    {0x08, 0x04, 0x02, 0x02, 0x02, 0x04, 0x08}, // )
    {0x00, 0x04, 0x15, 0x0E, 0x15, 0x04, 0x00}, // *
    {0x00, 0x04, 0x04, 0x1F, 0x04, 0x04, 0x00}, // +
    {0x00, 0x00, 0x00, 0x00, 0x0C, 0x04, 0x08}, // ,
    {0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00}, // -
    {0x00, 0x00, 0x00, 0x00, 0x00, 0x0C, 0x0C}, // .
    {0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x00}, // /
    {0x0E, 0x11, 0x13, 0x15, 0x19, 0x11, 0x0E}, // 0
    {0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E}, // 1
    {0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}, // 2
    {0x1F, 0x02, 0x04, 0x02, 0x01, 0x11, 0x0E}, // 3
    {0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}, // 4
    {0x1F, 0x10, 0x1E, 0x01, 0x01, 0x11, 0x0E}, // 5
    {0x06, 0x08, 0x10, 0x1E, 0x11, 0x11, 0x0E}, // 6
    {0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08}, // 7
    {0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}, // 8
    {0x0E, 0x11, 0x11, 0x0F, 0x01, 0x02, 0x0C}, // 9
    {0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x0C, 0x00}, // :
    {0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x04, 0x08}, // ;
    {0x02, 0x04, 0x08, 0x10, 0x08, 0x04, 0x02}, // <
    {0x00, 0x00, 0x1F, 0x00, 0x1F, 0x00, 0x00}, // =
    {0x08, 0x04, 0x02, 0x01, 0x02, 0x04, 0x08}, // >
    {0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04}, // ?
    {0x0E, 0x11, 0x01, 0x0D, 0x15, 0x15, 0x0E}, // @
    {0x0E, 0x11, 0x11, 0x11, 0x1F, 0x11, 0x11}, // A
    {0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E}, // B
    {0x0E, 0x11, 0x10, 0x10, 0x10, 0x11, 0x0E}, // C
    {0x1C, 0x12, 0x11, 0x11, 0x11, 0x12, 0x1C}, // D
    {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}, // E
    {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x10}, // F
    {0x0E, 0x11, 0x10, 0x17, 0x11, 0x11, 0x0F}, // G
    {0x11, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}, // H
    {0x0E, 0x04, 0x04, 0x04, 0x04, 0x04, 0x0E}, // I
    {0x07, 0x02, 0x02, 0x02, 0x02, 0x12, 0x0C}, // J
    {0x11, 0x12, 0x14, 0x18, 0x14, 0x12, 0x11}, // K
    {0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x1F}, // L
    {0x11, 0x1B, 0x15, 0x15, 0x11, 0x11, 0x11}, // M
    {0x11, 0x11, 0x19, 0x15, 0x13, 0x11, 0x11}, // N
    {0x0E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}, // O
    {0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10, 0x10}, // P
    {0x0E, 0x11, 0x11, 0x11, 0x15, 0x12, 0x0D}, // Q
    {0x1E, 0x11, 0x11, 0x1E, 0x14, 0x12, 0x11}, // R
    {0x0F, 0x10, 0x10, 0x0E, 0x01, 0x01, 0x1E}, // S
    {0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}, // T
    {0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}, // U
    {0x11, 0x11, 0x11, 0x11, 0x11, 0x0A, 0x04}, // V
    {0x11, 0x11, 0x11, 0x15, 0x15, 0x15, 0x0A}, // W
    {0x11, 0x11, 0x0A, 0x04, 0x0A, 0x11, 0x11}, // X
    {0x11, 0x11, 0x11, 0x0A, 0x04, 0x04, 0x04}, // Y
    {0x1F, 0x01, 0x02, 0x04, 0x08, 0x10, 0x1F}, // Z
    {0x0E, 0x08, 0x08, 0x08, 0x08, 0x08, 0x0E}, // [
    {0x00, 0x10, 0x08, 0x04, 0x02, 0x01, 0x00}, // backslash
    {0x0E, 0x02, 0x02, 0x02, 0x02, 0x02, 0x0E}, // ]
    {0x04, 0x0A, 0x11, 0x00, 0x00, 0x00, 0x00}, // ^
    {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1F}, // _
    {0x08, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00}, // `
    {0x00, 0x00, 0x0E, 0x01, 0x0F, 0x11, 0x0F}, // a
    {0x10, 0x10, 0x16, 0x19, 0x11, 0x11, 0x1E}, // b
    {0x00, 0x00, 0x0E, 0x10, 0x10, 0x11, 0x0E}, // c
    {0x01, 0x01, 0x0D, 0x13, 0x11, 0x11, 0x0F}, // d
    {0x00, 0x00, 0x0E, 0x11, 0x1F, 0x10, 0x0E}, // e
    {0x06, 0x09, 0x08, 0x1C, 0x08, 0x08, 0x08}, // f
    {0x00, 0x0F, 0x11, 0x11, 0x0F, 0x01, 0x0E}, // g
    {0x10, 0x10, 0x16, 0x19, 0x11, 0x11, 0x11}, // h
    {0x04, 0x00, 0x0C, 0x04, 0x04, 0x04, 0x0E}, // i
    {0x02, 0x00, 0x06, 0x02, 0x02, 0x12, 0x0C}, // j
    {0x10, 0x10, 0x12, 0x14, 0x18, 0x14, 0x12}, // k
    {0x0C, 0x04, 0x04, 0x04, 0x04, 0x04, 0x0E}, // l
    {0x00, 0x00, 0x1A, 0x15, 0x15, 0x11, 0x11}, // m
    {0x00, 0x00, 0x16, 0x19, 0x11, 0x11, 0x11}, // n
    {0x00, 0x00, 0x0E, 0x11, 0x11, 0x11, 0x0E}, // o
    {0x00, 0x00, 0x1E, 0x11, 0x1E, 0x10, 0x10}, // p
    {0x00, 0x00, 0x0D, 0x13, 0x0F, 0x01, 0x01}, // q
    {0x00, 0x00, 0x16, 0x19, 0x10, 0x10, 0x10}, // r
    {0x00, 0x00, 0x0E, 0x10, 0x0E, 0x01, 0x1E}, // s
    {0x08, 0x08, 0x1C, 0x08, 0x08, 0x09, 0x06}, // t
    {0x00, 0x00, 0x11, 0x11, 0x11, 0x13, 0x0D}, // u
    {0x00, 0x00, 0x11, 0x11, 0x11, 0x0A, 0x04}, // v
    {0x00, 0x00, 0x11, 0x11, 0x15, 0x15, 0x0A}, // w
    {0x00, 0x00, 0x11, 0x0A, 0x04, 0x0A, 0x11}, // x
    {0x00, 0x00, 0x11, 0x11, 0x0F, 0x01, 0x0E}, // y
    {0x00, 0x00, 0x1F, 0x02, 0x04, 0x08, 0x1F}, // z
    {0x02, 0x04, 0x04, 0x08, 0x04, 0x04, 0x02}, // {
    {0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}, // |
    {0x08, 0x04, 0x04, 0x02, 0x04, 0x04, 0x08}, // }
    {0x00, 0x00, 0x08, 0x15, 0x02, 0x00, 0x00}, // ~
};

const uint8_t kDegreeGlyph[7] = {0x06, 0x09, 0x09, 0x06, 0x00, 0x00, 0x00};
const uint8_t kMissingGlyph[7] = {0x1F, 0x11, 0x11, 0x11, 0x11, 0x11, 0x1F};

const uint8_t* glyph_rows(uint32_t cp) {
    if (cp >= 32 && cp <= 126) return kGlyphs[cp - 32];
    if (cp == 0xB0) return kDegreeGlyph;
    return kMissingGlyph;
}

class BitmapFont : public Font {
public:
    BitmapFont(int pixel_size, bool bold)
        : size_(std::max(1, pixel_size)), bold_(bold), cell_(std::max(1, size_ / 8)) {}

    int pixel_size() const override { return size_; }
    int ascent() const override { return 7 * cell_; }
    int descent() const override { return cell_; }

    int measure(const std::string& text) const override {
        return static_cast<int>(decode_utf8(text).size()) * advance();
    }

    void draw(Canvas& canvas, const std::string& text, int x, int baseline, Rgb color) const override {
        int top = baseline - ascent();
        int pen = x;
        for (uint32_t cp : decode_utf8(text)) {
            const uint8_t* rows = glyph_rows(cp);
            for (int row = 0; row < 7; ++row) {
                for (int col = 0; col < 5; ++col) {
                    if (rows[row] & (0x10 >> col)) {
                        int w = bold_ ? cell_ + std::max(1, cell_ / 2) : cell_;
                        canvas.fillRect(pen + col * cell_, top + row * cell_, w, cell_, color);
                    }
                }
            }
            pen += advance();
        }
    }

private:
    int advance() const { return 6 * cell_; }

    int size_;
    bool bold_;
    int cell_;
};

class BitmapFace : public FontFace {
public:
    explicit BitmapFace(bool bold) : bold_(bold) {}
    FontPtr at_size(int pixel_size) const override {
        return std::make_shared<BitmapFont>(pixel_size, bold_);
    }
    std::string name() const override { return bold_ ? "builtin-bold" : "builtin"; }

private:
    bool bold_;
};

} // namespace

FontFacePtr load_truetype_face(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return nullptr;
    }
    std::streamsize file_size = file.tellg();
    if (file_size <= 0) {
        std::cerr << "  [Font] Empty font file: " << path << std::endl;
        return nullptr;
    }
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> buffer(static_cast<size_t>(file_size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), file_size)) {
        std::cerr << "  [Font] Failed to read font file: " << path << std::endl;
        return nullptr;
    }
    auto face = std::make_shared<TrueTypeFace>(path, std::move(buffer));
    if (!face->init()) {
        std::cerr << "  [Font] Failed to initialize font: " << path << std::endl;
        return nullptr;
    }
    return face;
}

// --- Providers ---

FileFontProvider::FileFontProvider(std::vector<std::string> regular_paths,
                                   std::vector<std::string> bold_paths)
    : regular_paths_(std::move(regular_paths)), bold_paths_(std::move(bold_paths)) {}

FontFacePtr FileFontProvider::load(bool bold) const {
    const auto& paths = bold ? bold_paths_ : regular_paths_;
    for (const auto& path : paths) {
        if (path.empty()) continue;
        if (auto face = load_truetype_face(path)) return face;
    }
    return nullptr;
}

std::string FileFontProvider::describe() const {
    return regular_paths_.empty() ? std::string("files") : "files (" + regular_paths_.front() + ", ...)";
}

FontFacePtr BuiltinFontProvider::load(bool bold) const {
    return std::make_shared<BitmapFace>(bold);
}

// --- Library ---

FontLibrary::FontLibrary(std::vector<std::unique_ptr<FontProvider>> providers)
    : providers_(std::move(providers)) {
    providers_.push_back(std::make_unique<BuiltinFontProvider>());
}

std::unique_ptr<FontLibrary> FontLibrary::CreateDefault() {
    std::vector<std::unique_ptr<FontProvider>> providers;

    std::string env_regular = getenv_string("PANEL_FONT", "");
    std::string env_bold = getenv_string("PANEL_FONT_BOLD", env_regular);
    if (!env_regular.empty() || !env_bold.empty()) {
        providers.push_back(std::make_unique<FileFontProvider>(
            std::vector<std::string>{env_regular}, std::vector<std::string>{env_bold}));
    }

    providers.push_back(std::make_unique<FileFontProvider>(
        std::vector<std::string>{
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
        },
        std::vector<std::string>{
            "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
            "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
            "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        }));

    providers.push_back(std::make_unique<FileFontProvider>(
        std::vector<std::string>{
            "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
            "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
            "/System/Library/Fonts/Helvetica.ttc",
        },
        std::vector<std::string>{
            "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
            "/usr/share/fonts/truetype/noto/NotoSans-Bold.ttf",
            "/System/Library/Fonts/Helvetica.ttc",
        }));

    return std::make_unique<FontLibrary>(std::move(providers));
}

FontFacePtr FontLibrary::resolve(bool bold) const {
    for (const auto& provider : providers_) {
        if (auto face = provider->load(bold)) {
            if (panel_debug()) {
                std::cerr << "  [Font] " << (bold ? "bold" : "regular") << " face from "
                          << provider->describe() << ": " << face->name() << std::endl;
            }
            return face;
        }
    }
    // The builtin provider is always last and always answers.
    return BuiltinFontProvider().load(bold);
}

const FontFace& FontLibrary::face(bool bold) const {
    FontFacePtr& slot = bold ? bold_ : regular_;
    if (!slot) slot = resolve(bold);
    return *slot;
}

FontPtr FontLibrary::get(int pixel_size, bool bold) const {
    auto key = std::make_pair(pixel_size, bold);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
    FontPtr font = face(bold).at_size(pixel_size);
    cache_[key] = font;
    return font;
}
