#ifndef COMPONENTS_H
#define COMPONENTS_H

#include "RenderContext.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct Size {
    int width = 0;
    int height = 0;
};

enum class Align { Start, Center, End, Stretch };
enum class Justify { Start, Center, End, SpaceBetween, SpaceAround };

// Node of a declarative render tree. measure() is pure; render() draws into the given box.
class Component {
public:
    virtual ~Component() = default;
    virtual Size measure(const RenderContext& ctx, int max_width, int max_height) const = 0;
    virtual void render(RenderContext& ctx, int x, int y, int width, int height) const = 0;
    // Share of leftover main-axis space inside Row/Column.
    virtual int flex_grow() const { return 0; }
};

using ComponentPtr = std::shared_ptr<const Component>;
using Children = std::vector<ComponentPtr>;

// --- Leaves ---

struct TextStyle {
    FontClass font = FontClass::Regular;
    bool bold = false;
    Color color = Color::Primary();
    Align align = Align::Center;
    int adjust = 0;
};

struct TextPlacement {
    int x = 0;
    int y = 0;
    Anchor anchor = Anchor::Middle;
};

class Text : public Component {
public:
    explicit Text(std::string text, TextStyle style = {});

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

    // Anchor point for a box: start is left-middle, end is right-middle, center is the box center.
    static TextPlacement place(Align align, int x, int y, int width, int height);

    const std::string& text() const { return text_; }

private:
    std::string text_;
    TextStyle style_;
};

struct IconStyle {
    int size = 0;
    int max_size = 0;
    Color color = Color::Primary();
};

class Icon : public Component {
public:
    explicit Icon(std::string name, IconStyle style = {});

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    int resolvedSize(int width, int height) const;

    std::string name_;
    IconStyle style_;
};

struct GaugeStyle {
    Color color = Color(Colors::CYAN);
    Color background = Color(Colors::DARK_GRAY);
    int thickness = 0;
};

class Bar : public Component {
public:
    explicit Bar(double percent, GaugeStyle style = {});

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

    static int natural_height(int fixed_height, int max_height);

private:
    double percent_;
    GaugeStyle style_;
};

class Ring : public Component {
public:
    explicit Ring(double percent, GaugeStyle style = {});

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    double percent_;
    GaugeStyle style_;
};

class Arc : public Component {
public:
    explicit Arc(double percent, GaugeStyle style = {});

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    double percent_;
    GaugeStyle style_;
};

class Sparkline : public Component {
public:
    Sparkline(std::vector<double> data, Color color, bool fill = true, bool smooth = true, bool gradient = false);

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    std::vector<double> data_;
    Color color_;
    bool fill_;
    bool smooth_;
    bool gradient_;
};

class Timeline : public Component {
public:
    Timeline(std::vector<double> data, Color on_color, Color off_color);

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    std::vector<double> data_;
    Color on_color_;
    Color off_color_;
};

class ImageFill : public Component {
public:
    ImageFill(std::shared_ptr<const Canvas> image, ImageFit fit);

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    std::shared_ptr<const Canvas> image_;
    ImageFit fit_;
};

class Spacer : public Component {
public:
    explicit Spacer(int min_size = 0) : min_size_(min_size) {}

    Size measure(const RenderContext&, int, int) const override { return Size{min_size_, min_size_}; }
    void render(RenderContext&, int, int, int, int) const override {}
    int flex_grow() const override { return 1; }

private:
    int min_size_;
};

class Empty : public Component {
public:
    Size measure(const RenderContext&, int, int) const override { return Size{}; }
    void render(RenderContext&, int, int, int, int) const override {}
};

// --- Containers ---

struct FlexStyle {
    int gap = 0;
    int padding = 0;
    Align align = Align::Center;
    Justify justify = Justify::Start;
};

class FlexContainer : public Component {
public:
    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

    const Children& children() const { return children_; }
    const FlexStyle& style() const { return style_; }

protected:
    FlexContainer(bool horizontal, Children children, FlexStyle style);

private:
    bool horizontal_;
    Children children_;
    FlexStyle style_;
};

class Row : public FlexContainer {
public:
    explicit Row(Children children, FlexStyle style = {}) : FlexContainer(true, std::move(children), style) {}
};

class Column : public FlexContainer {
public:
    explicit Column(Children children, FlexStyle style = {}) : FlexContainer(false, std::move(children), style) {}
};

// Children overlap in one box, drawn first to last.
class Stack : public Component {
public:
    explicit Stack(Children children) : children_(std::move(children)) {}

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    Children children_;
};

// Row when the children fit side by side, Column otherwise.
class Adaptive : public Component {
public:
    explicit Adaptive(Children children, int gap = 4, int padding = 0);

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

    bool fits_row(const RenderContext& ctx, int max_width, int max_height) const;

private:
    std::unique_ptr<FlexContainer> choose(const RenderContext& ctx, int max_width, int max_height) const;

    Children children_;
    int gap_;
    int padding_;
};

// Per-side values win over vertical/horizontal, which win over all.
struct Insets {
    std::optional<int> all;
    std::optional<int> horizontal;
    std::optional<int> vertical;
    std::optional<int> top;
    std::optional<int> right;
    std::optional<int> bottom;
    std::optional<int> left;

    int resolved_top() const { return top.value_or(vertical.value_or(all.value_or(0))); }
    int resolved_bottom() const { return bottom.value_or(vertical.value_or(all.value_or(0))); }
    int resolved_left() const { return left.value_or(horizontal.value_or(all.value_or(0))); }
    int resolved_right() const { return right.value_or(horizontal.value_or(all.value_or(0))); }
};

class Padding : public Component {
public:
    Padding(ComponentPtr child, Insets insets);

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    ComponentPtr child_;
    Insets insets_;
};

// Rounded theme panel behind a child.
class Panel : public Component {
public:
    explicit Panel(ComponentPtr child, std::optional<Color> color = std::nullopt, int padding = 0);

    Size measure(const RenderContext& ctx, int max_width, int max_height) const override;
    void render(RenderContext& ctx, int x, int y, int width, int height) const override;

private:
    ComponentPtr child_;
    std::optional<Color> color_;
    int padding_;
};

#endif // COMPONENTS_H
