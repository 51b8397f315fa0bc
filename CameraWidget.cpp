#include "CameraWidget.h"
#include "ImageCodec.h"
#include "WidgetHelpers.h"

CameraWidget::CameraWidget(WidgetConfig config) : Widget(std::move(config)) {
    fit_ = parse_image_fit(config_.option<std::string>("fit", "contain"));
    show_label_ = config_.option("show_label", false);
}

RenderResult CameraWidget::render(RenderContext& ctx, const WidgetState& state) const {
    std::shared_ptr<Canvas> image;
    if (!state.image.empty()) image = decode_image(state.image);

    if (!image) {
        return RenderResult::Tree(std::make_shared<Column>(
            Children{
                std::make_shared<Icon>("camera", IconStyle{0, 32, Color::Secondary()}),
                std::make_shared<Text>(Placeholder::NO_IMAGE, TextStyle{FontClass::Small, false, Color::Secondary()}),
            },
            FlexStyle{4, 0, Align::Center, Justify::Center}));
    }

    Children layers{std::make_shared<ImageFill>(image, fit_)};
    if (show_label_ && ctx.show_secondary()) {
        std::string label = resolve_label(config_.label, state.get_entity(config_.entity_id));
        if (!label.empty()) {
            layers.push_back(std::make_shared<Column>(
                Children{std::make_shared<Text>(label, TextStyle{FontClass::Small, false, Color(Colors::WHITE)})},
                FlexStyle{0, 6, Align::Center, Justify::End}));
        }
    }
    return RenderResult::Tree(std::make_shared<Stack>(layers));
}
