#ifndef CAMERA_WIDGET_H
#define CAMERA_WIDGET_H

#include "Widget.h"

class CameraWidget : public Widget {
public:
    explicit CameraWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

private:
    ImageFit fit_;
    bool show_label_;
};

#endif // CAMERA_WIDGET_H
