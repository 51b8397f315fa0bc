#ifndef MEDIA_WIDGET_H
#define MEDIA_WIDGET_H

#include "Widget.h"
#include <ctime>
#include <optional>
#include <string>

// Media player: album art with a track overlay when an image is available,
// a text "now playing" panel otherwise, and a paused screen when idle.
class MediaWidget : public Widget {
public:
    explicit MediaWidget(WidgetConfig config);

    RenderResult render(RenderContext& ctx, const WidgetState& state) const override;

    static bool is_idle(const EntityState* entity);

    // media_position advanced by the time since media_position_updated_at while playing,
    // capped at media_duration when one is known.
    static double current_position(const EntityState* entity, std::time_t now);

    // 75 -> "1:15", 3725 -> "1:02:05"
    static std::string format_time(double seconds);

    // "2024-03-01T12:00:05.123+01:00" and friends; nullopt when unparseable.
    static std::optional<std::time_t> parse_timestamp(const std::string& text);

private:
    bool show_artist_;
    bool show_album_;
    bool show_progress_;
    bool show_album_art_;
};

#endif // MEDIA_WIDGET_H
