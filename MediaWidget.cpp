#include "MediaWidget.h"
#include "ImageCodec.h"
#include "WidgetHelpers.h"
#include <algorithm>
#include <cstdio>

namespace {

class MediaIdle : public Component {
public:
    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        int icon_size = std::max(32, static_cast<int>(height * 0.3));
        Column(
            Children{
                std::make_shared<Icon>("pause", IconStyle{icon_size, 0, Color::Secondary()}),
                std::make_shared<Text>("PAUSED", TextStyle{FontClass::Regular, false, Color::Secondary()}),
            },
            FlexStyle{static_cast<int>(height * 0.06), 0, Align::Center, Justify::Center})
            .render(ctx, x, y, width, height);
    }
};

struct Track {
    std::string title;
    std::string artist;
    std::string album;
    double position = 0.0;
    double duration = 0.0;
};

class NowPlaying : public Component {
public:
    Track track;
    Color color = Color(Colors::CYAN);
    bool show_artist = true;
    bool show_album = false;
    bool show_progress = true;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        const int padding = static_cast<int>(width * 0.05);
        const int max_chars = estimate_max_chars(width, 8, padding * 2);

        Children children{
            std::make_shared<Text>("NOW PLAYING", TextStyle{FontClass::Small, false, Color::Secondary()}),
            std::make_shared<Spacer>(static_cast<int>(height * 0.03)),
            std::make_shared<Text>(truncate_text(track.title, max_chars), TextStyle{FontClass::Regular, false, Color::Primary()}),
        };
        if (show_artist && !track.artist.empty()) {
            children.push_back(std::make_shared<Spacer>(static_cast<int>(height * 0.02)));
            children.push_back(std::make_shared<Text>(truncate_text(track.artist, max_chars),
                                                      TextStyle{FontClass::Small, false, Color::Secondary()}));
        }
        if (show_album && !track.album.empty()) {
            children.push_back(std::make_shared<Spacer>(static_cast<int>(height * 0.02)));
            children.push_back(std::make_shared<Text>(truncate_text(track.album, max_chars),
                                                      TextStyle{FontClass::Small, false, Color::Secondary()}));
        }
        children.push_back(std::make_shared<Spacer>());

        if (show_progress && track.duration > 0) {
            double percent = std::min(100.0, track.position / track.duration * 100.0);
            children.push_back(std::make_shared<Bar>(
                percent, GaugeStyle{color, Color(Colors::DARK_GRAY), std::max(4, static_cast<int>(height * 0.05))}));
            children.push_back(std::make_shared<Spacer>(static_cast<int>(height * 0.02)));
            children.push_back(std::make_shared<Row>(Children{
                std::make_shared<Text>(MediaWidget::format_time(track.position),
                                       TextStyle{FontClass::Small, false, Color::Secondary(), Align::Start}),
                std::make_shared<Spacer>(),
                std::make_shared<Text>(MediaWidget::format_time(track.duration),
                                       TextStyle{FontClass::Small, false, Color::Secondary(), Align::End}),
            }));
        }

        Column(children, FlexStyle{0, padding, Align::Stretch, Justify::Start}).render(ctx, x, y, width, height);
    }
};

// Cover art under a dark band carrying the track text, progress along the bottom edge.
class AlbumArt : public Component {
public:
    std::shared_ptr<const Canvas> image;
    Track track;
    Color color = Color(Colors::CYAN);
    bool show_progress = true;

    Size measure(const RenderContext&, int max_width, int max_height) const override {
        return Size{max_width, max_height};
    }

    void render(RenderContext& ctx, int x, int y, int width, int height) const override {
        ImageFill(image, ImageFit::Cover).render(ctx, x, y, width, height);

        SizeCategory size = size_category_for_height(height);
        const bool micro = size == SizeCategory::MICRO;
        const bool compact = micro || size == SizeCategory::TINY || size == SizeCategory::SMALL;
        const bool show_artist = size == SizeCategory::MEDIUM || size == SizeCategory::LARGE;
        const bool show_time = size == SizeCategory::LARGE;

        const double overlay_ratio = compact && !micro ? 0.30 : 0.28;
        const int overlay_h = static_cast<int>(height * overlay_ratio);
        const int overlay_y = y + height - overlay_h;
        ctx.draw_rect(Rect{x, overlay_y, x + width, y + height}, Color(RGB(10, 10, 10)));

        const int padding = micro ? std::max(2, static_cast<int>(width * 0.02)) : std::max(4, static_cast<int>(width * 0.04));
        const int max_chars = estimate_max_chars(width, 7, padding * 2);
        const int bar_h = show_progress ? std::max(2, static_cast<int>(height * 0.015)) : 0;

        Children text;
        if (!track.title.empty()) {
            FontClass font = micro || compact ? FontClass::Tiny : FontClass::Small;
            text.push_back(std::make_shared<Text>(truncate_text(track.title, max_chars),
                                                  TextStyle{font, !micro, Color(Colors::WHITE), Align::Start}));
        }
        if (show_artist && !track.artist.empty()) {
            text.push_back(std::make_shared<Text>(truncate_text(track.artist, max_chars),
                                                  TextStyle{FontClass::Tiny, false, Color(RGB(160, 160, 160)), Align::Start}));
        }
        if (show_time && track.duration > 0) {
            std::string times = MediaWidget::format_time(track.position) + " / " + MediaWidget::format_time(track.duration);
            text.push_back(std::make_shared<Text>(times, TextStyle{FontClass::Tiny, false, Color(RGB(120, 120, 120)), Align::Start}));
        }
        if (!text.empty()) {
            Column(text, FlexStyle{1, padding, Align::Start, Justify::End})
                .render(ctx, x, overlay_y, width, std::max(0, overlay_h - bar_h - padding));
        }

        if (show_progress && track.duration > 0) {
            double percent = std::min(100.0, track.position / track.duration * 100.0);
            Bar(percent, GaugeStyle{color, Color(RGB(40, 40, 40)), bar_h})
                .render(ctx, x, y + height - bar_h, width, bar_h);
        }
    }
};

} // namespace

MediaWidget::MediaWidget(WidgetConfig config) : Widget(std::move(config)) {
    show_artist_ = config_.option("show_artist", true);
    show_album_ = config_.option("show_album", false);
    show_progress_ = config_.option("show_progress", true);
    show_album_art_ = config_.option("show_album_art", true);
}

bool MediaWidget::is_idle(const EntityState* entity) {
    if (!entity || !entity->available) return true;
    const std::string& s = entity->state;
    return s == "off" || s == "unavailable" || s == "unknown" || s == "idle" || s == "paused";
}

double MediaWidget::current_position(const EntityState* entity, std::time_t now) {
    if (!entity) return 0.0;
    double position = extract_numeric(entity, "media_position");
    if (entity->state != "playing" || now <= 0) return position;

    auto it = entity->attributes.find("media_position_updated_at");
    if (it == entity->attributes.end()) return position;
    std::optional<std::time_t> updated;
    if (it->is_string()) updated = parse_timestamp(it->get<std::string>());
    else if (it->is_number()) updated = static_cast<std::time_t>(it->get<double>());
    if (!updated) return position;

    double elapsed = std::difftime(now, *updated);
    if (elapsed <= 0) return position;
    double duration = extract_numeric(entity, "media_duration");
    double advanced = position + elapsed;
    return duration > 0 ? std::min(advanced, duration) : advanced;
}

std::string MediaWidget::format_time(double seconds) {
    int total = std::max(0, static_cast<int>(seconds));
    char buf[32];
    if (total >= 3600) {
        std::snprintf(buf, sizeof(buf), "%d:%02d:%02d", total / 3600, (total % 3600) / 60, total % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%d:%02d", total / 60, total % 60);
    }
    return buf;
}

std::optional<std::time_t> MediaWidget::parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*1[T ]%2d:%2d:%lf%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second < 0 || second >= 61) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = static_cast<int>(second);
    std::time_t t = timegm(&tm);

    std::string zone = text.substr(static_cast<size_t>(consumed));
    if (zone.empty() || zone == "Z") return t;
    if (zone[0] != '+' && zone[0] != '-') return std::nullopt;
    int oh = 0, om = 0;
    if (std::sscanf(zone.c_str() + 1, "%2d:%2d", &oh, &om) != 2 && std::sscanf(zone.c_str() + 1, "%2d%2d", &oh, &om) != 2) {
        return std::nullopt;
    }
    int offset = oh * 3600 + om * 60;
    return zone[0] == '+' ? t - offset : t + offset;
}

RenderResult MediaWidget::render(RenderContext&, const WidgetState& state) const {
    const EntityState* entity = state.get_entity(config_.entity_id);
    if (is_idle(entity)) return RenderResult::Tree(std::make_shared<MediaIdle>());

    Track track;
    track.title = entity->attribute_string("media_title");
    track.artist = entity->attribute_string("media_artist");
    track.album = entity->attribute_string("media_album_name");
    track.position = current_position(entity, state.now);
    track.duration = extract_numeric(entity, "media_duration");

    if (show_album_art_ && !state.image.empty()) {
        if (auto image = decode_image(state.image)) {
            auto art = std::make_shared<AlbumArt>();
            art->image = image;
            art->track = track;
            art->color = accent_color();
            art->show_progress = show_progress_;
            return RenderResult::Tree(art);
        }
        std::cerr << "  [Widget] media: album art for " << config_.entity_id << " did not decode" << std::endl;
    }

    auto panel = std::make_shared<NowPlaying>();
    panel->track = track;
    if (panel->track.title.empty()) panel->track.title = Placeholder::UNKNOWN;
    panel->color = accent_color();
    panel->show_artist = show_artist_;
    panel->show_album = show_album_;
    panel->show_progress = show_progress_;
    return RenderResult::Tree(panel);
}
