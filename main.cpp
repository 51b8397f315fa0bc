#include "Dashboard.h"
#include "Font.h"
#include "IconCatalog.h"
#include "Renderer.h"
#include "utils.h"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static volatile sig_atomic_t running = 1;
static void signal_handler(int) { running = 0; }

struct Args {
    std::string config_path;
    std::string state_path;
    std::string out_jpeg = "frame.jpg";
    std::string out_png;
    double loop_seconds = 0.0;
    bool welcome = false;
    bool notify = false;
    std::string notify_message;
    std::string notify_icon = "mdi:bell-ring";
    std::string notify_image;
};

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " --config screen.json --state state.json [--out-jpeg out.jpg] [--out-png out.png]\n"
              << "       [--loop seconds] [--welcome] [--notify \"message\"] [--notify-icon mdi:name]"
              << " [--notify-image file]" << std::endl;
}

static bool parse_args(int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << a << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string value;
        if (a == "--config") {
            if (!next(args.config_path)) return false;
        } else if (a == "--state") {
            if (!next(args.state_path)) return false;
        } else if (a == "--out-jpeg") {
            if (!next(args.out_jpeg)) return false;
        } else if (a == "--out-png") {
            if (!next(args.out_png)) return false;
        } else if (a == "--loop") {
            if (!next(value)) return false;
            try {
                args.loop_seconds = std::stod(value);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid --loop value: " << value << std::endl;
                return false;
            }
        } else if (a == "--welcome") {
            args.welcome = true;
        } else if (a == "--notify") {
            args.notify = true;
            if (!next(args.notify_message)) return false;
        } else if (a == "--notify-icon") {
            if (!next(args.notify_icon)) return false;
        } else if (a == "--notify-image") {
            args.notify = true;
            if (!next(args.notify_image)) return false;
        } else if (a == "--help" || a == "-h") {
            return false;
        } else {
            std::cerr << "Unknown argument: " << a << std::endl;
            return false;
        }
    }
    if (!args.welcome && !args.notify && args.config_path.empty()) {
        std::cerr << "--config is required" << std::endl;
        return false;
    }
    return true;
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "Failed to open " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static bool read_bytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "Failed to open " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

static bool write_bytes(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to write " << path << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

// Re-read on every cycle so an external collector can rewrite the file between frames.
static bool load_snapshot(const std::string& path, Snapshot& snapshot) {
    if (path.empty()) {
        snapshot = Snapshot{};
        snapshot.now = std::time(nullptr);
        return true;
    }
    std::string text;
    if (!read_file(path, text)) return false;
    auto parsed = parse_snapshot(text);
    if (!parsed) return false;
    snapshot = std::move(*parsed);
    if (snapshot.now == 0) snapshot.now = std::time(nullptr);
    for (const auto& [id, image_path] : snapshot.image_paths) {
        std::vector<uint8_t> bytes;
        if (read_bytes(image_path, bytes)) snapshot.images[id] = std::move(bytes);
    }
    return true;
}

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        usage(argv[0]);
        return 2;
    }
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    const std::string theme_override = getenv_string("PANEL_THEME", "");
    const ExportOptions export_options = ExportOptions::FromEnv();

    std::unique_ptr<FontLibrary> fonts = FontLibrary::CreateDefault();
    IconCatalog icons;
    Renderer renderer(*fonts, icons);

    Snapshot snapshot;
    if (!load_snapshot(args.state_path, snapshot)) return 1;

    LayoutPtr layout;
    Notification notification;
    if (args.notify) {
        notification.message = args.notify_message;
        notification.icon = args.notify_icon;
        if (!theme_override.empty()) notification.theme = theme_override;
        if (!args.notify_image.empty() && !read_bytes(args.notify_image, notification.image)) return 1;
        layout = create_notification_layout(notification);
    } else if (args.welcome) {
        WelcomeInfo info;
        info.entity_count = static_cast<int>(snapshot.entities.size());
        layout = create_welcome_layout(info);
        if (!theme_override.empty()) layout->set_theme(get_theme(theme_override));
    } else {
        std::string text;
        if (!read_file(args.config_path, text)) return 1;
        auto config = parse_screen_config(text);
        if (!config) return 1;
        if (!theme_override.empty()) config->theme = theme_override;
        layout = build_layout(*config);
    }

    std::cout << "PanelComposer " << PANELCOMPOSER_VERSION << ": " << layout_type_name(layout->type()) << ", theme "
              << layout->theme().name << std::endl;

    auto last_log = std::chrono::steady_clock::now();
    double render_ms_acc = 0.0;
    double encode_ms_acc = 0.0;
    size_t last_jpeg_bytes = 0;
    int last_quality = 0;
    int frames = 0;
    bool first_frame = true;

    do {
        auto frame_start = std::chrono::steady_clock::now();

        WidgetStates states;
        if (args.notify) {
            states = notification_states(notification);
        } else {
            if (!first_frame && !load_snapshot(args.state_path, snapshot)) {
                std::cerr << "Keeping previous state snapshot" << std::endl;
            }
            states = build_widget_states(*layout, snapshot);
        }

        FrameOutput frame = render_frame(renderer, *layout, states, export_options, !args.out_png.empty());
        if (!write_bytes(args.out_jpeg, frame.jpeg)) return 1;
        if (!args.out_png.empty() && !write_bytes(args.out_png, frame.png)) return 1;

        render_ms_acc += frame.render_ms;
        encode_ms_acc += frame.encode_ms;
        last_jpeg_bytes = frame.jpeg.size();
        last_quality = frame.quality;
        frames++;
        first_frame = false;

        if (args.loop_seconds <= 0) {
            std::cout << "Wrote " << args.out_jpeg << " (" << last_jpeg_bytes << " bytes, quality " << last_quality
                      << ")" << std::endl;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        auto log_elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last_log).count();
        if (log_elapsed >= 5) {
            std::cerr << "PANEL PERF: frames=" << frames
                      << " render_ms=" << render_ms_acc
                      << " encode_ms=" << encode_ms_acc
                      << " jpeg_bytes=" << last_jpeg_bytes
                      << " quality=" << last_quality
                      << std::endl;
            render_ms_acc = 0.0;
            encode_ms_acc = 0.0;
            frames = 0;
            last_log = now;
        }

        auto frame_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - frame_start).count();
        auto period_ms = static_cast<long long>(args.loop_seconds * 1000.0);
        // Sleep in short steps so a signal ends the loop promptly.
        for (long long waited = frame_ms; running && waited < period_ms; waited += 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    } while (running);

    return 0;
}
