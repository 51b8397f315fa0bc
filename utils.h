#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

inline int getenv_int(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    try { return std::stoi(v); } catch (const std::logic_error&) { return def; }
}

inline double getenv_double(const char* name, double def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    try { return std::stod(v); } catch (const std::logic_error&) { return def; }
}

inline bool getenv_bool(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    std::string s(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

inline int getenv_int_clamped(const char* name, int def, int lo, int hi) {
    return std::clamp(getenv_int(name, def), lo, hi);
}

inline std::string getenv_string(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    return std::string(v);
}

inline double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

// Passes a repeating log line at most once per interval and counts what it held back.
class LogThrottle {
public:
    explicit LogThrottle(std::chrono::steady_clock::duration interval) : interval_(interval) {}

    // On true, `suppressed` is the number of calls dropped since the last pass.
    bool allow(std::chrono::steady_clock::time_point now, int& suppressed) {
        if (passed_once_ && now - last_ < interval_) {
            dropped_++;
            return false;
        }
        suppressed = dropped_;
        dropped_ = 0;
        last_ = now;
        passed_once_ = true;
        return true;
    }

private:
    std::chrono::steady_clock::duration interval_;
    std::chrono::steady_clock::time_point last_;
    int dropped_ = 0;
    bool passed_once_ = false;
};

// PANEL_DEBUG, read once per process
inline bool panel_debug() {
    static const bool enabled = getenv_bool("PANEL_DEBUG", false);
    return enabled;
}

#endif // UTILS_H
