#ifndef ICON_CATALOG_H
#define ICON_CATALOG_H

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class IconId {
    Thermometer, Drop, Cpu, Memory, Network, Wifi, Bolt,
    Sun, Moon, Cloud, PartlyCloudy, Rain, Snow, Wind, Fog,
    Home, Lightbulb, Power, Battery, Plug, Lock, LockOpen, Door, Window, Motion,
    Bell, Check, Close, Warning, Info, Help, Heart, Star,
    Clock, Calendar, Music, Play, Pause, Volume, Camera,
    Fan, Fire, Leaf, Car, Gauge, Chart, Person, Shield, Eye,
    ArrowUp, ArrowDown
};

// Name and alias lookup for the vector icon set. Built once and passed down.
class IconCatalog {
public:
    IconCatalog();

    // Accepts canonical names, aliases and "mdi:" names; "-outline" variants map to the base icon.
    std::optional<IconId> find(const std::string& name) const;
    std::string name_of(IconId id) const;
    std::vector<std::string> names() const;
    size_t size() const { return canonical_.size(); }

    // Weather condition tag (sunny, rainy, ...) to icon. Unknown conditions map to Cloud.
    IconId weather_icon(const std::string& condition) const;

private:
    void add(IconId id, const std::string& name, std::initializer_list<const char*> aliases);

    std::map<std::string, IconId> lookup_;
    std::map<IconId, std::string> canonical_;
    std::map<std::string, IconId> weather_;
};

#endif // ICON_CATALOG_H
