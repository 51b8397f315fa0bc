#include "IconCatalog.h"
#include <catch2/catch.hpp>

TEST_CASE("Icon lookup", "[icons]") {
    IconCatalog icons;

    SECTION("Canonical names, aliases and mdi names resolve") {
        REQUIRE(icons.find("thermometer") == IconId::Thermometer);
        REQUIRE(icons.find("temperature") == IconId::Thermometer);
        REQUIRE(icons.find("mdi:thermometer") == IconId::Thermometer);
        REQUIRE(icons.find("mdi:bell-ring") == IconId::Bell);
        REQUIRE(icons.find("lock") == IconId::Lock);
    }

    SECTION("Outline variants map to the base icon") {
        REQUIRE(icons.find("mdi:bell-outline") == IconId::Bell);
    }

    SECTION("Unknown names are not found") {
        REQUIRE_FALSE(icons.find("mdi:definitely-not-an-icon").has_value());
        REQUIRE_FALSE(icons.find("").has_value());
    }

    SECTION("Catalog covers the built-in set") {
        REQUIRE(icons.size() >= 45);
        REQUIRE(icons.names().size() == icons.size());
        REQUIRE(icons.name_of(IconId::Thermometer) == "thermometer");
    }
}

TEST_CASE("Weather conditions map to icons", "[icons]") {
    IconCatalog icons;
    REQUIRE(icons.weather_icon("sunny") == IconId::Sun);
    REQUIRE(icons.weather_icon("rainy") == IconId::Rain);
    REQUIRE(icons.weather_icon("some-new-condition") == IconId::Cloud);
}
