#include <catch2/catch_test_macros.hpp>

#include "window/window_spec.hpp"

TEST_CASE("Window matching", "[matcher]") {
    Window firefox{.id = "0x02a00001", .desktop = "0", .pid = "4346",
                   .wm_class = "Navigator.Firefox", .machine = "mistakenot",
                   .title = "The Mock Class - Mock 1.0.1 documentation - Firefox"};

    SECTION("SubstringOfAttribute") {
        WindowSpec spec;
        spec.set("wm_class", ".Firefox");
        REQUIRE(matches(firefox, spec));
    }

    SECTION("CaseInsensitive") {
        WindowSpec spec;
        spec.set("wm_class", "navigator.FIREFOX");
        spec.set("title", "mock class");
        REQUIRE(matches(firefox, spec));
    }

    SECTION("MismatchedTitle") {
        Window w{.id = "1", .title = "abc"};
        WindowSpec spec;
        spec.set("title", "XYZ");
        REQUIRE_FALSE(matches(w, spec));
    }

    SECTION("EveryKeyMustMatch") {
        WindowSpec spec;
        spec.set("wm_class", "Firefox");
        spec.set("desktop", "3");
        REQUIRE_FALSE(matches(firefox, spec));
    }

    SECTION("UnknownAttributeFails") {
        WindowSpec spec;
        spec.set("role", "browser");
        REQUIRE_FALSE(matches(firefox, spec));
    }

    SECTION("CommandIsIgnored") {
        WindowSpec spec;
        spec.set("wm_class", "Firefox");
        spec.set("command", "chromium");
        REQUIRE(matches(firefox, spec));
        REQUIRE(spec.command == "chromium");
        REQUIRE(spec.fields.size() == 1);
    }

    SECTION("EmptySpecMatchesEverything") {
        WindowSpec spec;
        REQUIRE_FALSE(spec.has_match_keys());
        REQUIRE(matches(firefox, spec));
        REQUIRE(matches(Window{.id = "2"}, spec));

        spec.set("command", "firefox");
        REQUIRE_FALSE(spec.has_match_keys());
        REQUIRE(matches(firefox, spec));
    }

    SECTION("MatchById") {
        WindowSpec spec;
        spec.set("id", "0x02a00001");
        REQUIRE(matches(firefox, spec));
        REQUIRE_FALSE(matches(Window{.id = "0x02a00002"}, spec));
    }

    SECTION("OverlayReplacesKeys") {
        WindowSpec base;
        base.set("wm_class", "Firefox");
        base.set("command", "firefox");

        WindowSpec overrides;
        overrides.set("wm_class", "Chromium");
        overrides.set("title", "Inbox");
        base.overlay(overrides);

        REQUIRE(base.fields.at("wm_class") == "Chromium");
        REQUIRE(base.fields.at("title") == "Inbox");
        REQUIRE(base.command == "firefox");
    }
}
