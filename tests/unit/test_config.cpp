// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

namespace resolute {

// Test fixture for Config class testing
class ConfigTestFixture : public test::TempDirFixture {
  protected:
    Config config;

    json& data() {
        return config.data;
    }

    void setup_test_config() {
        config.data = {{"lifecycle", {{"persistent_background", true}, {"close_reshow_delay_ms", 500}}},
                       {"display", {{"backend", "mock"}, {"width", 640}}},
                       {"log_level", "debug"}};
    }

    json load_file(const std::string& file) const {
        std::ifstream in(file);
        return json::parse(in);
    }
};

} // namespace resolute

using namespace resolute;

// ============================================================================
// get()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values", "[config][get]") {
    setup_test_config();

    REQUIRE(config.get<bool>("/lifecycle/persistent_background"));
    REQUIRE(config.get<int>("/lifecycle/close_reshow_delay_ms") == 500);
    REQUIRE(config.get<std::string>("/display/backend") == "mock");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() throws on missing path or wrong type",
                 "[config][get]") {
    setup_test_config();

    REQUIRE_THROWS_AS(config.get<int>("/display/height"), json::exception);
    REQUIRE_THROWS_AS(config.get<int>("/display/backend"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default falls back", "[config][get]") {
    setup_test_config();

    SECTION("existing value wins") {
        REQUIRE(config.get<int>("/display/width", 1) == 640);
    }

    SECTION("missing key") {
        REQUIRE(config.get<int>("/display/height", 480) == 480);
    }

    SECTION("missing parent") {
        REQUIRE(config.get<std::string>("/worker/path", "none") == "none");
    }

    SECTION("type mismatch") {
        REQUIRE(config.get<int>("/log_level", 7) == 7);
    }
}

// ============================================================================
// set() / get_json()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects", "[config][set]") {
    setup_test_config();

    config.set<std::string>("/worker/path", "/opt/worker");
    REQUIRE(config.get<std::string>("/worker/path") == "/opt/worker");
    REQUIRE(data()["worker"].is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_json() returns a mutable reference",
                 "[config][set]") {
    setup_test_config();

    config.get_json("/display")["height"] = 360;
    REQUIRE(config.get<int>("/display/height") == 360);
}

// ============================================================================
// init() / save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: missing file is created from defaults",
                 "[config][init]") {
    std::string file = path("conf/resolute.json");

    REQUIRE_FALSE(config.init(file));
    REQUIRE(config.get_path() == file);
    REQUIRE(file_exists("conf/resolute.json"));
    REQUIRE(load_file(file) == Config::default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is replaced by defaults",
                 "[config][init]") {
    write_file("resolute.json", "{ not json");

    REQUIRE_FALSE(config.init(path("resolute.json")));
    REQUIRE(config.get<std::string>("/display/backend") == "auto");
    REQUIRE(load_file(path("resolute.json")) == Config::default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: non-object document is rejected", "[config][init]") {
    write_file("resolute.json", "[1, 2, 3]");

    REQUIRE_FALSE(config.init(path("resolute.json")));
    REQUIRE(data() == Config::default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: user values survive and missing keys are merged",
                 "[config][init]") {
    write_file("resolute.json",
               R"({"lifecycle": {"persistent_background": true}, "log_level": "trace"})");

    REQUIRE(config.init(path("resolute.json")));

    REQUIRE(config.get<bool>("/lifecycle/persistent_background"));
    REQUIRE(config.get<std::string>("/log_level") == "trace");
    REQUIRE(config.get<int>("/lifecycle/close_reshow_delay_ms") ==
            Config::default_config()["lifecycle"]["close_reshow_delay_ms"].get<int>());
    REQUIRE(config.get<bool>("/supervisor/enabled"));

    // Merged keys are written back
    json on_disk = load_file(path("resolute.json"));
    REQUIRE(on_disk["supervisor"]["enabled"] == true);
    REQUIRE(on_disk["log_level"] == "trace");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() round-trips and leaves no temp file",
                 "[config][save]") {
    std::string file = path("resolute.json");
    config.init(file);

    config.set<int>("/supervisor/restart_delay_sec", 9);
    REQUIRE(config.save());
    REQUIRE_FALSE(file_exists("resolute.json.tmp"));

    Config reloaded;
    REQUIRE(reloaded.init(file));
    REQUIRE(reloaded.get<int>("/supervisor/restart_delay_sec") == 9);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() before init() fails", "[config][save]") {
    REQUIRE_FALSE(config.save());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_in_range() clamps and falls back",
                 "[config][get]") {
    data() = {{"delays", {{"negative", -1}, {"huge", 4294967295LL}, {"ok", 250}, {"text", "soon"}}}};

    REQUIRE(config.get_in_range("/delays/negative", 5, 100, 1000) == 100);
    REQUIRE(config.get_in_range("/delays/huge", 5, 100, 1000) == 1000);
    REQUIRE(config.get_in_range("/delays/ok", 5, 100, 1000) == 250);
    REQUIRE(config.get_in_range("/delays/text", 500, 100, 1000) == 500);
    REQUIRE(config.get_in_range("/delays/missing", 500, 100, 1000) == 500);
}

TEST_CASE("Config: default document carries every section", "[config]") {
    json defaults = Config::default_config();

    for (const char* key : {"lifecycle", "supervisor", "worker", "display"}) {
        INFO(key);
        REQUIRE(defaults.contains(key));
        REQUIRE(defaults[key].is_object());
    }
    REQUIRE(defaults["lifecycle"]["persistent_background"] == false);
    REQUIRE(defaults["supervisor"]["enabled"] == true);
    REQUIRE(defaults["display"]["backend"] == "auto");
}
