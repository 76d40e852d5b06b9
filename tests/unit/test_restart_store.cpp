// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "restart_store.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <ctime>
#include <string>
#include <unistd.h>

using namespace resolute;
using resolute::test::TempDirFixture;

class RestartStoreFixture : public TempDirFixture {
  protected:
    RestartStoreFixture() : store(paths.state_dir), marker(store) {}

    RestartStore store;
    LivenessMarker marker;
};

// ============================================================================
// RestartStore
// ============================================================================

TEST_CASE_METHOD(RestartStoreFixture, "RestartStore: missing key reads as absent",
                 "[core][restart]") {
    REQUIRE_FALSE(store.exists("nothing"));
    REQUIRE_FALSE(store.read("nothing").has_value());
}

TEST_CASE_METHOD(RestartStoreFixture, "RestartStore: write, read, clear", "[core][restart]") {
    REQUIRE(store.write("key", "value"));
    REQUIRE(store.exists("key"));
    REQUIRE(store.read("key").value() == "value");

    REQUIRE(store.write("key", "replaced"));
    REQUIRE(store.read("key").value() == "replaced");

    REQUIRE(store.clear("key"));
    REQUIRE_FALSE(store.exists("key"));
}

TEST_CASE_METHOD(RestartStoreFixture, "RestartStore: clearing an absent key succeeds",
                 "[restart]") {
    REQUIRE(store.clear("never-written"));
}

TEST_CASE_METHOD(RestartStoreFixture, "RestartStore: write leaves no temp files behind",
                 "[restart]") {
    REQUIRE(store.write("key", "value"));
    REQUIRE_FALSE(file_exists("state/key.tmp." + std::to_string(getpid())));
}

TEST_CASE("RestartStore: unwritable directory reports failure", "[restart]") {
    RestartStore store("/nonexistent/resolute/state");
    REQUIRE_FALSE(store.write("key", "value"));
    REQUIRE_FALSE(store.read("key").has_value());
    REQUIRE_FALSE(store.exists("key"));
}

TEST_CASE_METHOD(RestartStoreFixture, "RestartStore: a directory under the key is not a value",
                 "[restart]") {
    write_file("state/dir/inner", "x");
    REQUIRE_FALSE(store.exists("dir"));
}

// ============================================================================
// LivenessMarker
// ============================================================================

TEST_CASE_METHOD(RestartStoreFixture, "LivenessMarker: stamp and clear", "[core][restart][marker]") {
    REQUIRE_FALSE(marker.present());

    std::time_t before = std::time(nullptr);
    REQUIRE(marker.stamp());
    REQUIRE(marker.present());

    auto written = marker.written_at();
    REQUIRE(written.has_value());
    REQUIRE(*written >= before);
    REQUIRE(*written <= std::time(nullptr));

    REQUIRE(marker.clear());
    REQUIRE_FALSE(marker.present());
    REQUIRE_FALSE(marker.written_at().has_value());
}

TEST_CASE_METHOD(RestartStoreFixture, "LivenessMarker: garbage content is present but undated",
                 "[restart][marker]") {
    write_file("state/liveness", "not a timestamp");
    REQUIRE(marker.present());
    REQUIRE_FALSE(marker.written_at().has_value());
}

TEST_CASE_METHOD(RestartStoreFixture, "LivenessMarker: path lives in the state directory",
                 "[restart][marker]") {
    REQUIRE(marker.path() == paths.state_dir + "/liveness");
}
