// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "exit_classifier.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace resolute;

// ============================================================================
// classify()
// ============================================================================

TEST_CASE("ExitClassifier: only a user-requested exit is clean", "[core][exit]") {
    REQUIRE(ExitClassifier::classify(QuitIntent::UserRequested) == ExitDisposition::Clean);
    REQUIRE(ExitClassifier::classify(QuitIntent::SystemRequested) == ExitDisposition::Abnormal);
    REQUIRE(ExitClassifier::classify(QuitIntent::Unknown) == ExitDisposition::Abnormal);
}

TEST_CASE("ExitClassifier: exit codes", "[core][exit]") {
    REQUIRE(exit_code_for(ExitDisposition::Clean) == 0);
    REQUIRE(exit_code_for(ExitDisposition::Abnormal) == 1);
}

TEST_CASE("ExitClassifier: classify_final answers once", "[exit]") {
    ExitClassifier classifier;
    REQUIRE_FALSE(classifier.has_classified());

    REQUIRE(classifier.classify_final(QuitIntent::SystemRequested) == ExitDisposition::Abnormal);
    REQUIRE(classifier.has_classified());

    // A second request keeps the first answer
    REQUIRE(classifier.classify_final(QuitIntent::UserRequested) == ExitDisposition::Abnormal);
}

TEST_CASE("ExitClassifier: names for log lines", "[exit]") {
    REQUIRE(std::string(quit_intent_name(QuitIntent::UserRequested)) == "UserRequested");
    REQUIRE(std::string(exit_disposition_name(ExitDisposition::Abnormal)) == "Abnormal");
}

// ============================================================================
// QuitIntentRecorder
// ============================================================================

TEST_CASE("QuitIntentRecorder: starts unknown", "[core][exit][intent]") {
    QuitIntentRecorder intent;
    REQUIRE(intent.current() == QuitIntent::Unknown);
    REQUIRE_FALSE(intent.is_user_requested());
}

TEST_CASE("QuitIntentRecorder: first value wins", "[core][exit][intent]") {
    QuitIntentRecorder intent;

    SECTION("user first") {
        REQUIRE(intent.record(QuitIntent::UserRequested));
        REQUIRE_FALSE(intent.record(QuitIntent::SystemRequested));
        REQUIRE(intent.current() == QuitIntent::UserRequested);
        REQUIRE(intent.is_user_requested());
    }

    SECTION("system first") {
        REQUIRE(intent.record(QuitIntent::SystemRequested));
        REQUIRE_FALSE(intent.record(QuitIntent::UserRequested));
        REQUIRE(intent.current() == QuitIntent::SystemRequested);
        REQUIRE_FALSE(intent.is_user_requested());
    }
}

TEST_CASE("QuitIntentRecorder: Unknown is not a value", "[exit][intent]") {
    QuitIntentRecorder intent;
    REQUIRE_FALSE(intent.record(QuitIntent::Unknown));
    REQUIRE(intent.record(QuitIntent::UserRequested));
    REQUIRE(intent.current() == QuitIntent::UserRequested);
}
