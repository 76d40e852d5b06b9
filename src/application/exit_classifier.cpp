// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "exit_classifier.h"

#include "app_constants.h"

#include <spdlog/spdlog.h>

namespace resolute {

const char* quit_intent_name(QuitIntent intent) {
    switch (intent) {
    case QuitIntent::Unknown:
        return "Unknown";
    case QuitIntent::UserRequested:
        return "UserRequested";
    case QuitIntent::SystemRequested:
        return "SystemRequested";
    }
    return "Invalid";
}

const char* exit_disposition_name(ExitDisposition disposition) {
    switch (disposition) {
    case ExitDisposition::Clean:
        return "Clean";
    case ExitDisposition::Abnormal:
        return "Abnormal";
    }
    return "Invalid";
}

int exit_code_for(ExitDisposition disposition) {
    return disposition == ExitDisposition::Clean ? AppConstants::ExitCode::CLEAN
                                                 : AppConstants::ExitCode::ABNORMAL;
}

bool QuitIntentRecorder::record(QuitIntent intent) {
    if (intent == QuitIntent::Unknown) {
        return false;
    }
    if (intent_ != QuitIntent::Unknown) {
        spdlog::debug("[QuitIntent] Ignoring {} (already {})", quit_intent_name(intent),
                      quit_intent_name(intent_));
        return false;
    }
    intent_ = intent;
    spdlog::info("[QuitIntent] Recorded {}", quit_intent_name(intent));
    return true;
}

ExitDisposition ExitClassifier::classify(QuitIntent intent) {
    return intent == QuitIntent::UserRequested ? ExitDisposition::Clean
                                               : ExitDisposition::Abnormal;
}

ExitDisposition ExitClassifier::classify_final(QuitIntent intent) {
    if (result_) {
        spdlog::error("[ExitClassifier] Classified twice; keeping {}",
                      exit_disposition_name(*result_));
        return *result_;
    }
    result_ = classify(intent);
    spdlog::info("[ExitClassifier] intent={} -> {} (exit code {})", quit_intent_name(intent),
                 exit_disposition_name(*result_), exit_code_for(*result_));
    return *result_;
}

} // namespace resolute
