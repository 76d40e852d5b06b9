// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file exit_classifier.h
 * @brief Quit intent bookkeeping and the exit-code decision it drives
 *
 * The supervisor relaunches the process on any non-zero exit. The only thing
 * that makes an exit clean is an explicit, sanctioned user request, so the
 * recorded QuitIntent is the single input to the final exit code.
 */

#pragma once

#include <optional>

namespace resolute {

/**
 * @brief Why a termination sequence began
 */
enum class QuitIntent {
    Unknown,         ///< Nothing recorded yet
    UserRequested,   ///< Sanctioned exit control (Ctrl+Q, --quit, SIGUSR2)
    SystemRequested, ///< Everything else that ends the process (faults)
};

/**
 * @brief Exit code class consumed by the supervisor
 */
enum class ExitDisposition { Clean, Abnormal };

const char* quit_intent_name(QuitIntent intent);
const char* exit_disposition_name(ExitDisposition disposition);

/**
 * @brief Map a disposition to the process exit code (Clean 0, Abnormal 1)
 */
int exit_code_for(ExitDisposition disposition);

/**
 * @brief Write-once holder for the Quit Intent
 *
 * The first non-Unknown value sticks; every later record() is ignored.
 * Once UserRequested is recorded nothing can downgrade it.
 */
class QuitIntentRecorder {
  public:
    /**
     * @brief Record an intent
     * @return true if this call set the intent, false if it was already set
     *         or intent is Unknown
     */
    bool record(QuitIntent intent);

    QuitIntent current() const {
        return intent_;
    }

    bool is_user_requested() const {
        return intent_ == QuitIntent::UserRequested;
    }

  private:
    QuitIntent intent_ = QuitIntent::Unknown;
};

/**
 * @brief Derives the exit disposition from the final Quit Intent
 *
 * classify() is pure. The classifier remembers its first answer so the
 * final teardown hook can only ever produce one result; a second request is
 * logged and answered with the first result.
 */
class ExitClassifier {
  public:
    /**
     * @brief Pure mapping: UserRequested -> Clean, anything else -> Abnormal
     */
    static ExitDisposition classify(QuitIntent intent);

    /**
     * @brief Classify once at final teardown
     */
    ExitDisposition classify_final(QuitIntent intent);

    bool has_classified() const {
        return result_.has_value();
    }

  private:
    std::optional<ExitDisposition> result_;
};

} // namespace resolute
