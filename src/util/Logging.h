#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcImage)
Q_DECLARE_LOGGING_CATEGORY(lcOverlay)
Q_DECLARE_LOGGING_CATEGORY(lcEncode)
Q_DECLARE_LOGGING_CATEGORY(lcEngine)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace Logging {
    // Timestamped "[time] [category] level: message" output for the CLI
    void installMessagePattern();

    // Applies QLoggingCategory filter rules; verbose enables all photoreel debug output
    void applyRules(const QString& rules, bool verbose);
}
