#include "Logging.h"
#include <QString>

Q_LOGGING_CATEGORY(lcImage, "photoreel.image", QtInfoMsg)
Q_LOGGING_CATEGORY(lcOverlay, "photoreel.overlay", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEncode, "photoreel.encode", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEngine, "photoreel.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "photoreel.app", QtInfoMsg)

namespace Logging {

void installMessagePattern() {
    qSetMessagePattern("[%{time yyyy-MM-dd hh:mm:ss.zzz}] [%{category}] %{type}: %{message}");
}

void applyRules(const QString& rules, bool verbose) {
    QString effective = rules;
    if (verbose) {
        if (!effective.isEmpty()) effective += '\n';
        effective += "photoreel.*.debug=true";
    }
    if (!effective.isEmpty()) {
        QLoggingCategory::setFilterRules(effective);
    }
}

} // namespace Logging
