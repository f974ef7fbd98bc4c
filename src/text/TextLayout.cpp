#include "TextLayout.h"
#include <QRegularExpression>

namespace TextLayout {

QStringList wrap(const QString& text, double maxWidth, const MeasureFn& measure) {
    QStringList lines;
    if (text.isEmpty()) return lines;

    static const QRegularExpression paragraphSep(R"(\s*\n+\s*)");
    static const QRegularExpression wordSep(R"(\s+)");

    const QStringList paragraphs = text.split(paragraphSep);
    for (const QString& paragraph : paragraphs) {
        const QStringList words = paragraph.split(wordSep, Qt::SkipEmptyParts);
        if (words.isEmpty()) continue;

        QString current = words.first();
        for (int i = 1; i < words.size(); ++i) {
            QString candidate = current + ' ' + words[i];
            if (measure(candidate) > maxWidth) {
                lines.append(current);
                current = words[i];
            } else {
                current = candidate;
            }
        }
        lines.append(current);
    }

    return lines;
}

} // namespace TextLayout
