#pragma once

#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QString>

namespace ImageUtil {
    // Lossless PNG encoding of a rendered frame. Returns false if the writer fails.
    bool encodePng(const QImage& image, QByteArray& out);

    // Accepts "#rrggbb" only; the color picker never produces other forms.
    bool parseAccentColor(const QString& text, QColor& color);

    // Solid test/placeholder image of the given size
    QImage createPlaceholder(int width, int height, const QColor& fill);
}
