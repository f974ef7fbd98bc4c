#include "ImageUtil.h"
#include <QBuffer>
#include <QImageWriter>
#include <QRegularExpression>

namespace ImageUtil {

bool encodePng(const QImage& image, QByteArray& out) {
    if (image.isNull()) return false;

    out.clear();
    QBuffer buffer(&out);
    if (!buffer.open(QIODevice::WriteOnly)) return false;

    QImageWriter writer(&buffer, "png");
    if (!writer.write(image)) {
        out.clear();
        return false;
    }
    return true;
}

bool parseAccentColor(const QString& text, QColor& color) {
    static const QRegularExpression re(R"(^#[0-9a-fA-F]{6}$)");
    if (!re.match(text.trimmed()).hasMatch()) return false;

    color = QColor(text.trimmed());
    return color.isValid();
}

QImage createPlaceholder(int width, int height, const QColor& fill) {
    QImage img(width, height, QImage::Format_RGB32);
    img.fill(fill);
    return img;
}

} // namespace ImageUtil
