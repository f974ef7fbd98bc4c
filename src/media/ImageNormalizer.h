#pragma once

#include <QObject>
#include <QByteArray>
#include <QImage>
#include <QString>
#include <memory>
#include "SourceImage.h"

// Turns arbitrary photo bytes into a SourceImage. Qt's image reader is tried
// first; if it rejects the data, FFmpeg decodes the first picture of the
// stream. There is no third strategy.
class ImageNormalizer : public QObject {
    Q_OBJECT
public:
    explicit ImageNormalizer(QObject* parent = nullptr);
    ~ImageNormalizer();

    // mimeType is only a hint; the format is always decided from content.
    // Returns nullptr and sets errorString() if both decoders fail.
    std::unique_ptr<SourceImage> normalize(const QByteArray& data,
                                           const QString& mimeType = QString());

    QString errorString() const { return m_error; }

    static bool decodeWithQt(const QByteArray& data, const QString& mimeType,
                             QImage& out, QString& error);
    static bool decodeWithFFmpeg(const QByteArray& data, QImage& out, QString& error);

private:
    QString m_error;
};
