#pragma once

#include <QObject>
#include <QByteArray>
#include <QRectF>
#include <QSize>
#include <QString>
#include "CaptionOverlay.h"

class SourceImage;

struct LetterboxGeometry {
    double scale = 0.0;
    double drawWidth = 0.0;
    double drawHeight = 0.0;
    double offsetX = 0.0;
    double offsetY = 0.0;

    QRectF rect() const { return QRectF(offsetX, offsetY, drawWidth, drawHeight); }
};

// Still frame handed to the encoder
struct CompositedFrame {
    QByteArray png;
    QSize size;
    bool hasOverlay = false;
    CaptionGeometry caption;   // valid when hasOverlay
};

// Renders background, letterboxed photo and caption into one output-sized frame.
class FrameCompositor : public QObject {
    Q_OBJECT
public:
    explicit FrameCompositor(QObject* parent = nullptr);
    ~FrameCompositor();

    // Always releases the source image, on success and on failure.
    bool compose(SourceImage& source, const OverlaySpec& overlay, CompositedFrame& frame);

    static LetterboxGeometry letterbox(QSize source, QSize target);
    static QSize frameSize();

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
