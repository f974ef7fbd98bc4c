#pragma once

#include <QColor>
#include <QFont>
#include <QPainter>
#include <QPainterPath>
#include <QList>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QString>
#include <QStringList>

struct OverlaySpec {
    QString text;                // caption, trimmed before layout
    QColor accentColor = QColor(0xff, 0x7b, 0x7b);
    QStringList fontFamilies;    // tried in order; empty = platform default
};

// Placement of a wrapped caption inside the output frame
struct CaptionGeometry {
    int fontSize = 0;            // pixels
    double lineHeight = 0.0;
    double maxWidth = 0.0;
    QStringList lines;
    QRectF panelRect;

    int lineCount() const { return lines.size(); }
    double lineCenterY(int index) const;
};

// Bottom caption: translucent panel plus outlined, centered right-to-left text.
class CaptionOverlay {
public:
    explicit CaptionOverlay(const OverlaySpec& spec);

    const OverlaySpec& spec() const { return m_spec; }
    bool isEmpty() const { return m_spec.text.trimmed().isEmpty(); }

    // Wraps the caption with the metrics of the caption font and places it.
    CaptionGeometry measure(QSize frameSize) const;
    void paint(QPainter& painter, const CaptionGeometry& geometry, QSize frameSize) const;

    static int fontSizeFor(QSize frameSize);
    static QFont captionFont(const QStringList& families, int pixelSize);
    static CaptionGeometry placeLines(const QStringList& lines, QSize frameSize);

    // Registers font files with the application font database.
    // Returns the families they provide; unreadable files are logged and skipped.
    static QStringList registerFontFiles(const QStringList& files);

    // Outline shadow without a direction: the stroke is repeated at these
    // offsets around the glyphs instead of being shifted one way.
    static QList<QPointF> shadowOffsets();
    static void paintShadow(QPainter& painter, const QPainterPath& path, double strokeWidth);

    static constexpr int ShadowSamples = 8;
    static constexpr double ShadowRadius = 3.0;

protected:
    void paintBackground(QPainter& painter, const QRectF& rect) const;
    void paintLine(QPainter& painter, const QString& line, const QFont& font,
                   QPointF center, double boxWidth) const;

    // Glyph outlines of one line laid out right-to-left and centered on center.x
    static QPainterPath linePath(const QString& line, const QFont& font,
                                 QPointF center, double boxWidth);

private:
    OverlaySpec m_spec;
};
