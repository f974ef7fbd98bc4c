#include "CaptionOverlay.h"
#include "AppConstants.h"
#include "Logging.h"
#include "TextLayout.h"
#include <QFontDatabase>
#include <QFontInfo>
#include <QFontMetricsF>
#include <QGlyphRun>
#include <QPen>
#include <QRawFont>
#include <QTextLayout>
#include <QTextOption>
#include <QtMath>
#include <algorithm>
#include <cmath>

double CaptionGeometry::lineCenterY(int index) const {
    return panelRect.top() + panelRect.height() / 2.0
        - (lines.size() - 1) * lineHeight * 0.5
        + index * lineHeight;
}

CaptionOverlay::CaptionOverlay(const OverlaySpec& spec) : m_spec(spec) {
    m_spec.text = m_spec.text.trimmed();
}

int CaptionOverlay::fontSizeFor(QSize frameSize) {
    return qRound(frameSize.height() * AppConstants::CaptionFontRatio);
}

QFont CaptionOverlay::captionFont(const QStringList& families, int pixelSize) {
    QFont font;
    if (!families.isEmpty()) font.setFamilies(families);
    font.setPixelSize(qMax(1, pixelSize));
    font.setWeight(QFont::DemiBold);
    font.setStyleStrategy(QFont::PreferAntialias);
    return font;
}

CaptionGeometry CaptionOverlay::placeLines(const QStringList& lines, QSize frameSize) {
    CaptionGeometry g;
    g.fontSize = fontSizeFor(frameSize);
    g.lineHeight = g.fontSize * AppConstants::CaptionLineHeightRatio;
    g.maxWidth = frameSize.width() * AppConstants::CaptionMaxWidthRatio;
    g.lines = lines;

    const double totalHeight = lines.size() * g.lineHeight;
    const double panelHeight = totalHeight + g.fontSize * AppConstants::CaptionPanelPaddingRatio;
    const double panelY = frameSize.height() - panelHeight - AppConstants::CaptionPanelBottomMargin;
    const double margin = AppConstants::CaptionPanelSideMargin;

    g.panelRect = QRectF((frameSize.width() - g.maxWidth) / 2.0 - margin, panelY,
                         g.maxWidth + 2 * margin, panelHeight);
    return g;
}

CaptionGeometry CaptionOverlay::measure(QSize frameSize) const {
    const int fontSize = fontSizeFor(frameSize);
    const QFont font = captionFont(m_spec.fontFamilies, fontSize);
    const QFontMetricsF fm(font);

    qCDebug(lcOverlay) << "Caption font resolved to" << QFontInfo(font).family()
                       << fontSize << "px";

    const double maxWidth = frameSize.width() * AppConstants::CaptionMaxWidthRatio;
    const QStringList lines = TextLayout::wrap(m_spec.text, maxWidth,
        [&fm](const QString& candidate) { return fm.horizontalAdvance(candidate); });

    return placeLines(lines, frameSize);
}

void CaptionOverlay::paint(QPainter& painter, const CaptionGeometry& geometry, QSize frameSize) const {
    if (geometry.lines.isEmpty()) return;

    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    paintBackground(painter, geometry.panelRect);

    const QFont font = captionFont(m_spec.fontFamilies, geometry.fontSize);
    const double centerX = frameSize.width() / 2.0;
    for (int i = 0; i < geometry.lines.size(); ++i) {
        paintLine(painter, geometry.lines[i], font,
                  QPointF(centerX, geometry.lineCenterY(i)), geometry.maxWidth);
    }

    painter.restore();
}

void CaptionOverlay::paintBackground(QPainter& painter, const QRectF& rect) const {
    painter.fillRect(rect, QColor(0, 0, 0, 115));  // 45% black
}

void CaptionOverlay::paintLine(QPainter& painter, const QString& line, const QFont& font,
                               QPointF center, double boxWidth) const {
    const QPainterPath path = linePath(line, font, center, boxWidth);
    if (path.isEmpty()) return;

    const double strokeWidth = qMax(4.0, font.pixelSize() * 0.08);
    paintShadow(painter, path, strokeWidth);

    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(m_spec.accentColor, strokeWidth,
                        Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.drawPath(path);

    painter.fillPath(path, Qt::white);
}

QList<QPointF> CaptionOverlay::shadowOffsets() {
    QList<QPointF> offsets{QPointF(0.0, 0.0)};
    for (int i = 0; i < ShadowSamples; ++i) {
        const double angle = 2.0 * M_PI * i / ShadowSamples;
        offsets.append(QPointF(ShadowRadius * qCos(angle), ShadowRadius * qSin(angle)));
    }
    return offsets;
}

void CaptionOverlay::paintShadow(QPainter& painter, const QPainterPath& path, double strokeWidth) {
    // Where every sample overlaps the halo reaches 45% black
    const QList<QPointF> offsets = shadowOffsets();
    const int alpha = qRound(255.0 * (1.0 - std::pow(1.0 - 0.45, 1.0 / offsets.size())));

    painter.save();
    painter.setBrush(Qt::NoBrush);
    painter.setPen(QPen(QColor(0, 0, 0, alpha), strokeWidth + 4.0,
                        Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    for (const QPointF& offset : offsets) {
        painter.drawPath(path.translated(offset));
    }
    painter.restore();
}

QPainterPath CaptionOverlay::linePath(const QString& line, const QFont& font,
                                      QPointF center, double boxWidth) {
    QPainterPath path;
    const QFontMetricsF fm(font);
    // An overflowing single word gets a box of its own width so it stays centered
    const double lineWidth = std::max(boxWidth, fm.horizontalAdvance(line));

    QTextOption option(Qt::AlignHCenter);
    option.setTextDirection(Qt::RightToLeft);
    option.setWrapMode(QTextOption::NoWrap);

    QTextLayout layout(line, font);
    layout.setTextOption(option);
    layout.beginLayout();
    QTextLine textLine = layout.createLine();
    if (textLine.isValid()) {
        textLine.setLineWidth(lineWidth);
        textLine.setPosition(QPointF(0.0, 0.0));
    }
    layout.endLayout();
    if (!textLine.isValid()) return path;

    // Vertically centered on the em box, like a "middle" text baseline
    const double baseline = center.y() + (fm.ascent() - fm.descent()) / 2.0;
    const QPointF origin(center.x() - lineWidth / 2.0, baseline - textLine.ascent());

    const QList<QGlyphRun> runs = textLine.glyphRuns();
    for (const QGlyphRun& run : runs) {
        const QRawFont rawFont = run.rawFont();
        const QList<quint32> indexes = run.glyphIndexes();
        const QList<QPointF> positions = run.positions();
        for (int i = 0; i < indexes.size() && i < positions.size(); ++i) {
            QPainterPath glyph = rawFont.pathForGlyph(indexes[i]);
            glyph.translate(origin + positions[i]);
            path.addPath(glyph);
        }
    }
    return path;
}

QStringList CaptionOverlay::registerFontFiles(const QStringList& files) {
    QStringList families;
    for (const QString& file : files) {
        const int id = QFontDatabase::addApplicationFont(file);
        if (id < 0) {
            qCWarning(lcOverlay) << "Cannot load font file" << file;
            continue;
        }
        const QStringList provided = QFontDatabase::applicationFontFamilies(id);
        qCInfo(lcOverlay) << "Loaded font" << file << provided;
        families += provided;
    }
    return families;
}
