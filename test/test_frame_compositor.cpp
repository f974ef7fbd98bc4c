#include <cassert>
#include <cstdio>
#include <cmath>
#include <QGuiApplication>
#include <QFontMetricsF>
#include <QImage>
#include <QPainter>
#include <QPainterPath>
#include "overlay/CaptionOverlay.h"
#include "overlay/FrameCompositor.h"
#include "media/ImageUtil.h"
#include "media/SourceImage.h"
#include "CaptionText.h"

static bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

static QImage decodeFrame(const CompositedFrame& frame) {
    QImage img;
    img.loadFromData(frame.png, "PNG");
    return img.convertToFormat(QImage::Format_RGB32);
}

void test_letterbox_geometry() {
    const QSize target(1280, 720);

    LetterboxGeometry wide = FrameCompositor::letterbox(QSize(1920, 1080), target);
    assert(near(wide.scale, 2.0 / 3.0));
    assert(near(wide.drawWidth, 1280) && near(wide.drawHeight, 720));
    assert(near(wide.offsetX, 0) && near(wide.offsetY, 0));

    LetterboxGeometry square = FrameCompositor::letterbox(QSize(800, 800), target);
    assert(near(square.scale, 0.9));
    assert(near(square.drawWidth, 720) && near(square.drawHeight, 720));
    assert(near(square.offsetX, 280) && near(square.offsetY, 0));

    LetterboxGeometry tall = FrameCompositor::letterbox(QSize(100, 400), target);
    assert(near(tall.scale, 1.8));
    assert(near(tall.drawWidth, 180) && near(tall.offsetX, 550));

    for (QSize src : {QSize(3000, 100), QSize(7, 9), QSize(1280, 720), QSize(640, 2000)}) {
        LetterboxGeometry g = FrameCompositor::letterbox(src, target);
        assert(g.drawWidth <= 1280 + 1e-9 && g.drawHeight <= 720 + 1e-9);
        assert(near(g.offsetX * 2 + g.drawWidth, 1280));
        assert(near(g.offsetY * 2 + g.drawHeight, 720));
    }
    printf("PASS: test_letterbox_geometry\n");
}

void test_caption_placement() {
    const QSize frame(1280, 720);
    assert(CaptionOverlay::fontSizeFor(frame) == 47);

    CaptionGeometry g = CaptionOverlay::placeLines({"one", "two", "three"}, frame);
    assert(g.lineCount() == 3);
    assert(near(g.lineHeight, 47 * 1.35));
    assert(near(g.maxWidth, 960));
    assert(near(g.panelRect.x(), 112));
    assert(near(g.panelRect.width(), 1056));
    assert(near(g.panelRect.height(), 3 * 47 * 1.35 + 47 * 0.9));
    assert(near(g.panelRect.bottom(), 720 - 48));
    // Middle line sits on the panel center
    assert(near(g.lineCenterY(1), g.panelRect.center().y()));
    assert(near(g.lineCenterY(2) - g.lineCenterY(0), 2 * g.lineHeight));
    printf("PASS: test_caption_placement\n");
}

void test_compose_without_caption() {
    SourceImage source(ImageUtil::createPlaceholder(1920, 1080, Qt::white), DecodePath::QtReader);
    FrameCompositor compositor;
    CompositedFrame frame;

    OverlaySpec overlay;
    overlay.text = "   \n  ";
    assert(compositor.compose(source, overlay, frame));
    assert(source.isReleased());
    assert(!frame.hasOverlay);
    assert(frame.size == QSize(1280, 720));

    QImage raw;
    const bool loaded = raw.loadFromData(frame.png, "PNG");
    assert(loaded);
    assert(!raw.hasAlphaChannel());

    QImage img = decodeFrame(frame);
    assert(img.size() == QSize(1280, 720));
    assert(img.pixelColor(640, 360) == QColor(Qt::white));
    assert(img.pixelColor(640, 700) == QColor(Qt::white));
    printf("PASS: test_compose_without_caption\n");
}

void test_compose_letterbox_background() {
    SourceImage source(ImageUtil::createPlaceholder(800, 800, Qt::white), DecodePath::QtReader);
    FrameCompositor compositor;
    CompositedFrame frame;

    assert(compositor.compose(source, OverlaySpec(), frame));
    QImage img = decodeFrame(frame);
    assert(img.pixelColor(10, 360) == QColor(0x05, 0x05, 0x05));
    assert(img.pixelColor(1270, 360) == QColor(0x05, 0x05, 0x05));
    assert(img.pixelColor(640, 360) == QColor(Qt::white));
    printf("PASS: test_compose_letterbox_background\n");
}

void test_compose_three_line_caption() {
    SourceImage source(ImageUtil::createPlaceholder(800, 800, Qt::white), DecodePath::QtReader);
    FrameCompositor compositor;
    CompositedFrame frame;

    OverlaySpec overlay;
    overlay.text = "  one\ntwo\nthree  ";
    overlay.accentColor = QColor("#ff7b7b");
    assert(compositor.compose(source, overlay, frame));
    assert(frame.hasOverlay);
    assert(frame.caption.lineCount() == 3);
    assert(frame.caption.lines[0] == "one");
    assert(frame.caption.lines[2] == "three");
    assert(near(frame.caption.panelRect.height(), 3 * 47 * 1.35 + 47 * 0.9));

    // Panel corner, over the white photo and above the first text line
    QImage img = decodeFrame(frame);
    const QPointF probe(300, frame.caption.panelRect.top() + 5);
    const QColor px = img.pixelColor(probe.toPoint());
    assert(px.red() > 125 && px.red() < 155);
    assert(px.red() == px.green() && px.green() == px.blue());

    // Above the panel the photo is untouched
    assert(img.pixelColor(300, 100) == QColor(Qt::white));
    printf("PASS: test_compose_three_line_caption\n");
}

void test_compose_wraps_long_caption() {
    const QString text = paragraphWrappingTo(3, QSize(1280, 720));
    assert(!text.contains('\n'));

    SourceImage source(ImageUtil::createPlaceholder(800, 800, Qt::white), DecodePath::QtReader);
    FrameCompositor compositor;
    CompositedFrame frame;

    OverlaySpec overlay;
    overlay.text = text;
    assert(compositor.compose(source, overlay, frame));
    assert(frame.hasOverlay);
    assert(frame.caption.lineCount() == 3);
    assert(frame.caption.lines.join(' ') == text);

    const QFontMetricsF fm(CaptionOverlay::captionFont(QStringList(), 47));
    for (const QString& line : frame.caption.lines) {
        assert(!line.contains(' ') || fm.horizontalAdvance(line) <= 960.0);
    }
    assert(near(frame.caption.panelRect.height(), 3 * 47 * 1.35 + 47 * 0.9));
    printf("PASS: test_compose_wraps_long_caption\n");
}

void test_shadow_has_no_direction() {
    double sumX = 0.0;
    double sumY = 0.0;
    for (const QPointF& p : CaptionOverlay::shadowOffsets()) {
        sumX += p.x();
        sumY += p.y();
    }
    assert(near(sumX, 0.0) && near(sumY, 0.0));

    // A vertical stroke on the x = 50 pixel boundary darkens both sides alike
    QImage img(100, 100, QImage::Format_RGB32);
    img.fill(Qt::white);
    QPainter painter(&img);
    painter.setRenderHint(QPainter::Antialiasing, true);
    QPainterPath path;
    path.moveTo(50, 20);
    path.lineTo(50, 80);
    CaptionOverlay::paintShadow(painter, path, 4.0);
    painter.end();

    const QColor left = img.pixelColor(45, 50);
    const QColor right = img.pixelColor(54, 50);
    assert(left.red() < 250 && right.red() < 250);
    assert(std::abs(left.red() - right.red()) <= 2);
    assert(std::abs(img.pixelColor(50, 15).red() - img.pixelColor(50, 84).red()) <= 2);
    printf("PASS: test_shadow_has_no_direction\n");
}

void test_compose_released_source_fails() {
    SourceImage source(ImageUtil::createPlaceholder(100, 100, Qt::red), DecodePath::QtReader);
    source.release();

    FrameCompositor compositor;
    CompositedFrame frame;
    assert(!compositor.compose(source, OverlaySpec(), frame));
    assert(!compositor.errorString().isEmpty());
    assert(frame.png.isEmpty());
    printf("PASS: test_compose_released_source_fails\n");
}

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);

    test_letterbox_geometry();
    test_caption_placement();
    test_compose_without_caption();
    test_compose_letterbox_background();
    test_compose_three_line_caption();
    test_compose_wraps_long_caption();
    test_shadow_has_no_direction();
    test_compose_released_source_fails();
    printf("All frame compositor tests passed.\n");
    return 0;
}
