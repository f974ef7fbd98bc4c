#include "FrameCompositor.h"
#include "AppConstants.h"
#include "ImageUtil.h"
#include "Logging.h"
#include "SourceImage.h"
#include <QImage>
#include <QPainter>
#include <QtGlobal>

namespace {

// Releases the decoded photo when compositing leaves scope, whatever the path
class SourceReleaser {
public:
    explicit SourceReleaser(SourceImage& source) : m_source(source) {}
    ~SourceReleaser() { m_source.release(); }

    SourceReleaser(const SourceReleaser&) = delete;
    SourceReleaser& operator=(const SourceReleaser&) = delete;

private:
    SourceImage& m_source;
};

} // namespace

FrameCompositor::FrameCompositor(QObject* parent) : QObject(parent) {}
FrameCompositor::~FrameCompositor() = default;

QSize FrameCompositor::frameSize() {
    return QSize(AppConstants::VideoWidth, AppConstants::VideoHeight);
}

LetterboxGeometry FrameCompositor::letterbox(QSize source, QSize target) {
    LetterboxGeometry g;
    if (source.width() <= 0 || source.height() <= 0) return g;

    g.scale = qMin(static_cast<double>(target.width()) / source.width(),
                   static_cast<double>(target.height()) / source.height());
    g.drawWidth = source.width() * g.scale;
    g.drawHeight = source.height() * g.scale;
    g.offsetX = (target.width() - g.drawWidth) / 2.0;
    g.offsetY = (target.height() - g.drawHeight) / 2.0;
    return g;
}

bool FrameCompositor::compose(SourceImage& source, const OverlaySpec& overlay, CompositedFrame& frame) {
    SourceReleaser releaser(source);
    m_error.clear();
    frame = CompositedFrame{};

    const QSize size = frameSize();
    QImage canvas(size, QImage::Format_RGB32);   // always opaque
    if (canvas.isNull()) {
        m_error = "Cannot allocate frame canvas";
        return false;
    }
    canvas.fill(QColor(0x05, 0x05, 0x05));

    QPainter painter(&canvas);
    if (!painter.isActive()) {
        m_error = "Cannot open painter on frame canvas";
        return false;
    }
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);

    const LetterboxGeometry box = letterbox(source.size(), size);
    if (!source.drawInto(painter, box.offsetX, box.offsetY, box.drawWidth, box.drawHeight)) {
        painter.end();
        m_error = "Source image is no longer available";
        return false;
    }
    source.release();

    qCDebug(lcOverlay) << "Letterboxed" << source.width() << "x" << source.height()
                       << "scale" << box.scale << "at" << box.rect();

    CaptionOverlay caption(overlay);
    if (!caption.isEmpty()) {
        frame.caption = caption.measure(size);
        caption.paint(painter, frame.caption, size);
        frame.hasOverlay = !frame.caption.lines.isEmpty();
        qCDebug(lcOverlay) << "Caption wrapped into" << frame.caption.lineCount()
                           << "lines, panel" << frame.caption.panelRect;
    }
    painter.end();

    if (!ImageUtil::encodePng(canvas, frame.png)) {
        m_error = "Cannot encode frame as PNG";
        frame = CompositedFrame{};
        return false;
    }

    frame.size = size;
    return true;
}
