#include "SourceImage.h"
#include "Logging.h"
#include <QPainter>
#include <QRectF>
#include <utility>

SourceImage::SourceImage(QImage image, DecodePath path)
    : m_image(std::move(image))
    , m_width(m_image.width())
    , m_height(m_image.height())
    , m_path(path)
{}

SourceImage::~SourceImage() {
    release();
}

bool SourceImage::drawInto(QPainter& target, double x, double y, double w, double h) const {
    if (m_released || m_image.isNull()) return false;

    target.drawImage(QRectF(x, y, w, h), m_image);
    return true;
}

void SourceImage::release() {
    if (m_released) return;

    m_image = QImage();
    m_released = true;
    qCDebug(lcImage) << "Released source image" << m_width << "x" << m_height;
}
