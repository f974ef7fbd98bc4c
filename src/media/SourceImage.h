#pragma once

#include <QImage>
#include <QSize>

class QPainter;

enum class DecodePath {
    QtReader,   // QImageReader over the raw bytes
    FFmpeg      // libavcodec fallback for formats Qt has no plugin for
};

// Decoded input photo. Owned by the call that decoded it and released once
// the frame has been composited; width/height stay valid after release.
class SourceImage {
public:
    SourceImage(QImage image, DecodePath path);
    ~SourceImage();

    SourceImage(const SourceImage&) = delete;
    SourceImage& operator=(const SourceImage&) = delete;

    int width() const { return m_width; }
    int height() const { return m_height; }
    QSize size() const { return QSize(m_width, m_height); }
    DecodePath decodePath() const { return m_path; }

    // Draws the full image scaled into the target rectangle.
    // Returns false once the pixel data has been released.
    bool drawInto(QPainter& target, double x, double y, double w, double h) const;

    // Drops the decoded pixel data. Further calls are no-ops.
    void release();
    bool isReleased() const { return m_released; }

private:
    QImage m_image;
    int m_width = 0;
    int m_height = 0;
    DecodePath m_path;
    bool m_released = false;
};
