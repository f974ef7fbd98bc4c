#include "ImageNormalizer.h"
#include "Logging.h"
#include <QBuffer>
#include <QImageReader>
#include <algorithm>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

namespace {

constexpr int IoBufferSize = 32768;

// In-memory source for a custom AVIOContext
struct MemoryReader {
    const uint8_t* data = nullptr;
    int64_t size = 0;
    int64_t pos = 0;
};

int readMemory(void* opaque, uint8_t* buf, int bufSize) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    int64_t remaining = reader->size - reader->pos;
    if (remaining <= 0) return AVERROR_EOF;

    int n = static_cast<int>(std::min<int64_t>(remaining, bufSize));
    std::memcpy(buf, reader->data + reader->pos, n);
    reader->pos += n;
    return n;
}

int64_t seekMemory(void* opaque, int64_t offset, int whence) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    if (whence & AVSEEK_SIZE) return reader->size;

    int64_t target = 0;
    switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET: target = offset; break;
    case SEEK_CUR: target = reader->pos + offset; break;
    case SEEK_END: target = reader->size + offset; break;
    default: return AVERROR(EINVAL);
    }
    if (target < 0 || target > reader->size) return AVERROR(EINVAL);

    reader->pos = target;
    return target;
}

QString avErrorString(int err) {
    char errBuf[256];
    av_strerror(err, errBuf, sizeof(errBuf));
    return QString(errBuf);
}

struct FFmpegImageContext {
    MemoryReader reader;
    AVIOContext* ioCtx = nullptr;
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwsContext* swsCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;

    ~FFmpegImageContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swsCtx) sws_freeContext(swsCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        // Custom I/O is not owned by the format context
        if (fmtCtx) avformat_close_input(&fmtCtx);
        if (ioCtx) {
            av_freep(&ioCtx->buffer);
            avio_context_free(&ioCtx);
        }
    }
};

// Pulls packets until the decoder hands out its first frame.
int receiveFirstFrame(FFmpegImageContext& ctx, int streamIdx) {
    bool flushed = false;
    while (true) {
        int ret = avcodec_receive_frame(ctx.codecCtx, ctx.frame);
        if (ret == 0) return 0;
        if (ret != AVERROR(EAGAIN)) return ret;
        if (flushed) return AVERROR_EOF;

        ret = av_read_frame(ctx.fmtCtx, ctx.packet);
        if (ret < 0) {
            // Drain frames still buffered in the codec
            flushed = true;
            avcodec_send_packet(ctx.codecCtx, nullptr);
            continue;
        }

        if (ctx.packet->stream_index != streamIdx) {
            av_packet_unref(ctx.packet);
            continue;
        }

        ret = avcodec_send_packet(ctx.codecCtx, ctx.packet);
        av_packet_unref(ctx.packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) return ret;
    }
}

} // namespace

ImageNormalizer::ImageNormalizer(QObject* parent) : QObject(parent) {}
ImageNormalizer::~ImageNormalizer() = default;

std::unique_ptr<SourceImage> ImageNormalizer::normalize(const QByteArray& data,
                                                        const QString& mimeType) {
    m_error.clear();
    if (data.isEmpty()) {
        m_error = "Image data is empty";
        return nullptr;
    }

    QImage image;
    QString qtError;
    if (decodeWithQt(data, mimeType, image, qtError)) {
        qCDebug(lcImage) << "Decoded" << image.width() << "x" << image.height() << "with Qt";
        return std::make_unique<SourceImage>(image, DecodePath::QtReader);
    }

    qCInfo(lcImage) << "Qt image reader rejected input (" << qtError << "), trying FFmpeg";

    QString ffmpegError;
    if (decodeWithFFmpeg(data, image, ffmpegError)) {
        qCDebug(lcImage) << "Decoded" << image.width() << "x" << image.height() << "with FFmpeg";
        return std::make_unique<SourceImage>(image, DecodePath::FFmpeg);
    }

    m_error = QString("Cannot decode image: Qt: %1; FFmpeg: %2").arg(qtError, ffmpegError);
    qCWarning(lcImage) << m_error;
    return nullptr;
}

bool ImageNormalizer::decodeWithQt(const QByteArray& data, const QString& mimeType,
                                   QImage& out, QString& error) {
    QByteArray formatHint;
    if (!mimeType.isEmpty()) {
        const QList<QByteArray> formats = QImageReader::imageFormatsForMimeType(mimeType.toLatin1());
        if (!formats.isEmpty()) formatHint = formats.first();
    }

    QBuffer buffer;
    buffer.setData(data);
    if (!buffer.open(QIODevice::ReadOnly)) {
        error = "Cannot open image buffer";
        return false;
    }

    QImageReader reader(&buffer, formatHint);
    reader.setDecideFormatFromContent(true);
    reader.setAutoTransform(true);

    QImage image = reader.read();
    if (image.isNull() || image.width() <= 0 || image.height() <= 0) {
        error = reader.errorString();
        return false;
    }

    out = image;
    return true;
}

bool ImageNormalizer::decodeWithFFmpeg(const QByteArray& data, QImage& out, QString& error) {
    FFmpegImageContext ctx;
    ctx.reader.data = reinterpret_cast<const uint8_t*>(data.constData());
    ctx.reader.size = data.size();

    auto* ioBuffer = static_cast<unsigned char*>(av_malloc(IoBufferSize));
    if (!ioBuffer) {
        error = "Out of memory";
        return false;
    }

    ctx.ioCtx = avio_alloc_context(ioBuffer, IoBufferSize, 0, &ctx.reader,
                                   &readMemory, nullptr, &seekMemory);
    if (!ctx.ioCtx) {
        av_free(ioBuffer);
        error = "Cannot allocate I/O context";
        return false;
    }

    ctx.fmtCtx = avformat_alloc_context();
    if (!ctx.fmtCtx) {
        error = "Cannot allocate format context";
        return false;
    }
    ctx.fmtCtx->pb = ctx.ioCtx;
    ctx.fmtCtx->flags |= AVFMT_FLAG_CUSTOM_IO;

    // On failure the format context is freed and reset to nullptr
    int ret = avformat_open_input(&ctx.fmtCtx, nullptr, nullptr, nullptr);
    if (ret < 0) {
        error = QString("Unrecognized format (%1)").arg(avErrorString(ret));
        return false;
    }

    ret = avformat_find_stream_info(ctx.fmtCtx, nullptr);
    if (ret < 0) {
        error = "Cannot find stream info";
        return false;
    }

    int streamIdx = av_find_best_stream(ctx.fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (streamIdx < 0) {
        error = "No picture stream";
        return false;
    }

    AVCodecParameters* par = ctx.fmtCtx->streams[streamIdx]->codecpar;
    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) {
        error = "No decoder for picture codec";
        return false;
    }

    ctx.codecCtx = avcodec_alloc_context3(codec);
    if (!ctx.codecCtx || avcodec_parameters_to_context(ctx.codecCtx, par) < 0) {
        error = "Cannot set up decoder";
        return false;
    }

    ret = avcodec_open2(ctx.codecCtx, codec, nullptr);
    if (ret < 0) {
        error = QString("Cannot open decoder (%1)").arg(avErrorString(ret));
        return false;
    }

    ctx.frame = av_frame_alloc();
    ctx.packet = av_packet_alloc();
    if (!ctx.frame || !ctx.packet) {
        error = "Out of memory";
        return false;
    }

    ret = receiveFirstFrame(ctx, streamIdx);
    if (ret < 0) {
        error = QString("Cannot decode picture (%1)").arg(avErrorString(ret));
        return false;
    }

    const int width = ctx.frame->width;
    const int height = ctx.frame->height;
    if (width <= 0 || height <= 0) {
        error = "Decoded picture has no size";
        return false;
    }

    ctx.swsCtx = sws_getContext(
        width, height, static_cast<AVPixelFormat>(ctx.frame->format),
        width, height, AV_PIX_FMT_RGB32,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!ctx.swsCtx) {
        error = "Cannot create pixel converter";
        return false;
    }

    // AV_PIX_FMT_RGB32 is native-endian ARGB, the same layout as QImage::Format_ARGB32
    QImage image(width, height, QImage::Format_ARGB32);
    if (image.isNull()) {
        error = "Cannot allocate picture";
        return false;
    }

    uint8_t* dstData[4] = { image.bits(), nullptr, nullptr, nullptr };
    int dstLinesize[4] = { static_cast<int>(image.bytesPerLine()), 0, 0, 0 };
    sws_scale(ctx.swsCtx, ctx.frame->data, ctx.frame->linesize, 0, height,
              dstData, dstLinesize);

    out = image;
    return true;
}
