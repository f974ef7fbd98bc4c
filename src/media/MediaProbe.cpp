#include "MediaProbe.h"
#include "Logging.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/pixdesc.h>
}

namespace {

QString codecName(AVCodecID id) {
    const AVCodecDescriptor* desc = avcodec_descriptor_get(id);
    return desc ? QString(desc->name) : QString("unknown");
}

} // namespace

QString MediaInfo::summary() const {
    QString text = QString("%1, %2x%3 %4 %5 @ %6 fps, %7 s")
        .arg(containerFormat)
        .arg(videoWidth)
        .arg(videoHeight)
        .arg(videoCodec, videoPixelFormat)
        .arg(videoFps, 0, 'f', 2)
        .arg(duration, 0, 'f', 2);
    text += hasAudio ? QString(", audio %1").arg(audioCodec) : QString(", no audio");
    return text;
}

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = "Cannot find stream info";
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->name);
    m_info.duration = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !m_info.hasVideo) {
            m_info.hasVideo = true;
            m_info.videoWidth = par->width;
            m_info.videoHeight = par->height;
            m_info.videoCodec = codecName(par->codec_id);
            const char* pixFmt = av_get_pix_fmt_name(static_cast<AVPixelFormat>(par->format));
            m_info.videoPixelFormat = pixFmt ? QString(pixFmt) : QString();

            if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->avg_frame_rate);
            } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->r_frame_rate);
            }
        }
        else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !m_info.hasAudio) {
            m_info.hasAudio = true;
            m_info.audioCodec = codecName(par->codec_id);
        }
    }

    avformat_close_input(&fmtCtx);

    if (!m_info.hasVideo) {
        m_error = "No video stream";
        return false;
    }
    qCDebug(lcApp) << "Probed" << filePath << ":" << m_info.summary();
    return true;
}
