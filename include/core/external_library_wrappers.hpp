#pragma once

#include <string>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libswscale/swscale.h>
}

// Human readable FFmpeg error code
inline std::string ffmpegError(int code)
{
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return std::string(buf);
}

// RAII wrapper for a demuxing AVFormatContext
class AVInputContextRAII
{
public:
    AVInputContextRAII() : ctx_(nullptr) {}
    ~AVInputContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVInputContextRAII(const AVInputContextRAII &) = delete;
    AVInputContextRAII &operator=(const AVInputContextRAII &) = delete;

    /**
     * @brief Open the container and read stream info
     * @return FFmpeg status code (negative on error)
     */
    int open(const std::string &path)
    {
        int rc = avformat_open_input(&ctx_, path.c_str(), nullptr, nullptr);
        if (rc < 0)
            return rc;
        return avformat_find_stream_info(ctx_, nullptr);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext *operator->() { return ctx_; }

private:
    AVFormatContext *ctx_;
};

// RAII wrapper for a muxing AVFormatContext with its output file
class AVOutputContextRAII
{
public:
    AVOutputContextRAII() : ctx_(nullptr) {}
    ~AVOutputContextRAII()
    {
        if (!ctx_)
            return;
        if (!(ctx_->oformat->flags & AVFMT_NOFILE) && ctx_->pb)
            avio_closep(&ctx_->pb);
        avformat_free_context(ctx_);
    }

    AVOutputContextRAII(const AVOutputContextRAII &) = delete;
    AVOutputContextRAII &operator=(const AVOutputContextRAII &) = delete;

    // Container chosen from the file extension
    int allocate(const std::string &path)
    {
        return avformat_alloc_output_context2(&ctx_, nullptr, nullptr, path.c_str());
    }

    int openFile(const std::string &path)
    {
        if (ctx_->oformat->flags & AVFMT_NOFILE)
            return 0;
        return avio_open(&ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext *operator->() { return ctx_; }

private:
    AVFormatContext *ctx_;
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
public:
    explicit AVCodecContextRAII(const AVCodec *codec) : ctx_(avcodec_alloc_context3(codec)) {}
    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

    AVCodecContext *get() { return ctx_; }
    AVCodecContext *operator->() { return ctx_; }

private:
    AVCodecContext *ctx_;
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}
    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;

    AVFrame *get() { return frame_; }
    AVFrame *operator->() { return frame_; }

private:
    AVFrame *frame_;
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}
    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;

    AVPacket *get() { return packet_; }
    AVPacket *operator->() { return packet_; }

private:
    AVPacket *packet_;
};

// RAII wrapper for FFmpeg SwsContext
class SwsContextRAII
{
public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;

    SwsContext *get() { return ctx_; }

    // sws_getCachedContext frees a context it replaces
    void set(SwsContext *ctx) { ctx_ = ctx; }

private:
    SwsContext *ctx_;
};
