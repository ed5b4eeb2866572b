#include "core/external_library_wrappers.hpp"
#include "core/media_handler.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>
#include <opencv2/videoio.hpp>

namespace fs = std::filesystem;

namespace
{
    int64_t secondsToStreamTime(const AVStream *stream, double seconds)
    {
        int64_t ts = static_cast<int64_t>(seconds / av_q2d(stream->time_base));
        if (stream->start_time != AV_NOPTS_VALUE)
            ts += stream->start_time;
        return ts;
    }

    bool toBgrMat(SwsContextRAII &sws, const AVFrame *frame, cv::Mat &out)
    {
        sws.set(sws_getCachedContext(sws.get(), frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                                     frame->width, frame->height, AV_PIX_FMT_BGR24, SWS_BILINEAR,
                                     nullptr, nullptr, nullptr));
        if (!sws.get())
            return false;

        out.create(frame->height, frame->width, CV_8UC3);
        uint8_t *dst[4] = {out.data, nullptr, nullptr, nullptr};
        int dst_stride[4] = {static_cast<int>(out.step[0]), 0, 0, 0};
        sws_scale(sws.get(), frame->data, frame->linesize, 0, frame->height, dst, dst_stride);
        return true;
    }

    /**
     * Seek to the keyframe before offset and decode forward to the first frame
     * at or after it.
     */
    bool decodeFrameAt(AVFormatContext *fmt, int stream_index, AVCodecContext *decoder, SwsContextRAII &sws,
                       double offset_seconds, cv::Mat &out, CancellationToken &cancel)
    {
        AVStream *stream = fmt->streams[stream_index];
        int64_t target = secondsToStreamTime(stream, offset_seconds);
        if (av_seek_frame(fmt, stream_index, target, AVSEEK_FLAG_BACKWARD) < 0)
            return false;
        avcodec_flush_buffers(decoder);

        AVPacketRAII packet;
        AVFrameRAII frame;
        if (!packet.get() || !frame.get())
            return false;

        bool eof = false;
        while (true)
        {
            cancel.throwIfStopped("Frame extraction");

            if (!eof)
            {
                int rc = av_read_frame(fmt, packet.get());
                if (rc < 0)
                {
                    eof = true;
                    avcodec_send_packet(decoder, nullptr);
                }
                else
                {
                    bool ours = packet->stream_index == stream_index;
                    if (ours)
                        rc = avcodec_send_packet(decoder, packet.get());
                    av_packet_unref(packet.get());
                    if (!ours || rc < 0)
                        continue;
                }
            }

            while (true)
            {
                int rc = avcodec_receive_frame(decoder, frame.get());
                if (rc == AVERROR(EAGAIN))
                {
                    if (eof)
                        return false;
                    break;
                }
                if (rc < 0)
                    return false;

                int64_t pts = frame->best_effort_timestamp;
                if (pts == AV_NOPTS_VALUE || pts >= target)
                {
                    bool converted = toBgrMat(sws, frame.get(), out);
                    av_frame_unref(frame.get());
                    return converted;
                }
                av_frame_unref(frame.get());
            }
        }
    }

    bool readStreamPacket(AVFormatContext *fmt, int stream_index, AVPacket *packet)
    {
        while (av_read_frame(fmt, packet) >= 0)
        {
            if (packet->stream_index == stream_index)
                return true;
            av_packet_unref(packet);
        }
        return false;
    }

    double safeFps(cv::VideoCapture &capture)
    {
        double fps = capture.get(cv::CAP_PROP_FPS);
        if (!std::isfinite(fps) || fps <= 0.0 || fps > 240.0)
            return 25.0;
        return fps;
    }
}

bool VideoHandler::supports(StageKind) const
{
    return true;
}

std::optional<double> VideoHandler::probeDuration(const std::string &source)
{
    AVInputContextRAII input;
    int rc = input.open(source);
    if (rc < 0)
    {
        Logger::warn("Could not probe video " + source + ": " + ffmpegError(rc));
        return std::nullopt;
    }

    if (input->duration > 0)
        return static_cast<double>(input->duration) / AV_TIME_BASE;

    int vi = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (vi >= 0 && input->streams[vi]->duration > 0)
    {
        AVStream *stream = input->streams[vi];
        return stream->duration * av_q2d(stream->time_base);
    }

    Logger::warn("Video has no known duration: " + source);
    return std::nullopt;
}

std::vector<cv::Mat> VideoHandler::extractFrames(const std::string &source, const std::vector<double> &offsets,
                                                 CancellationToken &cancel)
{
    std::vector<cv::Mat> frames;

    AVInputContextRAII input;
    int rc = input.open(source);
    if (rc < 0)
    {
        Logger::error("Could not open video for frame extraction: " + source + " - " + ffmpegError(rc));
        return frames;
    }

    int vi = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (vi < 0)
    {
        Logger::error("No video stream found: " + source);
        return frames;
    }

    AVCodecParameters *codec_params = input->streams[vi]->codecpar;
    const AVCodec *codec = avcodec_find_decoder(codec_params->codec_id);
    if (!codec)
    {
        Logger::error("Unsupported video codec in " + source);
        return frames;
    }

    AVCodecContextRAII decoder(codec);
    if (!decoder.get() || avcodec_parameters_to_context(decoder.get(), codec_params) < 0 ||
        avcodec_open2(decoder.get(), codec, nullptr) < 0)
    {
        Logger::error("Could not open decoder for " + source);
        return frames;
    }

    SwsContextRAII sws;
    for (double offset : offsets)
    {
        cv::Mat frame;
        if (!decodeFrameAt(input.get(), vi, decoder.get(), sws, offset, frame, cancel))
        {
            Logger::warn("No decodable frame at " + std::to_string(offset) + "s in " + source);
            break;
        }
        frames.push_back(frame);
    }

    Logger::debug("Extracted " + std::to_string(frames.size()) + "/" + std::to_string(offsets.size()) +
                  " frames from " + source);
    return frames;
}

StageResult VideoHandler::extractPreview(const std::string &source, double start_seconds, double length_seconds,
                                         const std::string &output_path, CancellationToken &cancel)
{
    try
    {
        cv::VideoCapture capture(source, cv::CAP_FFMPEG);
        if (!capture.isOpened())
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not open video: " + source);
        }

        double fps = safeFps(capture);
        int width = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH));
        int height = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT));
        int frame_count = std::max(1, static_cast<int>(std::llround(length_seconds * fps)));

        capture.set(cv::CAP_PROP_POS_MSEC, start_seconds * 1000.0);

        fs::path video_only = fs::path(output_path).parent_path() / ("preview_video" + previewExtension());
        cv::VideoWriter writer(video_only.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, cv::Size(width, height));
        if (!writer.isOpened())
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not open video writer: " + video_only.string());
        }

        cv::Mat frame;
        cv::Mat last;
        int written = 0;
        while (written < frame_count && capture.read(frame))
        {
            cancel.throwIfStopped("Preview extraction");
            writer.write(frame);
            last = frame;
            ++written;
        }

        if (written == 0)
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "No frames decoded after " + std::to_string(start_seconds) + "s");
        }

        // Keep the clip exactly length_seconds long when the tail under-reads
        int padded = frame_count - written;
        while (written < frame_count)
        {
            writer.write(last);
            ++written;
        }
        writer.release();

        if (padded > 0)
            Logger::debug("Padded preview with " + std::to_string(padded) + " repeated frames");

        std::string error;
        bool audio = muxWithSourceAudio(video_only.string(), source, start_seconds, length_seconds, output_path, error);
        if (!audio)
        {
            if (!error.empty())
                Logger::warn("Preview audio not preserved, delivering video only: " + error);
            fs::rename(video_only, output_path);
        }

        nlohmann::json meta;
        meta["start_seconds"] = start_seconds;
        meta["length_seconds"] = frame_count / fps;
        meta["frames"] = frame_count;
        meta["fps"] = fps;
        meta["width"] = width;
        meta["height"] = height;
        meta["audio"] = audio;
        return StageResult::done(output_path, meta.dump());
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during preview extraction: " + std::string(e.what()));
        return StageResult::failed(ErrorCode::STAGE_FAILED, "OpenCV processing error: " + std::string(e.what()));
    }
    catch (const fs::filesystem_error &e)
    {
        return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not finalize preview: " + std::string(e.what()));
    }
}

StageResult VideoHandler::overlayWatermark(const std::string &input, const WatermarkStyle &style,
                                           const std::string &output_path, CancellationToken &cancel)
{
    // Collage targets are still images
    if (WatermarkRenderer::isImageFile(input))
    {
        cancel.throwIfStopped("Image watermark");
        return WatermarkRenderer::applyToImage(input, output_path, style);
    }

    try
    {
        cv::VideoCapture capture(input, cv::CAP_FFMPEG);
        if (!capture.isOpened())
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not open video: " + input);
        }

        double fps = safeFps(capture);
        int width = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH));
        int height = static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT));

        fs::path video_only = fs::path(output_path).parent_path() / ("watermark_video" + previewExtension());
        cv::VideoWriter writer(video_only.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, cv::Size(width, height));
        if (!writer.isOpened())
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not open video writer: " + video_only.string());
        }

        cv::Mat frame;
        int frames = 0;
        while (capture.read(frame))
        {
            cancel.throwIfStopped("Video watermark");
            WatermarkRenderer::renderOnto(frame, style);
            writer.write(frame);
            ++frames;
        }
        writer.release();

        if (frames == 0)
        {
            return StageResult::failed(ErrorCode::STAGE_FAILED, "No frames decoded from " + input);
        }

        std::string error;
        bool audio = muxWithSourceAudio(video_only.string(), input, 0.0, 0.0, output_path, error);
        if (!audio)
        {
            if (!error.empty())
                Logger::warn("Watermark audio not preserved, delivering video only: " + error);
            fs::rename(video_only, output_path);
        }

        nlohmann::json meta;
        meta["frames"] = frames;
        meta["width"] = width;
        meta["height"] = height;
        meta["anchor"] = WatermarkRenderer::getAnchorName(style.anchor);
        meta["opacity"] = style.opacity;
        meta["audio"] = audio;
        return StageResult::done(output_path, meta.dump());
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during video watermarking: " + std::string(e.what()));
        return StageResult::failed(ErrorCode::STAGE_FAILED, "OpenCV processing error: " + std::string(e.what()));
    }
    catch (const fs::filesystem_error &e)
    {
        return StageResult::failed(ErrorCode::STAGE_FAILED, "Could not finalize watermark: " + std::string(e.what()));
    }
}

bool VideoHandler::muxWithSourceAudio(const std::string &video_only, const std::string &audio_source, double start_seconds,
                                      double length_seconds, const std::string &output_path, std::string &error)
{
    AVInputContextRAII audio_in;
    if (audio_in.open(audio_source) < 0)
        return false;
    int ai = av_find_best_stream(audio_in.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (ai < 0)
        return false;

    AVInputContextRAII video_in;
    int rc = video_in.open(video_only);
    if (rc < 0)
    {
        error = "could not reopen rendered video: " + ffmpegError(rc);
        return false;
    }
    int vi = av_find_best_stream(video_in.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (vi < 0)
    {
        error = "rendered video has no video stream";
        return false;
    }

    bool completed = false;
    {
        AVOutputContextRAII out;
        rc = out.allocate(output_path);
        if (rc < 0 || !out.get())
        {
            error = "could not allocate output container: " + ffmpegError(rc);
            return false;
        }

        AVStream *video_src = video_in->streams[vi];
        AVStream *audio_src = audio_in->streams[ai];
        AVStream *video_dst = avformat_new_stream(out.get(), nullptr);
        AVStream *audio_dst = avformat_new_stream(out.get(), nullptr);
        if (!video_dst || !audio_dst ||
            avcodec_parameters_copy(video_dst->codecpar, video_src->codecpar) < 0 ||
            avcodec_parameters_copy(audio_dst->codecpar, audio_src->codecpar) < 0)
        {
            error = "could not create output streams";
            return false;
        }
        video_dst->codecpar->codec_tag = 0;
        audio_dst->codecpar->codec_tag = 0;
        video_dst->time_base = video_src->time_base;
        audio_dst->time_base = audio_src->time_base;

        if ((rc = out.openFile(output_path)) < 0 || (rc = avformat_write_header(out.get(), nullptr)) < 0)
        {
            error = "container rejected streams: " + ffmpegError(rc);
        }
        else
        {
            int64_t audio_start = secondsToStreamTime(audio_src, start_seconds);
            int64_t audio_end = length_seconds > 0.0
                                    ? audio_start + static_cast<int64_t>(length_seconds / av_q2d(audio_src->time_base))
                                    : std::numeric_limits<int64_t>::max();
            // On a failed seek the packets before audio_start are skipped below
            if (start_seconds > 0.0 && (rc = av_seek_frame(audio_in.get(), ai, audio_start, AVSEEK_FLAG_BACKWARD)) < 0)
                Logger::debug("Audio seek failed, reading from the start: " + ffmpegError(rc));

            AVPacketRAII video_pkt;
            AVPacketRAII audio_pkt;
            bool have_video = readStreamPacket(video_in.get(), vi, video_pkt.get());
            bool have_audio = false;
            while (!have_audio && readStreamPacket(audio_in.get(), ai, audio_pkt.get()))
            {
                if (audio_pkt->pts != AV_NOPTS_VALUE && audio_pkt->pts < audio_start)
                {
                    av_packet_unref(audio_pkt.get());
                    continue;
                }
                have_audio = true;
            }

            bool write_ok = true;
            while (write_ok && (have_video || have_audio))
            {
                bool take_video = have_video &&
                                  (!have_audio || av_compare_ts(video_pkt->dts, video_src->time_base,
                                                                audio_pkt->dts - audio_start, audio_src->time_base) <= 0);
                if (take_video)
                {
                    av_packet_rescale_ts(video_pkt.get(), video_src->time_base, video_dst->time_base);
                    video_pkt->stream_index = video_dst->index;
                    video_pkt->pos = -1;
                    write_ok = av_interleaved_write_frame(out.get(), video_pkt.get()) >= 0;
                    have_video = readStreamPacket(video_in.get(), vi, video_pkt.get());
                }
                else
                {
                    if (audio_pkt->pts != AV_NOPTS_VALUE && audio_pkt->pts >= audio_end)
                    {
                        av_packet_unref(audio_pkt.get());
                        have_audio = false;
                        continue;
                    }
                    if (audio_pkt->pts != AV_NOPTS_VALUE)
                        audio_pkt->pts -= audio_start;
                    if (audio_pkt->dts != AV_NOPTS_VALUE)
                        audio_pkt->dts -= audio_start;
                    av_packet_rescale_ts(audio_pkt.get(), audio_src->time_base, audio_dst->time_base);
                    audio_pkt->stream_index = audio_dst->index;
                    audio_pkt->pos = -1;
                    write_ok = av_interleaved_write_frame(out.get(), audio_pkt.get()) >= 0;
                    have_audio = readStreamPacket(audio_in.get(), ai, audio_pkt.get());
                }
            }

            if (!write_ok)
                error = "packet write failed";
            else if ((rc = av_write_trailer(out.get())) < 0)
                error = "trailer write failed: " + ffmpegError(rc);
            else
                completed = true;
        }
    }

    std::error_code ec;
    if (completed)
        fs::remove(video_only, ec);
    else
        fs::remove(output_path, ec);
    return completed;
}
