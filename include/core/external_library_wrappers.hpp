#pragma once

extern "C"
{
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include <string>

// RAII wrapper for FFmpeg AVFormatContext opened for input
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// Text for an FFmpeg error code
inline std::string avErrorString(int error_code)
{
    char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(error_code, err_buf, AV_ERROR_MAX_STRING_SIZE);
    return std::string(err_buf);
}
