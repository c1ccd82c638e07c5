#include "ContainerMetadata.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

namespace
{
    std::string DictValue(AVDictionary* Dict, const char* Key)
    {
        if (Dict == nullptr)
        {
            return "";
        }
        AVDictionaryEntry* Entry = av_dict_get(Dict, Key, nullptr, 0);
        return (Entry != nullptr && Entry->value != nullptr) ? std::string(Entry->value) : std::string();
    }

    std::string FirstValue(AVDictionary* Dict, const char* Key, const char* AltKey)
    {
        std::string Value = DictValue(Dict, Key);
        return Value.empty() ? DictValue(Dict, AltKey) : Value;
    }

    std::string AvError(int Code)
    {
        char Buffer[AV_ERROR_MAX_STRING_SIZE] = { 0 };
        av_strerror(Code, Buffer, sizeof(Buffer));
        return Buffer;
    }
}

ContainerMetadata::ContainerMetadata(Logger& Log) : Log(Log)
{
    av_log_set_level(AV_LOG_QUIET);
}

const ContainerInfo& ContainerMetadata::Read(const std::filesystem::path& FilePath)
{
    if (HasCache && CachedPath == FilePath)
    {
        return Cached;
    }

    HasCache = true;
    CachedPath = FilePath;
    Cached = ContainerInfo{};

    AVFormatContext* Format = nullptr;
    int Result = avformat_open_input(&Format, FilePath.string().c_str(), nullptr, nullptr);
    if (Result < 0)
    {
        Log.Debug("Container open failed for " + FilePath.filename().string() + ": " + AvError(Result));
        return Cached;
    }

    Result = avformat_find_stream_info(Format, nullptr);
    if (Result < 0)
    {
        Log.Debug("Container stream info failed for " + FilePath.filename().string() + ": " + AvError(Result));
        avformat_close_input(&Format);
        return Cached;
    }

    Cached.CreationTime = DictValue(Format->metadata, "creation_time");
    Cached.Make = FirstValue(Format->metadata, "make", "com.apple.quicktime.make");
    Cached.Model = FirstValue(Format->metadata, "model", "com.apple.quicktime.model");

    int VideoIndex = av_find_best_stream(Format, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (VideoIndex >= 0)
    {
        AVStream* Stream = Format->streams[VideoIndex];
        if (Stream->codecpar != nullptr)
        {
            Cached.Width = Stream->codecpar->width;
            Cached.Height = Stream->codecpar->height;
        }

        AVRational Rate = Stream->avg_frame_rate;
        if (Rate.num == 0 || Rate.den == 0)
        {
            Rate = Stream->r_frame_rate;
        }
        if (Rate.num != 0 && Rate.den != 0)
        {
            Cached.FrameRate = av_q2d(Rate);
        }

        if (Cached.CreationTime.empty())
        {
            Cached.CreationTime = DictValue(Stream->metadata, "creation_time");
        }
    }

    if (Cached.CreationTime.empty())
    {
        for (unsigned int i = 0; i < Format->nb_streams && Cached.CreationTime.empty(); ++i)
        {
            Cached.CreationTime = DictValue(Format->streams[i]->metadata, "creation_time");
        }
    }

    avformat_close_input(&Format);
    return Cached;
}
