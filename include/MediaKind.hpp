#pragma once

#include <string>

enum class MediaKind
{
    Image,
    Video,
    PanoramicVideo,
    Audio
};

// Stable identifiers used in logs and reports.
inline std::string KindName(MediaKind Kind)
{
    switch (Kind)
    {
    case MediaKind::Image:          return "image";
    case MediaKind::Video:          return "video";
    case MediaKind::PanoramicVideo: return "panoramic_video";
    case MediaKind::Audio:          return "audio";
    }
    return "unknown";
}

inline bool IsVideoKind(MediaKind Kind)
{
    return Kind == MediaKind::Video || Kind == MediaKind::PanoramicVideo;
}

inline bool CarriesDevice(MediaKind Kind)
{
    return Kind != MediaKind::Audio;
}
