#include "EmbeddedMetadata.hpp"

#include <exiv2/exiv2.hpp>
#include <exception>

namespace
{
    std::string FindExif(const Exiv2::ExifData& Exif, const char* Key)
    {
        auto it = Exif.findKey(Exiv2::ExifKey(Key));
        if (it == Exif.end())
        {
            return "";
        }
        std::string Value = it->toString();
        Value.erase(0, Value.find_first_not_of(" \t\r\n"));
        Value.erase(Value.find_last_not_of(" \t\r\n") + 1);
        // EXIF ASCII values are NUL padded.
        auto Nul = Value.find('\0');
        if (Nul != std::string::npos)
        {
            Value.erase(Nul);
        }
        return Value;
    }
}

EmbeddedMetadata::EmbeddedMetadata(Logger& Log) : Log(Log)
{
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
}

const EmbeddedInfo& EmbeddedMetadata::Read(const std::filesystem::path& FilePath)
{
    if (HasCache && CachedPath == FilePath)
    {
        return Cached;
    }

    HasCache = true;
    CachedPath = FilePath;
    Cached = EmbeddedInfo{};

    try
    {
        auto Image = Exiv2::ImageFactory::open(FilePath.string());
        if (!Image.get())
        {
            return Cached;
        }
        Image->readMetadata();

        Cached.Width = Image->pixelWidth();
        Cached.Height = Image->pixelHeight();

        const Exiv2::ExifData& Exif = Image->exifData();
        if (!Exif.empty())
        {
            Cached.Make = FindExif(Exif, "Exif.Image.Make");
            Cached.Model = FindExif(Exif, "Exif.Image.Model");
            Cached.DateTimeOriginal = FindExif(Exif, "Exif.Photo.DateTimeOriginal");
            Cached.DateTimeDigitized = FindExif(Exif, "Exif.Photo.DateTimeDigitized");
            Cached.DateTime = FindExif(Exif, "Exif.Image.DateTime");
        }
    }
    catch (const std::exception& e)
    {
        Log.Debug("EXIF read failed for " + FilePath.filename().string() + ": " + e.what());
    }
    return Cached;
}
