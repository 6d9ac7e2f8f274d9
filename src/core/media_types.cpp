#include "core/media_types.hpp"
#include "core/file_utils.hpp"
#include <algorithm>
#include <cctype>

std::string MediaTypes::normalizeMimeType(const std::string &mime_type)
{
    std::string normalized = mime_type.substr(0, mime_type.find(';'));

    auto not_space = [](unsigned char c)
    { return !std::isspace(c); };
    normalized.erase(normalized.begin(), std::find_if(normalized.begin(), normalized.end(), not_space));
    normalized.erase(std::find_if(normalized.rbegin(), normalized.rend(), not_space).base(), normalized.end());

    std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::tolower);
    return normalized;
}

MediaFormat MediaTypes::fromMimeType(const std::string &mime_type)
{
    const std::string mime = normalizeMimeType(mime_type);

    if (mime == "image/jpeg" || mime == "image/jpg")
        return MediaFormat::JPEG;
    if (mime == "image/png")
        return MediaFormat::PNG;
    if (mime == "video/mp4")
        return MediaFormat::MP4;
    if (mime == "video/quicktime")
        return MediaFormat::QUICKTIME;
    if (mime.rfind("image/", 0) == 0)
        return MediaFormat::OTHER_IMAGE;
    if (mime.rfind("video/", 0) == 0)
        return MediaFormat::OTHER_VIDEO;
    return MediaFormat::UNKNOWN;
}

MediaKind MediaTypes::kindOf(MediaFormat format)
{
    switch (format)
    {
    case MediaFormat::MP4:
    case MediaFormat::QUICKTIME:
    case MediaFormat::OTHER_VIDEO:
        return MediaKind::VIDEO;
    default:
        return MediaKind::IMAGE;
    }
}

std::string MediaTypes::getKindName(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::VIDEO:
        return "video";
    case MediaKind::IMAGE:
    default:
        return "image";
    }
}

MediaKind MediaTypes::kindFromString(const std::string &kind_str)
{
    if (kind_str == "video" || kind_str == "VIDEO")
        return MediaKind::VIDEO;
    return MediaKind::IMAGE;
}

std::string MediaTypes::getFormatName(MediaFormat format)
{
    switch (format)
    {
    case MediaFormat::JPEG:
        return "JPEG";
    case MediaFormat::PNG:
        return "PNG";
    case MediaFormat::MP4:
        return "MP4";
    case MediaFormat::QUICKTIME:
        return "QUICKTIME";
    case MediaFormat::OTHER_IMAGE:
        return "OTHER_IMAGE";
    case MediaFormat::OTHER_VIDEO:
        return "OTHER_VIDEO";
    default:
        return "UNKNOWN";
    }
}

std::string MediaTypes::mimeTypeForPath(const std::string &file_path)
{
    const std::string ext = FileUtils::getFileExtension(file_path);

    if (ext == "jpg" || ext == "jpeg")
        return "image/jpeg";
    if (ext == "png")
        return "image/png";
    if (ext == "mp4" || ext == "m4v")
        return "video/mp4";
    if (ext == "mov" || ext == "qt")
        return "video/quicktime";
    return "";
}

const std::vector<std::string> &MediaTypes::defaultAcceptedMimeTypes()
{
    static const std::vector<std::string> accepted = {
        "image/jpeg", "image/jpg", "image/png", "video/mp4", "video/quicktime"};
    return accepted;
}
