#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Broad media family reported in analysis results
 */
enum class MediaKind
{
    IMAGE,
    VIDEO
};

/**
 * @brief Container format derived from the declared MIME type
 */
enum class MediaFormat
{
    JPEG,
    PNG,
    MP4,
    QUICKTIME,
    OTHER_IMAGE, // image/* without format-specific analysis
    OTHER_VIDEO, // video/* without format-specific analysis
    UNKNOWN      // not an image or video type
};

/**
 * @brief Non-owning read-only view over a byte buffer
 *
 * Extractors only ever read the caller's buffer, so the view lets the same
 * pipeline run over a std::vector, a std::string body or a raw pointer.
 */
struct BufferView
{
    const uint8_t *data;
    std::size_t size;

    BufferView() : data(nullptr), size(0) {}
    BufferView(const uint8_t *d, std::size_t s) : data(d), size(s) {}
    BufferView(const std::vector<uint8_t> &buffer) : data(buffer.data()), size(buffer.size()) {}
    BufferView(const std::string &buffer)
        : data(reinterpret_cast<const uint8_t *>(buffer.data())), size(buffer.size()) {}

    bool empty() const { return size == 0; }
    uint8_t operator[](std::size_t index) const { return data[index]; }
    const uint8_t *begin() const { return data; }
    const uint8_t *end() const { return data + size; }
};

class MediaTypes
{
public:
    /**
     * @brief Parse a declared MIME type into a media format
     * @param mime_type MIME type, case-insensitive, parameters ignored
     * @return MediaFormat, UNKNOWN when neither image/* nor video/*
     */
    static MediaFormat fromMimeType(const std::string &mime_type);

    /**
     * @brief Media family reported for a format (video for every video/* type, image otherwise)
     */
    static MediaKind kindOf(MediaFormat format);

    static bool isVideo(MediaFormat format) { return kindOf(format) == MediaKind::VIDEO; }

    static std::string getKindName(MediaKind kind);
    static MediaKind kindFromString(const std::string &kind_str);
    static std::string getFormatName(MediaFormat format);

    /**
     * @brief MIME type for a file path based on its extension
     * @param file_path Path to the media file
     * @return MIME type, or an empty string for unrecognized extensions
     */
    static std::string mimeTypeForPath(const std::string &file_path);

    /**
     * @brief Lowercased MIME type without parameters ("Image/JPEG; q=1" -> "image/jpeg")
     */
    static std::string normalizeMimeType(const std::string &mime_type);

    // MIME types accepted by the upload boundary
    static const std::vector<std::string> &defaultAcceptedMimeTypes();
};
