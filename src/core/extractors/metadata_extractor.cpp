#include "core/extractors/metadata_extractor.hpp"
#include <algorithm>
#include <array>
#include <cstring>

namespace
{
    constexpr uint8_t JPEG_SOI[2] = {0xFF, 0xD8};
    constexpr uint8_t JPEG_EOI[2] = {0xFF, 0xD9};
    constexpr uint8_t PNG_SIGNATURE[4] = {0x89, 0x50, 0x4E, 0x47};
    constexpr char FTYP[4] = {'f', 't', 'y', 'p'};

    // Top-level atoms a QuickTime movie may open with instead of ftyp
    const std::array<const char *, 5> QUICKTIME_ATOMS = {"moov", "mdat", "wide", "free", "skip"};

    bool hasBytesAt(BufferView buffer, std::size_t offset, const void *expected, std::size_t length)
    {
        if (buffer.size < offset + length)
            return false;
        return std::memcmp(buffer.data + offset, expected, length) == 0;
    }
}

bool MetadataExtractor::hasJpegSignature(BufferView buffer)
{
    if (buffer.size < 4)
        return false;
    return hasBytesAt(buffer, 0, JPEG_SOI, 2) && hasBytesAt(buffer, buffer.size - 2, JPEG_EOI, 2);
}

bool MetadataExtractor::hasPngSignature(BufferView buffer)
{
    return hasBytesAt(buffer, 0, PNG_SIGNATURE, 4);
}

bool MetadataExtractor::hasMp4Signature(BufferView buffer)
{
    return hasBytesAt(buffer, 4, FTYP, 4);
}

bool MetadataExtractor::hasQuickTimeSignature(BufferView buffer)
{
    if (hasMp4Signature(buffer))
        return true;
    return std::any_of(QUICKTIME_ATOMS.begin(), QUICKTIME_ATOMS.end(), [&buffer](const char *atom)
                       { return hasBytesAt(buffer, 4, atom, 4); });
}

double MetadataExtractor::compute(BufferView buffer, MediaFormat format) const
{
    switch (format)
    {
    case MediaFormat::JPEG:
        return hasJpegSignature(buffer) ? kJpegValidScore : kJpegInvalidScore;
    case MediaFormat::PNG:
        return hasPngSignature(buffer) ? kPngValidScore : kPngInvalidScore;
    case MediaFormat::MP4:
    case MediaFormat::OTHER_VIDEO:
        return hasMp4Signature(buffer) ? kVideoValidScore : kVideoInvalidScore;
    case MediaFormat::QUICKTIME:
        return hasQuickTimeSignature(buffer) ? kVideoValidScore : kVideoInvalidScore;
    default:
        return kNeutralScore;
    }
}
