// image_decoder.hpp
#pragma once

#include <string>
#include "fingerprint.hpp"

namespace snapmatch {

class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    // Decode to 8-bit luminance. Throws DecodeError on unreadable or unsupported files.
    virtual GrayImage decode(const std::string& path) const = 0;
};

// cv::imread backed decoder; safe to share across worker threads.
class OpenCvDecoder : public ImageDecoder {
public:
    GrayImage decode(const std::string& path) const override;
};

} // namespace snapmatch
