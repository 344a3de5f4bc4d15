#include "../include/image_decoder.hpp"
#include "../include/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace snapmatch {

GrayImage OpenCvDecoder::decode(const std::string& path) const
{
    cv::Mat gray;
    try {
        gray = cv::imread(path, cv::IMREAD_GRAYSCALE);
    }
    catch (const cv::Exception& e) {
        throw DecodeError("cannot decode '" + path + "': " + e.what());
    }

    if (gray.empty()) {
        throw DecodeError("cannot decode '" + path + "': unreadable or unsupported image");
    }
    if (gray.type() != CV_8UC1) {
        gray.convertTo(gray, CV_8U);
    }
    if (!gray.isContinuous()) {
        gray = gray.clone();
    }

    GrayImage image;
    image.width = gray.cols;
    image.height = gray.rows;
    image.pixels.assign(gray.data, gray.data + gray.total());
    return image;
}

} // namespace snapmatch
