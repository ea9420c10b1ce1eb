// FrameProcessor.cpp
#include "FrameProcessor.h"
#include <opencv2/imgproc.hpp>
#include <cmath>

cv::Mat FrameProcessor::toDisplay8(const cv::Mat& mono) {
    double lo = lo_, hi = hi_;
    if (autoContrast_) {
        cv::minMaxLoc(mono, &lo, &hi);
        if (hi <= lo) hi = lo + 1.0;
    }
    lastLo_ = lo;
    lastHi_ = hi;

    cv::Mat g8;
    const double scale = 255.0 / (hi - lo);
    mono.convertTo(g8, CV_8U, scale, -lo * scale);

    if (gamma_ != 1.0) {
        cv::Mat table(1, 256, CV_8U);
        for (int i = 0; i < 256; ++i)
            table.at<uchar>(i) = cv::saturate_cast<uchar>(std::pow(i / 255.0, gamma_) * 255.0);
        cv::Mat t; cv::LUT(g8, table, t); g8 = t;
    }
    return g8;
}

cv::Mat FrameProcessor::applyLut(const cv::Mat& gray8) const {
    cv::Mat bgr;
    switch (lut_) {
        case Lut::Gray:
            cv::cvtColor(gray8, bgr, cv::COLOR_GRAY2BGR);
            break;
        case Lut::Green: {
            cv::Mat z = cv::Mat::zeros(gray8.size(), CV_8U);
            cv::merge(std::vector<cv::Mat>{ z, gray8, z }, bgr);
            break;
        }
        case Lut::Magenta: {
            cv::Mat z = cv::Mat::zeros(gray8.size(), CV_8U);
            cv::merge(std::vector<cv::Mat>{ gray8, z, gray8 }, bgr);
            break;
        }
        case Lut::Fire:
            cv::applyColorMap(gray8, bgr, cv::COLORMAP_HOT);
            break;
    }
    return bgr;
}

cv::Mat FrameProcessor::run(const cv::Mat& src) {
    if (src.empty()) return src;
    cv::Mat dst;

    if (src.channels() == 1) {
        dst = applyLut(toDisplay8(src));
    }
    else if (src.depth() != CV_8U) {
        cv::Mat t; src.convertTo(t, CV_8U, 255.0 / 65535.0); dst = t;
    }
    else {
        dst = src;
    }

    // flip (horizontal / vertical / both)
    if (flipH_ || flipV_) {
        int code = 0;
        if (flipH_ && flipV_) code = -1;
        else if (flipH_)      code = 1;
        cv::Mat t; cv::flip(dst, t, code); dst = t;
    }

    // zoom: center crop, then scale back to the frame size
    if (zoom_ > 1) {
        int w = dst.cols, h = dst.rows;
        int rw = w / zoom_, rh = h / zoom_;
        if (rw > 0 && rh > 0) {
            int x = (w - rw) / 2, y = (h - rh) / 2;
            cv::Rect roi(x, y, rw, rh);
            cv::Mat crop = dst(roi).clone(), z;
            cv::resize(crop, z, cv::Size(w, h), 0, 0, cv::INTER_NEAREST);
            dst = z;
        }
    }
    return dst;
}
