#undef NDEBUG
#include "FrameProcessor.h"

#include <cassert>
#include <cstdlib>

static cv::Mat ramp16() {
    cv::Mat m(2, 4, CV_16UC1);
    const ushort vals[] = { 0, 250, 500, 1000 };
    for (int r = 0; r < m.rows; ++r)
        for (int c = 0; c < m.cols; ++c) m.at<ushort>(r, c) = vals[c];
    return m;
}

int main() {
    {
        FrameProcessor p;
        assert(p.run(cv::Mat()).empty());
    }

    {
        // auto contrast maps min..max onto 0..255
        FrameProcessor p;
        const cv::Mat out = p.run(ramp16());
        assert(out.type() == CV_8UC3);
        assert(out.size() == cv::Size(4, 2));
        assert(p.lastLow() == 0.0 && p.lastHigh() == 1000.0);
        assert(out.at<cv::Vec3b>(0, 0) == cv::Vec3b(0, 0, 0));
        assert(out.at<cv::Vec3b>(0, 3) == cv::Vec3b(255, 255, 255));
    }

    {
        // fixed range saturates above the upper limit
        FrameProcessor p;
        p.setAutoContrast(false);
        p.setRange(0, 500);
        const cv::Mat out = p.run(ramp16());
        assert(p.lastHigh() == 500.0);
        assert(out.at<cv::Vec3b>(0, 2)[0] == 255);
        assert(out.at<cv::Vec3b>(0, 3)[0] == 255);
        assert(std::abs(out.at<cv::Vec3b>(0, 1)[0] - 128) <= 1);
    }

    {
        // flat image does not divide by zero
        FrameProcessor p;
        cv::Mat flat(3, 3, CV_8UC1, cv::Scalar(42));
        const cv::Mat out = p.run(flat);
        assert(out.at<cv::Vec3b>(1, 1) == cv::Vec3b(0, 0, 0));
        assert(p.lastHigh() > p.lastLow());
    }

    {
        FrameProcessor p;
        p.setLut(Lut::Green);
        const cv::Vec3b px = p.run(ramp16()).at<cv::Vec3b>(0, 3);
        assert(px[0] == 0 && px[1] == 255 && px[2] == 0);

        p.setLut(Lut::Magenta);
        const cv::Vec3b mg = p.run(ramp16()).at<cv::Vec3b>(0, 3);
        assert(mg[0] == 255 && mg[1] == 0 && mg[2] == 255);
    }

    {
        // gamma > 1 darkens mid-tones, keeps the ends
        FrameProcessor lin, gam;
        gam.setGamma(2.0);
        const cv::Mat a = lin.run(ramp16());
        const cv::Mat b = gam.run(ramp16());
        assert(b.at<cv::Vec3b>(0, 2)[0] < a.at<cv::Vec3b>(0, 2)[0]);
        assert(b.at<cv::Vec3b>(0, 3)[0] == 255);
        assert(b.at<cv::Vec3b>(0, 0)[0] == 0);
    }

    {
        FrameProcessor p;
        p.setFlipH(true);
        const cv::Mat out = p.run(ramp16());
        assert(out.at<cv::Vec3b>(0, 0)[0] == 255);
        assert(out.at<cv::Vec3b>(0, 3)[0] == 0);
    }

    {
        // zoom keeps the frame size
        FrameProcessor p;
        p.setZoom(2);
        cv::Mat big(64, 64, CV_16UC1, cv::Scalar(0));
        big(cv::Rect(16, 16, 32, 32)).setTo(cv::Scalar(4000));
        const cv::Mat out = p.run(big);
        assert(out.size() == big.size());
        assert(out.at<cv::Vec3b>(0, 0)[0] == 255);   // corner now shows the centre
    }

    {
        // colour frames are passed through, 16-bit ones scaled down
        FrameProcessor p;
        cv::Mat bgr16(2, 2, CV_16UC3, cv::Scalar(65535, 0, 0));
        const cv::Mat out = p.run(bgr16);
        assert(out.type() == CV_8UC3);
        assert(out.at<cv::Vec3b>(0, 0)[0] == 255);
    }

    return 0;
}
