#undef NDEBUG
#include "MvsCore.h"

#include <cassert>
#include <cstdint>
#include <cstring>
#include <vector>

static MV_FRAME_OUT_INFO_EX frameInfo(int w, int h, MvGvspPixelType type) {
    MV_FRAME_OUT_INFO_EX info{};
    info.nWidth = static_cast<unsigned short>(w);
    info.nHeight = static_cast<unsigned short>(h);
    info.enPixelType = type;
    return info;
}

int main() {
    {
        std::vector<unsigned char> buf(4 * 3);
        for (size_t i = 0; i < buf.size(); ++i) buf[i] = static_cast<unsigned char>(i * 10);
        const cv::Mat m = MvsCore::toMat(buf.data(), frameInfo(4, 3, PixelType_Gvsp_Mono8));
        assert(m.type() == CV_8UC1);
        assert(m.cols == 4 && m.rows == 3);
        assert(m.at<uint8_t>(2, 3) == 110);

        // the result owns its pixels
        buf[0] = 255;
        assert(m.at<uint8_t>(0, 0) == 0);
    }

    {
        std::vector<uint16_t> buf(2 * 2, 0);
        buf[3] = 4095;
        for (auto type : { PixelType_Gvsp_Mono12, PixelType_Gvsp_Mono16 }) {
            const cv::Mat m = MvsCore::toMat(reinterpret_cast<unsigned char*>(buf.data()), frameInfo(2, 2, type));
            assert(m.type() == CV_16UC1);
            assert(m.at<uint16_t>(1, 1) == 4095);
            assert(m.at<uint16_t>(0, 0) == 0);
        }
    }

    {
        // RGB becomes BGR, BGR is kept as is
        std::vector<unsigned char> rgb = { 10, 20, 30, 40, 50, 60 };
        const cv::Mat m = MvsCore::toMat(rgb.data(), frameInfo(2, 1, PixelType_Gvsp_RGB8_Packed));
        assert(m.type() == CV_8UC3);
        assert(m.at<cv::Vec3b>(0, 0) == cv::Vec3b(30, 20, 10));
        assert(m.at<cv::Vec3b>(0, 1) == cv::Vec3b(60, 50, 40));

        const cv::Mat b = MvsCore::toMat(rgb.data(), frameInfo(2, 1, PixelType_Gvsp_BGR8_Packed));
        assert(b.at<cv::Vec3b>(0, 0) == cv::Vec3b(10, 20, 30));
    }

    {
        // a flat Bayer mosaic demosaics to flat grey
        std::vector<unsigned char> raw(8 * 8, 100);
        for (auto type : { PixelType_Gvsp_BayerRG8, PixelType_Gvsp_BayerGB8,
                           PixelType_Gvsp_BayerBG8, PixelType_Gvsp_BayerGR8 }) {
            const cv::Mat m = MvsCore::toMat(raw.data(), frameInfo(8, 8, type));
            assert(m.type() == CV_8UC3);
            assert(m.cols == 8 && m.rows == 8);
            assert(m.at<cv::Vec3b>(4, 4) == cv::Vec3b(100, 100, 100));
        }
    }

    {
        // Bayer RG: the red site ends up in the red (third) channel
        std::vector<unsigned char> raw(8 * 8, 0);
        for (int y = 0; y < 8; y += 2)
            for (int x = 0; x < 8; x += 2) raw[y * 8 + x] = 200;
        const cv::Mat m = MvsCore::toMat(raw.data(), frameInfo(8, 8, PixelType_Gvsp_BayerRG8));
        const cv::Vec3b px = m.at<cv::Vec3b>(4, 4);
        assert(px[2] == 200);
        assert(px[0] == 0);
    }

    {
        std::vector<unsigned char> raw(16, 0);
        assert(MvsCore::toMat(raw.data(), frameInfo(4, 4, PixelType_Gvsp_YUV422_Packed)).empty());
    }

    return 0;
}
