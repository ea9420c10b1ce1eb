// FrameProcessor.h
// - display pipeline for the preview: contrast -> gamma -> LUT -> flip -> zoom
// - input: mono CV_8U / CV_16U or BGR, output: 8-bit BGR
#pragma once
#include <opencv2/core.hpp>

enum class Lut { Gray, Green, Magenta, Fire };

class FrameProcessor {
public:
    cv::Mat run(const cv::Mat& src);

    void setAutoContrast(bool on) { autoContrast_ = on; }
    void setRange(double lo, double hi) { lo_ = lo; hi_ = (hi > lo ? hi : lo + 1.0); }
    void setGamma(double g) { gamma_ = (g <= 0.0 ? 0.1 : g); }
    void setLut(Lut lut) { lut_ = lut; }
    void setZoom(int z) { zoom_ = (z < 1 ? 1 : z); }
    void setFlipH(bool v) { flipH_ = v; }
    void setFlipV(bool v) { flipV_ = v; }

    bool autoContrast() const { return autoContrast_; }
    // Range used for the most recent mono frame.
    double lastLow() const { return lastLo_; }
    double lastHigh() const { return lastHi_; }

private:
    cv::Mat toDisplay8(const cv::Mat& mono);
    cv::Mat applyLut(const cv::Mat& gray8) const;

    bool autoContrast_{ true };
    double lo_{ 0.0 }, hi_{ 65535.0 };
    double lastLo_{ 0.0 }, lastHi_{ 0.0 };
    double gamma_{ 1.0 };
    Lut lut_{ Lut::Gray };
    int zoom_{ 1 };
    bool flipH_{ false };
    bool flipV_{ false };
};
