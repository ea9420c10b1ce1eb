// StackWriter.h
// - writes acquired frames as TIFF files <prefix>_t0000_c00.tif (16-bit kept)
#pragma once
#include "Acquisition.h"
#include <opencv2/core.hpp>
#include <string>

class StackWriter {
public:
    // Creates `dir` if needed; throws if it cannot be created.
    void open(const std::string& dir, const std::string& prefix);
    void write(const FrameIndex& idx, const cv::Mat& img);
    void close();
    bool isOpen() const { return open_; }
    int framesWritten() const { return written_; }

    std::string pathFor(const FrameIndex& idx) const;

    // Saves one frame to `path`; the extension picks the format.
    static void saveImage(const std::string& path, const cv::Mat& img);

private:
    std::string dir_;
    std::string prefix_;
    bool open_ = false;
    int written_ = 0;
};
