// StackWriter.cpp
#include "StackWriter.h"
#include <opencv2/imgcodecs.hpp>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

void StackWriter::open(const std::string& dir, const std::string& prefix) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw std::runtime_error("cannot create " + dir + ": " + ec.message());
    dir_ = dir;
    prefix_ = prefix.empty() ? "acq" : prefix;
    written_ = 0;
    open_ = true;
}

std::string StackWriter::pathFor(const FrameIndex& idx) const {
    char name[64];
    std::snprintf(name, sizeof(name), "_t%04d_c%02d.tif", idx.t, idx.c);
    return (std::filesystem::path(dir_) / (prefix_ + name)).string();
}

void StackWriter::write(const FrameIndex& idx, const cv::Mat& img) {
    if (!open_) return;
    saveImage(pathFor(idx), img);
    ++written_;
}

void StackWriter::close() {
    open_ = false;
}

void StackWriter::saveImage(const std::string& path, const cv::Mat& img) {
    if (img.empty()) throw std::runtime_error("no image to save");
    bool ok = false;
    try {
        ok = cv::imwrite(path, img);
    }
    catch (const cv::Exception& e) {
        throw std::runtime_error("cannot write " + path + ": " + e.msg);
    }
    if (!ok) throw std::runtime_error("cannot write " + path);
}
