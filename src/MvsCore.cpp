// MvsCore.cpp
#include "MvsCore.h"
#include <opencv2/imgproc.hpp>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

// Features exposed in the property browser; absent ones are skipped.
struct Feature {
    const char* key;
    PropertyType type;
};

const Feature kFeatures[] = {
    { "ExposureTime",         PropertyType::Float   },
    { "Gain",                 PropertyType::Float   },
    { "AcquisitionFrameRate", PropertyType::Float   },
    { "Width",                PropertyType::Integer },
    { "Height",               PropertyType::Integer },
    { "OffsetX",              PropertyType::Integer },
    { "OffsetY",              PropertyType::Integer },
    { "PixelFormat",          PropertyType::Enum    },
    { "TriggerMode",          PropertyType::Enum    },
    { "ExposureAuto",         PropertyType::Enum    },
    { "GainAuto",             PropertyType::Enum    },
};

const Feature* findFeature(const std::string& key) {
    for (const auto& f : kFeatures)
        if (key == f.key) return &f;
    return nullptr;
}

std::string fmtDouble(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::string deviceLabel(const MV_CC_DEVICE_INFO* info) {
    const unsigned char* model = nullptr;
    const unsigned char* serial = nullptr;
    if (info->nTLayerType == MV_GIGE_DEVICE) {
        model = info->SpecialInfo.stGigEInfo.chModelName;
        serial = info->SpecialInfo.stGigEInfo.chSerialNumber;
    }
    else if (info->nTLayerType == MV_USB_DEVICE) {
        model = info->SpecialInfo.stUsb3VInfo.chModelName;
        serial = info->SpecialInfo.stUsb3VInfo.chSerialNumber;
    }
    if (!model) return "unknown device";
    std::string label(reinterpret_cast<const char*>(model));
    if (serial && serial[0]) label += " (" + std::string(reinterpret_cast<const char*>(serial)) + ")";
    return label;
}

} // namespace

void MvsCore::check(const char* where, int err) {
    if (err == MV_OK) return;
    std::ostringstream oss; oss << where << " failed: 0x" << std::hex << err;
    throw std::runtime_error(oss.str());
}

void MvsCore::requireOpen(const char* where) const {
    if (!opened_) throw std::runtime_error(std::string(where) + ": no camera loaded");
}

MvsCore::MvsCore() {}
MvsCore::~MvsCore() {
    try { unloadAllDevices(); }
    catch (const std::exception& e) { std::cerr << "[MvsCore] unload failed: " << e.what() << std::endl; }
}

std::vector<std::string> MvsCore::availableDevices() {
    MV_CC_DEVICE_INFO_LIST devList{};
    check("MV_CC_EnumDevices", MV_CC_EnumDevices(MV_GIGE_DEVICE | MV_USB_DEVICE, &devList));
    std::vector<std::string> out;
    for (unsigned int i = 0; i < devList.nDeviceNum; ++i)
        if (devList.pDeviceInfo[i]) out.push_back(deviceLabel(devList.pDeviceInfo[i]));
    return out;
}

void MvsCore::openDevice(unsigned int index) {
    if (opened_) return;
    MV_CC_DEVICE_INFO_LIST devList{};
    int ret = MV_CC_EnumDevices(MV_GIGE_DEVICE | MV_USB_DEVICE, &devList);
    check("MV_CC_EnumDevices", ret);
    if (devList.nDeviceNum <= index) throw std::runtime_error("No camera found");

    MV_CC_DEVICE_INFO* pDevInfo = devList.pDeviceInfo[index];
    if (!pDevInfo) throw std::runtime_error("Invalid device info");

    ret = MV_CC_CreateHandle(&handle_, pDevInfo);
    check("MV_CC_CreateHandle", ret);

    ret = MV_CC_OpenDevice(handle_);
    if (ret != MV_OK) {
        MV_CC_DestroyHandle(handle_); handle_ = nullptr;
        check("MV_CC_OpenDevice", ret);
    }
    opened_ = true;

    if (pDevInfo->nTLayerType == MV_GIGE_DEVICE) {
        int pkt = MV_CC_GetOptimalPacketSize(handle_);
        if (pkt > 0) MV_CC_SetIntValue(handle_, "GevSCPSPacketSize", static_cast<unsigned int>(pkt));
    }
    MV_CC_SetEnumValue(handle_, "TriggerMode", 0);
}

void MvsCore::loadSystemConfiguration(const std::string& path) {
    if (path == kDemoConfig)
        throw std::runtime_error("the demo configuration needs the demo camera");
    unloadAllDevices();
    openDevice(0);
    if (!path.empty()) {
        int ret = MV_CC_FeatureLoad(handle_, path.c_str());
        if (ret != MV_OK) {
            unloadAllDevices();
            check("MV_CC_FeatureLoad", ret);
        }
    }
    configFile_ = path;
}

void MvsCore::saveSystemConfiguration(const std::string& path) {
    requireOpen("saveSystemConfiguration");
    check("MV_CC_FeatureSave", MV_CC_FeatureSave(handle_, path.c_str()));
    configFile_ = path;
}

void MvsCore::unloadAllDevices() {
    if (!opened_) return;
    if (grabbing_) stopContinuousAcquisition();
    MV_CC_CloseDevice(handle_);
    MV_CC_DestroyHandle(handle_);
    handle_ = nullptr;
    opened_ = false;
    configFile_.clear();
}

std::vector<PropertyInfo> MvsCore::properties() {
    std::vector<PropertyInfo> out;
    if (!opened_) return out;
    for (const auto& f : kFeatures) {
        PropertyInfo p;
        p.name = f.key;
        p.type = f.type;
        if (f.type == PropertyType::Float) {
            MVCC_FLOATVALUE v{};
            if (MV_CC_GetFloatValue(handle_, f.key, &v) != MV_OK) continue;
            p.value = fmtDouble(v.fCurValue);
            p.hasLimits = true; p.lower = v.fMin; p.upper = v.fMax;
        }
        else if (f.type == PropertyType::Integer) {
            MVCC_INTVALUE v{};
            if (MV_CC_GetIntValue(handle_, f.key, &v) != MV_OK) continue;
            p.value = std::to_string(v.nCurValue);
            p.hasLimits = true; p.lower = v.nMin; p.upper = v.nMax;
        }
        else {
            MVCC_ENUMVALUE v{};
            if (MV_CC_GetEnumValue(handle_, f.key, &v) != MV_OK) continue;
            p.value = std::to_string(v.nCurValue);
            for (unsigned int i = 0; i < v.nSupportedNum; ++i)
                p.allowed.push_back(std::to_string(v.nSupportValue[i]));
        }
        // geometry is locked while the camera streams
        p.readOnly = grabbing_ && (p.name == "Width" || p.name == "Height" || p.name == "PixelFormat");
        out.push_back(p);
    }
    return out;
}

std::string MvsCore::getProperty(const std::string& key) {
    requireOpen("getProperty");
    const Feature* f = findFeature(key);
    if (!f) throw std::runtime_error("unknown property: " + key);
    if (f->type == PropertyType::Float) {
        MVCC_FLOATVALUE v{};
        check("MV_CC_GetFloatValue", MV_CC_GetFloatValue(handle_, key.c_str(), &v));
        return fmtDouble(v.fCurValue);
    }
    if (f->type == PropertyType::Integer) {
        MVCC_INTVALUE v{};
        check("MV_CC_GetIntValue", MV_CC_GetIntValue(handle_, key.c_str(), &v));
        return std::to_string(v.nCurValue);
    }
    MVCC_ENUMVALUE v{};
    check("MV_CC_GetEnumValue", MV_CC_GetEnumValue(handle_, key.c_str(), &v));
    return std::to_string(v.nCurValue);
}

void MvsCore::setProperty(const std::string& key, const std::string& value) {
    requireOpen("setProperty");
    const Feature* f = findFeature(key);
    if (!f) throw std::runtime_error("unknown property: " + key);
    try {
        if (f->type == PropertyType::Float) {
            check("MV_CC_SetFloatValue", MV_CC_SetFloatValue(handle_, key.c_str(), std::stof(value)));
        }
        else if (f->type == PropertyType::Integer) {
            check("MV_CC_SetIntValue", MV_CC_SetIntValue(handle_, key.c_str(), static_cast<unsigned int>(std::stoul(value))));
        }
        else {
            char* end = nullptr;
            const unsigned long n = std::strtoul(value.c_str(), &end, 10);
            if (end && *end == '\0' && !value.empty())
                check("MV_CC_SetEnumValue", MV_CC_SetEnumValue(handle_, key.c_str(), static_cast<unsigned int>(n)));
            else
                check("MV_CC_SetEnumValueByString", MV_CC_SetEnumValueByString(handle_, key.c_str(), value.c_str()));
        }
    }
    catch (const std::invalid_argument&) {
        throw std::runtime_error("invalid value '" + value + "' for " + key);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("value '" + value + "' out of range for " + key);
    }
}

double MvsCore::exposure() {
    requireOpen("exposure");
    MVCC_FLOATVALUE v{};
    check("MV_CC_GetFloatValue", MV_CC_GetFloatValue(handle_, "ExposureTime", &v));
    return v.fCurValue / 1000.0;
}

void MvsCore::setExposure(double ms) {
    requireOpen("setExposure");
    check("MV_CC_SetFloatValue", MV_CC_SetFloatValue(handle_, "ExposureTime", static_cast<float>(ms * 1000.0)));
}

cv::Mat MvsCore::snapImage() {
    requireOpen("snapImage");
    if (grabbing_) {
        // callback mode owns the stream; hand out the newest frame
        std::scoped_lock lk(cbMtx_);
        if (lastFrame_.empty()) throw std::runtime_error("snapImage: no frame received yet");
        return lastFrame_.clone();
    }

    check("MV_CC_StartGrabbing", MV_CC_StartGrabbing(handle_));
    MV_FRAME_OUT frame{};
    const unsigned int timeoutMs = static_cast<unsigned int>(exposure()) + 1000;
    int ret = MV_CC_GetImageBuffer(handle_, &frame, timeoutMs);
    if (ret != MV_OK) {
        MV_CC_StopGrabbing(handle_);
        check("MV_CC_GetImageBuffer", ret);
    }
    cv::Mat img = toMat(frame.pBufAddr, frame.stFrameInfo);
    MV_CC_FreeImageBuffer(handle_, &frame);
    check("MV_CC_StopGrabbing", MV_CC_StopGrabbing(handle_));
    if (img.empty()) throw std::runtime_error("snapImage: unsupported pixel format");
    return img;
}

void MvsCore::startContinuousAcquisition(FrameCB cb) {
    requireOpen("startContinuousAcquisition");
    if (grabbing_) return;
    {
        std::scoped_lock lk(cbMtx_);
        userCb_ = std::move(cb);
        lastFrame_.release();
    }

    int ret = MV_CC_RegisterImageCallBackEx(handle_, &MvsCore::ImageCallback, this);
    check("MV_CC_RegisterImageCallBackEx", ret);

    ret = MV_CC_StartGrabbing(handle_);
    check("MV_CC_StartGrabbing", ret);
    grabbing_ = true;
}

void MvsCore::stopContinuousAcquisition() {
    if (!opened_ || !grabbing_) return;
    int ret = MV_CC_StopGrabbing(handle_);
    check("MV_CC_StopGrabbing", ret);
    MV_CC_RegisterImageCallBackEx(handle_, nullptr, nullptr);
    grabbing_ = false;
    std::scoped_lock lk(cbMtx_);
    userCb_ = nullptr;
}

void MvsCore::ImageCallback(unsigned char* pData, MV_FRAME_OUT_INFO_EX* pInfo, void* pUser) {
    if (!pUser || !pData || !pInfo) return;
    reinterpret_cast<MvsCore*>(pUser)->onImage(pData, pInfo);
}

void MvsCore::onImage(unsigned char* pData, MV_FRAME_OUT_INFO_EX* pInfo) {
    cv::Mat img = toMat(pData, *pInfo);
    if (img.empty()) return;
    std::scoped_lock lk(cbMtx_);
    lastFrame_ = img;
    if (userCb_) userCb_(img);
}

cv::Mat MvsCore::toMat(unsigned char* pData, const MV_FRAME_OUT_INFO_EX& info) {
    const int w = static_cast<int>(info.nWidth);
    const int h = static_cast<int>(info.nHeight);

    cv::Mat out;
    switch (info.enPixelType) {
        case PixelType_Gvsp_Mono8: {
            out = cv::Mat(h, w, CV_8UC1, pData).clone();
            break;
        }
        case PixelType_Gvsp_Mono10:
        case PixelType_Gvsp_Mono12:
        case PixelType_Gvsp_Mono16: {
            out = cv::Mat(h, w, CV_16UC1, pData).clone();
            break;
        }
        case PixelType_Gvsp_BGR8_Packed: {
            out = cv::Mat(h, w, CV_8UC3, pData).clone();
            break;
        }
        case PixelType_Gvsp_RGB8_Packed: {
            cv::Mat rgb(h, w, CV_8UC3, pData);
            cv::cvtColor(rgb, out, cv::COLOR_RGB2BGR);
            break;
        }
        // OpenCV names the pattern after the second row/column: RGGB is "BG"
        case PixelType_Gvsp_BayerRG8: {
            cv::Mat bayer(h, w, CV_8UC1, pData);
            cv::cvtColor(bayer, out, cv::COLOR_BayerBG2BGR);
            break;
        }
        case PixelType_Gvsp_BayerGB8: {
            cv::Mat bayer(h, w, CV_8UC1, pData);
            cv::cvtColor(bayer, out, cv::COLOR_BayerGR2BGR);
            break;
        }
        case PixelType_Gvsp_BayerBG8: {
            cv::Mat bayer(h, w, CV_8UC1, pData);
            cv::cvtColor(bayer, out, cv::COLOR_BayerRG2BGR);
            break;
        }
        case PixelType_Gvsp_BayerGR8: {
            cv::Mat bayer(h, w, CV_8UC1, pData);
            cv::cvtColor(bayer, out, cv::COLOR_BayerGB2BGR);
            break;
        }
        default:
            break;
    }
    return out;
}
