// MvsCore.h
// - DeviceCore over the Hikrobot MVS SDK (GigE Vision / USB3 Vision cameras)
// - the system configuration file is the SDK feature file (MV_CC_FeatureSave)
#pragma once
#include "DeviceCore.h"
#include <mutex>
#include <MvCameraControl.h>

class MvsCore : public DeviceCore {
public:
    MvsCore();
    ~MvsCore() override;

    std::string name() const override { return "Hikrobot MVS"; }
    std::vector<std::string> availableDevices() override;

    void loadSystemConfiguration(const std::string& path) override;
    void saveSystemConfiguration(const std::string& path) override;
    void unloadAllDevices() override;
    bool isLoaded() const override { return opened_; }
    std::string systemConfigurationFile() const override { return configFile_; }

    std::vector<PropertyInfo> properties() override;
    std::string getProperty(const std::string& key) override;
    void setProperty(const std::string& key, const std::string& value) override;

    double exposure() override;
    void setExposure(double ms) override;

    cv::Mat snapImage() override;

    void startContinuousAcquisition(FrameCB cb) override;
    void stopContinuousAcquisition() override;
    bool isSequenceRunning() const override { return grabbing_; }

    // Opens device `index` of the current enumeration.
    void openDevice(unsigned int index = 0);

    // Mono8/Mono10/Mono12/Mono16 keep one channel, colour formats become BGR.
    static cv::Mat toMat(unsigned char* pData, const MV_FRAME_OUT_INFO_EX& info);

private:
    static void ImageCallback(unsigned char* pData, MV_FRAME_OUT_INFO_EX* pInfo, void* pUser);
    void onImage(unsigned char* pData, MV_FRAME_OUT_INFO_EX* pInfo);
    static void check(const char* where, int err);
    void requireOpen(const char* where) const;

    void* handle_ = nullptr;
    bool  opened_ = false;
    bool  grabbing_ = false;
    std::string configFile_;

    std::mutex cbMtx_;
    FrameCB userCb_;
    cv::Mat lastFrame_;
};
