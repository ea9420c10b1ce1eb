// DemoCore.h
// - synthetic 16-bit camera: noise floor plus a drifting bright spot
// - configuration files are JSON property maps; "demo" loads the built-in defaults
#pragma once
#include "DeviceCore.h"
#include <atomic>
#include <map>
#include <mutex>
#include <thread>

class DemoCore : public DeviceCore {
public:
    DemoCore();
    ~DemoCore() override;

    std::string name() const override { return "Demo camera"; }
    std::vector<std::string> availableDevices() override { return { "DemoCamera" }; }

    void loadSystemConfiguration(const std::string& path) override;
    void saveSystemConfiguration(const std::string& path) override;
    void unloadAllDevices() override;
    bool isLoaded() const override;
    std::string systemConfigurationFile() const override;

    std::vector<PropertyInfo> properties() override;
    std::string getProperty(const std::string& key) override;
    void setProperty(const std::string& key, const std::string& value) override;

    double exposure() override;
    void setExposure(double ms) override;

    cv::Mat snapImage() override;

    void startContinuousAcquisition(FrameCB cb) override;
    void stopContinuousAcquisition() override;
    bool isSequenceRunning() const override { return live_; }

    // When false, snaps return immediately instead of sleeping for the exposure.
    void setSimulateTiming(bool on) { simulateTiming_ = on; }

private:
    void resetProperties();
    cv::Mat render();
    void requireLoaded(const char* where) const;
    void setLocked(const std::string& key, const std::string& value);

    mutable std::mutex mtx_;
    std::map<std::string, PropertyInfo> props_;
    bool loaded_ = false;
    std::string configFile_;
    unsigned long frameCounter_ = 0;
    std::atomic<bool> simulateTiming_{ true };

    std::atomic<bool> live_{ false };
    std::thread liveThread_;
};
