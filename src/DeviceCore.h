// DeviceCore.h
// - device-control handle used by the GUI (camera enumeration, properties, snap, live)
// - MvsCore: Hikrobot MVS cameras, DemoCore: synthetic camera without hardware
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

// Configuration sentinel that selects the demo camera.
constexpr const char* kDemoConfig = "demo";

enum class PropertyType { String, Integer, Float, Enum, Bool };

struct PropertyInfo {
    std::string name;
    PropertyType type = PropertyType::String;
    std::string value;
    bool readOnly = false;
    bool hasLimits = false;
    double lower = 0.0, upper = 0.0;
    std::vector<std::string> allowed;   // Enum choices
};

class DeviceCore {
public:
    using FrameCB = std::function<void(const cv::Mat& img)>;

    virtual ~DeviceCore() = default;

    virtual std::string name() const = 0;
    virtual std::vector<std::string> availableDevices() = 0;

    // Opens the hardware described by `path` (throws on failure).
    virtual void loadSystemConfiguration(const std::string& path) = 0;
    virtual void saveSystemConfiguration(const std::string& path) = 0;
    virtual void unloadAllDevices() = 0;
    virtual bool isLoaded() const = 0;
    virtual std::string systemConfigurationFile() const = 0;

    virtual std::vector<PropertyInfo> properties() = 0;
    virtual std::string getProperty(const std::string& key) = 0;
    virtual void setProperty(const std::string& key, const std::string& value) = 0;

    virtual double exposure() = 0;              // ms
    virtual void setExposure(double ms) = 0;

    // Single frame, mono frames keep their bit depth (CV_8U / CV_16U).
    virtual cv::Mat snapImage() = 0;

    virtual void startContinuousAcquisition(FrameCB cb) = 0;
    virtual void stopContinuousAcquisition() = 0;
    virtual bool isSequenceRunning() const = 0;
};

// MVS core, or the demo core when `config` is the demo sentinel.
std::shared_ptr<DeviceCore> createDefaultCore(const std::string& config = {});
