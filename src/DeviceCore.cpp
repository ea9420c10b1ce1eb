// DeviceCore.cpp
#include "DeviceCore.h"
#include "DemoCore.h"
#include "MvsCore.h"

std::shared_ptr<DeviceCore> createDefaultCore(const std::string& config) {
    if (config == kDemoConfig) return std::make_shared<DemoCore>();
    return std::make_shared<MvsCore>();
}
