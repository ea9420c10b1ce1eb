// DemoCore.cpp
#include "DemoCore.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

PropertyInfo makeNumber(const char* name, PropertyType type, double value, double lo, double hi) {
    PropertyInfo p;
    p.name = name;
    p.type = type;
    std::ostringstream oss; oss << value;
    p.value = oss.str();
    p.hasLimits = true;
    p.lower = lo;
    p.upper = hi;
    return p;
}

PropertyInfo makeEnum(const char* name, const std::string& value, std::vector<std::string> allowed) {
    PropertyInfo p;
    p.name = name;
    p.type = PropertyType::Enum;
    p.value = value;
    p.allowed = std::move(allowed);
    return p;
}

} // namespace

DemoCore::DemoCore() {
    resetProperties();
}

DemoCore::~DemoCore() {
    stopContinuousAcquisition();
}

void DemoCore::resetProperties() {
    props_.clear();
    auto add = [this](PropertyInfo p) { props_[p.name] = p; };
    add(makeNumber("Exposure", PropertyType::Float,   10.0, 0.1, 10000.0));
    add(makeNumber("Gain",     PropertyType::Float,    0.0, 0.0, 24.0));
    add(makeNumber("Width",    PropertyType::Integer, 512, 64, 2048));
    add(makeNumber("Height",   PropertyType::Integer, 512, 64, 2048));
    add(makeEnum("Binning", "1", { "1", "2", "4" }));
    add(makeEnum("PixelType", "Mono16", { "Mono8", "Mono16" }));

    PropertyInfo cam;
    cam.name = "CameraName";
    cam.value = "DemoCamera";
    cam.readOnly = true;
    add(cam);
}

void DemoCore::requireLoaded(const char* where) const {
    if (!loaded_) throw std::runtime_error(std::string(where) + ": no configuration loaded");
}

void DemoCore::loadSystemConfiguration(const std::string& path) {
    stopContinuousAcquisition();
    std::scoped_lock lk(mtx_);
    resetProperties();
    loaded_ = false;
    if (!path.empty() && path != kDemoConfig) {
        QFile f(QString::fromStdString(path));
        if (!f.open(QIODevice::ReadOnly)) throw std::runtime_error("cannot open configuration " + path);
        QJsonParseError err{};
        const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
        if (err.error != QJsonParseError::NoError)
            throw std::runtime_error("configuration " + path + ": " + err.errorString().toStdString());
        const QJsonValue node = doc.object().value("properties");
        if (!node.isObject()) throw std::runtime_error("configuration " + path + " has no properties map");
        const QJsonObject values = node.toObject();
        for (auto item = values.constBegin(); item != values.constEnd(); ++item) {
            const std::string key = item.key().toStdString();
            auto it = props_.find(key);
            if (it == props_.end() || it->second.readOnly) continue;
            if (item.value().isString()) setLocked(key, item.value().toString().toStdString());
            else if (item.value().isDouble()) setLocked(key, QString::number(item.value().toDouble()).toStdString());
            else throw std::runtime_error("configuration " + path + ": bad value for " + key);
        }
    }
    configFile_ = path.empty() ? kDemoConfig : path;
    loaded_ = true;
}

void DemoCore::saveSystemConfiguration(const std::string& path) {
    std::scoped_lock lk(mtx_);
    requireLoaded("saveSystemConfiguration");
    QJsonObject values;
    for (const auto& [key, p] : props_) {
        if (p.readOnly) continue;
        values.insert(QString::fromStdString(key), QString::fromStdString(p.value));
    }
    QSaveFile out(QString::fromStdString(path));
    if (!out.open(QIODevice::WriteOnly)) throw std::runtime_error("cannot write configuration " + path);
    out.write(QJsonDocument(QJsonObject{ { "properties", values } }).toJson(QJsonDocument::Indented));
    if (!out.commit()) throw std::runtime_error("cannot write configuration " + path);
    configFile_ = path;
}

void DemoCore::unloadAllDevices() {
    stopContinuousAcquisition();
    std::scoped_lock lk(mtx_);
    loaded_ = false;
    configFile_.clear();
    resetProperties();
}

bool DemoCore::isLoaded() const {
    std::scoped_lock lk(mtx_);
    return loaded_;
}

std::string DemoCore::systemConfigurationFile() const {
    std::scoped_lock lk(mtx_);
    return configFile_;
}

std::vector<PropertyInfo> DemoCore::properties() {
    std::scoped_lock lk(mtx_);
    std::vector<PropertyInfo> out;
    if (!loaded_) return out;
    for (const auto& [key, p] : props_) {
        PropertyInfo info = p;
        if (live_ && (key == "Width" || key == "Height" || key == "Binning")) info.readOnly = true;
        out.push_back(info);
    }
    return out;
}

std::string DemoCore::getProperty(const std::string& key) {
    std::scoped_lock lk(mtx_);
    requireLoaded("getProperty");
    auto it = props_.find(key);
    if (it == props_.end()) throw std::runtime_error("unknown property: " + key);
    return it->second.value;
}

void DemoCore::setProperty(const std::string& key, const std::string& value) {
    std::scoped_lock lk(mtx_);
    requireLoaded("setProperty");
    if (live_ && (key == "Width" || key == "Height" || key == "Binning"))
        throw std::runtime_error(key + " cannot change during live mode");
    setLocked(key, value);
}

void DemoCore::setLocked(const std::string& key, const std::string& value) {
    auto it = props_.find(key);
    if (it == props_.end()) throw std::runtime_error("unknown property: " + key);
    PropertyInfo& p = it->second;
    if (p.readOnly) throw std::runtime_error(key + " is read-only");

    if (p.type == PropertyType::Float || p.type == PropertyType::Integer) {
        double v = 0.0;
        try { v = std::stod(value); }
        catch (const std::exception&) { throw std::runtime_error("invalid value '" + value + "' for " + key); }
        if (p.type == PropertyType::Integer) v = std::round(v);
        if (p.hasLimits && (v < p.lower || v > p.upper))
            throw std::runtime_error("value " + value + " out of range for " + key);
        std::ostringstream oss; oss << v;
        p.value = oss.str();
    }
    else if (p.type == PropertyType::Enum) {
        if (std::find(p.allowed.begin(), p.allowed.end(), value) == p.allowed.end())
            throw std::runtime_error("invalid value '" + value + "' for " + key);
        p.value = value;
    }
    else {
        p.value = value;
    }
}

double DemoCore::exposure() {
    return std::stod(getProperty("Exposure"));
}

void DemoCore::setExposure(double ms) {
    std::ostringstream oss; oss << ms;
    setProperty("Exposure", oss.str());
}

cv::Mat DemoCore::render() {
    std::scoped_lock lk(mtx_);
    requireLoaded("snapImage");
    const int bin = std::stoi(props_["Binning"].value);
    const int w = std::stoi(props_["Width"].value) / bin;
    const int h = std::stoi(props_["Height"].value) / bin;
    const double exposureMs = std::stod(props_["Exposure"].value);
    const double gain = std::pow(10.0, std::stod(props_["Gain"].value) / 20.0);
    const bool mono8 = props_["PixelType"].value == "Mono8";
    const double maxVal = mono8 ? 255.0 : 65535.0;
    const unsigned long n = frameCounter_++;

    cv::Mat f(h, w, CV_32FC1);
    const double base = (mono8 ? 10.0 : 100.0) * gain;
    cv::randn(f, base, base * 0.1 + 1.0);

    // spot drifts on a circle, brightness grows with exposure and gain
    cv::Mat spot = cv::Mat::zeros(h, w, CV_32FC1);
    const double phase = n * 0.1;
    const cv::Point center(static_cast<int>(w / 2 + w / 4 * std::cos(phase)),
                           static_cast<int>(h / 2 + h / 4 * std::sin(phase)));
    const double peak = std::min(maxVal, exposureMs * gain * (mono8 ? 2.0 : 500.0));
    cv::circle(spot, center, std::max(2, std::min(w, h) / 16), cv::Scalar(peak), cv::FILLED);
    cv::GaussianBlur(spot, spot, cv::Size(0, 0), std::max(1.0, std::min(w, h) / 64.0));
    f += spot;

    cv::Mat out;
    f.convertTo(out, mono8 ? CV_8UC1 : CV_16UC1);
    return out;
}

cv::Mat DemoCore::snapImage() {
    if (simulateTiming_) {
        const auto ms = static_cast<long long>(exposure());
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
    return render();
}

void DemoCore::startContinuousAcquisition(FrameCB cb) {
    if (!isLoaded()) throw std::runtime_error("startContinuousAcquisition: no configuration loaded");
    if (live_) return;
    if (liveThread_.joinable()) liveThread_.join();   // previous run stopped on an error
    live_ = true;
    liveThread_ = std::thread([this, cb = std::move(cb)]() {
        while (live_) {
            const auto t0 = std::chrono::steady_clock::now();
            double period = 20.0;
            try {
                cv::Mat img = render();
                if (cb) cb(img);
                period = std::max(period, exposure());
            }
            catch (const std::exception& e) {
                std::cerr << "[DemoCore] live mode stopped: " << e.what() << std::endl;
                live_ = false;
                break;
            }
            std::this_thread::sleep_until(t0 + std::chrono::microseconds(static_cast<long long>(period * 1000.0)));
        }
    });
}

void DemoCore::stopContinuousAcquisition() {
    live_ = false;
    if (liveThread_.joinable()) liveThread_.join();
}
