// Acquisition.cpp
#include "Acquisition.h"
#include <chrono>
#include <iostream>
#include <stdexcept>

AcquisitionRunner::AcquisitionRunner(DeviceCore& core)
    : core_(core) {}

AcquisitionRunner::~AcquisitionRunner() {
    cancel();
    wait();
}

void AcquisitionRunner::validate(const SequencePlan& plan) {
    if (plan.timepoints < 1) throw std::invalid_argument("timepoints must be at least 1");
    if (plan.intervalMs < 0.0) throw std::invalid_argument("interval must not be negative");
    for (const auto& ch : plan.channels)
        if (ch.exposureMs <= 0.0) throw std::invalid_argument("channel '" + ch.name + "' needs a positive exposure");
}

void AcquisitionRunner::start(const SequencePlan& plan, FrameCB onFrame, DoneCB onDone) {
    validate(plan);
    if (running_) throw std::runtime_error("an acquisition is already running");
    if (core_.isSequenceRunning()) throw std::runtime_error("stop live mode before starting an acquisition");
    if (worker_.joinable()) worker_.join();

    cancel_ = false;
    running_ = true;
    worker_ = std::thread(&AcquisitionRunner::run, this, plan, std::move(onFrame), std::move(onDone));
}

void AcquisitionRunner::cancel() {
    cancel_ = true;
}

void AcquisitionRunner::wait() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

bool AcquisitionRunner::sleepUnless(double ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::microseconds(static_cast<long long>(ms * 1000.0));
    while (std::chrono::steady_clock::now() < until) {
        if (cancel_) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return !cancel_;
}

void AcquisitionRunner::run(SequencePlan plan, FrameCB onFrame, DoneCB onDone) {
    RunState state = RunState::Finished;
    std::string error;
    double savedExposure = 0.0;
    bool haveExposure = false;

    try {
        savedExposure = core_.exposure();
        haveExposure = true;

        for (int t = 0; t < plan.timepoints && state == RunState::Finished; ++t) {
            const auto t0 = std::chrono::steady_clock::now();
            for (int c = 0; c < plan.channelCount(); ++c) {
                if (cancel_) { state = RunState::Cancelled; break; }
                if (!plan.channels.empty()) core_.setExposure(plan.channels[c].exposureMs);
                cv::Mat img = core_.snapImage();
                if (onFrame) onFrame(FrameIndex{ t, c }, img);
            }
            if (state != RunState::Finished || t + 1 == plan.timepoints) break;

            const double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
            if (!sleepUnless(plan.intervalMs - elapsed)) state = RunState::Cancelled;
        }
    }
    catch (const std::exception& e) {
        state = RunState::Failed;
        error = e.what();
        std::cerr << "[Acquisition] " << error << std::endl;
    }

    if (haveExposure) {
        try { core_.setExposure(savedExposure); }
        catch (const std::exception& e) { std::cerr << "[Acquisition] could not restore exposure: " << e.what() << std::endl; }
    }

    running_ = false;
    if (onDone) onDone(state, error);
}
