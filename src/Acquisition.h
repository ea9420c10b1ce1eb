// Acquisition.h
// - multi-timepoint / multi-channel sequence run on a worker thread
#pragma once
#include "DeviceCore.h"
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

struct ChannelStep {
    std::string name;
    double exposureMs = 10.0;
};

struct SequencePlan {
    int timepoints = 1;
    double intervalMs = 0.0;            // start-to-start time between timepoints
    std::vector<ChannelStep> channels;  // empty = one frame at the current exposure

    int channelCount() const { return channels.empty() ? 1 : static_cast<int>(channels.size()); }
    int totalFrames() const { return timepoints * channelCount(); }
};

struct FrameIndex {
    int t = 0;
    int c = 0;
};

enum class RunState { Finished, Cancelled, Failed };

class AcquisitionRunner {
public:
    using FrameCB = std::function<void(const FrameIndex& idx, const cv::Mat& img)>;
    using DoneCB  = std::function<void(RunState state, const std::string& error)>;

    explicit AcquisitionRunner(DeviceCore& core);
    ~AcquisitionRunner();

    AcquisitionRunner(const AcquisitionRunner&) = delete;
    AcquisitionRunner& operator=(const AcquisitionRunner&) = delete;

    // Throws if a sequence is already running or the plan is invalid.
    // Callbacks are invoked on the worker thread.
    void start(const SequencePlan& plan, FrameCB onFrame, DoneCB onDone);
    void cancel();
    void wait();
    bool isRunning() const { return running_; }

    static void validate(const SequencePlan& plan);

private:
    void run(SequencePlan plan, FrameCB onFrame, DoneCB onDone);
    bool sleepUnless(double ms);

    DeviceCore& core_;
    std::thread worker_;
    std::atomic<bool> running_{ false };
    std::atomic<bool> cancel_{ false };
};
