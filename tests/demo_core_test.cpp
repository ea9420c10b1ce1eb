#undef NDEBUG
#include "Acquisition.h"
#include "DemoCore.h"
#include "StackWriter.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

template <typename F>
static bool throws(F&& f) {
    try { f(); }
    catch (const std::exception&) { return true; }
    return false;
}

// Collects runner callbacks; done() blocks until onDone fired.
struct RunRecorder {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<FrameIndex> frames;
    std::vector<double> exposures;
    bool finished = false;
    RunState state = RunState::Failed;
    std::string error;

    AcquisitionRunner::FrameCB onFrame(DeviceCore& core) {
        return [this, &core](const FrameIndex& idx, const cv::Mat& img) {
            assert(!img.empty());
            std::scoped_lock lk(mtx);
            frames.push_back(idx);
            exposures.push_back(core.exposure());
        };
    }
    AcquisitionRunner::DoneCB onDone() {
        return [this](RunState s, const std::string& e) {
            std::scoped_lock lk(mtx);
            state = s;
            error = e;
            finished = true;
            cv.notify_all();
        };
    }
    bool done(std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        std::unique_lock lk(mtx);
        return cv.wait_for(lk, timeout, [this] { return finished; });
    }
};

int main() {
    {
        DemoCore core;
        assert(!core.isLoaded());
        assert(core.properties().empty());
        assert(throws([&] { core.snapImage(); }));

        core.loadSystemConfiguration(kDemoConfig);
        assert(core.isLoaded());
        assert(core.systemConfigurationFile() == kDemoConfig);
        assert(core.properties().size() == 7);
    }

    {
        DemoCore core;
        core.setSimulateTiming(false);
        core.loadSystemConfiguration(kDemoConfig);

        cv::Mat img = core.snapImage();
        assert(img.type() == CV_16UC1);
        assert(img.size() == cv::Size(512, 512));

        core.setProperty("Binning", "2");
        core.setProperty("PixelType", "Mono8");
        img = core.snapImage();
        assert(img.type() == CV_8UC1);
        assert(img.size() == cv::Size(256, 256));

        core.setExposure(25.5);
        assert(core.exposure() == 25.5);
        core.setProperty("Width", "100.4");
        assert(core.getProperty("Width") == "100");

        assert(throws([&] { core.setProperty("Binning", "3"); }));
        assert(throws([&] { core.setProperty("Gain", "99"); }));
        assert(throws([&] { core.setProperty("Gain", "loud"); }));
        assert(throws([&] { core.setProperty("CameraName", "x"); }));
        assert(throws([&] { core.getProperty("Nope"); }));
    }

    {
        // JSON configuration save / load
        QTemporaryDir tmp;
        const std::string path = tmp.filePath("demo.json").toStdString();
        {
            DemoCore core;
            core.loadSystemConfiguration(kDemoConfig);
            core.setProperty("Gain", "6");
            core.setProperty("PixelType", "Mono8");
            core.saveSystemConfiguration(path);
        }
        DemoCore core;
        core.loadSystemConfiguration(path);
        assert(core.getProperty("Gain") == "6");
        assert(core.getProperty("PixelType") == "Mono8");
        assert(core.systemConfigurationFile() == path);

        assert(throws([&] { core.loadSystemConfiguration(tmp.filePath("missing.json").toStdString()); }));
        assert(!core.isLoaded());
    }

    {
        // hand-written files: numbers accepted, broken JSON rejected
        QTemporaryDir tmp;
        const QString path = tmp.filePath("rig.json");
        {
            QFile f(path);
            bool ok = f.open(QIODevice::WriteOnly);
            assert(ok);
            f.write(R"({"properties": {"Gain": 3, "Binning": "2", "CameraName": "ignored"}})");
        }
        DemoCore core;
        core.loadSystemConfiguration(path.toStdString());
        assert(core.getProperty("Gain") == "3");
        assert(core.getProperty("Binning") == "2");
        assert(core.getProperty("CameraName") != "ignored");

        {
            QFile f(path);
            bool ok = f.open(QIODevice::WriteOnly | QIODevice::Truncate);
            assert(ok);
            f.write("{ \"properties\": ");
        }
        assert(throws([&] { core.loadSystemConfiguration(path.toStdString()); }));
        assert(!core.isLoaded());
    }

    {
        // live mode delivers frames and locks the frame geometry
        DemoCore core;
        core.setSimulateTiming(false);
        core.loadSystemConfiguration(kDemoConfig);
        core.setExposure(1.0);
        std::atomic<int> frames{ 0 };
        core.startContinuousAcquisition([&](const cv::Mat& img) {
            assert(!img.empty());
            ++frames;
        });
        assert(core.isSequenceRunning());
        assert(throws([&] { core.setProperty("Width", "256"); }));
        core.setProperty("Gain", "3");

        const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (frames < 3 && std::chrono::steady_clock::now() < until)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        core.stopContinuousAcquisition();
        assert(frames >= 3);
        assert(!core.isSequenceRunning());
        core.setProperty("Width", "256");
    }

    {
        SequencePlan plan;
        assert(plan.totalFrames() == 1);
        plan.timepoints = 0;
        assert(throws([&] { AcquisitionRunner::validate(plan); }));
        plan.timepoints = 2;
        plan.intervalMs = -1;
        assert(throws([&] { AcquisitionRunner::validate(plan); }));
        plan.intervalMs = 0;
        plan.channels = { { "DAPI", 0.0 } };
        assert(throws([&] { AcquisitionRunner::validate(plan); }));
    }

    {
        // t x c sequence, exposure per channel, restored afterwards
        DemoCore core;
        core.setSimulateTiming(false);
        core.loadSystemConfiguration(kDemoConfig);
        core.setExposure(7.0);

        SequencePlan plan;
        plan.timepoints = 3;
        plan.intervalMs = 5.0;
        plan.channels = { { "DAPI", 2.0 }, { "GFP", 4.0 } };

        RunRecorder rec;
        AcquisitionRunner runner(core);
        runner.start(plan, rec.onFrame(core), rec.onDone());
        assert(rec.done());
        runner.wait();

        assert(rec.state == RunState::Finished);
        assert(rec.frames.size() == 6);
        assert(rec.frames[0].t == 0 && rec.frames[0].c == 0);
        assert(rec.frames[3].t == 1 && rec.frames[3].c == 1);
        assert(rec.frames[5].t == 2 && rec.frames[5].c == 1);
        assert(rec.exposures[0] == 2.0 && rec.exposures[1] == 4.0);
        assert(core.exposure() == 7.0);
        assert(!runner.isRunning());
    }

    {
        // cancel during a long interval
        DemoCore core;
        core.setSimulateTiming(false);
        core.loadSystemConfiguration(kDemoConfig);

        SequencePlan plan;
        plan.timepoints = 100;
        plan.intervalMs = 60000.0;

        RunRecorder rec;
        AcquisitionRunner runner(core);
        runner.start(plan, rec.onFrame(core), rec.onDone());
        assert(throws([&] { runner.start(plan, {}, {}); }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        runner.cancel();
        assert(rec.done(std::chrono::milliseconds(2000)));
        runner.wait();
        assert(rec.state == RunState::Cancelled);
        assert(rec.frames.size() == 1);
    }

    {
        // device errors end the run as Failed
        DemoCore core;
        core.setSimulateTiming(false);
        core.loadSystemConfiguration(kDemoConfig);
        SequencePlan plan;
        plan.channels = { { "far", 20000.0 } };   // above the exposure limit

        RunRecorder rec;
        AcquisitionRunner runner(core);
        runner.start(plan, rec.onFrame(core), rec.onDone());
        assert(rec.done());
        runner.wait();
        assert(rec.state == RunState::Failed);
        assert(!rec.error.empty());
        assert(rec.frames.empty());
    }

    {
        // live mode blocks a sequence
        DemoCore core;
        core.setSimulateTiming(false);
        core.loadSystemConfiguration(kDemoConfig);
        core.startContinuousAcquisition({});
        AcquisitionRunner runner(core);
        assert(throws([&] { runner.start(SequencePlan{}, {}, {}); }));
        core.stopContinuousAcquisition();
    }

    {
        QTemporaryDir tmp;
        const QString dir = tmp.filePath("run1");
        StackWriter writer;
        writer.open(dir.toStdString(), "");
        assert(writer.isOpen());
        assert(QFileInfo(writer.pathFor({ 3, 1 }).c_str()).fileName() == "acq_t0003_c01.tif");

        cv::Mat img(8, 8, CV_16UC1, cv::Scalar(40000));
        writer.write({ 0, 0 }, img);
        writer.write({ 0, 1 }, img);
        assert(writer.framesWritten() == 2);
        writer.close();
        writer.write({ 1, 0 }, img);
        assert(writer.framesWritten() == 2);

        const cv::Mat back = cv::imread(dir.toStdString() + "/acq_t0000_c01.tif", cv::IMREAD_UNCHANGED);
        assert(back.type() == CV_16UC1);
        assert(back.at<ushort>(0, 0) == 40000);
        assert(QDir(dir).entryList({ "*.tif" }, QDir::Files).size() == 2);

        assert(throws([] { StackWriter::saveImage("/tmp/x.tif", cv::Mat()); }));
    }

    return 0;
}
