// PreviewWidget.h
// - live / snap image view with display controls
// - frames may be pushed from any thread; the view repaints on a UI timer
#pragma once
#include <QElapsedTimer>
#include <QTimer>
#include <QWidget>
#include <mutex>
#include <opencv2/core.hpp>
#include "FrameProcessor.h"

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QSpinBox;

class PreviewWidget : public QWidget {
    Q_OBJECT
public:
    explicit PreviewWidget(QWidget* parent = nullptr);

    void pushFrame(const cv::Mat& img);
    cv::Mat lastFrame();
    void clear();

private slots:
    void onUiTick();
    void onAutoToggled(bool on);
    void onRangeChanged();
    void onGammaChanged(double v);
    void onLutChanged(int idx);
    void onZoomChanged(int v);
    void onFlipHToggled(bool on);
    void onFlipVToggled(bool on);

private:
    void buildUi();
    void updateView(const cv::Mat& bgr);

    FrameProcessor proc_;
    QTimer uiTimer_;
    QElapsedTimer fpsTick_;
    int fpsCounter_ = 0;

    std::mutex frameMtx_;
    cv::Mat lastFrame_;
    bool dirty_{ false };

    QLabel* lblView_{ nullptr };
    QLabel* lblFps_{ nullptr };
    QLabel* lblRange_{ nullptr };
    QCheckBox* chkAuto_{ nullptr };
    QDoubleSpinBox* spMin_{ nullptr }, * spMax_{ nullptr }, * spGamma_{ nullptr };
    QComboBox* cbLut_{ nullptr };
    QSpinBox* spZoom_{ nullptr };
    QCheckBox* chkFlipH_{ nullptr }, * chkFlipV_{ nullptr };
};
