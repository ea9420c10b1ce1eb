// PreviewWidget.cpp
#include "PreviewWidget.h"
#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QImage>
#include <QLabel>
#include <QPixmap>
#include <QSpinBox>
#include <QVBoxLayout>
#include <opencv2/imgproc.hpp>

static QImage MatBGRToQImage(const cv::Mat& bgr) {
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
}

PreviewWidget::PreviewWidget(QWidget* parent)
    : QWidget(parent) {
    buildUi();

    uiTimer_.setInterval(50);
    connect(&uiTimer_, &QTimer::timeout, this, &PreviewWidget::onUiTick);
    uiTimer_.start();
    fpsTick_.start();
}

void PreviewWidget::buildUi() {
    auto ctrlBar = new QHBoxLayout;
    chkAuto_ = new QCheckBox("Auto");
    chkAuto_->setChecked(true);
    spMin_ = new QDoubleSpinBox; spMin_->setRange(0, 65535); spMin_->setDecimals(0); spMin_->setValue(0);
    spMax_ = new QDoubleSpinBox; spMax_->setRange(1, 65535); spMax_->setDecimals(0); spMax_->setValue(65535);
    spMin_->setEnabled(false); spMax_->setEnabled(false);
    spGamma_ = new QDoubleSpinBox; spGamma_->setRange(0.1, 5.0); spGamma_->setSingleStep(0.1); spGamma_->setValue(1.0);
    cbLut_ = new QComboBox; cbLut_->addItems({ "Gray", "Green", "Magenta", "Fire" });
    spZoom_ = new QSpinBox; spZoom_->setRange(1, 8); spZoom_->setValue(1);
    chkFlipH_ = new QCheckBox("Flip H");
    chkFlipV_ = new QCheckBox("Flip V");

    ctrlBar->addWidget(chkAuto_);
    ctrlBar->addWidget(new QLabel("min")); ctrlBar->addWidget(spMin_);
    ctrlBar->addWidget(new QLabel("max")); ctrlBar->addWidget(spMax_);
    ctrlBar->addWidget(new QLabel("gamma")); ctrlBar->addWidget(spGamma_);
    ctrlBar->addWidget(new QLabel("LUT")); ctrlBar->addWidget(cbLut_);
    ctrlBar->addWidget(new QLabel("zoom")); ctrlBar->addWidget(spZoom_);
    ctrlBar->addWidget(chkFlipH_);
    ctrlBar->addWidget(chkFlipV_);
    ctrlBar->addStretch();

    lblView_ = new QLabel("No Image");
    lblView_->setMinimumSize(640, 480);
    lblView_->setAlignment(Qt::AlignCenter);
    lblView_->setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Ignored);

    auto statusBar = new QHBoxLayout;
    lblRange_ = new QLabel("range: -");
    lblFps_ = new QLabel("FPS: -");
    statusBar->addWidget(lblRange_);
    statusBar->addStretch();
    statusBar->addWidget(lblFps_);

    auto vbox = new QVBoxLayout(this);
    vbox->addLayout(ctrlBar);
    vbox->addWidget(lblView_, 1);
    vbox->addLayout(statusBar);

    connect(chkAuto_, &QCheckBox::toggled, this, &PreviewWidget::onAutoToggled);
    connect(spMin_, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &PreviewWidget::onRangeChanged);
    connect(spMax_, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &PreviewWidget::onRangeChanged);
    connect(spGamma_, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &PreviewWidget::onGammaChanged);
    connect(cbLut_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &PreviewWidget::onLutChanged);
    connect(spZoom_, QOverload<int>::of(&QSpinBox::valueChanged), this, &PreviewWidget::onZoomChanged);
    connect(chkFlipH_, &QCheckBox::toggled, this, &PreviewWidget::onFlipHToggled);
    connect(chkFlipV_, &QCheckBox::toggled, this, &PreviewWidget::onFlipVToggled);
}

void PreviewWidget::pushFrame(const cv::Mat& img) {
    std::scoped_lock lk(frameMtx_);
    lastFrame_ = img.clone();
    dirty_ = true;
}

cv::Mat PreviewWidget::lastFrame() {
    std::scoped_lock lk(frameMtx_);
    return lastFrame_.clone();
}

void PreviewWidget::clear() {
    {
        std::scoped_lock lk(frameMtx_);
        lastFrame_.release();
        dirty_ = false;
    }
    lblView_->clear();
    lblView_->setText("No Image");
}

// display settings changed: repaint the last frame on the next tick
void PreviewWidget::onAutoToggled(bool on) {
    proc_.setAutoContrast(on);
    spMin_->setEnabled(!on);
    spMax_->setEnabled(!on);
    if (!on) onRangeChanged();
    std::scoped_lock lk(frameMtx_); dirty_ = true;
}
void PreviewWidget::onRangeChanged() {
    proc_.setRange(spMin_->value(), spMax_->value());
    std::scoped_lock lk(frameMtx_); dirty_ = true;
}
void PreviewWidget::onGammaChanged(double v) { proc_.setGamma(v); std::scoped_lock lk(frameMtx_); dirty_ = true; }
void PreviewWidget::onLutChanged(int idx) { proc_.setLut(static_cast<Lut>(idx)); std::scoped_lock lk(frameMtx_); dirty_ = true; }
void PreviewWidget::onZoomChanged(int v) { proc_.setZoom(v); std::scoped_lock lk(frameMtx_); dirty_ = true; }
void PreviewWidget::onFlipHToggled(bool on) { proc_.setFlipH(on); std::scoped_lock lk(frameMtx_); dirty_ = true; }
void PreviewWidget::onFlipVToggled(bool on) { proc_.setFlipV(on); std::scoped_lock lk(frameMtx_); dirty_ = true; }

void PreviewWidget::onUiTick() {
    cv::Mat frame;
    {
        std::scoped_lock lk(frameMtx_);
        if (!dirty_ || lastFrame_.empty()) return;
        frame = lastFrame_.clone();
        dirty_ = false;
    }

    auto out = proc_.run(frame);
    updateView(out);

    if (frame.channels() == 1)
        lblRange_->setText(QString("%1 x %2, range: %3 - %4")
                               .arg(frame.cols).arg(frame.rows)
                               .arg(proc_.lastLow()).arg(proc_.lastHigh()));
    else
        lblRange_->setText(QString("%1 x %2, colour").arg(frame.cols).arg(frame.rows));

    fpsCounter_++;
    if (fpsTick_.elapsed() >= 1000) {
        lblFps_->setText(QString("FPS: %1").arg(fpsCounter_));
        fpsCounter_ = 0;
        fpsTick_.restart();
    }
}

void PreviewWidget::updateView(const cv::Mat& bgr) {
    auto img = MatBGRToQImage(bgr);
    lblView_->setPixmap(QPixmap::fromImage(img).scaled(lblView_->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
}
