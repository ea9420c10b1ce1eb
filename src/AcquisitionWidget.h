// AcquisitionWidget.h
// - timepoints / interval / channel table, output folder, Run / Cancel
// - frames go to the preview sink and, optionally, to TIFF files on disk
#pragma once
#include <QWidget>
#include <functional>
#include <memory>
#include "Acquisition.h"
#include "StackWriter.h"

class QCheckBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QTableWidget;
class SettingsStore;

class AcquisitionWidget : public QWidget {
    Q_OBJECT
public:
    // Called on the acquisition thread for every frame.
    using FrameSink = std::function<void(const cv::Mat& img)>;

    AcquisitionWidget(std::shared_ptr<DeviceCore> core, SettingsStore& settings, QWidget* parent = nullptr);
    ~AcquisitionWidget() override;

    void setFrameSink(FrameSink sink) { sink_ = std::move(sink); }
    bool isRunning() const { return runner_.isRunning(); }
    void cancelAndWait();

    SequencePlan plan() const;

signals:
    void started();
    void finished(RunState state, const QString& error);

private slots:
    void onRun();
    void onCancel();
    void onBrowse();
    void onAddChannel();
    void onRemoveChannel();

private:
    void buildUi();
    void addChannelRow(const QString& name, double exposureMs);
    void onFrameDone(int done);
    void onRunDone(RunState state, const QString& error);

    std::shared_ptr<DeviceCore> core_;
    SettingsStore& settings_;
    AcquisitionRunner runner_;
    StackWriter writer_;
    FrameSink sink_;
    int total_ = 0;

    QSpinBox* spTimepoints_{ nullptr };
    QDoubleSpinBox* spInterval_{ nullptr };
    QTableWidget* tblChannels_{ nullptr };
    QPushButton* btnAddCh_{ nullptr }, * btnRemoveCh_{ nullptr };
    QCheckBox* chkSave_{ nullptr };
    QLineEdit* edDir_{ nullptr }, * edPrefix_{ nullptr };
    QPushButton* btnBrowse_{ nullptr };
    QPushButton* btnRun_{ nullptr }, * btnCancel_{ nullptr };
    QProgressBar* progress_{ nullptr };
    QLabel* lblStatus_{ nullptr };
};
