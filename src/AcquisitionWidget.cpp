// AcquisitionWidget.cpp
#include "AcquisitionWidget.h"
#include "ExceptionLog.h"
#include "Settings.h"
#include <QCheckBox>
#include <QDateTime>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QMetaObject>
#include <QPointer>
#include <QProgressBar>
#include <QPushButton>
#include <QSpinBox>
#include <QTableWidget>
#include <QVBoxLayout>
#include <atomic>
#include <iostream>

AcquisitionWidget::AcquisitionWidget(std::shared_ptr<DeviceCore> core, SettingsStore& settings, QWidget* parent)
    : QWidget(parent), core_(std::move(core)), settings_(settings), runner_(*core_) {
    buildUi();
}

AcquisitionWidget::~AcquisitionWidget() {
    cancelAndWait();
}

void AcquisitionWidget::buildUi() {
    spTimepoints_ = new QSpinBox; spTimepoints_->setRange(1, 100000); spTimepoints_->setValue(1);
    spInterval_ = new QDoubleSpinBox; spInterval_->setRange(0, 86400); spInterval_->setDecimals(2); spInterval_->setSuffix(" s");

    tblChannels_ = new QTableWidget(0, 2);
    tblChannels_->setHorizontalHeaderLabels({ "Channel", "Exposure (ms)" });
    tblChannels_->horizontalHeader()->setStretchLastSection(true);
    tblChannels_->verticalHeader()->hide();
    btnAddCh_ = new QPushButton("Add");
    btnRemoveCh_ = new QPushButton("Remove");
    auto chBar = new QHBoxLayout;
    chBar->addWidget(btnAddCh_);
    chBar->addWidget(btnRemoveCh_);
    chBar->addStretch();

    chkSave_ = new QCheckBox("Save to disk");
    edDir_ = new QLineEdit;
    if (settings_.settings().lastSaveDir) edDir_->setText(*settings_.settings().lastSaveDir);
    else edDir_->setText(QDir::homePath());
    edPrefix_ = new QLineEdit("acq");
    btnBrowse_ = new QPushButton("...");
    auto dirRow = new QHBoxLayout;
    dirRow->addWidget(edDir_, 1);
    dirRow->addWidget(btnBrowse_);

    auto form = new QFormLayout;
    form->addRow("Timepoints", spTimepoints_);
    form->addRow("Interval", spInterval_);
    form->addRow(chkSave_);
    form->addRow("Folder", dirRow);
    form->addRow("Prefix", edPrefix_);

    btnRun_ = new QPushButton("Run");
    btnCancel_ = new QPushButton("Cancel");
    btnCancel_->setEnabled(false);
    auto runBar = new QHBoxLayout;
    runBar->addWidget(btnRun_);
    runBar->addWidget(btnCancel_);
    runBar->addStretch();

    progress_ = new QProgressBar;
    progress_->setRange(0, 1);
    progress_->setValue(0);
    lblStatus_ = new QLabel("Idle");

    auto vbox = new QVBoxLayout(this);
    vbox->addLayout(form);
    vbox->addWidget(tblChannels_, 1);
    vbox->addLayout(chBar);
    vbox->addLayout(runBar);
    vbox->addWidget(progress_);
    vbox->addWidget(lblStatus_);

    connect(btnRun_, &QPushButton::clicked, this, &AcquisitionWidget::onRun);
    connect(btnCancel_, &QPushButton::clicked, this, &AcquisitionWidget::onCancel);
    connect(btnBrowse_, &QPushButton::clicked, this, &AcquisitionWidget::onBrowse);
    connect(btnAddCh_, &QPushButton::clicked, this, &AcquisitionWidget::onAddChannel);
    connect(btnRemoveCh_, &QPushButton::clicked, this, &AcquisitionWidget::onRemoveChannel);
}

void AcquisitionWidget::addChannelRow(const QString& name, double exposureMs) {
    const int row = tblChannels_->rowCount();
    tblChannels_->insertRow(row);
    tblChannels_->setItem(row, 0, new QTableWidgetItem(name));
    tblChannels_->setItem(row, 1, new QTableWidgetItem(QString::number(exposureMs)));
}

void AcquisitionWidget::onAddChannel() {
    double exp = 10.0;
    try {
        if (core_->isLoaded()) exp = core_->exposure();
    }
    catch (const std::exception& e) {
        std::cerr << "[Acquisition] " << e.what() << std::endl;
    }
    addChannelRow(QString("Channel %1").arg(tblChannels_->rowCount() + 1), exp);
}

void AcquisitionWidget::onRemoveChannel() {
    const int row = tblChannels_->currentRow();
    if (row >= 0) tblChannels_->removeRow(row);
    else if (tblChannels_->rowCount() > 0) tblChannels_->removeRow(tblChannels_->rowCount() - 1);
}

void AcquisitionWidget::onBrowse() {
    const QString dir = QFileDialog::getExistingDirectory(this, "Output folder", edDir_->text());
    if (!dir.isEmpty()) edDir_->setText(dir);
}

SequencePlan AcquisitionWidget::plan() const {
    SequencePlan p;
    p.timepoints = spTimepoints_->value();
    p.intervalMs = spInterval_->value() * 1000.0;
    for (int row = 0; row < tblChannels_->rowCount(); ++row) {
        ChannelStep ch;
        auto nameItem = tblChannels_->item(row, 0);
        auto expItem = tblChannels_->item(row, 1);
        ch.name = nameItem ? nameItem->text().toStdString() : std::string();
        bool ok = false;
        ch.exposureMs = expItem ? expItem->text().toDouble(&ok) : 0.0;
        if (!ok) ch.exposureMs = 0.0;   // rejected by validate()
        p.channels.push_back(ch);
    }
    return p;
}

void AcquisitionWidget::onRun() {
    if (!core_->isLoaded()) {
        QMessageBox::warning(this, "Acquisition", "No camera configuration is loaded.");
        return;
    }

    const SequencePlan p = plan();
    try {
        AcquisitionRunner::validate(p);
        if (chkSave_->isChecked()) {
            writer_.open(edDir_->text().toStdString(), edPrefix_->text().toStdString());
            settings_.settings().lastSaveDir = edDir_->text();
            settings_.flush();
        }
        else {
            writer_.close();
        }

        total_ = p.totalFrames();
        progress_->setRange(0, total_);
        progress_->setValue(0);

        QPointer<AcquisitionWidget> self(this);
        auto done = std::make_shared<std::atomic<int>>(0);
        runner_.start(p,
            [this, self, done](const FrameIndex& idx, const cv::Mat& img) {
                if (writer_.isOpen()) writer_.write(idx, img);
                if (sink_) sink_(img);
                const int n = ++(*done);
                QMetaObject::invokeMethod(self, [self, n] { if (self) self->onFrameDone(n); }, Qt::QueuedConnection);
            },
            [self](RunState state, const std::string& error) {
                const QString msg = QString::fromStdString(error);
                QMetaObject::invokeMethod(self, [self, state, msg] { if (self) self->onRunDone(state, msg); }, Qt::QueuedConnection);
            });
    }
    catch (const std::exception& e) {
        writer_.close();
        QMessageBox::warning(this, "Acquisition", e.what());
        return;
    }

    btnRun_->setEnabled(false);
    btnCancel_->setEnabled(true);
    lblStatus_->setText(QString("Running: 0 / %1").arg(total_));
    emit started();
}

void AcquisitionWidget::onCancel() {
    runner_.cancel();
    lblStatus_->setText("Cancelling...");
}

void AcquisitionWidget::cancelAndWait() {
    runner_.cancel();
    runner_.wait();
    writer_.close();
}

void AcquisitionWidget::onFrameDone(int done) {
    progress_->setValue(done);
    lblStatus_->setText(QString("Running: %1 / %2").arg(done).arg(total_));
}

void AcquisitionWidget::onRunDone(RunState state, const QString& error) {
    runner_.wait();
    const int written = writer_.framesWritten();
    const bool saved = writer_.isOpen();
    writer_.close();

    btnRun_->setEnabled(true);
    btnCancel_->setEnabled(false);

    switch (state) {
        case RunState::Finished:
            lblStatus_->setText(saved ? QString("Finished, %1 files written").arg(written) : QString("Finished"));
            break;
        case RunState::Cancelled:
            lblStatus_->setText("Cancelled");
            break;
        case RunState::Failed:
            lblStatus_->setText("Failed");
            ExceptionLog::instance().append({ QDateTime::currentDateTime(), "AcquisitionError", error, "acquisition thread" });
            QMessageBox::warning(this, "Acquisition", error);
            break;
    }
    emit finished(state, error);
}
