// ExceptionLog.cpp
#include "ExceptionLog.h"
#include "ErrorReporter.h"
#include "Settings.h"
#include <QCheckBox>
#include <QHBoxLayout>
#include <QPushButton>
#include <QTextEdit>
#include <QTextOption>
#include <QVBoxLayout>

QString formatRecord(const ExceptionRecord& r) {
    QString line = QString("[%1] %2: %3").arg(r.time.toString(Qt::ISODate), r.type, r.message);
    if (!r.context.isEmpty()) line += QString("\n    in %1").arg(r.context);
    return line;
}

ExceptionLog::ExceptionLog() {
    // appended() may be emitted from worker threads
    qRegisterMetaType<ExceptionRecord>();
}

ExceptionLog& ExceptionLog::instance() {
    static ExceptionLog log;
    return log;
}

void ExceptionLog::append(ExceptionRecord rec) {
    if (!rec.time.isValid()) rec.time = QDateTime::currentDateTime();
    {
        std::scoped_lock lk(mtx_);
        records_.push_back(rec);
    }
    emit appended(rec);
}

QVector<ExceptionRecord> ExceptionLog::records() const {
    std::scoped_lock lk(mtx_);
    return records_;
}

void ExceptionLog::clear() {
    {
        std::scoped_lock lk(mtx_);
        records_.clear();
    }
    emit cleared();
}

// ==============================
// ExceptionLogWidget
// ==============================
ExceptionLogWidget::ExceptionLogWidget(SettingsStore& settings, QWidget* parent)
    : QWidget(parent), settings_(settings) {
    txtLog_ = new QTextEdit(this);
    txtLog_->setReadOnly(true);
    txtLog_->setLineWrapMode(QTextEdit::NoWrap);
    txtLog_->setWordWrapMode(QTextOption::NoWrap);
    txtLog_->setAcceptRichText(false);
    txtLog_->setPlaceholderText("No exceptions have been raised.");

    chkSend_ = new QCheckBox("Send error reports to the developers");
    chkSend_->setObjectName("sendErrorReports");
    chkSend_->setChecked(settings_.settings().sendErrorReports.value_or(false));
    auto btnClear = new QPushButton("Clear");

    auto bottom = new QHBoxLayout;
    bottom->addWidget(chkSend_);
    bottom->addStretch();
    bottom->addWidget(btnClear);

    auto vbox = new QVBoxLayout(this);
    vbox->addWidget(txtLog_);
    vbox->addLayout(bottom);

    for (const auto& rec : ExceptionLog::instance().records())
        txtLog_->append(formatRecord(rec));

    connect(&ExceptionLog::instance(), &ExceptionLog::appended, this, &ExceptionLogWidget::onAppended);
    connect(&ExceptionLog::instance(), &ExceptionLog::cleared, txtLog_, &QTextEdit::clear);
    connect(chkSend_, &QCheckBox::toggled, this, &ExceptionLogWidget::onSendToggled);
    connect(btnClear, &QPushButton::clicked, this, &ExceptionLogWidget::onClear);
}

void ExceptionLogWidget::onAppended(const ExceptionRecord& rec) {
    txtLog_->append(formatRecord(rec));
}

void ExceptionLogWidget::onSendToggled(bool on) {
    settings_.settings().sendErrorReports = on;
    settings_.flush();
    // a reporter that was off at startup starts now; turning off is handled per event
    if (on) {
        if (auto reporter = ErrorReporter::global()) reporter->install({});
    }
}

void ExceptionLogWidget::onClear() {
    ExceptionLog::instance().clear();
}
