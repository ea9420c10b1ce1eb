// ExceptionLog.h
// - process-wide list of exceptions caught by the application
// - ExceptionLogWidget: read-only view + error report opt-in checkbox
#pragma once
#include <QDateTime>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <QVector>
#include <QWidget>
#include <mutex>

class QCheckBox;
class QTextEdit;
class SettingsStore;

struct ExceptionRecord {
    QDateTime time;
    QString type;       // exception class or origin, e.g. "std::runtime_error"
    QString message;
    QString context;    // where it was caught (receiver, slot, thread)
};
Q_DECLARE_METATYPE(ExceptionRecord)

QString formatRecord(const ExceptionRecord& r);

class ExceptionLog : public QObject {
    Q_OBJECT
public:
    static ExceptionLog& instance();

    void append(ExceptionRecord rec);
    QVector<ExceptionRecord> records() const;
    void clear();

signals:
    void appended(const ExceptionRecord& rec);
    void cleared();

private:
    ExceptionLog();

    mutable std::mutex mtx_;
    QVector<ExceptionRecord> records_;
};

class ExceptionLogWidget : public QWidget {
    Q_OBJECT
public:
    explicit ExceptionLogWidget(SettingsStore& settings, QWidget* parent = nullptr);

private slots:
    void onAppended(const ExceptionRecord& rec);
    void onSendToggled(bool on);
    void onClear();

private:
    SettingsStore& settings_;
    QTextEdit* txtLog_{ nullptr };
    QCheckBox* chkSend_{ nullptr };
};
