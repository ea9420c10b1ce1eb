// Dialogs.h
// - small modal dialogs used during startup and from the app menu
#pragma once
#include <QDialog>
#include <QMessageBox>
#include <optional>

class QCheckBox;
class QCloseEvent;
class QKeyEvent;
class DeviceCore;

// "Allow error reporting?" - OK / No, closing the dialog means "ask again later"
class SendErrorsDialog : public QDialog {
    Q_OBJECT
public:
    explicit SendErrorsDialog(QWidget* parent = nullptr);

    // true = allowed, false = refused, nullopt = dismissed
    static std::optional<bool> ask(QWidget* parent = nullptr);

protected:
    void closeEvent(QCloseEvent* e) override;
    void keyPressEvent(QKeyEvent* e) override;

private:
    bool dismissed_ = false;
};

// "Load last config?" - Yes / No / Cancel with a "Don't ask again" box
class LoadConfigDialog : public QMessageBox {
    Q_OBJECT
public:
    explicit LoadConfigDialog(const QString& lastConfig, QWidget* parent = nullptr);
    bool dontAskAgain() const;

private:
    QCheckBox* chkDontAsk_{ nullptr };
};

class AboutDialog : public QDialog {
    Q_OBJECT
public:
    explicit AboutDialog(DeviceCore* core, QWidget* parent = nullptr);
};
