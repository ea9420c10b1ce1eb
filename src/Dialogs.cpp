// Dialogs.cpp
#include "Dialogs.h"
#include "AppInfo.h"
#include "DeviceCore.h"
#include <QCheckBox>
#include <QCloseEvent>
#include <QDialogButtonBox>
#include <QFont>
#include <QFormLayout>
#include <QKeyEvent>
#include <QLabel>
#include <QSysInfo>
#include <QVBoxLayout>

// ==============================
// SendErrorsDialog
// ==============================
SendErrorsDialog::SendErrorsDialog(QWidget* parent)
    : QDialog(parent) {
    setWindowTitle("Allow error reporting?");
    setMinimumWidth(500);

    auto txt = new QLabel(QString(R"(
<h2>Help us improve?</h2>
<p>Please help us fix bugs by allowing us to collect crash and exception reports.</p>
<ul>
<li><strong>No</strong> personally identifiable information is collected.</li>
<li>We collect the type and message of errors and where they occurred.</li>
<li>We collect program, Qt and operating system versions.</li>
<li>Error-reporting logic is viewable in the <a href="%1">source code</a>.</li>
</ul>
<p>You can disable this at any time in the Exception Log window.</p>
)").arg(AppInfo::kProjectUrl));
    txt->setWordWrap(true);
    txt->setOpenExternalLinks(true);

    auto buttons = new QDialogButtonBox(QDialogButtonBox::No | QDialogButtonBox::Ok);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);

    auto vbox = new QVBoxLayout(this);
    vbox->addWidget(txt);
    vbox->addWidget(buttons);
}

void SendErrorsDialog::closeEvent(QCloseEvent* e) {
    dismissed_ = true;
    QDialog::closeEvent(e);
}

void SendErrorsDialog::keyPressEvent(QKeyEvent* e) {
    if (e->key() == Qt::Key_Escape) dismissed_ = true;
    QDialog::keyPressEvent(e);
}

std::optional<bool> SendErrorsDialog::ask(QWidget* parent) {
    SendErrorsDialog dlg(parent);
    const int res = dlg.exec();
    if (dlg.dismissed_) return std::nullopt;
    return res == QDialog::Accepted;
}

// ==============================
// LoadConfigDialog
// ==============================
LoadConfigDialog::LoadConfigDialog(const QString& lastConfig, QWidget* parent)
    : QMessageBox(QMessageBox::Question, "Load last config?",
                  QString("Do you want to load the last-used config file:\n\n%1?").arg(lastConfig),
                  QMessageBox::Yes | QMessageBox::No | QMessageBox::Cancel, parent) {
    setDefaultButton(QMessageBox::Yes);
    setEscapeButton(QMessageBox::Cancel);
    chkDontAsk_ = new QCheckBox("Don't ask again");
    setCheckBox(chkDontAsk_);
}

bool LoadConfigDialog::dontAskAgain() const {
    return chkDontAsk_->isChecked();
}

// ==============================
// AboutDialog
// ==============================
AboutDialog::AboutDialog(DeviceCore* core, QWidget* parent)
    : QDialog(parent) {
    setWindowTitle(QString("About %1").arg(AppInfo::kAppName));

    auto title = new QLabel(AppInfo::kAppName);
    title->setFont(QFont(title->font().family(), 20, QFont::Bold));
    auto version = new QLabel(QString("v%1").arg(AppInfo::kVersion));

    auto link = new QLabel(QString("<a href='%1'>%1</a>").arg(AppInfo::kProjectUrl));
    link->setTextFormat(Qt::RichText);
    link->setTextInteractionFlags(Qt::TextBrowserInteraction);
    link->setOpenExternalLinks(true);

    auto form = new QFormLayout;
    form->setVerticalSpacing(2);
    form->addRow("Qt:", new QLabel(qVersion()));
    form->addRow("OS:", new QLabel(QSysInfo::prettyProductName()));
    if (core) {
        form->addRow("Device core:", new QLabel(QString::fromStdString(core->name())));
        form->addRow("Config:", new QLabel(core->isLoaded() ? "loaded" : "none"));
    }

    auto vbox = new QVBoxLayout(this);
    vbox->addWidget(title, 0, Qt::AlignHCenter);
    vbox->addWidget(version, 0, Qt::AlignHCenter);
    vbox->addWidget(link, 0, Qt::AlignHCenter);
    vbox->addLayout(form);
}
