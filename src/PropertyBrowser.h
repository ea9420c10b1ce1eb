// PropertyBrowser.h
// - table of device properties; editable cells write back to the core
#pragma once
#include <QWidget>
#include <memory>
#include "DeviceCore.h"

class QPushButton;
class QTableWidget;
class QTableWidgetItem;

class PropertyBrowser : public QWidget {
    Q_OBJECT
public:
    explicit PropertyBrowser(std::shared_ptr<DeviceCore> core, QWidget* parent = nullptr);

public slots:
    void refresh();

signals:
    void propertyChanged(const QString& name, const QString& value);
    void errorOccurred(const QString& message);

private slots:
    void onItemChanged(QTableWidgetItem* item);

private:
    void applyValue(const QString& name, const QString& value);

    std::shared_ptr<DeviceCore> core_;
    QTableWidget* table_{ nullptr };
    QPushButton* btnRefresh_{ nullptr };
    bool updating_ = false;
};
