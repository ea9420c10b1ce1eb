// PropertyBrowser.cpp
#include "PropertyBrowser.h"
#include <QComboBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QPushButton>
#include <QTableWidget>
#include <QTimer>
#include <QVBoxLayout>
#include <exception>
#include <iostream>

PropertyBrowser::PropertyBrowser(std::shared_ptr<DeviceCore> core, QWidget* parent)
    : QWidget(parent), core_(std::move(core)) {
    table_ = new QTableWidget(0, 2);
    table_->setHorizontalHeaderLabels({ "Property", "Value" });
    table_->horizontalHeader()->setSectionResizeMode(0, QHeaderView::ResizeToContents);
    table_->horizontalHeader()->setStretchLastSection(true);
    table_->verticalHeader()->hide();

    btnRefresh_ = new QPushButton("Refresh");
    auto bar = new QHBoxLayout;
    bar->addStretch();
    bar->addWidget(btnRefresh_);

    auto vbox = new QVBoxLayout(this);
    vbox->addWidget(table_, 1);
    vbox->addLayout(bar);

    connect(btnRefresh_, &QPushButton::clicked, this, &PropertyBrowser::refresh);
    connect(table_, &QTableWidget::itemChanged, this, &PropertyBrowser::onItemChanged);
    refresh();
}

void PropertyBrowser::refresh() {
    updating_ = true;
    table_->clearContents();
    table_->setRowCount(0);

    std::vector<PropertyInfo> props;
    if (core_ && core_->isLoaded()) {
        try {
            props = core_->properties();
        }
        catch (const std::exception& e) {
            std::cerr << "[PropertyBrowser] " << e.what() << std::endl;
            emit errorOccurred(QString::fromStdString(e.what()));
        }
    }

    table_->setRowCount(static_cast<int>(props.size()));
    for (int row = 0; row < static_cast<int>(props.size()); ++row) {
        const auto& p = props[row];
        const QString name = QString::fromStdString(p.name);
        const QString value = QString::fromStdString(p.value);

        auto nameItem = new QTableWidgetItem(name);
        nameItem->setFlags(Qt::ItemIsEnabled | Qt::ItemIsSelectable);
        if (p.hasLimits)
            nameItem->setToolTip(QString("%1 .. %2").arg(p.lower).arg(p.upper));
        table_->setItem(row, 0, nameItem);

        auto valueItem = new QTableWidgetItem(value);
        if (p.readOnly) {
            valueItem->setFlags(Qt::ItemIsEnabled | Qt::ItemIsSelectable);
            valueItem->setForeground(palette().color(QPalette::Disabled, QPalette::Text));
        }
        table_->setItem(row, 1, valueItem);

        if (p.type == PropertyType::Enum && !p.readOnly && !p.allowed.empty()) {
            auto combo = new QComboBox;
            for (const auto& a : p.allowed) combo->addItem(QString::fromStdString(a));
            combo->setCurrentText(value);
            connect(combo, &QComboBox::textActivated, this, [this, name](const QString& v) {
                applyValue(name, v);
            });
            table_->setCellWidget(row, 1, combo);
        }
    }
    updating_ = false;
}

void PropertyBrowser::onItemChanged(QTableWidgetItem* item) {
    if (updating_ || !item || item->column() != 1) return;
    auto nameItem = table_->item(item->row(), 0);
    if (!nameItem) return;
    applyValue(nameItem->text(), item->text());
}

void PropertyBrowser::applyValue(const QString& name, const QString& value) {
    if (!core_) return;
    try {
        core_->setProperty(name.toStdString(), value.toStdString());
        emit propertyChanged(name, value);
    }
    catch (const std::exception& e) {
        std::cerr << "[PropertyBrowser] set " << name.toStdString() << ": " << e.what() << std::endl;
        emit errorOccurred(QString("Could not set %1: %2").arg(name, QString::fromStdString(e.what())));
    }
    // show what the device actually accepted; the editor that fired may not be deleted here
    QTimer::singleShot(0, this, &PropertyBrowser::refresh);
}
