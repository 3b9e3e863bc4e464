#pragma once

#include <QString>
#include <QWidget>

class QLabel;

namespace chorewheel {
namespace ui {

class AlertPanel : public QWidget
{
    Q_OBJECT

public:
    explicit AlertPanel(QWidget *parent = nullptr);

    void showAlert(const QString &displayText, const QString &speechText);

private:
    QLabel *m_titleLabel = nullptr;
    QLabel *m_messageLabel = nullptr;
    QLabel *m_timeLabel = nullptr;
};

} // namespace ui
} // namespace chorewheel
