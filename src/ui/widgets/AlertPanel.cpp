#include "chorewheel/ui/widgets/AlertPanel.hpp"

#include <QDateTime>
#include <QLabel>
#include <QPalette>
#include <QVBoxLayout>

namespace chorewheel {
namespace ui {

AlertPanel::AlertPanel(QWidget *parent)
    : QWidget(parent)
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(12, 12, 12, 12);
    layout->setSpacing(6);

    m_titleLabel = new QLabel(tr("No alerts yet"), this);
    m_titleLabel->setObjectName(QStringLiteral("alertTitle"));
    auto font = m_titleLabel->font();
    font.setBold(true);
    font.setPointSizeF(font.pointSizeF() * 1.6);
    m_titleLabel->setFont(font);
    m_titleLabel->setWordWrap(true);
    layout->addWidget(m_titleLabel);

    m_messageLabel = new QLabel(this);
    m_messageLabel->setWordWrap(true);
    layout->addWidget(m_messageLabel);

    m_timeLabel = new QLabel(this);
    QPalette pal = m_timeLabel->palette();
    pal.setColor(QPalette::WindowText, pal.color(QPalette::Disabled, QPalette::WindowText));
    m_timeLabel->setPalette(pal);
    layout->addWidget(m_timeLabel);
}

void AlertPanel::showAlert(const QString &displayText, const QString &speechText)
{
    m_titleLabel->setText(displayText);
    m_messageLabel->setText(speechText);
    m_timeLabel->setText(tr("Called at %1").arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss"))));
}

} // namespace ui
} // namespace chorewheel
