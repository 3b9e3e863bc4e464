#pragma once

#include <QAbstractListModel>
#include <QDate>
#include <vector>

#include "chorewheel/core/TaskScheduler.hpp"

namespace chorewheel {
namespace ui {

class AssignmentListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        PersonRole = Qt::UserRole + 1,
        DateRole,
    };

    explicit AssignmentListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;

    void setAssignments(std::vector<core::AssignmentPreview> assignments, const QDate &today);
    const core::AssignmentPreview *assignmentAt(const QModelIndex &index) const;

private:
    std::vector<core::AssignmentPreview> m_assignments;
    QDate m_today;
};

} // namespace ui
} // namespace chorewheel
