#include "chorewheel/ui/models/AssignmentListModel.hpp"

#include <QFont>

namespace chorewheel {
namespace ui {

AssignmentListModel::AssignmentListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int AssignmentListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_assignments.size());
}

QVariant AssignmentListModel::data(const QModelIndex &index, int role) const
{
    const auto *assignment = assignmentAt(index);
    if (!assignment) {
        return {};
    }

    switch (role) {
    case Qt::DisplayRole:
        return tr("%1 %2  %3 - %4")
            .arg(assignment->date.toString(QStringLiteral("ddd dd.MM.")),
                 assignment->time.toString(QStringLiteral("HH:mm")),
                 assignment->label,
                 assignment->person);
    case Qt::ToolTipRole:
        return assignment->action;
    case Qt::FontRole: {
        if (assignment->date != m_today) {
            return {};
        }
        QFont font;
        font.setBold(true);
        return font;
    }
    case PersonRole:
        return assignment->person;
    case DateRole:
        return assignment->date;
    default:
        return {};
    }
}

void AssignmentListModel::setAssignments(std::vector<core::AssignmentPreview> assignments, const QDate &today)
{
    beginResetModel();
    m_assignments = std::move(assignments);
    m_today = today;
    endResetModel();
}

const core::AssignmentPreview *AssignmentListModel::assignmentAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= static_cast<int>(m_assignments.size())) {
        return nullptr;
    }
    return &m_assignments.at(static_cast<size_t>(index.row()));
}

} // namespace ui
} // namespace chorewheel
