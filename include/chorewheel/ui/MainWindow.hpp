#pragma once

#include <QMainWindow>
#include <QString>

class QLabel;
class QListView;
class QToolBar;

namespace chorewheel {
namespace core {
class TaskScheduler;
struct TaskInstance;
}

namespace ui {

class AlertPanel;
class AssignmentListModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(core::TaskScheduler &scheduler, QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    QToolBar *createActionBar();
    QWidget *createSummaryPanel();
    void connectScheduler();
    void refreshUpcoming();
    void advanceRotations();
    void handleTaskFired(const core::TaskInstance &instance, const QString &displayText, const QString &speechText);

    core::TaskScheduler &m_scheduler;
    AlertPanel *m_alertPanel = nullptr;
    QLabel *m_nextLabel = nullptr;
    QLabel *m_lastLabel = nullptr;
    QListView *m_upcomingView = nullptr;
    AssignmentListModel *m_upcomingModel = nullptr;
    int m_upcomingDays = 7;
};

} // namespace ui
} // namespace chorewheel
