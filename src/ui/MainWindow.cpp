#include "chorewheel/ui/MainWindow.hpp"

#include <QAction>
#include <QApplication>
#include <QFrame>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLabel>
#include <QListView>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QVBoxLayout>
#include <QWidget>

#include "chorewheel/core/TaskScheduler.hpp"
#include "chorewheel/core/TaskTriggerEngine.hpp"
#include "chorewheel/ui/models/AssignmentListModel.hpp"
#include "chorewheel/ui/widgets/AlertPanel.hpp"

namespace chorewheel {
namespace ui {

MainWindow::MainWindow(core::TaskScheduler &scheduler, QWidget *parent)
    : QMainWindow(parent)
    , m_scheduler(scheduler)
{
    setupUi();
    connectScheduler();
    refreshUpcoming();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi()
{
    setWindowTitle(tr("ChoreWheel"));
    resize(900, 600);

    addToolBar(Qt::TopToolBarArea, createActionBar());

    auto *splitter = new QSplitter(Qt::Horizontal, this);
    splitter->addWidget(createSummaryPanel());

    m_upcomingModel = new AssignmentListModel(this);
    m_upcomingView = new QListView(this);
    m_upcomingView->setModel(m_upcomingModel);
    m_upcomingView->setSelectionMode(QAbstractItemView::NoSelection);
    splitter->addWidget(m_upcomingView);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 1);

    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(splitter);
    setCentralWidget(centralWidget);

    statusBar()->showMessage(tr("Ready"));
}

QToolBar *MainWindow::createActionBar()
{
    auto *toolbar = new QToolBar(tr("Actions"), this);
    toolbar->setMovable(false);

    auto *advanceAction = toolbar->addAction(tr("Advance rotations"));
    advanceAction->setShortcut(QKeySequence(Qt::CTRL + Qt::Key_A));
    connect(advanceAction, &QAction::triggered, this, &MainWindow::advanceRotations);

    auto *refreshAction = toolbar->addAction(tr("Refresh"));
    refreshAction->setShortcut(QKeySequence(Qt::Key_F5));
    connect(refreshAction, &QAction::triggered, this, &MainWindow::refreshUpcoming);

    auto *quitAction = toolbar->addAction(tr("Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, qApp, &QApplication::quit);
    return toolbar;
}

QWidget *MainWindow::createSummaryPanel()
{
    auto *panel = new QWidget(this);
    auto *layout = new QVBoxLayout(panel);
    layout->setContentsMargins(8, 8, 8, 8);

    m_alertPanel = new AlertPanel(panel);
    layout->addWidget(m_alertPanel);

    auto *line = new QFrame(panel);
    line->setFrameShape(QFrame::HLine);
    layout->addWidget(line);

    auto addRow = [&](const QString &caption) {
        auto *row = new QHBoxLayout();
        auto *captionLabel = new QLabel(caption, panel);
        auto font = captionLabel->font();
        font.setBold(true);
        captionLabel->setFont(font);
        auto *valueLabel = new QLabel(panel);
        row->addWidget(captionLabel);
        row->addWidget(valueLabel, 1);
        layout->addLayout(row);
        return valueLabel;
    };
    m_nextLabel = addRow(tr("Next:"));
    m_lastLabel = addRow(tr("Last:"));
    layout->addStretch(1);

    m_nextLabel->setText(m_scheduler.engine().nextSummary());
    m_lastLabel->setText(m_scheduler.engine().lastSummary());
    return panel;
}

void MainWindow::connectScheduler()
{
    auto &engine = m_scheduler.engine();
    connect(&engine, &core::TaskTriggerEngine::taskFired, this, &MainWindow::handleTaskFired);
    connect(&engine, &core::TaskTriggerEngine::nextTaskChanged, m_nextLabel, &QLabel::setText);
    connect(&engine, &core::TaskTriggerEngine::lastTaskChanged, m_lastLabel, &QLabel::setText);
    connect(&m_scheduler, &core::TaskScheduler::instancesRebuilt, this, &MainWindow::refreshUpcoming);
}

void MainWindow::refreshUpcoming()
{
    m_upcomingModel->setAssignments(m_scheduler.upcomingAssignments(m_upcomingDays), m_scheduler.today());
}

void MainWindow::advanceRotations()
{
    if (m_scheduler.advanceAllRotations()) {
        statusBar()->showMessage(tr("Rotations advanced"), 5000);
    } else {
        statusBar()->showMessage(tr("Rotations advanced, but saving failed"), 5000);
    }
}

void MainWindow::handleTaskFired(const core::TaskInstance &instance, const QString &displayText, const QString &speechText)
{
    Q_UNUSED(instance);
    m_alertPanel->showAlert(displayText, speechText);
    statusBar()->showMessage(displayText, 60000);
    QApplication::alert(this);
}

} // namespace ui
} // namespace chorewheel
