#include "chorewheel/core/AppContext.hpp"

#include "chorewheel/core/Clock.hpp"
#include "chorewheel/core/TaskScheduler.hpp"
#include "chorewheel/data/FileRotationStateRepository.hpp"

#include <QDir>

namespace chorewheel {
namespace core {

AppContext::AppContext(AppSettings settings)
    : m_settings(std::move(settings))
{
    QDir dir(m_settings.dataDir);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    m_clock = std::make_unique<SystemClock>();
    m_rotationRepository = std::make_unique<data::FileRotationStateRepository>(m_settings.rotationStatePath());
    m_scheduler = std::make_unique<TaskScheduler>(m_settings, *m_clock, *m_rotationRepository);
}

AppContext::~AppContext() = default;

const AppSettings &AppContext::settings() const
{
    return m_settings;
}

TaskScheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

} // namespace core
} // namespace chorewheel
