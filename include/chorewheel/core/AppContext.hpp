#pragma once

#include <memory>

#include "chorewheel/core/AppSettings.hpp"

namespace chorewheel {
namespace data {
class FileRotationStateRepository;
}

namespace core {

class Clock;
class TaskScheduler;

class AppContext
{
public:
    explicit AppContext(AppSettings settings);
    ~AppContext();

    const AppSettings &settings() const;
    TaskScheduler &scheduler();

private:
    AppSettings m_settings;
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<data::FileRotationStateRepository> m_rotationRepository;
    std::unique_ptr<TaskScheduler> m_scheduler;
};

} // namespace core
} // namespace chorewheel
