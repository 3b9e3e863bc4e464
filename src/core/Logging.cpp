#include "chorewheel/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcSchedule, "chorewheel.schedule", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRotation, "chorewheel.rotation", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTrigger, "chorewheel.trigger", QtInfoMsg)
Q_LOGGING_CATEGORY(lcContent, "chorewheel.content", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTaskLog, "chorewheel.log", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "chorewheel.app", QtInfoMsg)
