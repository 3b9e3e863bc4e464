#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcSchedule)
Q_DECLARE_LOGGING_CATEGORY(lcRotation)
Q_DECLARE_LOGGING_CATEGORY(lcTrigger)
Q_DECLARE_LOGGING_CATEGORY(lcContent)
Q_DECLARE_LOGGING_CATEGORY(lcTaskLog)
Q_DECLARE_LOGGING_CATEGORY(lcApp)
