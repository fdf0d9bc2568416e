#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(cceMedia)
Q_DECLARE_LOGGING_CATEGORY(cceKeying)
Q_DECLARE_LOGGING_CATEGORY(cceAudio)
Q_DECLARE_LOGGING_CATEGORY(cceDriver)
