#include "cce_logging.h"

Q_LOGGING_CATEGORY(cceMedia, "cce.media")
Q_LOGGING_CATEGORY(cceKeying, "cce.keying")
Q_LOGGING_CATEGORY(cceAudio, "cce.audio")
Q_LOGGING_CATEGORY(cceDriver, "cce.driver")
