#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(sxCore, "sextant.core")
Q_LOGGING_CATEGORY(sxIndex, "sextant.index")
Q_LOGGING_CATEGORY(sxEmbed, "sextant.embed")
Q_LOGGING_CATEGORY(sxSearch, "sextant.search")
Q_LOGGING_CATEGORY(sxStore, "sextant.store")
