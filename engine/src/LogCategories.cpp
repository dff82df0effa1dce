#include "logcollect/LogCategories.hpp"

Q_LOGGING_CATEGORY(lcEnum, "logcollect.enum")
Q_LOGGING_CATEGORY(lcRegistry, "logcollect.registry")
Q_LOGGING_CATEGORY(lcCopy, "logcollect.copy")
Q_LOGGING_CATEGORY(lcXfer, "logcollect.transfer")
Q_LOGGING_CATEGORY(lcConfig, "logcollect.config")
