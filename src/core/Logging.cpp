#include "custody/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStore, "custody.store")
Q_LOGGING_CATEGORY(lcApply, "custody.apply")
Q_LOGGING_CATEGORY(lcWorkflow, "custody.workflow")
Q_LOGGING_CATEGORY(lcRecurrence, "custody.recurrence")
Q_LOGGING_CATEGORY(lcPersistence, "custody.persistence")
Q_LOGGING_CATEGORY(lcEngine, "custody.engine")
