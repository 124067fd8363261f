#include "planner/Logging.hpp"

Q_LOGGING_CATEGORY(lcEngine, "planner.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcData, "planner.data")
Q_LOGGING_CATEGORY(lcService, "planner.service")
Q_LOGGING_CATEGORY(lcConfig, "planner.config")
