#include "calmerge/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcCalmergeCodec, "calmerge.codec", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCalmergeImport, "calmerge.import", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCalmergeEngine, "calmerge.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCalmergeService, "calmerge.service", QtInfoMsg)
