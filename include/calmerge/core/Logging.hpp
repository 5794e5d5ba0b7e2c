#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcCalmergeCodec)
Q_DECLARE_LOGGING_CATEGORY(lcCalmergeImport)
Q_DECLARE_LOGGING_CATEGORY(lcCalmergeEngine)
Q_DECLARE_LOGGING_CATEGORY(lcCalmergeService)
