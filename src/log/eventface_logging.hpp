#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_STORE)
Q_DECLARE_LOGGING_CATEGORY(LC_INDEX)
Q_DECLARE_LOGGING_CATEGORY(LC_REGISTRY)
Q_DECLARE_LOGGING_CATEGORY(LC_INGEST)
Q_DECLARE_LOGGING_CATEGORY(LC_MATCH)
Q_DECLARE_LOGGING_CATEGORY(LC_EMBED)
Q_DECLARE_LOGGING_CATEGORY(LC_HTTP)
Q_DECLARE_LOGGING_CATEGORY(LC_CONFIG)
