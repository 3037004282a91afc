#include "log/eventface_logging.hpp"

Q_LOGGING_CATEGORY(LC_STORE,    "eventface.store")
Q_LOGGING_CATEGORY(LC_INDEX,    "eventface.index")
Q_LOGGING_CATEGORY(LC_REGISTRY, "eventface.registry")
Q_LOGGING_CATEGORY(LC_INGEST,   "eventface.ingest")
Q_LOGGING_CATEGORY(LC_MATCH,    "eventface.match")
Q_LOGGING_CATEGORY(LC_EMBED,    "eventface.embed")
Q_LOGGING_CATEGORY(LC_HTTP,     "eventface.http")
Q_LOGGING_CATEGORY(LC_CONFIG,   "eventface.config")
