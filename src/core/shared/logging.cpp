#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(plCore, "policylens.core")
Q_LOGGING_CATEGORY(plStore, "policylens.store")
Q_LOGGING_CATEGORY(plEmbedding, "policylens.embedding")
Q_LOGGING_CATEGORY(plRetrieval, "policylens.retrieval")
Q_LOGGING_CATEGORY(plEvidence, "policylens.evidence")
Q_LOGGING_CATEGORY(plIpc, "policylens.ipc")
