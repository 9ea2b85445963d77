#pragma once

#include "core/engine/evidence_engine.h"
#include "core/engine/question_coordinator.h"
#include "core/ipc/message.h"
#include "core/ipc/service_base.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <memory>

namespace pl {

class EmbeddingIndex;
class EmbeddingProvider;
class PageStore;
class SqlitePageStore;

// EvidenceService -- exposes the evidence engine over the local socket.
//
//   packEvidence { questions: [{id, text}] }  -> { results: [...], offset, total }
//                  results that overflow one frame arrive first as "partial"
//                  frames { results, offset } with the same id
//   searchPages  { q, limit? }                -> { query, ftsQuery, results }
//   ping, shutdown
class EvidenceService : public ServiceBase {
    Q_OBJECT
public:
    static constexpr const char* kServiceName = "evidence";

    EvidenceService(std::shared_ptr<const EmbeddingIndex> index,
                    std::unique_ptr<PageStore> pageStore,
                    std::unique_ptr<EmbeddingProvider> provider,
                    const Settings& settings,
                    QObject* parent = nullptr);
    ~EvidenceService() override;

    // Opens the page store and index named in settings and builds the HTTP
    // provider. Returns nullptr and fills *error if anything is missing.
    static std::unique_ptr<EvidenceService> create(const Settings& settings,
                                                   QString* error = nullptr);

    // Upper bound on one encoded reply frame; packEvidence splits its
    // results to stay under it. Clamped to [kMinReplyBytes, kMaxMessageSize].
    void setMaxReplyBytes(int bytes);
    int maxReplyBytes() const { return m_maxReplyBytes; }

    static constexpr int kMinReplyBytes = 4096;

protected:
    QJsonObject handlePackEvidence(uint64_t id, const QJsonObject& params);
    QJsonObject handleSearchPages(uint64_t id, const QJsonObject& params);

private:
    std::shared_ptr<const EmbeddingIndex> m_index;
    std::unique_ptr<PageStore> m_pageStore;
    std::unique_ptr<EmbeddingProvider> m_provider;
    Settings m_settings;
    int m_maxReplyBytes = IpcMessage::kMaxMessageSize;

    // Non-owning; set when m_pageStore is the SQLite backend.
    const SqlitePageStore* m_sqliteStore = nullptr;

    std::unique_ptr<EvidenceEngine> m_engine;
    std::unique_ptr<QuestionCoordinator> m_coordinator;
};

} // namespace pl
