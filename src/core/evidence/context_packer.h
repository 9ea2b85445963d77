#pragma once

#include "core/shared/retrieval_settings.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace pl {

// ContextPacker -- greedy, budgeted packing of ranked evidence into
// citation-tagged chunks:
//
//   [n] <documentId> p.<page>
//   """<text>"""
//
// Chunks are joined with a blank line; each chunk costs length + 2 against
// the character budget. A chunk that would overrun the budget is still taken
// while fewer than overageChunkLimit chunks are packed and the total stays
// within budget * overageMultiplier; otherwise packing stops.
class ContextPacker {
public:
    explicit ContextPacker(const RetrievalSettings& settings);

    std::vector<QString> pack(const std::vector<EvidenceBlock>& blocks) const;

    // Coarse fallback: up to fallbackPageLimit pages, each truncated to an even
    // share of the budget. Always emits the first page with non-empty text.
    std::vector<QString> packWholePages(const std::vector<CandidatePage>& pages) const;

    static QString formatChunk(int index, const QString& documentId, int page,
                               const QString& text);
    static QString joinChunks(const std::vector<QString>& chunks);

private:
    int m_charBudget = 200000;
    int m_maxBlocks = 100;
    double m_overageMultiplier = 1.1;
    int m_overageChunkLimit = 10;
    int m_fallbackPageLimit = 20;
};

} // namespace pl
