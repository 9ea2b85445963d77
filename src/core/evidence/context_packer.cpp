#include "core/evidence/context_packer.h"
#include "core/evidence/sentence_splitter.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace pl {

namespace {

constexpr qsizetype kSeparatorChars = 2;  // "\n\n"

} // namespace

ContextPacker::ContextPacker(const RetrievalSettings& settings)
    : m_charBudget(std::max(settings.charBudget, 1))
    , m_maxBlocks(std::max(settings.maxBlocks, 1))
    , m_overageMultiplier(std::max(settings.overageMultiplier, 1.0))
    , m_overageChunkLimit(std::max(settings.overageChunkLimit, 0))
    , m_fallbackPageLimit(std::max(settings.fallbackPageLimit, 1))
{
}

QString ContextPacker::formatChunk(int index, const QString& documentId, int page,
                                   const QString& text)
{
    // Single pass so a '%N' inside the id or text is left alone.
    return QStringLiteral("[%1] %2 p.%3\n\"\"\"%4\"\"\"")
        .arg(QString::number(index), documentId, QString::number(page), text);
}

QString ContextPacker::joinChunks(const std::vector<QString>& chunks)
{
    QString joined;
    for (const QString& chunk : chunks) {
        if (!joined.isEmpty()) {
            joined += QStringLiteral("\n\n");
        }
        joined += chunk;
    }
    return joined;
}

std::vector<QString> ContextPacker::pack(const std::vector<EvidenceBlock>& blocks) const
{
    const double overageBudget = static_cast<double>(m_charBudget) * m_overageMultiplier;

    std::vector<QString> out;
    qsizetype used = 0;

    for (const EvidenceBlock& block : blocks) {
        if (static_cast<int>(out.size()) >= m_maxBlocks) {
            break;
        }

        QString chunk = formatChunk(static_cast<int>(out.size()) + 1,
                                    block.documentId, block.page, block.text);
        const qsizetype length = chunk.size();

        if (used + length > m_charBudget) {
            const bool earlyChunk = static_cast<int>(out.size()) < m_overageChunkLimit;
            const bool withinOverage = static_cast<double>(used + length) <= overageBudget;
            if (!earlyChunk || !withinOverage) {
                break;
            }
        }

        out.push_back(std::move(chunk));
        used += length + kSeparatorChars;
    }

    LOG_DEBUG(plEvidence, "Packed %d of %d blocks (%lld chars, budget %d)",
              static_cast<int>(out.size()), static_cast<int>(blocks.size()),
              static_cast<long long>(used), m_charBudget);
    return out;
}

std::vector<QString> ContextPacker::packWholePages(const std::vector<CandidatePage>& pages) const
{
    std::vector<QString> out;
    if (pages.empty()) {
        return out;
    }

    const int pageCount = std::min(static_cast<int>(pages.size()), m_fallbackPageLimit);
    const int share = m_charBudget / pageCount;
    const double overageBudget = static_cast<double>(m_charBudget) * m_overageMultiplier;

    qsizetype joinedLength = 0;
    for (int i = 0; i < pageCount; ++i) {
        const CandidatePage& page = pages[static_cast<size_t>(i)];
        const QString text = SentenceSplitter::normalize(page.text).left(share);
        if (text.isEmpty()) {
            continue;
        }

        QString chunk = formatChunk(static_cast<int>(out.size()) + 1,
                                    page.documentId, page.page, text);
        const qsizetype nextLength =
            joinedLength + (out.empty() ? 0 : kSeparatorChars) + chunk.size();
        if (!out.empty() && static_cast<double>(nextLength) > overageBudget) {
            break;
        }

        joinedLength = nextLength;
        out.push_back(std::move(chunk));
    }

    LOG_DEBUG(plEvidence, "Whole-page fallback packed %d of %d pages (%d chars each)",
              static_cast<int>(out.size()), static_cast<int>(pages.size()), share);
    return out;
}

} // namespace pl
