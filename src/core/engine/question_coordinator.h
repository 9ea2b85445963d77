#pragma once

#include "core/shared/types.h"

#include <atomic>
#include <functional>
#include <vector>

namespace pl {

class EvidenceEngine;

// Shared flag a caller flips to abandon a batch. Questions already being
// answered run to completion; unclaimed ones are not started.
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true, std::memory_order_release); }
    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};

// QuestionCoordinator -- answers a batch of questions with a bounded pool of
// worker threads.
//
// Workers claim the next unanswered index from a shared counter and write the
// result into that slot, so results come back in input order regardless of
// completion order. A failure in one question never affects another.
class QuestionCoordinator {
public:
    using AnswerFn = std::function<QuestionEvidence(const Question&)>;

    QuestionCoordinator(const EvidenceEngine& engine, int concurrency = 4);
    QuestionCoordinator(AnswerFn answer, int concurrency = 4);

    std::vector<QuestionEvidence> run(const std::vector<Question>& questions,
                                      const CancellationToken* cancel = nullptr) const;

    int concurrency() const { return m_concurrency; }

private:
    AnswerFn m_answer;
    int m_concurrency = 4;
};

} // namespace pl
