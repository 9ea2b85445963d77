#include "core/engine/question_coordinator.h"
#include "core/engine/evidence_engine.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <exception>
#include <thread>

namespace pl {

QuestionCoordinator::QuestionCoordinator(const EvidenceEngine& engine, int concurrency)
    : m_answer([&engine](const Question& question) { return engine.answer(question); })
    , m_concurrency(std::max(concurrency, 1))
{
}

QuestionCoordinator::QuestionCoordinator(AnswerFn answer, int concurrency)
    : m_answer(std::move(answer))
    , m_concurrency(std::max(concurrency, 1))
{
}

std::vector<QuestionEvidence> QuestionCoordinator::run(
    const std::vector<Question>& questions, const CancellationToken* cancel) const
{
    std::vector<QuestionEvidence> results(questions.size());
    for (size_t i = 0; i < questions.size(); ++i) {
        results[i].questionId = questions[i].questionId;
    }
    if (questions.empty()) {
        return results;
    }

    QElapsedTimer timer;
    timer.start();

    std::atomic<size_t> nextIndex{0};
    // One slot per question, each written only by the worker that claimed it.
    std::vector<char> answered(questions.size(), 0);

    auto workerLoop = [&]() {
        for (;;) {
            if (cancel && cancel->isCancelled()) {
                return;
            }
            const size_t index = nextIndex.fetch_add(1, std::memory_order_relaxed);
            if (index >= questions.size()) {
                return;
            }

            const Question& question = questions[index];
            QuestionEvidence evidence;
            try {
                evidence = m_answer(question);
            } catch (const std::exception& e) {
                LOG_ERROR(plRetrieval, "Question %s failed: %s",
                          qUtf8Printable(question.questionId), e.what());
                evidence = QuestionEvidence{};
            }
            evidence.questionId = question.questionId;
            results[index] = std::move(evidence);
            answered[index] = 1;
        }
    };

    const size_t workerCount =
        std::min(static_cast<size_t>(m_concurrency), questions.size());
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(workerLoop);
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    // Anything never claimed was abandoned by cancellation.
    int answeredCount = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (answered[i]) {
            ++answeredCount;
        } else {
            results[i].cancelled = true;
        }
    }

    LOG_INFO(plRetrieval, "Answered %d/%d questions with %d workers in %lld ms",
             answeredCount, static_cast<int>(questions.size()),
             static_cast<int>(workerCount), static_cast<long long>(timer.elapsed()));
    return results;
}

} // namespace pl
