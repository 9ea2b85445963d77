#pragma once

namespace pl {

// Retrieval and packing knobs. All of these are configuration, not protocol.
struct RetrievalSettings {
    // Nearest-neighbor fan-out and page expansion
    int topK = 80;
    int neighborRadius = 3;
    double baseScoreFactor = 0.25;

    // Sentence harvesting
    int sentWindow = 2;
    int maxSentChars = 600;
    int dedupKeyChars = 160;
    double lenientScoreFloor = 0.1;

    // Packing
    int charBudget = 200000;
    int maxBlocks = 100;
    double overageMultiplier = 1.1;
    int overageChunkLimit = 10;
    int minPackedChunks = 5;
    int fallbackPageLimit = 20;

    // Parallel in-flight questions
    int concurrency = 4;
};

} // namespace pl
