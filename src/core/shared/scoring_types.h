#pragma once

namespace pl {

// Weights for the sentence-level evidence heuristics.
struct SentenceScoringWeights {
    // Obligation and timing language
    double obligationWeight = 3.0;
    double dayCountWeight = 3.0;
    double mandateWeight = 1.5;
    double timingWeight = 1.0;

    // Domain concepts
    double authorizationWeight = 2.0;
    double hospiceWeight = 2.0;
    double retrospectiveWeight = 2.0;
    double directPaymentWeight = 2.0;
    double primaryCareWeight = 2.0;
    double roomAndBoardWeight = 2.0;
    double explanationOfBenefitsWeight = 2.0;
    double notifyWeight = 1.0;
    double claimWeight = 1.0;
    double memberWeight = 1.0;
    double policyGenericWeight = 1.0;

    // Question number echoed in the sentence
    double questionNumberBonus = 2.0;

    // Length penalties
    int shortSentenceChars = 30;
    int longSentenceChars = 500;
    double shortSentencePenalty = 0.3;
    double longSentencePenalty = 0.3;
};

} // namespace pl
