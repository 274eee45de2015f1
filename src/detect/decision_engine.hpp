#pragma once

#include "features/feature_vector.hpp"
#include <map>
#include <string>
#include <vector>

namespace detect {

enum class Classification {
    HUMAN,
    AI_GENERATED
};

const char* to_string(Classification c);

// Hand-tuned calibration values, matched to the default ExtractorConfig.
struct DecisionConfig {
    double pitch_var_threshold = 500.0;   // pitch_var at which the pitch score reaches tanh(1)
    double mfcc_var_threshold = 50.0;     // same for the mean MFCC variance
    double pitch_weight = 0.7;
    double mfcc_weight = 0.3;
    double human_boundary = 0.5;          // human_probability >= boundary -> HUMAN
};

struct ClassificationResult {
    Classification classification = Classification::AI_GENERATED;
    double confidence = 0.0;                  // in [0, 1], 4 decimals
    std::vector<std::string> explanation;     // never empty
    std::map<std::string, double> details;    // human_probability, pitch_score, mfcc_score
};

// tanh(x / threshold): maps [0, inf) monotonically into [0, 1).
double saturate(double x, double threshold);

// Round half away from zero to `decimals` places.
double round_to(double x, int decimals);

/**
 * Score a feature vector. Total: never throws for any FeatureVector.
 *
 * Absent or degenerate fields take safe defaults: an empty mfcc_var averages to 0,
 * NaN or negative statistics count as 0.
 */
ClassificationResult classify(const features::FeatureVector& fv,
                              const DecisionConfig& config = DecisionConfig{});

} // namespace detect
