#include "detect/decision_engine.hpp"
#include <cmath>

namespace detect {

namespace {

// Statistics are variances; anything that is not a non-negative number is treated as absent.
double sanitize(double x) {
    return (std::isnan(x) || x < 0.0) ? 0.0 : x;
}

double mean_mfcc_variance(const std::vector<double>& mfcc_var) {
    if (mfcc_var.empty()) return 0.0;
    double sum = 0.0;
    for (double v : mfcc_var) sum += sanitize(v);
    return sum / static_cast<double>(mfcc_var.size());
}

} // namespace

const char* to_string(Classification c) {
    switch (c) {
    case Classification::HUMAN: return "HUMAN";
    case Classification::AI_GENERATED: return "AI_GENERATED";
    }
    return "AI_GENERATED";
}

double saturate(double x, double threshold) {
    x = sanitize(x);
    if (!(threshold > 0.0)) return x > 0.0 ? 1.0 : 0.0;
    return std::tanh(x / threshold);
}

double round_to(double x, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(x * scale) / scale;
}

ClassificationResult classify(const features::FeatureVector& fv, const DecisionConfig& config) {
    const double avg_mfcc_var = mean_mfcc_variance(fv.mfcc_var);

    const double pitch_score = saturate(fv.pitch_var, config.pitch_var_threshold);
    const double mfcc_score = saturate(avg_mfcc_var, config.mfcc_var_threshold);

    // Prosody (pitch movement) carries more weight than spectral movement
    const double human_probability = config.pitch_weight * pitch_score + config.mfcc_weight * mfcc_score;

    ClassificationResult result;
    if (human_probability >= config.human_boundary) {
        result.classification = Classification::HUMAN;
        result.confidence = human_probability;
        if (pitch_score > 0.5) {
            result.explanation.push_back("High pitch variability suggests natural intonation.");
        }
        if (mfcc_score > 0.5) {
            result.explanation.push_back("Spectral dynamics indicate natural coarticulation.");
        }
        if (result.explanation.empty()) {
            result.explanation.push_back("Overall acoustic features lean towards human patterns.");
        }
    } else {
        result.classification = Classification::AI_GENERATED;
        result.confidence = 1.0 - human_probability;
        if (pitch_score <= 0.5) {
            result.explanation.push_back("Low pitch variability suggests monotonic/robotic speech.");
        }
        if (mfcc_score <= 0.5) {
            result.explanation.push_back("Low spectral variance indicates lack of natural acoustic richness.");
        }
        if (result.explanation.empty()) {
            result.explanation.push_back("Overall acoustic features lean towards synthetic patterns.");
        }
    }

    // Custom weights may push the raw score outside [0, 1]
    result.confidence = round_to(std::fmin(1.0, std::fmax(0.0, result.confidence)), 4);
    result.details["human_probability"] = round_to(human_probability, 4);
    result.details["pitch_score"] = round_to(pitch_score, 4);
    result.details["mfcc_score"] = round_to(mfcc_score, 4);
    return result;
}

} // namespace detect
