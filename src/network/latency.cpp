#include "latency.hpp"

#include <cmath>

#include "../core/errors.hpp"

namespace {

bool non_negative(double x) {
    return std::isfinite(x) && x >= 0;
}

}  // namespace

SimTime sample_latency(const LatencyModel& model, NodeId from, NodeId to, std::mt19937_64& rng) {
    if (model.sampler) {
        SimTime latency = model.sampler(from, to, rng);
        if (!non_negative(latency)) {
            throw ConfigurationError("latency sampler returned a negative or non-finite delay");
        }
        return latency;
    }

    switch (model.kind) {
        case LatencyKind::Fixed:
            return model.value;
        case LatencyKind::Uniform:
            return std::uniform_real_distribution<double>(model.min, model.max)(rng);
        case LatencyKind::Exponential:
            return model.min + std::exponential_distribution<double>(1.0 / model.mean)(rng);
    }
    return model.value;
}

void validate_latency(const LatencyModel& model) {
    if (model.sampler) {
        return;
    }

    switch (model.kind) {
        case LatencyKind::Fixed:
            if (!non_negative(model.value)) {
                throw ConfigurationError("fixed latency must be finite and non-negative");
            }
            break;
        case LatencyKind::Uniform:
            if (!non_negative(model.min) || !std::isfinite(model.max) || model.max < model.min) {
                throw ConfigurationError("uniform latency needs 0 <= min <= max");
            }
            break;
        case LatencyKind::Exponential:
            if (!non_negative(model.min) || !std::isfinite(model.mean) || model.mean <= 0) {
                throw ConfigurationError("exponential latency needs min >= 0 and mean > 0");
            }
            break;
    }
}
