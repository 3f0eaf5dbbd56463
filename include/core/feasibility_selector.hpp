#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/generation_settings.hpp"
#include "core/report_model.hpp"

/**
 * @brief What the execution environment can afford, as far as we know.
 *
 * An empty memory_gb means "unknown" and never constrains the decision.
 */
struct EnvironmentCapacityHint
{
    std::optional<double> memory_gb;

    // Physical memory of this host, or unknown if it cannot be read
    static EnvironmentCapacityHint detect();
};

struct FeasibilityDecision
{
    bool local = true;
    uint64_t estimated_payload_bytes = 0;
    std::string reason;
};

/**
 * @brief Decides whether a document can be assembled locally.
 *
 * Pure function of declared asset sizes, asset count and the capacity hint;
 * it must run before any image is fetched.
 */
class FeasibilitySelector
{
public:
    explicit FeasibilitySelector(const GenerationSettings &settings = GenerationSettings{});

    bool canGenerateLocally(const std::vector<ImageAsset> &assets, const EnvironmentCapacityHint &hint) const;

    FeasibilityDecision decide(const std::vector<ImageAsset> &assets, const EnvironmentCapacityHint &hint) const;

    static uint64_t estimatePayloadBytes(const std::vector<ImageAsset> &assets);

private:
    GenerationSettings settings_;
};
