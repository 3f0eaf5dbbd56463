#include "core/feasibility_selector.hpp"
#include <unistd.h>

EnvironmentCapacityHint EnvironmentCapacityHint::detect()
{
    EnvironmentCapacityHint hint;
    const long pages = sysconf(_SC_PHYS_PAGES);
    const long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages > 0 && page_size > 0)
    {
        hint.memory_gb = static_cast<double>(pages) * static_cast<double>(page_size) / (1024.0 * 1024.0 * 1024.0);
    }
    return hint;
}

FeasibilitySelector::FeasibilitySelector(const GenerationSettings &settings)
    : settings_(settings)
{
}

uint64_t FeasibilitySelector::estimatePayloadBytes(const std::vector<ImageAsset> &assets)
{
    uint64_t total = 0;
    for (const auto &asset : assets)
    {
        total += asset.declared_byte_size;
    }
    return total;
}

FeasibilityDecision FeasibilitySelector::decide(const std::vector<ImageAsset> &assets,
                                                const EnvironmentCapacityHint &hint) const
{
    FeasibilityDecision decision;
    decision.estimated_payload_bytes = estimatePayloadBytes(assets);

    if (decision.estimated_payload_bytes > settings_.local_payload_ceiling_bytes)
    {
        decision.local = false;
        decision.reason = "Total image size " + std::to_string(decision.estimated_payload_bytes / MIB) +
                          " MiB exceeds local limit of " + std::to_string(settings_.local_payload_ceiling_bytes / MIB) + " MiB";
        return decision;
    }

    if (hint.memory_gb && *hint.memory_gb < settings_.low_memory_threshold_gb &&
        assets.size() > static_cast<size_t>(settings_.low_memory_max_images))
    {
        decision.local = false;
        decision.reason = "Low-memory environment allows at most " + std::to_string(settings_.low_memory_max_images) +
                          " images, report has " + std::to_string(assets.size());
        return decision;
    }

    decision.reason = "Document can be generated locally";
    return decision;
}

bool FeasibilitySelector::canGenerateLocally(const std::vector<ImageAsset> &assets,
                                             const EnvironmentCapacityHint &hint) const
{
    return decide(assets, hint).local;
}
