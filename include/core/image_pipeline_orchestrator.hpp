#pragma once

#include <memory>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/content_block.hpp"
#include "core/generation_result.hpp"
#include "core/generation_settings.hpp"
#include "core/image_reencoder.hpp"
#include "core/image_resolver.hpp"

enum class PipelineStatus
{
    COMPLETED,
    CANCELLED
};

struct PipelineResult
{
    PipelineStatus status = PipelineStatus::COMPLETED;
    std::vector<ImageOutcome> images; // Same order as the input assets; empty when cancelled
    size_t embedded_count = 0;
    size_t unavailable_count = 0;
    size_t batches_run = 0;

    bool cancelled() const { return status == PipelineStatus::CANCELLED; }
};

/**
 * @brief Runs Resolve -> Re-encode over the report images in sequential batches.
 *
 * Error Handling Policy:
 * - A failed fetch or decode never aborts the run; the asset becomes an UnavailableImage.
 * - Cancellation is polled at every batch boundary; a cancelled run returns no images.
 * - Within a batch assets run concurrently (at most batch_size at once) and are
 *   written back by input index, so completion order never changes output order.
 */
class ImagePipelineOrchestrator
{
public:
    ImagePipelineOrchestrator(std::shared_ptr<ImageResolver> resolver, const GenerationSettings &settings);

    /**
     * @brief Process every asset
     * @param assets Ordered report images
     * @param embed_inline false skips all I/O and yields ImageReference entries
     * @param on_progress Receives baseline + range * (batches done / total batches)
     * @param cancel Polled before each batch and before every fetch
     */
    PipelineResult run(const std::vector<ImageAsset> &assets,
                       bool embed_inline,
                       const ProgressCallback &on_progress,
                       const CancellationToken &cancel,
                       double baseline = 20.0,
                       double range = 60.0) const;

    static std::vector<ImageOutcome> toReferences(const std::vector<ImageAsset> &assets);

private:
    std::shared_ptr<ImageResolver> resolver_;
    GenerationSettings settings_;
    ImageReencoder reencoder_;

    ImageOutcome processAsset(const ImageAsset &asset, const CancellationToken &cancel) const;
};
