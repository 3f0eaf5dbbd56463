#include "core/image_pipeline_orchestrator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>
#include <utility>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

ImagePipelineOrchestrator::ImagePipelineOrchestrator(std::shared_ptr<ImageResolver> resolver,
                                                     const GenerationSettings &settings)
    : resolver_(std::move(resolver)), settings_(settings), reencoder_(settings)
{
}

std::vector<ImageOutcome> ImagePipelineOrchestrator::toReferences(const std::vector<ImageAsset> &assets)
{
    std::vector<ImageOutcome> references;
    references.reserve(assets.size());
    for (const auto &asset : assets)
    {
        references.emplace_back(ImageReference{asset});
    }
    return references;
}

ImageOutcome ImagePipelineOrchestrator::processAsset(const ImageAsset &asset, const CancellationToken &cancel) const
{
    try
    {
        ResolveResult resolved = resolver_->resolve(asset, cancel);
        switch (resolved.status)
        {
        case ResolveStatus::OK:
            return reencoder_.reencode(resolved.image);
        case ResolveStatus::NOT_FOUND:
            return UnavailableImage{asset, UnavailableReason::NOT_FOUND, resolved.error_message};
        case ResolveStatus::TIMEOUT:
            return UnavailableImage{asset, UnavailableReason::TIMEOUT, resolved.error_message};
        case ResolveStatus::CANCELLED:
        case ResolveStatus::TRANSPORT_ERROR:
            break;
        }
        return UnavailableImage{asset, UnavailableReason::TRANSPORT_ERROR, resolved.error_message};
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected error processing image " + asset.original_filename + ": " + e.what());
        return UnavailableImage{asset, UnavailableReason::TRANSPORT_ERROR, e.what()};
    }
}

PipelineResult ImagePipelineOrchestrator::run(const std::vector<ImageAsset> &assets,
                                              bool embed_inline,
                                              const ProgressCallback &on_progress,
                                              const CancellationToken &cancel,
                                              double baseline,
                                              double range) const
{
    PipelineResult result;

    if (!embed_inline)
    {
        Logger::info("Inline images disabled, listing " + std::to_string(assets.size()) + " image references");
        result.images = toReferences(assets);
        if (on_progress)
            on_progress(baseline + range, "Added " + std::to_string(assets.size()) + " image references");
        return result;
    }

    if (assets.empty())
    {
        if (on_progress)
            on_progress(baseline + range, "No images to process");
        return result;
    }

    const size_t batch_size = static_cast<size_t>(std::max(1, settings_.batch_size));
    const size_t total_batches = (assets.size() + batch_size - 1) / batch_size;

    Logger::info("Processing " + std::to_string(assets.size()) + " images in " +
                 std::to_string(total_batches) + " batches of up to " + std::to_string(batch_size));

    std::vector<std::optional<ImageOutcome>> slots(assets.size());
    tbb::task_arena arena(static_cast<int>(batch_size));

    for (size_t batch = 0; batch < total_batches; ++batch)
    {
        if (cancel.isCancelled())
        {
            Logger::info("Image pipeline cancelled before batch " + std::to_string(batch + 1));
            return PipelineResult{PipelineStatus::CANCELLED, {}, 0, 0, batch};
        }

        const size_t start = batch * batch_size;
        const size_t end = std::min(start + batch_size, assets.size());

        arena.execute([&]
                      { tbb::parallel_for(tbb::blocked_range<size_t>(start, end, 1),
                                          [&](const tbb::blocked_range<size_t> &range_of_assets)
                                          {
                                              for (size_t i = range_of_assets.begin(); i != range_of_assets.end(); ++i)
                                              {
                                                  slots[i] = processAsset(assets[i], cancel);
                                              }
                                          }); });

        if (cancel.isCancelled())
        {
            Logger::info("Image pipeline cancelled during batch " + std::to_string(batch + 1));
            return PipelineResult{PipelineStatus::CANCELLED, {}, 0, 0, batch + 1};
        }

        result.batches_run = batch + 1;
        const double percent = baseline + range * static_cast<double>(batch + 1) / static_cast<double>(total_batches);
        if (on_progress)
        {
            on_progress(percent, "Processing images " + std::to_string(start + 1) + "-" + std::to_string(end) +
                                     " of " + std::to_string(assets.size()) + "...");
        }

        // Yield between batches so the pipeline does not monopolize the host
        if (batch + 1 < total_batches && settings_.inter_batch_delay_ms > 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(settings_.inter_batch_delay_ms));
        }
    }

    result.images.reserve(assets.size());
    for (auto &slot : slots)
    {
        if (std::holds_alternative<EmbeddedImage>(*slot))
            ++result.embedded_count;
        else
            ++result.unavailable_count;
        result.images.push_back(std::move(*slot));
    }

    Logger::info("Image pipeline finished: " + std::to_string(result.embedded_count) + " embedded, " +
                 std::to_string(result.unavailable_count) + " unavailable");
    return result;
}
