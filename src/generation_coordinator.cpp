#include "core/generation_coordinator.hpp"
#include "core/content_model_builder.hpp"
#include "core/image_pipeline_orchestrator.hpp"
#include "document/document_packager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace
{
    constexpr double CONTENT_DONE = 20.0;
    constexpr double IMAGES_RANGE = 60.0;
    constexpr double PACKAGING_START = 80.0;
    constexpr double DELEGATION_CEILING = 99.0;

    const char *FALLBACK_MESSAGE = "Local document exceeded size limit, switching to remote generation...";
}

const char *toString(CoordinatorState state)
{
    switch (state)
    {
    case CoordinatorState::IDLE:
        return "idle";
    case CoordinatorState::ESTIMATING:
        return "estimating";
    case CoordinatorState::LOCAL_GENERATING:
        return "local_generating";
    case CoordinatorState::DELEGATING:
        return "delegating";
    case CoordinatorState::SUCCEEDED:
        return "succeeded";
    case CoordinatorState::FAILED:
        return "failed";
    case CoordinatorState::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

// Clamps every report so the caller never sees progress go backwards
class GenerationCoordinator::ProgressRelay
{
public:
    explicit ProgressRelay(const ProgressCallback &sink) : sink_(sink) {}

    void report(double percent, const std::string &message)
    {
        percent = std::min(100.0, std::max(percent, last_));
        last_ = percent;
        if (sink_)
            sink_(percent, message);
    }

    double last() const { return last_; }

private:
    const ProgressCallback &sink_;
    double last_ = 0.0;
};

GenerationCoordinator::GenerationCoordinator(std::shared_ptr<ImageResolver> resolver,
                                             std::shared_ptr<RemoteGenerationClient> remote,
                                             std::shared_ptr<TextEnhancer> enhancer,
                                             const GenerationSettings &settings,
                                             EnvironmentCapacityHint hint)
    : resolver_(std::move(resolver)), remote_(std::move(remote)), enhancer_(std::move(enhancer)),
      settings_(settings), hint_(hint)
{
    history_.push_back(CoordinatorState::IDLE);
}

std::string GenerationCoordinator::suggestedFilename(const std::string &title, std::time_t when)
{
    std::string name = title;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                   { return std::isalnum(c) ? static_cast<char>(c) : '_'; });

    std::tm utc{};
    gmtime_r(&when, &utc);
    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &utc);
    return name + "_" + date + ".docx";
}

CoordinatorState GenerationCoordinator::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<CoordinatorState> GenerationCoordinator::stateHistory() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_;
}

void GenerationCoordinator::transition(CoordinatorState next)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    Logger::debug(std::string("Generation state ") + toString(state_) + " -> " + toString(next));
    state_ = next;
    history_.push_back(next);
}

std::future<GenerationOutcome> GenerationCoordinator::generateAsync(GenerationRequest request,
                                                                    ProgressCallback on_progress,
                                                                    CancellationToken cancel)
{
    return std::async(std::launch::async, [this, request = std::move(request), on_progress = std::move(on_progress), cancel]()
                      { return generate(request, on_progress, cancel); });
}

GenerationOutcome GenerationCoordinator::generate(const GenerationRequest &request,
                                                  const ProgressCallback &on_progress,
                                                  const CancellationToken &cancel)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = CoordinatorState::IDLE;
        history_.assign(1, CoordinatorState::IDLE);
    }
    ProgressRelay progress(on_progress);

    try
    {
        transition(CoordinatorState::ESTIMATING);
        progress.report(0.0, "Initializing document generation...");

        if (cancel.isCancelled())
        {
            return finish(GenerationOutcome::failure(GenerationErrorKind::CANCELLED, "Generation cancelled"), request, progress);
        }

        // Reference-only documents never fetch images, so their size does not count
        static const std::vector<ImageAsset> no_assets;
        const auto &fetched_assets = request.options.embed_images_inline ? request.assets : no_assets;
        const FeasibilityDecision decision = FeasibilitySelector(settings_).decide(fetched_assets, hint_);
        Logger::info("Feasibility for '" + request.model.title + "': " + (decision.local ? "local" : "delegated") +
                     " (" + decision.reason + ")");

        if (!decision.local)
        {
            return finish(delegate(request, progress, cancel, ""), request, progress);
        }
        return finish(generateLocally(request, progress, cancel), request, progress);
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected error during document generation: " + std::string(e.what()));
        return finish(GenerationOutcome::failure(GenerationErrorKind::INTERNAL, e.what()), request, progress);
    }
}

GenerationOutcome GenerationCoordinator::generateLocally(const GenerationRequest &request,
                                                         ProgressRelay &progress,
                                                         const CancellationToken &cancel)
{
    transition(CoordinatorState::LOCAL_GENERATING);

    const ReportContentModel *model = &request.model;
    ReportContentModel enhanced;
    if (request.options.enhance_text && enhancer_)
    {
        progress.report(5.0, "Enhancing report text...");
        enhanced = enhanceModel(request.model, *enhancer_, cancel);
        model = &enhanced;
    }
    if (cancel.isCancelled())
    {
        return GenerationOutcome::failure(GenerationErrorKind::CANCELLED, "Generation cancelled");
    }

    std::vector<ContentBlock> blocks = ContentModelBuilder::build(*model);
    progress.report(CONTENT_DONE, "Processing images...");

    ImagePipelineOrchestrator pipeline(resolver_, settings_);
    PipelineResult images = pipeline.run(
        request.assets, request.options.embed_images_inline,
        [&progress](double percent, const std::string &message)
        { progress.report(percent, message); },
        cancel, CONTENT_DONE, IMAGES_RANGE);

    if (images.cancelled() || cancel.isCancelled())
    {
        return GenerationOutcome::failure(GenerationErrorKind::CANCELLED, "Generation cancelled");
    }

    ContentModelBuilder::appendImageBlocks(blocks, images.images, request.options.embed_images_inline);
    progress.report(PACKAGING_START, "Creating document...");

    DocumentProperties properties;
    properties.title = request.model.title;
    PackResult packed = DocumentPackager(settings_).pack(blocks, properties);

    if (packed.status == PackStatus::PAYLOAD_TOO_LARGE)
    {
        Logger::warn("Local package too large: " + packed.error_message);
        return delegate(request, progress, cancel, packed.error_message);
    }
    if (!packed.success())
    {
        return GenerationOutcome::failure(GenerationErrorKind::PACKAGING, packed.error_message);
    }
    if (cancel.isCancelled())
    {
        return GenerationOutcome::failure(GenerationErrorKind::CANCELLED, "Generation cancelled");
    }

    progress.report(90.0, "Packaging document...");

    GenerationOutcome outcome;
    outcome.success = true;
    outcome.strategy = GenerationStrategy::LOCAL;
    outcome.package_bytes = std::move(packed.package);
    outcome.embedded_images = images.embedded_count;
    outcome.unavailable_images = images.unavailable_count;
    return outcome;
}

GenerationOutcome GenerationCoordinator::delegate(const GenerationRequest &request,
                                                  ProgressRelay &progress,
                                                  const CancellationToken &cancel,
                                                  const std::string &fallback_cause)
{
    transition(CoordinatorState::DELEGATING);
    const bool fallback = !fallback_cause.empty();

    if (!remote_)
    {
        if (fallback)
        {
            return GenerationOutcome::failure(GenerationErrorKind::PAYLOAD_TOO_LARGE, fallback_cause);
        }
        return GenerationOutcome::failure(GenerationErrorKind::DELEGATION,
                                          "Document is too large to generate locally and no remote generation service is configured");
    }
    if (cancel.isCancelled())
    {
        return GenerationOutcome::failure(GenerationErrorKind::CANCELLED, "Generation cancelled");
    }

    const double base = progress.last();
    progress.report(base, fallback ? FALLBACK_MESSAGE : "Generating document on server...");

    DelegationResult delegated = remote_->generate(
        request,
        [&progress, base](double percent, const std::string &message)
        {
            const double clamped = std::min(100.0, std::max(0.0, percent));
            progress.report(base + (DELEGATION_CEILING - base) * clamped / 100.0, message);
        },
        cancel);

    if (delegated.cancelled || cancel.isCancelled())
    {
        return GenerationOutcome::failure(GenerationErrorKind::CANCELLED, "Generation cancelled");
    }
    if (!delegated.success)
    {
        std::string message = delegated.error_message;
        if (fallback)
        {
            message = "Remote generation failed after local fallback (" + fallback_cause + "): " + message;
        }
        return GenerationOutcome::failure(GenerationErrorKind::DELEGATION, message);
    }

    GenerationOutcome outcome;
    outcome.success = true;
    outcome.strategy = GenerationStrategy::DELEGATED;
    outcome.fallback_used = fallback;
    outcome.package_bytes = std::move(delegated.package_bytes);
    return outcome;
}

GenerationOutcome GenerationCoordinator::finish(GenerationOutcome outcome,
                                                const GenerationRequest &request,
                                                ProgressRelay &progress)
{
    if (outcome.success)
    {
        outcome.suggested_filename = suggestedFilename(request.model.title, std::time(nullptr));
        transition(CoordinatorState::SUCCEEDED);
        progress.report(100.0, "Document ready");
        Logger::info("Generated " + outcome.suggested_filename + " (" + std::to_string(outcome.package_bytes.size()) +
                     " bytes, " + toString(outcome.strategy) + ")");
    }
    else if (outcome.cancelled())
    {
        transition(CoordinatorState::CANCELLED);
        Logger::info("Generation of '" + request.model.title + "' cancelled");
    }
    else
    {
        transition(CoordinatorState::FAILED);
        Logger::error("Generation of '" + request.model.title + "' failed (" + toString(outcome.error) +
                      "): " + outcome.error_message);
    }
    return outcome;
}
