#pragma once

#include <ctime>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/feasibility_selector.hpp"
#include "core/generation_result.hpp"
#include "core/generation_settings.hpp"
#include "core/image_resolver.hpp"
#include "core/remote_generation_client.hpp"
#include "core/text_enhancer.hpp"

enum class CoordinatorState
{
    IDLE,
    ESTIMATING,
    LOCAL_GENERATING,
    DELEGATING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char *toString(CoordinatorState state);

/**
 * @brief Top-level driver for one document generation.
 *
 * Idle -> Estimating -> {LocalGenerating | Delegating} -> {Succeeded | Failed | Cancelled}
 *
 * LocalGenerating falls back to Delegating at most once, and only when the
 * packaged document exceeds the size ceiling. Progress is monotonic:
 * 0-20 content, 20-80 images, 80-100 packaging. One coordinator runs one
 * generation at a time; concurrent requests use separate instances.
 */
class GenerationCoordinator
{
public:
    /**
     * @param resolver Image source for the local path
     * @param remote Delegation target; null disables delegation
     * @param enhancer Text rewriting collaborator; null disables enhancement
     */
    GenerationCoordinator(std::shared_ptr<ImageResolver> resolver,
                          std::shared_ptr<RemoteGenerationClient> remote,
                          std::shared_ptr<TextEnhancer> enhancer,
                          const GenerationSettings &settings = GenerationSettings{},
                          EnvironmentCapacityHint hint = EnvironmentCapacityHint{});

    GenerationOutcome generate(const GenerationRequest &request,
                               const ProgressCallback &on_progress,
                               const CancellationToken &cancel);

    // Runs generate() on its own thread; the coordinator must outlive the future
    std::future<GenerationOutcome> generateAsync(GenerationRequest request,
                                                 ProgressCallback on_progress,
                                                 CancellationToken cancel);

    CoordinatorState state() const;
    std::vector<CoordinatorState> stateHistory() const;

    // "<title with non-alphanumerics as _>_<YYYY-MM-DD>.docx"
    static std::string suggestedFilename(const std::string &title, std::time_t when);

private:
    std::shared_ptr<ImageResolver> resolver_;
    std::shared_ptr<RemoteGenerationClient> remote_;
    std::shared_ptr<TextEnhancer> enhancer_;
    GenerationSettings settings_;
    EnvironmentCapacityHint hint_;

    mutable std::mutex state_mutex_;
    CoordinatorState state_ = CoordinatorState::IDLE;
    std::vector<CoordinatorState> history_;

    class ProgressRelay;

    void transition(CoordinatorState next);
    GenerationOutcome generateLocally(const GenerationRequest &request, ProgressRelay &progress, const CancellationToken &cancel);
    GenerationOutcome delegate(const GenerationRequest &request, ProgressRelay &progress, const CancellationToken &cancel,
                               const std::string &fallback_cause);
    GenerationOutcome finish(GenerationOutcome outcome, const GenerationRequest &request, ProgressRelay &progress);
};
