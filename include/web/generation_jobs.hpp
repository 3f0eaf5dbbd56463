#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/cancellation_token.hpp"
#include "core/feasibility_selector.hpp"
#include "core/generation_coordinator.hpp"
#include "core/generation_result.hpp"
#include "core/generation_settings.hpp"

using CoordinatorFactory = std::function<std::unique_ptr<GenerationCoordinator>()>;

/**
 * @brief Everything the HTTP layer needs to run generations
 */
struct GenerationServices
{
    CoordinatorFactory make_coordinator;
    GenerationSettings settings;
    EnvironmentCapacityHint hint;
};

struct GenerationJobSnapshot
{
    std::string id;
    CoordinatorState state = CoordinatorState::IDLE;
    double percent = 0.0;
    std::string message;
    bool finished = false;
    GenerationErrorKind error = GenerationErrorKind::NONE;
    std::string error_message;
    GenerationStrategy strategy = GenerationStrategy::LOCAL;
    bool fallback_used = false;
};

/**
 * @brief Asynchronous generation jobs addressed by an opaque id.
 *
 * Each job owns its coordinator, cancellation token and result; nothing is
 * shared between jobs. Finished jobs are kept for polling until the registry
 * holds more than max_finished_jobs of them, oldest evicted first.
 */
class GenerationJobRegistry
{
public:
    explicit GenerationJobRegistry(CoordinatorFactory factory, size_t max_finished_jobs = 32);
    ~GenerationJobRegistry();

    GenerationJobRegistry(const GenerationJobRegistry &) = delete;
    GenerationJobRegistry &operator=(const GenerationJobRegistry &) = delete;

    std::string start(GenerationRequest request);

    std::optional<GenerationJobSnapshot> status(const std::string &id);

    // The outcome once the job has finished, whatever its result
    std::optional<GenerationOutcome> result(const std::string &id);

    // false when the id is unknown
    bool cancel(const std::string &id);

    size_t activeCount();

    // Cancels every running job and waits for all of them
    void shutdown();

private:
    struct Job
    {
        std::string id;
        CancellationToken cancel;
        std::chrono::steady_clock::time_point created;
        std::unique_ptr<GenerationCoordinator> coordinator;
        std::future<GenerationOutcome> future;

        std::mutex mutex;
        double percent = 0.0;
        std::string message;
        std::optional<GenerationOutcome> outcome;
    };

    CoordinatorFactory factory_;
    size_t max_finished_jobs_;
    std::mutex jobs_mutex_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;

    std::shared_ptr<Job> find(const std::string &id);
    static bool collect(Job &job);
    void evictFinished();
    static std::string newJobId();
};
