#include "web/generation_jobs.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

GenerationJobRegistry::GenerationJobRegistry(CoordinatorFactory factory, size_t max_finished_jobs)
    : factory_(std::move(factory)), max_finished_jobs_(max_finished_jobs)
{
}

GenerationJobRegistry::~GenerationJobRegistry()
{
    shutdown();
}

std::string GenerationJobRegistry::newJobId()
{
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(rng_mutex);
    std::ostringstream id;
    id << std::hex << std::setfill('0') << std::setw(16) << rng();
    return id.str();
}

std::string GenerationJobRegistry::start(GenerationRequest request)
{
    auto job = std::make_shared<Job>();
    job->created = std::chrono::steady_clock::now();
    job->coordinator = factory_();
    job->message = "Queued";

    std::weak_ptr<Job> weak_job = job;
    ProgressCallback on_progress = [weak_job](double percent, const std::string &message)
    {
        if (auto running = weak_job.lock())
        {
            std::lock_guard<std::mutex> lock(running->mutex);
            running->percent = percent;
            running->message = message;
        }
    };

    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        do
        {
            job->id = newJobId();
        } while (jobs_.count(job->id) > 0);
        jobs_[job->id] = job;
    }

    Logger::info("Starting generation job " + job->id + " for '" + request.model.title + "'");
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->future = job->coordinator->generateAsync(std::move(request), std::move(on_progress), job->cancel);
    }

    evictFinished();
    return job->id;
}

std::shared_ptr<GenerationJobRegistry::Job> GenerationJobRegistry::find(const std::string &id)
{
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

bool GenerationJobRegistry::collect(Job &job)
{
    std::lock_guard<std::mutex> lock(job.mutex);
    if (!job.outcome && job.future.valid() &&
        job.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
    {
        job.outcome = job.future.get();
    }
    return job.outcome.has_value();
}

std::optional<GenerationJobSnapshot> GenerationJobRegistry::status(const std::string &id)
{
    auto job = find(id);
    if (!job)
    {
        return std::nullopt;
    }

    const bool finished = collect(*job);

    GenerationJobSnapshot snapshot;
    snapshot.id = job->id;
    snapshot.state = job->coordinator->state();
    snapshot.finished = finished;

    std::lock_guard<std::mutex> lock(job->mutex);
    snapshot.percent = job->percent;
    snapshot.message = job->message;
    if (finished)
    {
        snapshot.error = job->outcome->error;
        snapshot.error_message = job->outcome->error_message;
        snapshot.strategy = job->outcome->strategy;
        snapshot.fallback_used = job->outcome->fallback_used;
    }
    return snapshot;
}

std::optional<GenerationOutcome> GenerationJobRegistry::result(const std::string &id)
{
    auto job = find(id);
    if (!job || !collect(*job))
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->outcome;
}

bool GenerationJobRegistry::cancel(const std::string &id)
{
    auto job = find(id);
    if (!job)
    {
        return false;
    }
    job->cancel.cancel();
    Logger::info("Cancellation requested for generation job " + id);
    return true;
}

size_t GenerationJobRegistry::activeCount()
{
    std::vector<std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (const auto &entry : jobs_)
            jobs.push_back(entry.second);
    }

    size_t active = 0;
    for (const auto &job : jobs)
    {
        if (!collect(*job))
            ++active;
    }
    return active;
}

void GenerationJobRegistry::evictFinished()
{
    std::vector<std::shared_ptr<Job>> finished;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (const auto &entry : jobs_)
        {
            if (collect(*entry.second))
                finished.push_back(entry.second);
        }
    }
    if (finished.size() <= max_finished_jobs_)
    {
        return;
    }

    std::sort(finished.begin(), finished.end(), [](const std::shared_ptr<Job> &a, const std::shared_ptr<Job> &b)
              { return a->created < b->created; });
    const size_t excess = finished.size() - max_finished_jobs_;

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (size_t i = 0; i < excess; ++i)
    {
        jobs_.erase(finished[i]->id);
        Logger::debug("Evicted finished generation job " + finished[i]->id);
    }
}

void GenerationJobRegistry::shutdown()
{
    std::map<std::string, std::shared_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs.swap(jobs_);
    }
    for (auto &entry : jobs)
    {
        entry.second->cancel.cancel();
    }
    // No lock here: running jobs take the job mutex to report progress
    for (auto &entry : jobs)
    {
        if (entry.second->future.valid())
            entry.second->future.wait();
    }
    if (!jobs.empty())
    {
        Logger::info("Generation job registry shut down, " + std::to_string(jobs.size()) + " jobs released");
    }
}
