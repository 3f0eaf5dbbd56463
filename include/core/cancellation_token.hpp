#pragma once

#include <atomic>
#include <memory>

/**
 * @brief Cooperative cancellation flag shared between a caller and one generation run.
 *
 * Copies share the same flag, so the caller keeps one copy as the cancel handle
 * and passes another through every pipeline stage. Stages poll isCancelled()
 * at batch boundaries and before starting network I/O.
 */
class CancellationToken
{
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool isCancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};
