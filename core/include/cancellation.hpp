#pragma once

#include <atomic>
#include <memory>

namespace core {

    // Cooperative cancellation flag. Copies share the same state, so the owner keeps one
    // copy to call cancel() on while the engine polls another.
    class CancellationToken {
    public:
        CancellationToken() : requested_(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const noexcept { requested_->store(true, std::memory_order_release); }

        bool isCancellationRequested() const noexcept {
            return requested_->load(std::memory_order_acquire);
        }

        // Throws OperationCancelledException when cancellation has been requested
        void throwIfCancellationRequested() const;

    private:
        std::shared_ptr<std::atomic<bool>> requested_;
    };

} // namespace core
