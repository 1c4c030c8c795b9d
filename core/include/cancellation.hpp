#pragma once

#include <atomic>
#include <memory>

namespace core {

    // Read side of a cancellation flag. Default-constructed tokens are never cancelled.
    class CancellationToken {
    public:
        CancellationToken() = default;
        explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
            : flag_(std::move(flag)) {}

        bool isCancelled() const {
            return flag_ && flag_->load(std::memory_order_acquire);
        }

    private:
        std::shared_ptr<const std::atomic<bool>> flag_;
    };

    // Owner side. cancel() is visible to every token handed out.
    class CancellationSource {
    public:
        CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

        CancellationToken token() const { return CancellationToken(flag_); }
        void cancel() { flag_->store(true, std::memory_order_release); }
        bool isCancelled() const { return flag_->load(std::memory_order_acquire); }

    private:
        std::shared_ptr<std::atomic<bool>> flag_;
    };

} // namespace core
