#pragma once

#include <atomic>
#include <memory>

namespace onova {

class CancelSource;

// Cheap copyable view of a cancellation flag. A default-constructed token is
// never cancelled.
class CancelToken {
  public:
    CancelToken() = default;

    bool IsCancelled() const {
        return flag_ && flag_->load(std::memory_order_relaxed);
    }

  private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<const std::atomic_bool> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic_bool> flag_;
};

class CancelSource {
  public:
    CancelSource() : flag_(std::make_shared<std::atomic_bool>(false)) {}

    void Cancel() { flag_->store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return flag_->load(std::memory_order_relaxed); }
    CancelToken Token() const { return CancelToken(flag_); }

  private:
    std::shared_ptr<std::atomic_bool> flag_;
};

} // namespace onova
