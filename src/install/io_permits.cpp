#include <strata/io_permits.hpp>

namespace strata {

IoPermitPool::IoPermitPool(size_t permits)
    : capacity_(permits == 0 ? 1 : permits), available_(capacity_) {}

IoPermitPool::Permit IoPermitPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return available_ > 0; });
    --available_;
    return Permit(this);
}

void IoPermitPool::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}

IoPermitPool::Permit::~Permit() {
    if (pool_) pool_->release();
}

} // namespace strata
