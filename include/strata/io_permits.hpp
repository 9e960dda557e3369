#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace strata {

// Counting permit pool bounding concurrent link and unlink work across every
// installer sharing it. acquire() blocks until a permit is free.
class IoPermitPool {
public:
    // Returns its permit to the pool on destruction
    class Permit {
    public:
        Permit(Permit&& o) noexcept : pool_(o.pool_) { o.pool_ = nullptr; }
        Permit& operator=(Permit&&) = delete;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

    private:
        friend class IoPermitPool;
        explicit Permit(IoPermitPool* pool) : pool_(pool) {}

        IoPermitPool* pool_;
    };

    // A pool of zero permits would block forever; it is raised to one
    explicit IoPermitPool(size_t permits);

    IoPermitPool(const IoPermitPool&) = delete;
    IoPermitPool& operator=(const IoPermitPool&) = delete;

    Permit acquire();

    size_t capacity() const { return capacity_; }

private:
    void release();

    size_t capacity_;
    size_t available_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace strata
