#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include "Reader.hpp"
#include "chunkfeed/core/sync/Mutex.hpp"

namespace cfd::io {

/**
 * @brief Reader sharing one inner reader behind a mutex
 *
 * Copies share the same inner reader. Every read() holds the lock for its
 * whole duration, producer calls included, so concurrent reads never
 * interleave within a single call.
 */
template<typename ReaderT, typename MutexT = std::mutex>
class GuardedReader: public Reader {
public:
    using Guarded = sync::Mutex<ReaderT, MutexT>;

    explicit GuardedReader(std::shared_ptr<Guarded> guarded) : guarded_(std::move(guarded)) {}

    explicit GuardedReader(ReaderT&& reader)
        : guarded_(std::make_shared<Guarded>(std::move(reader))) {}

    nonstd::span<uint8_t> read(nonstd::span<uint8_t> buf) override {
        auto inner = guarded_->lock();
        return inner->read(buf);
    }

    const std::shared_ptr<Guarded>& guarded() const {
        return guarded_;
    }

private:
    std::shared_ptr<Guarded> guarded_;
};

} // namespace cfd::io
