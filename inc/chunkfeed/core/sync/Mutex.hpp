#pragma once

#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace cfd::sync
{

template <typename T, typename MutexT>
class Locked;

/**
 * @brief Owns a T that can only be reached while holding the mutex
 */
template <typename T, typename MutexT = std::mutex>
class Mutex
{
public:
    template <typename... Args, std::enable_if_t<std::is_constructible_v<T, Args...>, int> = 0>
    explicit Mutex(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
        : data_(std::forward<Args>(args)...)
    {
    }

    Locked<T, MutexT> lock() noexcept
    {
        return Locked<T, MutexT>(&data_, std::unique_lock<MutexT>(mutex_));
    }

    // std::nullopt if the mutex is held elsewhere
    std::optional<Locked<T, MutexT>> try_lock() noexcept
    {
        std::unique_lock<MutexT> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) {
            return std::nullopt;
        }
        return Locked<T, MutexT>(&data_, std::move(lock));
    }

    MutexT& mutex()
    {
        return mutex_;
    }

    ~Mutex() = default;

    Mutex(const Mutex& s) = delete;
    Mutex(Mutex&& s)      = delete;

    Mutex& operator=(const Mutex& other) = delete;
    Mutex& operator=(Mutex&& other)      = delete;

private:
    T data_;
    mutable MutexT mutex_;
};

/**
 * @brief Scoped access to the data of a Mutex. Unlocks on destruction.
 */
template <typename T, typename MutexT>
class Locked
{
public:
    friend class Mutex<T, MutexT>;

    T* operator->() noexcept
    {
        return locked_data_;
    }

    T& operator*() noexcept
    {
        return *locked_data_;
    }

    const T* operator->() const noexcept
    {
        return locked_data_;
    }

    const T& operator*() const noexcept
    {
        return *locked_data_;
    }

private:
    Locked(T* locked_data, std::unique_lock<MutexT>&& lock) noexcept
        : lock_(std::move(lock)),
          locked_data_(locked_data)
    {
    }

    std::unique_lock<MutexT> lock_;
    T* locked_data_;
};

}  // namespace cfd::sync
