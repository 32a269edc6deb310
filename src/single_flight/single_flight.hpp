#ifndef SINGLE_FLIGHT_HPP
#define SINGLE_FLIGHT_HPP

#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>

namespace single_flight
{

    // Compute-once cell. The first caller runs the computation; callers arriving
    // while it runs wait on the same shared future and get its value or its
    // exception. Only a successful result is cached, so a failed run leaves the
    // cell empty for the next caller.
    template <typename T>
    class SingleFlight
    {
    public:
        T get(const std::function<T()> &compute)
        {
            std::promise<T> promise;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (value_)
                {
                    return *value_;
                }
                if (inflight_.valid())
                {
                    std::shared_future<T> pending = inflight_;
                    lock.unlock();
                    return pending.get();
                }
                inflight_ = promise.get_future().share();
            }

            try
            {
                T result = compute();
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    value_ = result;
                    inflight_ = std::shared_future<T>();
                }
                promise.set_value(result);
                return result;
            }
            catch (...)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    inflight_ = std::shared_future<T>();
                }
                promise.set_exception(std::current_exception());
                throw;
            }
        }

        std::optional<T> peek() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return value_;
        }

        // Replaces the cached value. Has no effect on a computation in flight.
        void set(const T &value)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_ = value;
        }

    private:
        mutable std::mutex mutex_;
        std::optional<T> value_;
        std::shared_future<T> inflight_;
    };

} // namespace single_flight

#endif // SINGLE_FLIGHT_HPP
