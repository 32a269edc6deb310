#pragma once

#include <atomic>
#include "../errors/errors.hpp"

namespace cancellation
{
    // Cooperative cancellation flag shared between a running traversal and its owner.
    class CancellationToken
    {
    public:
        CancellationToken() : cancelled_(false) {}

        void cancel() { cancelled_.store(true); }
        void reset() { cancelled_.store(false); }
        bool isCancelled() const { return cancelled_.load(); }

        void throwIfCancelled() const
        {
            if (isCancelled())
                throw errors::FingerprintCancelled();
        }

    private:
        std::atomic<bool> cancelled_;
    };

    // Clears the token when the scope ends, however it ends.
    class ResetOnExit
    {
    public:
        explicit ResetOnExit(CancellationToken &token) : token_(token) {}
        ~ResetOnExit() { token_.reset(); }

        ResetOnExit(const ResetOnExit &) = delete;
        ResetOnExit &operator=(const ResetOnExit &) = delete;

    private:
        CancellationToken &token_;
    };
}
