/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

/**
 * @file CancellationToken.h
 * @brief Cooperative cancellation shared between an operation and its owner
 *
 * A CancellationSource owns the right to cancel; any number of
 * CancellationTokens observe it. Work checks the token at its suspension
 * points (between chunks, before each filesystem call) and unwinds through
 * RAII when cancellation was requested, so open streams close on the same
 * path as a normal return.
 *
 * @code
 * CancellationSource source;
 * auto token = source.token();
 * work.submit([token] {
 *     for (auto& chunk : chunks) {
 *         token.throwIfCancelled();
 *         write(chunk);
 *     }
 * });
 * source.cancel();
 * @endcode
 */

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Palisade {
namespace Core {

    namespace detail {
        struct CancellationState {
            std::atomic<bool> cancelled{false};
            std::mutex callbacksMutex;
            std::vector<std::function<void()>> callbacks;
        };
    }

    class CancellationToken {
    public:
        /**
         * @brief A token that can never be cancelled
         */
        CancellationToken() = default;

        bool isCancellationRequested() const noexcept {
            return _state && _state->cancelled.load(std::memory_order_acquire);
        }

        bool canBeCancelled() const noexcept { return static_cast<bool>(_state); }

        /**
         * @brief Throws FileProcessingError("Operation cancelled") if cancelled
         */
        void throwIfCancelled() const;

        /**
         * @brief Runs callback once when the source is cancelled
         *
         * If cancellation already happened the callback runs immediately on
         * the calling thread. Returns false for tokens that can never be
         * cancelled (the callback is dropped).
         */
        bool onCancel(std::function<void()> callback) const;

    private:
        friend class CancellationSource;
        explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
            : _state(std::move(state)) {}

        std::shared_ptr<detail::CancellationState> _state;
    };

    class CancellationSource {
    public:
        CancellationSource();

        CancellationToken token() const { return CancellationToken(_state); }

        /**
         * @brief Requests cancellation; returns true only for the first call
         *
         * Registered callbacks run on the calling thread, outside any lock.
         */
        bool cancel();

        bool isCancellationRequested() const noexcept {
            return _state->cancelled.load(std::memory_order_acquire);
        }

    private:
        std::shared_ptr<detail::CancellationState> _state;
    };

} // namespace Core
} // namespace Palisade
