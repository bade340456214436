/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "CancellationToken.h"
#include "Errors.h"

namespace Palisade {
namespace Core {

void CancellationToken::throwIfCancelled() const {
    if (isCancellationRequested()) {
        throw FileProcessingError("Operation cancelled");
    }
}

bool CancellationToken::onCancel(std::function<void()> callback) const {
    if (!_state || !callback) return false;
    {
        std::lock_guard<std::mutex> lock(_state->callbacksMutex);
        if (!_state->cancelled.load(std::memory_order_acquire)) {
            _state->callbacks.push_back(std::move(callback));
            return true;
        }
    }
    // Already cancelled - honour the registration immediately
    callback();
    return true;
}

CancellationSource::CancellationSource()
    : _state(std::make_shared<detail::CancellationState>()) {
}

bool CancellationSource::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(_state->callbacksMutex);
        bool expected = false;
        if (!_state->cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        callbacks.swap(_state->callbacks);
    }
    for (auto& cb : callbacks) {
        cb();
    }
    return true;
}

} // namespace Core
} // namespace Palisade
