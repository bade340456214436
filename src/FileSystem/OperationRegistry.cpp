/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "OperationRegistry.h"
#include <chrono>

namespace Palisade::Core::IO {

OperationRegistry::ActiveOperation::ActiveOperation(OperationRegistry& registry, StatePtr state)
    : _registry(&registry), _state(std::move(state)) {}

OperationRegistry::ActiveOperation::~ActiveOperation() {
    release();
}

OperationRegistry::ActiveOperation::ActiveOperation(ActiveOperation&& other) noexcept
    : _registry(other._registry), _state(std::move(other._state)) {
    other._registry = nullptr;
}

OperationRegistry::ActiveOperation&
OperationRegistry::ActiveOperation::operator=(ActiveOperation&& other) noexcept {
    if (this != &other) {
        release();
        _registry = other._registry;
        _state = std::move(other._state);
        other._registry = nullptr;
    }
    return *this;
}

void OperationRegistry::ActiveOperation::release() {
    if (_registry && _state) {
        _registry->remove(_state->id);
    }
    _registry = nullptr;
    _state.reset();
}

std::string OperationRegistry::nextId() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "op-" + std::to_string(millis) + "-" + std::to_string(++_counter);
}

OperationRegistry::ActiveOperation OperationRegistry::begin(StatePtr state) {
    state->id = nextId();
    // Set before the entry is visible so a concurrent cancelAll() settles a complete state
    state->onSettled = [this, id = state->id] { remove(id); };
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _operations.emplace(state->id, state);
    }
    return ActiveOperation(*this, std::move(state));
}

bool OperationRegistry::cancelState(const StatePtr& state) {
    // Settle first so the outcome reads Cancelled, then wake the worker
    FileErrorInfo info{ErrorKind::FileProcessing, FileError::Cancelled, "Operation cancelled"};
    bool settled = state->settle(FileOpStatus::Cancelled, std::move(info));
    state->cancellation.cancel();
    return settled;
}

bool OperationRegistry::cancel(const std::string& id) {
    StatePtr state;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _operations.find(id);
        if (it == _operations.end()) {
            return false;
        }
        state = it->second;
    }
    // Settlement runs onSettled, which re-enters remove(); keep the lock released
    return cancelState(state);
}

size_t OperationRegistry::cancelAll() {
    std::vector<StatePtr> states;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        states.reserve(_operations.size());
        for (const auto& [id, state] : _operations) {
            states.push_back(state);
        }
    }
    size_t settled = 0;
    for (const auto& state : states) {
        if (cancelState(state)) {
            ++settled;
        }
    }
    return settled;
}

bool OperationRegistry::remove(const std::string& id) {
    StatePtr removed;
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _operations.find(id);
    if (it == _operations.end()) {
        return false;
    }
    removed = std::move(it->second);
    _operations.erase(it);
    return true;
}

bool OperationRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _operations.count(id) != 0;
}

size_t OperationRegistry::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _operations.size();
}

} // namespace Palisade::Core::IO
