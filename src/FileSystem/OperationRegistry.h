/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file OperationRegistry.h
 * @brief Table of in-flight operations addressable by id
 *
 * FileService registers every operation here before validation starts and
 * removes it exactly once when it settles. Membership is held by an
 * ActiveOperation scope; settlement also removes the entry, so a cancelled
 * or timed-out operation leaves the table immediately even while its worker
 * is still unwinding. Both removals are idempotent.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "FileOperationHandle.h"

namespace Palisade::Core::IO {

class OperationRegistry {
public:
    using StatePtr = std::shared_ptr<FileOperationHandle::OpState>;

    /**
     * @brief RAII registration of one operation
     *
     * Move-only. Destruction removes the id from the registry if it is still
     * present.
     */
    class ActiveOperation {
    public:
        ActiveOperation() = default;
        ActiveOperation(OperationRegistry& registry, StatePtr state);
        ~ActiveOperation();

        ActiveOperation(ActiveOperation&& other) noexcept;
        ActiveOperation& operator=(ActiveOperation&& other) noexcept;

        ActiveOperation(const ActiveOperation&) = delete;
        ActiveOperation& operator=(const ActiveOperation&) = delete;

        const StatePtr& state() const noexcept { return _state; }
        void release();

    private:
        OperationRegistry* _registry = nullptr;
        StatePtr _state;
    };

    OperationRegistry() = default;
    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /// Mints an id, arranges removal on settlement, registers state and returns the scope
    ActiveOperation begin(StatePtr state);

    /**
     * @brief Cancels one operation
     * @return false for unknown or already settled ids
     */
    bool cancel(const std::string& id);

    /// Cancels every registered operation; returns how many were settled
    size_t cancelAll();

    bool remove(const std::string& id);
    bool contains(const std::string& id) const;
    size_t size() const;

private:
    std::string nextId();
    static bool cancelState(const StatePtr& state);

    mutable std::mutex _mutex;
    std::unordered_map<std::string, StatePtr> _operations;
    std::atomic<uint64_t> _counter{0};
};

} // namespace Palisade::Core::IO
