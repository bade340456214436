/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

#include "CoreCommon.h"
#include <atomic>

namespace Palisade {
    namespace Core {

        /**
         * @brief Lifecycle states for a PalisadeService instance.
         */
        enum class ServiceState {
            Registered,
            Loaded,
            Started,
            Stopped,
            Unloaded
        };

        /**
         * @brief Base interface for the long-lived services of the gateway.
         *
         * Services are constructed explicitly by a composition root (see Gateway)
         * and handed to their dependents by reference; there are no global
         * accessors. Heavy initialization belongs in load()/start(), and stop()
         * must be safe to call more than once.
         */
        class PalisadeService {
        public:
            virtual ~PalisadeService() = default;

            // Identity (metadata only; not used for lookups)
            virtual const char* id() const = 0;    // stable unique id, e.g. "com.palisade.core.files"
            virtual const char* name() const = 0;  // human readable

            virtual const char* version() const { return "0.1.0"; }

            // Lifecycle hooks, driven by the owner in dependency order
            virtual void load() { setState(ServiceState::Loaded); }
            virtual void start() { setState(ServiceState::Started); }
            virtual void stop() { setState(ServiceState::Stopped); }
            virtual void unload() { setState(ServiceState::Unloaded); }

            ServiceState state() const noexcept { return _state.load(std::memory_order_acquire); }
            bool isRunning() const noexcept { return state() == ServiceState::Started; }

        protected:
            void setState(ServiceState s) noexcept { _state.store(s, std::memory_order_release); }

        private:
            std::atomic<ServiceState> _state{ServiceState::Registered};
        };

    } // namespace Core
} // namespace Palisade
