/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file CancellationToken.h
 * @brief Cooperative cancellation flag shared between a controller and its workers
 *
 * The source owns the flag and requests cancellation; tokens are cheap copies that
 * workers poll between units of work.
 *
 * @code
 * CancellationSource source;
 * auto token = source.token();
 * manager.copyItems(items, dest, resolver, sink, token);
 * // from a UI thread
 * source.cancel();
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>

namespace TwinPane {
namespace Core {
namespace Concurrency {

    class CancellationToken {
    public:
        // A default token can never be cancelled
        CancellationToken() = default;

        bool isCancellationRequested() const noexcept {
            return _state && _state->requested.load(std::memory_order_acquire);
        }

        bool canBeCancelled() const noexcept { return _state != nullptr; }

    private:
        struct State {
            std::atomic<bool> requested{false};
        };

        explicit CancellationToken(std::shared_ptr<State> state) : _state(std::move(state)) {}

        std::shared_ptr<State> _state;

        friend class CancellationSource;
    };

    class CancellationSource {
    public:
        CancellationSource() : _state(std::make_shared<CancellationToken::State>()) {}

        void cancel() noexcept { _state->requested.store(true, std::memory_order_release); }
        bool isCancellationRequested() const noexcept { return _state->requested.load(std::memory_order_acquire); }

        CancellationToken token() const { return CancellationToken(_state); }

        // Detaches previously issued tokens and starts a fresh flag
        void reset() { _state = std::make_shared<CancellationToken::State>(); }

    private:
        std::shared_ptr<CancellationToken::State> _state;
    };

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane
