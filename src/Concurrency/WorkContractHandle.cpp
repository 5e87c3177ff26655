/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "WorkContractHandle.h"
#include "WorkContractGroup.h"
#include <format>

namespace TwinPane {
namespace Core {
namespace Concurrency {

    ScheduleResult WorkContractHandle::schedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->scheduleContract(*this);
    }

    ScheduleResult WorkContractHandle::unschedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->unscheduleContract(*this);
    }

    bool WorkContractHandle::valid() const {
        return _owner && _owner->isValidHandle(*this);
    }

    bool WorkContractHandle::release() {
        const bool released = _owner && _owner->releaseContract(*this);
        // Clear identity to make subsequent calls fast no-ops
        _owner = nullptr;
        _index = 0;
        _generation = 0;
        return released;
    }

    bool WorkContractHandle::isScheduled() const {
        if (!_owner) return false;
        return _owner->getContractState(*this) == ContractState::Scheduled;
    }

    bool WorkContractHandle::isExecuting() const {
        if (!_owner) return false;
        return _owner->getContractState(*this) == ContractState::Executing;
    }

    std::string WorkContractHandle::toString() const {
        if (_owner) {
            return std::format("WorkContractHandle(owner={}, idx={}, gen={})",
                               static_cast<const void*>(_owner), _index, _generation);
        }
        return "WorkContractHandle(invalid)";
    }

} // namespace Concurrency
} // namespace Core
} // namespace TwinPane
