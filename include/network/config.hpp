#pragma once
#include <chrono>
#include <cstdint>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::network {
//---------------------------------------------------------------------------
/// Config for retrying requests that were answered with 429 Too Many Requests
struct RetryOnRateLimitConfig {
    /// Default number of attempts, including the first one
    static constexpr unsigned defaultMaxAttempts = 3;
    /// Default wait before the first retry if the server sends no Retry-After
    static constexpr std::chrono::milliseconds defaultInitialBackoff{1000};
    /// Default upper bound of a single wait
    static constexpr std::chrono::milliseconds defaultMaxBackoff{30000};

    /// Total attempts
    unsigned maxAttempts = defaultMaxAttempts;
    /// The first wait, doubled on every retry
    std::chrono::milliseconds initialBackoff = defaultInitialBackoff;
    /// The maximum wait
    std::chrono::milliseconds maxBackoff = defaultMaxBackoff;

    /// Get the wait before the given retry (1 based) without server hint
    constexpr std::chrono::milliseconds backoff(unsigned retry) const {
        auto wait = initialBackoff;
        for (auto i = 1u; i < retry && wait < maxBackoff; i++)
            wait *= 2;
        return wait < maxBackoff ? wait : maxBackoff;
    }
};
//---------------------------------------------------------------------------
} // namespace statuspost::network
