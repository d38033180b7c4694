#pragma once
#include "model/build_status.hpp"
#include <functional>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::client {
//---------------------------------------------------------------------------
/// Posts build statuses for one commit
class BuildStatusClient {
    public:
    /// Called with the finalized status before anything is sent
    using BeforePost = std::function<void(const model::BuildStatus&)>;

    /// Finalize and post the status
    virtual void post(model::BuildStatus::Builder& statusBuilder, const BeforePost& beforePost) = 0;
    /// The destructor
    virtual ~BuildStatusClient() noexcept = default;
};
//---------------------------------------------------------------------------
} // namespace statuspost::client
