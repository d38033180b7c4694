#pragma once
#include <string>
#include <utility>
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
/// Supplies the externally reachable root url of the CI deployment
class RootUrlProvider {
    public:
    /// Get the root url
    [[nodiscard]] virtual std::string getRoot() const = 0;
    /// The destructor
    virtual ~RootUrlProvider() noexcept = default;
};
//---------------------------------------------------------------------------
/// A configured root url
class StaticRootUrlProvider : public RootUrlProvider {
    /// The root url
    std::string _root;

    public:
    /// The constructor
    explicit StaticRootUrlProvider(std::string root) : _root(std::move(root)) {}

    /// Get the root url
    [[nodiscard]] std::string getRoot() const override { return _root; }
};
//---------------------------------------------------------------------------
} // namespace statuspost::client
