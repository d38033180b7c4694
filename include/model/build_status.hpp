#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::model {
//---------------------------------------------------------------------------
/// The state of a build as understood by the server
enum class BuildState : uint8_t {
    SUCCESSFUL,
    FAILED,
    INPROGRESS,
    CANCELLED,
    UNKNOWN
};
//---------------------------------------------------------------------------
/// The test summary of a build
struct TestResults {
    /// Successful tests
    uint32_t successful = 0;
    /// Failed tests
    uint32_t failed = 0;
    /// Skipped tests
    uint32_t skipped = 0;
};
//---------------------------------------------------------------------------
/// An immutable build status, created by the Builder
class BuildStatus {
    public:
    class Builder;

    private:
    /// The build key
    std::string _key;
    /// The state
    BuildState _state;
    /// The link back to the build
    std::string _url;
    /// The branch or tag reference
    std::optional<std::string> _ref;
    /// The display name
    std::optional<std::string> _name;
    /// The description
    std::optional<std::string> _description;
    /// The parent build key
    std::optional<std::string> _parent;
    /// The build number
    std::optional<std::string> _buildNumber;
    /// The duration in milliseconds
    std::optional<uint64_t> _duration;
    /// The test results
    std::optional<TestResults> _testResults;

    /// The constructor, only the builder creates statuses
    BuildStatus(std::string key, BuildState state, std::string url) : _key(std::move(key)), _state(state), _url(std::move(url)) {}

    public:
    /// Get the state name
    static constexpr std::string_view getStateName(const BuildState& state) {
        switch (state) {
            case BuildState::SUCCESSFUL: return "SUCCESSFUL";
            case BuildState::FAILED: return "FAILED";
            case BuildState::INPROGRESS: return "INPROGRESS";
            case BuildState::CANCELLED: return "CANCELLED";
            case BuildState::UNKNOWN: return "UNKNOWN";
            default: return "";
        }
    }
    /// Parse a state name, throws std::invalid_argument for unknown names
    [[nodiscard]] static BuildState parseState(std::string_view name);

    [[nodiscard]] const std::string& getKey() const { return _key; }
    [[nodiscard]] BuildState getState() const { return _state; }
    [[nodiscard]] std::string_view getStateName() const { return getStateName(_state); }
    [[nodiscard]] const std::string& getUrl() const { return _url; }
    [[nodiscard]] const std::optional<std::string>& getRef() const { return _ref; }
    [[nodiscard]] const std::optional<std::string>& getName() const { return _name; }
    [[nodiscard]] const std::optional<std::string>& getDescription() const { return _description; }
    [[nodiscard]] const std::optional<std::string>& getParent() const { return _parent; }
    [[nodiscard]] const std::optional<std::string>& getBuildNumber() const { return _buildNumber; }
    [[nodiscard]] const std::optional<uint64_t>& getDuration() const { return _duration; }
    [[nodiscard]] const std::optional<TestResults>& getTestResults() const { return _testResults; }

    /// Serialize as json request body, absent fields are omitted
    [[nodiscard]] static std::string serialize(const BuildStatus& status);
};
//---------------------------------------------------------------------------
/// Collects the fields of a build status until it is finalized
class BuildStatus::Builder {
    /// The status under construction
    BuildStatus _status;
    /// Report cancelled builds as failed
    bool _noCancelledState;

    public:
    /// The constructor with the required fields
    Builder(std::string key, BuildState state, std::string url);

    Builder& setKey(std::string key);
    Builder& setState(BuildState state);
    Builder& setUrl(std::string url);
    Builder& setRef(std::string ref);
    Builder& setName(std::string name);
    Builder& setDescription(std::string description);
    Builder& setParent(std::string parent);
    Builder& setBuildNumber(std::string buildNumber);
    Builder& setDuration(uint64_t duration);
    Builder& setTestResults(const TestResults& testResults);
    /// The server cannot represent CANCELLED, build() maps it to FAILED
    Builder& noCancelledState();

    /// Finalize the status, throws std::invalid_argument if a required field is empty
    [[nodiscard]] BuildStatus build() const;
};
//---------------------------------------------------------------------------
} // namespace statuspost::model
