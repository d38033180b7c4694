#include "model/build_status.hpp"
#include "utils/utils.hpp"
#include <sstream>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
BuildState BuildStatus::parseState(string_view name)
// Parse a state name
{
    for (auto state = static_cast<uint8_t>(BuildState::SUCCESSFUL); state <= static_cast<uint8_t>(BuildState::UNKNOWN); state++)
        if (utils::equalsIgnoreCase(name, getStateName(static_cast<BuildState>(state))))
            return static_cast<BuildState>(state);
    throw invalid_argument("Unknown build state: " + string(name));
}
//---------------------------------------------------------------------------
string BuildStatus::serialize(const BuildStatus& status)
// Serialize as json object
{
    stringstream json;
    auto field = [&json](string_view name, string_view value) {
        json << ",\"" << name << "\":\"" << utils::jsonEscape(value) << "\"";
    };

    json << "{\"key\":\"" << utils::jsonEscape(status._key) << "\"";
    field("state", status.getStateName());
    field("url", status._url);
    if (status._ref)
        field("ref", *status._ref);
    if (status._name)
        field("name", *status._name);
    if (status._description)
        field("description", *status._description);
    if (status._parent)
        field("parent", *status._parent);
    if (status._buildNumber)
        field("buildNumber", *status._buildNumber);
    if (status._duration)
        json << ",\"duration\":" << *status._duration;
    if (status._testResults) {
        json << ",\"testResults\":{\"successful\":" << status._testResults->successful;
        json << ",\"failed\":" << status._testResults->failed;
        json << ",\"skipped\":" << status._testResults->skipped << "}";
    }
    json << "}";
    return json.str();
}
//---------------------------------------------------------------------------
BuildStatus::Builder::Builder(string key, BuildState state, string url) : _status(move(key), state, move(url)), _noCancelledState(false)
// The constructor
{
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setKey(string key)
{
    _status._key = move(key);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setState(BuildState state)
{
    _status._state = state;
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setUrl(string url)
{
    _status._url = move(url);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setRef(string ref)
{
    _status._ref = move(ref);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setName(string name)
{
    _status._name = move(name);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setDescription(string description)
{
    _status._description = move(description);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setParent(string parent)
{
    _status._parent = move(parent);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setBuildNumber(string buildNumber)
{
    _status._buildNumber = move(buildNumber);
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setDuration(uint64_t duration)
{
    _status._duration = duration;
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::setTestResults(const TestResults& testResults)
{
    _status._testResults = testResults;
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus::Builder& BuildStatus::Builder::noCancelledState()
{
    _noCancelledState = true;
    return *this;
}
//---------------------------------------------------------------------------
BuildStatus BuildStatus::Builder::build() const
// Validates and copies the status
{
    if (_status._key.empty())
        throw invalid_argument("Build status requires a key");
    if (_status._url.empty())
        throw invalid_argument("Build status requires a url");

    auto status = _status;
    if (_noCancelledState && status._state == BuildState::CANCELLED)
        status._state = BuildState::FAILED;
    return status;
}
//---------------------------------------------------------------------------
} // namespace statuspost::model
