#include "client/signed_build_status_client.hpp"
#include "model/build_status.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    string helpText = "statuspost baseUrl projectKey repoSlug revision [OPTIONS]\n\n";
    helpText += "OPTIONS:\n";
    helpText += "-k privateKeyPemFile\n";
    helpText += "-r rootUrl (sent as base-url)\n";
    helpText += "-s state [SUCCESSFUL, FAILED, INPROGRESS, CANCELLED, UNKNOWN] (default: SUCCESSFUL)\n";
    helpText += "-b buildKey\n";
    helpText += "-u buildUrl\n";
    helpText += "-f ref [optional]\n";
    helpText += "-n name [optional]\n";
    helpText += "-d description [optional]\n";
    helpText += "-p parent [optional]\n";
    helpText += "-i buildNumber [optional]\n";
    helpText += "-c supports cancelled state (default: 1)\n";
    helpText += "-a rate limit attempts (default: 3)\n";
    helpText += "-x fail if signing fails (default: 0)\n";

    if (argc < 5) {
        cerr << helpText << endl;
        return -1;
    }

    string keyFile, rootUrl, buildKey, buildUrl;
    string ref, name, description, parent, buildNumber;
    string state = "SUCCESSFUL";
    bool supportsCancelled = true;
    statuspost::client::ClientOptions options;

    for (auto i = 5; i < argc; i++) {
        if ((i + 1) >= argc) {
            cerr << helpText << endl;
            return -1;
        }
        if (!strcmp(argv[i], "-k")) {
            keyFile = argv[++i];
        } else if (!strcmp(argv[i], "-r")) {
            rootUrl = argv[++i];
        } else if (!strcmp(argv[i], "-s")) {
            state = argv[++i];
        } else if (!strcmp(argv[i], "-b")) {
            buildKey = argv[++i];
        } else if (!strcmp(argv[i], "-u")) {
            buildUrl = argv[++i];
        } else if (!strcmp(argv[i], "-f")) {
            ref = argv[++i];
        } else if (!strcmp(argv[i], "-n")) {
            name = argv[++i];
        } else if (!strcmp(argv[i], "-d")) {
            description = argv[++i];
        } else if (!strcmp(argv[i], "-p")) {
            parent = argv[++i];
        } else if (!strcmp(argv[i], "-i")) {
            buildNumber = argv[++i];
        } else if (!strcmp(argv[i], "-c")) {
            supportsCancelled = atoi(argv[++i]);
        } else if (!strcmp(argv[i], "-a")) {
            auto attempts = atoi(argv[++i]);
            if (attempts < 1) {
                cerr << "ERROR: -a needs at least one attempt" << endl;
                return -1;
            }
            options.rateLimitAttempts = static_cast<unsigned>(attempts);
        } else if (!strcmp(argv[i], "-x")) {
            options.signingPolicy = atoi(argv[++i]) ? statuspost::client::SigningPolicy::FailClosed : statuspost::client::SigningPolicy::FailOpen;
        } else {
            cerr << helpText << endl;
            return -1;
        }
    }

    if (keyFile.empty() || rootUrl.empty() || buildKey.empty() || buildUrl.empty()) {
        cerr << helpText << endl;
        return -1;
    }

    try {
        auto client = statuspost::client::SignedBuildStatusClient::makeClient(argv[1], argv[2], argv[3], argv[4], keyFile, rootUrl, supportsCancelled, options);

        statuspost::model::BuildStatus::Builder builder(buildKey, statuspost::model::BuildStatus::parseState(state), buildUrl);
        if (!ref.empty())
            builder.setRef(ref);
        if (!name.empty())
            builder.setName(name);
        if (!description.empty())
            builder.setDescription(description);
        if (!parent.empty())
            builder.setParent(parent);
        if (!buildNumber.empty())
            builder.setBuildNumber(buildNumber);

        client->post(builder, [](const statuspost::model::BuildStatus& status) {
            cout << statuspost::model::BuildStatus::serialize(status) << endl;
        });
    } catch (const exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }

    return 0;
}
//---------------------------------------------------------------------------
