#include "client/key_provider.hpp"
#include <fstream>
#include <iterator>
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
using namespace std;
//---------------------------------------------------------------------------
PrivateKey::PrivateKey(utils::EVPKey key) : _key(move(key))
// The constructor
{
    _algorithm = utils::keyAlgorithm(_key.get());
}
//---------------------------------------------------------------------------
PrivateKey PrivateKey::fromPem(const string& pem)
// Reads the key
{
    return PrivateKey(utils::readPrivateKey(reinterpret_cast<const uint8_t*>(pem.data()), pem.size()));
}
//---------------------------------------------------------------------------
const PrivateKey& FileKeyProvider::getPrivate()
// Gets the key from the keyfile
{
    lock_guard<mutex> lock(_mutex);
    if (!_key) {
        ifstream ifs(_keyFile);
        if (!ifs)
            throw utils::SigningError("Could not open key file " + _keyFile);
        string pem((istreambuf_iterator<char>(ifs)), (istreambuf_iterator<char>()));
        _key = make_unique<PrivateKey>(PrivateKey::fromPem(pem));
    }
    return *_key;
}
//---------------------------------------------------------------------------
} // namespace statuspost::client
