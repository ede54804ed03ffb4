// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <fuelcall/core/assert.h>
#include <fuelcall/core/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

FUELCALL_NAMESPACE_BEGIN

sha256_hash_t sha256(byte_string_view const data)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> const ctx{
        EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    FUELCALL_ASSERT(ctx != nullptr);
    FUELCALL_ASSERT(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1);
    FUELCALL_ASSERT(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1);

    sha256_hash_t hash;
    unsigned int len = 0;
    FUELCALL_ASSERT(EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) == 1);
    FUELCALL_ASSERT(len == SHA256_SIZE);
    return hash;
}

FUELCALL_NAMESPACE_END
