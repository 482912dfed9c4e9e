// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/abi.h>
#include <mintsuite/chain.h>

#include <algorithm>

namespace mintsuite {
namespace abi {

void AppendUint(Bytes& out, const CAmount& value)
{
    size_t offset = out.size();
    out.resize(offset + WORD_SIZE, 0);
    CAmount remaining = value;
    for (size_t i = 0; i < WORD_SIZE && remaining != 0; ++i) {
        out[offset + WORD_SIZE - 1 - i] = static_cast<unsigned char>(static_cast<unsigned int>(remaining & 0xff));
        remaining >>= 8;
    }
}

void AppendAddress(Bytes& out, const uint160& addr)
{
    size_t offset = out.size();
    out.resize(offset + WORD_SIZE, 0);
    std::copy(addr.begin(), addr.end(), out.begin() + offset + (WORD_SIZE - uint160::size()));
}

CAmount DecodeUint(const Bytes& data, size_t index)
{
    Require((index + 1) * WORD_SIZE <= data.size(), "ABI: word out of range");
    CAmount value = 0;
    const size_t offset = index * WORD_SIZE;
    for (size_t i = 0; i < WORD_SIZE; ++i) {
        value <<= 8;
        value |= data[offset + i];
    }
    return value;
}

uint160 DecodeAddress(const Bytes& data, size_t index)
{
    Require((index + 1) * WORD_SIZE <= data.size(), "ABI: word out of range");
    const size_t offset = index * WORD_SIZE;
    const size_t padding = WORD_SIZE - uint160::size();
    for (size_t i = 0; i < padding; ++i) {
        Require(data[offset + i] == 0, "ABI: invalid address word");
    }
    return uint160(Bytes(data.begin() + offset + padding, data.begin() + offset + WORD_SIZE));
}

} // namespace abi
} // namespace mintsuite
