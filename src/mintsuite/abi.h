// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_ABI_H
#define MINTSUITE_ABI_H

/**
 * @file abi.h
 * @brief 32-byte word packing for raw contract return data
 *
 * Raw return data is a sequence of big-endian 32-byte words. Addresses
 * occupy the low 20 bytes of a word.
 */

#include <amount.h>
#include <uint256.h>

#include <cstddef>
#include <vector>

namespace mintsuite {
namespace abi {

/** Size of one word in bytes */
static constexpr size_t WORD_SIZE = 32;

typedef std::vector<unsigned char> Bytes;

void AppendUint(Bytes& out, const CAmount& value);
void AppendAddress(Bytes& out, const uint160& addr);

/** Number of whole words in data; data with a partial word is rejected by callers */
inline size_t WordCount(const Bytes& data) { return data.size() / WORD_SIZE; }

/**
 * @brief Decode word `index` as an unsigned integer
 * @throws RevertError if the word is out of range
 */
CAmount DecodeUint(const Bytes& data, size_t index);

/**
 * @brief Decode word `index` as an address
 * @throws RevertError if the word is out of range or has dirty high bytes
 */
uint160 DecodeAddress(const Bytes& data, size_t index);

} // namespace abi
} // namespace mintsuite

#endif // MINTSUITE_ABI_H
