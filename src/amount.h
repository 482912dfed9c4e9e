// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_AMOUNT_H
#define MINTSUITE_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

/** Amount in wei. Unsigned 256-bit, wraps on underflow: check before subtracting. */
typedef boost::multiprecision::uint256_t CAmount;

static const CAmount WEI = 1;
static const CAmount GWEI = 1000000000ULL;
static const CAmount ETHER = 1000000000000000000ULL;

/** Number of decimals used when formatting an amount */
static const int AMOUNT_DECIMALS = 18;

#endif // MINTSUITE_AMOUNT_H
