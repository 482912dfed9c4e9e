// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef MINTSUITE_UTILMONEYSTR_H
#define MINTSUITE_UTILMONEYSTR_H

#include <amount.h>

#include <string>

/** Format a wei amount as a decimal ether string, e.g. "0.55". */
std::string FormatMoney(const CAmount& n);

/** Parse a decimal ether string into wei. Returns false on malformed input. */
bool ParseMoney(const std::string& str, CAmount& nRet);

#endif // MINTSUITE_UTILMONEYSTR_H
