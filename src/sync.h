// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_SYNC_H
#define MINTSUITE_SYNC_H

#include <mutex>

/**
 * Wrapped mutex: supports recursive locking, since a ledger transaction
 * re-enters contracts (and therefore their locks) from nested call frames.
 */
typedef std::recursive_mutex CCriticalSection;

typedef std::unique_lock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)
#define LOCK2(cs1, cs2) CCriticalBlock criticalblock1(cs1); CCriticalBlock criticalblock2(cs2)

#endif // MINTSUITE_SYNC_H
