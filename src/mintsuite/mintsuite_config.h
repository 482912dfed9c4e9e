// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTSUITE_CONFIG_H
#define MINTSUITE_MINTSUITE_CONFIG_H

/**
 * @file mintsuite_config.h
 * @brief Minter suite configuration and initialization
 *
 * This file provides functions for configuring the minter suite
 * based on command-line arguments and config file.
 */

#include <string>

namespace mintsuite {

// Default values for minter suite configuration
static const char* const DEFAULT_NETWORK = "main";

/**
 * Get minter suite help message for command-line options
 * @return Help message string
 */
std::string GetMintSuiteHelpMessage();

/**
 * Initialize minter suite configuration from gArgs
 * Selects network parameters and applies overrides.
 * @param[out] error Reason on failure
 * @return true if initialization successful
 */
bool InitMintSuiteConfig(std::string& error);

} // namespace mintsuite

#endif // MINTSUITE_MINTSUITE_CONFIG_H
