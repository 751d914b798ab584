#pragma once

/** \file deltachain.hpp
 *  \brief Umbrella header.
 *
 *  Includes the public interfaces:
 *   - Byte sources (io/byte_source.hpp)
 *   - Header line scanning and extraction (header/line_scanner.hpp, header/header_extractor.hpp)
 *   - Chain validation (chain/chain_validator.hpp, chain/directory.hpp)
 *   - Baseline store (chain/baseline.hpp)
 *   - Environment configuration (config.hpp)
 */

#include "deltachain/error.hpp"
#include "deltachain/io/byte_source.hpp"
#include "deltachain/header/line_scanner.hpp"
#include "deltachain/header/header_extractor.hpp"
#include "deltachain/chain/chain_validator.hpp"
#include "deltachain/chain/directory.hpp"
#include "deltachain/chain/baseline.hpp"
#include "deltachain/config.hpp"
