#pragma once

/** \file wal.hpp
 *  \brief Umbrella header for transaction log APIs.
 *
 *  This header includes the public transaction log interfaces:
 *   - Frame and entry encode/decode (frame.hpp, log_entry.hpp)
 *   - Log file directory view and version bridge (log_files.hpp)
 *   - Bridged entry reader (reader.hpp)
 *   - Writer with rotation (transaction_log_file.hpp)
 *   - Checkpoint records in either layout (checkpoint.hpp)
 *
 *  Doxygen groups:
 *   - \defgroup wal_api Transaction log API
 *   - \brief Write-ahead transaction log for durability and recovery
 *   - \{
 */

#include "trellis/wal/frame.hpp"
#include "trellis/wal/log_entry.hpp"
#include "trellis/wal/log_files.hpp"
#include "trellis/wal/reader.hpp"
#include "trellis/wal/transaction_log_file.hpp"
#include "trellis/wal/checkpoint.hpp"

/** \} */
