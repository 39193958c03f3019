#pragma once

#include <optional>
#include <string>
#include "stockledger/ledger.pb.h"

namespace stockledger {
namespace checkpoint {

/**
 * Write a projection checkpoint atomically (temp file, then rename).
 *
 * @throws StorageError
 */
void write(const std::string& path, const ProjectionCheckpoint& checkpoint);

/**
 * Read a checkpoint. Returns nullopt if the file does not exist.
 *
 * @throws StorageError if the file exists but cannot be parsed
 */
std::optional<ProjectionCheckpoint> read(const std::string& path);

} // namespace checkpoint
} // namespace stockledger
