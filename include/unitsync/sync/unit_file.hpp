#pragma once

#include "unitsync/core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace unitsync::sync {

/// Lowercase hex SHA-256 of a unit file's bytes
using Fingerprint = std::string;

/**
 * @brief Fingerprint the file at @p path
 *
 * Fails with ErrorKind::Read. A missing file fails with a no_such_file_or_directory
 * cause so callers can check Error::is_not_found(). Anything that is not a regular
 * file is a read error.
 */
Result<Fingerprint> fingerprint_file(const std::filesystem::path& path, const std::string& unit);

/**
 * @brief Fingerprint raw bytes (same digest as fingerprint_file). Fails with ErrorKind::Read.
 */
Result<Fingerprint> fingerprint_bytes(std::string_view data);

/**
 * @brief Copy @p source over @p destination byte for byte
 *
 * Data is written to a hidden sibling of the destination and renamed into place, so
 * readers of the destination directory never observe a partial file.
 */
Result<void> copy_unit_file(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            const std::string& unit);

/**
 * @brief Remove a destination record. A record that is already gone is not an error.
 */
Result<void> remove_unit_file(const std::filesystem::path& path, const std::string& unit);

/// Editor swap and backup files (`*.swp`, `*~`) are never units
bool is_editor_artifact(std::string_view name) noexcept;

} // namespace unitsync::sync
