/**
 * @file ContentAddress.h
 * @brief Deterministic content address for a logical remote path
 *
 * The address names the local cache entry (directory or cover file) and is
 * the id carried by completion signals. Same path, same address.
 */

#ifndef ASSETSYNC_CONTENT_ADDRESS_H
#define ASSETSYNC_CONTENT_ADDRESS_H

#include <string>

/**
 * @brief Lowercase hex SHA-256 of the path bytes (64 characters)
 */
std::string contentAddress(const std::string& path);

#endif // ASSETSYNC_CONTENT_ADDRESS_H
