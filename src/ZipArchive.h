/**
 * @file ZipArchive.h
 * @brief ZIP archive extraction and creation (zlib)
 *
 * Song bundles, the info package and the score upload travel as ZIP
 * archives. Supported: stored and deflate entries, no ZIP64, no
 * encryption. Extraction refuses entry names that escape the target
 * directory.
 */

#ifndef ASSETSYNC_ZIP_ARCHIVE_H
#define ASSETSYNC_ZIP_ARCHIVE_H

#include <cstdint>
#include <string>
#include <vector>

struct ZipSource {
    std::string filePath;   // file on disk
    std::string entryName;  // name inside the archive ('/' separated)
};

struct ZipEntryInfo {
    std::string name;
    uint16_t method = 0;
    uint32_t crc = 0;
    uint64_t compressedSize = 0;
    uint64_t uncompressedSize = 0;
    uint64_t localHeaderOffset = 0;
    uint16_t flags = 0;
};

/**
 * @brief Extract every entry of an archive below destDir
 *
 * destDir is created if needed. A 0-byte archive file counts as an empty
 * archive. On failure some entries may already have been written; the
 * caller owns cleanup of destDir.
 */
bool extractZip(const std::string& archivePath, const std::string& destDir);

/**
 * @brief Write a new archive holding the given files (deflate)
 */
bool createZip(const std::string& archivePath, const std::vector<ZipSource>& sources);

/**
 * @brief Read the central directory of an archive
 */
bool listZip(const std::string& archivePath, std::vector<ZipEntryInfo>& entries);

#endif // ASSETSYNC_ZIP_ARCHIVE_H
