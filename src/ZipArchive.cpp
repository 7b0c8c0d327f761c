/**
 * @file ZipArchive.cpp
 * @brief ZIP reader/writer on top of zlib raw deflate streams
 *
 * Layout (all fields little-endian):
 *   [local header][data] ... [central directory entries][end of central directory]
 *
 * Extraction trusts the central directory for sizes and CRC, so archives
 * written with data descriptors (flag bit 3) are handled the same way.
 */

#include "ZipArchive.h"
#include "LogLevel.h"

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t SIG_LOCAL_HEADER = 0x04034b50;
constexpr uint32_t SIG_CENTRAL_HEADER = 0x02014b50;
constexpr uint32_t SIG_END_OF_CENTRAL = 0x06054b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_SIZE = 22;
constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATE = 8;
constexpr uint16_t FLAG_ENCRYPTED = 0x0001;
constexpr uint16_t FLAG_UTF8 = 0x0800;
constexpr uint16_t VERSION_NEEDED = 20;

constexpr size_t IO_CHUNK = 64 * 1024;

// ============================================
// Little-endian helpers
// ============================================

uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t getU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void setU32(std::vector<uint8_t>& buf, size_t pos, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        buf[pos + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

bool readAt(std::ifstream& in, uint64_t offset, void* buf, size_t len) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(static_cast<char*>(buf), static_cast<std::streamsize>(len));
    return static_cast<size_t>(in.gcount()) == len;
}

// RAII wrappers so every exit path releases the zlib state
struct InflateStream {
    z_stream zs{};
    bool ok = false;
    InflateStream() { ok = (inflateInit2(&zs, -MAX_WBITS) == Z_OK); }
    ~InflateStream() { if (ok) inflateEnd(&zs); }
};

struct DeflateStream {
    z_stream zs{};
    bool ok = false;
    DeflateStream() {
        ok = (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY) == Z_OK);
    }
    ~DeflateStream() { if (ok) deflateEnd(&zs); }
};

// ============================================
// Central directory
// ============================================

bool readCentralDirectory(std::ifstream& in, uint64_t fileSize, const std::string& archivePath,
                          std::vector<ZipEntryInfo>& entries) {
    entries.clear();
    if (fileSize < END_OF_CENTRAL_SIZE) {
        LOG_ERROR("[Zip] " << archivePath << ": too small to be an archive (" << fileSize << " bytes)");
        return false;
    }

    // End record sits in the last 22 + comment bytes
    size_t tailLen = static_cast<size_t>(
        std::min<uint64_t>(fileSize, END_OF_CENTRAL_SIZE + MAX_COMMENT_SIZE));
    uint64_t tailStart = fileSize - tailLen;
    std::vector<uint8_t> tail(tailLen);
    if (!readAt(in, tailStart, tail.data(), tail.size())) {
        LOG_ERROR("[Zip] " << archivePath << ": read failed");
        return false;
    }

    size_t eocd = tailLen;
    for (size_t i = tailLen - END_OF_CENTRAL_SIZE + 1; i-- > 0;) {
        if (getU32(&tail[i]) == SIG_END_OF_CENTRAL) {
            eocd = i;
            break;
        }
    }
    if (eocd == tailLen) {
        LOG_ERROR("[Zip] " << archivePath << ": end of central directory not found");
        return false;
    }

    const uint8_t* e = &tail[eocd];
    uint16_t entryCount = getU16(e + 10);
    uint32_t cdSize = getU32(e + 12);
    uint32_t cdOffset = getU32(e + 16);

    if (entryCount == 0xFFFF || cdSize == 0xFFFFFFFF || cdOffset == 0xFFFFFFFF) {
        LOG_ERROR("[Zip] " << archivePath << ": ZIP64 archives are not supported");
        return false;
    }
    if (static_cast<uint64_t>(cdOffset) + cdSize > tailStart + eocd) {
        LOG_ERROR("[Zip] " << archivePath << ": central directory out of bounds");
        return false;
    }

    std::vector<uint8_t> cd(cdSize);
    if (cdSize > 0 && !readAt(in, cdOffset, cd.data(), cd.size())) {
        LOG_ERROR("[Zip] " << archivePath << ": cannot read central directory");
        return false;
    }

    size_t pos = 0;
    for (uint16_t i = 0; i < entryCount; i++) {
        if (pos + CENTRAL_HEADER_SIZE > cd.size() || getU32(&cd[pos]) != SIG_CENTRAL_HEADER) {
            LOG_ERROR("[Zip] " << archivePath << ": bad central header #" << i);
            return false;
        }
        const uint8_t* h = &cd[pos];
        ZipEntryInfo info;
        info.flags = getU16(h + 8);
        info.method = getU16(h + 10);
        info.crc = getU32(h + 16);
        info.compressedSize = getU32(h + 20);
        info.uncompressedSize = getU32(h + 24);
        uint16_t nameLen = getU16(h + 28);
        uint16_t extraLen = getU16(h + 30);
        uint16_t commentLen = getU16(h + 32);
        info.localHeaderOffset = getU32(h + 42);

        size_t next = pos + CENTRAL_HEADER_SIZE + nameLen + extraLen + commentLen;
        if (next > cd.size()) {
            LOG_ERROR("[Zip] " << archivePath << ": truncated central header #" << i);
            return false;
        }
        info.name.assign(reinterpret_cast<const char*>(h + CENTRAL_HEADER_SIZE), nameLen);
        entries.push_back(std::move(info));
        pos = next;
    }
    return true;
}

// Resolve an entry name below destDir; empty result = rejected name
fs::path safeEntryPath(const fs::path& destDir, std::string name) {
    std::replace(name.begin(), name.end(), '\\', '/');
    if (name.empty() || name.front() == '/') return {};

    fs::path rel(name);
    if (rel.has_root_name() || rel.has_root_directory()) return {};
    for (const auto& part : rel) {
        if (part.string() == "..") return {};
    }
    return destDir / rel;
}

// ============================================
// Entry extraction
// ============================================

bool copyStored(std::ifstream& in, uint64_t size, std::ofstream& out, uint32_t& crc) {
    std::vector<char> buf(IO_CHUNK);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buf.size()));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want) return false;
        crc = static_cast<uint32_t>(crc32(crc, reinterpret_cast<const Bytef*>(buf.data()),
                                          static_cast<uInt>(want)));
        if (!out.write(buf.data(), static_cast<std::streamsize>(want))) return false;
        remaining -= want;
    }
    return true;
}

bool inflateEntry(std::ifstream& in, uint64_t compressedSize, std::ofstream& out,
                  uint32_t& crc, uint64_t& produced) {
    InflateStream stream;
    if (!stream.ok) return false;
    z_stream& zs = stream.zs;

    std::vector<uint8_t> inBuf(IO_CHUNK);
    std::vector<uint8_t> outBuf(IO_CHUNK);
    uint64_t remainingIn = compressedSize;
    produced = 0;

    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        if (zs.avail_in == 0) {
            if (remainingIn == 0) return false;  // deflate stream truncated
            size_t want = static_cast<size_t>(std::min<uint64_t>(remainingIn, inBuf.size()));
            in.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(want));
            if (static_cast<size_t>(in.gcount()) != want) return false;
            remainingIn -= want;
            zs.next_in = inBuf.data();
            zs.avail_in = static_cast<uInt>(want);
        }

        zs.next_out = outBuf.data();
        zs.avail_out = static_cast<uInt>(outBuf.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            LOG_DEBUG("[Zip] inflate failed: " << (zs.msg ? zs.msg : "no message") << " (" << ret << ")");
            return false;
        }

        size_t have = outBuf.size() - zs.avail_out;
        if (have > 0) {
            crc = static_cast<uint32_t>(crc32(crc, outBuf.data(), static_cast<uInt>(have)));
            if (!out.write(reinterpret_cast<const char*>(outBuf.data()),
                           static_cast<std::streamsize>(have))) {
                return false;
            }
            produced += have;
        }
    }
    return true;
}

bool extractEntry(std::ifstream& in, const ZipEntryInfo& info, const fs::path& target,
                  const std::string& archivePath) {
    uint8_t local[LOCAL_HEADER_SIZE];
    if (!readAt(in, info.localHeaderOffset, local, sizeof(local)) ||
        getU32(local) != SIG_LOCAL_HEADER) {
        LOG_ERROR("[Zip] " << archivePath << ": bad local header for " << info.name);
        return false;
    }
    uint64_t dataOffset = info.localHeaderOffset + LOCAL_HEADER_SIZE +
                          getU16(local + 26) + getU16(local + 28);
    in.clear();
    in.seekg(static_cast<std::streamoff>(dataOffset));

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        LOG_ERROR("[Zip] Cannot create " << target.parent_path() << ": " << ec.message());
        return false;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR("[Zip] Cannot write " << target);
        return false;
    }

    uint32_t crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    uint64_t produced = 0;
    bool ok = false;
    if (info.method == METHOD_STORED) {
        ok = copyStored(in, info.compressedSize, out, crc);
        produced = info.compressedSize;
    } else {
        ok = inflateEntry(in, info.compressedSize, out, crc, produced);
    }
    out.close();

    if (!ok || out.fail()) {
        LOG_ERROR("[Zip] " << archivePath << ": failed to extract " << info.name);
        return false;
    }
    if (produced != info.uncompressedSize || crc != info.crc) {
        LOG_ERROR("[Zip] " << archivePath << ": size/CRC mismatch on " << info.name);
        return false;
    }
    return true;
}

// ============================================
// Entry writing
// ============================================

void dosDateTime(uint16_t& dosTime, uint16_t& dosDate) {
    std::time_t now = std::time(nullptr);
    struct tm lt{};
    localtime_r(&now, &lt);
    int year = std::max(lt.tm_year + 1900, 1980);
    dosTime = static_cast<uint16_t>((lt.tm_hour << 11) | (lt.tm_min << 5) | (lt.tm_sec / 2));
    dosDate = static_cast<uint16_t>(((year - 1980) << 9) | ((lt.tm_mon + 1) << 5) | lt.tm_mday);
}

bool deflateFile(const std::string& path, std::ofstream& out, uint32_t& crc,
                 uint64_t& inSize, uint64_t& outSize) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_ERROR("[Zip] Cannot open " << path);
        return false;
    }

    DeflateStream stream;
    if (!stream.ok) return false;
    z_stream& zs = stream.zs;

    std::vector<uint8_t> inBuf(IO_CHUNK);
    std::vector<uint8_t> outBuf(IO_CHUNK);
    crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    inSize = 0;
    outSize = 0;

    int flush = Z_NO_FLUSH;
    while (flush != Z_FINISH) {
        in.read(reinterpret_cast<char*>(inBuf.data()), static_cast<std::streamsize>(inBuf.size()));
        size_t got = static_cast<size_t>(in.gcount());
        if (in.bad()) {
            LOG_ERROR("[Zip] Read failed on " << path);
            return false;
        }
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
        crc = static_cast<uint32_t>(crc32(crc, inBuf.data(), static_cast<uInt>(got)));
        inSize += got;

        zs.next_in = inBuf.data();
        zs.avail_in = static_cast<uInt>(got);
        do {
            zs.next_out = outBuf.data();
            zs.avail_out = static_cast<uInt>(outBuf.size());
            int ret = deflate(&zs, flush);
            if (ret == Z_STREAM_ERROR) return false;
            size_t have = outBuf.size() - zs.avail_out;
            if (have > 0 && !out.write(reinterpret_cast<const char*>(outBuf.data()),
                                       static_cast<std::streamsize>(have))) {
                return false;
            }
            outSize += have;
        } while (zs.avail_out == 0);
    }
    return true;
}

}  // namespace

// ============================================
// Public API
// ============================================

bool listZip(const std::string& archivePath, std::vector<ZipEntryInfo>& entries) {
    std::ifstream in(archivePath, std::ios::binary | std::ios::ate);
    if (!in) {
        LOG_ERROR("[Zip] Cannot open " << archivePath);
        return false;
    }
    uint64_t size = static_cast<uint64_t>(in.tellg());
    if (size == 0) {
        entries.clear();
        return true;
    }
    return readCentralDirectory(in, size, archivePath, entries);
}

bool extractZip(const std::string& archivePath, const std::string& destDir) {
    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        LOG_ERROR("[Zip] Cannot create " << destDir << ": " << ec.message());
        return false;
    }

    std::ifstream in(archivePath, std::ios::binary | std::ios::ate);
    if (!in) {
        LOG_ERROR("[Zip] Cannot open " << archivePath);
        return false;
    }
    uint64_t size = static_cast<uint64_t>(in.tellg());
    if (size == 0) {
        LOG_DEBUG("[Zip] " << archivePath << " is empty, nothing to extract");
        return true;
    }

    std::vector<ZipEntryInfo> entries;
    if (!readCentralDirectory(in, size, archivePath, entries)) {
        return false;
    }

    const fs::path root(destDir);
    for (const auto& info : entries) {
        fs::path target = safeEntryPath(root, info.name);
        if (target.empty()) {
            LOG_ERROR("[Zip] " << archivePath << ": refusing entry name \"" << info.name << "\"");
            return false;
        }
        if (info.flags & FLAG_ENCRYPTED) {
            LOG_ERROR("[Zip] " << archivePath << ": encrypted entry " << info.name);
            return false;
        }

        if (info.name.back() == '/' || info.name.back() == '\\') {
            fs::create_directories(target, ec);
            if (ec) {
                LOG_ERROR("[Zip] Cannot create " << target << ": " << ec.message());
                return false;
            }
            continue;
        }

        if (info.method != METHOD_STORED && info.method != METHOD_DEFLATE) {
            LOG_ERROR("[Zip] " << archivePath << ": unsupported method " << info.method
                      << " on " << info.name);
            return false;
        }
        if (!extractEntry(in, info, target, archivePath)) {
            return false;
        }
    }

    LOG_DEBUG("[Zip] Extracted " << entries.size() << " entries from " << archivePath
              << " into " << destDir);
    return true;
}

bool createZip(const std::string& archivePath, const std::vector<ZipSource>& sources) {
    if (sources.size() >= 0xFFFF) {
        LOG_ERROR("[Zip] Too many entries for " << archivePath);
        return false;
    }

    std::ofstream out(archivePath, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR("[Zip] Cannot create " << archivePath);
        return false;
    }

    uint16_t dosTime = 0;
    uint16_t dosDate = 0;
    dosDateTime(dosTime, dosDate);

    std::vector<uint8_t> central;
    for (const auto& src : sources) {
        uint64_t offset = static_cast<uint64_t>(out.tellp());
        if (offset >= 0xFFFFFFFF || src.entryName.size() > 0xFFFF) {
            LOG_ERROR("[Zip] " << archivePath << ": entry " << src.entryName << " exceeds ZIP limits");
            return false;
        }

        // Local header; CRC and sizes patched once the data is written
        std::vector<uint8_t> local;
        putU32(local, SIG_LOCAL_HEADER);
        putU16(local, VERSION_NEEDED);
        putU16(local, FLAG_UTF8);
        putU16(local, METHOD_DEFLATE);
        putU16(local, dosTime);
        putU16(local, dosDate);
        putU32(local, 0);
        putU32(local, 0);
        putU32(local, 0);
        putU16(local, static_cast<uint16_t>(src.entryName.size()));
        putU16(local, 0);
        local.insert(local.end(), src.entryName.begin(), src.entryName.end());
        out.write(reinterpret_cast<const char*>(local.data()),
                  static_cast<std::streamsize>(local.size()));

        uint32_t crc = 0;
        uint64_t inSize = 0;
        uint64_t outSize = 0;
        if (!out || !deflateFile(src.filePath, out, crc, inSize, outSize)) {
            LOG_ERROR("[Zip] " << archivePath << ": failed to add " << src.filePath);
            return false;
        }
        if (inSize >= 0xFFFFFFFF || outSize >= 0xFFFFFFFF) {
            LOG_ERROR("[Zip] " << archivePath << ": " << src.filePath << " too large (no ZIP64)");
            return false;
        }

        setU32(local, 14, crc);
        setU32(local, 18, static_cast<uint32_t>(outSize));
        setU32(local, 22, static_cast<uint32_t>(inSize));
        std::streampos end = out.tellp();
        out.seekp(static_cast<std::streamoff>(offset + 14));
        out.write(reinterpret_cast<const char*>(&local[14]), 12);
        out.seekp(end);

        putU32(central, SIG_CENTRAL_HEADER);
        putU16(central, VERSION_NEEDED);
        putU16(central, VERSION_NEEDED);
        putU16(central, FLAG_UTF8);
        putU16(central, METHOD_DEFLATE);
        putU16(central, dosTime);
        putU16(central, dosDate);
        putU32(central, crc);
        putU32(central, static_cast<uint32_t>(outSize));
        putU32(central, static_cast<uint32_t>(inSize));
        putU16(central, static_cast<uint16_t>(src.entryName.size()));
        putU16(central, 0);  // extra
        putU16(central, 0);  // comment
        putU16(central, 0);  // disk
        putU16(central, 0);  // internal attributes
        putU32(central, 0);  // external attributes
        putU32(central, static_cast<uint32_t>(offset));
        central.insert(central.end(), src.entryName.begin(), src.entryName.end());
    }

    uint64_t cdOffset = static_cast<uint64_t>(out.tellp());
    if (cdOffset + central.size() >= 0xFFFFFFFF) {
        LOG_ERROR("[Zip] " << archivePath << " too large (no ZIP64)");
        return false;
    }

    std::vector<uint8_t> eocd;
    putU32(eocd, SIG_END_OF_CENTRAL);
    putU16(eocd, 0);
    putU16(eocd, 0);
    putU16(eocd, static_cast<uint16_t>(sources.size()));
    putU16(eocd, static_cast<uint16_t>(sources.size()));
    putU32(eocd, static_cast<uint32_t>(central.size()));
    putU32(eocd, static_cast<uint32_t>(cdOffset));
    putU16(eocd, 0);

    out.write(reinterpret_cast<const char*>(central.data()),
              static_cast<std::streamsize>(central.size()));
    out.write(reinterpret_cast<const char*>(eocd.data()),
              static_cast<std::streamsize>(eocd.size()));
    out.close();
    if (out.fail()) {
        LOG_ERROR("[Zip] Write failed on " << archivePath);
        return false;
    }

    LOG_DEBUG("[Zip] Created " << archivePath << " (" << sources.size() << " entries)");
    return true;
}
