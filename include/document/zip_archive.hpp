#pragma once

#include <cstdint>
#include <list>
#include <string>
#include <vector>
#include <zip.h>

enum class ZipCompression
{
    STORE,
    DEFLATE
};

/**
 * @brief Zip archive assembled in memory through libzip.
 *
 * Entry data is copied and kept alive until finish(), since libzip only reads
 * its sources when the archive is closed. Modification times are fixed so
 * identical input yields identical archives.
 */
class ZipArchive
{
public:
    ZipArchive();
    ~ZipArchive();

    ZipArchive(const ZipArchive &) = delete;
    ZipArchive &operator=(const ZipArchive &) = delete;

    bool addEntry(const std::string &name, const std::vector<uint8_t> &data,
                  ZipCompression compression = ZipCompression::DEFLATE);
    bool addEntry(const std::string &name, const std::string &text,
                  ZipCompression compression = ZipCompression::DEFLATE);

    /**
     * @brief Close the archive and return its bytes.
     * Empty on failure; the archive cannot be used afterwards.
     */
    std::vector<uint8_t> finish();

    size_t entryCount() const { return entry_count_; }
    const std::string &errorMessage() const { return error_message_; }

private:
    zip_source_t *buffer_ = nullptr;
    zip_t *archive_ = nullptr;
    std::list<std::vector<uint8_t>> payloads_;
    size_t entry_count_ = 0;
    std::string error_message_;

    void fail(const std::string &context, zip_error_t *error);
    std::vector<uint8_t> readBuffer();
};
