#include "document/zip_archive.hpp"
#include <cstdio>
#include <ctime>

namespace
{
    // 1980-01-02 UTC, inside the DOS date range in every time zone
    constexpr time_t FIXED_MTIME = 315619200;
}

ZipArchive::ZipArchive()
{
    zip_error_t error;
    zip_error_init(&error);

    buffer_ = zip_source_buffer_create(nullptr, 0, 0, &error);
    if (!buffer_)
    {
        fail("Failed to create archive buffer", &error);
        zip_error_fini(&error);
        return;
    }

    archive_ = zip_open_from_source(buffer_, ZIP_TRUNCATE, &error);
    if (!archive_)
    {
        fail("Failed to open archive", &error);
        zip_source_free(buffer_);
        buffer_ = nullptr;
        zip_error_fini(&error);
        return;
    }
    // The archive owns one reference; keep ours so the bytes survive zip_close
    zip_source_keep(buffer_);
    zip_error_fini(&error);
}

ZipArchive::~ZipArchive()
{
    if (archive_)
        zip_discard(archive_);
    if (buffer_)
        zip_source_free(buffer_);
}

bool ZipArchive::addEntry(const std::string &name, const std::string &text, ZipCompression compression)
{
    return addEntry(name, std::vector<uint8_t>(text.begin(), text.end()), compression);
}

bool ZipArchive::addEntry(const std::string &name, const std::vector<uint8_t> &data, ZipCompression compression)
{
    if (!archive_)
    {
        error_message_ = "Archive is not open, cannot add " + name;
        return false;
    }

    payloads_.push_back(data);
    const std::vector<uint8_t> &payload = payloads_.back();
    zip_source_t *source = zip_source_buffer(archive_, payload.empty() ? nullptr : payload.data(), payload.size(), 0);
    if (!source)
    {
        payloads_.pop_back();
        fail("Failed to create source for " + name, zip_get_error(archive_));
        return false;
    }

    const zip_int64_t index = zip_file_add(archive_, name.c_str(), source, ZIP_FL_ENC_UTF_8);
    if (index < 0)
    {
        zip_source_free(source);
        payloads_.pop_back();
        fail("Failed to add " + name, zip_get_error(archive_));
        return false;
    }

    const zip_int32_t method = compression == ZipCompression::STORE ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    if (zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index), method, 0) < 0 ||
        zip_file_set_mtime(archive_, static_cast<zip_uint64_t>(index), FIXED_MTIME, 0) < 0)
    {
        fail("Failed to configure " + name, zip_get_error(archive_));
        return false;
    }

    ++entry_count_;
    return true;
}

std::vector<uint8_t> ZipArchive::finish()
{
    if (!archive_)
    {
        if (error_message_.empty())
            error_message_ = "Archive already finished";
        return {};
    }

    if (zip_close(archive_) < 0)
    {
        fail("Failed to write archive", zip_get_error(archive_));
        zip_discard(archive_);
        archive_ = nullptr;
        payloads_.clear();
        return {};
    }
    archive_ = nullptr;
    payloads_.clear();

    return readBuffer();
}

std::vector<uint8_t> ZipArchive::readBuffer()
{
    std::vector<uint8_t> bytes;
    if (zip_source_open(buffer_) < 0)
    {
        fail("Failed to open archive buffer", zip_source_error(buffer_));
        return bytes;
    }

    zip_int64_t size = -1;
    if (zip_source_seek(buffer_, 0, SEEK_END) == 0)
    {
        size = zip_source_tell(buffer_);
    }
    if (size < 0 || zip_source_seek(buffer_, 0, SEEK_SET) < 0)
    {
        fail("Failed to size archive buffer", zip_source_error(buffer_));
        zip_source_close(buffer_);
        return bytes;
    }

    bytes.resize(static_cast<size_t>(size));
    const zip_int64_t read = size > 0 ? zip_source_read(buffer_, bytes.data(), static_cast<zip_uint64_t>(size)) : 0;
    zip_source_close(buffer_);
    if (read != size)
    {
        fail("Failed to read archive buffer", zip_source_error(buffer_));
        bytes.clear();
    }
    return bytes;
}

void ZipArchive::fail(const std::string &context, zip_error_t *error)
{
    error_message_ = context + ": " + zip_error_strerror(error);
}
