#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <httplib.h>
#include <zip.h>
#include "core/image_resolver.hpp"
#include "core/remote_generation_client.hpp"
#include "core/text_enhancer.hpp"

namespace test_support
{
    inline std::vector<uint8_t> makeJpeg(int width, int height, int quality = 90)
    {
        cv::Mat image(height, width, CV_8UC3);
        cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));
        std::vector<uint8_t> bytes;
        cv::imencode(".jpg", image, bytes, {cv::IMWRITE_JPEG_QUALITY, quality});
        return bytes;
    }

    inline std::vector<uint8_t> makePng(int width, int height, bool with_alpha)
    {
        cv::Mat image(height, width, with_alpha ? CV_8UC4 : CV_8UC3, cv::Scalar(40, 80, 160, 128));
        std::vector<uint8_t> bytes;
        cv::imencode(".png", image, bytes);
        return bytes;
    }

    inline ImageAsset makeAsset(const std::string &id, uint64_t declared_size = 100 * 1024, int order = 0)
    {
        ImageAsset asset;
        asset.id = id;
        asset.original_filename = id + ".jpg";
        asset.source_locator = "https://storage.example.com/photos/" + id + ".jpg";
        asset.declared_byte_size = declared_size;
        asset.mime_type = "image/jpeg";
        asset.order = order;
        return asset;
    }

    /**
     * @brief In-memory ImageResolver keyed by asset id.
     * Unknown ids resolve as NOT_FOUND. Optional random delay shuffles completion order.
     */
    class FakeImageResolver : public ImageResolver
    {
    public:
        void add(const std::string &id, std::vector<uint8_t> bytes) { images_[id] = std::move(bytes); }
        void fail(const std::string &id, ResolveStatus status) { failures_[id] = status; }
        void setRandomDelay(int max_ms, int min_ms = 0)
        {
            min_delay_ms_ = min_ms;
            max_delay_ms_ = max_ms;
        }

        // Cancels the token once this many fetches have started
        void cancelAfter(size_t calls, CancellationToken token)
        {
            cancel_after_ = calls;
            cancel_target_ = token;
        }

        ResolveResult resolve(const ImageAsset &asset, const CancellationToken &cancel) override
        {
            const size_t call = ++calls_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requested_.push_back(asset.id);
            }
            if (cancel_after_ > 0 && call >= cancel_after_)
            {
                cancel_target_.cancel();
            }
            if (max_delay_ms_ > 0)
            {
                int delay = 0;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    delay = std::uniform_int_distribution<int>(min_delay_ms_, max_delay_ms_)(rng_);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }

            ResolveResult result;
            result.image.asset = asset;
            if (cancel.isCancelled())
            {
                result.status = ResolveStatus::CANCELLED;
                return result;
            }
            auto failure = failures_.find(asset.id);
            if (failure != failures_.end())
            {
                result.status = failure->second;
                result.error_message = "injected failure";
                return result;
            }
            auto found = images_.find(asset.id);
            if (found == images_.end())
            {
                result.status = ResolveStatus::NOT_FOUND;
                result.error_message = "no such image";
                return result;
            }
            result.status = ResolveStatus::OK;
            result.image.bytes = found->second;
            return result;
        }

        size_t calls() const { return calls_.load(); }

        std::vector<std::string> requested()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requested_;
        }

    private:
        std::map<std::string, std::vector<uint8_t>> images_;
        std::map<std::string, ResolveStatus> failures_;
        std::atomic<size_t> calls_{0};
        int min_delay_ms_ = 0;
        int max_delay_ms_ = 0;
        size_t cancel_after_ = 0;
        CancellationToken cancel_target_;
        std::mutex mutex_;
        std::mt19937 rng_{42};
        std::vector<std::string> requested_;
    };

    class FakeRemoteClient : public RemoteGenerationClient
    {
    public:
        DelegationResult reply;
        size_t calls = 0;
        GenerationRequest last_request;

        FakeRemoteClient()
        {
            reply.success = true;
            reply.package_bytes = {'P', 'K', 3, 4, 'r', 'e', 'm', 'o', 't', 'e'};
        }

        DelegationResult generate(const GenerationRequest &request,
                                  const ProgressCallback &on_progress,
                                  const CancellationToken &) override
        {
            ++calls;
            last_request = request;
            if (on_progress)
            {
                on_progress(50.0, "Remote halfway");
                on_progress(100.0, "Remote done");
            }
            return reply;
        }
    };

    class FakeTextEnhancer : public TextEnhancer
    {
    public:
        bool succeed = true;
        std::vector<std::string> field_types;

        std::optional<std::string> enhance(const std::string &text, const std::string &field_type) override
        {
            field_types.push_back(field_type);
            if (!succeed)
                return std::nullopt;
            return "Prose: " + text;
        }
    };

    /**
     * @brief Reads every entry of an in-memory archive through libzip.
     * libzip verifies each entry's CRC while reading it.
     */
    class ZipReader
    {
    public:
        explicit ZipReader(const std::vector<uint8_t> &archive) { valid_ = parse(archive); }

        bool valid() const { return valid_; }
        const std::vector<std::string> &names() const { return names_; }
        bool has(const std::string &name) const { return entries_.count(name) > 0; }
        std::string read(const std::string &name) const
        {
            auto it = entries_.find(name);
            return it == entries_.end() ? std::string() : it->second;
        }
        int method(const std::string &name) const
        {
            auto it = methods_.find(name);
            return it == methods_.end() ? -1 : it->second;
        }

    private:
        bool valid_ = false;
        std::vector<std::string> names_;
        std::map<std::string, std::string> entries_;
        std::map<std::string, int> methods_;

        bool parse(const std::vector<uint8_t> &archive)
        {
            if (archive.empty())
                return false;

            zip_error_t error;
            zip_error_init(&error);
            zip_source_t *source = zip_source_buffer_create(archive.data(), archive.size(), 0, &error);
            if (!source)
            {
                zip_error_fini(&error);
                return false;
            }
            zip_t *zip = zip_open_from_source(source, ZIP_RDONLY | ZIP_CHECKCONS, &error);
            zip_error_fini(&error);
            if (!zip)
            {
                zip_source_free(source);
                return false;
            }

            bool ok = true;
            const zip_int64_t count = zip_get_num_entries(zip, 0);
            for (zip_int64_t i = 0; ok && i < count; ++i)
            {
                zip_stat_t stat;
                zip_stat_init(&stat);
                if (zip_stat_index(zip, static_cast<zip_uint64_t>(i), 0, &stat) < 0)
                {
                    ok = false;
                    break;
                }

                std::string content(static_cast<size_t>(stat.size), '\0');
                zip_file_t *file = zip_fopen_index(zip, static_cast<zip_uint64_t>(i), 0);
                if (!file)
                {
                    ok = false;
                    break;
                }
                const zip_int64_t read = stat.size > 0 ? zip_fread(file, &content[0], stat.size) : 0;
                const int closed = zip_fclose(file);
                ok = read == static_cast<zip_int64_t>(stat.size) && closed == 0;

                names_.push_back(stat.name);
                entries_[stat.name] = content;
                methods_[stat.name] = stat.comp_method;
            }

            zip_discard(zip);
            return ok;
        }
    };

    /**
     * @brief httplib server on an ephemeral loopback port, stopped on destruction
     */
    class LocalHttpServer
    {
    public:
        httplib::Server server;

        void start()
        {
            port_ = server.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this]()
                                  { server.listen_after_bind(); });
            for (int i = 0; i < 200 && !server.is_running(); ++i)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }

        std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

        ~LocalHttpServer()
        {
            server.stop();
            if (thread_.joinable())
                thread_.join();
        }

    private:
        int port_ = 0;
        std::thread thread_;
    };

    inline size_t countOccurrences(const std::string &haystack, const std::string &needle)
    {
        size_t count = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size()))
            ++count;
        return count;
    }
}
