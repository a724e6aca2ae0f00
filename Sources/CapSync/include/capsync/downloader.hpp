#pragma once

#include "config.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace capsync {

struct download_request {
    std::string tenant_id;
    std::string video_id;
    std::string database_name;

    /// Skip the image cache.
    bool force_download = false;
};

/// Handle to one download. After cancel() no retry is scheduled and no
/// completion or progress is delivered.
class download_task {
public:
    void cancel() { cancelled_ = true; }
    bool is_cancelled() const { return cancelled_; }
    bool is_finished() const { return finished_; }

private:
    friend class downloader;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
};

// ============================================================================
// downloader - fetches initial database images
// ============================================================================

class downloader {
public:
    using progress_handler = std::function<void(const download_progress&)>;
    /// Exactly one of (image, error) is meaningful: error is null on success.
    using completion_handler = std::function<void(byte_vector image, std::exception_ptr error)>;

    downloader(std::shared_ptr<http_client> http,
               std::shared_ptr<scheduler> sched,
               std::string storage_url,
               retry_options retry = {});
    ~downloader();

    downloader(const downloader&) = delete;
    downloader& operator=(const downloader&) = delete;

    /// GET <storage_url>/<tenant>/<video>/<db>.db. Transport errors, 5xx, 408
    /// and 429 are retried with backoff; other statuses fail at once with
    /// download_error. Handlers run on the scheduler.
    std::shared_ptr<download_task> download(const download_request& request,
                                            progress_handler on_progress,
                                            completion_handler on_complete);

    std::string image_url(const download_request& request) const;

    bool is_cached(const download_request& request) const;
    void evict(const download_request& request);
    void clear_cache() { cache_.clear(); }

private:
    struct pending_download {
        download_request request;
        std::string url;
        std::shared_ptr<download_task> task;
        progress_handler on_progress;
        completion_handler on_complete;
        int attempt = 0;
    };

    static std::string cache_key(const download_request& request);
    static bool is_transient(const http_response& response);

    void start_attempt(const std::shared_ptr<pending_download>& pending);
    void on_response(const std::shared_ptr<pending_download>& pending, http_response response);
    void report_progress(const std::shared_ptr<pending_download>& pending,
                         uint64_t received, uint64_t total);
    void fail(const std::shared_ptr<pending_download>& pending, const std::string& cause);

    std::shared_ptr<http_client> http_;
    std::shared_ptr<scheduler> scheduler_;
    std::string storage_url_;
    retry_options retry_;
    std::map<std::string, byte_vector> cache_;

    // Completions posted after destruction check this before touching `this`.
    std::shared_ptr<char> lifetime_ = std::make_shared<char>();
};

} // namespace capsync
