#include "capsync/downloader.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include <algorithm>
#include <cmath>

namespace capsync {

downloader::downloader(std::shared_ptr<http_client> http,
                       std::shared_ptr<scheduler> sched,
                       std::string storage_url,
                       retry_options retry)
    : http_(std::move(http))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , storage_url_(std::move(storage_url))
    , retry_(retry)
{
}

downloader::~downloader() = default;

std::string downloader::cache_key(const download_request& request) {
    return request.tenant_id + "/" + request.video_id + "/" + request.database_name;
}

std::string downloader::image_url(const download_request& request) const {
    return join_url(storage_url_, url_escape(request.tenant_id) + "/" +
                                  url_escape(request.video_id) + "/" +
                                  url_escape(request.database_name) + ".db");
}

bool downloader::is_cached(const download_request& request) const {
    return cache_.count(cache_key(request)) > 0;
}

void downloader::evict(const download_request& request) {
    cache_.erase(cache_key(request));
}

bool downloader::is_transient(const http_response& response) {
    int status = response.status_code;
    return status == 0 || status >= 500 || status == 408 || status == 429;
}

std::shared_ptr<download_task> downloader::download(const download_request& request,
                                                    progress_handler on_progress,
                                                    completion_handler on_complete) {
    auto task = std::make_shared<download_task>();

    if (!request.force_download) {
        auto cached = cache_.find(cache_key(request));
        if (cached != cache_.end()) {
            LOG_DEBUG("downloader", "Cache hit for %s", cache_key(request).c_str());
            std::weak_ptr<char> alive = lifetime_;
            scheduler_->invoke([alive, task, image = cached->second, on_complete = std::move(on_complete)]() mutable {
                if (alive.expired() || task->is_cancelled()) return;
                task->finished_ = true;
                if (on_complete) on_complete(std::move(image), nullptr);
            });
            return task;
        }
    }

    auto pending = std::make_shared<pending_download>();
    pending->request = request;
    pending->url = image_url(request);
    pending->task = task;
    pending->on_progress = std::move(on_progress);
    pending->on_complete = std::move(on_complete);

    start_attempt(pending);
    return task;
}

void downloader::start_attempt(const std::shared_ptr<pending_download>& pending) {
    if (pending->task->is_cancelled()) return;

    ++pending->attempt;
    LOG_INFO("downloader", "GET %s (attempt %d)", pending->url.c_str(), pending->attempt);

    http_request req;
    req.method = "GET";
    req.url = pending->url;

    std::weak_ptr<char> alive = lifetime_;
    auto sched = scheduler_;
    http_->send_async(req,
        [this, alive, sched, pending](http_response response) {
            sched->invoke([this, alive, pending, response = std::move(response)]() mutable {
                if (alive.expired()) return;
                on_response(pending, std::move(response));
            });
        },
        [this, alive, sched, pending](uint64_t received, uint64_t total) {
            sched->invoke([this, alive, pending, received, total] {
                if (alive.expired()) return;
                report_progress(pending, received, total);
            });
        });
}

void downloader::report_progress(const std::shared_ptr<pending_download>& pending,
                                 uint64_t received, uint64_t total) {
    if (pending->task->is_cancelled() || pending->task->is_finished() || !pending->on_progress) {
        return;
    }

    download_progress progress;
    progress.bytes_received = received;
    progress.total_bytes = total;
    progress.attempt = pending->attempt;
    if (total > 0) {
        double pct = std::round(static_cast<double>(received) * 100.0 / static_cast<double>(total));
        progress.percent = static_cast<int>(std::clamp(pct, 0.0, 100.0));
    }
    pending->on_progress(progress);
}

void downloader::on_response(const std::shared_ptr<pending_download>& pending, http_response response) {
    if (pending->task->is_cancelled()) {
        LOG_DEBUG("downloader", "Dropping response for cancelled download %s", pending->url.c_str());
        return;
    }

    if (response.is_success()) {
        if (response.body.empty()) {
            fail(pending, "empty response body");
            return;
        }

        auto size = static_cast<uint64_t>(response.body.size());
        report_progress(pending, size, response.content_length().value_or(size));

        cache_[cache_key(pending->request)] = response.body;
        pending->task->finished_ = true;
        LOG_INFO("downloader", "Downloaded %s (%llu bytes)", pending->url.c_str(),
                 static_cast<unsigned long long>(size));
        if (pending->on_complete) pending->on_complete(std::move(response.body), nullptr);
        return;
    }

    std::string cause = response.status_code == 0
        ? (response.error.empty() ? std::string("network error") : response.error)
        : "HTTP " + std::to_string(response.status_code);

    if (!is_transient(response)) {
        fail(pending, cause);
        return;
    }

    // attempt N is retry N-1; max_retries retries after the first attempt
    if (pending->attempt > retry_.max_retries) {
        fail(pending, cause + " after " + std::to_string(pending->attempt) + " attempts");
        return;
    }

    auto delay = retry_.delay_for(pending->attempt - 1);
    LOG_WARN("downloader", "%s failed: %s, retrying in %lld ms", pending->url.c_str(),
             cause.c_str(), static_cast<long long>(delay.count()));

    std::weak_ptr<char> alive = lifetime_;
    scheduler_->invoke_after(delay, [this, alive, pending] {
        if (alive.expired()) return;
        start_attempt(pending);
    });
}

void downloader::fail(const std::shared_ptr<pending_download>& pending, const std::string& cause) {
    pending->task->finished_ = true;
    LOG_ERROR("downloader", "Download of %s failed: %s", pending->url.c_str(), cause.c_str());
    if (pending->on_complete) {
        pending->on_complete({}, std::make_exception_ptr(download_error(cause)));
    }
}

} // namespace capsync
