#pragma once

#include "TestSupport.hpp"

namespace capsync_tests {

namespace {

download_request captions_request(bool force = false) {
    download_request request;
    request.tenant_id = "tenant";
    request.video_id = "video 1";
    request.database_name = "captions";
    request.force_download = force;
    return request;
}

struct download_outcome {
    int completions = 0;
    byte_vector image;
    std::exception_ptr error;
    std::vector<download_progress> progress;

    downloader::progress_handler on_progress() {
        return [this](const download_progress& p) { progress.push_back(p); };
    }
    downloader::completion_handler on_complete() {
        return [this](byte_vector bytes, std::exception_ptr e) {
            ++completions;
            image = std::move(bytes);
            error = e;
        };
    }
};

} // namespace

// ============================================================================
// Test: successful download and cache
// ============================================================================

void test_downloader_success() {
    std::cout << "Testing downloader success..." << std::endl;

    auto http = std::make_shared<mock_http_client>();
    auto sched = std::make_shared<manual_scheduler>();
    downloader dl(http, sched, "https://storage.example.com/dbs/");

    auto request = captions_request();
    assert(dl.image_url(request) == "https://storage.example.com/dbs/tenant/video%201/captions.db");

    download_outcome outcome;
    auto task = dl.download(request, outcome.on_progress(), outcome.on_complete());
    assert(http->sent().size() == 1);
    assert(http->sent()[0].method == "GET");
    assert(http->sent()[0].url == dl.image_url(request));

    http->progress(50, 200);
    sched->run_pending();
    assert(outcome.progress.size() == 1);
    assert(outcome.progress[0].percent == 25);
    assert(outcome.progress[0].attempt == 1);

    auto image = captions_image();
    http->respond(ok_body(image));
    assert(outcome.completions == 0);  // delivered on the scheduler
    sched->run_pending();

    assert(outcome.completions == 1);
    assert(!outcome.error);
    assert(outcome.image == image);
    assert(outcome.progress.back().percent == 100);
    assert(task->is_finished());
    assert(dl.is_cached(request));

    // Cached: no second request.
    download_outcome cached;
    dl.download(request, cached.on_progress(), cached.on_complete());
    assert(http->sent().size() == 1);
    sched->run_pending();
    assert(cached.completions == 1 && cached.image == image);

    // Forced: bypasses the cache.
    download_outcome forced;
    dl.download(captions_request(true), forced.on_progress(), forced.on_complete());
    assert(http->sent().size() == 2);

    dl.evict(request);
    assert(!dl.is_cached(request));

    std::cout << "  Downloader success test passed!" << std::endl;
}

// ============================================================================
// Test: retry schedule and exhaustion
// ============================================================================

void test_downloader_retries() {
    std::cout << "Testing downloader retries..." << std::endl;

    auto http = std::make_shared<mock_http_client>();
    auto sched = std::make_shared<manual_scheduler>();
    downloader dl(http, sched, "https://storage.example.com/dbs");

    download_outcome outcome;
    dl.download(captions_request(), outcome.on_progress(), outcome.on_complete());

    // Transient failures back off 1s, 2s, 4s.
    const int transient[] = {503, 500, 0};
    const int64_t delays[] = {1000, 2000, 4000};
    for (int i = 0; i < 3; ++i) {
        http->respond(status_only(transient[i]));
        sched->run_pending();
        assert(outcome.completions == 0);
        assert(http->outstanding() == 0);

        sched->advance(millis(delays[i] - 1));
        assert(http->sent().size() == static_cast<size_t>(i + 1));
        sched->advance(millis(1));
        assert(http->sent().size() == static_cast<size_t>(i + 2));
    }

    // Fourth attempt fails: no more retries.
    http->respond(status_only(429));
    sched->run_pending();
    assert(outcome.completions == 1);
    assert(outcome.error);
    try {
        std::rethrow_exception(outcome.error);
    } catch (const download_error& e) {
        assert(e.cause().find("after 4 attempts") != std::string::npos);
    }

    sched->advance(millis(60000));
    assert(http->sent().size() == 4);

    std::cout << "  Downloader retries test passed!" << std::endl;
}

void test_downloader_permanent_failure() {
    std::cout << "Testing downloader permanent failures..." << std::endl;

    auto http = std::make_shared<mock_http_client>();
    auto sched = std::make_shared<manual_scheduler>();
    downloader dl(http, sched, "https://storage.example.com/dbs");

    download_outcome missing;
    dl.download(captions_request(), missing.on_progress(), missing.on_complete());
    http->respond(status_only(404));
    sched->run_pending();
    assert(missing.completions == 1);
    assert(describe(missing.error) == "Download failed: HTTP 404");
    assert(http->sent().size() == 1);

    download_outcome empty;
    dl.download(captions_request(), empty.on_progress(), empty.on_complete());
    http->respond(ok_body({}));
    sched->run_pending();
    assert(empty.completions == 1);
    assert(empty.error);
    assert(!dl.is_cached(captions_request()));

    std::cout << "  Downloader permanent failure test passed!" << std::endl;
}

void test_downloader_cancel() {
    std::cout << "Testing downloader cancellation..." << std::endl;

    auto http = std::make_shared<mock_http_client>();
    auto sched = std::make_shared<manual_scheduler>();
    downloader dl(http, sched, "https://storage.example.com/dbs");

    // Cancelled while the request is outstanding.
    download_outcome first;
    auto task = dl.download(captions_request(), first.on_progress(), first.on_complete());
    task->cancel();
    http->progress(10, 100);
    http->respond(ok_body(captions_image()));
    sched->run_pending();
    assert(first.completions == 0);
    assert(first.progress.empty());
    assert(!dl.is_cached(captions_request()));

    // Cancelled during backoff: the retry never goes out.
    download_outcome second;
    auto retrying = dl.download(captions_request(), second.on_progress(), second.on_complete());
    http->respond(status_only(503));
    sched->run_pending();
    retrying->cancel();
    sched->advance(millis(10000));
    assert(http->sent().size() == 2);
    assert(second.completions == 0);

    std::cout << "  Downloader cancellation test passed!" << std::endl;
}

} // namespace capsync_tests
