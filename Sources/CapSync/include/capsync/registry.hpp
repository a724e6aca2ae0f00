#pragma once

#include "config.hpp"
#include "downloader.hpp"
#include "engine.hpp"
#include "lock_manager.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include "subscriptions.hpp"
#include "sync_manager.hpp"
#include "types.hpp"
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsync {

/// Read-only view of one database instance.
struct instance_snapshot {
    instance_id id;
    std::string tenant_id;
    bool ready = false;
    /// True in the final notification after close().
    bool closed = false;
    version_t version = 0;
    sync_status sync;
    std::optional<lock_status> lock;
    std::optional<download_progress> download;
    std::exception_ptr error;
    std::optional<timestamp_t> initialized_at;

    std::string error_message() const;
};

/// Optimistic edit: `apply` updates caller-held state before the write,
/// `revert` restores the previous value if the write fails.
struct edit_command {
    std::string video_id;
    std::string database_name;
    std::string sql;
    std::vector<column_value_t> params;
    std::function<void()> apply;
    std::function<void()> revert;
};

struct edit_result {
    bool applied = false;
    int64_t rows_affected = 0;
    std::exception_ptr error;
};

// ============================================================================
// registry - lifecycle of every database instance in this client
// ============================================================================
//
// Construct one per process and pass it to consumers. All completions run on
// config.sched; call the registry from that context.

class registry {
public:
    using initialize_handler = std::function<void(instance_snapshot instance, std::exception_ptr error)>;
    using exec_handler = std::function<void(int64_t rows_affected, std::exception_ptr error)>;
    using lock_handler = lock_manager::completion_handler;
    using observer = std::function<void(const instance_snapshot& instance)>;

    /// Throws std::invalid_argument when config.network is null.
    explicit registry(registry_config config);
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;

    /// Ready instance: completes with it. In flight: joins. Otherwise
    /// download -> open -> connect (-> acquire if requested).
    void initialize(const std::string& tenant_id,
                    const std::string& video_id,
                    const std::string& database_name,
                    const initialize_options& options,
                    initialize_handler on_complete);

    void close(const std::string& video_id, const std::string& database_name);
    void close_all();

    /// Throws query_error when the instance is not ready or the SQL fails.
    std::vector<row_t> query(const std::string& video_id,
                             const std::string& database_name,
                             const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Throws permission_error without the edit lock; the engine is not
    /// touched. On success the new changes are sent and subscribers notified.
    int64_t exec(const std::string& video_id,
                 const std::string& database_name,
                 const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// exec() on the scheduler. Permission is checked when it runs.
    void exec_async(const std::string& video_id,
                    const std::string& database_name,
                    const std::string& sql,
                    const std::vector<column_value_t>& params,
                    exec_handler on_complete);

    edit_result apply(const edit_command& command);

    void acquire_lock(const std::string& video_id, const std::string& database_name, lock_handler on_complete);
    void release_lock(const std::string& video_id, const std::string& database_name, lock_handler on_complete);
    void check_lock(const std::string& video_id, const std::string& database_name, lock_handler on_complete);

    /// Local and remote changes of one instance that pass `filter`.
    /// A non-zero `debounce` coalesces bursts into one event.
    notification_token subscribe(const std::string& video_id,
                                 const std::string& database_name,
                                 change_callback callback,
                                 change_filter filter = {},
                                 millis debounce = millis(0));

    /// Every instance, sync or lock state change.
    notification_token observe(observer callback);

    std::optional<instance_snapshot> instance(const std::string& video_id,
                                              const std::string& database_name) const;
    std::vector<instance_snapshot> instances() const;
    size_t size() const { return instances_.size(); }

    /// JSON array of instance_metadata for every known instance.
    std::string snapshot_metadata() const;

    /// Register not-ready placeholders for persisted instances. Returns how
    /// many were added; malformed input adds none.
    size_t restore_metadata(const std::string& json);

    const std::string& client_id() const { return locks_->client_id(); }

private:
    struct instance_record {
        instance_id id;
        std::string tenant_id;
        uint64_t generation = 0;

        bool ready = false;
        bool in_flight = false;
        bool acquire_lock = false;
        version_t version = 0;
        sync_status sync;
        std::optional<lock_status> lock;
        std::optional<download_progress> download;
        std::exception_ptr error;
        std::optional<timestamp_t> initialized_at;
        std::vector<std::string> tracked_tables;

        std::unique_ptr<changeset_engine> engine;
        std::unique_ptr<sync_manager> sync_channel;
        std::shared_ptr<download_task> active_download;
        std::vector<initialize_handler> waiters;
    };

    instance_record* find(const instance_id& id);
    const instance_record* find(const instance_id& id) const;
    /// Null when `id` was closed (and maybe re-created) since `generation`.
    instance_record* find(const instance_id& id, uint64_t generation);
    instance_record& ready_record(const instance_id& id);

    void on_downloaded(const instance_id& id, uint64_t generation, byte_vector image);
    void start_sync(instance_record& record);
    void request_lock(const instance_id& id, uint64_t generation);
    void fail(instance_record& record, std::exception_ptr error);
    void complete_waiters(instance_record& record, std::exception_ptr error);

    void on_remote_changes(const instance_id& id, uint64_t generation, const change_set& changes);
    void on_ack(const instance_id& id, uint64_t generation, version_t version);

    instance_snapshot snapshot(const instance_record& record) const;
    void publish(const instance_record& record);
    void publish(const instance_snapshot& snapshot);

    registry_config config_;
    std::shared_ptr<scheduler> scheduler_;
    std::unique_ptr<downloader> downloader_;
    std::unique_ptr<lock_manager> locks_;
    subscription_manager subscriptions_;

    std::map<instance_id, std::unique_ptr<instance_record>> instances_;
    uint64_t next_generation_ = 1;

    std::map<uint64_t, observer> observers_;
    uint64_t next_observer_id_ = 1;

    std::shared_ptr<char> lifetime_ = std::make_shared<char>();
};

} // namespace capsync
