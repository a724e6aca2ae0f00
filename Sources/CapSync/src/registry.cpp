#include "capsync/registry.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include "capsync/protocol.hpp"
#include <algorithm>
#include <stdexcept>

namespace capsync {

std::atomic<log_level> g_log_level{log_level::off};

std::string instance_snapshot::error_message() const {
    return describe(error);
}

registry::registry(registry_config config)
    : config_(std::move(config))
    , scheduler_(config_.sched ? config_.sched : std::make_shared<immediate_scheduler>())
    , subscriptions_(scheduler_)
{
    if (!config_.network) {
        throw std::invalid_argument("registry_config.network is required");
    }

    auto http = config_.network->create_http_client();
    downloader_ = std::make_unique<downloader>(http, scheduler_, config_.storage_url, config_.retry);
    locks_ = std::make_unique<lock_manager>(http, scheduler_, config_.lock_url, config_.client_id);

    locks_->set_on_status_change([this](const instance_id& id, const lock_status& status) {
        auto* record = find(id);
        if (!record) return;
        record->lock = status;
        publish(*record);
    });
}

registry::~registry() {
    close_all();
    lifetime_.reset();
}

// ============================================================================
// Lookup
// ============================================================================

registry::instance_record* registry::find(const instance_id& id) {
    auto it = instances_.find(id);
    return it == instances_.end() ? nullptr : it->second.get();
}

const registry::instance_record* registry::find(const instance_id& id) const {
    auto it = instances_.find(id);
    return it == instances_.end() ? nullptr : it->second.get();
}

registry::instance_record* registry::find(const instance_id& id, uint64_t generation) {
    auto* record = find(id);
    return record && record->generation == generation ? record : nullptr;
}

registry::instance_record& registry::ready_record(const instance_id& id) {
    auto* record = find(id);
    if (!record || !record->ready || !record->engine) {
        throw query_error("Instance " + id.to_string() + " is not ready");
    }
    return *record;
}

// ============================================================================
// Initialization
// ============================================================================

void registry::initialize(const std::string& tenant_id,
                          const std::string& video_id,
                          const std::string& database_name,
                          const initialize_options& options,
                          initialize_handler on_complete) {
    instance_id id(video_id, database_name);

    auto it = instances_.find(id);
    if (it == instances_.end()) {
        auto record = std::make_unique<instance_record>();
        record->id = id;
        record->generation = next_generation_++;
        it = instances_.emplace(id, std::move(record)).first;
    }
    auto& record = *it->second;
    uint64_t generation = record.generation;

    if (record.ready) {
        auto snap = snapshot(record);
        std::weak_ptr<char> alive = lifetime_;
        scheduler_->invoke([alive, snap, on_complete = std::move(on_complete)] {
            if (!alive.expired() && on_complete) on_complete(snap, nullptr);
        });
        if (options.acquire_lock && !locks_->can_edit(id)) {
            request_lock(id, generation);
        }
        return;
    }

    if (on_complete) record.waiters.push_back(std::move(on_complete));
    record.acquire_lock = record.acquire_lock || options.acquire_lock;

    if (record.in_flight) {
        LOG_DEBUG("registry", "Joining initialization of %s", id.to_string().c_str());
        return;
    }

    record.in_flight = true;
    record.tenant_id = tenant_id;
    record.error = nullptr;
    record.tracked_tables = options.tracked_tables ? *options.tracked_tables
                                                   : config_.tables_for(database_name);
    record.download = download_progress{};

    LOG_INFO("registry", "Initializing %s for tenant %s", id.to_string().c_str(), tenant_id.c_str());
    publish(record);
    if (!find(id, generation)) return;

    download_request request;
    request.tenant_id = tenant_id;
    request.video_id = video_id;
    request.database_name = database_name;
    request.force_download = options.force_download;

    auto task = downloader_->download(request,
        [this, id, generation](const download_progress& progress) {
            auto* r = find(id, generation);
            if (!r) return;
            r->download = progress;
            publish(*r);
        },
        [this, id, generation](byte_vector image, std::exception_ptr error) {
            if (error) {
                if (auto* r = find(id, generation)) fail(*r, error);
                return;
            }
            on_downloaded(id, generation, std::move(image));
        });

    // A cached image may already have completed the record.
    if (auto* r = find(id, generation); r && r->in_flight) {
        r->active_download = std::move(task);
    }
}

void registry::on_downloaded(const instance_id& id, uint64_t generation, byte_vector image) {
    auto* record = find(id, generation);
    if (!record) {
        LOG_DEBUG("registry", "Dropping image for closed instance %s", id.to_string().c_str());
        return;
    }
    record->active_download.reset();

    engine_options options;
    options.tracked_tables = record->tracked_tables;
    try {
        record->engine = changeset_engine::open(image, options);
    } catch (const database_error&) {
        // Do not serve the same bad image to the next initialize.
        download_request request;
        request.tenant_id = record->tenant_id;
        request.video_id = id.video_id;
        request.database_name = id.database_name;
        downloader_->evict(request);

        fail(*record, std::current_exception());
        return;
    }

    record->version = record->engine->version();
    record->ready = true;
    record->in_flight = false;
    record->error = nullptr;
    record->initialized_at = std::chrono::system_clock::now();
    LOG_INFO("registry", "%s ready at version %lld", id.to_string().c_str(),
             static_cast<long long>(record->version));

    // Observers run while the channel connects and may close the instance.
    start_sync(*record);
    record = find(id, generation);
    if (!record) return;
    bool want_lock = record->acquire_lock;
    publish(*record);

    record = find(id, generation);
    if (!record) return;
    complete_waiters(*record, nullptr);

    if (want_lock && find(id, generation)) {
        request_lock(id, generation);
    }
}

void registry::start_sync(instance_record& record) {
    if (config_.websocket_url.empty()) {
        LOG_DEBUG("registry", "No sync URL configured; %s stays local", record.id.to_string().c_str());
        return;
    }

    auto id = record.id;
    auto generation = record.generation;
    auto channel = std::make_unique<sync_manager>(id, config_.network->create_sync_transport(), scheduler_,
                                                  config_.websocket_url, client_id(), config_.sync);

    channel->set_on_changes([this, id, generation](const change_set& changes) {
        on_remote_changes(id, generation, changes);
    });
    channel->set_on_ack([this, id, generation](version_t version) {
        on_ack(id, generation, version);
    });
    channel->set_on_lock([this, id](lock_state state, const std::optional<std::string>& holder) {
        locks_->apply_server_state(id, state, holder);
    });
    channel->set_on_session_transferred([this, id](const std::string& new_tab_id) {
        locks_->session_transferred(id, new_tab_id);
    });
    channel->set_on_error([this, id, generation](std::exception_ptr error) {
        auto* r = find(id, generation);
        if (!r) return;
        r->error = error;
        publish(*r);
    });
    channel->set_on_status_change([this, id, generation](const sync_status& status) {
        auto* r = find(id, generation);
        if (!r) return;
        r->sync = status;
        publish(*r);
    });

    channel->set_local_version(record.version);
    record.sync_channel = std::move(channel);
    record.sync_channel->connect(config_.auth_token);
}

void registry::request_lock(const instance_id& id, uint64_t generation) {
    locks_->acquire(id, [this, id, generation](lock_status, std::exception_ptr error) {
        if (!error || !find(id, generation)) return;

        // The instance stays usable read-only; learn who holds the lock.
        LOG_WARN("registry", "Edit lock for %s not acquired: %s", id.to_string().c_str(), describe(error).c_str());
        locks_->check(id, [id](lock_status, std::exception_ptr check_error) {
            if (check_error) {
                LOG_WARN("registry", "Lock check for %s failed: %s", id.to_string().c_str(),
                         describe(check_error).c_str());
            }
        });
    });
}

void registry::fail(instance_record& record, std::exception_ptr error) {
    LOG_ERROR("registry", "Initializing %s failed: %s", record.id.to_string().c_str(), describe(error).c_str());

    auto id = record.id;
    auto generation = record.generation;
    record.ready = false;
    record.in_flight = false;
    record.error = error;
    record.engine.reset();
    record.active_download.reset();
    publish(record);

    if (auto* r = find(id, generation)) {
        complete_waiters(*r, error);
    }
}

void registry::complete_waiters(instance_record& record, std::exception_ptr error) {
    auto waiters = std::move(record.waiters);
    record.waiters.clear();
    auto snap = snapshot(record);
    for (auto& waiter : waiters) {
        waiter(snap, error);
    }
}

// ============================================================================
// Close
// ============================================================================

void registry::close(const std::string& video_id, const std::string& database_name) {
    instance_id id(video_id, database_name);
    auto it = instances_.find(id);
    if (it == instances_.end()) return;

    // Out of the map first so late completions find nothing.
    auto record = std::move(it->second);
    instances_.erase(it);
    LOG_INFO("registry", "Closing %s", id.to_string().c_str());

    if (record->active_download) {
        record->active_download->cancel();
    }
    locks_->release(id, {});
    locks_->forget(id);

    if (record->sync_channel) {
        record->sync_channel->disconnect();
    }
    subscriptions_.clear(id);
    if (record->engine) {
        record->engine->close();
    }

    auto waiters = std::move(record->waiters);
    record->ready = false;
    auto snap = snapshot(*record);
    snap.closed = true;
    record.reset();

    if (!waiters.empty()) {
        auto error = std::make_exception_ptr(
            query_error("Instance " + id.to_string() + " was closed before it became ready"));
        for (auto& waiter : waiters) {
            waiter(snap, error);
        }
    }
    publish(snap);
}

void registry::close_all() {
    std::vector<instance_id> ids;
    for (const auto& [id, _] : instances_) ids.push_back(id);
    for (const auto& id : ids) {
        close(id.video_id, id.database_name);
    }
}

// ============================================================================
// Reads and writes
// ============================================================================

std::vector<row_t> registry::query(const std::string& video_id,
                                   const std::string& database_name,
                                   const std::string& sql,
                                   const std::vector<column_value_t>& params) {
    auto& record = ready_record(instance_id(video_id, database_name));
    return record.engine->query(sql, params);
}

int64_t registry::exec(const std::string& video_id,
                       const std::string& database_name,
                       const std::string& sql,
                       const std::vector<column_value_t>& params) {
    instance_id id(video_id, database_name);
    auto& record = ready_record(id);

    if (!locks_->can_edit(id)) {
        auto lock = locks_->status(id);
        std::string detail = std::string("lock is ") + to_string(lock.state);
        if (lock.holder && *lock.holder != client_id()) detail += ", held by " + *lock.holder;
        throw permission_error("Cannot edit " + id.to_string() + ": " + detail);
    }

    auto generation = record.generation;
    auto before = record.engine->version();
    auto rows = record.engine->exec(sql, params);
    auto changes = record.engine->changes_since(before);
    record.version = std::max(record.version, record.engine->version());

    if (!changes.empty()) {
        LOG_DEBUG("registry", "%s: %zu local changes at version %lld", id.to_string().c_str(),
                  changes.size(), static_cast<long long>(record.version));
        if (record.sync_channel) {
            record.sync_channel->send_changes(changes);
        }
        subscriptions_.notify(id, change_origin::local, changes.resulting_version, changes.changes);
    }

    if (auto* r = find(id, generation)) publish(*r);
    return rows;
}

void registry::exec_async(const std::string& video_id,
                          const std::string& database_name,
                          const std::string& sql,
                          const std::vector<column_value_t>& params,
                          exec_handler on_complete) {
    std::weak_ptr<char> alive = lifetime_;
    scheduler_->invoke([this, alive, video_id, database_name, sql, params,
                        on_complete = std::move(on_complete)] {
        if (alive.expired()) return;
        int64_t rows = 0;
        std::exception_ptr error;
        try {
            rows = exec(video_id, database_name, sql, params);
        } catch (const database_error&) {
            error = std::current_exception();
        }
        if (on_complete) on_complete(rows, error);
    });
}

edit_result registry::apply(const edit_command& command) {
    edit_result result;
    if (command.apply) command.apply();

    try {
        result.rows_affected = exec(command.video_id, command.database_name, command.sql, command.params);
        result.applied = true;
    } catch (const database_error& e) {
        LOG_WARN("registry", "Edit on %s:%s reverted: %s", command.video_id.c_str(),
                 command.database_name.c_str(), e.what());
        result.error = std::current_exception();
        if (command.revert) command.revert();
    }
    return result;
}

// ============================================================================
// Sync callbacks
// ============================================================================

void registry::on_remote_changes(const instance_id& id, uint64_t generation, const change_set& changes) {
    auto* record = find(id, generation);
    if (!record || !record->engine) return;

    // apply_changes_error propagates to the sync channel, which reports it.
    auto version = record->engine->apply_changes(changes);
    record->version = std::max(record->version, version);
    LOG_DEBUG("registry", "%s: merged %zu remote changes, version %lld", id.to_string().c_str(),
              changes.size(), static_cast<long long>(record->version));

    subscriptions_.notify(id, change_origin::remote, record->version, changes.changes);
    if (auto* r = find(id, generation)) publish(*r);
}

void registry::on_ack(const instance_id& id, uint64_t generation, version_t version) {
    auto* record = find(id, generation);
    if (!record || !record->engine) return;

    try {
        record->engine->advance_version(version);
    } catch (const database_error& e) {
        LOG_ERROR("registry", "Recording ack %lld on %s failed: %s", static_cast<long long>(version),
                  id.to_string().c_str(), e.what());
        record->error = std::current_exception();
    }
    record->version = std::max(record->version, record->engine->version());
    publish(*record);
}

// ============================================================================
// Locks
// ============================================================================

void registry::acquire_lock(const std::string& video_id, const std::string& database_name,
                            lock_handler on_complete) {
    locks_->acquire(instance_id(video_id, database_name), std::move(on_complete));
}

void registry::release_lock(const std::string& video_id, const std::string& database_name,
                            lock_handler on_complete) {
    locks_->release(instance_id(video_id, database_name), std::move(on_complete));
}

void registry::check_lock(const std::string& video_id, const std::string& database_name,
                          lock_handler on_complete) {
    locks_->check(instance_id(video_id, database_name), std::move(on_complete));
}

// ============================================================================
// Observation
// ============================================================================

notification_token registry::subscribe(const std::string& video_id,
                                       const std::string& database_name,
                                       change_callback callback,
                                       change_filter filter,
                                       millis debounce) {
    auto sid = subscriptions_.add(instance_id(video_id, database_name), std::move(filter),
                                  std::move(callback), debounce);
    std::weak_ptr<char> alive = lifetime_;
    return notification_token([this, alive, sid] {
        if (!alive.expired()) subscriptions_.remove(sid);
    });
}

notification_token registry::observe(observer callback) {
    auto oid = next_observer_id_++;
    observers_.emplace(oid, std::move(callback));
    std::weak_ptr<char> alive = lifetime_;
    return notification_token([this, alive, oid] {
        if (!alive.expired()) observers_.erase(oid);
    });
}

instance_snapshot registry::snapshot(const instance_record& record) const {
    instance_snapshot snap;
    snap.id = record.id;
    snap.tenant_id = record.tenant_id;
    snap.ready = record.ready;
    snap.version = record.version;
    snap.sync = record.sync;
    snap.lock = record.lock;
    snap.download = record.download;
    snap.error = record.error;
    snap.initialized_at = record.initialized_at;
    return snap;
}

void registry::publish(const instance_record& record) {
    publish(snapshot(record));
}

void registry::publish(const instance_snapshot& snap) {
    std::vector<uint64_t> ids;
    for (const auto& [oid, _] : observers_) ids.push_back(oid);

    for (auto oid : ids) {
        auto it = observers_.find(oid);
        if (it == observers_.end()) continue;
        auto callback = it->second;
        try {
            callback(snap);
        } catch (const std::exception& e) {
            LOG_ERROR("registry", "Observer threw for %s: %s", snap.id.to_string().c_str(), e.what());
        }
    }
}

std::optional<instance_snapshot> registry::instance(const std::string& video_id,
                                                    const std::string& database_name) const {
    auto* record = find(instance_id(video_id, database_name));
    if (!record) return std::nullopt;
    return snapshot(*record);
}

std::vector<instance_snapshot> registry::instances() const {
    std::vector<instance_snapshot> result;
    result.reserve(instances_.size());
    for (const auto& [_, record] : instances_) {
        result.push_back(snapshot(*record));
    }
    return result;
}

// ============================================================================
// Metadata
// ============================================================================

std::string registry::snapshot_metadata() const {
    std::vector<instance_metadata> entries;
    for (const auto& [id, record] : instances_) {
        instance_metadata meta;
        meta.instance_id = id.to_string();
        meta.video_id = id.video_id;
        meta.database_name = id.database_name;
        meta.version = record->version;
        meta.initialized_at = record->initialized_at;
        entries.push_back(std::move(meta));
    }
    return metadata_to_json(entries);
}

size_t registry::restore_metadata(const std::string& json) {
    auto entries = metadata_from_json(json);
    if (!entries) return 0;

    size_t added = 0;
    for (const auto& meta : *entries) {
        if (meta.video_id.empty() || meta.database_name.empty()) continue;
        instance_id id(meta.video_id, meta.database_name);
        if (instances_.count(id)) continue;

        auto record = std::make_unique<instance_record>();
        record->id = id;
        record->generation = next_generation_++;
        record->version = meta.version;
        record->initialized_at = meta.initialized_at;
        auto& ref = *record;
        instances_.emplace(id, std::move(record));
        ++added;
        publish(ref);
    }
    LOG_INFO("registry", "Restored %zu instance placeholders", added);
    return added;
}

} // namespace capsync
