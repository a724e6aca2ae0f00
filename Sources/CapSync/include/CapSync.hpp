#pragma once

// CapSync - local-first replicated databases for caption annotation
//
// Usage:
//   #include <CapSync.hpp>
//
//   capsync::registry_config config;
//   config.storage_url = "https://storage.example.com/images";
//   config.lock_url = "https://api.example.com/locks";
//   config.websocket_url = "wss://sync.example.com/ws";
//   config.network = my_network_factory;   // platform HTTP + WebSocket
//   config.sched = my_ui_scheduler;
//
//   capsync::registry reg(config);
//   reg.initialize("tenant", "video-1", "captions", {.acquire_lock = true},
//       [&](capsync::instance_snapshot instance, std::exception_ptr error) {
//           if (error) return;
//           auto rows = reg.query("video-1", "captions", "SELECT * FROM captions");
//           reg.exec("video-1", "captions",
//                    "UPDATE captions SET text = ? WHERE id = ?", {std::string("Hi"), int64_t(1)});
//       });

#include "capsync/types.hpp"
#include "capsync/errors.hpp"
#include "capsync/log.hpp"
#include "capsync/scheduler.hpp"
#include "capsync/network.hpp"
#include "capsync/config.hpp"
#include "capsync/db.hpp"
#include "capsync/protocol.hpp"
#include "capsync/engine.hpp"
#include "capsync/downloader.hpp"
#include "capsync/lock_manager.hpp"
#include "capsync/sync_manager.hpp"
#include "capsync/subscriptions.hpp"
#include "capsync/registry.hpp"
