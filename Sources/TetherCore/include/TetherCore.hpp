#pragma once

// TetherCore - Offline-first sync engine
//
// Usage:
//   #include <TetherCore.hpp>
//
//   tether::sqlite_local_store store({"climbs.db"});
//   tether::http_remote_client remote(auth, {"https://project.example.co", api_key});
//   tether::sync_coordinator sync(store, remote, auth, {}, user_id);
//
//   // Writes go straight to the local store, then get queued for push
//   auto session = tether::record::create(tether::entity_type::session, user_id);
//   store.write(session);
//   sync.enqueue(session.id);
//
//   // Foreground / timer triggers
//   sync.perform_sync().get();

#include "tether/log.hpp"
#include "tether/types.hpp"
#include "tether/config.hpp"
#include "tether/db.hpp"
#include "tether/record.hpp"
#include "tether/scheduler.hpp"
#include "tether/local_store.hpp"
#include "tether/network.hpp"
#include "tether/remote_client.hpp"
#include "tether/change_tracker.hpp"
#include "tether/conflict_resolver.hpp"
#include "tether/retry_queue.hpp"
#include "tether/sync.hpp"
