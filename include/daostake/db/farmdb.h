// DAOSTAKE - Engine State Database
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Persists a complete FarmState in one atomic write batch.
//
// Layout:
//   'E'                 -> emission parameters
//   'G'                 -> total weight, wallets, reward token, admin, pool count
//   'P' + pid           -> pool record
//   'U' + pid + address -> user position
// Pool ids are stored big-endian so keys sort by pool.

#ifndef DAOSTAKE_DB_FARMDB_H
#define DAOSTAKE_DB_FARMDB_H

#include "daostake/db/database.h"
#include "daostake/farm/emission.h"
#include "daostake/farm/engine.h"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace daostake {
namespace db {

/// Format version written into the globals record
constexpr uint8_t FARMDB_VERSION = 1;

class FarmStore {
public:
    explicit FarmStore(std::unique_ptr<Database> db);

    FarmStore(const FarmStore&) = delete;
    FarmStore& operator=(const FarmStore&) = delete;

    /// Open (or create) a LevelDB-backed store under `path`
    static std::pair<Status, std::unique_ptr<FarmStore>> Open(
        const std::filesystem::path& path, const Options& options = Options());

    /// Replace whatever is stored with `state`
    Status Save(const farm::EmissionParams& params, const farm::FarmState& state,
                bool sync = true);

    /**
     * Load the stored state. Fails with InvalidArgument when the stored
     * emission parameters differ from `expected`, NotFound when nothing
     * was saved and Corruption on malformed records or a total weight
     * that does not match the pools.
     */
    Status Load(const farm::EmissionParams& expected, farm::FarmState& out);

    bool HasState();

    Database& GetDatabase() { return *db_; }

    // Key builders, exposed for tests
    static std::string PoolKey(PoolId pid);
    static std::string PositionKey(PoolId pid, const Address& user);

private:
    Status CollectKeys(char keyPrefix, WriteBatch& deletes);

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace daostake

#endif // DAOSTAKE_DB_FARMDB_H
