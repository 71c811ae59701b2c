// DAOSTAKE - Engine State Database Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/db/farmdb.h"
#include "daostake/core/serialize.h"
#include "daostake/util/logging.h"

#include <ios>

namespace daostake {
namespace db {

namespace {

void WritePoolId(std::string& key, PoolId pid) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        key.push_back(static_cast<char>((pid >> shift) & 0xff));
    }
}

PoolId ReadPoolId(const Slice& key, size_t offset) {
    PoolId pid = 0;
    for (size_t i = 0; i < 4; ++i) {
        pid = (pid << 8) | static_cast<uint8_t>(key[offset + i]);
    }
    return pid;
}

DataStream StreamOf(const std::string& value) {
    return DataStream(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

std::string SerializeParams(const farm::EmissionParams& params) {
    DataStream s;
    ser_writedata64(s, params.startBlock);
    ser_writedata64(s, params.periodLength);
    ser_writedata32(s, params.periodCount);
    SerializeAmount(s, params.baseRate);
    ser_writedata32(s, params.decayNumerator);
    ser_writedata32(s, params.decayDenominator);
    return s.str();
}

farm::EmissionParams UnserializeParams(DataStream& s) {
    farm::EmissionParams params;
    params.startBlock = ser_readdata64(s);
    params.periodLength = ser_readdata64(s);
    params.periodCount = ser_readdata32(s);
    params.baseRate = UnserializeAmount(s);
    params.decayNumerator = ser_readdata32(s);
    params.decayDenominator = ser_readdata32(s);
    return params;
}

} // anonymous namespace

// ============================================================================
// FarmStore
// ============================================================================

FarmStore::FarmStore(std::unique_ptr<Database> db) : db_(std::move(db)) {}

std::pair<Status, std::unique_ptr<FarmStore>> FarmStore::Open(
    const std::filesystem::path& path, const Options& options) {
    auto [status, db] = OpenDatabase(path, options);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open " << path.string() << ": "
                                         << status.ToString();
        return {status, nullptr};
    }
    return {Status::Ok(), std::make_unique<FarmStore>(std::move(db))};
}

std::string FarmStore::PoolKey(PoolId pid) {
    std::string key = MakeKey(prefix::POOL);
    WritePoolId(key, pid);
    return key;
}

std::string FarmStore::PositionKey(PoolId pid, const Address& user) {
    std::string key = MakeKey(prefix::POSITION);
    WritePoolId(key, pid);
    key.append(reinterpret_cast<const char*>(user.data()), user.size());
    return key;
}

Status FarmStore::CollectKeys(char keyPrefix, WriteBatch& deletes) {
    return db_->ScanPrefix(MakeKey(keyPrefix), [&](const Slice& key, const Slice&) {
        deletes.Delete(key);
        return Status::Ok();
    });
}

bool FarmStore::HasState() {
    return db_->Exists(MakeKey(prefix::GLOBALS));
}

Status FarmStore::Save(const farm::EmissionParams& params, const farm::FarmState& state,
                       bool sync) {
    WriteBatch batch;

    // Stale records first; later puts of the same key win
    Status s = CollectKeys(prefix::POOL, batch);
    if (!s.ok()) return s;
    s = CollectKeys(prefix::POSITION, batch);
    if (!s.ok()) return s;

    batch.Put(MakeKey(prefix::EMISSION), SerializeParams(params));

    DataStream globals;
    ser_writedata8(globals, FARMDB_VERSION);
    SerializeAmount(globals, state.totalWeight);
    SerializeHash(globals, state.treasury);
    SerializeHash(globals, state.community);
    SerializeHash(globals, state.rewardToken);
    SerializeHash(globals, state.admin);
    ser_writedata32(globals, static_cast<uint32_t>(state.pools.size()));
    batch.Put(MakeKey(prefix::GLOBALS), globals.str());

    for (PoolId pid = 0; pid < state.pools.size(); ++pid) {
        const farm::PoolInfo& pool = state.pools[pid];
        DataStream ds;
        SerializeHash(ds, pool.lpToken);
        SerializeAmount(ds, pool.weight);
        ser_writedata64(ds, pool.lastRewardBlock);
        SerializeAmount(ds, pool.accRewardPerShare);
        batch.Put(PoolKey(pid), ds.str());
    }

    size_t positions = 0;
    state.ledger.ForEach([&](const farm::UserLedger::Key& key, const farm::UserPosition& pos) {
        DataStream ds;
        SerializeAmount(ds, pos.stakeAmount);
        SerializeAmount(ds, pos.rewardDebt);
        batch.Put(PositionKey(key.first, key.second), ds.str());
        ++positions;
    });

    WriteOptions opts;
    opts.sync = sync;
    s = db_->Write(opts, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Saving engine state failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Saved " << state.pools.size() << " pools, "
                                     << positions << " positions";
    return Status::Ok();
}

Status FarmStore::Load(const farm::EmissionParams& expected, farm::FarmState& out) {
    std::string value;
    Status s = db_->Get(MakeKey(prefix::EMISSION), &value);
    if (!s.ok()) {
        return s;
    }

    try {
        DataStream es = StreamOf(value);
        farm::EmissionParams stored = UnserializeParams(es);
        if (stored != expected) {
            return Status::InvalidArgument("stored " + stored.ToString() +
                                           " differs from configured " + expected.ToString());
        }

        s = db_->Get(MakeKey(prefix::GLOBALS), &value);
        if (!s.ok()) {
            return s.IsNotFound() ? Status::Corruption("emission record without globals") : s;
        }

        farm::FarmState state;
        DataStream gs = StreamOf(value);
        uint8_t version = ser_readdata8(gs);
        if (version != FARMDB_VERSION) {
            return Status::NotSupported("state version " + std::to_string(version));
        }
        state.totalWeight = UnserializeAmount(gs);
        state.treasury = UnserializeAddress(gs);
        state.community = UnserializeAddress(gs);
        state.rewardToken = UnserializeAddress(gs);
        state.admin = UnserializeAddress(gs);
        uint32_t poolCount = ser_readdata32(gs);

        for (PoolId pid = 0; pid < poolCount; ++pid) {
            s = db_->Get(PoolKey(pid), &value);
            if (!s.ok()) {
                return Status::Corruption("missing pool " + std::to_string(pid));
            }
            DataStream ps = StreamOf(value);
            farm::PoolInfo pool;
            pool.lpToken = UnserializeAddress(ps);
            pool.weight = UnserializeAmount(ps);
            pool.lastRewardBlock = ser_readdata64(ps);
            pool.accRewardPerShare = UnserializeAmount(ps);
            state.pools.push_back(pool);
        }

        if (state.SumWeights() != state.totalWeight) {
            return Status::Corruption("total weight does not match pool weights");
        }

        const size_t keySize = 1 + 4 + Address::SIZE;
        s = db_->ScanPrefix(MakeKey(prefix::POSITION), [&](const Slice& key, const Slice& value) {
            if (key.size() != keySize) {
                return Status::Corruption("malformed position key");
            }
            PoolId pid = ReadPoolId(key, 1);
            if (pid >= poolCount) {
                return Status::Corruption("position for missing pool " + std::to_string(pid));
            }
            Address user(reinterpret_cast<const Byte*>(key.data() + 5), Address::SIZE);

            std::string posValue = value.ToString();
            DataStream us = StreamOf(posValue);
            farm::UserPosition& pos = state.ledger.At(pid, user);
            pos.stakeAmount = UnserializeAmount(us);
            pos.rewardDebt = UnserializeAmount(us);
            return Status::Ok();
        });
        if (!s.ok()) {
            return s;
        }

        out = std::move(state);
    } catch (const std::ios_base::failure& e) {
        return Status::Corruption(e.what());
    }

    LOG_INFO(util::LogCategory::DB) << "Loaded " << out.pools.size() << " pools, "
                                    << out.ledger.Size() << " positions";
    return Status::Ok();
}

} // namespace db
} // namespace daostake
