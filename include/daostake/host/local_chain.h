// DAOSTAKE - Local Chain
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Single-threaded host for the engine: a block counter, a registry of
// contract addresses and tokens, and Execute() which runs one call and
// reverts every token ledger if it throws.

#ifndef DAOSTAKE_HOST_LOCAL_CHAIN_H
#define DAOSTAKE_HOST_LOCAL_CHAIN_H

#include "daostake/core/types.h"
#include "daostake/farm/token.h"
#include "daostake/host/memory_token.h"
#include "daostake/util/logging.h"

#include <exception>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace daostake {
namespace host {

class LocalChain : public farm::IChainContext {
public:
    explicit LocalChain(BlockNumber startBlock = 0) : block_(startBlock) {}

    // IChainContext
    BlockNumber CurrentBlock() const override { return block_; }
    bool IsContract(const Address& address) const override;
    farm::IFungibleToken* GetToken(const Address& address) override;
    farm::IMintableToken* GetMintableToken(const Address& address) override;

    /// Jump to a block; the chain never moves backwards
    bool SetBlock(BlockNumber block);

    /// Move forward `count` blocks; false if the height would overflow
    bool AdvanceBlocks(BlockNumber count);

    /// Mark an address as a programmable account
    void RegisterContract(const Address& address) { contracts_.insert(address); }

    /// Deploy a token at AddressFromLabel(symbol)
    MemoryToken& CreateToken(const std::string& symbol, const Address& owner);

    /// Deploy a token at an explicit address
    MemoryToken& CreateToken(const std::string& symbol, const Address& address,
                             const Address& owner);

    MemoryToken* FindToken(const Address& address);

    size_t TokenCount() const { return tokens_.size(); }

    /**
     * Run one top-level call. Token ledgers are snapshotted first and
     * restored if `fn` throws; the exception is then rethrown.
     */
    template<typename Fn>
    auto Execute(Fn&& fn) -> decltype(fn()) {
        std::map<Address, MemoryToken::Snapshot> snapshots;
        for (const auto& [address, token] : tokens_) {
            snapshots.emplace(address, token->TakeSnapshot());
        }
        try {
            return fn();
        } catch (const std::exception& e) {
            for (const auto& [address, snapshot] : snapshots) {
                tokens_.at(address)->Restore(snapshot);
            }
            LOG_DEBUG(util::LogCategory::TOKEN) << "Call reverted: " << e.what();
            throw;
        }
    }

private:
    BlockNumber block_;
    std::set<Address> contracts_;
    std::map<Address, std::unique_ptr<MemoryToken>> tokens_;
};

} // namespace host
} // namespace daostake

#endif // DAOSTAKE_HOST_LOCAL_CHAIN_H
