// DAOSTAKE - Local Chain Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/host/local_chain.h"
#include "daostake/crypto/hash.h"

#include <limits>
#include <stdexcept>

namespace daostake {
namespace host {

bool LocalChain::IsContract(const Address& address) const {
    return contracts_.count(address) > 0;
}

farm::IFungibleToken* LocalChain::GetToken(const Address& address) {
    return FindToken(address);
}

farm::IMintableToken* LocalChain::GetMintableToken(const Address& address) {
    return FindToken(address);
}

MemoryToken* LocalChain::FindToken(const Address& address) {
    auto it = tokens_.find(address);
    return it == tokens_.end() ? nullptr : it->second.get();
}

bool LocalChain::SetBlock(BlockNumber block) {
    if (block < block_) {
        return false;
    }
    block_ = block;
    return true;
}

bool LocalChain::AdvanceBlocks(BlockNumber count) {
    if (count > std::numeric_limits<BlockNumber>::max() - block_) {
        return false;
    }
    block_ += count;
    return true;
}

MemoryToken& LocalChain::CreateToken(const std::string& symbol, const Address& owner) {
    return CreateToken(symbol, crypto::AddressFromLabel(symbol), owner);
}

MemoryToken& LocalChain::CreateToken(const std::string& symbol, const Address& address,
                                     const Address& owner) {
    if (tokens_.count(address) > 0 || contracts_.count(address) > 0) {
        throw std::invalid_argument("address " + address.ToHex() + " already deployed");
    }
    auto token = std::make_unique<MemoryToken>(symbol, address, owner);
    MemoryToken& ref = *token;
    tokens_.emplace(address, std::move(token));
    contracts_.insert(address);
    LOG_DEBUG(util::LogCategory::TOKEN) << "Token " << symbol << " deployed at " << address.ToHex();
    return ref;
}

} // namespace host
} // namespace daostake
