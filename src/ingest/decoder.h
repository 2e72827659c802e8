#pragma once
// Copyright (c) 2024-2026 The DTL Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "ingest/block_fetcher.h"
#include "store/records.h"
#include "store/transport_db.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ingest {

/// Everything one sequencer block contributes to the store.
struct SequencerEntry {
    store::TransactionEntry transaction;
    store::StateRootEntry   state_root;
};

// ---------------------------------------------------------------------------
// BlockDecoder -- transform and persist one fetched block
// ---------------------------------------------------------------------------
class BlockDecoder {
public:
    virtual ~BlockDecoder() = default;

    /// DECODE_ERROR for payloads that do not have the expected shape.
    virtual core::Result<SequencerEntry> parse_block(const RawBlock& block,
                                                     uint64_t chain_id) = 0;

    virtual core::Result<void> store_block(const SequencerEntry& entry,
                                           store::TransportDB& db) = 0;
};

/// The zero address used as target for sequencer-origin transactions.
inline constexpr std::string_view ZERO_ADDRESS =
    "0x0000000000000000000000000000000000000000";

// ---------------------------------------------------------------------------
// SequencerBlockHandler -- decoder for L2 sequencer blocks
// ---------------------------------------------------------------------------
// Every L2 block carries exactly one transaction, so the block's first
// transaction becomes the unconfirmed transaction at index blockNumber - 1
// and the block's stateRoot the unconfirmed state root at the same index.
// ---------------------------------------------------------------------------
class SequencerBlockHandler final : public BlockDecoder {
public:
    core::Result<SequencerEntry> parse_block(const RawBlock& block,
                                             uint64_t chain_id) override;

    /// Writes the transaction and state root in one atomic commit.
    core::Result<void> store_block(const SequencerEntry& entry,
                                   store::TransportDB& db) override;
};

/// Converts an EIP-155 (or pre-EIP-155 27/28, or bare 0/1) v value to the
/// 0/1 recovery id. DECODE_ERROR for anything else.
core::Result<uint64_t> recovery_id(uint64_t v, uint64_t chain_id);

/// Left-pads a 0x-prefixed hex string to @p bytes bytes, lowercasing it.
/// DECODE_ERROR if it is not hex or already longer.
core::Result<std::string> pad_hex(std::string_view hex, size_t bytes);

} // namespace ingest
