// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

#include <node/block_tree.h>
#include <util/logging.h>
#include <cstring>

const char* const CBlockTree::BLOCKS_BUCKET = "blocks";
const char* const CBlockTree::CHAIN_META_BUCKET = "chain_meta";
const char* const CBlockTree::HEAD_KEY = "head";

static std::string HashKey(const uint256& hash) {
    return std::string(reinterpret_cast<const char*>(hash.begin()), uint256::size());
}

CBlockTree::CBlockTree() : m_store(nullptr), m_hasHead(false) {
}

bool CBlockTree::Open(CDBWrapper& store, std::string& error) {
    if (!store.IsOpen()) {
        error = "database not open";
        return false;
    }

    CDBBucket blocks = store.CreateBucket(BLOCKS_BUCKET);
    CDBBucket chainMeta = store.CreateBucket(CHAIN_META_BUCKET);

    std::string value;
    bool found = false;
    if (!chainMeta.Get(HEAD_KEY, value, found, error)) {
        return false;
    }

    CBlockHeader head;
    if (found) {
        if (value.size() != uint256::size()) {
            error = "stored head hash has " + std::to_string(value.size()) + " bytes";
            return false;
        }

        uint256 headHash;
        memcpy(headHash.begin(), value.data(), uint256::size());

        std::string header_data;
        if (!blocks.Get(HashKey(headHash), header_data, found, error)) {
            return false;
        }
        if (!found) {
            error = "head block " + headHash.GetHex() + " missing from the store";
            return false;
        }
        if (!head.Deserialize(header_data, &error)) {
            error = "head block " + headHash.GetHex() + ": " + error;
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(cs_head);
        m_head = head;
        m_hasHead = found;
    }

    m_store = &store;
    m_blocks = blocks;
    m_chainMeta = chainMeta;

    if (found) {
        LogPrintChain(INFO, "Block tree head %s at sequence %llu",
                      head.GetHash().GetHex().c_str(), static_cast<unsigned long long>(head.nBkSeq));
    } else {
        LogPrintChain(INFO, "Block tree is empty");
    }
    return true;
}

void CBlockTree::Close() {
    std::lock_guard<std::mutex> lock(cs_head);
    m_head = CBlockHeader();
    m_hasHead = false;
    m_store = nullptr;
    m_blocks = CDBBucket();
    m_chainMeta = CDBBucket();
}

bool CBlockTree::ConnectHeader(const CBlockHeader& header, CDBTransaction& tx, UndoAction& undo,
                               std::string& error) {
    if (m_store == nullptr) {
        error = "block tree not open";
        return false;
    }

    CBlockHeader prevHead;
    bool prevHasHead;
    {
        std::lock_guard<std::mutex> lock(cs_head);
        prevHead = m_head;
        prevHasHead = m_hasHead;
    }

    if (prevHasHead) {
        if (header.nBkSeq != prevHead.nBkSeq + 1) {
            error = "block sequence " + std::to_string(header.nBkSeq) + " does not follow head " +
                    std::to_string(prevHead.nBkSeq);
            return false;
        }
        if (header.hashPrevBlock != prevHead.GetHash()) {
            error = "block " + std::to_string(header.nBkSeq) + " does not build on the head";
            return false;
        }
    } else if (header.nBkSeq != 0 || !header.hashPrevBlock.IsNull()) {
        error = "first block must have sequence 0 and no previous block";
        return false;
    }

    uint256 hash = header.GetHash();
    if (!tx.Put(m_blocks, HashKey(hash), header.Serialize(), error) ||
        !tx.Put(m_chainMeta, HEAD_KEY, HashKey(hash), error)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(cs_head);
        m_head = header;
        m_hasHead = true;
    }

    LogPrintChain(DEBUG, "Connected block %s at sequence %llu",
                  hash.GetHex().c_str(), static_cast<unsigned long long>(header.nBkSeq));

    undo = [this, prevHead, prevHasHead]() {
        std::lock_guard<std::mutex> lock(cs_head);
        m_head = prevHead;
        m_hasHead = prevHasHead;
    };
    return true;
}

TxHandler CBlockTree::BlockHandler(const CBlock& block) {
    CBlockHeader header = block.GetBlockHeader();
    return [this, header](CDBTransaction& tx, UndoAction& undo, std::string& error) {
        return ConnectHeader(header, tx, undo, error);
    };
}

bool CBlockTree::GetHead(CBlockHeader& head) const {
    std::lock_guard<std::mutex> lock(cs_head);
    if (!m_hasHead) {
        return false;
    }
    head = m_head;
    return true;
}

bool CBlockTree::HasBlock(const uint256& hash) const {
    if (m_store == nullptr) {
        return false;
    }

    std::string value;
    std::string error;
    bool found = false;
    if (!m_blocks.Get(HashKey(hash), value, found, error)) {
        LogPrintChain(ERROR, "HasBlock %s: %s", hash.GetHex().c_str(), error.c_str());
        return false;
    }
    return found;
}

uint64_t CBlockTree::Height() const {
    std::lock_guard<std::mutex> lock(cs_head);
    return m_hasHead ? m_head.nBkSeq + 1 : 0;
}
