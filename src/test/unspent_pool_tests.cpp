// Copyright (c) 2025 The Uxledger Core developers
// Distributed under the MIT software license

/**
 * Unspent Pool Tests
 *
 * Covers the cache queries, block application with its undo action, the
 * unspent hash, and loading the cache back from the store.
 */

#include <boost/test/unit_test.hpp>

#include <test/test_uxledger.h>
#include <node/unspent_pool.h>
#include <db/dbwrapper.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <random>
#include <thread>

struct UnspentPoolSetup {
    TestDirectory dir{"unspent_pool"};
    CDBWrapper db;
    CUnspentPool pool;

    UnspentPoolSetup() {
        DBOptions options;
        options.sync = false;
        std::string error;
        BOOST_REQUIRE_MESSAGE(db.Open(dir.path, options, error), error);

        CUnspentError unspent_error;
        BOOST_REQUIRE_MESSAGE(pool.Open(db, unspent_error), unspent_error.ToString());
    }

    /** Apply a block and commit the store transaction */
    bool Apply(const CBlock& block, CUnspentError& error) {
        std::string db_error;
        std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(db_error);
        BOOST_REQUIRE(tx);

        UndoAction undo;
        if (!pool.ProcessBlock(block, *tx, undo, error)) {
            return false;
        }
        BOOST_REQUIRE_MESSAGE(tx->Commit(db_error), db_error);
        return true;
    }

    void ApplyOrFail(const CBlock& block) {
        CUnspentError error;
        BOOST_REQUIRE_MESSAGE(Apply(block, error), error.ToString());
    }

    void CheckConsistent() {
        CUnspentError error;
        bool consistent = pool.VerifyConsistency(error);
        BOOST_CHECK_MESSAGE(consistent, error.ToString());
        BOOST_CHECK_EQUAL(pool.GetUxHash(), XorSnapshotHashes(pool.GetAll()));
    }

    /** Write a raw value behind the pool's back */
    void StorePut(const char* bucket_name, const std::string& key, const std::string& value) {
        CDBBucket bucket = db.CreateBucket(bucket_name);
        std::string error;
        std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(error);
        BOOST_REQUIRE(tx);
        BOOST_REQUIRE(tx->Put(bucket, key, value, error));
        BOOST_REQUIRE_MESSAGE(tx->Commit(error), error);
    }
};

static std::string StoreKey(const uint256& id) {
    return std::string(reinterpret_cast<const char*>(id.begin()), uint256::size());
}

static bool ContainsUx(const UxArray& uxs, const CUxOut& ux) {
    return std::find(uxs.begin(), uxs.end(), ux) != uxs.end();
}

BOOST_FIXTURE_TEST_SUITE(unspent_pool_tests, UnspentPoolSetup)

BOOST_AUTO_TEST_CASE(empty_pool) {
    BOOST_CHECK_EQUAL(pool.Len(), 0U);
    BOOST_CHECK(pool.GetAll().empty());
    BOOST_CHECK(pool.GetUxHash().IsNull());
    BOOST_CHECK(!pool.Contains(MakeTestHash(1)));

    CUxOut ux;
    BOOST_CHECK(!pool.Get(MakeTestHash(1), ux));
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(checksum_add_spend_undo) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10),
                                                CTxOut(MakeTestAddress(2), 200, 20)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    UxArray created1 = CreateUnspents(block1.GetBlockHeader(), tx1);
    BOOST_REQUIRE_EQUAL(created1.size(), 2U);
    const CUxOut A = created1[0];
    const CUxOut B = created1[1];

    ApplyOrFail(block1);
    BOOST_CHECK_EQUAL(pool.Len(), 2U);
    BOOST_CHECK_EQUAL(pool.GetUxHash(), A.GetSnapshotHash().Xor(B.GetSnapshotHash()));
    CheckConsistent();

    CTransaction tx2 = MakeTestTransaction({A.GetHash()}, {CTxOut(MakeTestAddress(3), 100, 5)});
    CBlock block2 = MakeTestBlock(1, block1.GetHash(), {tx2});
    const CUxOut C = CreateUnspents(block2.GetBlockHeader(), tx2)[0];

    std::string db_error;
    std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(db_error);
    BOOST_REQUIRE(tx);

    UndoAction undo;
    CUnspentError error;
    BOOST_REQUIRE_MESSAGE(pool.ProcessBlock(block2, *tx, undo, error), error.ToString());
    BOOST_REQUIRE(undo);

    BOOST_CHECK_EQUAL(pool.Len(), 2U);
    BOOST_CHECK_EQUAL(pool.GetUxHash(), B.GetSnapshotHash().Xor(C.GetSnapshotHash()));
    BOOST_CHECK(!pool.Contains(A.GetHash()));
    BOOST_CHECK(pool.Contains(C.GetHash()));

    // Caller's transaction fails: discard it and undo the cache
    undo();
    tx.reset();

    BOOST_CHECK_EQUAL(pool.Len(), 2U);
    BOOST_CHECK_EQUAL(pool.GetUxHash(), A.GetSnapshotHash().Xor(B.GetSnapshotHash()));
    BOOST_CHECK(pool.Contains(A.GetHash()));
    BOOST_CHECK(!pool.Contains(C.GetHash()));

    CUxOut restored;
    BOOST_REQUIRE(pool.Get(A.GetHash(), restored));
    BOOST_CHECK(restored == A);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(undo_restores_everything) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 10, 1),
                                                CTxOut(MakeTestAddress(1), 20, 2),
                                                CTxOut(MakeTestAddress(2), 30, 3)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);

    UxArray before = pool.GetAll();
    uint256 hashBefore = pool.GetUxHash();
    UxArray created1 = CreateUnspents(block1.GetBlockHeader(), tx1);

    CTransaction tx2 = MakeTestTransaction({created1[0].GetHash(), created1[2].GetHash()},
                                           {CTxOut(MakeTestAddress(4), 40, 4)});
    CTransaction tx3 = MakeTestTransaction({created1[1].GetHash()},
                                           {CTxOut(MakeTestAddress(5), 10, 1),
                                            CTxOut(MakeTestAddress(6), 10, 1)});
    CBlock block2 = MakeTestBlock(1, block1.GetHash(), {tx2, tx3});

    std::string db_error;
    std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(db_error);
    BOOST_REQUIRE(tx);
    UndoAction undo;
    CUnspentError error;
    BOOST_REQUIRE_MESSAGE(pool.ProcessBlock(block2, *tx, undo, error), error.ToString());
    BOOST_CHECK_EQUAL(pool.Len(), 3U);

    undo();
    tx.reset();

    UxArray after = pool.GetAll();
    BOOST_CHECK_EQUAL(after.size(), before.size());
    for (const CUxOut& ux : before) {
        BOOST_CHECK(ContainsUx(after, ux));
    }
    BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(duplicate_insert_rejected) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);

    uint256 hashBefore = pool.GetUxHash();

    // Same transaction again: same source hash, so the same output ids
    CBlock block2 = MakeTestBlock(1, block1.GetHash(), {tx1});
    CUnspentError error;
    BOOST_CHECK(!Apply(block2, error));
    BOOST_CHECK(error.type == UnspentErrorType::DUPLICATE_INSERT);
    BOOST_CHECK_EQUAL(error.hash, CreateUnspents(block1.GetBlockHeader(), tx1)[0].GetHash());

    BOOST_CHECK_EQUAL(pool.Len(), 1U);
    BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(failed_block_leaves_no_trace) {
    CTransaction tx0 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(9), 1, 1)});
    CBlock block0 = MakeTestBlock(0, uint256(), {tx0});
    ApplyOrFail(block0);
    UxArray before = pool.GetAll();

    // The second transaction re-adds the first one's outputs, after the
    // first one already wrote them to the store transaction
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10),
                                                CTxOut(MakeTestAddress(2), 50, 5)});
    CBlock block1 = MakeTestBlock(1, block0.GetHash(), {tx1, tx1});

    CUnspentError error;
    BOOST_CHECK(!Apply(block1, error));
    BOOST_CHECK(error.type == UnspentErrorType::DUPLICATE_INSERT);

    for (const CUxOut& ux : CreateUnspents(block1.GetBlockHeader(), tx1)) {
        BOOST_CHECK(!pool.Contains(ux.GetHash()));
    }
    BOOST_CHECK_EQUAL(pool.Len(), before.size());

    // Nothing reached the store either
    CUnspentPool reloaded;
    CUnspentError open_error;
    BOOST_REQUIRE(reloaded.Open(db, open_error));
    BOOST_CHECK_EQUAL(reloaded.Len(), before.size());
    BOOST_CHECK_EQUAL(reloaded.GetUxHash(), pool.GetUxHash());
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(unknown_input_not_found) {
    uint256 missing = MakeTestHash(0x42);
    CTransaction tx1 = MakeTestTransaction({missing}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});

    CUnspentError error;
    BOOST_CHECK(!Apply(block1, error));
    BOOST_CHECK(error.type == UnspentErrorType::NOT_FOUND);
    BOOST_CHECK_EQUAL(error.hash, missing);
    BOOST_CHECK_EQUAL(pool.Len(), 0U);
    BOOST_CHECK(pool.GetUxHash().IsNull());
}

BOOST_AUTO_TEST_CASE(spend_within_block) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock header = MakeTestBlock(0, uint256(), {});
    const CUxOut A = CreateUnspents(header.GetBlockHeader(), tx1)[0];

    CTransaction tx2 = MakeTestTransaction({A.GetHash()}, {CTxOut(MakeTestAddress(2), 60, 6),
                                                           CTxOut(MakeTestAddress(3), 40, 4)});
    CBlock block = MakeTestBlock(0, uint256(), {tx1, tx2});
    UxArray created2 = CreateUnspents(block.GetBlockHeader(), tx2);

    ApplyOrFail(block);

    BOOST_CHECK_EQUAL(pool.Len(), 2U);
    BOOST_CHECK(!pool.Contains(A.GetHash()));
    BOOST_CHECK(pool.Contains(created2[0].GetHash()));
    BOOST_CHECK(pool.Contains(created2[1].GetHash()));
    BOOST_CHECK_EQUAL(pool.GetUxHash(), XorSnapshotHashes(created2));
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(double_spend_rejected) {
    CTransaction tx0 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block0 = MakeTestBlock(0, uint256(), {tx0});
    ApplyOrFail(block0);
    const uint256 id = CreateUnspents(block0.GetBlockHeader(), tx0)[0].GetHash();

    // Two transactions of one block spending the same output
    CTransaction spend1 = MakeTestTransaction({id}, {CTxOut(MakeTestAddress(2), 100, 10)});
    CTransaction spend2 = MakeTestTransaction({id}, {CTxOut(MakeTestAddress(3), 100, 10)});
    CUnspentError error;
    BOOST_CHECK(!Apply(MakeTestBlock(1, block0.GetHash(), {spend1, spend2}), error));
    BOOST_CHECK(error.type == UnspentErrorType::NOT_FOUND);

    // One transaction naming the same input twice
    CTransaction spendTwice = MakeTestTransaction({id, id}, {CTxOut(MakeTestAddress(4), 200, 20)});
    CUnspentError error2;
    BOOST_CHECK(!Apply(MakeTestBlock(1, block0.GetHash(), {spendTwice}), error2));
    BOOST_CHECK(error2.type == UnspentErrorType::NOT_FOUND);

    BOOST_CHECK(pool.Contains(id));
    BOOST_CHECK_EQUAL(pool.Len(), 1U);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(block_without_transactions) {
    CTransaction tx0 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block0 = MakeTestBlock(0, uint256(), {tx0});
    ApplyOrFail(block0);
    uint256 hashBefore = pool.GetUxHash();

    ApplyOrFail(MakeTestBlock(1, block0.GetHash(), {}));

    BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);
    BOOST_CHECK_EQUAL(pool.Len(), 1U);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(reload_from_store) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10),
                                                CTxOut(MakeTestAddress(2), 200, 20)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);

    UxArray created1 = CreateUnspents(block1.GetBlockHeader(), tx1);
    CTransaction tx2 = MakeTestTransaction({created1[1].GetHash()}, {CTxOut(MakeTestAddress(3), 150, 15)});
    ApplyOrFail(MakeTestBlock(1, block1.GetHash(), {tx2}));

    CUnspentPool reloaded;
    CUnspentError error;
    BOOST_REQUIRE_MESSAGE(reloaded.Open(db, error), error.ToString());

    BOOST_CHECK_EQUAL(reloaded.Len(), pool.Len());
    BOOST_CHECK_EQUAL(reloaded.GetUxHash(), pool.GetUxHash());
    UxArray expected = pool.GetAll();
    for (const CUxOut& ux : reloaded.GetAll()) {
        BOOST_CHECK(ContainsUx(expected, ux));
    }
}

BOOST_AUTO_TEST_CASE(get_array) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 1, 1),
                                                CTxOut(MakeTestAddress(2), 2, 2)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);
    UxArray created = CreateUnspents(block1.GetBlockHeader(), tx1);

    UxArray uxs;
    CUnspentError error;
    BOOST_REQUIRE(pool.GetArray({created[1].GetHash(), created[0].GetHash()}, uxs, error));
    BOOST_REQUIRE_EQUAL(uxs.size(), 2U);
    BOOST_CHECK(uxs[0] == created[1]);
    BOOST_CHECK(uxs[1] == created[0]);

    uint256 missing = MakeTestHash(7);
    UxArray partial;
    BOOST_CHECK(!pool.GetArray({created[0].GetHash(), missing}, partial, error));
    BOOST_CHECK(error.type == UnspentErrorType::NOT_FOUND);
    BOOST_CHECK_EQUAL(error.hash, missing);
    BOOST_CHECK(partial.empty());
}

BOOST_AUTO_TEST_CASE(contains_and_collides) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 1, 1)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);
    uint256 id = CreateUnspents(block1.GetBlockHeader(), tx1)[0].GetHash();

    BOOST_CHECK(pool.Contains(id));
    BOOST_CHECK(pool.Collides({MakeTestHash(1), id}));
    BOOST_CHECK(!pool.Collides({MakeTestHash(1), MakeTestHash(2)}));
    BOOST_CHECK(!pool.Collides({}));
}

BOOST_AUTO_TEST_CASE(address_queries) {
    CAddress addr1 = MakeTestAddress(1);
    CAddress addr2 = MakeTestAddress(2);
    CAddress addr3 = MakeTestAddress(3);

    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(addr1, 10, 1),
                                                CTxOut(addr2, 20, 2),
                                                CTxOut(addr1, 30, 3)});
    ApplyOrFail(MakeTestBlock(0, uint256(), {tx1}));

    UxArray ofAddr1 = pool.GetUnspentsOfAddr(addr1);
    BOOST_CHECK_EQUAL(ofAddr1.size(), 2U);
    for (const CUxOut& ux : ofAddr1) {
        BOOST_CHECK_EQUAL(ux.body.address, addr1);
    }
    BOOST_CHECK(pool.GetUnspentsOfAddr(addr3).empty());

    AddressUxOuts grouped = pool.GetUnspentsOfAddrs({addr1, addr3});
    BOOST_CHECK_EQUAL(grouped.size(), 1U);
    BOOST_REQUIRE(grouped.count(addr1) == 1);
    BOOST_CHECK_EQUAL(grouped[addr1].size(), 2U);
    BOOST_CHECK(grouped.count(addr2) == 0);
    BOOST_CHECK(grouped.count(addr3) == 0);
}

BOOST_AUTO_TEST_CASE(block_handler_rolled_back_by_update) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});

    TxHandler failing = [](CDBTransaction&, UndoAction&, std::string& error) {
        error = "sibling refused the block";
        return false;
    };

    std::string error;
    BOOST_CHECK(!db.Update({pool.BlockHandler(block1), failing}, error));
    BOOST_CHECK_EQUAL(error, "sibling refused the block");
    BOOST_CHECK_EQUAL(pool.Len(), 0U);
    BOOST_CHECK(pool.GetUxHash().IsNull());
    CheckConsistent();

    BOOST_CHECK(db.Update({pool.BlockHandler(block1)}, error));
    BOOST_CHECK_EQUAL(pool.Len(), 1U);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(corrupt_record_fails_open) {
    CDBBucket bucket = db.CreateBucket(CUnspentPool::POOL_BUCKET);
    uint256 id = MakeTestHash(5);

    std::string error;
    std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(error);
    BOOST_REQUIRE(tx);
    BOOST_REQUIRE(tx->Put(bucket, std::string(reinterpret_cast<const char*>(id.begin()), 32), "garbage", error));
    BOOST_REQUIRE(tx->Commit(error));
    tx.reset();

    CUnspentPool reloaded;
    CUnspentError open_error;
    BOOST_CHECK(!reloaded.Open(db, open_error));
    BOOST_CHECK(open_error.type == UnspentErrorType::DECODE_ERROR);
}

BOOST_AUTO_TEST_CASE(verify_detects_divergence) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);
    CheckConsistent();

    // A record written behind the pool's back
    CUxOut stray = CreateUnspents(block1.GetBlockHeader(),
                                  MakeTestTransaction({}, {CTxOut(MakeTestAddress(2), 5, 5)}))[0];
    uint256 id = stray.GetHash();
    CDBBucket bucket = db.CreateBucket(CUnspentPool::POOL_BUCKET);

    std::string error;
    std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(error);
    BOOST_REQUIRE(tx);
    BOOST_REQUIRE(tx->Put(bucket, std::string(reinterpret_cast<const char*>(id.begin()), 32),
                          SerializeUxOut(stray), error));
    BOOST_REQUIRE(tx->Commit(error));
    tx.reset();

    CUnspentError verify_error;
    BOOST_CHECK(!pool.VerifyConsistency(verify_error));
    BOOST_CHECK(verify_error.type == UnspentErrorType::STORE_ERROR);
}

BOOST_AUTO_TEST_CASE(process_block_requires_open_pool) {
    CUnspentPool closed;
    std::string db_error;
    std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(db_error);
    BOOST_REQUIRE(tx);

    UndoAction undo;
    CUnspentError error;
    BOOST_CHECK(!closed.ProcessBlock(MakeTestBlock(0, uint256(), {}), *tx, undo, error));
    BOOST_CHECK(error.type == UnspentErrorType::STORE_ERROR);
    BOOST_CHECK(!undo);
}

BOOST_AUTO_TEST_CASE(spend_of_record_missing_from_store) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);
    uint256 spent = CreateUnspents(block1.GetBlockHeader(), tx1)[0].GetHash();

    // Remove the record from the store but not from the cache
    CDBBucket bucket = db.CreateBucket(CUnspentPool::POOL_BUCKET);
    std::string db_error;
    {
        std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(db_error);
        BOOST_REQUIRE(tx);
        BOOST_REQUIRE(tx->Delete(bucket, StoreKey(spent), db_error));
        BOOST_REQUIRE(tx->Commit(db_error));
    }

    uint256 hashBefore = pool.GetUxHash();
    CTransaction tx2 = MakeTestTransaction({spent}, {CTxOut(MakeTestAddress(2), 100, 10)});
    CUnspentError error;
    BOOST_CHECK(!Apply(MakeTestBlock(1, block1.GetHash(), {tx2}), error));
    BOOST_CHECK(error.type == UnspentErrorType::STORE_ERROR);
    BOOST_CHECK_EQUAL(error.hash, spent);

    BOOST_CHECK(pool.Contains(spent));
    BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);

    CUnspentError verify_error;
    bool consistent = pool.VerifyConsistency(verify_error);
    BOOST_CHECK(!consistent);
}

BOOST_AUTO_TEST_CASE(undecodable_record_on_spend) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);
    uint256 spent = CreateUnspents(block1.GetBlockHeader(), tx1)[0].GetHash();

    StorePut(CUnspentPool::POOL_BUCKET, StoreKey(spent), "garbage");

    uint256 hashBefore = pool.GetUxHash();
    CTransaction tx2 = MakeTestTransaction({spent}, {CTxOut(MakeTestAddress(2), 100, 10)});
    CUnspentError error;
    BOOST_CHECK(!Apply(MakeTestBlock(1, block1.GetHash(), {tx2}), error));
    BOOST_CHECK(error.type == UnspentErrorType::DECODE_ERROR);
    BOOST_CHECK_EQUAL(error.hash, spent);
    BOOST_CHECK(pool.Contains(spent));
    BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);
}

BOOST_AUTO_TEST_CASE(malformed_stored_hash) {
    StorePut(CUnspentPool::META_BUCKET, CUnspentPool::XORHASH_KEY, "short");

    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CUnspentError error;
    BOOST_CHECK(!Apply(MakeTestBlock(0, uint256(), {tx1}), error));
    BOOST_CHECK(error.type == UnspentErrorType::DECODE_ERROR);
    BOOST_CHECK_EQUAL(pool.Len(), 0U);
    BOOST_CHECK(pool.GetUxHash().IsNull());

    CUnspentPool reloaded;
    CUnspentError open_error;
    BOOST_CHECK(!reloaded.Open(db, open_error));
    BOOST_CHECK(open_error.type == UnspentErrorType::DECODE_ERROR);
    BOOST_CHECK(!reloaded.IsOpen());
}

BOOST_AUTO_TEST_CASE(store_exception_becomes_internal_fault) {
    CTransaction tx1 = MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)});
    CBlock block1 = MakeTestBlock(0, uint256(), {tx1});
    ApplyOrFail(block1);
    uint256 spent = CreateUnspents(block1.GetBlockHeader(), tx1)[0].GetHash();
    uint256 hashBefore = pool.GetUxHash();

    // Transactions of another store throw on writes through the pool's buckets
    TestDirectory otherDir("unspent_pool_other");
    CDBWrapper other;
    DBOptions options;
    options.sync = false;
    std::string db_error;
    BOOST_REQUIRE_MESSAGE(other.Open(otherDir.path, options, db_error), db_error);

    {
        CTransaction create = MakeTestTransaction({}, {CTxOut(MakeTestAddress(2), 5, 5)});
        std::unique_ptr<CDBTransaction> tx = other.BeginTransaction(db_error);
        BOOST_REQUIRE(tx);

        UndoAction undo;
        CUnspentError error;
        BOOST_CHECK(!pool.ProcessBlock(MakeTestBlock(1, block1.GetHash(), {create}), *tx, undo, error));
        BOOST_CHECK(error.type == UnspentErrorType::INTERNAL_FAULT);
        BOOST_CHECK(!undo);
    }

    // Make the spent record readable through the other store so the delete is reached
    CUxOut ux;
    BOOST_REQUIRE(pool.Get(spent, ux));
    {
        CDBBucket otherPool = other.CreateBucket(CUnspentPool::POOL_BUCKET);
        std::unique_ptr<CDBTransaction> tx = other.BeginTransaction(db_error);
        BOOST_REQUIRE(tx);
        BOOST_REQUIRE(tx->Put(otherPool, StoreKey(spent), SerializeUxOut(ux), db_error));
        BOOST_REQUIRE(tx->Commit(db_error));
    }
    {
        CTransaction spend = MakeTestTransaction({spent}, {CTxOut(MakeTestAddress(3), 100, 10)});
        std::unique_ptr<CDBTransaction> tx = other.BeginTransaction(db_error);
        BOOST_REQUIRE(tx);

        UndoAction undo;
        CUnspentError error;
        BOOST_CHECK(!pool.ProcessBlock(MakeTestBlock(1, block1.GetHash(), {spend}), *tx, undo, error));
        BOOST_CHECK(error.type == UnspentErrorType::INTERNAL_FAULT);
        BOOST_CHECK_EQUAL(error.hash, spent);
        BOOST_CHECK(!undo);
    }

    BOOST_CHECK(pool.Contains(spent));
    BOOST_CHECK_EQUAL(pool.Len(), 1U);
    BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);
    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(random_blocks_keep_checksum) {
    std::mt19937 rng(20171105);

    for (uint64_t step = 0; step < 60; step++) {
        UxArray all = pool.GetAll();
        std::shuffle(all.begin(), all.end(), rng);

        size_t spends = rng() % (std::min<size_t>(all.size(), 3) + 1);
        std::vector<uint256> vin;
        for (size_t i = 0; i < spends; i++) {
            vin.push_back(all[i].GetHash());
        }

        size_t outputs = 1 + rng() % 3;
        std::vector<CTxOut> vout;
        for (size_t j = 0; j < outputs; j++) {
            vout.push_back(CTxOut(MakeTestAddress(static_cast<uint8_t>(rng() % 4)), step * 10 + j + 1, rng() % 100));
        }

        CBlock block = MakeTestBlock(step, MakeTestHash(static_cast<uint8_t>(step)),
                                     {MakeTestTransaction(vin, vout)});

        size_t lenBefore = pool.Len();
        uint256 hashBefore = pool.GetUxHash();

        std::string db_error;
        std::unique_ptr<CDBTransaction> tx = db.BeginTransaction(db_error);
        BOOST_REQUIRE(tx);

        UndoAction undo;
        CUnspentError error;
        BOOST_REQUIRE_MESSAGE(pool.ProcessBlock(block, *tx, undo, error), error.ToString());
        BOOST_CHECK_EQUAL(pool.Len(), lenBefore - spends + outputs);

        if (rng() % 3 == 0) {
            tx.reset();
            undo();
            BOOST_CHECK_EQUAL(pool.Len(), lenBefore);
            BOOST_CHECK_EQUAL(pool.GetUxHash(), hashBefore);
        } else {
            BOOST_REQUIRE_MESSAGE(tx->Commit(db_error), db_error);
            tx.reset();
        }

        BOOST_CHECK_EQUAL(pool.GetUxHash(), XorSnapshotHashes(pool.GetAll()));
        if (step % 10 == 9) {
            CheckConsistent();
        }
    }

    CheckConsistent();
}

BOOST_AUTO_TEST_CASE(rollback_blocks_other_writers) {
    CBlock block1 = MakeTestBlock(0, uint256(), {MakeTestTransaction({}, {CTxOut(MakeTestAddress(1), 100, 10)})});
    CBlock block2 = MakeTestBlock(1, uint256(), {MakeTestTransaction({}, {CTxOut(MakeTestAddress(2), 200, 20)})});

    std::thread other;
    std::atomic<bool> otherDone{false};
    bool otherOk = false;
    std::string otherError;
    bool committedDuringRollback = false;

    // Starts a second writer while the rollback is running and gives it time to commit
    TxHandler sibling = [&](CDBTransaction&, UndoAction& undo, std::string&) {
        undo = [&]() {
            other = std::thread([&]() {
                otherOk = db.Update({pool.BlockHandler(block2)}, otherError);
                otherDone = true;
            });
            for (int i = 0; i < 50 && !otherDone; i++) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            committedDuringRollback = otherDone;
        };
        return true;
    };
    TxHandler failing = [](CDBTransaction&, UndoAction&, std::string& error) {
        error = "refused";
        return false;
    };

    std::string error;
    BOOST_CHECK(!db.Update({pool.BlockHandler(block1), sibling, failing}, error));
    BOOST_REQUIRE(other.joinable());
    other.join();

    BOOST_CHECK(!committedDuringRollback);
    BOOST_CHECK_MESSAGE(otherOk, otherError);
    BOOST_CHECK_EQUAL(pool.Len(), 1U);
    BOOST_CHECK(pool.Contains(CreateUnspents(block2.GetBlockHeader(), block2.vtx[0])[0].GetHash()));
    CheckConsistent();
}

BOOST_AUTO_TEST_SUITE_END()
