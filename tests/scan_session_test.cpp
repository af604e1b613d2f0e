#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "scan_session.hpp"
#include "transfer_codec.hpp"

using QrTransfer::TransferCodec;
using QrTransfer::TransferError;
using QrTransfer::Chunks::Chunk;
using QrTransfer::Session::ScanOutcome;
using QrTransfer::Session::ScanSession;
using QrTransfer::Session::ScanState;

namespace {

nlohmann::json notes(const std::string& title) {
    nlohmann::json entry{{"id", "1"}, {"title", title}};
    nlohmann::json day;
    day["2025-06-01"] = nlohmann::json::array({entry});
    return nlohmann::json{{"notes", day}};
}

// Small chunk size so ordinary notes span several codes
std::vector<Chunk> exportNotes(const std::string& title) {
    return TransferCodec::compressAndChunk(notes(title), 24);
}

} // namespace

class ScanSessionTest : public ::testing::Test {
protected:
    ScanSessionTest() : session(64) {}

    void SetUp() override {
        chunks = exportNotes("Quarterly planning");
        ASSERT_GE(chunks.size(), 3u);
    }

    ScanSession session;
    std::vector<Chunk> chunks;
};

TEST_F(ScanSessionTest, StartsEmpty) {
    const auto progress = session.progress();
    EXPECT_EQ(progress.state, ScanState::Empty);
    EXPECT_EQ(progress.received, 0u);
    EXPECT_TRUE(progress.missing.empty());
    EXPECT_EQ(session.reassemble().error, TransferError::IncompleteSet);
}

TEST_F(ScanSessionTest, CollectsOutOfOrderUntilComplete) {
    EXPECT_EQ(session.accept(chunks.back()), ScanOutcome::Started);

    auto progress = session.progress();
    EXPECT_EQ(progress.state, ScanState::Collecting);
    EXPECT_EQ(progress.fingerprint, chunks.front().fingerprint);
    EXPECT_EQ(progress.total, chunks.size());
    EXPECT_EQ(progress.received, 1u);
    EXPECT_EQ(progress.missing.size(), chunks.size() - 1);
    EXPECT_EQ(progress.missing.front(), 1u);

    for (size_t k = 0; k + 2 < chunks.size(); ++k) {
        EXPECT_EQ(session.accept(chunks[k]), ScanOutcome::Added);
    }
    EXPECT_EQ(session.reassemble().error, TransferError::IncompleteSet);

    progress = session.progress();
    ASSERT_EQ(progress.missing.size(), 1u);
    EXPECT_EQ(progress.missing.front(), chunks.size() - 1);

    EXPECT_EQ(session.accept(chunks[chunks.size() - 2]), ScanOutcome::Completed);
    EXPECT_EQ(session.progress().state, ScanState::Complete);

    const auto result = session.reassemble();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.value, notes("Quarterly planning"));
}

TEST_F(ScanSessionTest, DuplicateScansAreIgnored) {
    EXPECT_EQ(session.accept(chunks[0]), ScanOutcome::Started);
    EXPECT_EQ(session.accept(chunks[0]), ScanOutcome::Duplicate);
    EXPECT_EQ(session.progress().received, 1u);
}

TEST_F(ScanSessionTest, NewFingerprintRestartsCollection) {
    const auto other = exportNotes("Something else entirely");
    ASSERT_NE(other.front().fingerprint, chunks.front().fingerprint);

    session.accept(chunks[0]);
    session.accept(chunks[1]);
    EXPECT_EQ(session.accept(other[0]), ScanOutcome::Restarted);

    const auto progress = session.progress();
    EXPECT_EQ(progress.fingerprint, other.front().fingerprint);
    EXPECT_EQ(progress.total, other.size());
    EXPECT_EQ(progress.received, 1u);

    for (size_t k = 1; k < other.size(); ++k) {
        session.accept(other[k]);
    }
    const auto result = session.reassemble();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result.value, notes("Something else entirely"));
}

TEST_F(ScanSessionTest, SingleChunkTransferCompletesImmediately) {
    const auto single = TransferCodec::compressAndChunk(notes("short"));
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(session.accept(single[0]), ScanOutcome::Completed);
    EXPECT_TRUE(session.reassemble().ok());
}

TEST_F(ScanSessionTest, RejectsInvalidChunks) {
    Chunk zero_index = chunks[0];
    zero_index.index = 0;
    EXPECT_EQ(session.accept(zero_index), ScanOutcome::Rejected);

    Chunk past_total = chunks[0];
    past_total.index = past_total.total + 1;
    EXPECT_EQ(session.accept(past_total), ScanOutcome::Rejected);

    Chunk zero_total = chunks[0];
    zero_total.total = 0;
    EXPECT_EQ(session.accept(zero_total), ScanOutcome::Rejected);

    Chunk future_version = chunks[0];
    future_version.version = 2;
    EXPECT_EQ(session.accept(future_version), ScanOutcome::Rejected);

    EXPECT_EQ(session.progress().state, ScanState::Empty);
}

TEST_F(ScanSessionTest, EnforcesChunkCountCeiling) {
    ScanSession small(2);
    EXPECT_EQ(small.accept(chunks[0]), ScanOutcome::Rejected);
    EXPECT_EQ(small.progress().state, ScanState::Empty);
}

TEST_F(ScanSessionTest, WireTextIsDecodedFirst) {
    EXPECT_EQ(session.acceptWire("not a chunk"), ScanOutcome::Rejected);
    EXPECT_EQ(session.acceptWire("{\"v\":1,\"i\":1}"), ScanOutcome::Rejected);
    EXPECT_EQ(session.progress().state, ScanState::Empty);

    for (const auto& chunk : chunks) {
        session.acceptWire(TransferCodec::encodeChunkToWire(chunk));
    }
    EXPECT_EQ(session.progress().state, ScanState::Complete);
    EXPECT_TRUE(session.reassemble().ok());
}

TEST_F(ScanSessionTest, TamperedChunkCompletesButFailsIntegrity) {
    for (auto chunk : chunks) {
        if (chunk.index == 2) {
            chunk.slice[0] = chunk.slice[0] == 'A' ? 'B' : 'A';
        }
        session.accept(chunk);
    }
    EXPECT_EQ(session.progress().state, ScanState::Complete);
    EXPECT_EQ(session.reassemble().error, TransferError::FinalIntegrityFailure);
}

TEST_F(ScanSessionTest, ResetDiscardsEverything) {
    session.accept(chunks[0]);
    session.accept(chunks[1]);
    session.reset();

    const auto progress = session.progress();
    EXPECT_EQ(progress.state, ScanState::Empty);
    EXPECT_TRUE(progress.fingerprint.empty());
    EXPECT_EQ(session.accept(chunks[0]), ScanOutcome::Started);
}

TEST_F(ScanSessionTest, ConcurrentScansOfOneTransfer) {
    std::vector<std::thread> scanners;
    for (const auto& chunk : chunks) {
        scanners.emplace_back([this, chunk] {
            session.accept(chunk);
            session.accept(chunk);
        });
    }
    for (auto& scanner : scanners) {
        scanner.join();
    }
    EXPECT_EQ(session.progress().state, ScanState::Complete);
    EXPECT_TRUE(session.reassemble().ok());
}
