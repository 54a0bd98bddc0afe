#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "files/download_manager.hpp"
#include "files/chunker.hpp"
#include "crypto/hasher.hpp"

#include <fstream>
#include <future>
#include <map>
#include <random>
#include <thread>

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::AtLeast;

namespace {

class MockMetadataSink : public MetadataSink {
public:
    MOCK_METHOD(void, record_peer, (const dht::Contact& contact), (override));
    MOCK_METHOD(void, record_shared_file, (const Manifest& manifest, const std::filesystem::path& source_path),
                (override));
    MOCK_METHOD(void, record_download,
                (const std::string& info_hash_hex, const std::string& file_name, const std::string& status,
                 const std::string& output_path),
                (override));
};

// Answers with whatever a fixed list of peers was configured with.
class FakeLocator : public ProviderLocator {
public:
    FakeLocator(asio::io_context& io, std::vector<PeerAddress> providers)
        : io_(io), providers_(std::move(providers)) {}

    void find_providers(const hash_t& /*info_hash*/, ProvidersCallback callback) override {
        lookups++;
        asio::post(io_, [callback = std::move(callback), providers = providers_]() {
            callback(providers);
        });
    }

    int lookups = 0;

private:
    asio::io_context& io_;
    std::vector<PeerAddress> providers_;
};

enum class PeerBehavior {
    Honest,   // serves what it holds, NOT_FOUND otherwise
    Dead,     // every request fails to connect
    Corrupt,  // serves bytes that do not match the requested hash
    Silent    // never answers
};

struct FakePeer {
    PeerBehavior behavior = PeerBehavior::Honest;
    std::optional<Manifest> manifest;
    std::map<hash_t, std::vector<uint8_t>> chunks;
    int chunk_requests = 0;
    int corrupt_replies = 0; // next chunk replies sent as garbage
};

class FakeChunkSource : public ChunkSource {
public:
    explicit FakeChunkSource(asio::io_context& io) : io_(io) {}

    FakePeer& peer(const PeerAddress& address) { return peers_[address.to_string()]; }

    void request_manifest(const PeerAddress& address, const hash_t& info_hash, BytesCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        FakePeer& p = peers_[address.to_string()];
        switch (p.behavior) {
            case PeerBehavior::Dead:
                reply(std::move(callback), TransferStatus::ConnectionFailed, {});
                return;
            case PeerBehavior::Silent:
                held_.push_back(std::move(callback));
                return;
            default:
                break;
        }
        if (p.manifest && p.manifest->info_hash == info_hash) {
            std::string text = nlohmann::json(*p.manifest).dump();
            reply(std::move(callback), TransferStatus::Ok, std::vector<uint8_t>(text.begin(), text.end()));
        } else {
            reply(std::move(callback), TransferStatus::NotFound, {});
        }
    }

    void request_chunk(const PeerAddress& address, const hash_t& chunk_hash, BytesCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        FakePeer& p = peers_[address.to_string()];
        p.chunk_requests++;
        switch (p.behavior) {
            case PeerBehavior::Dead:
                reply(std::move(callback), TransferStatus::ConnectionFailed, {});
                return;
            case PeerBehavior::Silent:
                held_.push_back(std::move(callback));
                return;
            case PeerBehavior::Corrupt:
                reply(std::move(callback), TransferStatus::Ok, std::vector<uint8_t>(64, 0xee));
                return;
            case PeerBehavior::Honest:
                break;
        }
        if (p.corrupt_replies > 0) {
            p.corrupt_replies--;
            reply(std::move(callback), TransferStatus::Ok, std::vector<uint8_t>(64, 0xee));
            return;
        }
        auto it = p.chunks.find(chunk_hash);
        if (it != p.chunks.end()) {
            reply(std::move(callback), TransferStatus::Ok, it->second);
        } else {
            reply(std::move(callback), TransferStatus::NotFound, {});
        }
    }

    int chunk_requests(const PeerAddress& address) {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_[address.to_string()].chunk_requests;
    }

private:
    void reply(BytesCallback callback, TransferStatus status, std::vector<uint8_t> data) {
        asio::post(io_, [callback = std::move(callback), status, data = std::move(data)]() mutable {
            callback(status, std::move(data));
        });
    }

    asio::io_context& io_;
    std::mutex mutex_;
    std::map<std::string, FakePeer> peers_;
    std::vector<BytesCallback> held_;
};

class DownloadManagerTest : public ::testing::Test {
protected:
    fs::path dir_;
    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;

    std::vector<uint8_t> content_;
    Manifest manifest_;
    std::unique_ptr<ChunkStore> seed_store_;
    std::unique_ptr<ChunkStore> store_;

    const PeerAddress alice_{"10.0.0.1", 7001};
    const PeerAddress bob_{"10.0.0.2", 7001};

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("lanshare_dm_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        // Ten chunks, the last one short.
        std::mt19937 rng(42);
        content_.resize(CHUNK_SIZE * 9 + 777);
        for (auto& b : content_) {
            b = static_cast<uint8_t>(rng() & 0xff);
        }
        {
            std::ofstream out(dir_ / "movie.bin", std::ios::binary);
            out.write(reinterpret_cast<const char*>(content_.data()), static_cast<std::streamsize>(content_.size()));
        }
        seed_store_ = std::make_unique<ChunkStore>(dir_ / "seed");
        manifest_ = Chunker::chunk_file(dir_ / "movie.bin", *seed_store_);
        store_ = std::make_unique<ChunkStore>(dir_ / "local");

        work_.emplace(asio::make_work_guard(io_));
        for (int i = 0; i < 2; ++i) {
            threads_.emplace_back([this]() { io_.run(); });
        }
    }

    void TearDown() override {
        work_.reset();
        io_.stop();
        for (auto& t : threads_) {
            t.join();
        }
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // Gives `peer` the manifest and the chunks with the listed indices.
    void seed(FakePeer& peer, const std::vector<size_t>& indices) {
        peer.manifest = manifest_;
        for (size_t i : indices) {
            auto data = seed_store_->get_chunk(manifest_.chunk_hashes[i]);
            ASSERT_TRUE(data.has_value());
            peer.chunks[manifest_.chunk_hashes[i]] = *data;
        }
    }

    std::vector<size_t> range(size_t from, size_t to) {
        std::vector<size_t> out;
        for (size_t i = from; i < to; ++i) out.push_back(i);
        return out;
    }

    DownloadOptions options() {
        DownloadOptions opts;
        opts.download_dir = dir_ / "downloads";
        return opts;
    }

    // Runs a session to a terminal phase.
    DownloadSnapshot run(const std::shared_ptr<DownloadManager>& session) {
        auto done = std::make_shared<std::promise<DownloadSnapshot>>();
        auto result = done->get_future();
        session->set_completion_handler([done](const DownloadSnapshot& snap) { done->set_value(snap); });
        session->start();
        EXPECT_EQ(result.wait_for(std::chrono::seconds(20)), std::future_status::ready);
        return result.get();
    }

    std::vector<uint8_t> read_output(const DownloadSnapshot& snap) {
        std::ifstream in(snap.output_path, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

} // namespace

TEST_F(DownloadManagerTest, AssemblesFileFromDisjointPeers) {
    FakeLocator locator(io_, {alice_, bob_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), range(0, 5));
    seed(source.peer(bob_), range(5, 10));

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;
    EXPECT_EQ(snap.totals.chunks_done, 10u);
    EXPECT_DOUBLE_EQ(snap.totals.percent, 100.0);
    EXPECT_EQ(fs::path(snap.output_path).filename(), "movie.bin");
    EXPECT_EQ(read_output(snap), content_);

    for (const auto& chunk : snap.chunks) {
        EXPECT_EQ(chunk.status, ChunkStatus::Complete);
    }
    size_t completed = 0;
    for (const auto& peer : snap.peers) {
        completed += peer.completed;
    }
    EXPECT_EQ(completed, 10u);
    // The fetched manifest is kept for later resumes.
    EXPECT_TRUE(store_->get_manifest(manifest_.info_hash).has_value());
}

TEST_F(DownloadManagerTest, HashMismatchPenalizesPeerAndRecovers) {
    FakeLocator locator(io_, {alice_, bob_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), {});
    source.peer(alice_).behavior = PeerBehavior::Corrupt;
    seed(source.peer(bob_), range(0, 10));

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;
    EXPECT_EQ(read_output(snap), content_);

    for (const auto& peer : snap.peers) {
        if (peer.peer == alice_.to_string()) {
            EXPECT_GT(peer.failed, 0u);
            EXPECT_EQ(peer.completed, 0u);
            EXPECT_FALSE(peer.active);
        } else {
            EXPECT_EQ(peer.completed, 10u);
        }
    }
    // Penalized after max_peer_failures bad chunks.
    EXPECT_LE(source.chunk_requests(alice_), static_cast<int>(options().max_peer_failures + options().per_peer_inflight));
}

TEST_F(DownloadManagerTest, SingleBadChunkCountsOnceAndIsNotStored) {
    FakeLocator locator(io_, {alice_, bob_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), range(0, 10));
    source.peer(alice_).corrupt_replies = 1;
    seed(source.peer(bob_), range(0, 10));

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;
    EXPECT_EQ(read_output(snap), content_);
    EXPECT_FALSE(store_->has_chunk(Hasher::sha256(std::vector<uint8_t>(64, 0xee))));

    bool seen = false;
    for (const auto& peer : snap.peers) {
        if (peer.peer == alice_.to_string()) {
            seen = true;
            EXPECT_EQ(peer.failed, 1u);
            EXPECT_TRUE(peer.active);
        } else {
            EXPECT_EQ(peer.failed, 0u);
        }
    }
    EXPECT_TRUE(seen);
}

TEST_F(DownloadManagerTest, DeadPeerDoesNotBlockDownload) {
    FakeLocator locator(io_, {alice_, bob_});
    FakeChunkSource source(io_);
    source.peer(alice_).behavior = PeerBehavior::Dead;
    seed(source.peer(bob_), range(0, 10));

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;
    EXPECT_EQ(read_output(snap), content_);
}

TEST_F(DownloadManagerTest, NoProvidersFails) {
    FakeLocator locator(io_, {});
    FakeChunkSource source(io_);
    MockMetadataSink sink;
    EXPECT_CALL(sink, record_download(Hasher::hash_to_hex(manifest_.info_hash), _, _, _)).Times(AnyNumber());
    EXPECT_CALL(sink, record_download(_, _, "failed", _)).Times(1);

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options(),
                                                     &sink);
    DownloadSnapshot snap = run(session);

    EXPECT_EQ(snap.phase, DownloadPhase::Failed);
    EXPECT_EQ(snap.message, "no providers");
    EXPECT_EQ(locator.lookups, 1);
}

TEST_F(DownloadManagerTest, MissingChunksEndInsufficient) {
    FakeLocator locator(io_, {alice_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), range(0, 7));

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    EXPECT_EQ(snap.phase, DownloadPhase::Failed);
    EXPECT_EQ(snap.message, "insufficient chunks");
    EXPECT_EQ(snap.totals.chunks_done, 7u);
    for (size_t i = 7; i < 10; ++i) {
        EXPECT_EQ(snap.chunks[i].status, ChunkStatus::Failed);
    }
    // Verified chunks stay in the store.
    EXPECT_EQ(store_->missing_chunks(manifest_).size(), 3u);
}

TEST_F(DownloadManagerTest, ManifestNotFoundAnywhereFails) {
    FakeLocator locator(io_, {alice_, bob_});
    FakeChunkSource source(io_);
    source.peer(bob_).behavior = PeerBehavior::Dead;

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    EXPECT_EQ(snap.phase, DownloadPhase::Failed);
    EXPECT_EQ(snap.message, "manifest not found");
}

TEST_F(DownloadManagerTest, CancelEndsSessionAsFailed) {
    FakeLocator locator(io_, {alice_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), range(0, 10));
    source.peer(alice_).behavior = PeerBehavior::Silent;

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    auto done = std::make_shared<std::promise<DownloadSnapshot>>();
    auto result = done->get_future();
    session->set_completion_handler([done](const DownloadSnapshot& snap) { done->set_value(snap); });
    session->start();

    // Wait until the session is blocked on the silent peer.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (session->phase() != DownloadPhase::FindingPeers && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    session->cancel();

    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    DownloadSnapshot snap = result.get();
    EXPECT_EQ(snap.phase, DownloadPhase::Failed);
    EXPECT_EQ(snap.message, "cancelled");
    EXPECT_TRUE(session->events().closed());
}

TEST_F(DownloadManagerTest, CompleteLocalCopyNeedsNoPeers) {
    FakeLocator locator(io_, {});
    FakeChunkSource source(io_);
    for (const auto& h : manifest_.chunk_hashes) {
        ASSERT_TRUE(store_->put_chunk(h, *seed_store_->get_chunk(h)));
    }
    store_->put_manifest(manifest_);

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;
    EXPECT_EQ(locator.lookups, 0);
    EXPECT_EQ(read_output(snap), content_);
}

TEST_F(DownloadManagerTest, ResumeFetchesOnlyMissingChunks) {
    FakeLocator locator(io_, {alice_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), range(0, 10));
    for (size_t i = 0; i < 6; ++i) {
        const auto& h = manifest_.chunk_hashes[i];
        ASSERT_TRUE(store_->put_chunk(h, *seed_store_->get_chunk(h)));
    }
    store_->put_manifest(manifest_);

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options());
    DownloadSnapshot snap = run(session);

    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;
    EXPECT_EQ(source.chunk_requests(alice_), 4);
    EXPECT_EQ(read_output(snap), content_);
}

TEST_F(DownloadManagerTest, EventStreamIsOrderedAndEndsTerminal) {
    FakeLocator locator(io_, {alice_, bob_});
    FakeChunkSource source(io_);
    seed(source.peer(alice_), range(0, 10));
    seed(source.peer(bob_), range(0, 10));

    MockMetadataSink sink;
    EXPECT_CALL(sink, record_download(_, _, _, _)).Times(AtLeast(1));
    EXPECT_CALL(sink, record_download(_, "movie.bin", "complete", _)).Times(1);

    auto session = std::make_shared<DownloadManager>(io_, manifest_.info_hash, *store_, locator, source, options(),
                                                     &sink);
    run(session);

    auto events = session->events().read_from(1);
    ASSERT_FALSE(events.empty());
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].seq, i + 1);
    }
    EXPECT_EQ(events.back().type, EventType::PhaseChanged);
    EXPECT_EQ(events.back().phase, DownloadPhase::Complete);

    std::vector<DownloadPhase> phases;
    for (const auto& e : events) {
        if (e.type == EventType::PhaseChanged) {
            phases.push_back(e.phase);
        }
    }
    std::vector<DownloadPhase> expected = {DownloadPhase::Initializing, DownloadPhase::FindingPeers,
                                           DownloadPhase::Downloading, DownloadPhase::Merging,
                                           DownloadPhase::Complete};
    EXPECT_EQ(phases, expected);
}
