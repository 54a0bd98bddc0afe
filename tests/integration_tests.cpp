#include "gtest/gtest.h"
#include "dht/dht_node.hpp"
#include "node/node_controller.hpp"
#include "network/connection.hpp"
#include "files/chunker.hpp"
#include "crypto/hasher.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <fstream>
#include <functional>
#include <future>
#include <random>
#include <set>
#include <thread>

namespace {

template <typename T>
T wait_result(std::future<T>& future, std::chrono::seconds timeout = std::chrono::seconds(15)) {
    EXPECT_EQ(future.wait_for(timeout), std::future_status::ready);
    return future.get();
}

// Runs one io_context on a few threads for the duration of a test.
class IoTest : public ::testing::Test {
protected:
    asio::io_context io_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;

    void start_io() {
        work_.emplace(asio::make_work_guard(io_));
        for (int i = 0; i < 3; ++i) {
            threads_.emplace_back([this]() { io_.run(); });
        }
    }

    void stop_io() {
        work_.reset();
        io_.stop();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }
};

class DhtNetworkTest : public IoTest {
protected:
    std::vector<std::unique_ptr<dht::DhtNode>> nodes_;

    void SetUp() override {
        for (int i = 0; i < 3; ++i) {
            dht::DhtOptions options;
            options.host = "127.0.0.1";
            options.port = 0;
            options.transfer_port = static_cast<uint16_t>(7100 + i);
            options.rpc_timeout = std::chrono::milliseconds(500);
            nodes_.push_back(std::make_unique<dht::DhtNode>(
                io_, dht::node_id_from_seed("dht-test-" + std::to_string(i)), options));
        }
        for (auto& node : nodes_) {
            node->start();
        }
        start_io();

        // b and c join through a.
        for (size_t i = 1; i < nodes_.size(); ++i) {
            std::promise<size_t> joined;
            auto future = joined.get_future();
            nodes_[i]->bootstrap({endpoint_of(0)}, [&joined](size_t answered) { joined.set_value(answered); });
            ASSERT_EQ(wait_result(future), 1u);
        }
    }

    void TearDown() override {
        for (auto& node : nodes_) {
            node->stop();
        }
        stop_io();
        nodes_.clear();
    }

    asio::ip::udp::endpoint endpoint_of(size_t i) {
        return asio::ip::udp::endpoint(asio::ip::address_v4::loopback(), nodes_[i]->local_port());
    }
};

class NodeControllerTest : public IoTest {
protected:
    fs::path dir_;
    std::vector<std::unique_ptr<NodeController>> nodes_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("lanshare_it_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        for (auto& node : nodes_) {
            node->stop();
        }
        stop_io();
        nodes_.clear();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    NodeController& add_node(const std::string& name, std::function<void(NodeConfig&)> adjust = nullptr) {
        NodeConfig config;
        config.host = "127.0.0.1";
        config.dht_port = 0;
        config.transfer_port = 0;
        config.data_dir = dir_ / name;
        config.download_dir = dir_ / name / "files";
        config.node_id_seed = name;
        config.rpc_timeout_ms = 500;
        config.transfer_timeout_ms = 5000;
        if (adjust) {
            adjust(config);
        }
        nodes_.push_back(std::make_unique<NodeController>(io_, config));
        return *nodes_.back();
    }

    size_t join(NodeController& node, NodeController& seed) {
        std::promise<size_t> joined;
        auto future = joined.get_future();
        node.bootstrap({"127.0.0.1:" + std::to_string(seed.dht().local_port())},
                       [&joined](size_t answered) { joined.set_value(answered); });
        return wait_result(future);
    }

    size_t share(NodeController& node, const fs::path& path, std::string& hex) {
        std::promise<size_t> announced;
        auto future = announced.get_future();
        hex = node.share(path, [&announced](size_t acks) { announced.set_value(acks); });
        return wait_result(future);
    }

    std::vector<uint8_t> write_random_file(const fs::path& path, size_t size) {
        std::mt19937 rng(7);
        std::vector<uint8_t> data(size);
        for (auto& b : data) {
            b = static_cast<uint8_t>(rng() & 0xff);
        }
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return data;
    }

    static DownloadSnapshot wait_terminal(const std::shared_ptr<DownloadManager>& session) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (!is_terminal(session->phase()) && std::chrono::steady_clock::now() < deadline) {
            session->events().wait_for(session->events().size() + 1, std::chrono::milliseconds(200));
        }
        return session->snapshot();
    }
};

} // namespace

// --- DHT over loopback UDP ---

TEST_F(DhtNetworkTest, FindNodeLocatesPeerLearnedThroughSeed) {
    std::promise<std::vector<dht::Contact>> found;
    auto future = found.get_future();
    nodes_[2]->find_node(nodes_[1]->get_self_id(),
                         [&found](std::vector<dht::Contact> contacts) { found.set_value(std::move(contacts)); });

    auto contacts = wait_result(future);
    ASSERT_FALSE(contacts.empty());
    EXPECT_EQ(contacts.front().id, nodes_[1]->get_self_id());
    std::set<dht::NodeID> ids;
    for (size_t i = 0; i < contacts.size(); ++i) {
        EXPECT_TRUE(ids.insert(contacts[i].id).second);
        if (i > 0) {
            EXPECT_FALSE(dht::is_closer(dht::xor_distance(contacts[i].id, nodes_[1]->get_self_id()),
                                        dht::xor_distance(contacts[i - 1].id, nodes_[1]->get_self_id())));
        }
    }
    EXPECT_EQ(contacts.front().dht_port, nodes_[1]->local_port());
    EXPECT_EQ(contacts.front().transfer_port, 7101);
}

TEST_F(DhtNetworkTest, StoredValueIsFoundFromAnotherNode) {
    dht::NodeID key = Hasher::sha1("greeting");
    std::vector<uint8_t> value = {'h', 'e', 'l', 'l', 'o'};

    std::promise<size_t> stored;
    auto stored_future = stored.get_future();
    nodes_[1]->store(key, value, [&stored](size_t acks) { stored.set_value(acks); });
    EXPECT_GE(wait_result(stored_future), 1u);

    std::promise<dht::FindValueResult> found;
    auto future = found.get_future();
    nodes_[2]->find_value(key, [&found](dht::FindValueResult result) { found.set_value(std::move(result)); });

    auto result = wait_result(future);
    ASSERT_TRUE(result.value.has_value());
    EXPECT_EQ(*result.value, value);
}

TEST_F(DhtNetworkTest, MissingValueReturnsClosestNodes) {
    std::promise<dht::FindValueResult> found;
    auto future = found.get_future();
    nodes_[0]->find_value(Hasher::sha1("nobody stored this"),
                          [&found](dht::FindValueResult result) { found.set_value(std::move(result)); });

    auto result = wait_result(future);
    EXPECT_FALSE(result.value.has_value());
    EXPECT_TRUE(result.providers.empty());
    EXPECT_FALSE(result.closest.empty());
}

TEST_F(DhtNetworkTest, AnnouncedProviderIsDiscovered) {
    dht::NodeID key = dht::key_for_info_hash(Hasher::sha256(std::string("some file")));

    std::promise<size_t> announced;
    auto announced_future = announced.get_future();
    nodes_[1]->announce(key, [&announced](size_t acks) { announced.set_value(acks); });
    EXPECT_GE(wait_result(announced_future), 1u);

    std::promise<std::vector<dht::Provider>> found;
    auto future = found.get_future();
    nodes_[2]->find_providers(key, [&found](std::vector<dht::Provider> providers) {
        found.set_value(std::move(providers));
    });

    auto providers = wait_result(future);
    ASSERT_EQ(providers.size(), 1u);
    EXPECT_EQ(providers[0].address, asio::ip::address_v4::loopback());
    EXPECT_EQ(providers[0].transfer_port, 7101);
}

TEST_F(DhtNetworkTest, SelfAnnouncedProviderTakesAddressItWasReachedAt) {
    // Advertises 0.0.0.0, so the querier fills in the address it used.
    dht::DhtOptions options;
    options.host = "127.0.0.1";
    options.transfer_port = 7200;
    options.rpc_timeout = std::chrono::milliseconds(500);
    nodes_.push_back(std::make_unique<dht::DhtNode>(io_, dht::node_id_from_seed("dht-test-lone"), options));
    dht::DhtNode& lone = *nodes_.back();
    lone.start();

    dht::NodeID key = dht::key_for_info_hash(Hasher::sha256(std::string("lone file")));
    std::promise<size_t> announced;
    auto announced_future = announced.get_future();
    lone.announce(key, [&announced](size_t acks) { announced.set_value(acks); });
    EXPECT_EQ(wait_result(announced_future), 0u);

    std::promise<size_t> joined;
    auto joined_future = joined.get_future();
    nodes_[0]->bootstrap({endpoint_of(3)}, [&joined](size_t answered) { joined.set_value(answered); });
    ASSERT_EQ(wait_result(joined_future), 1u);

    std::promise<std::vector<dht::Provider>> found;
    auto future = found.get_future();
    nodes_[0]->find_providers(key, [&found](std::vector<dht::Provider> providers) {
        found.set_value(std::move(providers));
    });

    auto providers = wait_result(future);
    ASSERT_EQ(providers.size(), 1u);
    EXPECT_EQ(providers[0].address, asio::ip::address_v4::loopback());
    EXPECT_EQ(providers[0].transfer_port, 7200);
}

TEST_F(DhtNetworkTest, PingOfSilentEndpointTimesOut) {
    // Bound but never read, so requests go unanswered.
    asio::ip::udp::socket silent(io_, asio::ip::udp::endpoint(asio::ip::address_v4::loopback(), 0));

    std::promise<std::optional<dht::Contact>> answered;
    auto future = answered.get_future();
    nodes_[0]->ping(silent.local_endpoint(), [&answered](std::optional<dht::Contact> contact) {
        answered.set_value(std::move(contact));
    });
    EXPECT_FALSE(wait_result(future).has_value());
}

// --- Framed TCP ---

TEST_F(IoTest, ConnectionStopsReadingWhileRepliesBackUp) {
    start_io();
    asio::ip::tcp::acceptor acceptor(io_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    asio::ip::tcp::socket client(io_);
    client.open(asio::ip::tcp::v4());
    client.set_option(asio::socket_base::receive_buffer_size(4096));
    client.connect(acceptor.local_endpoint());

    auto server_side = std::make_shared<Connection>(io_);
    acceptor.accept(server_side->socket());
    std::atomic<int> handled{0};
    std::weak_ptr<Connection> weak = server_side;
    server_side->set_message_handler([&handled, weak](Message) {
        handled++;
        if (auto self = weak.lock()) {
            self->send_message(Message{MessageType::CHUNK_DATA, std::vector<uint8_t>(2 * 1024 * 1024, 0x5a)});
        }
    });
    server_side->start();

    // Pipeline requests and never read the replies.
    const int requests = 64;
    std::vector<uint8_t> frames;
    for (int i = 0; i < requests; ++i) {
        std::vector<uint8_t> frame = {0, 0, 0, 32, static_cast<uint8_t>(MessageType::REQUEST_CHUNK)};
        frame.resize(frame.size() + 32, static_cast<uint8_t>(i));
        frames.insert(frames.end(), frame.begin(), frame.end());
    }
    asio::write(client, asio::buffer(frames));
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    std::promise<size_t> pending;
    auto pending_future = pending.get_future();
    asio::post(server_side->strand(), [&pending, server_side]() { pending.set_value(server_side->pending_writes()); });
    EXPECT_LE(wait_result(pending_future), Connection::MAX_PENDING_WRITES);
    EXPECT_LT(handled.load(), requests);

    // Draining the replies lets every request through.
    std::array<uint8_t, HEADER_SIZE> header{};
    std::vector<uint8_t> body(2 * 1024 * 1024);
    for (int i = 0; i < requests; ++i) {
        asio::read(client, asio::buffer(header));
        EXPECT_EQ(header[4], static_cast<uint8_t>(MessageType::CHUNK_DATA));
        asio::read(client, asio::buffer(body));
    }
    EXPECT_EQ(handled.load(), requests);

    server_side->close();
    client.close();
    stop_io();
}

// --- Whole nodes ---

TEST_F(NodeControllerTest, DownloadsFromTwoPartialSeeders) {
    NodeController& alice = add_node("alice");
    NodeController& bob = add_node("bob");
    NodeController& carol = add_node("carol");
    for (auto& node : nodes_) {
        node->start();
    }
    start_io();

    ASSERT_EQ(join(bob, alice), 1u);
    ASSERT_EQ(join(carol, alice), 1u);

    auto content = write_random_file(dir_ / "dataset.bin", CHUNK_SIZE * 9 + 100);
    std::string hex;
    EXPECT_GE(share(alice, dir_ / "dataset.bin", hex), 1u);
    std::string bob_hex;
    EXPECT_GE(share(bob, dir_ / "dataset.bin", bob_hex), 1u);
    ASSERT_EQ(hex, bob_hex);

    // Each seeder keeps half of the chunks.
    auto manifest = alice.chunk_store().get_manifest(Hasher::hex_to_hash(hex));
    ASSERT_TRUE(manifest.has_value());
    ASSERT_EQ(manifest->chunk_count(), 10u);
    for (size_t i = 0; i < 10; ++i) {
        NodeController& dropper = i < 5 ? bob : alice;
        ASSERT_TRUE(dropper.chunk_store().delete_chunk(manifest->chunk_hashes[i]));
    }

    auto session = carol.download(hex);
    DownloadSnapshot snap = wait_terminal(session);
    ASSERT_EQ(snap.phase, DownloadPhase::Complete) << snap.message;

    std::ifstream in(snap.output_path, std::ios::binary);
    std::vector<uint8_t> downloaded((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(downloaded, content);

    EXPECT_EQ(alice.stats().chunks_served, 5u);
    EXPECT_EQ(bob.stats().chunks_served, 5u);
    EXPECT_GE(alice.stats().inbound_connections, 1u);
    EXPECT_EQ(carol.stats().outbound_connections, 2u);
    nlohmann::json stats = carol.stats();
    EXPECT_EQ(stats.at("outbound_connections"), 2u);
    EXPECT_TRUE(stats.contains("inbound_connections"));
    EXPECT_EQ(carol.stats().chunks_stored, 10u);
    EXPECT_EQ(carol.list_shared().size(), 1u);

    auto record = carol.storage().get_download(hex);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, "complete");
}

TEST_F(NodeControllerTest, DownloadOfUnknownFileFails) {
    NodeController& alice = add_node("alice");
    NodeController& bob = add_node("bob");
    alice.start();
    bob.start();
    start_io();
    ASSERT_EQ(join(bob, alice), 1u);

    auto session = bob.download(Hasher::hash_to_hex(Hasher::sha256(std::string("never shared"))));
    DownloadSnapshot snap = wait_terminal(session);
    EXPECT_EQ(snap.phase, DownloadPhase::Failed);
    EXPECT_EQ(snap.message, "no providers");
}

TEST_F(NodeControllerTest, RejectsMalformedInfoHash) {
    NodeController& node = add_node("solo");
    node.start();
    start_io();

    EXPECT_THROW(node.download(std::string(63, 'a')), std::invalid_argument);
    EXPECT_THROW(node.download(std::string(63, 'a') + "z"), std::invalid_argument);
    EXPECT_THROW(node.share(dir_ / "does-not-exist"), std::invalid_argument);
    EXPECT_TRUE(node.sessions().empty());
}

TEST_F(NodeControllerTest, RepeatedDownloadReusesRunningSession) {
    NodeController& node = add_node("solo");
    node.start();
    start_io();

    write_random_file(dir_ / "local.bin", 1000);
    std::string hex = node.share(dir_ / "local.bin");

    auto first = node.download(hex);
    auto upper = hex;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    auto second = node.download(upper);
    if (!is_terminal(first->phase())) {
        EXPECT_EQ(first, second);
    }
    EXPECT_EQ(node.get_session(hex), second);
    EXPECT_EQ(wait_terminal(second).phase, DownloadPhase::Complete);
}

TEST_F(NodeControllerTest, OldFinishedSessionsAreDropped) {
    NodeController& node = add_node("solo", [](NodeConfig& config) { config.finished_sessions_kept = 1; });
    node.start();
    start_io();

    std::vector<std::string> hashes;
    for (int i = 0; i < 3; ++i) {
        fs::path file = dir_ / ("local" + std::to_string(i) + ".bin");
        write_random_file(file, 1000 + i);
        hashes.push_back(node.share(file));
    }
    ASSERT_NE(hashes[0], hashes[1]);

    for (const auto& hex : hashes) {
        EXPECT_EQ(wait_terminal(node.download(hex)).phase, DownloadPhase::Complete);
    }

    // Starting the third download dropped the first finished one.
    EXPECT_EQ(node.get_session(hashes[0]), nullptr);
    EXPECT_NE(node.get_session(hashes[1]), nullptr);
    EXPECT_NE(node.get_session(hashes[2]), nullptr);
    EXPECT_EQ(node.sessions().size(), 2u);
}

TEST_F(NodeControllerTest, NodeIdPersistsAcrossRestarts) {
    NodeConfig config;
    config.data_dir = dir_ / "persist";
    dht::NodeID first = NodeController::load_or_create_node_id(config);
    dht::NodeID second = NodeController::load_or_create_node_id(config);
    EXPECT_EQ(first, second);

    config.node_id_seed = "fixed";
    EXPECT_EQ(NodeController::load_or_create_node_id(config), dht::node_id_from_seed("fixed"));
}

TEST_F(NodeControllerTest, PeersSeenOnTheDhtAreRecorded) {
    NodeController& alice = add_node("alice");
    NodeController& bob = add_node("bob");
    alice.start();
    bob.start();
    start_io();
    ASSERT_EQ(join(bob, alice), 1u);

    // Peers are written off the DHT strand, so give the write a moment.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    auto peers = bob.storage().get_peers(20);
    while (peers.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        peers = bob.storage().get_peers(20);
    }
    ASSERT_FALSE(peers.empty());
    EXPECT_EQ(peers.front().node_id, alice.node_id_hex());
    EXPECT_EQ(peers.front().dht_port, alice.dht().local_port());
}
