// ============================================================
// relay_server_test.cpp -- RelayServer over loopback sockets
// ============================================================

#include "../common/event_loop.hpp"
#include "../common/logger.hpp"
#include "../common/socket.hpp"
#include "../peer/relay_client.hpp"
#include "../peer/signaling.hpp"
#include "../relay/relay_server.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

// Raw line-protocol client
class LineClient {
public:
    explicit LineClient(u16 port) {
        sock_.connect("127.0.0.1", port, 5000);
        sock_.set_recv_timeout_ms(5000);
        SignalingEnvelope hello = read();
        EXPECT_EQ(hello.type, sigtype::YOUR_ID);
        id_ = hello.payload.get<u64>();
    }

    void send(const std::string& type, nlohmann::json payload = nullptr) {
        SignalingEnvelope env;
        env.type    = type;
        env.payload = std::move(payload);
        sock_.write_line(proto::encode_envelope(env));
    }

    SignalingEnvelope read() {
        std::string line;
        if (!sock_.read_line(line)) throw std::runtime_error("relay closed the connection");
        return proto::decode_envelope(line);
    }

    // true once the relay has closed the connection
    bool closed_by_peer() {
        std::string line;
        try {
            return !sock_.read_line(line);
        } catch (const std::runtime_error&) {
            return false;
        }
    }

    void close() { sock_.close(); }
    u64 id() const { return id_; }

private:
    TcpSocket sock_;
    u64       id_{0};
};

// RelayClient on its own loop; built and destroyed there
struct ClientOnLoop {
    ~ClientOnLoop() {
        loop.call([this] {
            subs.clear();
            relay.reset();
        }).get();
        loop.stop();
    }

    EventLoop                    loop;
    std::unique_ptr<RelayClient> relay;
    std::vector<Subscription>    subs;
};

class RelayServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_console(false);
        RelayConfig cfg;
        cfg.listen_ip   = "127.0.0.1";
        cfg.listen_port = 0;
        server_ = std::make_unique<RelayServer>(cfg);
        port_   = server_->start();
        thread_ = std::thread([this] { server_->run(); });
    }

    void TearDown() override {
        server_->stop();
        if (thread_.joinable()) thread_.join();
        server_.reset();
    }

    // Joins happen on the server's client threads; wait until one lands
    bool wait_room_size(const std::string& code, size_t n) {
        for (int i = 0; i < 500; ++i) {
            if (server_->room_size(code) == n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    std::unique_ptr<RelayServer> server_;
    std::thread                  thread_;
    u16                          port_{0};
};

} // namespace

TEST_F(RelayServerTest, AssignsDistinctIds) {
    LineClient a(port_);
    LineClient b(port_);
    EXPECT_NE(a.id(), 0u);
    EXPECT_NE(a.id(), b.id());
}

TEST_F(RelayServerTest, PairsTwoMembersAndFlagsTheFirstAsInitiator) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "k7q-x2m");
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));

    LineClient b(port_);
    b.send(sigtype::JOIN_ROOM, "K7QX2M");

    SignalingEnvelope ea = a.read();
    SignalingEnvelope eb = b.read();
    EXPECT_EQ(ea.type, sigtype::PEER_CONNECTED);
    EXPECT_EQ(eb.type, sigtype::PEER_CONNECTED);
    EXPECT_TRUE(ea.payload.at("isInitiator").get<bool>());
    EXPECT_FALSE(eb.payload.at("isInitiator").get<bool>());
    EXPECT_EQ(ea.room_code, "K7QX2M");
    EXPECT_EQ(server_->room_size("K7QX2M"), 2u);
}

TEST_F(RelayServerTest, ForwardsNegotiationWithSenderId) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "K7QX2M");
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));
    LineClient b(port_);
    b.send(sigtype::JOIN_ROOM, "K7QX2M");
    a.read();
    b.read();

    a.send(sigtype::OFFER, {{"type", "offer"}, {"sdp", "v=0"}});
    SignalingEnvelope got = b.read();
    EXPECT_EQ(got.type, sigtype::OFFER);
    ASSERT_TRUE(got.sender_id.has_value());
    EXPECT_EQ(*got.sender_id, a.id());
    SessionDescription desc = proto::description_from_json(got.payload);
    EXPECT_EQ(desc.type, "offer");
    EXPECT_EQ(desc.sdp, "v=0");

    b.send(sigtype::CANDIDATE, {{"candidate", "tcp 127.0.0.1 9"}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}});
    got = a.read();
    EXPECT_EQ(got.type, sigtype::CANDIDATE);
    EXPECT_EQ(*got.sender_id, b.id());
    EXPECT_EQ(proto::candidate_from_json(got.payload).candidate, "tcp 127.0.0.1 9");
}

TEST_F(RelayServerTest, ThirdMemberIsRefused) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "K7QX2M");
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));
    LineClient b(port_);
    b.send(sigtype::JOIN_ROOM, "K7QX2M");
    a.read();
    b.read();

    LineClient c(port_);
    c.send(sigtype::JOIN_ROOM, "K7QX2M");
    SignalingEnvelope err = c.read();
    EXPECT_EQ(err.type, sigtype::ERROR_MSG);
    EXPECT_EQ(err.payload.get<std::string>(), "room full");
    EXPECT_EQ(server_->room_size("K7QX2M"), 2u);
}

TEST_F(RelayServerTest, InvalidRoomCodeIsRejected) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "ABCDE0");
    SignalingEnvelope err = a.read();
    EXPECT_EQ(err.type, sigtype::ERROR_MSG);
    EXPECT_EQ(err.payload.get<std::string>(), "invalid room code");
    EXPECT_EQ(server_->room_size("ABCDE0"), 0u);
}

TEST_F(RelayServerTest, LeavingNotifiesTheRemainingMember) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "K7QX2M");
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));
    LineClient b(port_);
    b.send(sigtype::JOIN_ROOM, "K7QX2M");
    a.read();
    b.read();

    b.send(sigtype::LEAVE_ROOM);
    SignalingEnvelope got = a.read();
    EXPECT_EQ(got.type, sigtype::PEER_DISCONNECTED);
    EXPECT_EQ(*got.sender_id, b.id());
    EXPECT_TRUE(wait_room_size("K7QX2M", 1));

    // The freed slot can be taken again
    b.send(sigtype::JOIN_ROOM, "K7QX2M");
    EXPECT_EQ(a.read().type, sigtype::PEER_CONNECTED);
    EXPECT_EQ(b.read().type, sigtype::PEER_CONNECTED);
}

TEST_F(RelayServerTest, DisconnectNotifiesTheRemainingMember) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "K7QX2M");
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));
    {
        LineClient b(port_);
        b.send(sigtype::JOIN_ROOM, "K7QX2M");
        a.read();
        b.read();
        b.close();
    }
    EXPECT_EQ(a.read().type, sigtype::PEER_DISCONNECTED);
    EXPECT_TRUE(wait_room_size("K7QX2M", 1));
}

TEST_F(RelayServerTest, MessagesOutsideARoomAreDropped) {
    LineClient a(port_);
    LineClient b(port_);
    a.send(sigtype::OFFER, {{"type", "offer"}, {"sdp", "x"}});
    a.send("not-a-relay-type");
    // b sees nothing; a is still served afterwards
    a.send(sigtype::JOIN_ROOM, "ABCDE0");
    EXPECT_EQ(a.read().type, sigtype::ERROR_MSG);
    EXPECT_EQ(server_->client_count(), 2u);
}

TEST_F(RelayServerTest, StopClosesClients) {
    LineClient a(port_);
    server_->stop();
    thread_.join();
    EXPECT_TRUE(a.closed_by_peer());
}

TEST_F(RelayServerTest, ForwardingToAClosingMemberIsSafe) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "K7QX2M");
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));
    auto b = std::make_unique<LineClient>(port_);
    b->send(sigtype::JOIN_ROOM, "K7QX2M");
    a.read();
    b->read();

    // a keeps writing while b's connection is torn down under it
    std::thread flood([&] {
        for (int i = 0; i < 2000; ++i) {
            a.send(sigtype::CANDIDATE, {{"candidate", "tcp 127.0.0.1 " + std::to_string(i)},
                                        {"sdpMid", "0"}, {"sdpMLineIndex", 0}});
        }
    });
    b->close();
    flood.join();
    b.reset();

    EXPECT_EQ(a.read().type, sigtype::PEER_DISCONNECTED);
    EXPECT_TRUE(wait_room_size("K7QX2M", 1));

    // The relay keeps serving the room
    LineClient c(port_);
    c.send(sigtype::JOIN_ROOM, "K7QX2M");
    EXPECT_EQ(c.read().type, sigtype::PEER_CONNECTED);
    EXPECT_EQ(a.read().type, sigtype::PEER_CONNECTED);
}

TEST_F(RelayServerTest, RelayClientKeepsItsIdAndSwitchesRooms) {
    LineClient a(port_);
    a.send(sigtype::JOIN_ROOM, "HJKLMN");
    ASSERT_TRUE(wait_room_size("HJKLMN", 1));

    std::promise<bool> paired;
    bool paired_set = false;   // loop thread only
    ClientOnLoop client;
    client.loop.call([&] {
        client.relay = std::make_unique<RelayClient>(client.loop, "127.0.0.1", port_, "K7QX2M");
        client.subs.push_back(client.relay->subscribe(sigtype::PEER_CONNECTED,
                                                      [&](const SignalingEnvelope& e) {
            if (paired_set) return;
            paired_set = true;
            paired.set_value(e.payload.at("isInitiator").get<bool>());
        }));
        client.relay->start();
    }).get();
    ASSERT_TRUE(wait_room_size("K7QX2M", 1));

    std::optional<u64> id;
    for (int i = 0; i < 500 && !id; ++i) {
        id = client.loop.call([&] { return client.relay->client_id(); }).get();
        if (!id) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(id.has_value());
    EXPECT_NE(*id, a.id());

    auto got_paired = paired.get_future();
    client.loop.call([&] { client.relay->set_room_code("hjk-lmn"); }).get();
    ASSERT_TRUE(wait_room_size("HJKLMN", 2));
    EXPECT_EQ(server_->room_size("K7QX2M"), 0u);

    SignalingEnvelope to_a = a.read();
    EXPECT_EQ(to_a.type, sigtype::PEER_CONNECTED);
    EXPECT_TRUE(to_a.payload.at("isInitiator").get<bool>());
    ASSERT_EQ(got_paired.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(got_paired.get());

    // Traffic from the client carries the id the relay assigned it
    bool sent = client.loop.call([&] {
        SignalingEnvelope env;
        env.type    = sigtype::OFFER;
        env.payload = {{"type", "offer"}, {"sdp", "v=0"}};
        return client.relay->send(env);
    }).get();
    ASSERT_TRUE(sent);
    SignalingEnvelope offer = a.read();
    EXPECT_EQ(offer.type, sigtype::OFFER);
    ASSERT_TRUE(offer.sender_id.has_value());
    EXPECT_EQ(*offer.sender_id, *id);
}
