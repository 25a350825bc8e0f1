// ============================================================
// transport_test.cpp -- TcpPeerConnection description handling and
// a loopback stream between two connections
// ============================================================

#include "../common/event_loop.hpp"
#include "../common/logger.hpp"
#include "../peer/tcp_peer_transport.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using testing_fakes::ManualExecutor;

namespace {

constexpr auto WAIT = std::chrono::seconds(10);

template<typename T>
bool ready(std::future<T>& f) {
    return f.wait_for(WAIT) == std::future_status::ready;
}

} // namespace

// ---- Descriptions (no peer on the other end) ----

class TcpDescriptionTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::get().set_console(false); }

    ManualExecutor exec;
    std::shared_ptr<TcpPeerConnection> pc = std::make_shared<TcpPeerConnection>(exec, "127.0.0.1");
};

TEST_F(TcpDescriptionTest, OfferCarriesVersionAndToken) {
    SessionDescription offer = pc->create_offer();
    EXPECT_EQ(offer.type, "offer");
    EXPECT_EQ(offer.sdp.rfind("v=peerdrop-tcp/1\na=token:", 0), 0u);
    EXPECT_NE(pc->create_offer().sdp, offer.sdp);
}

TEST_F(TcpDescriptionTest, LocalOfferAdvertisesAListeningCandidate) {
    std::vector<IceCandidate> seen;
    Subscription sub = pc->subscribe_local_candidate([&](const IceCandidate& c) { seen.push_back(c); });

    pc->set_local_description(pc->create_offer());
    EXPECT_EQ(pc->signaling_state(), SignalingState::HAVE_LOCAL_OFFER);
    EXPECT_TRUE(seen.empty());
    exec.run_ready();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].candidate.rfind("tcp 127.0.0.1 ", 0), 0u);
    EXPECT_EQ(seen[0].sdp_mid, "0");

    pc->set_local_description(SessionDescription{"rollback", ""});
    EXPECT_EQ(pc->signaling_state(), SignalingState::STABLE);
}

TEST_F(TcpDescriptionTest, AnswerRequiresRemoteOffer) {
    EXPECT_THROW(pc->create_answer(), TransportError);
    EXPECT_THROW(pc->set_local_description(SessionDescription{"rollback", ""}), TransportError);
    EXPECT_THROW(pc->set_remote_description(SessionDescription{"answer", "v=peerdrop-tcp/1\na=token:0123456789abcdef\n"}),
                 TransportError);
}

TEST_F(TcpDescriptionTest, AnswerEchoesTheOfferToken) {
    auto other = std::make_shared<TcpPeerConnection>(exec, "127.0.0.1");
    SessionDescription offer = other->create_offer();
    pc->set_remote_description(offer);
    EXPECT_EQ(pc->signaling_state(), SignalingState::HAVE_REMOTE_OFFER);
    SessionDescription answer = pc->create_answer();
    EXPECT_EQ(answer.type, "answer");
    EXPECT_EQ(answer.sdp, offer.sdp);
}

TEST_F(TcpDescriptionTest, MismatchedAnswerIsRefused) {
    pc->set_local_description(pc->create_offer());
    EXPECT_THROW(pc->set_remote_description(SessionDescription{"answer", "v=peerdrop-tcp/1\na=token:0123456789abcdef\n"}),
                 TransportError);
    EXPECT_EQ(pc->signaling_state(), SignalingState::HAVE_LOCAL_OFFER);
}

TEST_F(TcpDescriptionTest, ForeignDescriptionsAreRefused) {
    EXPECT_THROW(pc->set_remote_description(SessionDescription{"offer", "v=0\r\no=- 0 0 IN IP4 0.0.0.0\r\n"}),
                 TransportError);
    EXPECT_THROW(pc->set_remote_description(SessionDescription{"offer", "v=peerdrop-tcp/1\na=token:XYZ\n"}),
                 TransportError);
    EXPECT_EQ(pc->signaling_state(), SignalingState::STABLE);
}

TEST_F(TcpDescriptionTest, CandidateChecks) {
    IceCandidate c;
    c.candidate = "tcp 127.0.0.1 9";
    EXPECT_THROW(pc->add_ice_candidate(c), CandidateBeforeRemoteDescription);

    auto other = std::make_shared<TcpPeerConnection>(exec, "127.0.0.1");
    pc->set_remote_description(other->create_offer());
    c.candidate = "candidate:1 1 udp 2122260223 10.0.0.1 50000 typ host";
    EXPECT_THROW(pc->add_ice_candidate(c), TransportError);
    c.candidate = "";
    EXPECT_NO_THROW(pc->add_ice_candidate(c));
}

TEST_F(TcpDescriptionTest, ClosedConnectionRefusesEverything) {
    pc->close();
    pc->close();
    EXPECT_EQ(pc->signaling_state(), SignalingState::CLOSED);
    EXPECT_EQ(pc->connection_state(), ConnectionState::CLOSED);
    EXPECT_THROW(pc->create_offer(), TransportError);
    EXPECT_THROW(pc->create_data_channel("x"), TransportError);
}

// ---- Loopback stream ----

// Both connections live on one EventLoop; everything that touches them
// runs there through call().
class TcpLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::get().set_console(false);
        loop.call([this] {
            a = std::make_shared<TcpPeerConnection>(loop, "127.0.0.1");
            b = std::make_shared<TcpPeerConnection>(loop, "127.0.0.1");

            subs.push_back(a->subscribe_local_candidate([this](const IceCandidate& c) {
                b->add_ice_candidate(c);
            }));
            subs.push_back(b->subscribe_data_channel([this](std::shared_ptr<DataChannel> ch) {
                ch_b = ch;
                subs.push_back(ch_b->subscribe_message([this](const ChannelMessage& m) {
                    at_b.push_back(m);
                    if (at_b.size() == 2) b_got_two.set_value();
                }));
                subs.push_back(ch_b->subscribe_close([this] { b_closed.set_value(); }));
                b_channel.set_value();
            }));
            subs.push_back(b->subscribe_state_change([this](ConnectionState s) {
                b_states.push_back(s);
                if (s == ConnectionState::DISCONNECTED) b_disconnected.set_value();
            }));

            ch_a = a->create_data_channel("fileTransferChannel");
            subs.push_back(ch_a->subscribe_open([this] { a_open.set_value(); }));
            subs.push_back(ch_a->subscribe_message([this](const ChannelMessage& m) {
                at_a.push_back(m);
                a_got_reply.set_value();
            }));

            SessionDescription offer = a->create_offer();
            a->set_local_description(offer);
            b->set_remote_description(offer);
            SessionDescription answer = b->create_answer();
            b->set_local_description(answer);
            a->set_remote_description(answer);
        }).get();
    }

    void TearDown() override {
        loop.call([this] {
            subs.clear();
            ch_a.reset();
            ch_b.reset();
            a.reset();
            b.reset();
        }).get();
        loop.stop();
    }

    EventLoop loop;
    std::shared_ptr<TcpPeerConnection> a, b;
    std::shared_ptr<DataChannel>       ch_a, ch_b;
    std::vector<Subscription>          subs;
    std::vector<ChannelMessage>        at_a, at_b;
    std::vector<ConnectionState>       b_states;

    std::promise<void> a_open, b_channel, b_got_two, a_got_reply, b_closed, b_disconnected;
};

TEST_F(TcpLoopbackTest, ChannelCarriesTextAndBinaryBothWays) {
    auto opened   = a_open.get_future();
    auto announced = b_channel.get_future();
    ASSERT_TRUE(ready(opened));
    ASSERT_TRUE(ready(announced));

    auto info = loop.call([this] {
        return std::make_pair(ch_b->label(), a->connection_state());
    }).get();
    EXPECT_EQ(info.first, "fileTransferChannel");
    EXPECT_EQ(info.second, ConnectionState::CONNECTED);

    std::vector<u8> blob(200000);
    for (size_t i = 0; i < blob.size(); ++i) blob[i] = (u8)(i * 31);
    auto got_two = b_got_two.get_future();
    bool sent = loop.call([&] {
        return ch_a->send_text("hello") && ch_a->send_binary(blob);
    }).get();
    ASSERT_TRUE(sent);
    ASSERT_TRUE(ready(got_two));

    auto reply = a_got_reply.get_future();
    loop.call([this] {
        EXPECT_FALSE(at_b[0].binary);
        EXPECT_EQ(at_b[0].text, "hello");
        EXPECT_TRUE(at_b[1].binary);
        ch_b->send_text("ack");
    }).get();
    ASSERT_TRUE(ready(reply));
    loop.call([&] {
        EXPECT_EQ(at_b[1].data, blob);
        ASSERT_EQ(at_a.size(), 1u);
        EXPECT_EQ(at_a[0].text, "ack");
    }).get();
}

TEST_F(TcpLoopbackTest, BufferedAmountDrainsToZero) {
    auto opened = a_open.get_future();
    ASSERT_TRUE(ready(opened));
    loop.call([this] {
        for (int i = 0; i < 16; ++i) ch_a->send_binary(std::vector<u8>(CHUNK_SIZE, (u8)i));
    }).get();

    bool drained = false;
    for (int i = 0; i < 1000 && !drained; ++i) {
        drained = loop.call([this] { return ch_a->buffered_amount() == 0; }).get();
        if (!drained) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(drained);
}

TEST_F(TcpLoopbackTest, ClosingOneSideClosesTheOther) {
    auto opened    = a_open.get_future();
    auto announced = b_channel.get_future();
    ASSERT_TRUE(ready(opened));
    ASSERT_TRUE(ready(announced));

    auto closed       = b_closed.get_future();
    auto disconnected = b_disconnected.get_future();
    loop.call([this] { a->close(); }).get();
    ASSERT_TRUE(ready(closed));
    ASSERT_TRUE(ready(disconnected));

    loop.call([this] {
        EXPECT_EQ(ch_b->state(), ChannelState::CLOSED);
        EXPECT_FALSE(ch_b->send_text("late"));
        EXPECT_EQ(b->connection_state(), ConnectionState::DISCONNECTED);
    }).get();
}
