// ============================================================
// negotiator_test.cpp -- Offer/answer state machine against fakes
// ============================================================

#include "../peer/negotiator.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace testing_fakes;
using json = nlohmann::json;

namespace {

class NegotiatorTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::get().set_console(false); }

    void peer_connected(bool initiator) {
        signaling.deliver(sigtype::PEER_CONNECTED, json{{"isInitiator", initiator}});
    }

    void deliver_offer(const std::string& sdp) {
        signaling.deliver(sigtype::OFFER, proto::description_to_json(SessionDescription{"offer", sdp}));
    }

    void deliver_answer(const std::string& sdp) {
        signaling.deliver(sigtype::ANSWER, proto::description_to_json(SessionDescription{"answer", sdp}));
    }

    void deliver_candidate(const std::string& c) {
        signaling.deliver(sigtype::CANDIDATE, proto::candidate_to_json(IceCandidate{c, "0", 0}));
    }

    std::shared_ptr<FakePeerConnection> pc() const { return factory.last(); }

    ManualExecutor            exec;
    FakeSignaling             signaling;
    FakePeerConnectionFactory factory{exec};
    Negotiator                negotiator{signaling, factory};
};

} // namespace

TEST_F(NegotiatorTest, InitiatorCreatesChannelAndOffersExactlyOnce) {
    negotiator.start();
    peer_connected(true);

    ASSERT_EQ(factory.created.size(), 1u);
    EXPECT_EQ(negotiator.session().role, PeerRole::INITIATOR);
    ASSERT_EQ(pc()->channels.size(), 1u);
    EXPECT_EQ(pc()->channels[0]->label(), DATA_CHANNEL_LABEL);

    auto offers = signaling.sent_of(sigtype::OFFER);
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(proto::description_from_json(offers[0].payload).type, "offer");
    EXPECT_EQ(pc()->sig, SignalingState::HAVE_LOCAL_OFFER);
    EXPECT_TRUE(negotiator.session().offer_sent);
    EXPECT_EQ(negotiator.phase(), NegotiationPhase::NEGOTIATING);

    // Further requests while the offer is outstanding are no-ops
    negotiator.create_offer();
    negotiator.create_offer();
    EXPECT_EQ(pc()->offers_created, 1);
    EXPECT_EQ(signaling.sent_of(sigtype::OFFER).size(), 1u);
}

TEST_F(NegotiatorTest, ResponderWaitsForOffer) {
    negotiator.start();
    peer_connected(false);

    ASSERT_EQ(factory.created.size(), 1u);
    EXPECT_EQ(negotiator.session().role, PeerRole::RESPONDER);
    EXPECT_TRUE(pc()->channels.empty());
    EXPECT_TRUE(signaling.sent.empty());
    EXPECT_EQ(negotiator.phase(), NegotiationPhase::CONNECTING);

    negotiator.create_offer();
    EXPECT_EQ(pc()->offers_created, 0);
}

TEST_F(NegotiatorTest, PeerConnectedWithoutFlagIsIgnored) {
    LogCapture log;
    negotiator.start();
    signaling.deliver(sigtype::PEER_CONNECTED, json{{"isInitiator", "yes"}});
    signaling.deliver(sigtype::PEER_CONNECTED);
    EXPECT_TRUE(factory.created.empty());
    EXPECT_EQ(negotiator.session().role, PeerRole::UNKNOWN);
    EXPECT_EQ(log.count(LogLevel::WARN), 2u);
}

TEST_F(NegotiatorTest, ResponderAnswersOffer) {
    negotiator.start();
    peer_connected(false);
    deliver_offer("remote-offer");

    ASSERT_EQ(pc()->remote_applied.size(), 1u);
    EXPECT_EQ(pc()->remote_applied[0].sdp, "remote-offer");
    auto answers = signaling.sent_of(sigtype::ANSWER);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(proto::description_from_json(answers[0].payload).type, "answer");
    EXPECT_EQ(pc()->sig, SignalingState::STABLE);
    EXPECT_FALSE(negotiator.session().offer_sent);
}

TEST_F(NegotiatorTest, OfferWithoutConnectionInitializesOne) {
    negotiator.start();
    deliver_offer("early-offer");
    ASSERT_EQ(factory.created.size(), 1u);
    EXPECT_EQ(signaling.sent_of(sigtype::ANSWER).size(), 1u);
}

TEST_F(NegotiatorTest, DuplicateOfferIsIgnored) {
    negotiator.start();
    peer_connected(false);
    pc()->sig = SignalingState::HAVE_REMOTE_OFFER;
    deliver_offer("second");
    EXPECT_TRUE(pc()->remote_applied.empty());
    EXPECT_TRUE(signaling.sent_of(sigtype::ANSWER).empty());

    pc()->sig = SignalingState::HAVE_LOCAL_PRANSWER;
    deliver_offer("third");
    EXPECT_TRUE(pc()->remote_applied.empty());
}

TEST_F(NegotiatorTest, GlareInitiatorKeepsItsOffer) {
    negotiator.start();
    peer_connected(true);
    ASSERT_EQ(pc()->sig, SignalingState::HAVE_LOCAL_OFFER);

    deliver_offer("colliding");
    EXPECT_TRUE(pc()->remote_applied.empty());
    EXPECT_EQ(pc()->rollbacks, 0);
    EXPECT_TRUE(signaling.sent_of(sigtype::ANSWER).empty());
    EXPECT_EQ(pc()->sig, SignalingState::HAVE_LOCAL_OFFER);
}

TEST_F(NegotiatorTest, GlareResponderRollsBackAndAnswers) {
    negotiator.start();
    peer_connected(false);
    pc()->set_local_description(SessionDescription{"offer", "stray-local"});
    ASSERT_EQ(pc()->sig, SignalingState::HAVE_LOCAL_OFFER);

    deliver_offer("from-initiator");
    EXPECT_EQ(pc()->rollbacks, 1);
    ASSERT_EQ(pc()->remote_applied.size(), 1u);
    EXPECT_EQ(pc()->remote_applied[0].sdp, "from-initiator");
    EXPECT_EQ(signaling.sent_of(sigtype::ANSWER).size(), 1u);
    EXPECT_EQ(pc()->sig, SignalingState::STABLE);
}

// Two negotiators that both hold a local offer converge on one answer
TEST(NegotiatorGlare, ExactlyOneAnswerAndBothSidesStable) {
    Logger::get().set_console(false);
    ManualExecutor exec;
    FakeSignaling sig_a, sig_b;
    FakePeerConnectionFactory fac_a(exec), fac_b(exec);
    Negotiator a(sig_a, fac_a);
    Negotiator b(sig_b, fac_b);
    a.start();
    b.start();

    a.assign_role(true);
    b.assign_role(false);
    fac_b.last()->set_local_description(SessionDescription{"offer", "b-offer"});

    auto a_offer = proto::description_from_json(sig_a.sent_of(sigtype::OFFER).at(0).payload);
    a.handle_offer(SessionDescription{"offer", "b-offer"});
    b.handle_offer(a_offer);

    auto answers = sig_b.sent_of(sigtype::ANSWER);
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_TRUE(sig_a.sent_of(sigtype::ANSWER).empty());

    a.handle_answer(proto::description_from_json(answers[0].payload));
    EXPECT_EQ(fac_a.last()->sig, SignalingState::STABLE);
    EXPECT_EQ(fac_b.last()->sig, SignalingState::STABLE);
    ASSERT_EQ(fac_a.last()->remote_applied.size(), 1u);
    EXPECT_EQ(fac_a.last()->remote_applied[0].type, "answer");
    ASSERT_EQ(fac_b.last()->remote_applied.size(), 1u);
    EXPECT_EQ(fac_b.last()->remote_applied[0].sdp, a_offer.sdp);
}

TEST_F(NegotiatorTest, AnswerIsAppliedOnlyByInitiatorWithLocalOffer) {
    negotiator.start();
    peer_connected(false);
    deliver_answer("unexpected");
    EXPECT_TRUE(pc()->remote_applied.empty());

    peer_connected(true);
    deliver_answer("good");
    ASSERT_EQ(pc()->remote_applied.size(), 1u);
    EXPECT_EQ(pc()->sig, SignalingState::STABLE);

    // A second answer finds the connection stable
    deliver_answer("late");
    EXPECT_EQ(pc()->remote_applied.size(), 1u);
}

TEST_F(NegotiatorTest, EarlyCandidateIsSwallowedQuietly) {
    LogCapture log(LogLevel::ERR);
    negotiator.start();
    peer_connected(false);
    deliver_candidate("tcp 127.0.0.1 5000");
    EXPECT_TRUE(pc()->candidates.empty());
    EXPECT_EQ(log.count(LogLevel::ERR), 0u);

    deliver_offer("o");
    deliver_candidate("tcp 127.0.0.1 5000");
    ASSERT_EQ(pc()->candidates.size(), 1u);
    EXPECT_EQ(pc()->candidates[0].candidate, "tcp 127.0.0.1 5000");
}

TEST_F(NegotiatorTest, EmptyCandidateIsSkipped) {
    negotiator.start();
    peer_connected(false);
    deliver_offer("o");
    deliver_candidate("");
    EXPECT_TRUE(pc()->candidates.empty());
}

TEST_F(NegotiatorTest, OtherCandidateErrorsAreLogged) {
    LogCapture log(LogLevel::ERR);
    negotiator.start();
    peer_connected(false);
    deliver_offer("o");
    pc()->reject_candidates = true;
    deliver_candidate("garbage");
    EXPECT_EQ(log.count(LogLevel::ERR), 1u);
}

TEST_F(NegotiatorTest, LocalCandidatesAreRelayed) {
    negotiator.start();
    peer_connected(true);
    pc()->fire_candidate(IceCandidate{"tcp 10.0.0.2 4321", "0", 0});
    auto c = signaling.sent_of(sigtype::CANDIDATE);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(proto::candidate_from_json(c[0].payload).candidate, "tcp 10.0.0.2 4321");
}

TEST_F(NegotiatorTest, FailedOfferRelayRollsBack) {
    negotiator.start();
    signaling.connected = false;
    peer_connected(true);

    EXPECT_EQ(pc()->offers_created, 1);
    EXPECT_EQ(pc()->rollbacks, 1);
    EXPECT_EQ(pc()->sig, SignalingState::STABLE);
    EXPECT_FALSE(negotiator.session().offer_sent);
}

TEST_F(NegotiatorTest, OfferCanBeRetriedAfterFailure) {
    negotiator.start();
    signaling.connected = false;
    peer_connected(true);
    ASSERT_FALSE(negotiator.session().offer_sent);

    signaling.connected = true;
    pc()->fail_create_offer = true;
    negotiator.create_offer();
    EXPECT_FALSE(negotiator.session().offer_sent);
    EXPECT_TRUE(signaling.sent_of(sigtype::OFFER).empty());

    pc()->fail_create_offer = false;
    negotiator.create_offer();
    EXPECT_TRUE(negotiator.session().offer_sent);
    EXPECT_EQ(signaling.sent_of(sigtype::OFFER).size(), 1u);
}

TEST_F(NegotiatorTest, ChannelOpenAndCloseAreReported) {
    negotiator.start();
    std::shared_ptr<DataChannel> opened;
    int closed = 0;
    std::vector<bool> connected;
    Subscription s1 = negotiator.subscribe_channel_open([&](std::shared_ptr<DataChannel> ch) { opened = ch; });
    Subscription s2 = negotiator.subscribe_channel_closed([&] { ++closed; });
    Subscription s3 = negotiator.subscribe_connected([&](bool c) { connected.push_back(c); });

    peer_connected(true);
    auto ch = pc()->channels.at(0);
    ch->open();
    EXPECT_EQ(opened, ch);
    EXPECT_TRUE(negotiator.is_peer_connected());
    EXPECT_EQ(negotiator.session().channel_state, ChannelState::OPEN);

    ch->close();
    EXPECT_EQ(closed, 1);
    EXPECT_FALSE(negotiator.is_peer_connected());
    EXPECT_EQ(connected, (std::vector<bool>{true, false}));
}

TEST_F(NegotiatorTest, ResponderAdoptsInboundChannel) {
    negotiator.start();
    peer_connected(false);
    std::shared_ptr<DataChannel> opened;
    Subscription s = negotiator.subscribe_channel_open([&](std::shared_ptr<DataChannel> ch) { opened = ch; });

    auto inbound = std::make_shared<FakeDataChannel>(exec);
    pc()->fire_data_channel(inbound);
    EXPECT_EQ(negotiator.channel(), inbound);
    inbound->open();
    EXPECT_EQ(opened, inbound);
}

TEST_F(NegotiatorTest, ConnectionFailureClearsOfferFlag) {
    negotiator.start();
    peer_connected(true);
    ASSERT_TRUE(negotiator.session().offer_sent);
    pc()->fire_state(ConnectionState::CONNECTED);
    EXPECT_TRUE(negotiator.is_peer_connected());
    EXPECT_EQ(negotiator.phase(), NegotiationPhase::CONNECTED);

    pc()->fire_state(ConnectionState::FAILED);
    EXPECT_FALSE(negotiator.session().offer_sent);
    EXPECT_FALSE(negotiator.is_peer_connected());
    EXPECT_EQ(negotiator.phase(), NegotiationPhase::FAILED);
}

TEST_F(NegotiatorTest, PeerDisconnectedTearsDown) {
    negotiator.start();
    int closed = 0;
    Subscription s = negotiator.subscribe_channel_closed([&] { ++closed; });
    peer_connected(true);
    auto conn = pc();
    conn->channels.at(0)->open();

    signaling.deliver(sigtype::PEER_DISCONNECTED);
    EXPECT_TRUE(conn->closed);
    EXPECT_EQ(negotiator.session().role, PeerRole::UNKNOWN);
    EXPECT_FALSE(negotiator.session().offer_sent);
    EXPECT_EQ(negotiator.channel(), nullptr);
    EXPECT_EQ(negotiator.phase(), NegotiationPhase::IDLE);
    EXPECT_EQ(closed, 1);

    // Events from the old connection no longer reach the session
    conn->fire_state(ConnectionState::CONNECTED);
    EXPECT_FALSE(negotiator.is_peer_connected());
}

TEST_F(NegotiatorTest, ReinitializeReplacesConnectionAndAutoOffersAgain) {
    negotiator.start();
    peer_connected(true);
    auto first = pc();
    peer_connected(true);

    ASSERT_EQ(factory.created.size(), 2u);
    EXPECT_TRUE(first->closed);
    EXPECT_EQ(pc()->offers_created, 1);
    EXPECT_EQ(signaling.sent_of(sigtype::OFFER).size(), 2u);
}

TEST_F(NegotiatorTest, RelayLossDuringNegotiationTearsDown) {
    negotiator.start();
    peer_connected(true);
    auto conn = pc();
    signaling.deliver(sigtype::CLOSE);
    EXPECT_TRUE(conn->closed);
    EXPECT_EQ(negotiator.phase(), NegotiationPhase::IDLE);
}

TEST_F(NegotiatorTest, RelayLossKeepsOpenChannel) {
    negotiator.start();
    peer_connected(true);
    auto conn = pc();
    conn->channels.at(0)->open();
    signaling.deliver(sigtype::CLOSE);
    EXPECT_FALSE(conn->closed);
    EXPECT_NE(negotiator.channel(), nullptr);
    EXPECT_TRUE(negotiator.is_peer_connected());
}

TEST(NegotiatorNames, RoleAndPhaseNames) {
    EXPECT_STREQ(peer_role_name(PeerRole::INITIATOR), "initiator");
    EXPECT_STREQ(peer_role_name(PeerRole::RESPONDER), "responder");
    EXPECT_STREQ(negotiation_phase_name(NegotiationPhase::NEGOTIATING), "negotiating");
}
