#include <catch2/catch_test_macros.hpp>
#include "agentnet/consensus_manager.hpp"
#include "agentnet/signing.hpp"
#include "support.hpp"
#include <atomic>
#include <format>
#include <thread>

using namespace agentnet;
using namespace std::chrono_literals;
using agentnet::testing::ManualClock;
using agentnet::testing::members;
using agentnet::testing::RecordingBroadcaster;
using agentnet::testing::vote_from;

namespace
{
    class FailingSigner : public Signer
    {
    public:
        Result<std::string> sign(const crypto::Bytes &) override
        {
            return std::unexpected(ConsensusError::crypto("hsm offline"));
        }
    };

    class FailingBroadcaster : public Broadcaster
    {
    public:
        Result<void> broadcast(const ConsensusMessage &) override
        {
            ++attempts;
            return std::unexpected(ConsensusError::invalid_input("no peers reachable"));
        }

        std::atomic<int> attempts{0};
    };

    class FixedReputation : public ReputationSource
    {
    public:
        double reputation(std::string_view node_id) const override
        {
            return node_id == "B" ? 99.5 : 1.0;
        }
    };
}

TEST_CASE("Local membership and leadership queries", "[manager]")
{
    ConsensusManager cm("node1");
    REQUIRE(cm.node_id() == "node1");
    REQUIRE_FALSE(cm.is_committee_member());
    REQUIRE_FALSE(cm.is_leader());
    REQUIRE(cm.proposal_count() == 0);

    cm.set_committee(members({"node1", "node2", "node3"}));
    REQUIRE(cm.is_committee_member());
    REQUIRE(cm.is_leader());
    REQUIRE(cm.committee().size() == 3);
    REQUIRE(cm.committee().members[0].joined_at != TimePoint{});

    cm.rotate_leader();
    REQUIRE_FALSE(cm.is_leader());
    REQUIRE(cm.leader()->node_id == "node2");

    cm.rotate_leader();
    cm.rotate_leader();
    REQUIRE(cm.is_leader());
}

TEST_CASE("A committee with a repeated member is refused", "[manager][errors]")
{
    ConsensusManager cm("A");
    REQUIRE(cm.set_committee(members({"A", "B", "C"})).has_value());

    auto res = cm.set_committee(members({"A", "A", "B"}));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidInput);
    REQUIRE(cm.committee().size() == 3);
    REQUIRE(cm.is_committee_member());

    // the committee in force still decides proposals normally
    auto p = cm.propose_join(JoinProposalData{"new"});
    REQUIRE(cm.vote(p->id, true).has_value());
    REQUIRE(cm.receive_vote(p->id, vote_from("B", true)).has_value());
    REQUIRE(cm.proposal_result(p->id)->total_voters == 3);
    REQUIRE(cm.proposal(p->id)->phase == Phase::Finalized);
}

TEST_CASE("Creation is capped at the configured number of open proposals", "[manager][capacity]")
{
    ConsensusManager cm("A");
    cm.set_committee(members({"A"}));
    REQUIRE(cm.config().voting.max_pending == 100);

    std::vector<std::string> ids;
    for (int i = 0; i < 100; ++i)
    {
        auto p = cm.propose_join(JoinProposalData{std::format("new{}", i)});
        REQUIRE(p.has_value());
        ids.push_back(p->id);
    }

    auto refused = cm.propose_join(JoinProposalData{"one-too-many"});
    REQUIRE_FALSE(refused.has_value());
    REQUIRE(refused.error().code == ErrorCode::CapacityExceeded);
    REQUIRE(cm.proposal_count() == 100);
    REQUIRE(cm.pending_proposals().size() == 100);

    REQUIRE(cm.vote(ids.front(), true).has_value());
    REQUIRE(cm.proposal(ids.front())->phase == Phase::Finalized);

    REQUIRE(cm.propose_join(JoinProposalData{"fits-again"}).has_value());
    REQUIRE(cm.proposal_count() == 101);
}

TEST_CASE("Votes are signed over the canonical tuple", "[manager][signing]")
{
    auto keypair = crypto::Ed25519KeyPair::generate().value();
    auto signer = std::make_shared<Ed25519Signer>(keypair);

    ConsensusHooks hooks;
    hooks.signer = signer;
    ConsensusManager cm("A", {}, hooks);
    cm.set_committee(members({"A", "B", "C"}));

    auto p = cm.propose_join(JoinProposalData{"new"});
    REQUIRE(cm.vote(p->id, true, "known operator").has_value());

    auto vote = cm.proposal(p->id)->votes.at("A");
    REQUIRE_FALSE(vote.signature.empty());

    CommitteeKeyVerifier verifier;
    REQUIRE(verifier.add_key("A", keypair.public_key_b64()).has_value());
    REQUIRE(verifier.verify("A", canonical_vote_bytes(p->id, "A", true), vote.signature));
    REQUIRE_FALSE(verifier.verify("A", canonical_vote_bytes(p->id, "A", false), vote.signature));
}

TEST_CASE("Votes without a signer carry an empty signature", "[manager][signing]")
{
    ConsensusManager cm("A");
    cm.set_committee(members({"A", "B", "C"}));
    auto p = cm.propose_join(JoinProposalData{"new"});
    REQUIRE(cm.vote(p->id, true).has_value());
    REQUIRE(cm.proposal(p->id)->votes.at("A").signature.empty());
}

TEST_CASE("Signing failure leaves the vote unrecorded", "[manager][signing][errors]")
{
    ConsensusHooks hooks;
    hooks.signer = std::make_shared<FailingSigner>();
    ConsensusManager cm("A", {}, hooks);
    cm.set_committee(members({"A", "B", "C"}));

    auto p = cm.propose_join(JoinProposalData{"new"});
    REQUIRE(p.has_value());

    auto res = cm.vote(p->id, true);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::SigningFailed);
    REQUIRE(std::string(res.error().what()).find("hsm offline") != std::string::npos);
    REQUIRE(cm.proposal(p->id)->votes.empty());
    REQUIRE(cm.proposal(p->id)->phase == Phase::Pending);
}

TEST_CASE("Proposals and votes are broadcast to peers", "[manager][broadcast]")
{
    auto broadcaster = std::make_shared<RecordingBroadcaster>();
    ConsensusHooks hooks;
    hooks.broadcaster = broadcaster;
    ConsensusManager cm("A", {}, hooks);
    cm.set_committee(members({"A", "B", "C"}));
    cm.rotate_leader();

    auto p = cm.create_proposal(ProposalType::Suspend, {{"node_id", "X"}});
    REQUIRE(cm.vote(p->id, true).has_value());

    auto sent = broadcaster->sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0].type == MessageType::PrePrepare);
    REQUIRE(sent[0].proposal_id == p->id);
    REQUIRE(sent[0].sender_id == "A");
    REQUIRE(sent[0].view == 1);
    REQUIRE(sent[1].type == MessageType::Prepare);
    REQUIRE(sent[1].sequence > sent[0].sequence);
    REQUIRE(sent[1].vote()->voter_id == "A");

    SECTION("Refused votes are not broadcast")
    {
        REQUIRE_FALSE(cm.vote(p->id, false).has_value());
        REQUIRE(broadcaster->sent().size() == 2);
    }
}

TEST_CASE("Votes with non-UTF-8 reasons are still signed and broadcast", "[manager][broadcast]")
{
    auto keypair = crypto::Ed25519KeyPair::generate().value();
    auto broadcaster = std::make_shared<RecordingBroadcaster>();
    ConsensusHooks hooks;
    hooks.signer = std::make_shared<Ed25519Signer>(keypair);
    hooks.broadcaster = broadcaster;
    ConsensusManager cm("A", {}, hooks);
    cm.set_committee(members({"A"}));

    auto p = cm.create_proposal(ProposalType::Parameter, {{"note", "\xfe\xff"}});
    REQUIRE(p.has_value());
    REQUIRE(cm.vote(p->id, true, "\xff binary").has_value());
    REQUIRE(cm.proposal(p->id)->phase == Phase::Finalized);

    auto sent = broadcaster->sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1].type == MessageType::Prepare);

    CommitteeKeyVerifier verifier;
    REQUIRE(verifier.add_key("A", keypair.public_key_b64()).has_value());
    for (const auto &msg : sent)
    {
        REQUIRE(verifier.verify("A", msg.signing_bytes(), msg.signature));
        auto decoded = ConsensusMessage::decode(msg.encode());
        REQUIRE(decoded.has_value());
        REQUIRE(verifier.verify("A", decoded->signing_bytes(), decoded->signature));
    }
}

TEST_CASE("Broadcast failures never reach the caller", "[manager][broadcast]")
{
    auto broadcaster = std::make_shared<FailingBroadcaster>();
    ConsensusHooks hooks;
    hooks.broadcaster = broadcaster;
    ConsensusManager cm("A", {}, hooks);
    cm.set_committee(members({"A"}));

    auto p = cm.propose_join(JoinProposalData{"new"});
    REQUIRE(p.has_value());
    REQUIRE(cm.vote(p->id, true).has_value());
    REQUIRE(cm.proposal(p->id)->phase == Phase::Finalized);
    REQUIRE(broadcaster->attempts.load() == 2);
}

TEST_CASE("Remote votes are verified before they count", "[manager][signing]")
{
    auto a = crypto::Ed25519KeyPair::generate().value();
    auto b = crypto::Ed25519KeyPair::generate().value();
    auto committee = members({"A", "B", "C"});
    committee[0].public_key = a.public_key_b64();
    committee[1].public_key = b.public_key_b64();

    ConsensusHooks hooks;
    hooks.verifier = CommitteeKeyVerifier::from_members(committee).value();
    ConsensusManager cm("A", {}, hooks);
    cm.set_committee(committee);
    auto p = cm.propose_join(JoinProposalData{"new"});

    SECTION("Forged vote is refused without side effects")
    {
        auto forged = vote_from("B", true);
        auto sig = a.sign(canonical_vote_bytes(p->id, "B", true));
        forged.signature = crypto::Base64::encode(crypto::Bytes(sig.begin(), sig.end()));

        auto res = cm.receive_vote(p->id, forged);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidSignature);
        REQUIRE(cm.proposal(p->id)->votes.empty());
    }

    SECTION("Unsigned vote is refused")
    {
        auto res = cm.receive_vote(p->id, vote_from("B", true));
        REQUIRE(res.error().code == ErrorCode::InvalidSignature);
    }

    SECTION("Properly signed vote is counted")
    {
        auto genuine = vote_from("B", true);
        Ed25519Signer b_signer(b);
        genuine.signature = b_signer.sign(canonical_vote_bytes(p->id, "B", true)).value();

        REQUIRE(cm.receive_vote(p->id, genuine).has_value());
        REQUIRE(cm.proposal(p->id)->has_voted("B"));
    }
}

TEST_CASE("Admission errors take precedence over signature errors", "[manager][signing][errors]")
{
    auto a = crypto::Ed25519KeyPair::generate().value();
    auto committee = members({"A", "B", "C"});
    committee[0].public_key = a.public_key_b64();

    auto clock = std::make_shared<ManualClock>();
    ConsensusHooks hooks;
    hooks.verifier = CommitteeKeyVerifier::from_members(committee).value();
    ConsensusManager cm("A", {}, hooks, clock);
    cm.set_committee(committee);
    auto p = cm.propose_join(JoinProposalData{"new"});

    SECTION("Unsigned vote from a non-member")
    {
        REQUIRE(cm.receive_vote(p->id, vote_from("Z", true)).error().code == ErrorCode::NotMember);
    }

    SECTION("Unsigned vote on an unknown proposal")
    {
        REQUIRE(cm.receive_vote("missing", vote_from("B", true)).error().code == ErrorCode::NotFound);
    }

    SECTION("Unsigned vote after the deadline still times the proposal out")
    {
        clock->advance(31s);
        auto res = cm.receive_vote(p->id, vote_from("B", true));
        REQUIRE(res.error().code == ErrorCode::DeadlinePassed);

        auto timed_out = cm.proposal(p->id);
        REQUIRE(timed_out->phase == Phase::Timeout);
        REQUIRE(timed_out->votes.empty());
        REQUIRE(timed_out->result->reason == "timeout");
    }

    SECTION("Unsigned vote within the deadline fails verification")
    {
        REQUIRE(cm.receive_vote(p->id, vote_from("B", true)).error().code == ErrorCode::InvalidSignature);
        REQUIRE(cm.proposal(p->id)->phase == Phase::Pending);
    }
}

TEST_CASE("Member reputation comes from the injected source when present", "[manager]")
{
    ConsensusManager plain("A");
    plain.set_committee(members({"A", "B"}));
    REQUIRE(plain.member_reputation("B") == 60.0);
    REQUIRE_FALSE(plain.member_reputation("Z").has_value());

    ConsensusHooks hooks;
    hooks.reputation = std::make_shared<FixedReputation>();
    ConsensusManager hooked("A", {}, hooks);
    hooked.set_committee(members({"A", "B"}));
    REQUIRE(hooked.member_reputation("B") == 99.5);
    REQUIRE_FALSE(hooked.member_reputation("Z").has_value());
}

TEST_CASE("reset drops every proposal", "[manager]")
{
    ConsensusManager cm("A");
    cm.propose_join(JoinProposalData{"new1"}).value();
    cm.propose_kick(KickProposalData{"bad"}).value();
    REQUIRE(cm.proposal_count() == 2);
    cm.reset();
    REQUIRE(cm.proposal_count() == 0);
}

TEST_CASE("Concurrent votes finalize exactly once", "[manager][concurrency]")
{
    auto committee = members({"n0", "n1", "n2", "n3", "n4", "n5", "n6", "n7", "n8", "n9", "n10"});
    ConsensusManager cm("n0");
    cm.set_committee(committee);
    REQUIRE(cm.quorum_size() == 7);

    auto p = cm.propose_join(JoinProposalData{"new"});

    std::atomic<int> accepted{0};
    std::atomic<int> closed{0};
    std::vector<std::thread> threads;
    for (const auto &m : committee)
    {
        threads.emplace_back([&, id = m.node_id] {
            auto res = cm.receive_vote(p->id, vote_from(id, true));
            if (res)
                ++accepted;
            else if (res.error().code == ErrorCode::ProposalClosed)
                ++closed;
        });
    }
    for (auto &t : threads)
        t.join();

    REQUIRE(accepted.load() == 7);
    REQUIRE(closed.load() == 4);

    auto final_state = cm.proposal(p->id);
    REQUIRE(final_state->phase == Phase::Finalized);
    REQUIRE(final_state->votes.size() == 7);
    REQUIRE(final_state->result->agree_count == 7);
}

TEST_CASE("Concurrent creation never exceeds the cap", "[manager][concurrency][capacity]")
{
    ConsensusConfig cfg;
    cfg.voting.max_pending = 25;
    ConsensusManager cm("A", cfg);

    std::atomic<int> created{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i)
            {
                auto res = cm.create_proposal(ProposalType::Parameter, {});
                if (res)
                    ++created;
                else if (res.error().code == ErrorCode::CapacityExceeded)
                    ++refused;
            }
        });
    }
    for (auto &t : threads)
        t.join();

    REQUIRE(created.load() == 25);
    REQUIRE(refused.load() == 55);
    REQUIRE(cm.proposal_count() == 25);
}
