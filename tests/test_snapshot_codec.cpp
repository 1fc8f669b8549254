#include <gtest/gtest.h>
#include <cstdio>
#include <memory>
#include <string>
#include "paperdesk/ledger_store.hpp"
#include "paperdesk/snapshot_codec.hpp"

using paperdesk::Json;
using paperdesk::SnapshotCodec;

namespace {

// Deterministic UUID-shaped ids: ...-000000000001, ...-000000000002, ...
SnapshotCodec::IdGenerator sequential_ids() {
    auto counter = std::make_shared<int>(0);
    return [counter]() {
        char buffer[40];
        std::snprintf(buffer, sizeof(buffer), "00000000-0000-4000-8000-%012d", ++*counter);
        return std::string(buffer);
    };
}

const char* kFirstId = "00000000-0000-4000-8000-000000000001";
const char* kSecondId = "00000000-0000-4000-8000-000000000002";

} // namespace

class SnapshotCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.seed_defaults();
    }

    paperdesk::LoadReport load(const std::string& text) {
        return SnapshotCodec::decode(Json::parse(text), store_, sequential_ids());
    }

    paperdesk::LedgerStore store_;
};

TEST_F(SnapshotCodecTest, EncodeWritesCurrentVersionAndAllKeys) {
    store_.create_account("alpha", 2000.0);
    Json document = SnapshotCodec::encode(store_);

    EXPECT_EQ(document["version"], SnapshotCodec::kVersion);
    for (const char* key : {"accounts", "agent_name_to_id", "agent_keys", "key_to_agent",
                            "registration_challenges", "pending_by_agent", "registration_by_api_key",
                            "agent_following", "forum_posts", "forum_comments", "stock_prices",
                            "poly_markets", "activity_log", "next_activity_id"}) {
        EXPECT_TRUE(document.contains(key)) << key;
    }

    const Json& account = document["accounts"].begin().value();
    for (const char* key : {"agent_uuid", "display_name", "cash", "registered_at", "is_test", "positions",
                            "avg_cost", "realized_pnl", "poly_positions", "poly_cost_basis",
                            "poly_realized_pnl", "blocked"}) {
        EXPECT_TRUE(account.contains(key)) << key;
    }
}

TEST_F(SnapshotCodecTest, SavedLedgerReloadsUnchanged) {
    auto alpha = store_.create_account("alpha", 2000.0).value();
    auto beta = store_.create_account("beta", 2000.0).value();
    auto* account = store_.find_account(alpha.account_id);
    account->cash = 1558.0;
    account->positions.set("AAPL", 2.0, 200.0);
    account->poly.add("poly-us-recession-2026", "YES", 100.0, 42.0);
    account->realized_pnl = 12.5;
    account->blocked = true;
    account->profile["avatar"] = "cat.png";
    store_.follow(alpha.account_id, Json(beta.account_id));
    store_.set_last_price("AAPL", 215.0);
    store_.record_event("custom", alpha.account_id, Json{{"note", "x"}});

    std::string payload = SnapshotCodec::encode(store_).dump();

    paperdesk::LedgerStore reloaded;
    auto report = SnapshotCodec::decode(Json::parse(payload), reloaded, sequential_ids());
    EXPECT_EQ(report.source_version, SnapshotCodec::kVersion);
    EXPECT_FALSE(report.changed());

    ASSERT_EQ(reloaded.account_ids(), store_.account_ids());
    const auto* restored = reloaded.find_account(alpha.account_id);
    ASSERT_NE(restored, nullptr);
    EXPECT_DOUBLE_EQ(restored->cash, 1558.0);
    EXPECT_DOUBLE_EQ(restored->positions.find("AAPL")->avg_cost, 200.0);
    EXPECT_DOUBLE_EQ(restored->poly.shares("poly-us-recession-2026", "YES"), 100.0);
    EXPECT_DOUBLE_EQ(restored->realized_pnl, 12.5);
    EXPECT_TRUE(restored->blocked);
    EXPECT_EQ(restored->profile["avatar"], "cat.png");

    EXPECT_EQ(reloaded.resolve_api_key(alpha.api_key), alpha.account_id);
    EXPECT_EQ(reloaded.resolve("beta"), beta.account_id);
    EXPECT_DOUBLE_EQ(*reloaded.last_price("AAPL"), 215.0);
    EXPECT_EQ(reloaded.activity_log().size(), store_.activity_log().size());
    EXPECT_EQ(reloaded.next_activity_id(), store_.next_activity_id());
    EXPECT_EQ(reloaded.following().at(alpha.account_id).size(), 1u);
    EXPECT_EQ(SnapshotCodec::encode(reloaded).dump(), payload);
}

TEST_F(SnapshotCodecTest, MigratesNameKeyedDocument) {
    auto report = load(R"({
        "accounts": {
            "alpha": {"cash": 1500, "positions": {"AAPL": 2}, "avg_cost": {"AAPL": 200}},
            "beta": {"cash": 2000}
        },
        "agent_keys": {"alpha": "k1"},
        "key_to_agent": {"k1": "alpha"},
        "test_agents": ["beta"],
        "activity_log": [
            {"id": 3, "type": "agent_registered", "agent_id": "alpha", "details": {"initial_cash": 2000}}
        ]
    })");

    EXPECT_EQ(report.source_version, 0);
    EXPECT_TRUE(report.migrated);

    EXPECT_EQ(store_.resolve("alpha"), std::string(kFirstId));
    EXPECT_EQ(store_.resolve("beta"), std::string(kSecondId));
    EXPECT_EQ(store_.resolve_api_key("k1"), std::string(kFirstId));
    EXPECT_EQ(store_.api_key_for(kFirstId), std::string("k1"));

    const auto* alpha = store_.find_account(kFirstId);
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(alpha->display_name, "alpha");
    EXPECT_DOUBLE_EQ(alpha->cash, 1500.0);
    EXPECT_DOUBLE_EQ(alpha->positions.quantity("AAPL"), 2.0);
    EXPECT_FALSE(alpha->is_test);
    EXPECT_TRUE(store_.find_account(kSecondId)->is_test);

    ASSERT_EQ(store_.activity_log().size(), 1u);
    EXPECT_EQ(store_.activity_log().front().account_id, kFirstId);
    EXPECT_EQ(store_.next_activity_id(), 4);

    Json saved = SnapshotCodec::encode(store_);
    EXPECT_EQ(saved["version"], 6);
    EXPECT_FALSE(saved.contains("test_agents"));
    EXPECT_FALSE(saved.contains("agent_name_to_uuid"));
}

TEST_F(SnapshotCodecTest, LegacyRecordKeepsItsOwnUuid) {
    load(R"({
        "accounts": {
            "alpha": {"agent_uuid": "6f1c2a9e-3b7d-4e58-9a01-2c3d4e5f6a7b", "cash": 10}
        }
    })");
    EXPECT_EQ(store_.resolve("alpha"), std::string("6f1c2a9e-3b7d-4e58-9a01-2c3d4e5f6a7b"));
}

TEST_F(SnapshotCodecTest, VersionFiveUpgrade) {
    Json v5 = Json::parse(R"({
        "version": 5,
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {
                "agent_uuid": "00000000-0000-4000-8000-00000000000a",
                "display_name": "alpha",
                "poly_positions": {"m1": {"YES": 10}}
            }
        },
        "agent_name_to_uuid": {"alpha": "00000000-0000-4000-8000-00000000000a"},
        "test_agents": ["00000000-0000-4000-8000-00000000000a"]
    })");

    Json v6 = SnapshotCodec::migrate_v5_to_v6(v5);
    EXPECT_EQ(v6["version"], 6);
    EXPECT_FALSE(v6.contains("agent_name_to_uuid"));
    EXPECT_FALSE(v6.contains("test_agents"));
    EXPECT_EQ(v6["agent_name_to_id"]["alpha"], "00000000-0000-4000-8000-00000000000a");

    const Json& account = v6["accounts"]["00000000-0000-4000-8000-00000000000a"];
    EXPECT_EQ(account["is_test"], true);
    EXPECT_EQ(account["poly_cost_basis"]["m1"]["YES"], 0.0);
}

TEST_F(SnapshotCodecTest, CurrentVersionIsNotMigrated) {
    paperdesk::LoadReport report;
    Json document = Json{{"version", 6}, {"accounts", Json::object()}};
    Json migrated = SnapshotCodec::migrate(document, sequential_ids(), &report);
    EXPECT_EQ(migrated, document);
    EXPECT_FALSE(report.migrated);
}

TEST_F(SnapshotCodecTest, RepairsPositionInvariants) {
    auto report = load(R"({
        "version": 6,
        "stock_prices": {"MSFT": 420},
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {
                "display_name": "alpha",
                "positions": {"AAPL": 0, "MSFT": 3, "NVDA": 1},
                "avg_cost": {"AAPL": 100, "TSLA": 50},
                "poly_positions": {"m1": {"YES": 0}}
            }
        }
    })");

    EXPECT_TRUE(report.changed());
    EXPECT_FALSE(report.migrated);
    EXPECT_GE(report.repairs.size(), 5u);

    const auto* account = store_.find_account("00000000-0000-4000-8000-00000000000a");
    ASSERT_NE(account, nullptr);
    EXPECT_EQ(account->positions.size(), 2u);
    EXPECT_EQ(account->positions.find("AAPL"), nullptr);
    EXPECT_DOUBLE_EQ(account->positions.find("MSFT")->avg_cost, 420.0);
    EXPECT_DOUBLE_EQ(account->positions.find("NVDA")->avg_cost, 0.0);
    EXPECT_TRUE(account->poly.empty());

    // The document's price table replaces the seeded one.
    EXPECT_FALSE(store_.last_price("AAPL").has_value());
}

TEST_F(SnapshotCodecTest, ReconcilesKeyIndexes) {
    load(R"({
        "version": 6,
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {"display_name": "alpha"},
            "00000000-0000-4000-8000-00000000000b": {"display_name": "beta"}
        },
        "agent_keys": {"00000000-0000-4000-8000-00000000000a": "k1"},
        "key_to_agent": {"k2": "beta", "k3": "ghost"}
    })");

    EXPECT_EQ(store_.resolve_api_key("k1"), std::string("00000000-0000-4000-8000-00000000000a"));
    EXPECT_EQ(store_.api_key_for("00000000-0000-4000-8000-00000000000b"), std::string("k2"));
    EXPECT_FALSE(store_.resolve_api_key("k3").has_value());
}

TEST_F(SnapshotCodecTest, KeepsStoredAccountIdsAsIs) {
    const std::string text = R"({
        "version": 6,
        "accounts": {"acct-1": {"agent_uuid": "acct-1", "display_name": "alpha", "cash": 1200}},
        "agent_name_to_id": {"alpha": "acct-1"},
        "agent_keys": {"acct-1": "k1"},
        "key_to_agent": {"k1": "acct-1"}
    })";

    for (int pass = 0; pass < 2; ++pass) {
        auto report = load(text);
        EXPECT_FALSE(report.changed());
        EXPECT_EQ(store_.resolve("acct-1"), std::string("acct-1"));
        EXPECT_EQ(store_.resolve("alpha"), std::string("acct-1"));
        EXPECT_EQ(store_.resolve_api_key("k1"), std::string("acct-1"));
        EXPECT_DOUBLE_EQ(store_.find_account("acct-1")->cash, 1200.0);
    }
}

TEST_F(SnapshotCodecTest, MintedAccountIdIsARepair) {
    auto report = load(R"({
        "version": 6,
        "accounts": {" ": {"display_name": "alpha"}}
    })");

    EXPECT_TRUE(report.changed());
    EXPECT_EQ(store_.resolve("alpha"), std::string(kFirstId));
}

TEST_F(SnapshotCodecTest, PositionMultiplierSurvivesSaveAndFallsBackPerSymbol) {
    auto registration = store_.create_account("alpha", 2000.0);
    ASSERT_TRUE(registration.ok());
    const std::string id = registration->account_id;
    store_.find_account(id)->positions.set("AAPL", 1.0, 10.0, 100.0);

    Json saved = SnapshotCodec::encode(store_);
    EXPECT_EQ(saved["accounts"][id]["contract_multiplier"]["AAPL"], 100.0);

    paperdesk::LedgerStore reloaded;
    SnapshotCodec::decode(saved, reloaded, sequential_ids());
    EXPECT_DOUBLE_EQ(reloaded.find_account(id)->positions.find("AAPL")->multiplier, 100.0);

    load(R"({
        "version": 6,
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {
                "display_name": "beta",
                "positions": {"MSFT": 1, "AAPL260320C00200000": 2},
                "avg_cost": {"MSFT": 400, "AAPL260320C00200000": 3}
            }
        }
    })");
    const auto* beta = store_.find_account("00000000-0000-4000-8000-00000000000a");
    ASSERT_NE(beta, nullptr);
    EXPECT_DOUBLE_EQ(beta->positions.find("MSFT")->multiplier, 1.0);
    EXPECT_DOUBLE_EQ(beta->positions.find("AAPL260320C00200000")->multiplier, 100.0);
}

TEST_F(SnapshotCodecTest, DuplicateNamesGetSuffixes) {
    auto report = load(R"({
        "version": 6,
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {"display_name": "alpha"},
            "00000000-0000-4000-8000-00000000000b": {"display_name": "alpha"},
            "00000000-0000-4000-8000-00000000000c": {"display_name": "alpha"},
            "00000000-0000-4000-8000-00000000000d": {}
        }
    })");

    EXPECT_TRUE(report.changed());
    EXPECT_EQ(store_.find_account("00000000-0000-4000-8000-00000000000a")->display_name, "alpha");
    EXPECT_EQ(store_.find_account("00000000-0000-4000-8000-00000000000b")->display_name, "alpha_2");
    EXPECT_EQ(store_.find_account("00000000-0000-4000-8000-00000000000c")->display_name, "alpha_3");
    EXPECT_EQ(store_.find_account("00000000-0000-4000-8000-00000000000d")->display_name, "agent-00000000");
    EXPECT_EQ(store_.resolve("alpha_3"), std::string("00000000-0000-4000-8000-00000000000c"));
}

TEST_F(SnapshotCodecTest, NormalizesFollowGraph) {
    auto report = load(R"({
        "version": 6,
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {"display_name": "alpha"},
            "00000000-0000-4000-8000-00000000000b": {"display_name": "beta"}
        },
        "agent_following": {
            "alpha": ["beta", "beta", "ghost", {"agent_id": "beta"}],
            "ghost": ["alpha"]
        }
    })");

    EXPECT_TRUE(report.changed());
    EXPECT_EQ(store_.following().count("ghost"), 0u);
    const auto& targets = store_.following().at("00000000-0000-4000-8000-00000000000a");
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0], "00000000-0000-4000-8000-00000000000b");
}

TEST_F(SnapshotCodecTest, BackfillsAuthorsAndRefreshesNames) {
    load(R"({
        "version": 6,
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {"display_name": "alpha"}
        },
        "forum_posts": [{"post_id": 1, "agent_id": "alpha"}],
        "forum_comments": [{"comment_id": 1, "post_id": 1, "agent_uuid": "00000000-0000-4000-8000-00000000000a", "agent_id": "old"}],
        "activity_log": [{"id": 1, "type": "forum_post", "agent_uuid": "00000000-0000-4000-8000-00000000000a", "agent_id": "old"}]
    })");

    EXPECT_EQ(store_.forum_posts()[0]["agent_uuid"], "00000000-0000-4000-8000-00000000000a");
    EXPECT_EQ(store_.forum_comments()[0]["agent_id"], "alpha");
    EXPECT_EQ(store_.activity_log().front().display_name, "alpha");
}

TEST_F(SnapshotCodecTest, RederivesActivityCounter) {
    load(R"({
        "version": 6,
        "activity_log": [{"id": 7, "type": "a"}, {"id": 9, "type": "b"}],
        "next_activity_id": 0
    })");
    EXPECT_EQ(store_.next_activity_id(), 10);

    load(R"({"version": 6, "activity_log": [{"id": 7, "type": "a"}], "next_activity_id": 42})");
    EXPECT_EQ(store_.next_activity_id(), 42);
}

TEST_F(SnapshotCodecTest, ActivityLogTrimmedToCapacity) {
    paperdesk::LedgerStore small(2);
    SnapshotCodec::decode(Json::parse(R"({
        "version": 6,
        "activity_log": [{"id": 1, "type": "a"}, {"id": 2, "type": "b"}, {"id": 3, "type": "c"}]
    })"), small, sequential_ids());

    ASSERT_EQ(small.activity_log().size(), 2u);
    EXPECT_EQ(small.activity_log().front().id, 2);
    EXPECT_EQ(small.next_activity_id(), 4);
}

TEST_F(SnapshotCodecTest, CarriesUnknownKeysThrough) {
    load(R"({
        "version": 6,
        "forum_settings": {"max_posts": 10},
        "accounts": {
            "00000000-0000-4000-8000-00000000000a": {"display_name": "alpha", "avatar": "cat.png"}
        }
    })");

    Json saved = SnapshotCodec::encode(store_);
    EXPECT_EQ(saved["forum_settings"]["max_posts"], 10);
    EXPECT_EQ(saved["accounts"]["00000000-0000-4000-8000-00000000000a"]["avatar"], "cat.png");
}

TEST_F(SnapshotCodecTest, MissingKeysKeepSeededMarketData) {
    auto report = load("{}");
    EXPECT_EQ(store_.account_count(), 0u);
    EXPECT_DOUBLE_EQ(*store_.last_price("AAPL"), 210.0);
    EXPECT_NE(store_.find_market("poly-btc-150k-2026"), nullptr);
    EXPECT_EQ(store_.next_activity_id(), 1);
    EXPECT_TRUE(report.migrated);
}

TEST_F(SnapshotCodecTest, WrongTypedFieldsAreTolerated) {
    EXPECT_NO_THROW(load(R"({
        "version": 6,
        "accounts": [],
        "stock_prices": "nope",
        "poly_markets": {"m1": 5, "m2": {"outcomes": {"YES": "x", "NO": 0.5}, "resolved": true, "winning_outcome": "NO"}},
        "activity_log": {"id": 1},
        "agent_keys": ["k1"],
        "forum_posts": [1, 2],
        "next_activity_id": "seven"
    })"));

    EXPECT_DOUBLE_EQ(*store_.last_price("AAPL"), 210.0);
    EXPECT_EQ(store_.find_market("m1"), nullptr);
    const auto* market = store_.find_market("m2");
    ASSERT_NE(market, nullptr);
    EXPECT_TRUE(market->resolved);
    EXPECT_EQ(market->outcomes.size(), 1u);
    EXPECT_TRUE(store_.forum_posts().empty());
    EXPECT_EQ(store_.next_activity_id(), 1);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
