#include <gtest/gtest.h>
#include "storage/FirebaseProvider.hpp"
#include "storage/SupabaseProvider.hpp"
#include "storage/Compressor.hpp"
#include "error/CloudError.hpp"

using namespace cs::storage;
using namespace cs::config;
using namespace cs::util;
using namespace std::chrono_literals;
using json = nlohmann::json;

class ProvidersTest : public ::testing::Test {
protected:
    static FirebaseConfig firebase() {
        FirebaseConfig f;
        f.api_key = "key";
        f.project_id = "demo-game";
        return f;
    }

    static SupabaseConfig supabase() {
        SupabaseConfig s;
        s.url = "https://abc.supabase.co/";
        s.anon_key = "anon";
        return s;
    }

    static SlotRecord record() {
        return {
            .slot = 4,
            .saveName = "Before the boss",
            .blob = Compressor::raw({{"player", {{"level", 30}}}}),
            .checksum = std::string(64, 'c'),
            .updatedAt = parseIso8601("2026-03-01T12:30:45.250Z"),
            .originalSize = 120,
            .storedSize = 150
        };
    }
};

TEST_F(ProvidersTest, Firebase_DefaultsToProjectDatabase) {
    const FirebaseProvider p(firebase(), 5s);
    EXPECT_EQ(p.name(), "firebase");
    EXPECT_EQ(p.baseUrl(), "https://demo-game-default-rtdb.firebaseio.com");
    EXPECT_EQ(p.urlFor("/users/u1/saves/slot_0"),
              "https://demo-game-default-rtdb.firebaseio.com/users/u1/saves/slot_0.json");
}

TEST_F(ProvidersTest, Firebase_ExplicitDatabaseUrlIsTrimmed) {
    auto cfg = firebase();
    cfg.database_url = "https://eu.example-rtdb.firebasedatabase.app///";

    const FirebaseProvider p(cfg, 5s);
    EXPECT_EQ(p.baseUrl(), "https://eu.example-rtdb.firebasedatabase.app");
}

TEST_F(ProvidersTest, Firebase_EmulatorAddsNamespace) {
    auto cfg = firebase();
    cfg.use_emulator = true;
    cfg.emulator = EmulatorConfig{.host = "127.0.0.1", .port = 9100};

    const FirebaseProvider p(cfg, 5s);
    EXPECT_EQ(p.baseUrl(), "http://127.0.0.1:9100");
    EXPECT_EQ(p.urlFor("/users", "shallow=true"), "http://127.0.0.1:9100/users.json?shallow=true&ns=demo-game");
}

TEST_F(ProvidersTest, Firebase_AuthTokenIsEscapedIntoQuery) {
    FirebaseProvider p(firebase(), 5s);
    p.setAuthToken("id token/1");

    EXPECT_EQ(p.urlFor("/users"), "https://demo-game-default-rtdb.firebaseio.com/users.json?auth=id%20token%2F1");
}

TEST_F(ProvidersTest, Firebase_RequiresProjectOrDatabaseUrl) {
    FirebaseConfig cfg;
    cfg.api_key = "key";
    EXPECT_THROW((void)FirebaseProvider(cfg, 5s), cs::error::ConfigurationError);
}

TEST_F(ProvidersTest, Supabase_TableUrlUsesRestEndpoint) {
    const SupabaseProvider p(supabase(), 5s);
    EXPECT_EQ(p.name(), "supabase");
    EXPECT_EQ(p.tableUrl(), "https://abc.supabase.co/rest/v1/cloud_saves");
    EXPECT_EQ(p.tableUrl("select=slot_number&limit=1"),
              "https://abc.supabase.co/rest/v1/cloud_saves?select=slot_number&limit=1");
}

TEST_F(ProvidersTest, Supabase_RequiresUrlAndAnonKey) {
    auto cfg = supabase();
    cfg.anon_key.clear();
    EXPECT_THROW((void)SupabaseProvider(cfg, 5s), cs::error::ConfigurationError);
}

TEST_F(ProvidersTest, Supabase_RowCarriesEveryColumn) {
    const auto r = record();
    const auto row = SupabaseProvider::toRow("user-9", r);

    EXPECT_EQ(row.at("user_id"), "user-9");
    EXPECT_EQ(row.at("slot_number"), 4);
    EXPECT_EQ(row.at("save_name"), "Before the boss");
    EXPECT_EQ(row.at("save_data"), r.blob);
    EXPECT_EQ(row.at("checksum"), r.checksum);
    EXPECT_EQ(row.at("updated_at"), "2026-03-01T12:30:45.250Z");
    EXPECT_EQ(row.at("original_size"), 120);
    EXPECT_EQ(row.at("stored_size"), 150);

    const auto back = SupabaseProvider::fromRow(row);
    EXPECT_EQ(back.slot, r.slot);
    EXPECT_EQ(back.saveName, r.saveName);
    EXPECT_EQ(back.blob, r.blob);
    EXPECT_EQ(back.checksum, r.checksum);
    EXPECT_EQ(back.updatedAt, r.updatedAt);
    EXPECT_EQ(back.originalSize, r.originalSize);
    EXPECT_EQ(back.storedSize, r.storedSize);
}

TEST_F(ProvidersTest, Supabase_FromRowAcceptsPostgresTimestampsAndNulls) {
    const json row{
        {"slot_number", 1},
        {"save_name", nullptr},
        {"checksum", nullptr},
        {"updated_at", "2026-03-01T12:30:45.250123+00:00"}
    };

    const auto r = SupabaseProvider::fromRow(row);
    EXPECT_EQ(r.slot, 1u);
    EXPECT_TRUE(r.saveName.empty());
    EXPECT_TRUE(r.checksum.empty());
    EXPECT_EQ(r.updatedAt, parseIso8601("2026-03-01T12:30:45.250Z"));
}

TEST_F(ProvidersTest, SlotRecord_JsonKeepsMetadata) {
    const auto r = record();
    const json j = r;
    const auto back = j.get<SlotRecord>();

    EXPECT_EQ(back.slot, r.slot);
    EXPECT_EQ(back.blob, r.blob);
    EXPECT_EQ(back.updatedAt, r.updatedAt);

    const auto info = toInfo(r);
    EXPECT_EQ(info.slot, 4u);
    EXPECT_EQ(info.saveName, r.saveName);
    EXPECT_EQ(info.storedSize, 150u);
}
