#include <gtest/gtest.h>
#include <filesystem>
#include "pipeline_tuner/database/DatabaseManager.hpp"

using pipeline_tuner::database::DatabaseManager;
using pipeline_tuner::database::DatabaseConfig;
using namespace pipeline_tuner;

namespace {

SessionSnapshot makeSnapshot(const std::string& name) {
    SessionSnapshot snapshot;
    snapshot.name = name;
    snapshot.space_signature = "threshold:continuous:0:1:0;window:integer:3:15:0";
    snapshot.seed = 42;
    snapshot.iteration_count = 2;
    snapshot.phase = SessionPhase::AWAITING_EVALUATION;
    snapshot.retry_count = 1;
    snapshot.non_improving_iterations = 1;
    snapshot.pending = Configuration{{"threshold", 0.1}, {"window", 11}};
    snapshot.design_queue = {
        Configuration{{"threshold", 0.35}, {"window", 4}},
        Configuration{{"threshold", 0.8}, {"window", 14}}
    };

    Observation first;
    first.configuration = {{"threshold", 0.6}, {"window", 7}};
    first.encoded = {0.6, 1.0 / 3.0};
    first.objective = 0.25;
    first.noise = 0.01;
    first.source = ObservationSource::AUTOMATED;
    first.order_index = 0;
    first.timestamp = "2026-01-01 10:00:00";

    Observation second;
    second.configuration = {{"threshold", 0.2}, {"window", 13}};
    second.encoded = {0.2, 10.0 / 12.0};
    second.objective = -1.0;
    second.noise = 0.0025;
    second.source = ObservationSource::MANUAL;
    second.order_index = 1;
    second.timestamp = "2026-01-01 10:05:00";

    snapshot.observations = {first, second};
    snapshot.created_at = "2026-01-01 09:55:00";
    snapshot.updated_at = "2026-01-01 10:05:00";
    return snapshot;
}

} // namespace

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_db_name = "test_tuning_sessions.db";
        if (std::filesystem::exists(test_db_name)) {
            std::filesystem::remove(test_db_name);
        }
    }

    void TearDown() override {
        if (std::filesystem::exists(test_db_name)) {
            std::filesystem::remove(test_db_name);
        }
    }
    std::string test_db_name;
};

TEST_F(DatabaseManagerTest, DisabledDatabaseIsNoOp) {
    DatabaseManager db(DatabaseConfig::disabled());
    EXPECT_FALSE(db.isEnabled());
    EXPECT_TRUE(db.saveSession(makeSnapshot("quiet")));
    EXPECT_FALSE(db.loadSession("quiet").has_value());
    EXPECT_TRUE(db.listSessions().empty());
    EXPECT_TRUE(db.deleteSession("quiet"));
    EXPECT_EQ(db.getSessionId("quiet"), -1);
    EXPECT_FALSE(std::filesystem::exists(test_db_name));
}

TEST_F(DatabaseManagerTest, EnabledDatabaseInitialization) {
    DatabaseManager db(test_db_name, true);
    EXPECT_TRUE(db.isEnabled()) << "Enabled database should initialize successfully";
    EXPECT_TRUE(db.initializeTables()) << "Schema creation should be idempotent";
}

TEST_F(DatabaseManagerTest, SaveAndLoadRoundTrip) {
    DatabaseManager db(DatabaseConfig::sqlite(test_db_name));
    ASSERT_TRUE(db.isEnabled());

    const auto original = makeSnapshot("segmentation");
    ASSERT_TRUE(db.saveSession(original));

    const auto loaded = db.loadSession("segmentation");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->space_signature, original.space_signature);
    EXPECT_EQ(loaded->seed, 42u);
    EXPECT_EQ(loaded->iteration_count, 2);
    EXPECT_EQ(loaded->phase, SessionPhase::AWAITING_EVALUATION);
    EXPECT_EQ(loaded->retry_count, 1);
    EXPECT_EQ(loaded->non_improving_iterations, 1);
    EXPECT_FALSE(loaded->stalled);
    ASSERT_TRUE(loaded->pending.has_value());
    EXPECT_EQ(*loaded->pending, *original.pending);
    EXPECT_EQ(loaded->design_queue, original.design_queue);
    EXPECT_EQ(loaded->created_at, original.created_at);

    ASSERT_EQ(loaded->observations.size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        const auto& got = loaded->observations[i];
        const auto& want = original.observations[i];
        EXPECT_EQ(got.order_index, want.order_index);
        EXPECT_EQ(got.configuration, want.configuration);
        EXPECT_EQ(got.encoded, want.encoded) << "encoded vectors must survive bit for bit";
        EXPECT_DOUBLE_EQ(got.objective, want.objective);
        EXPECT_DOUBLE_EQ(got.noise, want.noise);
        EXPECT_EQ(got.source, want.source);
        EXPECT_EQ(got.timestamp, want.timestamp);
    }
}

TEST_F(DatabaseManagerTest, AbandonedConfigurationsRoundTrip) {
    DatabaseManager db(test_db_name, true);
    auto snapshot = makeSnapshot("stuck");
    snapshot.stalled = true;
    snapshot.abandoned = {
        Configuration{{"threshold", 0.1 + 0.2}, {"window", 5}},
        Configuration{{"threshold", 0.95}, {"window", 15}}
    };
    ASSERT_TRUE(db.saveSession(snapshot));

    const auto loaded = db.loadSession("stuck");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->abandoned, snapshot.abandoned);

    snapshot.abandoned.clear();
    ASSERT_TRUE(db.saveSession(snapshot));
    EXPECT_TRUE(db.loadSession("stuck")->abandoned.empty());
}

TEST_F(DatabaseManagerTest, FailedSaveReportsStepErrorAndRollsBack) {
    DatabaseManager db(test_db_name, true);
    auto snapshot = makeSnapshot("clashing");
    snapshot.observations[1].order_index = snapshot.observations[0].order_index;

    testing::internal::CaptureStderr();
    const bool saved = db.saveSession(snapshot);
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(saved);
    EXPECT_NE(log.find("insert observation 0"), std::string::npos) << log;
    EXPECT_NE(log.find("UNIQUE constraint failed"), std::string::npos) << log;
    EXPECT_EQ(db.getSessionId("clashing"), -1);
    EXPECT_FALSE(db.loadSession("clashing").has_value());
}

TEST_F(DatabaseManagerTest, TerminalSessionWithoutPending) {
    DatabaseManager db(test_db_name, true);
    auto snapshot = makeSnapshot("finished");
    snapshot.phase = SessionPhase::CONVERGED;
    snapshot.termination_reason = TerminationReason::NO_IMPROVEMENT;
    snapshot.pending.reset();
    snapshot.design_queue.clear();
    ASSERT_TRUE(db.saveSession(snapshot));

    const auto loaded = db.loadSession("finished");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->phase, SessionPhase::CONVERGED);
    EXPECT_EQ(loaded->termination_reason, TerminationReason::NO_IMPROVEMENT);
    EXPECT_FALSE(loaded->pending.has_value());
    EXPECT_TRUE(loaded->design_queue.empty());
}

TEST_F(DatabaseManagerTest, SaveReplacesEarlierState) {
    DatabaseManager db(test_db_name, true);
    auto snapshot = makeSnapshot("segmentation");
    ASSERT_TRUE(db.saveSession(snapshot));
    const int id = db.getSessionId("segmentation");
    EXPECT_GT(id, 0);

    snapshot.observations.pop_back();
    snapshot.iteration_count = 1;
    snapshot.stalled = true;
    ASSERT_TRUE(db.saveSession(snapshot));

    EXPECT_EQ(db.getSessionId("segmentation"), id);
    const auto loaded = db.loadSession("segmentation");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->iteration_count, 1);
    EXPECT_TRUE(loaded->stalled);
    EXPECT_EQ(loaded->observations.size(), 1u);
}

TEST_F(DatabaseManagerTest, ListSessionsReportsBestObjective) {
    DatabaseManager db(test_db_name, true);
    auto older = makeSnapshot("older");
    older.updated_at = "2026-01-01 08:00:00";
    auto newer = makeSnapshot("newer");
    newer.updated_at = "2026-01-02 08:00:00";
    newer.observations.clear();
    ASSERT_TRUE(db.saveSession(older));
    ASSERT_TRUE(db.saveSession(newer));

    const auto sessions = db.listSessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].name, "newer");
    EXPECT_FALSE(sessions[0].best_objective.has_value());
    EXPECT_EQ(sessions[1].name, "older");
    ASSERT_TRUE(sessions[1].best_objective.has_value());
    EXPECT_DOUBLE_EQ(*sessions[1].best_objective, 0.25);
    EXPECT_EQ(sessions[1].iteration_count, 2);
}

TEST_F(DatabaseManagerTest, DeleteSessionRemovesEverything) {
    DatabaseManager db(test_db_name, true);
    ASSERT_TRUE(db.saveSession(makeSnapshot("doomed")));
    ASSERT_TRUE(db.saveSession(makeSnapshot("kept")));

    EXPECT_TRUE(db.deleteSession("doomed"));
    EXPECT_EQ(db.getSessionId("doomed"), -1);
    EXPECT_FALSE(db.loadSession("doomed").has_value());
    EXPECT_TRUE(db.loadSession("kept").has_value());
    EXPECT_TRUE(db.deleteSession("never-stored"));
}

TEST_F(DatabaseManagerTest, SessionSurvivesReopen) {
    {
        DatabaseManager db(test_db_name, true);
        ASSERT_TRUE(db.saveSession(makeSnapshot("persistent")));
    }
    DatabaseManager reopened(test_db_name, true);
    const auto loaded = reopened.loadSession("persistent");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->observations.size(), 2u);
}

TEST_F(DatabaseManagerTest, UnnamedSessionIsRejected) {
    DatabaseManager db(test_db_name, true);
    EXPECT_FALSE(db.saveSession(makeSnapshot("")));
}

TEST(DatabaseSerialization, ConfigurationRoundTripsExactly) {
    const Configuration configuration{{"threshold", 0.1 + 0.2}, {"window", 7}, {"smoothing", 2}};
    const auto text = DatabaseManager::serializeConfiguration(configuration);
    const auto parsed = DatabaseManager::parseConfiguration(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, configuration);
}

TEST(DatabaseSerialization, VectorRoundTripsExactly) {
    const std::vector<double> values{1.0 / 3.0, 0.0, 1e-12, 1.0};
    const auto parsed = DatabaseManager::parseVector(DatabaseManager::serializeVector(values));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, values);

    const auto empty = DatabaseManager::parseVector("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(DatabaseSerialization, MalformedTextIsRejected) {
    EXPECT_FALSE(DatabaseManager::parseConfiguration("threshold=abc;").has_value());
    EXPECT_FALSE(DatabaseManager::parseConfiguration("threshold;").has_value());
    EXPECT_FALSE(DatabaseManager::parseConfiguration("=0.5;").has_value());
    EXPECT_FALSE(DatabaseManager::parseVector("0.5,,1").has_value());
    EXPECT_FALSE(DatabaseManager::parseVector("0.5,x").has_value());
}
