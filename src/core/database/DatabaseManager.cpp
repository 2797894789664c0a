#include "pipeline_tuner/database/DatabaseManager.hpp"
#include "pipeline_tuner/logging.hpp"
#include <sqlite3.h>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace pipeline_tuner::database {

namespace {

std::string formatDouble(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    return buffer;
}

bool parseDouble(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return errno == 0 && end == text.c_str() + text.size();
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

/// Steps a prepared statement once and finalizes it; error receives the step's message.
int stepAndFinalize(sqlite3* db, sqlite3_stmt* stmt, std::string& error) {
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        error = sqlite3_errmsg(db);
    }
    sqlite3_finalize(stmt);
    return rc;
}

std::string serializeDesign(const std::vector<Configuration>& design) {
    std::string text;
    for (const auto& configuration : design) {
        text += DatabaseManager::serializeConfiguration(configuration);
        text += "\n";
    }
    return text;
}

std::optional<std::vector<Configuration>> parseDesign(const std::string& text) {
    std::vector<Configuration> design;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }
        auto configuration = DatabaseManager::parseConfiguration(line);
        if (!configuration) {
            return std::nullopt;
        }
        design.push_back(std::move(*configuration));
    }
    return design;
}

} // namespace

// PIMPL implementation to hide SQLite details
class DatabaseManager::Impl {
public:
    sqlite3* db = nullptr;
    DatabaseConfig config;
    bool enabled = false;

    explicit Impl(const DatabaseConfig& cfg) : config(cfg), enabled(cfg.enabled) {
        if (!enabled) {
            LOG_INFO("DatabaseManager: Disabled - sessions will not be persisted");
            return;
        }

        int rc = sqlite3_open(config.connection_string.c_str(), &db);
        if (rc != SQLITE_OK) {
            LOG_ERROR("DatabaseManager: Failed to open database: " + std::string(sqlite3_errmsg(db)));
            enabled = false;
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
        } else {
            LOG_INFO("DatabaseManager: Connected to " + config.connection_string);
        }
    }

    ~Impl() {
        if (db) {
            sqlite3_close(db);
        }
    }

    bool exec(const char* sql) const {
        char* error_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(std::string("DatabaseManager: ") + (error_msg ? error_msg : "unknown error") +
                      " in: " + sql);
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool initializeTables() const {
        if (!enabled || !db) return !enabled; // Success if disabled

        const auto create_sessions_table = R"(
            CREATE TABLE IF NOT EXISTS sessions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT UNIQUE NOT NULL,
                space_signature TEXT NOT NULL,
                seed INTEGER NOT NULL,
                iteration_count INTEGER NOT NULL DEFAULT 0,
                phase TEXT NOT NULL,
                terminated INTEGER NOT NULL DEFAULT 0,
                termination_reason TEXT NOT NULL DEFAULT 'none',
                retry_count INTEGER NOT NULL DEFAULT 0,
                stalled INTEGER NOT NULL DEFAULT 0,
                non_improving_iterations INTEGER NOT NULL DEFAULT 0,
                pending_configuration TEXT,             -- NULL when nothing is awaiting evaluation
                remaining_design TEXT,                  -- one configuration per line
                abandoned_configurations TEXT,          -- stalled configurations, one per line
                best_objective REAL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            );
        )";

        const auto create_observations_table = R"(
            CREATE TABLE IF NOT EXISTS observations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                session_id INTEGER NOT NULL,
                order_index INTEGER NOT NULL,
                configuration TEXT NOT NULL,
                encoded TEXT NOT NULL,
                objective REAL NOT NULL,
                noise REAL NOT NULL,
                source TEXT NOT NULL,
                timestamp TEXT,
                UNIQUE(session_id, order_index),
                FOREIGN KEY(session_id) REFERENCES sessions(id)
            );
        )";

        const auto create_observation_index = R"(
            CREATE INDEX IF NOT EXISTS idx_observations_session
            ON observations(session_id, order_index);
        )";

        return exec(create_sessions_table) &&
               exec(create_observations_table) &&
               exec(create_observation_index);
    }
};

// DatabaseManager implementation
DatabaseManager::DatabaseManager(const DatabaseConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    if (impl_->enabled && !initializeTables()) {
        LOG_ERROR("DatabaseManager: Failed to initialize tables");
    }
}

DatabaseManager::DatabaseManager(const std::string& db_path, bool enabled)
    : DatabaseManager(enabled ? DatabaseConfig::sqlite(db_path) : DatabaseConfig::disabled()) {
}

DatabaseManager::~DatabaseManager() = default;

bool DatabaseManager::isEnabled() const {
    return impl_->enabled && impl_->db != nullptr;
}

bool DatabaseManager::initializeTables() const {
    return impl_->initializeTables();
}

// ================================
// SERIALIZATION
// ================================

std::string DatabaseManager::serializeConfiguration(const Configuration& configuration) {
    std::string text;
    for (const auto& [name, value] : configuration) {
        text += name + "=" + formatDouble(value) + ";";
    }
    return text;
}

std::optional<Configuration> DatabaseManager::parseConfiguration(const std::string& text) {
    Configuration configuration;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find(';', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string pair = text.substr(start, end - start);
        start = end + 1;
        if (pair.empty()) {
            continue;
        }
        const size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            return std::nullopt;
        }
        double value = 0.0;
        if (!parseDouble(pair.substr(eq + 1), value)) {
            return std::nullopt;
        }
        configuration[pair.substr(0, eq)] = value;
    }
    return configuration;
}

std::string DatabaseManager::serializeVector(const std::vector<double>& values) {
    std::string text;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            text += ",";
        }
        text += formatDouble(values[i]);
    }
    return text;
}

std::optional<std::vector<double>> DatabaseManager::parseVector(const std::string& text) {
    std::vector<double> values;
    if (text.empty()) {
        return values;
    }
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        double value = 0.0;
        if (!parseDouble(item, value)) {
            return std::nullopt;
        }
        values.push_back(value);
    }
    return values;
}

// ================================
// SESSIONS
// ================================

int DatabaseManager::getSessionId(const std::string& name) const {
    if (!isEnabled()) return -1;

    const auto sql = "SELECT id FROM sessions WHERE name = ?";
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to prepare session lookup: " + std::string(sqlite3_errmsg(impl_->db)));
        return -1;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    int id = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return id;
}

bool DatabaseManager::saveSession(const SessionSnapshot& snapshot) const {
    if (!isEnabled()) return true; // Success if disabled

    if (snapshot.name.empty()) {
        LOG_ERROR("Cannot save a session without a name");
        return false;
    }

    std::optional<double> best_objective;
    for (const auto& obs : snapshot.observations) {
        if (!best_objective || obs.objective > *best_objective) {
            best_objective = obs.objective;
        }
    }

    const bool terminated = snapshot.phase == SessionPhase::CONVERGED ||
                            snapshot.phase == SessionPhase::CANCELLED;
    const std::string phase = toString(snapshot.phase);
    const std::string reason = toString(snapshot.termination_reason);
    const std::string pending = snapshot.pending ? serializeConfiguration(*snapshot.pending) : "";
    const std::string design = serializeDesign(snapshot.design_queue);
    const std::string abandoned = serializeDesign(snapshot.abandoned);
    const std::string created_at = snapshot.created_at.empty() ? logging::currentTimestamp() : snapshot.created_at;
    const std::string updated_at = snapshot.updated_at.empty() ? logging::currentTimestamp() : snapshot.updated_at;

    if (!impl_->exec("BEGIN TRANSACTION")) {
        return false;
    }

    auto rollback = [this](const std::string& what, const std::string& error) {
        LOG_ERROR("Failed to save session (" + what + "): " + error);
        impl_->exec("ROLLBACK");
        return false;
    };
    std::string error;

    int session_id = getSessionId(snapshot.name);
    const bool exists = session_id >= 0;

    const auto insert_sql = R"(
        INSERT INTO sessions (space_signature, seed, iteration_count, phase, terminated,
                              termination_reason, retry_count, stalled, non_improving_iterations,
                              pending_configuration, remaining_design, abandoned_configurations,
                              best_objective, created_at, updated_at, name)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    const auto update_sql = R"(
        UPDATE sessions SET space_signature = ?, seed = ?, iteration_count = ?, phase = ?,
                            terminated = ?, termination_reason = ?, retry_count = ?, stalled = ?,
                            non_improving_iterations = ?, pending_configuration = ?,
                            remaining_design = ?, abandoned_configurations = ?, best_objective = ?,
                            created_at = ?, updated_at = ?
        WHERE name = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, exists ? update_sql : insert_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return rollback("prepare session row", sqlite3_errmsg(impl_->db));
    }

    sqlite3_bind_text(stmt, 1, snapshot.space_signature.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(snapshot.seed));
    sqlite3_bind_int(stmt, 3, snapshot.iteration_count);
    sqlite3_bind_text(stmt, 4, phase.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 5, terminated ? 1 : 0);
    sqlite3_bind_text(stmt, 6, reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 7, snapshot.retry_count);
    sqlite3_bind_int(stmt, 8, snapshot.stalled ? 1 : 0);
    sqlite3_bind_int(stmt, 9, snapshot.non_improving_iterations);
    if (snapshot.pending) {
        sqlite3_bind_text(stmt, 10, pending.c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 10);
    }
    sqlite3_bind_text(stmt, 11, design.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 12, abandoned.c_str(), -1, SQLITE_TRANSIENT);
    if (best_objective) {
        sqlite3_bind_double(stmt, 13, *best_objective);
    } else {
        sqlite3_bind_null(stmt, 13);
    }
    sqlite3_bind_text(stmt, 14, created_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 15, updated_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 16, snapshot.name.c_str(), -1, SQLITE_TRANSIENT);

    if (stepAndFinalize(impl_->db, stmt, error) != SQLITE_DONE) {
        return rollback("write session row", error);
    }

    if (!exists) {
        session_id = static_cast<int>(sqlite3_last_insert_rowid(impl_->db));
    }

    // The observation log is append-only; rewriting it keeps the save idempotent.
    rc = sqlite3_prepare_v2(impl_->db, "DELETE FROM observations WHERE session_id = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return rollback("prepare observation clear", sqlite3_errmsg(impl_->db));
    }
    sqlite3_bind_int(stmt, 1, session_id);
    if (stepAndFinalize(impl_->db, stmt, error) != SQLITE_DONE) {
        return rollback("clear observations", error);
    }

    const auto observation_sql = R"(
        INSERT INTO observations (session_id, order_index, configuration, encoded,
                                  objective, noise, source, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

    rc = sqlite3_prepare_v2(impl_->db, observation_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return rollback("prepare observation insert", sqlite3_errmsg(impl_->db));
    }

    for (const auto& obs : snapshot.observations) {
        const std::string configuration = serializeConfiguration(obs.configuration);
        const std::string encoded = serializeVector(obs.encoded);
        const std::string source = toString(obs.source);

        sqlite3_bind_int(stmt, 1, session_id);
        sqlite3_bind_int(stmt, 2, obs.order_index);
        sqlite3_bind_text(stmt, 3, configuration.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, encoded.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 5, obs.objective);
        sqlite3_bind_double(stmt, 6, obs.noise);
        sqlite3_bind_text(stmt, 7, source.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 8, obs.timestamp.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            error = sqlite3_errmsg(impl_->db);
            sqlite3_finalize(stmt);
            return rollback("insert observation " + std::to_string(obs.order_index), error);
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (!impl_->exec("COMMIT")) {
        impl_->exec("ROLLBACK");
        return false;
    }

    LOG_DEBUG("Saved session '" + snapshot.name + "' with " +
              std::to_string(snapshot.observations.size()) + " observation(s)");
    return true;
}

std::optional<SessionSnapshot> DatabaseManager::loadSession(const std::string& name) const {
    if (!isEnabled()) return std::nullopt;

    const auto sql = R"(
        SELECT id, space_signature, seed, iteration_count, phase, termination_reason,
               retry_count, stalled, non_improving_iterations, pending_configuration,
               remaining_design, abandoned_configurations, created_at, updated_at
        FROM sessions WHERE name = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to prepare session load: " + std::string(sqlite3_errmsg(impl_->db)));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return std::nullopt;
    }

    SessionSnapshot snapshot;
    snapshot.name = name;
    const int session_id = sqlite3_column_int(stmt, 0);
    snapshot.space_signature = columnText(stmt, 1);
    snapshot.seed = static_cast<unsigned int>(sqlite3_column_int64(stmt, 2));
    snapshot.iteration_count = sqlite3_column_int(stmt, 3);
    snapshot.phase = sessionPhaseFromString(columnText(stmt, 4));
    snapshot.termination_reason = terminationReasonFromString(columnText(stmt, 5));
    snapshot.retry_count = sqlite3_column_int(stmt, 6);
    snapshot.stalled = sqlite3_column_int(stmt, 7) != 0;
    snapshot.non_improving_iterations = sqlite3_column_int(stmt, 8);
    const bool has_pending = sqlite3_column_type(stmt, 9) != SQLITE_NULL;
    const std::string pending_text = columnText(stmt, 9);
    const std::string design_text = columnText(stmt, 10);
    const std::string abandoned_text = columnText(stmt, 11);
    snapshot.created_at = columnText(stmt, 12);
    snapshot.updated_at = columnText(stmt, 13);
    sqlite3_finalize(stmt);

    if (has_pending) {
        snapshot.pending = parseConfiguration(pending_text);
        if (!snapshot.pending) {
            LOG_ERROR("Session '" + name + "' has an unreadable pending configuration");
            return std::nullopt;
        }
    }

    auto design = parseDesign(design_text);
    if (!design) {
        LOG_ERROR("Session '" + name + "' has an unreadable initial design");
        return std::nullopt;
    }
    snapshot.design_queue = std::move(*design);

    auto abandoned = parseDesign(abandoned_text);
    if (!abandoned) {
        LOG_ERROR("Session '" + name + "' has unreadable abandoned configurations");
        return std::nullopt;
    }
    snapshot.abandoned = std::move(*abandoned);

    const auto observation_sql = R"(
        SELECT order_index, configuration, encoded, objective, noise, source, timestamp
        FROM observations WHERE session_id = ? ORDER BY order_index
    )";

    rc = sqlite3_prepare_v2(impl_->db, observation_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to prepare observation load: " + std::string(sqlite3_errmsg(impl_->db)));
        return std::nullopt;
    }

    sqlite3_bind_int(stmt, 1, session_id);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Observation obs;
        obs.order_index = sqlite3_column_int(stmt, 0);
        auto configuration = parseConfiguration(columnText(stmt, 1));
        auto encoded = parseVector(columnText(stmt, 2));
        if (!configuration || !encoded) {
            LOG_ERROR("Session '" + name + "' observation " + std::to_string(obs.order_index) +
                      " is unreadable");
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        obs.configuration = std::move(*configuration);
        obs.encoded = std::move(*encoded);
        obs.objective = sqlite3_column_double(stmt, 3);
        obs.noise = sqlite3_column_double(stmt, 4);
        obs.source = observationSourceFromString(columnText(stmt, 5));
        obs.timestamp = columnText(stmt, 6);
        snapshot.observations.push_back(std::move(obs));
    }
    const std::string error = rc == SQLITE_DONE ? "" : sqlite3_errmsg(impl_->db);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR("Failed to read observations of session '" + name + "': " + error);
        return std::nullopt;
    }

    return snapshot;
}

std::vector<DatabaseManager::SessionSummary> DatabaseManager::listSessions() const {
    std::vector<SessionSummary> sessions;
    if (!isEnabled()) return sessions;

    const auto sql = R"(
        SELECT id, name, iteration_count, phase, termination_reason, best_objective, updated_at
        FROM sessions ORDER BY updated_at DESC, id DESC
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("Failed to prepare session list: " + std::string(sqlite3_errmsg(impl_->db)));
        return sessions;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionSummary summary;
        summary.id = sqlite3_column_int(stmt, 0);
        summary.name = columnText(stmt, 1);
        summary.iteration_count = sqlite3_column_int(stmt, 2);
        summary.phase = sessionPhaseFromString(columnText(stmt, 3));
        summary.termination_reason = terminationReasonFromString(columnText(stmt, 4));
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            summary.best_objective = sqlite3_column_double(stmt, 5);
        }
        summary.updated_at = columnText(stmt, 6);
        sessions.push_back(std::move(summary));
    }

    sqlite3_finalize(stmt);
    return sessions;
}

bool DatabaseManager::deleteSession(const std::string& name) const {
    if (!isEnabled()) return true; // Success if disabled

    const int session_id = getSessionId(name);
    if (session_id < 0) {
        return true;
    }

    if (!impl_->exec("BEGIN TRANSACTION")) {
        return false;
    }

    const char* statements[] = {
        "DELETE FROM observations WHERE session_id = ?",
        "DELETE FROM sessions WHERE id = ?"
    };

    for (const char* sql : statements) {
        sqlite3_stmt* stmt = nullptr;
        std::string error;
        int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
        if (rc == SQLITE_OK) {
            sqlite3_bind_int(stmt, 1, session_id);
            rc = stepAndFinalize(impl_->db, stmt, error);
        } else {
            error = sqlite3_errmsg(impl_->db);
        }
        if (rc != SQLITE_DONE) {
            LOG_ERROR("Failed to delete session '" + name + "': " + error);
            impl_->exec("ROLLBACK");
            return false;
        }
    }

    return impl_->exec("COMMIT");
}

} // namespace pipeline_tuner::database
