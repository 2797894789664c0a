#ifndef PIPELINE_TUNER_DATABASE_MANAGER_HPP
#define PIPELINE_TUNER_DATABASE_MANAGER_HPP

#include "pipeline_tuner/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pipeline_tuner {
namespace database {

struct DatabaseConfig;

/**
 * @brief Optional session store for resuming interrupted tuning sessions
 *
 * All methods are safe to call - if the database is disabled, writes succeed
 * silently and reads return nothing. Failures are logged and reported through
 * the return value; nothing here throws into the optimisation loop.
 */
class DatabaseManager {
public:
    /**
     * @brief One row of the session overview
     */
    struct SessionSummary {
        int id = -1;
        std::string name;
        int iteration_count = 0;
        SessionPhase phase = SessionPhase::AWAITING_EVALUATION;
        TerminationReason termination_reason = TerminationReason::NONE;
        std::optional<double> best_objective;
        std::string updated_at;
    };

    /**
     * @brief Construct database manager
     * @param config Database configuration (connection string, enabled flag)
     */
    explicit DatabaseManager(const DatabaseConfig& config);

    /**
     * @brief Construct with simple parameters
     * @param db_path Path to SQLite database file
     * @param enabled Whether persistence is enabled
     */
    DatabaseManager(const std::string& db_path, bool enabled = false);

    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&&) = default;
    DatabaseManager& operator=(DatabaseManager&&) = default;

    /**
     * @brief Check if database is enabled and working
     */
    bool isEnabled() const;

    /**
     * @brief Create the sessions and observations tables if missing
     * @return true if the schema is ready (or disabled)
     */
    bool initializeTables() const;

    /**
     * @brief Store the complete state of a session, replacing any earlier save
     *
     * The session row and its observation log are written in one transaction;
     * on any failure the previous save is left untouched.
     * @return true if stored (or disabled), false on error
     */
    bool saveSession(const SessionSnapshot& snapshot) const;

    /**
     * @brief Load a session by name
     * @return Snapshot, or std::nullopt if unknown, disabled or unreadable
     */
    std::optional<SessionSnapshot> loadSession(const std::string& name) const;

    /**
     * @brief Overview of stored sessions, most recently updated first
     */
    std::vector<SessionSummary> listSessions() const;

    /**
     * @brief Delete a session and its observations
     * @return true if deleted, absent, or disabled; false on error
     */
    bool deleteSession(const std::string& name) const;

    /**
     * @brief Look up a session id by name
     * @return id if found, -1 otherwise
     */
    int getSessionId(const std::string& name) const;

    /// "name=value;" pairs, values printed with round-trip precision.
    static std::string serializeConfiguration(const Configuration& configuration);
    static std::optional<Configuration> parseConfiguration(const std::string& text);

    /// Comma-separated values with round-trip precision.
    static std::string serializeVector(const std::vector<double>& values);
    static std::optional<std::vector<double>> parseVector(const std::string& text);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Database configuration
 */
struct DatabaseConfig {
    std::string connection_string = "tuning_sessions.db";
    bool enabled = false;

    static DatabaseConfig disabled() {
        return DatabaseConfig{};
    }

    static DatabaseConfig sqlite(const std::string& path) {
        DatabaseConfig config;
        config.connection_string = path;
        config.enabled = true;
        return config;
    }

    static DatabaseConfig fromParams(const DatabaseParams& params) {
        DatabaseConfig config;
        config.connection_string = params.connection_string;
        config.enabled = params.enabled;
        return config;
    }
};

} // namespace database
} // namespace pipeline_tuner

#endif // PIPELINE_TUNER_DATABASE_MANAGER_HPP
