#include "Database.hpp"

#include <sqlite3.h>

#include <iostream>
#include <utility>

namespace edgesim::db
{
    namespace
    {
        sqlite3 *openHandle(const std::string &file_path, std::string *error)
        {
            sqlite3 *handle = nullptr;
            if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
            {
                if (error)
                {
                    *error = sqlite3_errmsg(handle);
                }
                sqlite3_close(handle);
                return nullptr;
            }
            return handle;
        }

        bool execute(sqlite3 *handle, const char *sql, std::string *error)
        {
            char *errmsg = nullptr;
            const int exec_rc = sqlite3_exec(handle, sql, nullptr, nullptr, &errmsg);
            if (exec_rc != SQLITE_OK)
            {
                if (error)
                {
                    *error = errmsg ? errmsg : "statement failed";
                }
                sqlite3_free(errmsg);
                return false;
            }
            return true;
        }

        void rollback(sqlite3 *handle)
        {
            std::string error;
            if (!execute(handle, "ROLLBACK;", &error))
            {
                std::cerr << "Database: rollback failed: " << error << "\n";
            }
        }
    }

    Database::Database(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool Database::initialize(std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS run_metadata ("
            "run_id TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS detections ("
            "run_id TEXT NOT NULL,"
            "parent_id TEXT NOT NULL,"
            "detection_index INTEGER NOT NULL,"
            "type TEXT NOT NULL,"
            "xmin REAL NOT NULL,"
            "ymin REAL NOT NULL,"
            "xmax REAL NOT NULL,"
            "ymax REAL NOT NULL,"
            "tick INTEGER NOT NULL"
            ");"
            "CREATE INDEX IF NOT EXISTS detections_by_run ON detections(run_id);";

        const bool ok = execute(handle, create_sql, error);
        sqlite3_close(handle);
        return ok;
    }

    bool Database::saveMetadataJson(const std::string &run_id, const std::string &metadata_json, std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        const char *upsert_sql =
            "INSERT INTO run_metadata(run_id, value) VALUES(?, ?) "
            "ON CONFLICT(run_id) DO UPDATE SET value = excluded.value;";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, upsert_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return false;
        }

        sqlite3_bind_text(stmt, 1, run_id.c_str(), static_cast<int>(run_id.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, metadata_json.c_str(), static_cast<int>(metadata_json.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (step_rc != SQLITE_DONE)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
    }

    std::optional<std::string> Database::loadMetadataJson(const std::string &run_id, std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        const char *select_sql = "SELECT value FROM run_metadata WHERE run_id = ? LIMIT 1;";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, select_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, run_id.c_str(), static_cast<int>(run_id.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            std::string value = text ? reinterpret_cast<const char *>(text) : "";
            sqlite3_finalize(stmt);
            sqlite3_close(handle);
            return value;
        }

        if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return std::nullopt;
    }

    bool Database::appendDetections(const std::string &run_id, const std::vector<DetectionRecord> &records, std::string *error) const
    {
        if (records.empty())
        {
            return true;
        }

        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return false;
        }

        if (!execute(handle, "BEGIN TRANSACTION;", error))
        {
            sqlite3_close(handle);
            return false;
        }

        const char *insert_sql =
            "INSERT INTO detections(run_id, parent_id, detection_index, type, xmin, ymin, xmax, ymax, tick) "
            "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?);";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, insert_sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            rollback(handle);
            sqlite3_close(handle);
            return false;
        }

        for (const auto &record : records)
        {
            const std::string type = toString(record.type);
            sqlite3_bind_text(stmt, 1, run_id.c_str(), static_cast<int>(run_id.size()), SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, record.parent_id.c_str(), static_cast<int>(record.parent_id.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(record.detection_index));
            sqlite3_bind_text(stmt, 4, type.c_str(), static_cast<int>(type.size()), SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 5, record.xmin);
            sqlite3_bind_double(stmt, 6, record.ymin);
            sqlite3_bind_double(stmt, 7, record.xmax);
            sqlite3_bind_double(stmt, 8, record.ymax);
            sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(record.tick));

            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                if (error)
                {
                    *error = sqlite3_errmsg(handle);
                }
                sqlite3_finalize(stmt);
                rollback(handle);
                sqlite3_close(handle);
                return false;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }

        sqlite3_finalize(stmt);
        const bool ok = execute(handle, "COMMIT;", error);
        sqlite3_close(handle);
        return ok;
    }

    std::optional<std::size_t> Database::countDetections(const std::string &run_id, std::string *error) const
    {
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
        {
            return std::nullopt;
        }

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(handle, "SELECT COUNT(*) FROM detections WHERE run_id = ?;", -1, &stmt, nullptr) != SQLITE_OK)
        {
            if (error)
            {
                *error = sqlite3_errmsg(handle);
            }
            sqlite3_close(handle);
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, run_id.c_str(), static_cast<int>(run_id.size()), SQLITE_TRANSIENT);

        std::optional<std::size_t> count;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
        }
        else if (error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return count;
    }
} // namespace edgesim::db
