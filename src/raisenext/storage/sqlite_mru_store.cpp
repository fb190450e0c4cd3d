#include "storage/sqlite_mru_store.hpp"

#include <filesystem>

namespace fs = std::filesystem;

SqliteMruStore::SqliteMruStore() = default;

SqliteMruStore::~SqliteMruStore() {
    close();
}

bool SqliteMruStore::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    if (open_db(path)) return true;
    if (last_rc_ != SQLITE_NOTADB && last_rc_ != SQLITE_CORRUPT) return false;

    // Unreadable state is worth nothing; start over rather than fail every save.
    close();
    auto reason = last_error_;
    fs::remove(p, ec);
    if (!open_db(path)) return false;
    last_error_ = "discarded unreadable state db " + path + ": " + reason;
    return true;
}

bool SqliteMruStore::open_db(const std::string& path) {
    int rc = sqlite3_open(path.c_str(), &db_);
    last_rc_ = rc;
    if (rc != SQLITE_OK) {
        last_error_ = std::string("failed to open ") + path + ": " +
                      (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        close();
        return false;
    }
    sqlite3_busy_timeout(db_, 1000);
    return create_tables();
}

void SqliteMruStore::close() {
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

MruList SqliteMruStore::load() {
    MruList list;
    if (!db_) {
        if (last_error_.empty()) last_error_ = "state db not open";
        return list;
    }

    const char* sql =
        "SELECT window_id, desktop, pid, wm_class, machine, title "
        "FROM mru ORDER BY position";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return list;
    }

    auto get_text = [](sqlite3_stmt* s, int col) -> std::string {
        auto* p = sqlite3_column_text(s, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Window w;
        w.id = get_text(stmt, 0);
        w.desktop = get_text(stmt, 1);
        w.pid = get_text(stmt, 2);
        w.wm_class = get_text(stmt, 3);
        w.machine = get_text(stmt, 4);
        w.title = get_text(stmt, 5);
        list.push_back(std::move(w));
    }

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        list.clear();
    }
    sqlite3_finalize(stmt);
    return list;
}

std::expected<void, std::string> SqliteMruStore::save(const MruList& list) {
    if (!db_) return std::unexpected(std::string("state db not open"));

    if (!exec("BEGIN IMMEDIATE;")) {
        return std::unexpected(std::string("begin failed: ") + sqlite3_errmsg(db_));
    }

    auto fail = [this](const std::string& what) -> std::expected<void, std::string> {
        std::string msg = what + ": " + sqlite3_errmsg(db_);
        exec("ROLLBACK;");
        return std::unexpected(msg);
    };

    if (!exec("DELETE FROM mru;")) return fail("clear failed");

    const char* insert_sql =
        "INSERT INTO mru (position, window_id, desktop, pid, wm_class, machine, title) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("prepare insert failed");
    }

    for (size_t i = 0; i < list.size(); ++i) {
        const auto& w = list[i];
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(i));
        sqlite3_bind_text(stmt, 2, w.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, w.desktop.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, w.pid.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, w.wm_class.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, w.machine.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, w.title.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return fail("insert failed");
        }
    }
    sqlite3_finalize(stmt);

    if (!exec("COMMIT;")) return fail("commit failed");
    return {};
}

bool SqliteMruStore::exec(const char* sql) {
    return sqlite3_exec(db_, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
}

bool SqliteMruStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS mru (
            position INTEGER PRIMARY KEY,
            window_id TEXT NOT NULL UNIQUE,
            desktop TEXT,
            pid TEXT,
            wm_class TEXT,
            machine TEXT,
            title TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    last_rc_ = rc;
    if (rc != SQLITE_OK) {
        last_error_ = err ? err : "unknown";
        sqlite3_free(err);
        return false;
    }
    return true;
}
