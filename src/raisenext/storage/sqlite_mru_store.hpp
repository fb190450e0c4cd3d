#pragma once

#include "platform/mru_store.hpp"

#include <sqlite3.h>
#include <string>

class SqliteMruStore : public MruStore {
public:
    SqliteMruStore();
    ~SqliteMruStore() override;

    SqliteMruStore(const SqliteMruStore&) = delete;
    SqliteMruStore& operator=(const SqliteMruStore&) = delete;

    // Opens (creating if needed) the database at `path`. A file that isn't a
    // readable database is discarded and recreated.
    bool open(const std::string& path);
    void close();

    MruList load() override;
    std::expected<void, std::string> save(const MruList& list) override;

    // Why the stored order was unusable (open or load failure), if it was.
    // Nothing is printed; callers decide whether to report it.
    const std::string& last_error() const { return last_error_; }

private:
    bool open_db(const std::string& path);
    bool create_tables();
    bool exec(const char* sql);

    sqlite3* db_ = nullptr;
    int last_rc_ = SQLITE_OK;
    std::string last_error_;
};
