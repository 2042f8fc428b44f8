#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the database instance shared by every repository in the process. DuckDB allows a
// single instance per file, so connections are opened from here instead of per path.
class DuckStore {
public:
    static constexpr const char* kInMemory = ":memory:";

    explicit DuckStore(std::string dbPath = "data/market.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates the bars, quotes and trades tables when missing.
    void migrate();

    ::duckdb::DuckDB& database() { return *db_; }
    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> db_;
};

}  // namespace adapters::duckdb
