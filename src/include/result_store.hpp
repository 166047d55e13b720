#pragma once

#include "crawl_state.hpp"
#include "duckdb.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace webcrawl {

// Durable append-only log of PageResults. Implementations serialize writers.
class ResultStore {
public:
	virtual ~ResultStore() = default;

	// Append one result. Throws duckdb::IOException if the row cannot be written.
	virtual void Record(const PageResult &result) = 0;

	// Every result of the current run, in completion order
	virtual std::vector<PageResult> QueryAll() = 0;
};

//===--------------------------------------------------------------------===//
// DuckDBResultStore - the "pages" table in a DuckDB database file
//===--------------------------------------------------------------------===//
// Each store instance is one run: it allocates a fresh run_id on open so rows
// of earlier crawls in the same file are kept but not reported.

class DuckDBResultStore : public ResultStore {
public:
	// Opens (or creates) the database and the pages table. ":memory:" is allowed.
	// Throws duckdb::IOException if the database cannot be opened.
	explicit DuckDBResultStore(const std::string &database_path);

	void Record(const PageResult &result) override;
	std::vector<PageResult> QueryAll() override;

	int64_t RunId() const {
		return run_id_;
	}

private:
	void InitializeSchema();

	std::string database_path_;
	duckdb::unique_ptr<duckdb::DuckDB> db_;
	duckdb::unique_ptr<duckdb::Connection> conn_;
	std::mutex db_mutex_;
	int64_t run_id_ = 0;
	int64_t next_seq_ = 0;
};

// Links column codec: JSON array of strings
std::string LinksToJson(const std::vector<std::string> &links);
// Returns false (and leaves links empty) if json is not an array of strings
bool LinksFromJson(const std::string &json, std::vector<std::string> &links);

} // namespace webcrawl
