#include "result_store.hpp"
#include "yyjson_guard.hpp"

namespace webcrawl {

using duckdb::Connection;
using duckdb::DuckDB;
using duckdb::idx_t;
using duckdb::IOException;
using duckdb::StringValue;
using duckdb::Value;

std::string LinksToJson(const std::vector<std::string> &links) {
	YyjsonMutDocGuard doc(yyjson_mut_doc_new(nullptr));
	yyjson_mut_val *arr = yyjson_mut_arr(doc.get());
	yyjson_mut_doc_set_root(doc.get(), arr);
	for (const auto &link : links) {
		yyjson_mut_arr_add_strncpy(doc.get(), arr, link.c_str(), link.size());
	}
	std::string json = WriteJson(doc);
	return json.empty() ? "[]" : json;
}

bool LinksFromJson(const std::string &json, std::vector<std::string> &links) {
	links.clear();
	YyjsonDocGuard doc(yyjson_read(json.c_str(), json.size(), 0));
	if (!doc) {
		return false;
	}
	yyjson_val *root = yyjson_doc_get_root(doc.get());
	if (!yyjson_is_arr(root)) {
		return false;
	}
	size_t idx, max;
	yyjson_val *item;
	yyjson_arr_foreach(root, idx, max, item) {
		if (!yyjson_is_str(item)) {
			links.clear();
			return false;
		}
		links.emplace_back(yyjson_get_str(item), yyjson_get_len(item));
	}
	return true;
}

DuckDBResultStore::DuckDBResultStore(const std::string &database_path) : database_path_(database_path) {
	// DuckDB treats nullptr as an in-memory database
	const char *path = database_path_ == ":memory:" ? nullptr : database_path_.c_str();
	db_ = duckdb::make_uniq<DuckDB>(path);
	conn_ = duckdb::make_uniq<Connection>(*db_);
	InitializeSchema();
}

void DuckDBResultStore::InitializeSchema() {
	auto create = conn_->Query("CREATE TABLE IF NOT EXISTS pages ("
	                           "run_id BIGINT NOT NULL, "
	                           "seq BIGINT NOT NULL, "
	                           "url VARCHAR NOT NULL, "
	                           "depth INTEGER NOT NULL, "
	                           "status VARCHAR NOT NULL, "
	                           "http_status INTEGER, "
	                           "error_message VARCHAR, "
	                           "error_type VARCHAR, "
	                           "fetched_at TIMESTAMP, "
	                           "content_type VARCHAR, "
	                           "elapsed_ms BIGINT, "
	                           "content_hash VARCHAR, "
	                           "links VARCHAR, "
	                           "content VARCHAR)");
	if (create->HasError()) {
		throw IOException("Failed to create pages table in '%s': %s", database_path_, create->GetError());
	}
	// Tables written before the content column existed
	auto migrate = conn_->Query("ALTER TABLE pages ADD COLUMN IF NOT EXISTS content VARCHAR");
	if (migrate->HasError()) {
		throw IOException("Failed to add content column in '%s': %s", database_path_, migrate->GetError());
	}

	auto last_run = conn_->Query("SELECT COALESCE(MAX(run_id), 0) FROM pages");
	if (last_run->HasError()) {
		throw IOException("Failed to read pages table in '%s': %s", database_path_, last_run->GetError());
	}
	auto chunk = last_run->Fetch();
	run_id_ = 1;
	if (chunk && chunk->size() > 0) {
		run_id_ = chunk->GetValue(0, 0).GetValue<int64_t>() + 1;
	}
}

void DuckDBResultStore::Record(const PageResult &result) {
	std::lock_guard<std::mutex> lock(db_mutex_);

	const char *error_type = ErrorTypeToString(result.error_type);
	auto insert_result = conn_->Query(
	    "INSERT INTO pages (run_id, seq, url, depth, status, http_status, error_message, error_type, "
	    "fetched_at, content_type, elapsed_ms, content_hash, links, content) "
	    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::TIMESTAMP, $10, $11, $12, $13, $14)",
	    run_id_, next_seq_, result.url, result.depth, std::string(PageStatusToString(result.status)),
	    result.http_status > 0 ? Value::INTEGER(result.http_status) : Value(),
	    result.error_message.empty() ? Value() : Value(result.error_message),
	    error_type[0] == '\0' ? Value() : Value(error_type),
	    result.fetched_at.empty() ? Value() : Value(result.fetched_at),
	    result.content_type.empty() ? Value() : Value(result.content_type),
	    result.elapsed_ms,
	    result.content_hash.empty() ? Value() : Value(result.content_hash),
	    LinksToJson(result.links),
	    result.status == PageStatus::SUCCESS && !result.content.empty() ? Value(result.content) : Value());

	if (insert_result->HasError()) {
		throw IOException("Failed to record result for %s: %s", result.url, insert_result->GetError());
	}
	next_seq_++;
}

std::vector<PageResult> DuckDBResultStore::QueryAll() {
	std::lock_guard<std::mutex> lock(db_mutex_);

	auto query_result = conn_->Query(
	    "SELECT url, depth, status, http_status, error_message, error_type, "
	    "CAST(fetched_at AS VARCHAR), content_type, elapsed_ms, content_hash, links, content "
	    "FROM pages WHERE run_id = $1 ORDER BY seq",
	    run_id_);
	if (query_result->HasError()) {
		throw IOException("Failed to read results from '%s': %s", database_path_, query_result->GetError());
	}

	std::vector<PageResult> results;
	for (auto chunk = query_result->Fetch(); chunk && chunk->size() > 0; chunk = query_result->Fetch()) {
		for (idx_t row = 0; row < chunk->size(); row++) {
			PageResult page;
			page.url = StringValue::Get(chunk->GetValue(0, row));
			page.depth = chunk->GetValue(1, row).GetValue<int32_t>();
			auto status_name = StringValue::Get(chunk->GetValue(2, row));
			if (!PageStatusFromString(status_name, page.status)) {
				throw IOException("Unknown page status '%s' for %s", status_name, page.url);
			}

			auto http_status_val = chunk->GetValue(3, row);
			page.http_status = http_status_val.IsNull() ? 0 : http_status_val.GetValue<int32_t>();
			auto error_message_val = chunk->GetValue(4, row);
			page.error_message = error_message_val.IsNull() ? "" : StringValue::Get(error_message_val);
			auto error_type_val = chunk->GetValue(5, row);
			page.error_type = error_type_val.IsNull() ? CrawlErrorType::NONE
			                                          : ErrorTypeFromString(StringValue::Get(error_type_val));
			auto fetched_at_val = chunk->GetValue(6, row);
			page.fetched_at = fetched_at_val.IsNull() ? "" : StringValue::Get(fetched_at_val);
			auto content_type_val = chunk->GetValue(7, row);
			page.content_type = content_type_val.IsNull() ? "" : StringValue::Get(content_type_val);
			auto elapsed_val = chunk->GetValue(8, row);
			page.elapsed_ms = elapsed_val.IsNull() ? 0 : elapsed_val.GetValue<int64_t>();
			auto hash_val = chunk->GetValue(9, row);
			page.content_hash = hash_val.IsNull() ? "" : StringValue::Get(hash_val);
			auto links_val = chunk->GetValue(10, row);
			if (!links_val.IsNull() && !LinksFromJson(StringValue::Get(links_val), page.links)) {
				throw IOException("Malformed links column for %s", page.url);
			}
			auto content_val = chunk->GetValue(11, row);
			page.content = content_val.IsNull() ? "" : StringValue::Get(content_val);
			results.push_back(std::move(page));
		}
	}
	return results;
}

} // namespace webcrawl
