#include "crawler_config.hpp"
#include "duckdb.hpp"

namespace webcrawl {

using duckdb::InvalidInputException;

void CrawlerConfig::Validate() const {
	if (max_depth < 0) {
		throw InvalidInputException("max_depth must be >= 0, got %d", max_depth);
	}
	if (max_pages < 1) {
		throw InvalidInputException("max_pages must be >= 1, got %d", max_pages);
	}
	if (num_threads < 1 || num_threads > MAX_WORKER_THREADS) {
		throw InvalidInputException("num_threads must be between 1 and %d, got %d", MAX_WORKER_THREADS,
		                            num_threads);
	}
	if (timeout_ms <= 0) {
		throw InvalidInputException("timeout_ms must be positive");
	}
	if (connect_timeout_ms <= 0) {
		throw InvalidInputException("connect_timeout_ms must be positive");
	}
	if (max_response_bytes <= 0) {
		throw InvalidInputException("max_response_bytes must be positive");
	}
	if (retry.max_retries < 0) {
		throw InvalidInputException("max_retries must be >= 0, got %d", retry.max_retries);
	}
	if (pop_timeout.count() <= 0) {
		throw InvalidInputException("pop_timeout must be positive");
	}
	if (database_path.empty()) {
		throw InvalidInputException("database path must not be empty");
	}
}

} // namespace webcrawl
