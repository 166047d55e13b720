#include "worker_pool.hpp"
#include "logger.hpp"

#include <exception>
#include <unordered_set>

namespace webcrawl {

const char *WorkerStateToString(WorkerState state) {
	switch (state) {
		case WorkerState::IDLE: return "idle";
		case WorkerState::POPPING: return "popping";
		case WorkerState::FETCHING: return "fetching";
		case WorkerState::EXTRACTING: return "extracting";
		case WorkerState::RECORDING: return "recording";
		case WorkerState::STOPPED_BUDGET: return "stopped_budget";
		case WorkerState::STOPPED_DRAINED: return "stopped_drained";
		case WorkerState::STOPPED_INTERRUPTED: return "stopped_interrupted";
		default: return "unknown";
	}
}

bool IsTerminalState(WorkerState state) {
	return state == WorkerState::STOPPED_BUDGET || state == WorkerState::STOPPED_DRAINED ||
	       state == WorkerState::STOPPED_INTERRUPTED;
}

WorkerPool::WorkerPool(CrawlContext context, int num_workers)
    : ctx_(context), num_workers_(num_workers), states_(std::make_unique<std::atomic<uint8_t>[]>(num_workers)),
      should_stop_(false), store_errors_(0) {
	for (int i = 0; i < num_workers_; i++) {
		states_[i].store(static_cast<uint8_t>(WorkerState::IDLE));
	}
}

WorkerPool::~WorkerPool() {
	Stop();
	Join();
}

void WorkerPool::Start() {
	threads_.reserve(num_workers_);
	for (int i = 0; i < num_workers_; i++) {
		threads_.emplace_back(&WorkerPool::RunWorker, this, i);
	}
}

void WorkerPool::Stop() {
	should_stop_.store(true);
}

void WorkerPool::Join() {
	for (auto &t : threads_) {
		if (t.joinable()) {
			t.join();
		}
	}
	threads_.clear();
}

bool WorkerPool::AllStopped() const {
	for (int i = 0; i < num_workers_; i++) {
		if (!IsTerminalState(State(i))) {
			return false;
		}
	}
	return true;
}

WorkerState WorkerPool::State(int worker_id) const {
	return static_cast<WorkerState>(states_[worker_id].load());
}

std::vector<std::string> WorkerPool::ProcessedUrls() const {
	std::lock_guard<std::mutex> lock(processed_mutex_);
	return processed_urls_;
}

void WorkerPool::SetState(int worker_id, WorkerState state) {
	if (worker_id >= 0 && worker_id < num_workers_) {
		states_[worker_id].store(static_cast<uint8_t>(state));
	}
}

void WorkerPool::RunWorker(int worker_id) {
	while (true) {
		if (should_stop_.load()) {
			SetState(worker_id, WorkerState::STOPPED_INTERRUPTED);
			break;
		}
		// The slot is taken before popping so racing workers cannot overshoot max_pages
		if (!ctx_.counters.TryReservePage()) {
			SetState(worker_id, WorkerState::STOPPED_BUDGET);
			break;
		}

		SetState(worker_id, WorkerState::POPPING);
		FrontierItem item;
		auto status = ctx_.frontier.Pop(item, ctx_.config.pop_timeout);
		if (status != PopStatus::ITEM) {
			ctx_.counters.ReleasePage();
			if (status == PopStatus::DRAINED) {
				SetState(worker_id, should_stop_.load() ? WorkerState::STOPPED_INTERRUPTED
				                                        : WorkerState::STOPPED_DRAINED);
				break;
			}
			SetState(worker_id, WorkerState::IDLE);
			continue;
		}

		// A popped item is always finished and recorded, even after Stop()
		PageResult result = ProcessItem(item, worker_id);

		SetState(worker_id, WorkerState::RECORDING);
		Record(result);
		ctx_.counters.RecordPage(result.depth, result.IsError());
		ctx_.frontier.Complete();
		SetState(worker_id, WorkerState::IDLE);
	}
	Logger::Debug("Worker " + std::to_string(worker_id) + " exiting: " + WorkerStateToString(State(worker_id)));
}

void WorkerPool::Record(const PageResult &result) {
	{
		std::lock_guard<std::mutex> lock(processed_mutex_);
		processed_urls_.push_back(result.url);
	}
	try {
		ctx_.store.Record(result);
	} catch (std::exception &e) {
		store_errors_.fetch_add(1);
		Logger::Error("Failed to store result for " + result.url + ": " + e.what());
	}
}

FetchOutcome WorkerPool::FetchWithRetry(const std::string &url) {
	FetchOutcome outcome = ctx_.fetcher.Fetch(url);
	const auto &retry = ctx_.config.retry;
	for (int attempt = 1; attempt <= retry.max_retries; attempt++) {
		if (outcome.ok || !IsRetryableError(outcome.error_type) || should_stop_.load()) {
			break;
		}
		auto delay = ExponentialBackoff(retry, attempt);
		Logger::Debug("Retrying " + url + " in " + std::to_string(delay.count()) + "ms (attempt " +
		              std::to_string(attempt) + "/" + std::to_string(retry.max_retries) + ")");
		// No lock is held here
		std::this_thread::sleep_for(delay);
		outcome = ctx_.fetcher.Fetch(url);
	}
	return outcome;
}

PageResult WorkerPool::ProcessItem(const FrontierItem &item, int worker_id) {
	PageResult result;
	result.url = item.url;
	result.depth = item.depth;
	result.fetched_at = CurrentTimestamp();

	try {
		SetState(worker_id, WorkerState::FETCHING);
		Logger::Debug("Fetching " + item.url + " (depth " + std::to_string(item.depth) + ")");
		FetchOutcome outcome = FetchWithRetry(item.url);
		result.http_status = outcome.http_status;
		result.content_type = outcome.content_type;
		result.elapsed_ms = outcome.elapsed_ms;

		if (!outcome.ok) {
			// A body that arrived but cannot be decoded is a parse failure
			result.status = outcome.error_type == CrawlErrorType::PARSE_ERROR ? PageStatus::PARSE_ERROR
			                                                                   : PageStatus::FETCH_ERROR;
			result.error_type = outcome.error_type;
			result.error_message = outcome.error;
			Logger::Warn("Failed to fetch " + item.url + ": " + outcome.error);
			return result;
		}

		if (!IsContentTypeAcceptable(outcome.content_type, ctx_.config.accept_content_types,
		                             ctx_.config.reject_content_types)) {
			result.status = PageStatus::SKIPPED;
			result.error_type = CrawlErrorType::CONTENT_TYPE_REJECTED;
			result.error_message = "Content type not accepted: " + outcome.content_type;
			Logger::Info("Skipped (type " + outcome.content_type + "): " + item.url);
			return result;
		}

		result.content_hash = GenerateContentHash(outcome.body);

		SetState(worker_id, WorkerState::EXTRACTING);
		LinkExtraction extraction = ctx_.extractor.ExtractLinks(outcome.body);
		if (!extraction.ok) {
			result.status = PageStatus::PARSE_ERROR;
			result.error_type = CrawlErrorType::PARSE_ERROR;
			result.error_message = extraction.error;
			Logger::Warn("Failed to parse " + item.url + ": " + extraction.error);
			return result;
		}

		// Relative links resolve against where the body actually came from
		std::string base_url = outcome.final_url.empty() ? item.url : outcome.final_url;
		if (!extraction.base_href.empty()) {
			std::string declared = UrlNormalizer::Resolve(extraction.base_href, base_url);
			if (!declared.empty()) {
				base_url = declared;
			}
		}

		std::unordered_set<std::string> seen;
		int pushed = 0;
		for (const auto &href : extraction.hrefs) {
			std::string link = ctx_.normalizer.Normalize(href, base_url);
			if (link.empty() || !seen.insert(link).second) {
				continue;
			}
			result.links.push_back(link);
			if (ctx_.frontier.TryPush(link, item.depth + 1)) {
				pushed++;
			}
		}
		result.status = PageStatus::SUCCESS;
		if (ctx_.config.store_content) {
			result.content = std::move(outcome.body);
		}
		Logger::Info("Crawled " + item.url + " (depth " + std::to_string(item.depth) + ", " +
		             std::to_string(result.links.size()) + " links, " + std::to_string(pushed) + " new)");
	} catch (std::exception &e) {
		result.status = PageStatus::FETCH_ERROR;
		if (result.error_type == CrawlErrorType::NONE) {
			result.error_type = CrawlErrorType::NETWORK_OTHER;
		}
		result.error_message = e.what();
		result.links.clear();
		result.content.clear();
		Logger::Error("Worker exception while processing " + item.url + ": " + e.what());
	}
	return result;
}

} // namespace webcrawl
