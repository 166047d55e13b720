#pragma once

#include "crawl_state.hpp"
#include "url_normalizer.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace webcrawl {

enum class PopStatus : uint8_t {
	ITEM = 0,       // item handed out; caller must call Complete() when done with it
	TIMED_OUT = 1,  // queue empty but some worker is still in flight
	DRAINED = 2     // nothing queued, nothing in flight, or shut down; permanent
};

//===--------------------------------------------------------------------===//
// Frontier - thread-safe FIFO of (url, depth) with a dedup guard
//===--------------------------------------------------------------------===//
// The pending queue, the visited set and the in-flight count live under one
// mutex, so a URL is enqueued at most once per crawl and drain detection
// cannot race with a worker that is about to push new links.

class Frontier {
public:
	Frontier(const UrlNormalizer &normalizer, int max_depth);

	Frontier(const Frontier &) = delete;
	Frontier &operator=(const Frontier &) = delete;

	// Normalize url and enqueue it at depth 0. No-op (false) if rejected or duplicate.
	bool Seed(const std::string &url);

	// Enqueue an already normalized url. False if depth > max_depth or already visited.
	bool TryPush(const std::string &url, int depth);

	// Wait at most `timeout` for an item
	PopStatus Pop(FrontierItem &item, std::chrono::milliseconds timeout);

	// Release the in-flight slot taken by a successful Pop
	void Complete();

	// Wake all waiters; every later Pop returns DRAINED
	void Shutdown();

	bool IsDrained() const;
	size_t Size() const;
	size_t InFlight() const;
	size_t VisitedCount() const;
	bool IsVisited(const std::string &url) const;

private:
	bool PushLocked(const std::string &url, int depth);

	const UrlNormalizer &normalizer_;
	const int max_depth_;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<FrontierItem> queue_;
	std::unordered_set<std::string> visited_;
	size_t in_flight_ = 0;
	bool shutdown_ = false;
};

} // namespace webcrawl
