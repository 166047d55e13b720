#include "frontier.hpp"

namespace webcrawl {

Frontier::Frontier(const UrlNormalizer &normalizer, int max_depth)
    : normalizer_(normalizer), max_depth_(max_depth) {
}

bool Frontier::Seed(const std::string &url) {
	std::string normalized = normalizer_.Normalize(url);
	if (normalized.empty()) {
		return false;
	}
	std::lock_guard<std::mutex> lock(mutex_);
	if (!PushLocked(normalized, 0)) {
		return false;
	}
	cv_.notify_one();
	return true;
}

bool Frontier::TryPush(const std::string &url, int depth) {
	if (url.empty() || depth > max_depth_) {
		return false;
	}
	std::lock_guard<std::mutex> lock(mutex_);
	if (!PushLocked(url, depth)) {
		return false;
	}
	cv_.notify_one();
	return true;
}

bool Frontier::PushLocked(const std::string &url, int depth) {
	if (shutdown_ || depth > max_depth_) {
		return false;
	}
	// insert() doubles as the membership test, keeping check and mark atomic
	if (!visited_.insert(url).second) {
		return false;
	}
	queue_.emplace_back(url, depth);
	return true;
}

PopStatus Frontier::Pop(FrontierItem &item, std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lock(mutex_);
	cv_.wait_for(lock, timeout, [this] { return shutdown_ || !queue_.empty() || in_flight_ == 0; });

	if (shutdown_) {
		return PopStatus::DRAINED;
	}
	if (!queue_.empty()) {
		item = std::move(queue_.front());
		queue_.pop_front();
		in_flight_++;
		return PopStatus::ITEM;
	}
	if (in_flight_ == 0) {
		return PopStatus::DRAINED;
	}
	return PopStatus::TIMED_OUT;
}

void Frontier::Complete() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (in_flight_ > 0) {
		in_flight_--;
	}
	if (in_flight_ == 0) {
		// Waiters may now observe the drained state
		cv_.notify_all();
	}
}

void Frontier::Shutdown() {
	std::lock_guard<std::mutex> lock(mutex_);
	shutdown_ = true;
	cv_.notify_all();
}

bool Frontier::IsDrained() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return shutdown_ || (queue_.empty() && in_flight_ == 0);
}

size_t Frontier::Size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return queue_.size();
}

size_t Frontier::InFlight() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return in_flight_;
}

size_t Frontier::VisitedCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return visited_.size();
}

bool Frontier::IsVisited(const std::string &url) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return visited_.count(url) > 0;
}

} // namespace webcrawl
