// Fixed-size worker pool, used to run queued copy jobs concurrently.

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

#include "duckdb/common/queue.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/vector.hpp"

namespace duckdb {

class ThreadPool {
public:
	// @param thread_name: name of worker threads, truncated to what the platform supports.
	explicit ThreadPool(size_t thread_num, string thread_name = "xrootd-worker");

	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;

	// Pending jobs which haven't started are dropped.
	~ThreadPool() noexcept;

	// @return future for synchronization.
	template <typename Fn, typename... Args>
	auto Push(Fn &&fn, Args &&...args) -> std::future<typename std::result_of_t<Fn(Args...)>>;

	// Block until all enqueued jobs finish.
	void Wait();

	size_t GetThreadNum() const {
		return workers_.size();
	}

private:
	using Job = std::function<void(void)>;

	// Worker loop, which keeps picking up jobs until the pool stops.
	void RunWorker();

	std::mutex mutex_;
	std::condition_variable new_job_cv_;
	std::condition_variable job_completion_cv_;
	// Accessed with [mutex_] held.
	size_t idle_num_ = 0;
	bool stopped_ = false;
	queue<Job> jobs_;

	string thread_name_;
	vector<std::thread> workers_;
};

template <typename Fn, typename... Args>
auto ThreadPool::Push(Fn &&fn, Args &&...args) -> std::future<typename std::result_of_t<Fn(Args...)>> {
	using Ret = typename std::result_of_t<Fn(Args...)>;

	auto job =
	    std::make_shared<std::packaged_task<Ret()>>(std::bind(std::forward<Fn>(fn), std::forward<Args>(args)...));
	std::future<Ret> result = job->get_future();
	{
		std::lock_guard<std::mutex> lck(mutex_);
		jobs_.emplace([job = std::move(job)]() mutable { (*job)(); });
	}
	new_job_cv_.notify_one();
	return result;
}

} // namespace duckdb
