#include "thread_pool.hpp"

#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

#include "duckdb/common/assert.hpp"

namespace duckdb {

namespace {

// Name the calling worker, linux keeps at most 15 characters.
void NameWorkerThread(const string &thread_name) {
#if defined(__APPLE__)
	pthread_setname_np(thread_name.c_str());
#elif defined(__linux__)
	pthread_setname_np(pthread_self(), thread_name.substr(0, 15).c_str());
#endif
}

} // namespace

ThreadPool::ThreadPool(size_t thread_num, string thread_name)
    : idle_num_(thread_num), thread_name_(std::move(thread_name)) {
	workers_.reserve(thread_num);
	for (size_t ii = 0; ii < thread_num; ++ii) {
		workers_.emplace_back([this]() { RunWorker(); });
	}
}

void ThreadPool::RunWorker() {
	NameWorkerThread(thread_name_);
	for (;;) {
		Job cur_job;
		{
			std::unique_lock<std::mutex> lck(mutex_);
			new_job_cv_.wait(lck, [this]() { return !jobs_.empty() || stopped_; });
			if (stopped_) {
				return;
			}
			cur_job = std::move(jobs_.front());
			jobs_.pop();
			--idle_num_;
		}

		// Execute job out of critical section.
		cur_job();

		{
			std::lock_guard<std::mutex> lck(mutex_);
			++idle_num_;
		}
		job_completion_cv_.notify_all();
	}
}

void ThreadPool::Wait() {
	std::unique_lock<std::mutex> lck(mutex_);
	job_completion_cv_.wait(lck, [this]() { return idle_num_ == workers_.size() && jobs_.empty(); });
}

ThreadPool::~ThreadPool() noexcept {
	{
		std::lock_guard<std::mutex> lck(mutex_);
		stopped_ = true;
	}
	new_job_cv_.notify_all();
	for (auto &cur_worker : workers_) {
		D_ASSERT(cur_worker.joinable());
		cur_worker.join();
	}
}

} // namespace duckdb
