// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "StreamExecutor.h"

namespace concurrency
{
  StreamExecutor::StreamExecutor(std::size_t threads)
  {
    const std::size_t n =
      threads > 0 ? threads : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

    try {
      for (std::size_t i = 0; i < n; ++i) {
	workers_.push_back(std::make_unique<Worker>());
	Worker& worker = *workers_.back();
	worker.thread = std::thread([&worker] { workerLoop(worker); });
      }
    }
    catch (...) {
      shutdown();
      throw;
    }
  }

  StreamExecutor::~StreamExecutor()
  {
    shutdown();
  }

  std::size_t StreamExecutor::workerFor(const std::string& streamKey) const
  {
    return std::hash<std::string>{}(streamKey) % workers_.size();
  }

  void StreamExecutor::enqueue(std::size_t index, std::function<void()> task)
  {
    Worker& worker = *workers_[index];
    {
      std::lock_guard<std::mutex> lock(worker.mutex);
      if (worker.stop)
	throw std::runtime_error("enqueue on stopped StreamExecutor");
      worker.tasks.push(std::move(task));
    }
    worker.condition.notify_one();
  }

  void StreamExecutor::workerLoop(Worker& worker)
  {
    for (;;) {
      std::function<void()> task;
      {
	std::unique_lock<std::mutex> lock(worker.mutex);
	worker.condition.wait(lock, [&worker]{ return worker.stop || !worker.tasks.empty(); });
	if (worker.stop && worker.tasks.empty()) return;
	task = std::move(worker.tasks.front());
	worker.tasks.pop();
      }
      task();
    }
  }

  void StreamExecutor::shutdown()
  {
    for (auto& worker : workers_) {
      {
	std::lock_guard<std::mutex> lock(worker->mutex);
	worker->stop = true;
      }
      worker->condition.notify_all();
    }

    for (auto& worker : workers_) {
      if (worker->thread.joinable())
	worker->thread.join();
    }
  }
} // namespace concurrency
