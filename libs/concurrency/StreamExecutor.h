// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file StreamExecutor.h
 * @brief Fixed-size pool where every task carries a stream key.
 *
 * Each worker owns its own queue and a stream key always maps to the same
 * worker, so the tasks of one stream run sequentially and in submission
 * order while different streams run in parallel. This is what a decision
 * stream needs: a single writer without locking inside the stream.
 *
 * Exceptions thrown by a task are delivered through its future.
 */
namespace concurrency
{
  class StreamExecutor {
  public:
    StreamExecutor(const StreamExecutor&) = delete;
    StreamExecutor& operator=(const StreamExecutor&) = delete;
    StreamExecutor(StreamExecutor&&) = delete;
    StreamExecutor& operator=(StreamExecutor&&) = delete;

    /**
     * @param threads number of workers; 0 picks std::thread::hardware_concurrency()
     * (falling back to 2 if that returns 0).
     */
    explicit StreamExecutor(std::size_t threads = 0);

    // Runs every task already queued, then joins the workers
    ~StreamExecutor();

    template <typename F>
    std::future<std::invoke_result_t<F>> submit(const std::string& streamKey, F task)
    {
      using R = std::invoke_result_t<F>;

      auto packaged = std::make_shared<std::packaged_task<R()>>(std::move(task));
      auto fut = packaged->get_future();
      enqueue(workerFor(streamKey), [packaged]() { (*packaged)(); });
      return fut;
    }

    // Worker index a stream key is pinned to
    std::size_t workerFor(const std::string& streamKey) const;

    std::size_t size() const { return workers_.size(); }

  private:
    struct Worker
    {
      std::queue<std::function<void()>> tasks;
      std::mutex mutex;
      std::condition_variable condition;
      bool stop = false;
      std::thread thread;
    };

    void enqueue(std::size_t index, std::function<void()> task);
    static void workerLoop(Worker& worker);
    void shutdown();

  private:
    std::vector<std::unique_ptr<Worker>> workers_;
  };
} // namespace concurrency
