/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include "test_helper.hxx"

#include "core/tracing/export_worker_pool.hxx"
#include "core/utils/concurrent_fixed_queue.hxx"

#include <tracepipe/tracer.hxx>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace
{
auto
finish_trace(tracepipe::tracer& tracer, const std::string& name) -> std::string
{
  auto context = std::make_shared<tracepipe::trace_context>();
  auto root = tracer.start_span(*context, name);
  auto trace_id = root.trace_id();
  REQUIRE_SUCCESS(tracer.end_span(*context, root));
  return trace_id;
}
} // namespace

TEST_CASE("unit: concurrent_fixed_queue", "[unit][export_queue]")
{
  tracepipe::core::utils::concurrent_fixed_queue<int> queue{ 2 };

  SECTION("rejects items beyond the capacity")
  {
    REQUIRE(queue.try_emplace(1));
    REQUIRE(queue.try_emplace(2));
    REQUIRE_FALSE(queue.try_emplace(3));
    REQUIRE(queue.dropped_count() == 1);
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.wait_pop() == 1);
    queue.task_done();
    REQUIRE(queue.wait_pop() == 2);
    queue.task_done();
    REQUIRE(queue.empty());
  }

  SECTION("drained only after the consumer acknowledged the item")
  {
    REQUIRE(queue.try_emplace(1));
    auto item = queue.wait_pop();
    REQUIRE(item.has_value());
    REQUIRE(queue.empty());
    REQUIRE_FALSE(queue.wait_until_drained(std::chrono::steady_clock::now() + 20ms));
    queue.task_done();
    REQUIRE(queue.wait_until_drained(std::chrono::steady_clock::now() + 20ms));
  }

  SECTION("close wakes up consumers and discards queued items")
  {
    std::optional<int> popped{ 42 };
    std::thread consumer([&] {
      popped = queue.wait_pop();
    });
    std::this_thread::sleep_for(10ms);
    REQUIRE(queue.close() == 0);
    consumer.join();
    REQUIRE_FALSE(popped.has_value());

    REQUIRE_FALSE(queue.try_emplace(5));
    REQUIRE(queue.wait_until_drained(std::chrono::steady_clock::now()));
  }
}

TEST_CASE("unit: full export queue drops the newest trace", "[unit][export_queue]")
{
  test::utils::init_logger();
  auto backend = std::make_shared<test::utils::recording_backend>();
  tracepipe::tracer tracer{ tracepipe::tracing_options{}.max_workers(1).max_queue_size(2), backend };

  backend->hold();
  auto first = finish_trace(tracer, "first");
  // the only worker is now stuck exporting the first trace
  REQUIRE(test::utils::wait_until([&] {
    return backend->waiting() == 1;
  }));
  auto second = finish_trace(tracer, "second");
  auto third = finish_trace(tracer, "third");
  auto fourth = finish_trace(tracer, "fourth");

  auto stats = tracer.stats();
  REQUIRE(stats.submitted == 4);
  REQUIRE(stats.dropped == 1);

  REQUIRE_FALSE(tracer.flush(50ms));

  backend->release();
  REQUIRE(tracer.flush(5s));

  auto traces = backend->traces();
  REQUIRE(traces.size() == 3);
  REQUIRE(traces[0].info.trace_id == first);
  REQUIRE(traces[1].info.trace_id == second);
  REQUIRE(traces[2].info.trace_id == third);

  stats = tracer.stats();
  REQUIRE(stats.exported == 3);
  REQUIRE(stats.dropped == 1);
  REQUIRE(stats.failed == 0);
}

TEST_CASE("unit: single worker exports in submission order", "[unit][export_queue]")
{
  test::utils::init_logger();
  auto backend = std::make_shared<test::utils::recording_backend>();
  tracepipe::tracer tracer{ tracepipe::tracing_options{}.max_workers(1), backend };

  std::vector<std::string> expected;
  for (int i = 0; i < 5; ++i) {
    expected.push_back(finish_trace(tracer, fmt::format("trace {}", i)));
  }
  REQUIRE(tracer.flush(5s));

  auto traces = backend->traces();
  REQUIRE(traces.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    REQUIRE(traces[i].info.trace_id == expected[i]);
  }
}

TEST_CASE("unit: close waits for the exports only up to the shutdown flush timeout", "[unit][export_queue]")
{
  test::utils::init_logger();
  auto backend = std::make_shared<test::utils::recording_backend>();
  tracepipe::tracer tracer{
    tracepipe::tracing_options{}.max_workers(1).max_queue_size(10).shutdown_flush_timeout(50ms), backend
  };

  backend->hold();
  finish_trace(tracer, "in flight");
  REQUIRE(test::utils::wait_until([&] {
    return backend->waiting() == 1;
  }));
  finish_trace(tracer, "queued 1");
  finish_trace(tracer, "queued 2");

  // the backend stays stalled for the whole close
  auto started = std::chrono::steady_clock::now();
  tracer.close();
  REQUIRE(std::chrono::steady_clock::now() - started < 2s);

  auto stats = tracer.stats();
  REQUIRE(stats.submitted == 3);
  REQUIRE(stats.exported == 0);
  REQUIRE(stats.failed == 2);
  REQUIRE(backend->trace_count() == 0);

  // the export in flight completes in the background, the queued ones are discarded
  backend->release();
  REQUIRE(test::utils::wait_until([&] {
    return tracer.stats().exported == 1;
  }));
  REQUIRE(backend->trace_count() == 1);
  REQUIRE(backend->persist_calls() == 1);

  SECTION("the closed tracer does not record anymore")
  {
    auto context = std::make_shared<tracepipe::trace_context>();
    REQUIRE(tracer.start_span(*context, "after close").is_noop());
    tracer.close();
  }
}

TEST_CASE("unit: destroying the tracer does not wait for a stalled backend", "[unit][export_queue]")
{
  test::utils::init_logger();
  auto backend = std::make_shared<test::utils::recording_backend>();
  backend->hold();
  auto started = std::chrono::steady_clock::now();
  {
    tracepipe::tracer tracer{ tracepipe::tracing_options{}.max_workers(2).shutdown_flush_timeout(100ms), backend };
    finish_trace(tracer, "first");
    finish_trace(tracer, "second");
    REQUIRE(test::utils::wait_until([&] {
      return backend->waiting() == 2;
    }));
  }
  REQUIRE(std::chrono::steady_clock::now() - started < 2s);

  backend->release();
  REQUIRE(test::utils::wait_until([&] {
    return backend->trace_count() == 2;
  }));
}

TEST_CASE("unit: export worker pool", "[unit][export_queue]")
{
  test::utils::init_logger();
  std::mutex mutex;
  std::vector<std::string> handled;
  std::vector<bool> sleep_results;
  std::atomic_bool sleep_on_task{ false };

  tracepipe::core::tracing::export_worker_pool pool{
    2,
    2,
    [&](const auto& task, const auto& sleep) {
      if (sleep_on_task) {
        auto completed = sleep(std::chrono::milliseconds{ 10'000 });
        const std::scoped_lock lock(mutex);
        sleep_results.push_back(completed);
        return;
      }
      const std::scoped_lock lock(mutex);
      handled.push_back(task->info.trace_id);
    },
  };
  REQUIRE(pool.worker_count() == 2);

  auto make_task = [](const std::string& trace_id) {
    auto snapshot = std::make_shared<tracepipe::trace_snapshot>();
    snapshot->info.trace_id = trace_id;
    return tracepipe::core::tracing::export_worker_pool::task{ std::move(snapshot) };
  };

  SECTION("capacity two with stalled workers keeps two of three tasks")
  {
    REQUIRE(pool.submit(make_task("tr-1")));
    REQUIRE(pool.submit(make_task("tr-2")));
    REQUIRE_FALSE(pool.submit(make_task("tr-3")));
    REQUIRE(pool.dropped_count() == 1);
    REQUIRE(pool.queue_size() == 2);

    pool.start();
    REQUIRE(pool.wait_until_drained(std::chrono::steady_clock::now() + 5s));
    const std::scoped_lock lock(mutex);
    REQUIRE(handled.size() == 2);
    REQUIRE(std::find(handled.begin(), handled.end(), "tr-3") == handled.end());
  }

  SECTION("stop interrupts the backoff wait")
  {
    sleep_on_task = true;
    pool.start();
    REQUIRE(pool.submit(make_task("tr-1")));
    std::this_thread::sleep_for(50ms);

    auto started = std::chrono::steady_clock::now();
    REQUIRE(pool.stop(std::chrono::steady_clock::now() + 5s) == 0);
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
    const std::scoped_lock lock(mutex);
    REQUIRE(sleep_results == std::vector<bool>{ false });
    REQUIRE_FALSE(pool.submit(make_task("tr-2")));
  }

  SECTION("stop discards queued tasks")
  {
    REQUIRE(pool.submit(make_task("tr-1")));
    REQUIRE(pool.submit(make_task("tr-2")));
    REQUIRE(pool.stop(std::chrono::steady_clock::now() + 5s) == 2);
    const std::scoped_lock lock(mutex);
    REQUIRE(handled.empty());
  }
}
