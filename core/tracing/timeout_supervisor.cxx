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

#include "timeout_supervisor.hxx"

#include "core/chrono_utils.hxx"
#include "core/logger/logger.hxx"
#include "live_trace.hxx"
#include "trace_registry.hxx"

#include <tracepipe/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include <algorithm>
#include <mutex>
#include <optional>
#include <thread>

namespace tracepipe::core::tracing
{
class timeout_supervisor_impl : public std::enable_shared_from_this<timeout_supervisor_impl>
{
public:
  timeout_supervisor_impl(const timeout_supervisor_options& options,
                          std::shared_ptr<trace_registry> registry,
                          timeout_supervisor::expired_handler handler)
    : options_{ options.trace_timeout,
                std::max(options.check_interval, std::chrono::milliseconds{ 1 }),
                options.idle_grace }
    , registry_{ std::move(registry) }
    , handler_{ std::move(handler) }
  {
  }

  timeout_supervisor_impl(const timeout_supervisor_impl&) = delete;
  timeout_supervisor_impl(timeout_supervisor_impl&&) = delete;
  auto operator=(const timeout_supervisor_impl&) -> timeout_supervisor_impl& = delete;
  auto operator=(timeout_supervisor_impl&&) -> timeout_supervisor_impl& = delete;
  ~timeout_supervisor_impl() = default;

  void ensure_running()
  {
    const std::scoped_lock lock(mutex_);
    if (stopped_ || running_) {
      return;
    }
    // the previous loop has left its last handler, so the join returns immediately
    if (thread_.joinable()) {
      thread_.join();
    }
    ctx_.restart();
    idle_since_.reset();
    running_ = true;
    rearm();
    thread_ = std::thread([this]() {
      ctx_.run();
    });
    TP_LOG_DEBUG("trace timeout supervisor started, timeout={}ms, interval={}ms",
                 options_.trace_timeout.count(),
                 options_.check_interval.count());
  }

  void stop()
  {
    std::thread worker;
    {
      const std::scoped_lock lock(mutex_);
      stopped_ = true;
      if (running_) {
        running_ = false;
        asio::post(ctx_, [self = shared_from_this()]() {
          self->timer_.cancel();
        });
      }
      worker = std::move(thread_);
    }
    if (worker.joinable()) {
      worker.join();
    }
  }

  [[nodiscard]] auto is_running() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return running_;
  }

private:
  void rearm()
  {
    timer_.expires_after(options_.check_interval);
    timer_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      self->check_traces();
    });
  }

  void check_traces()
  {
    const auto now = std::chrono::steady_clock::now();
    for (const auto& trace : registry_->in_progress()) {
      if (trace->age(now) < options_.trace_timeout) {
        continue;
      }
      auto snapshot = trace->force_close();
      if (snapshot == nullptr) {
        // the root span has been closed concurrently, the application wins
        continue;
      }
      registry_->remove(trace->trace_id());
      const std::error_code ec{ errc::tracing::trace_timeout };
      TP_LOG_WARNING("trace {} exceeded the timeout of {}ms (age {:.3f}s) and has been closed with "
                     "status ERROR, {} span(s), ec={}",
                     trace->trace_id(),
                     options_.trace_timeout.count(),
                     to_seconds(trace->age(now)),
                     snapshot->spans.size(),
                     ec.message());
      handler_(std::move(snapshot));
    }

    const std::scoped_lock lock(mutex_);
    if (!running_) {
      return;
    }
    if (registry_->empty()) {
      if (!idle_since_) {
        idle_since_ = now;
      } else if (now - idle_since_.value() >= options_.idle_grace) {
        running_ = false;
        TP_LOG_DEBUG("no traces in progress for {}ms, trace timeout supervisor goes idle",
                     options_.idle_grace.count());
        return;
      }
    } else {
      idle_since_.reset();
    }
    rearm();
  }

  const timeout_supervisor_options options_;
  std::shared_ptr<trace_registry> registry_;
  timeout_supervisor::expired_handler handler_;

  asio::io_context ctx_{};
  asio::steady_timer timer_{ ctx_ };
  std::thread thread_{};

  mutable std::mutex mutex_{};
  bool running_{ false };
  bool stopped_{ false };
  std::optional<std::chrono::steady_clock::time_point> idle_since_{};
};

timeout_supervisor::timeout_supervisor(const timeout_supervisor_options& options,
                                       std::shared_ptr<trace_registry> registry,
                                       expired_handler handler)
  : impl_{ std::make_shared<timeout_supervisor_impl>(options,
                                                     std::move(registry),
                                                     std::move(handler)) }
{
}

timeout_supervisor::~timeout_supervisor()
{
  impl_->stop();
}

void
timeout_supervisor::ensure_running()
{
  impl_->ensure_running();
}

void
timeout_supervisor::stop()
{
  impl_->stop();
}

auto
timeout_supervisor::is_running() const -> bool
{
  return impl_->is_running();
}
} // namespace tracepipe::core::tracing
