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

#include "tracing_service.hxx"

#include "backoff_calculator.hxx"
#include "core/logger/logger.hxx"
#include "export_worker_pool.hxx"
#include "live_trace.hxx"
#include "timeout_supervisor.hxx"
#include "trace_registry.hxx"

#include <tracepipe/error_codes.hxx>
#include <tracepipe/trace_backend.hxx>

#include <algorithm>
#include <exception>
#include <iterator>
#include <vector>

namespace tracepipe::core::tracing
{
namespace
{
constexpr std::chrono::seconds queue_full_warning_interval{ 10 };

void
export_snapshot(const export_retry_controller& controller,
                export_counters& counters,
                const trace_snapshot& snapshot,
                const export_retry_controller::sleeper& sleep)
{
  export_result result{ export_outcome::discarded_non_retryable };
  try {
    result = controller.execute(snapshot, sleep);
  } catch (const std::exception& e) {
    TP_LOG_ERROR(
      "unexpected exception while exporting trace {}: {}", snapshot.info.trace_id, e.what());
  } catch (...) {
    TP_LOG_ERROR("unexpected non-standard exception while exporting trace {}",
                 snapshot.info.trace_id);
  }

  counters.retried += result.retries();
  if (result.outcome == export_outcome::exported) {
    ++counters.exported;
  } else {
    ++counters.failed;
  }
}
} // namespace

tracing_service::tracing_service(tracing_options options, std::shared_ptr<trace_backend> backend)
  : options_{ std::move(options) }
  , backend_{ std::move(backend) }
  , registry_{ std::make_shared<trace_registry>() }
  , retry_controller_{ std::make_shared<export_retry_controller>(
      backend_,
      options_.export_retry_timeout(),
      exponential_backoff_with_bounded_jitter(
        options_.backoff_base(), options_.backoff_factor(), options_.backoff_jitter())) }
  , enabled_{ options_.enabled() }
{
  if (auto timeout = options_.trace_timeout(); timeout) {
    supervisor_ = std::make_unique<timeout_supervisor>(
      timeout_supervisor_options{
        timeout.value(),
        options_.timeout_check_interval(),
        options_.supervisor_idle_grace(),
      },
      registry_,
      [this](std::shared_ptr<const trace_snapshot> snapshot) {
        submit(std::move(snapshot), true);
      });
  }
  if (options_.async_export() || supervisor_) {
    // in synchronous mode a single worker exports the traces closed by the supervisor
    pool_ = std::make_unique<export_worker_pool>(
      options_.async_export() ? options_.max_workers() : 1,
      options_.max_queue_size(),
      [controller = retry_controller_, counters = counters_](
        const export_worker_pool::task& snapshot, const export_retry_controller::sleeper& sleep) {
        export_snapshot(*controller, *counters, *snapshot, sleep);
      });
    pool_->start();
  }
  TP_LOG_DEBUG("tracer created, async_export={}, workers={}, queue_size={}, trace_timeout={}ms",
               options_.async_export(),
               options_.max_workers(),
               options_.max_queue_size(),
               options_.trace_timeout().value_or(std::chrono::milliseconds::zero()).count());
}

tracing_service::~tracing_service()
{
  close();
}

auto
tracing_service::start_span(trace_context& context,
                            std::string name,
                            const start_span_options& options) -> span
{
  if (!enabled_ || closed_) {
    return {};
  }

  const std::scoped_lock lock(context.mutex_);
  const auto& parent = context.stack_.empty() ? context.parent_ : context.stack_.back();
  if (parent.is_noop()) {
    auto trace = std::make_shared<live_trace>(std::move(name), options.build());
    registry_->add(trace);
    if (supervisor_) {
      supervisor_->ensure_running();
    }
    TP_LOG_TRACE("trace {} started, root span {}", trace->trace_id(), trace->root_span_id());
    span root{ trace, trace->root_span_id() };
    context.stack_.push_back(root);
    return root;
  }

  auto span_id = parent.trace_->add_span(parent.id(), std::move(name), options.build());
  if (!span_id) {
    // the trace has finished (most likely timed out), the rest of the work is not recorded
    return {};
  }
  span child{ parent.trace_, std::move(span_id.value()) };
  context.stack_.push_back(child);
  return child;
}

auto
tracing_service::end_span(trace_context& context,
                          const span& target,
                          span_status status,
                          std::optional<tao::json::value> outputs) -> std::error_code
{
  if (target.is_noop()) {
    return {};
  }

  std::vector<std::shared_ptr<const trace_snapshot>> finished;
  close_result result{ close_status::unknown_span };
  {
    const std::scoped_lock lock(context.mutex_);
    auto& stack = context.stack_;
    auto it = std::find_if(stack.rbegin(), stack.rend(), [&target](const span& s) {
      return s.trace_ == target.trace_ && s.id() == target.id();
    });
    if (it == stack.rend()) {
      TP_LOG_DEBUG("span {} of trace {} is not open in this context", target.id(), target.trace_id());
      return errc::tracing::span_state_error;
    }

    const auto position = static_cast<std::size_t>(std::distance(it, stack.rend()) - 1);
    for (auto index = stack.size() - 1; index > position; --index) {
      const auto& above = stack[index];
      auto closed = above.trace_->close_span(above.id(), span_status::error, {});
      if (closed.status == close_status::closed) {
        TP_LOG_WARNING("span {} of trace {} was still open when its ancestor {} ended, closed with "
                       "status ERROR",
                       above.id(),
                       above.trace_id(),
                       target.id());
      }
      if (closed.snapshot) {
        finished.emplace_back(std::move(closed.snapshot));
      }
    }
    stack.resize(position);

    result = target.trace_->close_span(target.id(), status, std::move(outputs));
    if (result.snapshot) {
      finished.emplace_back(std::move(result.snapshot));
    }
  }

  for (auto& snapshot : finished) {
    finish(std::move(snapshot));
  }

  switch (result.status) {
    case close_status::closed:
    case close_status::trace_finished:
      return {};
    case close_status::already_closed:
    case close_status::unknown_span:
      break;
  }
  return errc::tracing::span_state_error;
}

auto
tracing_service::current_trace(const trace_context& context) const -> std::optional<trace_info>
{
  auto current = context.current_span();
  if (current.is_noop()) {
    return {};
  }
  return current.trace_->info();
}

auto
tracing_service::update_current_trace(trace_context& context,
                                      const std::map<std::string, std::string>& tags)
  -> std::error_code
{
  auto current = context.current_span();
  if (current.is_noop() || !current.trace_->merge_tags(tags)) {
    return errc::tracing::trace_not_active;
  }
  return {};
}

auto
tracing_service::set_trace_tag(const std::string& trace_id,
                               const std::string& key,
                               const std::string& value) -> std::error_code
{
  if (trace_id.empty() || key.empty()) {
    return errc::tracing::invalid_argument;
  }
  if (auto trace = registry_->find(trace_id); trace && trace->set_tag(key, value)) {
    return {};
  }
  return backend_->set_trace_tag(trace_id, key, value);
}

auto
tracing_service::delete_trace_tag(const std::string& trace_id, const std::string& key)
  -> std::error_code
{
  if (trace_id.empty() || key.empty()) {
    return errc::tracing::invalid_argument;
  }
  if (auto trace = registry_->find(trace_id); trace && trace->delete_tag(key)) {
    return {};
  }
  return backend_->delete_trace_tag(trace_id, key);
}

void
tracing_service::enable()
{
  enabled_ = true;
}

void
tracing_service::disable()
{
  enabled_ = false;
}

auto
tracing_service::is_enabled() const -> bool
{
  return enabled_;
}

auto
tracing_service::flush(std::chrono::milliseconds timeout) -> bool
{
  if (!pool_) {
    // synchronous exports have completed before end_span() returned
    return true;
  }
  return pool_->wait_until_drained(std::chrono::steady_clock::now() + timeout);
}

void
tracing_service::close()
{
  if (closed_.exchange(true)) {
    return;
  }
  {
    // pairs with the predicate check in sleep_unless_closed()
    const std::scoped_lock lock(close_mutex_);
  }
  close_requested_.notify_all();

  const auto timeout = options_.shutdown_flush_timeout();
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  if (supervisor_) {
    supervisor_->stop();
  }
  if (pool_) {
    if (!pool_->wait_until_drained(deadline)) {
      TP_LOG_WARNING("unable to export all finished traces within {}ms, {} trace(s) still queued",
                     timeout.count(),
                     pool_->queue_size());
    }
    if (auto discarded = pool_->stop(deadline); discarded > 0) {
      counters_->failed += discarded;
      TP_LOG_WARNING("{} finished trace(s) discarded on shutdown", discarded);
    }
  }
  if (auto left = registry_->size(); left > 0) {
    TP_LOG_INFO("tracer closed with {} trace(s) still in progress, they will not be exported", left);
  }
  TP_LOG_DEBUG("tracer closed, submitted={}, exported={}, dropped={}, failed={}, retried={}",
               counters_->submitted.load(),
               counters_->exported.load(),
               counters_->dropped.load(),
               counters_->failed.load(),
               counters_->retried.load());
}

auto
tracing_service::stats() const -> export_stats
{
  return {
    counters_->submitted.load(), counters_->exported.load(), counters_->dropped.load(),
    counters_->failed.load(),    counters_->retried.load(),
  };
}

auto
tracing_service::backend() const -> const std::shared_ptr<trace_backend>&
{
  return backend_;
}

auto
tracing_service::options() const -> const tracing_options&
{
  return options_;
}

auto
tracing_service::supervisor_running() const -> bool
{
  return supervisor_ != nullptr && supervisor_->is_running();
}

auto
tracing_service::in_progress_count() const -> std::size_t
{
  return registry_->size();
}

void
tracing_service::finish(std::shared_ptr<const trace_snapshot> snapshot)
{
  registry_->remove(snapshot->info.trace_id);
  TP_LOG_TRACE("trace {} finished with status {}, {} span(s)",
               snapshot->info.trace_id,
               to_string(snapshot->info.state),
               snapshot->spans.size());
  submit(std::move(snapshot), false);
}

void
tracing_service::submit(std::shared_ptr<const trace_snapshot> snapshot, bool closed_by_supervisor)
{
  ++counters_->submitted;
  if (!options_.async_export() && !closed_by_supervisor) {
    export_snapshot(
      *retry_controller_, *counters_, *snapshot, [this](std::chrono::milliseconds duration) {
        return sleep_unless_closed(duration);
      });
    return;
  }
  if (closed_) {
    ++counters_->failed;
    TP_LOG_WARNING("trace {} finished after the tracer has been closed, it will not be exported",
                   snapshot->info.trace_id);
    return;
  }
  auto trace_id = snapshot->info.trace_id;
  if (!pool_->submit(std::move(snapshot))) {
    ++counters_->dropped;
    report_queue_full(trace_id);
  }
}

void
tracing_service::report_queue_full(const std::string& trace_id)
{
  ++drops_since_warning_;
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  auto last = last_drop_warning_.load();
  const auto interval =
    std::chrono::duration_cast<std::chrono::steady_clock::duration>(queue_full_warning_interval)
      .count();
  if (last != 0 && now - last < interval) {
    return;
  }
  if (!last_drop_warning_.compare_exchange_strong(last, now)) {
    return;
  }
  TP_LOG_WARNING("export queue is full (capacity {}), dropped trace {}, {} trace(s) dropped since "
                 "the last warning",
                 options_.max_queue_size(),
                 trace_id,
                 drops_since_warning_.exchange(0));
}

auto
tracing_service::sleep_unless_closed(std::chrono::milliseconds duration) -> bool
{
  std::unique_lock lock(close_mutex_);
  return !close_requested_.wait_for(lock, duration, [this] {
    return closed_.load();
  });
}
} // namespace tracepipe::core::tracing
