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

#include <tracepipe/file_trace_backend.hxx>
#include <tracepipe/tracer.hxx>

#include "core/logger/logger.hxx"
#include "core/tracing/options_from_environment.hxx"

#include <fmt/core.h>

#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>

int
main()
{
  tracepipe::core::logger::create_console_logger();
  tracepipe::core::logger::set_log_levels(tracepipe::core::logger::level::info);

  // TRACEPIPE_* variables override these defaults, e.g. TRACEPIPE_TRACE_TIMEOUT_SECONDS=5
  auto options = tracepipe::core::tracing::load_options_from_environment(
    tracepipe::tracing_options{}
      .trace_timeout(std::chrono::milliseconds{ 500 })
      .timeout_check_interval(std::chrono::milliseconds{ 100 }));

  tracepipe::tracer tracer{ options, std::make_shared<tracepipe::file_trace_backend>(stdout) };

  {
    auto root = tracer.start_span("answer_question", tracepipe::start_span_options{}.inputs("What is the capital of France?"));
    auto retrieval = tracer.start_span("retrieve_documents");
    retrieval.set_attribute("documents", 3);
    if (auto ec = tracer.end_span(retrieval); ec) {
      fmt::print(stderr, "unable to end span: {}\n", ec.message());
    }
    if (auto ec = tracer.end_span(root, tracepipe::span_status::ok, tao::json::value("Paris")); ec) {
      fmt::print(stderr, "unable to end span: {}\n", ec.message());
    }

    auto [err, feedback] = tracer.assessments().log_feedback(
      root.trace_id(),
      "correctness",
      { tracepipe::assessment_source_type::llm_judge, "judge" },
      tracepipe::feedback_options{}.value(true).rationale("matches the expected answer"));
    if (err) {
      fmt::print(stderr, "unable to log feedback: {}\n", err.message());
    }
  }

  {
    // this trace never ends, the supervisor closes it with status ERROR
    auto root = tracer.start_span("stuck_operation");
    auto child = tracer.start_span("waiting_for_upstream");
    std::this_thread::sleep_for(options.trace_timeout().value_or(std::chrono::milliseconds{ 500 }) +
                                2 * options.timeout_check_interval());
    fmt::print(stderr, "stuck span still recording: {}\n", child.is_recording());
  }

  if (!tracer.flush(std::chrono::seconds{ 5 })) {
    fmt::print(stderr, "not every trace has been exported\n");
  }
  tracer.close();

  auto stats = tracer.stats();
  fmt::print(stderr,
             "submitted={}, exported={}, dropped={}, failed={}, retried={}\n",
             stats.submitted,
             stats.exported,
             stats.dropped,
             stats.failed,
             stats.retried);

  tracepipe::core::logger::shutdown();
  return 0;
}
