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

#include "core/utils/json.hxx"

#include <tracepipe/assessment_client.hxx>
#include <tracepipe/file_trace_backend.hxx>
#include <tracepipe/tracer.hxx>

#include <tao/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

namespace
{
class temporary_file
{
public:
  temporary_file()
    : file_{ std::tmpfile() }
  {
  }

  temporary_file(const temporary_file&) = delete;
  temporary_file(temporary_file&&) = delete;
  auto operator=(const temporary_file&) -> temporary_file& = delete;
  auto operator=(temporary_file&&) -> temporary_file& = delete;

  ~temporary_file()
  {
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  [[nodiscard]] auto get() const -> FILE*
  {
    return file_;
  }

  [[nodiscard]] auto records() const -> std::vector<tao::json::value>
  {
    std::vector<tao::json::value> result;
    std::rewind(file_);
    std::string line;
    int c{};
    while ((c = std::fgetc(file_)) != EOF) {
      if (c == '\n') {
        result.push_back(tracepipe::core::utils::json::parse(line));
        line.clear();
      } else {
        line.push_back(static_cast<char>(c));
      }
    }
    std::fseek(file_, 0, SEEK_END);
    return result;
  }

private:
  FILE* file_;
};
} // namespace

TEST_CASE("unit: file backend writes one JSON record per line", "[unit][file_backend]")
{
  test::utils::init_logger();
  temporary_file output{};
  REQUIRE(output.get() != nullptr);
  auto backend = std::make_shared<tracepipe::file_trace_backend>(output.get());

  tracepipe::tracer tracer{ tracepipe::tracing_options{}.async_export(false), backend };
  auto context = std::make_shared<tracepipe::trace_context>();
  auto root = tracer.start_span(*context, "handler", tracepipe::start_span_options{}.inputs("ping"));
  auto child = tracer.start_span(*context, "lookup");
  child.set_attribute("rows", 3);
  REQUIRE_SUCCESS(tracer.end_span(*context, child));
  REQUIRE_SUCCESS(tracer.end_span(*context, root, tracepipe::span_status::ok, tao::json::value("pong")));
  auto trace_id = root.trace_id();

  REQUIRE_SUCCESS(tracer.set_trace_tag(trace_id, "env", "test"));
  REQUIRE_SUCCESS(tracer.delete_trace_tag(trace_id, "env"));

  auto records = output.records();
  REQUIRE(records.size() == 3);

  const auto& trace = records[0];
  REQUIRE(trace.at("type").get_string() == "trace");
  REQUIRE(trace.at("info").at("trace_id").get_string() == trace_id);
  REQUIRE(trace.at("info").at("state").get_string() == "OK");
  const auto& spans = trace.at("spans").get_array();
  REQUIRE(spans.size() == 2);
  for (const auto& span : spans) {
    if (span.at("name").get_string() == "handler") {
      REQUIRE(span.at("inputs").get_string() == "ping");
      REQUIRE(span.at("outputs").get_string() == "pong");
      REQUIRE(span.at("parent_id").is_null());
    } else {
      REQUIRE(span.at("name").get_string() == "lookup");
      REQUIRE(span.at("parent_id").get_string() == root.id());
      REQUIRE(span.at("attributes").at("rows").as<std::int64_t>() == 3);
    }
  }

  REQUIRE(records[1].at("type").get_string() == "set_trace_tag");
  REQUIRE(records[1].at("key").get_string() == "env");
  REQUIRE(records[1].at("value").get_string() == "test");
  REQUIRE(records[2].at("type").get_string() == "delete_trace_tag");
  REQUIRE(records[2].at("trace_id").get_string() == trace_id);
  tracer.close();
}

TEST_CASE("unit: file backend keeps assessments for updates", "[unit][file_backend]")
{
  test::utils::init_logger();
  temporary_file output{};
  REQUIRE(output.get() != nullptr);
  auto backend = std::make_shared<tracepipe::file_trace_backend>(output.get());
  tracepipe::assessment_client client{ backend };

  auto [ec, feedback] =
    client.log_feedback("tr-1", "helpful", {}, tracepipe::feedback_options{}.value(false));
  REQUIRE_SUCCESS(ec);

  auto [update_ec, updated] = client.update_feedback(
    "tr-1", feedback.assessment_id, tracepipe::feedback_update_options{}.rationale("changed mind").value(true));
  REQUIRE_SUCCESS(update_ec);
  REQUIRE(updated.value.get_boolean());

  REQUIRE(client.update_feedback("tr-2", feedback.assessment_id, tracepipe::feedback_update_options{}.value(1))
            .first == tracepipe::errc::export_failure::resource_not_found);

  REQUIRE_SUCCESS(client.delete_feedback("tr-1", feedback.assessment_id));
  REQUIRE(client.delete_feedback("tr-1", feedback.assessment_id) ==
          tracepipe::errc::export_failure::resource_not_found);

  auto records = output.records();
  REQUIRE(records.size() == 3);
  REQUIRE(records[0].at("type").get_string() == "create_assessment");
  REQUIRE(records[0].at("value").get_boolean() == false);
  REQUIRE(records[1].at("type").get_string() == "update_assessment");
  REQUIRE(records[1].at("value").get_boolean() == true);
  REQUIRE(records[1].at("rationale").get_string() == "changed mind");
  REQUIRE(records[2].at("type").get_string() == "delete_assessment");
  REQUIRE(records[2].at("assessment_id").get_string() == feedback.assessment_id);
}

TEST_CASE("unit: file backend keeps assessments unchanged when the stream rejects writes", "[unit][file_backend]")
{
  test::utils::init_logger();
  auto path = (std::filesystem::temp_directory_path() / "tracepipe-assessments-XXXXXX").string();
  const int fd = ::mkstemp(path.data());
  REQUIRE(fd >= 0);
  ::close(fd);
  FILE* output = std::fopen(path.c_str(), "w");
  REQUIRE(output != nullptr);

  {
    auto backend = std::make_shared<tracepipe::file_trace_backend>(output);
    tracepipe::assessment_client client{ backend };
    auto [ec, feedback] = client.log_feedback("tr-1", "helpful", {}, tracepipe::feedback_options{}.value(false));
    REQUIRE_SUCCESS(ec);

    // same stream, now read-only
    output = std::freopen(path.c_str(), "r", output);
    REQUIRE(output != nullptr);
    REQUIRE(client
              .update_feedback(
                "tr-1", feedback.assessment_id, tracepipe::feedback_update_options{}.value(true).rationale("changed mind"))
              .first == tracepipe::errc::export_failure::backend_unavailable);
    REQUIRE(client.delete_feedback("tr-1", feedback.assessment_id) ==
            tracepipe::errc::export_failure::backend_unavailable);

    output = std::freopen(path.c_str(), "a", output);
    REQUIRE(output != nullptr);
    auto [update_ec, updated] =
      client.update_feedback("tr-1", feedback.assessment_id, tracepipe::feedback_update_options{}.metadata({ { "round", "2" } }));
    REQUIRE_SUCCESS(update_ec);
    REQUIRE(updated.value.get_boolean() == false);
    REQUIRE_FALSE(updated.rationale.has_value());
    REQUIRE_SUCCESS(client.delete_feedback("tr-1", feedback.assessment_id));
    REQUIRE(client.delete_feedback("tr-1", feedback.assessment_id) ==
            tracepipe::errc::export_failure::resource_not_found);
  }
  std::fclose(output);
  std::vector<std::string> types;
  FILE* input = std::fopen(path.c_str(), "r");
  REQUIRE(input != nullptr);
  std::string line;
  int c{};
  while ((c = std::fgetc(input)) != EOF) {
    if (c == '\n') {
      types.push_back(tracepipe::core::utils::json::parse(line).at("type").get_string());
      line.clear();
    } else {
      line.push_back(static_cast<char>(c));
    }
  }
  std::fclose(input);
  std::remove(path.c_str());
  REQUIRE(types == std::vector<std::string>{ "create_assessment", "update_assessment", "delete_assessment" });
}

TEST_CASE("unit: file backend without stream is unavailable", "[unit][file_backend]")
{
  tracepipe::file_trace_backend backend{ nullptr };
  REQUIRE(backend.persist_trace({}) == tracepipe::errc::export_failure::backend_unavailable);
  REQUIRE(backend.set_trace_tag("tr-1", "k", "v") == tracepipe::errc::export_failure::backend_unavailable);
}
