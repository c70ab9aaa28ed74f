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

#include <tracepipe/trace_context.hxx>

#include <utility>

namespace tracepipe
{
namespace
{
thread_local std::shared_ptr<trace_context> attached_context{};
} // namespace

trace_context::trace_context(span parent)
  : parent_{ std::move(parent) }
{
}

auto
trace_context::current() -> std::shared_ptr<trace_context>
{
    if (!attached_context) {
        attached_context = std::make_shared<trace_context>();
    }
    return attached_context;
}

auto
trace_context::propagate() const -> std::shared_ptr<trace_context>
{
    // the constructor taking the parent is private, std::make_shared cannot reach it
    return std::shared_ptr<trace_context>(new trace_context(current_span()));
}

auto
trace_context::current_span() const -> span
{
    const std::scoped_lock lock(mutex_);
    if (stack_.empty()) {
        return parent_;
    }
    return stack_.back();
}

auto
trace_context::depth() const -> std::size_t
{
    const std::scoped_lock lock(mutex_);
    return stack_.size();
}

context_scope::context_scope(std::shared_ptr<trace_context> context)
  : previous_{ std::exchange(attached_context, std::move(context)) }
{
}

context_scope::~context_scope()
{
    attached_context = std::move(previous_);
}
} // namespace tracepipe
