// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_STATUS_STATUS_MACROS_H_
#define AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/strings/string_view.h"

/// @file status_macros.h
/// @brief Trace-carrying status propagation
///
/// Every propagation step appends one frame to the status message:
///
///     Cannot read page length
///       at ReadLeInt32 (binary_utils.cpp:41) [OUT_OF_RANGE] - ...
///       at ReadLevelRecords (hier_decoder.cpp:97) [OUT_OF_RANGE] - page 2
///
/// Payloads attached to the root status (the index error kind in
/// particular) are carried over to every re-traced status.

namespace miraxindex::status {

/// @brief Format one frame line: "  at Func (file:line) [CODE] - message"
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");

  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

/// @brief Return the root error text, without any frame lines
inline std::string StripStackTrace(absl::string_view full_message) {
  if (auto pos = full_message.find("\n  at "); pos != absl::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

/// @brief Append exactly one frame to a non-ok status
///
/// The code and all payloads of @p st are preserved. Ok statuses pass
/// through untouched.
inline absl::Status AddTraceImpl(absl::Status const& st, char const* function,
                                 char const* file, int line,
                                 std::string_view message) {
  if (st.ok()) {
    return st;
  }

  std::string root = StripStackTrace(st.message());

  std::string tail;
  if (auto pos = st.message().find("\n  at "); pos != absl::string_view::npos) {
    tail = std::string(st.message().substr(pos));
  }

  std::string out = root;
  if (!tail.empty()) {
    out += tail;
  }
  out.push_back('\n');
  out += FormatStackFrame(function, file, line, st.code(), message);

  absl::Status traced(st.code(), out);
  st.ForEachPayload(
      [&traced](absl::string_view type_url, const absl::Cord& payload) {
        traced.SetPayload(type_url, payload);
      });
  return traced;
}

template <typename T>
inline absl::StatusOr<T> AddTraceImpl(absl::StatusOr<T> const& sor,
                                      char const* function, char const* file,
                                      int line, std::string_view message) {
  if (sor.ok()) {
    return sor;
  }
  return AddTraceImpl(sor.status(), function, file, line, message);
}

inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  return AddTraceImpl(st, function, file, line, message);
}

template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  return AddTraceImpl(sor, function, file, line, message);
}

}  // namespace miraxindex::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/// @brief Create a traced absl::Status with an initial frame
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                         \
  ::miraxindex::status::AddTrace(absl::Status((code), (message)), __func__, \
                                 __FILE__, __LINE__, (message))

/// @brief Propagate a non-ok absl::Status, appending this function as a frame
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                             \
  do {                                                                         \
    auto _st = (expr);                                                         \
    if (!_st.ok()) {                                                           \
      return ::miraxindex::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                            (msg));                            \
    }                                                                          \
  } while (0)

/// @brief Unpack a StatusOr<T> into an existing lhs or return with a frame
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                       \
  do {                                                                         \
    auto _sor = (expr);                                                        \
    if (!_sor.ok()) {                                                          \
      return ::miraxindex::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                            __LINE__, ##__VA_ARGS__);          \
    }                                                                          \
    lhs = std::move(_sor).value();                                             \
  } while (0)

#endif  // AIFO_MIRAXINDEX_INCLUDE_MIRAXINDEX_STATUS_STATUS_MACROS_H_
