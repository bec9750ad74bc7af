#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cmdex {

namespace trace_events {

struct process_spawned {
  std::int64_t pid;
  std::string executable;
  std::string command;
};

struct launch_failed {
  std::string executable;
  std::string command;
  std::string reason;
};

struct stream_closed {
  std::int64_t pid;
  std::string stream;  // "stdout" or "stderr"
  std::int64_t lines;
  bool end_of_stream;
};

struct process_exited {
  std::int64_t pid;
  int exit_code;
  int signal;  // 0 when the child exited normally
  std::int64_t duration_ms;
};

struct channel_closed {
  std::int64_t pid;
  std::int64_t events_sent;
  bool receiver_detached;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::process_spawned,
                                   trace_events::launch_failed,
                                   trace_events::stream_closed,
                                   trace_events::process_exited,
                                   trace_events::channel_closed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace cmdex

#define CMDEX_TRACE_UNLIKELY [[unlikely]]

#define CMDEX_TRACE_EMIT(event_expr) \
  do { \
    if (::cmdex::tui::g_trace_enabled) CMDEX_TRACE_UNLIKELY { \
        ::cmdex::tui::trace event_expr; \
      } \
  } while (0)

#define CMDEX_TRACE_PROCESS_SPAWNED(pid_value, executable_value, command_value) \
  CMDEX_TRACE_EMIT((::cmdex::trace_events::process_spawned{ \
      .pid = static_cast<std::int64_t>(pid_value), \
      .executable = (executable_value), \
      .command = (command_value), \
  }))

#define CMDEX_TRACE_LAUNCH_FAILED(executable_value, command_value, reason_value) \
  CMDEX_TRACE_EMIT((::cmdex::trace_events::launch_failed{ \
      .executable = (executable_value), \
      .command = (command_value), \
      .reason = (reason_value), \
  }))

#define CMDEX_TRACE_STREAM_CLOSED(pid_value, stream_value, lines_value, eof_value) \
  CMDEX_TRACE_EMIT((::cmdex::trace_events::stream_closed{ \
      .pid = static_cast<std::int64_t>(pid_value), \
      .stream = (stream_value), \
      .lines = static_cast<std::int64_t>(lines_value), \
      .end_of_stream = (eof_value), \
  }))

#define CMDEX_TRACE_PROCESS_EXITED(pid_value, exit_code_value, signal_value, duration_value) \
  CMDEX_TRACE_EMIT((::cmdex::trace_events::process_exited{ \
      .pid = static_cast<std::int64_t>(pid_value), \
      .exit_code = (exit_code_value), \
      .signal = (signal_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define CMDEX_TRACE_CHANNEL_CLOSED(pid_value, events_value, detached_value) \
  CMDEX_TRACE_EMIT((::cmdex::trace_events::channel_closed{ \
      .pid = static_cast<std::int64_t>(pid_value), \
      .events_sent = static_cast<std::int64_t>(events_value), \
      .receiver_detached = (detached_value), \
  }))
