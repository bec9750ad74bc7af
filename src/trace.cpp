#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace cmdex {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(process_spawned),
                        TRACE_NAME(launch_failed),
                        TRACE_NAME(stream_closed),
                        TRACE_NAME(process_exited),
                        TRACE_NAME(channel_closed),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::process_spawned const &value) {
            std::ostringstream oss;
            oss << "process_spawned pid=" << value.pid
                << " executable=" << value.executable << " command=" << value.command;
            return oss.str();
          },
          [](trace_events::launch_failed const &value) {
            std::ostringstream oss;
            oss << "launch_failed executable=" << value.executable
                << " command=" << value.command << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::stream_closed const &value) {
            std::ostringstream oss;
            oss << "stream_closed pid=" << value.pid << " stream=" << value.stream
                << " lines=" << value.lines
                << " end_of_stream=" << bool_string(value.end_of_stream);
            return oss.str();
          },
          [](trace_events::process_exited const &value) {
            std::ostringstream oss;
            oss << "process_exited pid=" << value.pid << " exit_code=" << value.exit_code
                << " signal=" << value.signal << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::channel_closed const &value) {
            std::ostringstream oss;
            oss << "channel_closed pid=" << value.pid
                << " events_sent=" << value.events_sent
                << " receiver_detached=" << bool_string(value.receiver_detached);
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::process_spawned const &value) {
            append_kv(output, "pid", value.pid);
            append_kv(output, "executable", value.executable);
            append_kv(output, "command", value.command);
          },
          [&](trace_events::launch_failed const &value) {
            append_kv(output, "executable", value.executable);
            append_kv(output, "command", value.command);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::stream_closed const &value) {
            append_kv(output, "pid", value.pid);
            append_kv(output, "stream", value.stream);
            append_kv(output, "lines", value.lines);
            append_kv(output, "end_of_stream", value.end_of_stream);
          },
          [&](trace_events::process_exited const &value) {
            append_kv(output, "pid", value.pid);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "signal", static_cast<std::int64_t>(value.signal));
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::channel_closed const &value) {
            append_kv(output, "pid", value.pid);
            append_kv(output, "events_sent", value.events_sent);
            append_kv(output, "receiver_detached", value.receiver_detached);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace cmdex
