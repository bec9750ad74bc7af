#include "errors.h"

#include <csignal>
#include <cstring>
#include <string>

namespace cmdex {

std::string exit_status_describe(exit_status const &status) {
  if (status.signal) {
    char const *name{ ::strsignal(*status.signal) };
    return "terminated by signal " + std::to_string(*status.signal) +
           (name ? " (" + std::string{ name } + ")" : std::string{});
  }
  return "exit status " + std::to_string(status.exit_code);
}

}  // namespace cmdex
