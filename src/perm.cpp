#include "perm.h"

#include "errors.h"

#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>

namespace cmdex {

namespace {

void check_digit(perm_mode value, char const *role) {
  if (static_cast<std::uint16_t>(value) > 7) {
    throw permission_encoding_error(std::string{ "invalid " } + role +
                                    " permission digit: " +
                                    std::to_string(static_cast<unsigned>(value)));
  }
}

}  // namespace

std::uint16_t merge_perm(perm_mode owner, perm_mode group, perm_mode other) {
  check_digit(owner, "owner");
  check_digit(group, "group");
  check_digit(other, "other");

  std::string const digits{ std::to_string(static_cast<unsigned>(owner)) +
                            std::to_string(static_cast<unsigned>(group)) +
                            std::to_string(static_cast<unsigned>(other)) };

  std::uint16_t result{ 0 };
  auto const [ptr, ec]{ std::from_chars(digits.data(), digits.data() + digits.size(), result) };
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    throw permission_encoding_error("cannot parse permission value: " + digits);
  }
  return result;
}

std::uint16_t merge_perm(perm_triplet const &perms) {
  return merge_perm(perms.owner, perms.group, perms.other);
}

std::filesystem::perms perm_to_fs(std::uint16_t merged) {
  unsigned bits{ 0 };
  unsigned shift{ 0 };
  for (int i{ 0 }; i < 3; ++i, merged /= 10, shift += 3) {
    unsigned const digit{ static_cast<unsigned>(merged % 10) };
    if (digit > 7) {
      throw permission_encoding_error("not an octal permission value: " +
                                      std::to_string(merged));
    }
    bits |= digit << shift;
  }
  if (merged != 0) {
    throw permission_encoding_error("permission value has more than three digits");
  }
  return static_cast<std::filesystem::perms>(bits);
}

}  // namespace cmdex
