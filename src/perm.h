#pragma once

#include <cstdint>
#include <filesystem>

namespace cmdex {

// One octal permission digit: read (4), write (2), execute (1).
enum perm_mode : std::uint16_t {
  perm_none = 0,
  perm_x = 1,
  perm_w = 2,
  perm_wx = 3,
  perm_r = 4,
  perm_rx = 5,
  perm_rw = 6,
  perm_rwx = 7,
};

struct perm_triplet {
  perm_mode owner{ perm_rwx };
  perm_mode group{ perm_rx };
  perm_mode other{ perm_rx };
};

// Concatenates the three digits and parses them as a decimal number, so
// merge_perm(7, 5, 5) == 755. Throws permission_encoding_error for a digit above 7.
std::uint16_t merge_perm(perm_mode owner, perm_mode group, perm_mode other);
std::uint16_t merge_perm(perm_triplet const &perms);

// Reads the digits of a merge_perm() value as octal: 755 -> rwxr-xr-x.
std::filesystem::perms perm_to_fs(std::uint16_t merged);

}  // namespace cmdex
