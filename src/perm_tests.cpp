#include "perm.h"

#include "errors.h"

#include "doctest.h"

#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("merge_perm concatenates digits as a decimal value") {
  CHECK(cmdex::merge_perm(cmdex::perm_rwx, cmdex::perm_rx, cmdex::perm_rx) == 755);
  CHECK(cmdex::merge_perm(cmdex::perm_rw, cmdex::perm_none, cmdex::perm_none) == 600);
  CHECK(cmdex::merge_perm(cmdex::perm_rw, cmdex::perm_r, cmdex::perm_r) == 644);
  CHECK(cmdex::merge_perm(cmdex::perm_none, cmdex::perm_none, cmdex::perm_x) == 1);
  CHECK(cmdex::merge_perm(cmdex::perm_rwx, cmdex::perm_rwx, cmdex::perm_rwx) == 777);
}

TEST_CASE("merge_perm defaults missing components position by position") {
  cmdex::perm_triplet const defaults{};
  cmdex::perm_triplet const owner_only{ .owner = cmdex::perm_rw };
  cmdex::perm_triplet const owner_group{ .owner = cmdex::perm_rw,
                                         .group = cmdex::perm_none };

  CHECK(cmdex::merge_perm(defaults) == 755);
  CHECK(cmdex::merge_perm(owner_only) == 655);
  CHECK(cmdex::merge_perm(owner_group) == 605);
}

TEST_CASE("merge_perm rejects digits above 7") {
  auto const eight{ static_cast<cmdex::perm_mode>(8) };
  CHECK_THROWS_AS(cmdex::merge_perm(eight, cmdex::perm_rx, cmdex::perm_rx),
                  cmdex::permission_encoding_error);
  CHECK_THROWS_AS(cmdex::merge_perm(cmdex::perm_rx, eight, cmdex::perm_rx),
                  cmdex::permission_encoding_error);
  CHECK_THROWS_AS(cmdex::merge_perm(cmdex::perm_rx, cmdex::perm_rx, eight),
                  cmdex::permission_encoding_error);
}

TEST_CASE("perm_mode digits compose from read, write and execute bits") {
  CHECK(cmdex::perm_rwx == (cmdex::perm_r | cmdex::perm_w | cmdex::perm_x));
  CHECK(cmdex::perm_rw == (cmdex::perm_r | cmdex::perm_w));
  CHECK(cmdex::perm_rx == (cmdex::perm_r | cmdex::perm_x));
  CHECK(cmdex::perm_wx == (cmdex::perm_w | cmdex::perm_x));
}

TEST_CASE("perm_to_fs reads merged digits as octal") {
  CHECK(cmdex::perm_to_fs(755) == (fs::perms::owner_all | fs::perms::group_read |
                                   fs::perms::group_exec | fs::perms::others_read |
                                   fs::perms::others_exec));
  CHECK(cmdex::perm_to_fs(600) == (fs::perms::owner_read | fs::perms::owner_write));
  CHECK(cmdex::perm_to_fs(0) == fs::perms::none);
  CHECK(cmdex::perm_to_fs(777) == fs::perms::all);
}

TEST_CASE("perm_to_fs rejects values that are not three octal digits") {
  CHECK_THROWS_AS(cmdex::perm_to_fs(758), cmdex::permission_encoding_error);
  CHECK_THROWS_AS(cmdex::perm_to_fs(1755), cmdex::permission_encoding_error);
}
