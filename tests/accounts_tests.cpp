#include "test_support.hpp"

#include <uidinit/accounts.hpp>

using namespace uidinit;

TEST_CASE("root is found by name and by uid") {
  SystemAccountDb db;
  auto by_name = db.by_name("root");
  REQUIRE(by_name.has_value());
  REQUIRE(by_name->uid == 0);

  auto by_uid = db.by_uid(0);
  REQUIRE(by_uid.has_value());
  REQUIRE(by_uid->name == "root");
}

TEST_CASE("unknown account is absent") {
  SystemAccountDb db;
  REQUIRE_FALSE(db.by_name("uidinit-no-such-user").has_value());
}
