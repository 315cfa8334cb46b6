#include "entities.h"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE( "group id is stable under member reordering", "[identity]" ) {
    Group first{"1", "Kitchen", {"A", "B", "C"}};
    Group later{"3", "Kitchen", {"C", "A", "B"}};

    REQUIRE(GroupMemberHash(first) == GroupMemberHash(later));
    REQUIRE(GroupUid(first) == GroupUid(later));
}

TEST_CASE( "group id depends on the member set only", "[identity]" ) {
    Group group{"1", "Stereo Pair", {"1", "2"}};
    Group renamed{"2", "Renamed", {"2", "1"}};
    Group bigger{"1", "Stereo Pair", {"1", "2", "3"}};

    REQUIRE(GroupMemberHash(group) == GroupMemberHash(renamed));
    REQUIRE(GroupMemberHash(group) != GroupMemberHash(bigger));
}

TEST_CASE( "group id is reproducible", "[identity]" ) {
    REQUIRE(GroupMemberHash(Group{"", "", {"2", "1"}}) == "4996668023748044565");
    REQUIRE(GroupMemberHash(Group{"", "", {"B", "C", "A"}}) == "14663585824208555115");
}

TEST_CASE( "player id is the pid", "[identity]" ) {
    Player player{"-1428681282", "Living Room", "HEOS 5", "192.168.1.31"};
    auto uid = PlayerUid(player);

    REQUIRE(uid.kind == EntityKind::player);
    REQUIRE(uid.id == "-1428681282");
    REQUIRE(uid.ToString() == "player:-1428681282");
}

TEST_CASE( "members as string keep reported order", "[identity]" ) {
    Group group{"1", "Stereo Pair", {"2", "1"}};
    REQUIRE(GroupMembersAsString(group) == "2;1");
    REQUIRE(GroupMembersAsString(Group{}) == "");
}

TEST_CASE( "uids order by kind then id", "[identity]" ) {
    EntityUid player{EntityKind::player, "9"};
    EntityUid group{EntityKind::group, "1"};

    REQUIRE(player < group);
    REQUIRE(EntityUid{EntityKind::group, "1"} == group);
    REQUIRE(group.ToString() == "group:1");
}
