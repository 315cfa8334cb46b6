#pragma once

#include <chrono>
#include <compare>
#include <map>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

constexpr const char* kPropName = "name";
constexpr const char* kPropPid = "pid";
constexpr const char* kPropModel = "model";
constexpr const char* kPropHost = "ip";
constexpr const char* kPropMembers = "members";

constexpr char kMemberSeparator = ';';

struct Player {
    std::string pid;
    std::string name;
    std::string model;
    std::string ip;

    friend bool operator==(const Player&, const Player&) = default;
};

struct Group {
    std::string gid;
    std::string name;
    std::vector<std::string> members;

    friend bool operator==(const Group&, const Group&) = default;
};

using PlayerMap = std::map<std::string, Player>;
using GroupMap = std::map<std::string, Group>;

enum class EntityKind { player, group };

struct EntityUid {
    EntityKind kind;
    std::string id;

    std::string ToString() const;

    friend auto operator<=>(const EntityUid&, const EntityUid&) = default;
};

struct DiscoveryResult {
    EntityUid uid;
    std::string label;
    std::map<std::string, std::string> properties;
    std::string bridge_uid;
    Timestamp timestamp;
};

const char* ToString(EntityKind kind);

EntityUid PlayerUid(Player const& player);
EntityUid GroupUid(Group const& group);

// Order independent: members are sorted before hashing, so [A,B,C] and [C,A,B]
// give the same id.
std::string GroupMemberHash(Group const& group);

// Members in reported order, joined with kMemberSeparator.
std::string GroupMembersAsString(Group const& group);
