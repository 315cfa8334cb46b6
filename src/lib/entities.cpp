#include "entities.h"

#include <algorithm>
#include <cstdint>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;

uint64_t Fnv1a(std::string const& key) {
    uint64_t hash = kFnvOffsetBasis;
    for (char c : key) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
        hash *= kFnvPrime;
    }
    return hash;
}

} // namespace

const char* ToString(EntityKind kind) {
    switch (kind) {
        case EntityKind::player: return "player";
        case EntityKind::group: return "group";
    }
    return "unknown";
}

std::string EntityUid::ToString() const {
    return fmt::format("{}:{}", ::ToString(kind), id);
}

EntityUid PlayerUid(Player const& player) {
    return EntityUid{EntityKind::player, player.pid};
}

EntityUid GroupUid(Group const& group) {
    return EntityUid{EntityKind::group, GroupMemberHash(group)};
}

std::string GroupMemberHash(Group const& group) {
    std::vector<std::string> sorted = group.members;
    std::sort(sorted.begin(), sorted.end());
    auto key = fmt::format("{}", fmt::join(sorted, std::string(1, kMemberSeparator)));
    return std::to_string(Fnv1a(key));
}

std::string GroupMembersAsString(Group const& group) {
    return fmt::format("{}", fmt::join(group.members, std::string(1, kMemberSeparator)));
}
