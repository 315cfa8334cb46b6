#include "channel_manager.h"

#include <algorithm>

#include <fmt/format.h>

std::string ChannelId(EntityUid const& uid) {
    switch (uid.kind) {
        case EntityKind::player: return fmt::format("P{}", uid.id);
        case EntityKind::group: return fmt::format("G{}", uid.id);
    }
    return uid.id;
}

std::vector<Channel> ChannelManager::AddSingleChannel(Channel channel) {
    std::lock_guard lock{mutex_};
    auto it = std::find_if(channels_.begin(), channels_.end(),
                           [&](Channel const& c) { return c.id == channel.id; });
    if (it != channels_.end()) {
        *it = std::move(channel);
    } else {
        channels_.push_back(std::move(channel));
    }
    return channels_;
}

std::vector<Channel> ChannelManager::RemoveSingleChannel(std::string const& id) {
    std::lock_guard lock{mutex_};
    std::erase_if(channels_, [&](Channel const& c) { return c.id == id; });
    return channels_;
}

std::vector<Channel> ChannelManager::GetChannels() const {
    std::lock_guard lock{mutex_};
    return channels_;
}
