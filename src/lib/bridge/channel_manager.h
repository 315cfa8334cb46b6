#pragma once

#include "bridge_handler.h"

#include <mutex>
#include <string>
#include <vector>

std::string ChannelId(EntityUid const& uid);

// Channels of the bridge in insertion order. Adding an existing id replaces it.
class ChannelManager {
public:
    std::vector<Channel> AddSingleChannel(Channel channel);
    std::vector<Channel> RemoveSingleChannel(std::string const& id);
    std::vector<Channel> GetChannels() const;

private:
    mutable std::mutex mutex_;
    std::vector<Channel> channels_;
};
