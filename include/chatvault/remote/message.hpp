#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatvault::remote {

using MessageRef = std::int64_t;
using ChannelId = std::int64_t;

// A message as seen through list_messages(); blob payloads are not loaded.
struct StoredMessage {
    MessageRef ref = 0;
    std::optional<std::string> text;
    bool is_blob = false;
    bool pinned = false;
    std::optional<MessageRef> reply_to;
    std::string filename;
    uint64_t blob_size = 0;
};

struct MessageFilter {
    std::optional<MessageRef> reply_to;
    bool pinned_only = false;
    // 0 means no limit.
    size_t limit = 0;

    static MessageFilter latest(size_t count) {
        MessageFilter filter;
        filter.limit = count;
        return filter;
    }

    static MessageFilter pinned() {
        MessageFilter filter;
        filter.pinned_only = true;
        return filter;
    }

    static MessageFilter replies_to(MessageRef ref) {
        MessageFilter filter;
        filter.reply_to = ref;
        return filter;
    }
};

}
