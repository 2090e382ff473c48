#pragma once

#include "chatvault/core/result.hpp"
#include "chatvault/remote/message.hpp"
#include <map>
#include <optional>
#include <string>

namespace chatvault::storage {

constexpr int INDEX_VERSION = 1;

/**
 * The catalog record: file id -> reference of its metadata message.
 *
 * There is exactly one pinned index per channel and it is the only source of
 * truth for which files exist. Writers do a read-modify-write of the whole
 * record, so concurrent writers race and the last one wins.
 */
struct VaultIndex {
    int version = INDEX_VERSION;
    std::map<std::string, remote::MessageRef> files;
    double updated_at = 0.0;

    void add_file(const std::string& file_id, remote::MessageRef metadata_ref);

    // Returns the removed reference; updated_at only changes when an entry went away.
    std::optional<remote::MessageRef> remove_file(const std::string& file_id);

    std::optional<remote::MessageRef> find(const std::string& file_id) const;
    bool contains(const std::string& file_id) const { return files.count(file_id) > 0; }
    size_t size() const { return files.size(); }

    std::string to_json() const;
    static core::VaultResult from_json(const std::string& text, VaultIndex& out);

    // True for a JSON object with a "files" object, the shape used to find the
    // index among pinned messages.
    static bool looks_like_index(const std::string& text);
};

}
