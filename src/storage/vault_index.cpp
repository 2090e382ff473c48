#include "chatvault/storage/vault_index.hpp"
#include "chatvault/core/utils.hpp"
#include <nlohmann/json.hpp>

namespace chatvault::storage {

using core::VaultError;
using core::VaultResult;

void VaultIndex::add_file(const std::string& file_id, remote::MessageRef metadata_ref) {
    files[file_id] = metadata_ref;
    updated_at = core::utils::TimeUtils::to_unix_seconds(core::utils::TimeUtils::now());
}

std::optional<remote::MessageRef> VaultIndex::remove_file(const std::string& file_id) {
    auto it = files.find(file_id);
    if (it == files.end()) {
        return std::nullopt;
    }

    auto ref = it->second;
    files.erase(it);
    updated_at = core::utils::TimeUtils::to_unix_seconds(core::utils::TimeUtils::now());
    return ref;
}

std::optional<remote::MessageRef> VaultIndex::find(const std::string& file_id) const {
    auto it = files.find(file_id);
    if (it == files.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string VaultIndex::to_json() const {
    nlohmann::json j = {
        {"version", version},
        {"files", files},
        {"updated_at", updated_at}
    };
    return j.dump();
}

VaultResult VaultIndex::from_json(const std::string& text, VaultIndex& out) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return VaultResult(VaultError::INVALID_RECORD, "Index is not a JSON object");
    }

    try {
        VaultIndex index;
        index.version = j.value("version", INDEX_VERSION);
        if (index.version > INDEX_VERSION) {
            return VaultResult(VaultError::INVALID_RECORD,
                               "Unsupported index version " + std::to_string(index.version));
        }
        j.at("files").get_to(index.files);
        index.updated_at = j.value("updated_at", 0.0);
        out = std::move(index);
    } catch (const nlohmann::json::exception& e) {
        return VaultResult(VaultError::INVALID_RECORD, std::string("Invalid index: ") + e.what());
    }

    return VaultResult();
}

bool VaultIndex::looks_like_index(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }
    auto it = j.find("files");
    return it != j.end() && it->is_object();
}

}
