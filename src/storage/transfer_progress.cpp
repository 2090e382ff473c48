#include "chatvault/storage/transfer_progress.hpp"
#include <nlohmann/json.hpp>

namespace chatvault::storage {

using core::VaultError;
using core::VaultResult;

const char* to_string(TransferOperation operation) {
    switch (operation) {
        case TransferOperation::UPLOAD: return "upload";
        case TransferOperation::DOWNLOAD: return "download";
    }
    return "unknown";
}

std::vector<uint32_t> TransferProgress::pending_chunks() const {
    std::vector<uint32_t> pending;
    for (uint32_t i = 0; i < total_chunks; ++i) {
        if (!completed_chunks.count(i)) {
            pending.push_back(i);
        }
    }
    return pending;
}

double TransferProgress::progress_percent() const {
    if (total_chunks == 0) {
        return 100.0;
    }
    return static_cast<double>(completed_chunks.size()) / total_chunks * 100.0;
}

std::string TransferProgress::to_json() const {
    nlohmann::json j = {
        {"operation", to_string(operation)},
        {"file_id", file_id},
        {"file_name", file_name},
        {"total_chunks", total_chunks},
        {"completed_chunks", completed_chunks},
        {"started_at", started_at}
    };
    return j.dump();
}

VaultResult TransferProgress::from_json(const std::string& text, TransferProgress& out) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return VaultResult(VaultError::INVALID_RECORD, "Transfer progress is not a JSON object");
    }

    try {
        TransferProgress progress;
        auto operation = j.at("operation").get<std::string>();
        if (operation == "upload") {
            progress.operation = TransferOperation::UPLOAD;
        } else if (operation == "download") {
            progress.operation = TransferOperation::DOWNLOAD;
        } else {
            return VaultResult(VaultError::INVALID_RECORD, "Unknown transfer operation: " + operation);
        }

        j.at("file_id").get_to(progress.file_id);
        j.at("file_name").get_to(progress.file_name);
        j.at("total_chunks").get_to(progress.total_chunks);
        j.at("completed_chunks").get_to(progress.completed_chunks);
        j.at("started_at").get_to(progress.started_at);
        out = std::move(progress);
    } catch (const nlohmann::json::exception& e) {
        return VaultResult(VaultError::INVALID_RECORD, std::string("Invalid transfer progress: ") + e.what());
    }

    return VaultResult();
}

}
