#pragma once

#include "chatvault/core/result.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace chatvault::storage {

enum class TransferOperation {
    UPLOAD,
    DOWNLOAD
};

const char* to_string(TransferOperation operation);

struct TransferProgress {
    TransferOperation operation = TransferOperation::UPLOAD;
    std::string file_id;
    std::string file_name;
    uint32_t total_chunks = 0;
    std::set<uint32_t> completed_chunks;
    double started_at = 0.0;

    std::vector<uint32_t> pending_chunks() const;

    // 100 when there is nothing to transfer.
    double progress_percent() const;

    void mark_completed(uint32_t index) { completed_chunks.insert(index); }
    bool is_done() const { return pending_chunks().empty(); }

    std::string to_json() const;
    static core::VaultResult from_json(const std::string& text, TransferProgress& out);
};

}
