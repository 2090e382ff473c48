#pragma once

#include <chrono>
#include <string>

namespace chatvault::core {

// Error kinds surfaced by the storage engine and the vault facade.
enum class VaultError {
    SUCCESS = 0,
    NOT_CONNECTED,
    NOT_AUTHENTICATED,
    NO_CHANNEL_CONFIGURED,
    FILE_NOT_FOUND,
    AMBIGUOUS_MATCH,
    CHUNK_CORRUPTION,
    FILE_CORRUPTION,
    MISSING_PASSWORD,
    DECRYPTION_FAILURE,
    RATE_LIMITED,
    INVALID_CONFIGURATION,
    IO_ERROR,
    REMOTE_ERROR,
    INVALID_RECORD,
    CANCELLED,
    RETRIES_EXHAUSTED
};

const char* to_string(VaultError error);

struct VaultResult {
    VaultError error;
    std::string message;
    // Mandatory cool-down requested by the remote store; only meaningful for RATE_LIMITED.
    std::chrono::milliseconds retry_after{0};

    VaultResult(VaultError err = VaultError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    static VaultResult rate_limited(std::chrono::milliseconds wait, std::string msg = "") {
        VaultResult result(VaultError::RATE_LIMITED, std::move(msg));
        result.retry_after = wait;
        return result;
    }

    bool success() const { return error == VaultError::SUCCESS; }
    operator bool() const { return success(); }

    std::string describe() const;
};

}
