#include "chatvault/core/result.hpp"

namespace chatvault::core {

const char* to_string(VaultError error) {
    switch (error) {
        case VaultError::SUCCESS: return "Success";
        case VaultError::NOT_CONNECTED: return "NotConnected";
        case VaultError::NOT_AUTHENTICATED: return "NotAuthenticated";
        case VaultError::NO_CHANNEL_CONFIGURED: return "NoChannelConfigured";
        case VaultError::FILE_NOT_FOUND: return "FileNotFound";
        case VaultError::AMBIGUOUS_MATCH: return "AmbiguousMatch";
        case VaultError::CHUNK_CORRUPTION: return "ChunkCorruption";
        case VaultError::FILE_CORRUPTION: return "FileCorruption";
        case VaultError::MISSING_PASSWORD: return "MissingPassword";
        case VaultError::DECRYPTION_FAILURE: return "DecryptionFailure";
        case VaultError::RATE_LIMITED: return "RateLimited";
        case VaultError::INVALID_CONFIGURATION: return "InvalidConfiguration";
        case VaultError::IO_ERROR: return "IoError";
        case VaultError::REMOTE_ERROR: return "RemoteError";
        case VaultError::INVALID_RECORD: return "InvalidRecord";
        case VaultError::CANCELLED: return "Cancelled";
        case VaultError::RETRIES_EXHAUSTED: return "RetriesExhausted";
    }
    return "Unknown";
}

std::string VaultResult::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}
