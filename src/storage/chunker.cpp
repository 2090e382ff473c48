#include "chatvault/storage/chunker.hpp"
#include "chatvault/crypto/hash.hpp"
#include "chatvault/core/logger.hpp"
#include <iomanip>
#include <sstream>

namespace chatvault::storage {

using core::VaultError;
using core::VaultResult;

Chunk::Chunk(uint32_t chunk_index, std::vector<uint8_t> bytes)
    : index(chunk_index)
    , data(std::move(bytes))
    , hash(crypto::hash_utils::digest_hex(data))
    , size(data.size()) {
}

std::string Chunk::filename() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << index << ".chunk";
    return oss.str();
}

uint64_t count_chunks(uint64_t file_size, uint64_t chunk_size) {
    if (file_size == 0 || chunk_size == 0) {
        return 0;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

VaultResult validate_chunk_size(uint64_t chunk_size) {
    if (chunk_size == 0) {
        return VaultResult(VaultError::INVALID_CONFIGURATION, "Chunk size must be positive");
    }
    if (chunk_size > MAX_CHUNK_SIZE) {
        return VaultResult(VaultError::INVALID_CONFIGURATION,
                           "Chunk size " + std::to_string(chunk_size) + " exceeds max " +
                           std::to_string(MAX_CHUNK_SIZE));
    }
    return VaultResult();
}

ChunkSplitter::ChunkSplitter(const std::filesystem::path& file_path, uint64_t chunk_size)
    : file_path_(file_path)
    , chunk_size_(chunk_size)
    , next_index_(0)
    , finished_(false) {
}

VaultResult ChunkSplitter::open() {
    status_ = validate_chunk_size(chunk_size_);
    if (!status_) {
        finished_ = true;
        return status_;
    }

    file_.open(file_path_, std::ios::binary);
    if (!file_.is_open()) {
        finished_ = true;
        status_ = VaultResult(VaultError::IO_ERROR, "Cannot open file: " + file_path_.string());
        return status_;
    }

    return status_;
}

std::optional<Chunk> ChunkSplitter::next() {
    if (finished_ || !file_.is_open()) {
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(chunk_size_);
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size_));
    auto bytes_read = static_cast<size_t>(file_.gcount());

    if (file_.bad()) {
        finished_ = true;
        status_ = VaultResult(VaultError::IO_ERROR,
                              "Read error in " + file_path_.string() + " at chunk " +
                              std::to_string(next_index_));
        return std::nullopt;
    }

    if (bytes_read == 0) {
        finished_ = true;
        file_.close();
        return std::nullopt;
    }

    buffer.resize(bytes_read);
    if (!file_) {
        // Short read at end of file; nothing follows this chunk.
        finished_ = true;
    }

    return Chunk(next_index_++, std::move(buffer));
}

VaultResult read_chunk(const std::filesystem::path& file_path,
                       uint32_t index,
                       uint64_t chunk_size,
                       Chunk& out_chunk) {
    auto result = validate_chunk_size(chunk_size);
    if (!result) {
        return result;
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return VaultResult(VaultError::IO_ERROR, "Cannot open file: " + file_path.string());
    }

    file.seekg(static_cast<std::streamoff>(index * chunk_size));
    std::vector<uint8_t> buffer(chunk_size);
    if (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size));
    }
    auto bytes_read = static_cast<size_t>(file.gcount());

    if (bytes_read == 0) {
        return VaultResult(VaultError::FILE_NOT_FOUND,
                           "Chunk " + std::to_string(index) + " is empty or out of range");
    }

    buffer.resize(bytes_read);
    out_chunk = Chunk(index, std::move(buffer));
    return VaultResult();
}

ChunkWriter::ChunkWriter(const std::filesystem::path& output_path,
                         uint64_t total_size,
                         uint64_t chunk_size)
    : output_path_(output_path)
    , total_size_(total_size)
    , chunk_size_(chunk_size) {
}

ChunkWriter::~ChunkWriter() {
    if (file_.is_open()) {
        file_.close();
    }
}

VaultResult ChunkWriter::open() {
    auto result = validate_chunk_size(chunk_size_);
    if (!result) {
        return result;
    }

    std::error_code ec;
    if (output_path_.has_parent_path()) {
        std::filesystem::create_directories(output_path_.parent_path(), ec);
        if (ec) {
            return VaultResult(VaultError::IO_ERROR,
                               "Cannot create directory " + output_path_.parent_path().string() +
                               ": " + ec.message());
        }
    }

    {
        std::ofstream create(output_path_, std::ios::binary | std::ios::trunc);
        if (!create.is_open()) {
            return VaultResult(VaultError::IO_ERROR, "Cannot create file: " + output_path_.string());
        }
    }

    // Sparse pre-allocation to the declared size.
    std::filesystem::resize_file(output_path_, total_size_, ec);
    if (ec) {
        return VaultResult(VaultError::IO_ERROR,
                           "Cannot size " + output_path_.string() + ": " + ec.message());
    }

    file_.open(output_path_, std::ios::binary | std::ios::in | std::ios::out);
    if (!file_.is_open()) {
        return VaultResult(VaultError::IO_ERROR, "Cannot open file for writing: " + output_path_.string());
    }

    written_chunks_.clear();
    return VaultResult();
}

VaultResult ChunkWriter::write_chunk(const Chunk& chunk) {
    if (written_chunks_.count(chunk.index)) {
        return VaultResult();
    }

    uint64_t offset = static_cast<uint64_t>(chunk.index) * chunk_size_;
    if (offset + chunk.data.size() > total_size_) {
        return VaultResult(VaultError::IO_ERROR,
                           "Chunk " + std::to_string(chunk.index) + " overruns declared size " +
                           std::to_string(total_size_));
    }

    if (!file_.is_open()) {
        file_.open(output_path_, std::ios::binary | std::ios::in | std::ios::out);
        if (!file_.is_open()) {
            return VaultResult(VaultError::IO_ERROR, "Cannot reopen file: " + output_path_.string());
        }
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(chunk.data.data()),
                static_cast<std::streamsize>(chunk.data.size()));
    if (!file_.good()) {
        return VaultResult(VaultError::IO_ERROR,
                           "Failed to write chunk " + std::to_string(chunk.index) + " to " +
                           output_path_.string());
    }

    written_chunks_.insert(chunk.index);
    return VaultResult();
}

bool ChunkWriter::is_complete(uint32_t expected_chunks) const {
    return written_chunks_.size() == expected_chunks;
}

std::vector<uint32_t> ChunkWriter::missing_chunks(uint32_t expected_chunks) const {
    std::vector<uint32_t> missing;
    for (uint32_t i = 0; i < expected_chunks; ++i) {
        if (!written_chunks_.count(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

VaultResult ChunkWriter::close() {
    if (!file_.is_open()) {
        return VaultResult();
    }

    file_.flush();
    bool ok = file_.good();
    file_.close();

    if (!ok) {
        return VaultResult(VaultError::IO_ERROR, "Failed to flush " + output_path_.string());
    }
    return VaultResult();
}

ChunkBuffer::ChunkBuffer(uint64_t chunk_size)
    : chunk_size_(chunk_size)
    , index_(0) {
}

std::vector<Chunk> ChunkBuffer::write(const std::vector<uint8_t>& data) {
    std::vector<Chunk> chunks;
    buffer_.insert(buffer_.end(), data.begin(), data.end());

    size_t consumed = 0;
    while (buffer_.size() - consumed >= chunk_size_) {
        std::vector<uint8_t> chunk_data(buffer_.begin() + consumed,
                                        buffer_.begin() + consumed + chunk_size_);
        chunks.emplace_back(index_++, std::move(chunk_data));
        consumed += chunk_size_;
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + consumed);
    return chunks;
}

std::optional<Chunk> ChunkBuffer::flush() {
    if (buffer_.empty()) {
        return std::nullopt;
    }

    Chunk chunk(index_++, std::move(buffer_));
    buffer_.clear();
    return chunk;
}

}
