#include "chatvault/storage/compression.hpp"
#include "chatvault/core/utils.hpp"
#include <zlib.h>
#include <array>
#include <unordered_set>

namespace chatvault::storage {

using core::VaultError;
using core::VaultResult;

namespace {
    constexpr size_t BUFFER_SIZE = 64 * 1024;

    const std::unordered_set<std::string> INCOMPRESSIBLE_EXTENSIONS = {
        // images
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".heic", ".heif", ".avif",
        // video
        ".mp4", ".mkv", ".avi", ".mov", ".webm", ".m4v", ".wmv", ".flv",
        // audio
        ".mp3", ".aac", ".ogg", ".opus", ".flac", ".m4a", ".wma",
        // archives
        ".zip", ".gz", ".bz2", ".xz", ".7z", ".rar", ".zst", ".lz4", ".lzma",
        // documents
        ".pdf", ".docx", ".xlsx", ".pptx", ".odt",
        // other
        ".woff", ".woff2", ".br"
    };

    const std::unordered_set<std::string> TEXT_EXTENSIONS = {
        ".txt", ".log", ".csv", ".json", ".xml", ".html", ".md"
    };

    const std::unordered_set<std::string> SOURCE_EXTENSIONS = {
        ".sql", ".py", ".js", ".ts", ".go", ".rs", ".c", ".cpp", ".h"
    };

    const std::unordered_set<std::string> CONTAINER_EXTENSIONS = {
        ".tar", ".iso", ".img"
    };

    // zlib rejects a null next_in only when avail_in is non-zero, but some
    // builds assert on it regardless.
    Bytef* input_ptr(std::span<const uint8_t> data) {
        static Bytef empty = 0;
        return data.empty() ? &empty : const_cast<Bytef*>(data.data());
    }

    std::string zlib_message(const z_stream& stream, int code) {
        if (stream.msg) {
            return stream.msg;
        }
        return "zlib error " + std::to_string(code);
    }
}

bool should_compress(const std::string& filename) {
    auto extension = core::utils::FileUtils::get_file_extension(filename);
    return INCOMPRESSIBLE_EXTENSIONS.count(extension) == 0;
}

VaultResult compress(std::span<const uint8_t> data, std::vector<uint8_t>& out, int level) {
    if (level < Z_BEST_SPEED || level > Z_BEST_COMPRESSION) {
        return VaultResult(VaultError::INVALID_CONFIGURATION,
                           "Compression level must be 1..9, got " + std::to_string(level));
    }

    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> buffer(bound);

    int rc = compress2(buffer.data(), &bound, input_ptr(data), static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        return VaultResult(VaultError::IO_ERROR, "zlib compress failed with code " + std::to_string(rc));
    }

    buffer.resize(bound);
    out = std::move(buffer);
    return VaultResult();
}

VaultResult decompress(std::span<const uint8_t> data, std::vector<uint8_t>& out) {
    out.clear();
    if (data.empty()) {
        return VaultResult();
    }

    z_stream stream{};
    int rc = inflateInit(&stream);
    if (rc != Z_OK) {
        return VaultResult(VaultError::IO_ERROR, "inflateInit failed: " + zlib_message(stream, rc));
    }

    stream.next_in = input_ptr(data);
    stream.avail_in = static_cast<uInt>(data.size());

    std::array<uint8_t, BUFFER_SIZE> buffer;
    std::vector<uint8_t> result;

    do {
        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());

        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string message = zlib_message(stream, rc);
            inflateEnd(&stream);
            return VaultResult(VaultError::CHUNK_CORRUPTION, "Corrupt compressed data: " + message);
        }

        result.insert(result.end(), buffer.data(), buffer.data() + (buffer.size() - stream.avail_out));

        if (rc != Z_STREAM_END && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            return VaultResult(VaultError::CHUNK_CORRUPTION, "Truncated compressed data");
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    out = std::move(result);
    return VaultResult();
}

uint64_t estimate_compressed_size(uint64_t size, const std::string& filename) {
    if (!should_compress(filename)) {
        return size;
    }

    auto extension = core::utils::FileUtils::get_file_extension(filename);
    double ratio = 0.5;
    if (TEXT_EXTENSIONS.count(extension)) {
        ratio = 0.2;
    } else if (SOURCE_EXTENSIONS.count(extension)) {
        ratio = 0.25;
    } else if (CONTAINER_EXTENSIONS.count(extension)) {
        ratio = 0.6;
    }

    return static_cast<uint64_t>(static_cast<double>(size) * ratio);
}

struct StreamingCompressor::Impl {
    z_stream stream{};
    int init_result = Z_OK;
};

StreamingCompressor::StreamingCompressor(int level)
    : impl_(std::make_unique<Impl>())
    , total_in_(0)
    , total_out_(0)
    , finished_(false) {
    impl_->init_result = deflateInit(&impl_->stream, level);
}

StreamingCompressor::~StreamingCompressor() {
    if (impl_->init_result == Z_OK) {
        deflateEnd(&impl_->stream);
    }
}

VaultResult StreamingCompressor::compress(std::span<const uint8_t> data, std::vector<uint8_t>& out) {
    if (impl_->init_result != Z_OK) {
        return VaultResult(VaultError::INVALID_CONFIGURATION, "Compressor failed to initialize");
    }
    if (finished_) {
        return VaultResult(VaultError::IO_ERROR, "Compressor already flushed");
    }

    auto& stream = impl_->stream;
    stream.next_in = input_ptr(data);
    stream.avail_in = static_cast<uInt>(data.size());

    std::array<uint8_t, BUFFER_SIZE> buffer;
    size_t produced = 0;

    do {
        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());

        int rc = deflate(&stream, Z_NO_FLUSH);
        if (rc == Z_STREAM_ERROR) {
            return VaultResult(VaultError::IO_ERROR, "deflate failed: " + zlib_message(stream, rc));
        }

        size_t have = buffer.size() - stream.avail_out;
        out.insert(out.end(), buffer.data(), buffer.data() + have);
        produced += have;
    } while (stream.avail_out == 0);

    total_in_ += data.size();
    total_out_ += produced;
    return VaultResult();
}

VaultResult StreamingCompressor::flush(std::vector<uint8_t>& out) {
    if (impl_->init_result != Z_OK) {
        return VaultResult(VaultError::INVALID_CONFIGURATION, "Compressor failed to initialize");
    }
    if (finished_) {
        return VaultResult();
    }

    auto& stream = impl_->stream;
    stream.next_in = input_ptr({});
    stream.avail_in = 0;

    std::array<uint8_t, BUFFER_SIZE> buffer;
    int rc = Z_OK;

    do {
        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());

        rc = deflate(&stream, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            return VaultResult(VaultError::IO_ERROR, "deflate finish failed: " + zlib_message(stream, rc));
        }

        size_t have = buffer.size() - stream.avail_out;
        out.insert(out.end(), buffer.data(), buffer.data() + have);
        total_out_ += have;
    } while (rc != Z_STREAM_END);

    finished_ = true;
    return VaultResult();
}

double StreamingCompressor::ratio() const {
    if (total_in_ == 0) {
        return 1.0;
    }
    return static_cast<double>(total_out_) / static_cast<double>(total_in_);
}

struct StreamingDecompressor::Impl {
    z_stream stream{};
    int init_result = Z_OK;
};

StreamingDecompressor::StreamingDecompressor()
    : impl_(std::make_unique<Impl>())
    , total_in_(0)
    , total_out_(0)
    , finished_(false) {
    impl_->init_result = inflateInit(&impl_->stream);
}

StreamingDecompressor::~StreamingDecompressor() {
    if (impl_->init_result == Z_OK) {
        inflateEnd(&impl_->stream);
    }
}

VaultResult StreamingDecompressor::decompress(std::span<const uint8_t> data, std::vector<uint8_t>& out) {
    if (impl_->init_result != Z_OK) {
        return VaultResult(VaultError::IO_ERROR, "Decompressor failed to initialize");
    }
    if (finished_ || data.empty()) {
        return VaultResult();
    }

    auto& stream = impl_->stream;
    stream.next_in = input_ptr(data);
    stream.avail_in = static_cast<uInt>(data.size());

    std::array<uint8_t, BUFFER_SIZE> buffer;

    // A full output buffer may leave inflated bytes pending inside zlib.
    while ((stream.avail_in > 0 || stream.avail_out == 0) && !finished_) {
        stream.next_out = buffer.data();
        stream.avail_out = static_cast<uInt>(buffer.size());

        int rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            return VaultResult(VaultError::CHUNK_CORRUPTION, "Corrupt compressed stream: " + zlib_message(stream, rc));
        }

        size_t have = buffer.size() - stream.avail_out;
        out.insert(out.end(), buffer.data(), buffer.data() + have);
        total_out_ += have;

        if (rc == Z_STREAM_END) {
            finished_ = true;
        } else if (rc == Z_BUF_ERROR && have == 0) {
            break;
        }
    }

    total_in_ += data.size() - stream.avail_in;
    return VaultResult();
}

}
