#include <benchmark/benchmark.h>
#include "chatvault/crypto/encryption.hpp"
#include "chatvault/crypto/hash.hpp"
#include "chatvault/crypto/random.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace chatvault::crypto;

class CryptoBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        chunk_.assign(static_cast<size_t>(state.range(0)), 0x42);
        cipher_ = std::make_unique<ChunkCipher>(KdfParams::minimal());
        if (!cipher_->encrypt(chunk_, password_, sealed_)) {
            sealed_.clear();
        }
    }

    void TearDown(const ::benchmark::State&) override {
        cipher_.reset();
        sealed_.clear();
    }

protected:
    std::string password_ = "benchmark password";
    std::vector<uint8_t> chunk_;
    std::vector<uint8_t> sealed_;
    std::unique_ptr<ChunkCipher> cipher_;
};

// Dominated by the key derivation at small sizes.
BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, ChunkEncrypt)(benchmark::State& state) {
    std::vector<uint8_t> out;
    for (auto _ : state) {
        benchmark::DoNotOptimize(cipher_->encrypt(chunk_, password_, out));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, ChunkEncrypt)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, ChunkDecrypt)(benchmark::State& state) {
    std::vector<uint8_t> out;
    for (auto _ : state) {
        benchmark::DoNotOptimize(cipher_->decrypt(sealed_, password_, out));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, ChunkDecrypt)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, StreamingBlocks)(benchmark::State& state) {
    StreamingEncryptor encryptor(password_, KdfParams::minimal());
    if (!encryptor.initialize()) {
        state.SkipWithError("Key derivation failed");
        return;
    }

    std::vector<uint8_t> block;
    for (auto _ : state) {
        block.clear();
        benchmark::DoNotOptimize(encryptor.encrypt_block(chunk_, block));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, StreamingBlocks)->Arg(64 * 1024);

static void KeyDerivation_Minimal(benchmark::State& state) {
    std::string password = "benchmark password";
    Salt salt{};
    salt.fill(0x11);
    for (auto _ : state) {
        SecureBytes key;
        benchmark::DoNotOptimize(KeyDerivation::derive_key(password, salt, KdfParams::minimal(), key));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(KeyDerivation_Minimal);

static void Hash_BLAKE2b(benchmark::State& state) {
    std::vector<uint8_t> data(static_cast<size_t>(state.range(0)), 0x42);
    for (auto _ : state) {
        benchmark::DoNotOptimize(Blake2bHasher::hash(data));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(Hash_BLAKE2b)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

static void Hash_SHA256(benchmark::State& state) {
    std::vector<uint8_t> data(static_cast<size_t>(state.range(0)), 0x42);
    for (auto _ : state) {
        benchmark::DoNotOptimize(hash_utils::sha256(data));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(Hash_SHA256)->Arg(64 * 1024);

static void RandomGeneration_Bytes_32(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(SecureRandom::generate_bytes(32));
    }
    state.SetBytesProcessed(state.iterations() * 32);
}
BENCHMARK(RandomGeneration_Bytes_32);

BENCHMARK_MAIN();
