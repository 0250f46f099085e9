#pragma once

/*
 * depfetch Integrity - streaming digest and gzip payload verification
 *
 * A cached artifact is a gzip stream whose *decompressed* content is addressed
 * by its hash. Verification inflates the stream incrementally and feeds each
 * decompressed block into a running digest; the payload is never held in
 * memory as a whole.
 */

#include <depfetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace depfetch::integrity {

/**
 * Hash algorithms supported for content addressing.
 */
enum class HashAlgo { Sha1, Sha256 };

[[nodiscard]] constexpr std::string_view hashAlgoName(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Sha1:
            return "sha1";
        case HashAlgo::Sha256:
            return "sha256";
    }
    return "sha1";
}

/**
 * Parse "sha1" / "sha256" (case-insensitive, "sha-1" accepted).
 */
std::optional<HashAlgo> parseHashAlgo(std::string_view name);

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha1};
    std::string hex; // lower-case hex
};

/**
 * Case-insensitive comparison of two hex digests.
 */
[[nodiscard]] bool digestEquals(std::string_view lhs, std::string_view rhs) noexcept;

/**
 * Streaming hash calculator.
 */
class IDigest {
public:
    virtual ~IDigest() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * OpenSSL EVP backed digest.
 */
std::unique_ptr<IDigest> makeOpenSslDigest(HashAlgo algo = HashAlgo::Sha1);

/**
 * Verification phases reported to a progress observer.
 */
enum class VerifyPhase { Decompression, Hashing };

/**
 * Progress side channel. Fractions are in [0, 1] and non-decreasing per phase.
 */
using PhaseProgress = std::function<void(VerifyPhase, double)>;

/**
 * Successful verification result.
 */
struct VerifyOutcome {
    std::string digest;                  // lower-case hex of the decompressed payload
    std::uint64_t compressedBytes{0};    // bytes read from disk
    std::uint64_t decompressedBytes{0};  // bytes fed into the digest
};

/**
 * Verifier interface.
 *
 * verify() returns the digest of the decompressed payload, or
 *  - ErrorCode::DecompressionFailure for a truncated or malformed stream,
 *  - ErrorCode::IoError when the file cannot be read.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;

    virtual Result<VerifyOutcome> verify(const std::filesystem::path& path,
                                         const PhaseProgress& onProgress = {}) = 0;

    [[nodiscard]] virtual HashAlgo algorithm() const noexcept = 0;
};

/**
 * zlib gzip inflater feeding an OpenSSL digest. Accepts multi-member streams and
 * trailing zero padding the way gzip(1) does.
 */
std::unique_ptr<IIntegrityVerifier>
makeGzipStreamVerifier(HashAlgo algo = HashAlgo::Sha1,
                       std::size_t bufferSize = DEFAULT_BUFFER_SIZE);

} // namespace depfetch::integrity
