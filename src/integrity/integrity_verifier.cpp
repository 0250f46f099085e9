/*
 * depfetch/src/integrity/integrity_verifier.cpp
 *
 * OpenSSL EVP digest plus a zlib gzip inflater that hashes decompressed output
 * block by block.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 * - ZLIB::ZLIB
 */

#include <depfetch/integrity/integrity_verifier.h>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <system_error>
#include <vector>

namespace depfetch::integrity {

namespace {

// RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

// RAII wrapper for an inflate stream
struct InflateStream {
    z_stream zs{};
    bool initialized{false};

    InflateStream() {
        // 16 + MAX_WBITS: expect a gzip header and trailer
        initialized = inflateInit2(&zs, 16 + MAX_WBITS) == Z_OK;
    }
    ~InflateStream() {
        if (initialized)
            inflateEnd(&zs);
    }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Sha256:
            return EVP_sha256();
    }
    return EVP_sha1();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslDigest final : public IDigest {
public:
    explicit OpenSslDigest(HashAlgo algo) { reset(algo); }
    ~OpenSslDigest() override = default;

    void reset(HashAlgo algo) override {
        algo_ = algo;
        md_ = resolve_algo(algo_);
        ctx_ = EvpMdCtx{};
        finalized_ = false;
        if (!ctx_ || !md_) {
            spdlog::error("OpenSSL digest context allocation failed");
            return;
        }
        if (EVP_DigestInit_ex(ctx_.ctx, md_, nullptr) != 1) {
            spdlog::error("EVP_DigestInit_ex failed for {}", hashAlgoName(algo_));
            ctx_ = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!ctx_ || finalized_ || data.empty())
            return;
        (void)EVP_DigestUpdate(ctx_.ctx, data.data(), data.size());
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = algo_;

        if (!ctx_ || finalized_) {
            return out;
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        finalized_ = true;
        if (EVP_DigestFinal_ex(ctx_.ctx, md_buf.data(), &md_len) != 1) {
            return out;
        }
        out.hex = to_hex_lower(md_buf.data(), md_len);

        reset(algo_);
        return out;
    }

private:
    HashAlgo algo_{HashAlgo::Sha1};
    const EVP_MD* md_{nullptr};
    EvpMdCtx ctx_{};
    bool finalized_{false};
};

class GzipStreamVerifier final : public IIntegrityVerifier {
public:
    GzipStreamVerifier(HashAlgo algo, std::size_t bufferSize)
        : algo_(algo), bufferSize_(std::max<std::size_t>(bufferSize, 512)),
          digest_(makeOpenSslDigest(algo)) {}

    HashAlgo algorithm() const noexcept override { return algo_; }

    Result<VerifyOutcome> verify(const std::filesystem::path& path,
                                 const PhaseProgress& onProgress) override {
        std::error_code ec;
        const auto totalBytes = std::filesystem::file_size(path, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Cannot stat " + path.string() + ": " + ec.message()};
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::IoError, "Cannot open " + path.string()};
        }

        InflateStream stream;
        if (!stream.initialized) {
            return Error{ErrorCode::DecompressionFailure, "inflateInit2 failed"};
        }
        z_stream& zs = stream.zs;

        digest_->reset(algo_);

        std::vector<unsigned char> inBuf(bufferSize_);
        std::vector<unsigned char> outBuf(bufferSize_);

        VerifyOutcome outcome;
        bool memberStarted = false;
        bool memberDone = false;
        double lastFraction = 0.0;

        auto report = [&](double fraction) {
            if (!onProgress || fraction <= lastFraction)
                return;
            lastFraction = fraction;
            onProgress(VerifyPhase::Decompression, fraction);
            onProgress(VerifyPhase::Hashing, fraction);
        };

        while (true) {
            in.read(reinterpret_cast<char*>(inBuf.data()),
                    static_cast<std::streamsize>(inBuf.size()));
            const auto got = in.gcount();
            if (got <= 0) {
                if (in.bad()) {
                    return Error{ErrorCode::IoError, "Read failed on " + path.string()};
                }
                break;
            }
            outcome.compressedBytes += static_cast<std::uint64_t>(got);

            zs.next_in = inBuf.data();
            zs.avail_in = static_cast<uInt>(got);

            for (;;) {
                if (memberDone) {
                    // Between members: zero padding is skipped, anything else starts a new member
                    while (zs.avail_in > 0 && *zs.next_in == 0) {
                        ++zs.next_in;
                        --zs.avail_in;
                    }
                    if (zs.avail_in == 0)
                        break;
                    if (inflateReset(&zs) != Z_OK) {
                        return Error{ErrorCode::DecompressionFailure, "inflateReset failed"};
                    }
                    memberDone = false;
                }

                zs.next_out = outBuf.data();
                zs.avail_out = static_cast<uInt>(outBuf.size());
                int rc = inflate(&zs, Z_NO_FLUSH);
                memberStarted = true;

                const std::size_t have = outBuf.size() - zs.avail_out;
                if (have > 0) {
                    digest_->update(
                        std::span<const std::byte>{reinterpret_cast<const std::byte*>(outBuf.data()),
                                                   have});
                    outcome.decompressedBytes += have;
                }

                if (rc == Z_STREAM_END) {
                    memberDone = true;
                    if (zs.avail_in == 0)
                        break;
                    continue;
                }
                if (rc == Z_BUF_ERROR) {
                    break; // needs more input
                }
                if (rc != Z_OK) {
                    return Error{ErrorCode::DecompressionFailure,
                                 fmt::format("Invalid gzip stream in {}: {}", path.string(),
                                             zs.msg ? zs.msg : "inflate error")};
                }
                if (zs.avail_in == 0 && zs.avail_out != 0)
                    break;
            }

            if (totalBytes > 0) {
                report(static_cast<double>(outcome.compressedBytes) /
                       static_cast<double>(totalBytes));
            }
        }

        if (!memberStarted || !memberDone) {
            return Error{ErrorCode::DecompressionFailure,
                         "Truncated gzip stream in " + path.string()};
        }

        report(1.0);
        outcome.digest = digest_->finalize().hex;
        return outcome;
    }

private:
    HashAlgo algo_;
    std::size_t bufferSize_;
    std::unique_ptr<IDigest> digest_;
};

} // namespace

std::optional<HashAlgo> parseHashAlgo(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (unsigned char c : name) {
        if (c != '-')
            lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lowered == "sha1")
        return HashAlgo::Sha1;
    if (lowered == "sha256")
        return HashAlgo::Sha256;
    return std::nullopt;
}

bool digestEquals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size())
        return false;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

std::unique_ptr<IDigest> makeOpenSslDigest(HashAlgo algo) {
    return std::make_unique<OpenSslDigest>(algo);
}

std::unique_ptr<IIntegrityVerifier> makeGzipStreamVerifier(HashAlgo algo, std::size_t bufferSize) {
    return std::make_unique<GzipStreamVerifier>(algo, bufferSize);
}

} // namespace depfetch::integrity
