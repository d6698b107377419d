/*
 * convey/src/downloader/integrity_verifier.cpp
 *
 * Streaming SHA-256 via OpenSSL EVP.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and re-arms the context for reuse.
 *
 * One verifier per transfer; instances are not shared between threads.
 */

#include <convey/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace convey::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

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

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    OpenSslIntegrityVerifier() { reset(HashAlgo::Sha256); }
    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _ok = _ctx && EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) == 1;
    }

    void update(std::span<const std::byte> data) override {
        if (!_ok || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1)
            _ok = false;
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;
        if (!_ok)
            return out; // empty hex signals failure

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1) {
            out.hex = to_hex_lower(md_buf.data(), md_len);
        }
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    EvpMdCtx _ctx{};
    bool _ok{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256Only() {
    return std::make_unique<OpenSslIntegrityVerifier>();
}

std::string sha256Hex(std::string_view data) {
    OpenSslIntegrityVerifier verifier;
    verifier.update(std::as_bytes(std::span<const char>(data.data(), data.size())));
    return verifier.finalize().hex;
}

std::optional<std::string> computeFileSha256(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;

    OpenSslIntegrityVerifier verifier;
    std::array<char, 1 << 16> buffer{};
    while (in) {
        in.read(buffer.data(), buffer.size());
        auto read = in.gcount();
        if (read > 0) {
            verifier.update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(read)));
        }
    }
    if (in.bad())
        return std::nullopt;

    auto result = verifier.finalize();
    if (result.hex.empty())
        return std::nullopt;
    return result.hex;
}

} // namespace convey::downloader
