#include "selfupdate/crypto/sha256.hpp"

#include "selfupdate/util/path_utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <vector>

namespace selfupdate {

namespace {

using Digest = std::array<std::uint8_t, 32>;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {
        ready_ = ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) == 1;
    }
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    bool ready() const { return ready_; }

    bool Update(std::span<const std::uint8_t> data) {
        if (!ready_) return false;
        if (data.empty()) return true;
        return EVP_DigestUpdate(ctx_, data.data(), data.size()) == 1;
    }

    std::string FinalHex() {
        if (!ready_) return {};
        ready_ = false;
        Digest digest{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, digest.data(), &len) != 1 || len != digest.size()) return {};
        return HexEncode(digest);
    }

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool ready_ = false;
};

} // namespace

struct Sha256Hasher::Impl {
    EvpCtx ctx;
    bool failed = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->failed) return;
    if (!impl_->ctx.Update(data)) impl_->failed = true;
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || impl_->failed) return {};
    return impl_->ctx.FinalHex();
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    EvpCtx ctx;
    if (!ctx.Update(data)) return {};
    return ctx.FinalHex();
}

std::string Sha256Hex(IReader& reader) {
    EvpCtx ctx;
    if (!ctx.ready()) return {};

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!ctx.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }
    return ctx.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) return Result::Fail(-1, "sha256 failed for " + path);
    return Result::Ok();
}

std::string NormalizeSha256(std::string_view digest) {
    std::string out = ToLower(digest);
    if (StartsWith(out, "sha256:")) out.erase(0, 7);
    return out;
}

} // namespace selfupdate
