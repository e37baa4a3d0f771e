#include <xorec/util/sha256.h>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

namespace xorec::util {

    namespace {

        struct EvpMdCtxDeleter {
            void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
        };
        using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

    } // namespace

    Digest256 sha256(std::span<const std::byte> data)
    {
        EvpMdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx) {
            throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
        }
        if (1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
            throw std::runtime_error("sha256: EVP_DigestInit_ex failed");
        }
        // EVP_DigestUpdate accepts a zero length update, so empty input is fine.
        if (1 != EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
            throw std::runtime_error("sha256: EVP_DigestUpdate failed");
        }

        Digest256 out{};
        unsigned int len = 0;
        if (1 != EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &len)
            || len != out.size()) {
            throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
        }
        return out;
    }

    Digest256 sha256(std::string_view s)
    {
        const auto* ptr = reinterpret_cast<const std::byte*>(s.data());
        return sha256(std::span<const std::byte>(ptr, s.size()));
    }

    std::string to_hex(std::span<const std::byte> data)
    {
        static constexpr char kDigits[] = "0123456789abcdef";
        std::string out;
        out.reserve(data.size() * 2);
        for (std::byte b : data) {
            const auto v = std::to_integer<unsigned char>(b);
            out.push_back(kDigits[v >> 4]);
            out.push_back(kDigits[v & 0x0F]);
        }
        return out;
    }

} // namespace xorec::util
