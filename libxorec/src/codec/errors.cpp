#include <xorec/codec/errors.h>

namespace xorec::codec {

    namespace {

        class CodecCategory final : public std::error_category {
        public:
            const char* name() const noexcept override { return "xorec.codec"; }

            std::string message(int ev) const override
            {
                switch (static_cast<codec_errc>(ev)) {
                case codec_errc::invalid_parameter:
                    return "invalid parameter";
                case codec_errc::insufficient_fragments:
                    return "fewer than k fragments supplied for part";
                case codec_errc::unrecoverable_part:
                    return "fragment subset cannot be reconstructed with XOR parity";
                case codec_errc::integrity_error:
                    return "hash mismatch (fragment or reconstructed data corrupted)";
                }
                return "unknown codec error";
            }
        };

    } // namespace

    const std::error_category& codec_category() noexcept
    {
        static const CodecCategory instance;
        return instance;
    }

} // namespace xorec::codec
