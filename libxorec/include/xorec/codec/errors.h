#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace xorec::codec {

    // Failure kinds surfaced by the codec. Each one calls for a different
    // reaction from the caller:
    //   invalid_parameter      - fix the input (k <= 0, empty data, bad lengths)
    //   insufficient_fragments - supply more fragments for the part
    //   unrecoverable_part     - supply a different subset (>= 2 data missing,
    //                            or 1 missing with no parity)
    //   integrity_error        - a fragment or the result is corrupted
    enum class codec_errc : int {
        invalid_parameter = 1,
        insufficient_fragments,
        unrecoverable_part,
        integrity_error,
    };

    const std::error_category& codec_category() noexcept;

    inline std::error_code make_error_code(codec_errc e) noexcept {
        return { static_cast<int>(e), codec_category() };
    }

} // namespace xorec::codec

namespace std {
    template <>
    struct is_error_code_enum<xorec::codec::codec_errc> : true_type {};
} // namespace std
