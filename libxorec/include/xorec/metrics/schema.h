#pragma once
#include <string>
#include <vector>

namespace xorec::metrics {

    // Bump when columns/semantics change.
    inline constexpr int schema_version = 2;

    // Event columns shared by both tools (after the implicit schema_version,run_uuid prefix).
    inline std::vector<std::string> standard_columns() {
        return { "ts_ms","app","event","part","fragments","bytes" };
    }

} // namespace xorec::metrics
