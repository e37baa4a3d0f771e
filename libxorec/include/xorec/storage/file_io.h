#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace xorec::storage {

    // Whole-file read/write for the tools (the codec itself never touches disk).
    std::error_code read_file(const std::string& filepath, std::vector<std::byte>& out);
    std::error_code write_file(const std::string& filepath, std::span<const std::byte> data);

} // namespace xorec::storage
