#include <xorec/storage/file_io.h>
#include <fstream>

namespace xorec::storage {

    std::error_code read_file(const std::string& filepath, std::vector<std::byte>& out)
    {
        std::ifstream is(filepath, std::ios::binary | std::ios::ate);
        if (!is) return std::make_error_code(std::errc::no_such_file_or_directory);

        const auto end = is.tellg();
        if (end < 0) return std::make_error_code(std::errc::io_error);
        std::vector<std::byte> buf(static_cast<std::size_t>(end));
        is.seekg(0);
        if (!buf.empty()) {
            is.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        }
        if (!is) return std::make_error_code(std::errc::io_error);

        out = std::move(buf);
        return {};
    }

    std::error_code write_file(const std::string& filepath, std::span<const std::byte> data)
    {
        std::ofstream os(filepath, std::ios::binary | std::ios::trunc);
        if (!os) return std::make_error_code(std::errc::io_error);
        os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!os) return std::make_error_code(std::errc::io_error);
        return {};
    }

} // namespace xorec::storage
