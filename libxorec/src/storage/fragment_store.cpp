#include <xorec/storage/fragment_store.h>
#include <fstream>
#include <iterator>

namespace xorec::storage {

    namespace fs = std::filesystem;

    std::error_code FragmentStore::prepare() const
    {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        return ec;
    }

    std::string FragmentStore::blob_name(std::uint32_t part_index, std::uint32_t fragment_index)
    {
        return "part_" + std::to_string(part_index) + "_frag_" + std::to_string(fragment_index) + ".bin";
    }

    fs::path FragmentStore::path_for(std::uint32_t part_index, std::uint32_t fragment_index) const
    {
        return dir_ / blob_name(part_index, fragment_index);
    }

    std::error_code FragmentStore::put(const codec::Fragment& f) const
    {
        std::ofstream os(path_for(f.part_index, f.fragment_index), std::ios::binary | std::ios::trunc);
        if (!os) return std::make_error_code(std::errc::io_error);
        os.write(reinterpret_cast<const char*>(f.bytes.data()), static_cast<std::streamsize>(f.bytes.size()));
        if (!os) return std::make_error_code(std::errc::io_error);
        return {};
    }

    std::error_code FragmentStore::put_all(const std::vector<std::vector<codec::Fragment>>& parts) const
    {
        for (const auto& part : parts) {
            for (const auto& f : part) {
                if (auto ec = put(f); ec) return ec;
            }
        }
        return {};
    }

    std::error_code FragmentStore::get(std::uint32_t part_index, std::uint32_t fragment_index, codec::Fragment& out) const
    {
        const auto p = path_for(part_index, fragment_index);
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            return ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory);
        }

        std::ifstream is(p, std::ios::binary);
        if (!is) return std::make_error_code(std::errc::io_error);
        const std::vector<char> raw{ std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>() };
        if (is.bad()) return std::make_error_code(std::errc::io_error);

        codec::Fragment f;
        f.part_index = part_index;
        f.fragment_index = fragment_index;
        f.bytes.resize(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            f.bytes[i] = static_cast<std::byte>(raw[i]);
        }
        out = std::move(f);
        return {};
    }

    std::error_code FragmentStore::remove(std::uint32_t part_index, std::uint32_t fragment_index) const
    {
        std::error_code ec;
        fs::remove(path_for(part_index, fragment_index), ec);
        return ec;
    }

    std::vector<std::uint32_t> FragmentStore::available(std::uint32_t part_index, int num_fragments) const
    {
        std::vector<std::uint32_t> out;
        for (int i = 0; i < num_fragments; ++i) {
            const auto idx = static_cast<std::uint32_t>(i);
            std::error_code ec;
            if (fs::is_regular_file(path_for(part_index, idx), ec)) out.push_back(idx);
        }
        return out;
    }

    std::error_code FragmentStore::load_part(std::uint32_t part_index,
        std::span<const std::uint32_t> indices,
        std::vector<codec::Fragment>& out) const
    {
        std::vector<codec::Fragment> frags;
        frags.reserve(indices.size());
        for (const auto idx : indices) {
            codec::Fragment f;
            if (auto ec = get(part_index, idx, f); ec) return ec;
            frags.push_back(std::move(f));
        }
        out = std::move(frags);
        return {};
    }

} // namespace xorec::storage
