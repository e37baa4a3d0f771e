#include <xorec/storage/metadata_json.h>
#include <xorec/codec/errors.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace xorec::storage {

    namespace pt = boost::property_tree;
    using codec::codec_errc;

    static void append_json_string(std::string& out, std::string_view s)
    {
        out.push_back('"');
        for (char c : s) {
            switch (c) {
            case '"':  out.append("\\\""); break;
            case '\\': out.append("\\\\"); break;
            case '\n': out.append("\\n"); break;
            case '\r': out.append("\\r"); break;
            case '\t': out.append("\\t"); break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out.append(buf);
                }
                else {
                    out.push_back(c);
                }
            }
        }
        out.push_back('"');
    }

    static void append_key(std::string& out, int indent, std::string_view key)
    {
        out.append(static_cast<std::size_t>(indent), ' ');
        append_json_string(out, key);
        out.append(": ");
    }

    std::string to_json(const codec::FileMetadata& meta)
    {
        std::string out;
        out.append("{\n");
        append_key(out, 2, "original_filename"); append_json_string(out, meta.original_filename); out.append(",\n");
        append_key(out, 2, "original_size"); out.append(std::to_string(meta.original_size)); out.append(",\n");
        append_key(out, 2, "original_hash"); append_json_string(out, meta.original_hash); out.append(",\n");
        append_key(out, 2, "num_parts"); out.append(std::to_string(meta.num_parts)); out.append(",\n");
        append_key(out, 2, "k"); out.append(std::to_string(meta.k)); out.append(",\n");
        append_key(out, 2, "m"); out.append(std::to_string(meta.m)); out.append(",\n");
        append_key(out, 2, "parts");

        if (meta.parts.empty()) {
            out.append("[]\n}\n");
            return out;
        }

        out.append("[\n");
        for (std::size_t i = 0; i < meta.parts.size(); ++i) {
            const auto& p = meta.parts[i];
            out.append("    {\n");
            append_key(out, 6, "original_length"); out.append(std::to_string(p.original_length)); out.append(",\n");
            append_key(out, 6, "chunk_size"); out.append(std::to_string(p.chunk_size)); out.append(",\n");
            append_key(out, 6, "k"); out.append(std::to_string(p.k)); out.append(",\n");
            append_key(out, 6, "m"); out.append(std::to_string(p.m)); out.append(",\n");
            append_key(out, 6, "num_fragments"); out.append(std::to_string(p.num_fragments)); out.append(",\n");
            append_key(out, 6, "data_hash"); append_json_string(out, p.data_hash);
            if (!p.fragment_hashes.empty()) {
                out.append(",\n");
                append_key(out, 6, "fragment_hashes");
                out.append("[\n");
                for (std::size_t j = 0; j < p.fragment_hashes.size(); ++j) {
                    out.append(8, ' ');
                    append_json_string(out, p.fragment_hashes[j]);
                    out.append(j + 1 < p.fragment_hashes.size() ? ",\n" : "\n");
                }
                out.append(6, ' ');
                out.append("]");
            }
            out.append("\n    }");
            out.append(i + 1 < meta.parts.size() ? ",\n" : "\n");
        }
        out.append("  ]\n}\n");
        return out;
    }

    // Typed field lookup; property_tree keeps every JSON scalar as text.
    template <typename T>
    static bool read_field(const pt::ptree& node, const char* key, T& out)
    {
        const auto child = node.get_child_optional(key);
        if (!child || !child->empty()) return false; // absent or not a scalar
        const auto v = child->get_value_optional<T>();
        if (!v) return false;
        out = *v;
        return true;
    }

    static bool read_part(const pt::ptree& node, codec::PartMetadata& p)
    {
        if (!read_field(node, "original_length", p.original_length)) return false;
        if (!read_field(node, "chunk_size", p.chunk_size)) return false;
        if (!read_field(node, "k", p.k)) return false;
        if (!read_field(node, "m", p.m)) return false;
        if (!read_field(node, "num_fragments", p.num_fragments)) return false;
        if (!read_field(node, "data_hash", p.data_hash)) return false;

        if (const auto hashes = node.get_child_optional("fragment_hashes")) {
            for (const auto& [key, item] : *hashes) {
                if (!key.empty() || !item.empty()) return false; // must be an array of strings
                p.fragment_hashes.push_back(item.data());
            }
        }
        return true;
    }

    std::error_code from_json(std::string_view text, codec::FileMetadata& out)
    {
        pt::ptree root;
        try {
            std::istringstream is{ std::string(text) };
            pt::read_json(is, root);
        }
        catch (const pt::json_parser_error&) {
            return codec_errc::invalid_parameter;
        }

        codec::FileMetadata meta;
        if (!read_field(root, "original_filename", meta.original_filename)) return codec_errc::invalid_parameter;
        if (!read_field(root, "original_size", meta.original_size)) return codec_errc::invalid_parameter;
        if (!read_field(root, "original_hash", meta.original_hash)) return codec_errc::invalid_parameter;
        if (!read_field(root, "num_parts", meta.num_parts)) return codec_errc::invalid_parameter;
        if (!read_field(root, "k", meta.k)) return codec_errc::invalid_parameter;
        if (!read_field(root, "m", meta.m)) return codec_errc::invalid_parameter;

        const auto parts = root.get_child_optional("parts");
        if (!parts) return codec_errc::invalid_parameter;
        for (const auto& [key, node] : *parts) {
            if (!key.empty()) return codec_errc::invalid_parameter; // object, not array
            codec::PartMetadata p;
            if (!read_part(node, p)) return codec_errc::invalid_parameter;
            meta.parts.push_back(std::move(p));
        }

        out = std::move(meta);
        return {};
    }

    std::error_code save_metadata(const std::string& filepath, const codec::FileMetadata& meta)
    {
        const std::string text = to_json(meta);
        std::ofstream os(filepath, std::ios::binary | std::ios::trunc);
        if (!os) return std::make_error_code(std::errc::io_error);
        os.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!os) return std::make_error_code(std::errc::io_error);
        return {};
    }

    std::error_code load_metadata(const std::string& filepath, codec::FileMetadata& out)
    {
        std::ifstream is(filepath, std::ios::binary);
        if (!is) return std::make_error_code(std::errc::no_such_file_or_directory);
        const std::string text{ std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>() };
        if (is.bad()) return std::make_error_code(std::errc::io_error);
        return from_json(text, out);
    }

} // namespace xorec::storage
