// apps/xorec_decode/main.cpp
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <xorec/version.h>
#include <xorec/codec/file_codec.h>
#include <xorec/metrics/run_report.h>
#include <xorec/sim/selection.h>
#include <xorec/storage/file_io.h>
#include <xorec/storage/fragment_store.h>
#include <xorec/storage/metadata_json.h>
#include <xorec/util/uuid.h>

using namespace xorec::codec;
using namespace xorec::storage;
namespace po = boost::program_options;
namespace fs = std::filesystem;

static inline std::uint64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

struct DropSpec {
    std::uint32_t part{ 0 };
    std::uint32_t fragment{ 0 };
};

// "0:3,1:4" -> {(0,3),(1,4)}
static bool parse_drops(const std::string& s, std::vector<DropSpec>& out) {
    std::istringstream is(s);
    std::string item;
    while (std::getline(is, item, ',')) {
        if (item.empty()) continue;
        const auto colon = item.find(':');
        if (colon == std::string::npos) return false;
        try {
            DropSpec d;
            d.part = static_cast<std::uint32_t>(std::stoul(item.substr(0, colon)));
            d.fragment = static_cast<std::uint32_t>(std::stoul(item.substr(colon + 1)));
            out.push_back(d);
        }
        catch (const std::logic_error&) {
            return false;
        }
    }
    return true;
}

static int exit_code_for(const std::error_code& ec) {
    if (ec == codec_errc::insufficient_fragments) return 4;
    if (ec == codec_errc::unrecoverable_part) return 5;
    if (ec == codec_errc::integrity_error) return 6;
    if (ec == codec_errc::invalid_parameter) return 7;
    return 3;
}

static const char* hint_for(const std::error_code& ec) {
    if (ec == codec_errc::insufficient_fragments || ec == codec_errc::unrecoverable_part) {
        return "select a different fragment subset (at most one data fragment may be missing per part)";
    }
    if (ec == codec_errc::integrity_error) return "a fragment or the metadata is corrupted";
    return "check the metadata and fragment directory";
}

static void save_report(xorec::metrics::RunReport& report, const std::string& metrics_dir, std::string_view summary) {
    report.finish(summary);
    if (metrics_dir.empty()) return;
    std::error_code ec;
    fs::create_directories(metrics_dir, ec);
    const auto path = fs::path(metrics_dir) / ("decode_" + report.run_uuid() + ".csv");
    if (!ec) ec = report.save(path.string());
    if (ec) {
        std::cerr << "warning: could not write metrics to " << path.string() << ": " << ec.message() << "\n";
    }
}

static int run(int argc, char** argv) {
    std::string metadata_path;
    std::string frag_dir;
    std::string output;
    std::string drops_s;
    std::string metrics_dir;
    double loss = -1.0;
    std::uint32_t seed = 2025u;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("metadata", po::value<std::string>(&metadata_path), "Metadata JSON written by xorec_encode (required)")
        ("fragments,f", po::value<std::string>(&frag_dir), "Fragment directory (required)")
        ("output,o", po::value<std::string>(&output), "Reconstructed file path (required)")
        ("drop", po::value<std::string>(&drops_s)->default_value(""), "Treat fragments as lost: part:fragment[,part:fragment...]")
        ("loss", po::value<double>(&loss)->default_value(-1.0), "Simulated Bernoulli loss probability per fragment (<0 disables)")
        ("recoverable", "Simulate loss by keeping k fragments that XOR can always decode")
        ("seed", po::value<std::uint32_t>(&seed)->default_value(2025u), "Seed for --loss / --recoverable")
        ("metrics-dir", po::value<std::string>(&metrics_dir)->default_value("metrics"), "Directory for the run CSV (empty disables)")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        std::cerr << "arg error: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << "xorec_decode " << xorec::version() << "\n" << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << xorec::version() << "\n";
        return 0;
    }
    if (!vm.count("metadata") || !vm.count("fragments") || !vm.count("output")) {
        std::cerr << "error: --metadata, --fragments and --output are required\n\n" << desc << "\n";
        return 2;
    }
    const bool recoverable = vm.count("recoverable") > 0;
    if (recoverable && loss >= 0.0) {
        std::cerr << "error: --loss and --recoverable are mutually exclusive\n";
        return 2;
    }
    std::vector<DropSpec> drops;
    if (!parse_drops(drops_s, drops)) {
        std::cerr << "error: invalid --drop (expected part:fragment[,part:fragment...])\n";
        return 2;
    }

    xorec::metrics::RunReport report("decode", xorec::util::uuid_v4());

    FileMetadata meta;
    if (auto ec = load_metadata(metadata_path, meta); ec) {
        std::cerr << "error: cannot load " << metadata_path << ": " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return exit_code_for(ec);
    }
    if (auto ec = validate_file_metadata(meta); ec) {
        std::cerr << "error: " << metadata_path << " is not a consistent layout: " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return exit_code_for(ec);
    }

    std::cout << "File: " << meta.original_filename << " (" << meta.original_size << " bytes, "
        << meta.num_parts << " parts, k=" << meta.k << ", m=" << meta.m << ")\n";

    // ---- Select the surviving fragments of every part ----
    const FragmentStore store(frag_dir);
    xorec::sim::XorShift32 rng(seed);
    std::vector<std::vector<Fragment>> subsets(meta.parts.size());

    for (std::size_t p = 0; p < meta.parts.size(); ++p) {
        const auto pi = static_cast<std::uint32_t>(p);
        const auto& pm = meta.parts[p];
        auto kept = store.available(pi, pm.num_fragments);

        for (const auto& d : drops) {
            if (d.part != pi) continue;
            kept.erase(std::remove(kept.begin(), kept.end(), d.fragment), kept.end());
        }

        if (recoverable) {
            const auto pick = xorec::sim::select_recoverable(pm.k, pm.m, rng);
            std::vector<std::uint32_t> both;
            std::set_intersection(kept.begin(), kept.end(), pick.begin(), pick.end(), std::back_inserter(both));
            kept = std::move(both);
        }
        else if (loss >= 0.0) {
            const auto pick = xorec::sim::select_bernoulli(pm.k, pm.m, { loss }, rng);
            std::vector<std::uint32_t> both;
            std::set_intersection(kept.begin(), kept.end(), pick.begin(), pick.end(), std::back_inserter(both));
            kept = std::move(both);
        }

        const auto lost = xorec::sim::lost_indices(pm.k, pm.m, kept);
        std::cout << "  part " << p << ": available [" << xorec::metrics::join_indices(kept) << "]";
        if (!lost.empty()) std::cout << ", lost [" << xorec::metrics::join_indices(lost) << "]";
        std::cout << "\n";

        if (auto ec = store.load_part(pi, kept, subsets[p]); ec) {
            std::cerr << "error: reading part " << p << " fragments: " << ec.message() << "\n";
            save_report(report, metrics_dir, "error: " + ec.message());
            return 3;
        }
        report.record(now_ms(), "part_selected", static_cast<int>(p),
            xorec::metrics::join_indices(kept), pm.chunk_size * kept.size());
    }

    // ---- Decode ----
    std::vector<std::byte> data;
    std::vector<DecodeReport> reps;
    if (auto ec = decode_file(subsets, meta, data, &reps); ec) {
        std::cerr << "error: reconstruction failed: " << ec.message() << "\n"
            << "hint: " << hint_for(ec) << "\n";
        report.record(now_ms(), "decode_failed", -1, "", 0);
        save_report(report, metrics_dir, "error: " + ec.message());
        return exit_code_for(ec);
    }

    for (std::size_t p = 0; p < reps.size(); ++p) {
        const auto& r = reps[p];
        if (r.path == DecodePath::recovered) {
            std::cout << "  part " << p << ": recovered data fragment " << r.recovered_index
                << " from parity " << r.parity_index << "\n";
            report.record(now_ms(), "part_recovered", static_cast<int>(p),
                std::to_string(r.recovered_index), meta.parts[p].original_length);
        }
        else {
            report.record(now_ms(), "part_direct", static_cast<int>(p), "", meta.parts[p].original_length);
        }
    }

    if (auto ec = write_file(output, data); ec) {
        std::cerr << "error: writing " << output << ": " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return 3;
    }
    report.record(now_ms(), "file_written", -1, "", data.size());

    std::cout << "Reconstructed " << data.size() << " bytes, SHA256 " << meta.original_hash << " verified\n"
        << "Output saved to " << output << "\n";

    save_report(report, metrics_dir, "ok");
    return 0;
}

int main(int argc, char** argv) {
    // Allocation or OpenSSL failures surface as exceptions; report them as I/O errors.
    try {
        return run(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << "error: xorec_decode aborted: " << e.what() << "\n";
        return 3;
    }
}
