// apps/xorec_encode/main.cpp
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <xorec/version.h>
#include <xorec/codec/file_codec.h>
#include <xorec/metrics/overhead.h>
#include <xorec/metrics/run_report.h>
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

static void save_report(xorec::metrics::RunReport& report, const std::string& metrics_dir, std::string_view summary) {
    report.finish(summary);
    if (metrics_dir.empty()) return;
    std::error_code ec;
    fs::create_directories(metrics_dir, ec);
    const auto path = fs::path(metrics_dir) / ("encode_" + report.run_uuid() + ".csv");
    if (!ec) ec = report.save(path.string());
    if (ec) {
        std::cerr << "warning: could not write metrics to " << path.string() << ": " << ec.message() << "\n";
    }
}

static int run(int argc, char** argv) {
    std::string input;
    std::string out_dir;
    std::string metadata_path;
    std::string metrics_dir;
    CodecConfig cfg{};

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("input,i", po::value<std::string>(&input), "File to encode (required)")
        ("out-dir,o", po::value<std::string>(&out_dir), "Directory receiving part_<p>_frag_<f>.bin blobs (required)")
        ("metadata", po::value<std::string>(&metadata_path)->default_value(""), "Metadata JSON path (default: <out-dir>/reconstruction_metadata.json)")
        ("parts", po::value<int>(&cfg.num_parts)->default_value(1), "Number of contiguous parts")
        ("k", po::value<int>(&cfg.k)->default_value(4), "Data fragments per part")
        ("m", po::value<int>(&cfg.m)->default_value(1), "XOR parity fragments per part (copies; one erasure is recoverable)")
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
        std::cout << "xorec_encode " << xorec::version() << "\n" << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << xorec::version() << "\n";
        return 0;
    }
    if (!vm.count("input") || !vm.count("out-dir")) {
        std::cerr << "error: --input and --out-dir are required\n\n" << desc << "\n";
        return 2;
    }
    if (cfg.num_parts < 1 || cfg.k < 1 || cfg.m < 1) {
        std::cerr << "error: invalid parts/k/m (all must be >= 1)\n";
        return 2;
    }
    if (metadata_path.empty()) {
        metadata_path = (fs::path(out_dir) / k_metadata_filename).string();
    }

    xorec::metrics::RunReport report("encode", xorec::util::uuid_v4());

    std::vector<std::byte> data;
    if (auto ec = read_file(input, data); ec) {
        std::cerr << "error: cannot read " << input << ": " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return 3;
    }
    report.record(now_ms(), "file_read", -1, "", data.size());

    std::cout << "File: " << input << " (" << data.size() << " bytes)\n"
        << "Splitting into " << cfg.num_parts << " parts, k=" << cfg.k << ", m=" << cfg.m << "\n";
    if (cfg.m > 1) {
        std::cout << "note: m > 1 stores identical XOR parity copies; still one erasure per part\n";
    }

    FileEncoding enc;
    const auto filename = fs::path(input).filename().string();
    if (auto ec = encode_file(data, filename, cfg, enc); ec) {
        std::cerr << "error: encode failed: " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return 7;
    }

    std::cout << "Original SHA256: " << enc.metadata.original_hash << "\n";
    for (std::size_t i = 0; i < enc.parts.size(); ++i) {
        const auto& pm = enc.metadata.parts[i];
        std::cout << "  part " << i << ": " << pm.original_length << " bytes -> "
            << pm.num_fragments << " fragments of " << pm.chunk_size << " bytes ("
            << pm.k << " data + " << pm.m << " parity)\n";

        std::vector<std::uint32_t> idx;
        for (const auto& f : enc.parts[i]) idx.push_back(f.fragment_index);
        report.record(now_ms(), "part_encoded", static_cast<int>(i),
            xorec::metrics::join_indices(idx), pm.original_length);
    }

    const FragmentStore store(out_dir);
    if (auto ec = store.prepare(); ec) {
        std::cerr << "error: cannot create " << out_dir << ": " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return 3;
    }
    if (auto ec = store.put_all(enc.parts); ec) {
        std::cerr << "error: writing fragments: " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return 3;
    }
    if (auto ec = save_metadata(metadata_path, enc.metadata); ec) {
        std::cerr << "error: writing " << metadata_path << ": " << ec.message() << "\n";
        save_report(report, metrics_dir, "error: " + ec.message());
        return 3;
    }

    const auto ov = xorec::metrics::storage_overhead(enc.metadata);
    report.record(now_ms(), "stored", -1, "", ov.stored_bytes);

    std::cout << "Fragments written to " << out_dir << "\n"
        << "Metadata saved to " << metadata_path << "\n"
        << std::fixed << std::setprecision(2)
        << "Storage: " << ov.stored_bytes << " bytes for " << ov.original_bytes
        << " (overhead " << ov.overhead_pct << "%, efficiency " << ov.efficiency_pct << "%)\n";

    save_report(report, metrics_dir, "ok");
    return 0;
}

int main(int argc, char** argv) {
    // Allocation or OpenSSL failures surface as exceptions; report them as I/O errors.
    try {
        return run(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << "error: xorec_encode aborted: " << e.what() << "\n";
        return 3;
    }
}
