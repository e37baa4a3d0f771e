#include <xorec/metrics/run_report.h>
#include <xorec/storage/file_io.h>
#include <span>
#include <stdexcept>

namespace xorec::metrics {

    // RFC 4180 quoting: only fields holding a separator, quote or line break.
    static void append_csv_field(std::string& out, std::string_view field)
    {
        if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
            out.append(field);
            return;
        }
        out.push_back('"');
        std::size_t from = 0;
        for (auto q = field.find('"'); q != std::string_view::npos; q = field.find('"', from)) {
            out.append(field.substr(from, q + 1 - from));
            out.push_back('"');
            from = q + 1;
        }
        out.append(field.substr(from));
        out.push_back('"');
    }

    RunReport::RunReport(std::string app, std::string run_uuid)
        : app_(std::move(app)), run_uuid_(std::move(run_uuid))
    {
        append_field("schema_version");
        append_field("run_uuid");
        for (const auto& c : standard_columns()) append_field(c);
        end_row();
    }

    void RunReport::append_field(std::string_view field)
    {
        if (!row_empty_) buf_.push_back(',');
        append_csv_field(buf_, field);
        row_empty_ = false;
    }

    void RunReport::end_row()
    {
        buf_.push_back('\n');
        row_empty_ = true;
    }

    void RunReport::record(const Event& e)
    {
        if (finished_) {
            throw std::logic_error("RunReport: record after finish");
        }
        append_field(std::to_string(schema_version));
        append_field(run_uuid_);
        append_field(std::to_string(e.ts_ms));
        append_field(app_);
        append_field(e.event);
        append_field(std::to_string(e.part));
        append_field(e.fragments);
        append_field(std::to_string(e.bytes));
        end_row();
        ++events_;
    }

    void RunReport::record(std::uint64_t ts_ms, std::string_view event, int part,
        std::string_view fragments, std::uint64_t bytes)
    {
        record(Event{ ts_ms, std::string(event), part, std::string(fragments), bytes });
    }

    void RunReport::finish(std::string_view summary)
    {
        if (finished_) return;
        append_field("# summary");
        append_field(std::to_string(schema_version));
        append_field(run_uuid_);
        append_field(summary);
        end_row();
        finished_ = true;
    }

    std::error_code RunReport::save(const std::string& filepath) const
    {
        return storage::write_file(filepath, std::as_bytes(std::span<const char>(buf_.data(), buf_.size())));
    }

    std::string join_indices(const std::vector<std::uint32_t>& indices)
    {
        std::string out;
        for (const auto i : indices) {
            if (!out.empty()) out.push_back(' ');
            out += std::to_string(i);
        }
        return out;
    }

} // namespace xorec::metrics
