#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <xorec/metrics/schema.h>

namespace xorec::metrics {

    // One encode/decode event. part == -1 for file-level events.
    struct Event {
        std::uint64_t ts_ms{ 0 };
        std::string event;
        int part{ -1 };
        std::string fragments;              // e.g. "0 1 2 4"
        std::uint64_t bytes{ 0 };
    };

    // In-memory CSV event log for one tool run.
    // Layout:
    //   schema_version,run_uuid,ts_ms,app,event,part,fragments,bytes
    //   2,<uuid>,1700,encode,part_encoded,0,0 1 2 3 4,1000
    //   ...
    //   # summary,2,<uuid>,<text>
    class RunReport {
    public:
        RunReport(std::string app, std::string run_uuid);

        void record(const Event& e);
        void record(std::uint64_t ts_ms, std::string_view event, int part,
            std::string_view fragments, std::uint64_t bytes);

        // Append the footer; further record() calls throw std::logic_error.
        void finish(std::string_view summary);

        const std::string& str() const noexcept { return buf_; }
        const std::string& app() const noexcept { return app_; }
        const std::string& run_uuid() const noexcept { return run_uuid_; }
        std::size_t event_count() const noexcept { return events_; }
        bool finished() const noexcept { return finished_; }

        // Write the buffered CSV to `filepath`, replacing any existing file.
        std::error_code save(const std::string& filepath) const;

    private:
        void append_field(std::string_view field);
        void end_row();

        std::string app_;
        std::string run_uuid_;
        std::string buf_;
        std::size_t events_{ 0 };
        bool finished_{ false };
        bool row_empty_{ true };
    };

    // "0 1 2 4" rendering of an index list for the fragments column.
    std::string join_indices(const std::vector<std::uint32_t>& indices);

} // namespace xorec::metrics
