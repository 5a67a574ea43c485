#ifndef LINKBENCH_REPORT_REPORTER_HPP
#define LINKBENCH_REPORT_REPORTER_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "../bench/statistics.hpp"

namespace linkbench::report {

/// prints a finished run, never sees a snapshot that is still changing
class reporter {
public:
    virtual ~reporter() = default;
    virtual void report(const bench::statistics_snapshot& snapshot, std::ostream& out) const = 0;
};

/// human readable summary, sections without traffic are omitted
class text_reporter : public reporter {
public:
    explicit text_reporter(std::string title = "Test statistics");
    void report(const bench::statistics_snapshot& snapshot, std::ostream& out) const override;

private:
    std::string title_;
};

/// single JSON document, see to_json()
class json_reporter : public reporter {
public:
    explicit json_reporter(int indent = 2);
    void report(const bench::statistics_snapshot& snapshot, std::ostream& out) const override;

private:
    int indent_;
};

enum class format {
    text,
    json
};

std::unique_ptr<reporter> make_reporter(format kind);

/// counters, CRCs as 0xXXXXXXXX strings, timestamps as epoch seconds (null when unset) and derived rates
nlohmann::json to_json(const bench::statistics_snapshot& snapshot);

/// 0x%08X
std::string format_crc32(uint32_t crc);

/// decimal with comma thousands separators: 1234567 -> "1,234,567"
std::string format_count(uint64_t value);

}

#endif
