#pragma once

#include "imuskel/session.hpp"
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace imuskel {
namespace link {

// Writes the corrected record stream as CSV:
//   label,w,x,y,z,timestamp          (default)
//   count,label,w,x,y,z,timestamp    (with_count)
// timestamp is milliseconds on the session clock.
class CsvRecordWriter {
public:
    // Opens path for writing; throws Error(IOError) on failure
    explicit CsvRecordWriter(const std::string& path, bool with_count = false);
    // Writes to a caller-owned stream
    explicit CsvRecordWriter(std::ostream& out, bool with_count = false);

    CsvRecordWriter(const CsvRecordWriter&) = delete;
    CsvRecordWriter& operator=(const CsvRecordWriter&) = delete;

    void write(const CorrectedRecord& record);
    void flush();

    // Listener bound to this writer; the writer must outlive the session hook
    RecordListener listener();

    size_t rows() const;

private:
    void write_header();

    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    bool with_count_;
    size_t rows_ = 0;
    mutable std::mutex mutex_;
};

} // namespace link
} // namespace imuskel
