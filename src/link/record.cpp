#include "imuskel/link/record.hpp"
#include "imuskel/error.hpp"
#include <iomanip>

namespace imuskel {
namespace link {

CsvRecordWriter::CsvRecordWriter(const std::string& path, bool with_count)
    : file_(std::make_unique<std::ofstream>(path)), out_(nullptr), with_count_(with_count) {
    if (!file_->is_open()) {
        throw Error(ErrorCode::IOError, path, "Failed to open record file for writing");
    }
    out_ = file_.get();
    write_header();
}

CsvRecordWriter::CsvRecordWriter(std::ostream& out, bool with_count)
    : out_(&out), with_count_(with_count) {
    write_header();
}

void CsvRecordWriter::write_header() {
    if (with_count_) {
        *out_ << "count,";
    }
    *out_ << "label,w,x,y,z,timestamp\n";
}

void CsvRecordWriter::write(const CorrectedRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Quaternion& q = record.quaternion;
    if (with_count_) {
        *out_ << record.sequence << ",";
    }
    *out_ << record.label << ","
          << std::setprecision(17) << q.w() << "," << q.x() << "," << q.y() << "," << q.z() << ","
          << to_millis(record.timestamp) << "\n";
    ++rows_;
}

void CsvRecordWriter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_->flush();
}

RecordListener CsvRecordWriter::listener() {
    return [this](const CorrectedRecord& record) { write(record); };
}

size_t CsvRecordWriter::rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_;
}

} // namespace link
} // namespace imuskel
