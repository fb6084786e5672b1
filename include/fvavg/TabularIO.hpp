/**
 * @file TabularIO.hpp
 * @brief Delimited-text reader for waveforms and CSV writer for results
 *
 * Reader: một dòng tiêu đề, sau đó mỗi dòng một mẫu. Dấu phân cách
 * (',' ';' hoặc tab) được tự động nhận dạng từ dòng tiêu đề. Cột được
 * tìm theo mẫu chuỗi con không phân biệt hoa thường.
 *
 * Writer: mỗi bảng kết quả ghi ra một file <base>_<table>.csv.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_TABULAR_IO_HPP
#define FVAVG_TABULAR_IO_HPP

#include "fvavg/Common.h"
#include "fvavg/Waveform.hpp"

#include <istream>
#include <string>
#include <vector>

namespace fvavg {

struct AnalysisResult;

// ============================================================================
// READER
// ============================================================================

/**
 * @struct ReaderConfig
 * @brief Mẫu tên cột và tùy chọn cho bộ đọc
 *
 * A column matches when every pattern of its list occurs in the header
 * cell (case-insensitive). The first matching column wins.
 */
struct ReaderConfig {
    std::vector<std::string> timePatterns = {"time"};
    std::vector<std::string> volumePatterns = {"vol"};
    std::vector<std::string> flowPatterns = {"flow"};
    char delimiter = '\0';          ///< '\0' = tự động nhận dạng
    bool verbose = false;

    ReaderConfig() = default;
};

/**
 * @class WaveformReader
 * @brief Đọc (time, volume, flow) từ file văn bản có dấu phân cách
 */
class WaveformReader {
public:
    explicit WaveformReader(const ReaderConfig& config = ReaderConfig());

    /**
     * @brief Đọc file dạng sóng
     *
     * @param filePath Đường dẫn file
     * @param waveform Dạng sóng (output)
     * @return false nếu không mở được file, thiếu cột hoặc không có mẫu nào
     */
    bool readFile(const std::string& filePath, Waveform& waveform) const;

    /**
     * @brief Đọc từ stream bất kỳ
     *
     * Rows with an unparsable number are skipped with a warning naming
     * the line; blank lines are skipped silently.
     */
    bool read(std::istream& input, Waveform& waveform, const std::string& sourceName) const;

    /**
     * @brief Nhận dạng dấu phân cách từ dòng tiêu đề (tab > ';' > ',')
     */
    static char detectDelimiter(const std::string& headerLine);

    /**
     * @brief Tách một dòng theo dấu phân cách, bỏ khoảng trắng và dấu nháy
     */
    static std::vector<std::string> splitLine(const std::string& line, char delimiter);

    /**
     * @brief Tìm cột đầu tiên chứa tất cả các mẫu
     * @return Chỉ số cột, hoặc -1 nếu không tìm thấy
     */
    static int findColumn(const std::vector<std::string>& headers,
                          const std::vector<std::string>& patterns);

    const ReaderConfig& getConfig() const { return m_config; }

private:
    ReaderConfig m_config;
};

// ============================================================================
// WRITER
// ============================================================================

/**
 * @class ResultWriter
 * @brief Ghi các bảng kết quả phân tích ra thư mục đầu ra
 *
 * Tables: zeroed, breaths, time_bins, volume_bins, tidal,
 * avg_time_bins, avg_volume_bins. Undefined statistics are written as NaN.
 */
class ResultWriter {
public:
    explicit ResultWriter(const std::string& outputDir, bool verbose = false);

    /**
     * @brief Ghi tất cả các bảng
     * @param baseName Tiền tố tên file (thường là tên file đầu vào)
     * @return Số file đã ghi; 0 nếu lỗi
     */
    size_t writeAll(const AnalysisResult& result, const std::string& baseName) const;

    bool writeZeroed(const AnalysisResult& result, const std::string& path) const;
    bool writeBreaths(const AnalysisResult& result, const std::string& path) const;
    bool writeTimeBins(const AnalysisResult& result, const std::string& path) const;
    bool writeVolumeBins(const AnalysisResult& result, const std::string& path) const;
    bool writeTidal(const AnalysisResult& result, const std::string& path) const;
    bool writeAverageTimeBins(const AnalysisResult& result, const std::string& path) const;
    bool writeAverageVolumeBins(const AnalysisResult& result, const std::string& path) const;

    /**
     * @brief Đường dẫn file của một bảng: <outputDir>/<baseName>_<table>.csv
     */
    std::string tablePath(const std::string& baseName, const std::string& table) const;

private:
    std::string m_outputDir;
    bool m_verbose;
};

} // namespace fvavg

#endif // FVAVG_TABULAR_IO_HPP
