/**
 * @file FlowVolumeAnalyzer.hpp
 * @brief End-to-end flow-volume averaging pipeline
 *
 * Pipeline:
 *   Waveform -> ZeroCrossingDetector -> BreathSegmenter
 *            -> {TimeBinResampler, VolumeBinResampler} -> Aggregator
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_FLOW_VOLUME_ANALYZER_HPP
#define FVAVG_FLOW_VOLUME_ANALYZER_HPP

#include "fvavg/Common.h"
#include "fvavg/Waveform.hpp"
#include "fvavg/ZeroCrossing.hpp"
#include "fvavg/BreathSegmenter.hpp"
#include "fvavg/Resampling.hpp"
#include "fvavg/Aggregator.hpp"
#include "fvavg/TabularIO.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fvavg {

// ============================================================================
// CONFIGURATION
// ============================================================================

/**
 * @struct AnalysisConfig
 * @brief Cấu hình tổng hợp cho toàn bộ pipeline
 *
 * verbose is copied into the detector, segmenter and resampler configs
 * when the analyzer is constructed. The inspiration sign convention lives
 * in segmenter.inspirationSign only.
 */
struct AnalysisConfig {
    DetectorConfig detector;
    SegmenterConfig segmenter;
    ResamplingConfig resampling;
    ReaderConfig reader;
    double capacityScale = 0.0;     ///< > 0: thêm bản sao tuyệt đối (value * scale / 100)
    bool verbose = false;

    AnalysisConfig() = default;

    /**
     * @brief Kiểm tra tính hợp lệ của cấu hình
     * @param errorMessage Mô tả lỗi (nếu có)
     */
    bool validate(std::string& errorMessage) const;
};

// ============================================================================
// RESULTS
// ============================================================================

/**
 * @struct BreathSummary
 * @brief Vt và thời gian của một nhịp
 */
struct BreathSummary {
    size_t breathIndex;
    double inspTidalVolume;
    double expTidalVolume;
    double inspTime;
    double expTime;
    double totalTime;

    BreathSummary()
        : breathIndex(0), inspTidalVolume(0.0), expTidalVolume(0.0)
        , inspTime(0.0), expTime(0.0), totalTime(0.0) {}
};

/**
 * @struct AnalysisResult
 * @brief Toàn bộ kết quả của một lần phân tích
 *
 * status tells OK and NO_BREATHS_DETECTED (valid input, nothing to
 * average) apart from the failure statuses.
 */
struct AnalysisResult {
    AnalysisStatus status;
    std::string message;
    std::string sourceName;

    std::vector<ZeroCrossingEvent> events;
    Waveform zeroed;
    std::vector<Breath> breaths;

    TimeBinSet timeBins;
    std::vector<BreathVolumeBins> volumeBins;
    TimeBinAverages timeBinAverages;
    VolumeBinAverages volumeBinAverages;

    std::vector<BreathSummary> summaries;
    double meanInspTidalVolume;
    double meanExpTidalVolume;
    double meanBreathTime;

    float processingTimeMs;

    AnalysisResult()
        : status(AnalysisStatus::OK)
        , meanInspTidalVolume(0.0), meanExpTidalVolume(0.0), meanBreathTime(0.0)
        , processingTimeMs(0.0f) {}

    bool ok() const { return status == AnalysisStatus::OK; }
    bool hasBreaths() const { return !breaths.empty(); }
    size_t breathCount() const { return breaths.size(); }

    void clear() { *this = AnalysisResult(); }
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class FlowVolumeAnalyzer
 * @brief Chạy toàn bộ pipeline trên một dạng sóng hoặc một file
 *
 * Cách sử dụng:
 * @code
 *   AnalysisConfig config;
 *   config.resampling.intervals = 10;
 *   FlowVolumeAnalyzer analyzer(config);
 *   AnalysisResult result;
 *   if (analyzer.analyze(waveform, result) && result.hasBreaths()) { ... }
 * @endcode
 */
class FlowVolumeAnalyzer {
public:
    /// Callback tiến độ: (số nhịp đã xử lý, tổng số nhịp)
    using ProgressCallback = std::function<void(size_t current, size_t total)>;

    /// Trả về true để yêu cầu dừng
    using CancellationCheck = std::function<bool()>;

    explicit FlowVolumeAnalyzer(const AnalysisConfig& config = AnalysisConfig());

    /**
     * @brief Phân tích một dạng sóng trong bộ nhớ
     *
     * @return true với OK hoặc NO_BREATHS_DETECTED; false với các lỗi
     *         (MALFORMED_INPUT, INVALID_CONFIG, CANCELLED). Chi tiết
     *         nằm trong result.status / result.message.
     */
    bool analyze(const Waveform& waveform, AnalysisResult& result) const;

    /**
     * @brief Đọc file rồi phân tích (IO_ERROR nếu đọc thất bại)
     */
    bool processFile(const std::string& filePath, AnalysisResult& result) const;

    /**
     * @brief Callback được gọi sau mỗi nhịp trong giai đoạn nội suy
     *
     * With OpenMP enabled the callback and the cancellation check run
     * inside a critical section, one call at a time.
     */
    void setProgressCallback(ProgressCallback callback) { m_progressCallback = callback; }
    void setCancellationCheck(CancellationCheck check) { m_cancellationCheck = check; }

    const AnalysisConfig& getConfig() const { return m_config; }

private:
    bool fail(AnalysisResult& result, AnalysisStatus status, const std::string& message) const;
    bool resampleBreaths(AnalysisResult& result) const;
    void summarizeBreaths(AnalysisResult& result) const;
    void logStage(ProcessingStage stage) const;

    AnalysisConfig m_config;
    ZeroCrossingDetector m_detector;
    BreathSegmenter m_segmenter;
    TimeBinResampler m_timeBins;
    VolumeBinResampler m_volumeBins;
    ProgressCallback m_progressCallback;
    CancellationCheck m_cancellationCheck;
};

} // namespace fvavg

#endif // FVAVG_FLOW_VOLUME_ANALYZER_HPP
