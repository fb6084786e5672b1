/**
 * @file ZeroCrossing.hpp
 * @brief Zero-flow crossing detection for respiratory waveforms
 *
 * Tìm các điểm flow đổi dấu (giao cắt không) đã được xác thực, nội suy
 * thời điểm và thể tích chính xác tại flow = 0. Các điểm này là ranh
 * giới giữa pha hít vào và pha thở ra.
 *
 * Validation of a candidate sign change at (i, i+1):
 *   - look-ahead: the next LOOK_AHEAD samples after i+1 all carry the
 *     post-crossing sign;
 *   - look-back: the mean of a LOOK_BACK_WIDTH-wide window located
 *     LOOK_BACK_OFFSET samples before i carries the pre-crossing sign.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_ZERO_CROSSING_HPP
#define FVAVG_ZERO_CROSSING_HPP

#include "fvavg/Common.h"
#include "fvavg/Waveform.hpp"

#include <vector>

namespace fvavg {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Số mẫu phía sau phải giữ dấu mới (chống nhiễu gai đơn mẫu)
constexpr size_t DEFAULT_LOOK_AHEAD_SAMPLES = 30;

/// Độ rộng cửa sổ nhìn lại
constexpr size_t DEFAULT_LOOK_BACK_WIDTH = 20;

/// Độ lệch của cửa sổ nhìn lại tính từ mẫu i (cửa sổ = i-41 ... i-60)
constexpr size_t DEFAULT_LOOK_BACK_OFFSET = 41;

/// Giới hạn trên cho mọi kích thước cửa sổ (look-ahead, look-back width/offset)
constexpr size_t MAX_WINDOW_SAMPLES = 100000;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct DetectorConfig
 * @brief Cấu hình cho bộ phát hiện giao cắt không
 */
struct DetectorConfig {
    size_t lookAheadSamples = DEFAULT_LOOK_AHEAD_SAMPLES;
    size_t lookBackWidth = DEFAULT_LOOK_BACK_WIDTH;
    size_t lookBackOffset = DEFAULT_LOOK_BACK_OFFSET;
    bool verbose = false;

    DetectorConfig() = default;
};

/**
 * @struct ZeroCrossingEvent
 * @brief Một điểm giao cắt không đã xác thực
 *
 * The crossing lies strictly between samples sampleIndex and
 * sampleIndex + 1; time and volume are linearly interpolated there.
 */
struct ZeroCrossingEvent {
    double time;                    ///< Thời điểm flow = 0 (nội suy)
    double volume;                  ///< Thể tích tại thời điểm đó (nội suy)
    CrossingDirection direction;    ///< Hướng đổi dấu
    size_t sampleIndex;             ///< Mẫu i ngay trước điểm giao cắt
    bool interpolated;              ///< Luôn true cho các sự kiện đã phát

    ZeroCrossingEvent()
        : time(0.0), volume(0.0)
        , direction(CrossingDirection::NEG_TO_POS)
        , sampleIndex(0), interpolated(true) {}
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class ZeroCrossingDetector
 * @brief Quét dãy flow và phát ra các sự kiện giao cắt không theo thứ tự thời gian
 *
 * Cách sử dụng:
 * @code
 *   ZeroCrossingDetector detector;
 *   std::vector<ZeroCrossingEvent> events;
 *   detector.detect(waveform, events);
 * @endcode
 */
class ZeroCrossingDetector {
public:
    explicit ZeroCrossingDetector(const DetectorConfig& config = DetectorConfig());

    // ========================================================================
    // MAIN METHODS
    // ========================================================================

    /**
     * @brief Phát hiện tất cả các điểm giao cắt không đã xác thực
     *
     * Events come out in time order and alternate in direction: a
     * validated candidate repeating the previous direction is dropped.
     * Candidates failing validation are skipped silently.
     *
     * @param waveform Dạng sóng đầu vào (đã validate)
     * @param events Vector chứa các sự kiện (output, bị xóa trước)
     * @return Số sự kiện tìm được
     */
    size_t detect(const Waveform& waveform, std::vector<ZeroCrossingEvent>& events) const;

    /**
     * @brief Kiểm tra điều kiện nhìn trước (look-ahead) cho ứng viên tại i
     *
     * Counts samples i+2 ... i+1+lookAhead carrying the post-crossing
     * sign. A window running past the end of the sequence fails.
     */
    bool passesLookAhead(const std::vector<double>& flow, size_t i,
                         CrossingDirection direction) const;

    /**
     * @brief Kiểm tra điều kiện nhìn lại (look-back) cho ứng viên tại i
     *
     * Mean over the available samples among i-offset ... i-offset-width+1.
     * Fails when no sample of the window exists.
     */
    bool passesLookBack(const std::vector<double>& flow, size_t i,
                        CrossingDirection direction) const;

    /**
     * @brief Nội suy thời điểm và thể tích tại flow = 0 giữa i và i+1
     */
    static ZeroCrossingEvent interpolateCrossing(const Waveform& waveform, size_t i,
                                                 CrossingDirection direction);

    const DetectorConfig& getConfig() const { return m_config; }

private:
    DetectorConfig m_config;
};

} // namespace fvavg

#endif // FVAVG_ZERO_CROSSING_HPP
