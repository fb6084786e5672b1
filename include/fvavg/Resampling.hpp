/**
 * @file Resampling.hpp
 * @brief Time-bin and volume-bin resampling of segmented breaths
 *
 * Hai phương pháp chuẩn hóa các nhịp thở có thời lượng/biên độ khác nhau
 * về cùng một lưới chung gồm (intervals + 1) điểm mỗi pha:
 *
 *   1. Time bins:   các điểm cách đều theo THỜI GIAN của pha,
 *                   nội suy volume và flow.
 *   2. Volume bins: các điểm cách đều theo THỂ TÍCH của pha,
 *                   nội suy time rồi flow tại thời điểm đó.
 *
 * Point 0 and point `intervals` always correspond to the phase start and
 * end. Targets outside the sampled range are clamped to the boundary
 * sample, never extrapolated.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_RESAMPLING_HPP
#define FVAVG_RESAMPLING_HPP

#include "fvavg/Common.h"
#include "fvavg/BreathSegmenter.hpp"

#include <vector>

namespace fvavg {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Số khoảng chia mặc định cho mỗi pha
constexpr int DEFAULT_INTERVALS = 100;

// ============================================================================
// CONFIGURATION
// ============================================================================

/**
 * @struct ResamplingConfig
 * @brief Cấu hình cho hai bộ nội suy
 */
struct ResamplingConfig {
    int intervals = DEFAULT_INTERVALS;      ///< Số khoảng chia (N), lưới có N+1 điểm
    bool applyMeanShift = true;             ///< Cộng Mean_shift vào thể tích trung bình
    bool useFixedMeanShift = false;         ///< Dùng giá trị cố định thay vì giá trị tính được
    double fixedMeanShift = 0.0;            ///< Giá trị Mean_shift cố định
    bool verbose = false;

    ResamplingConfig() = default;
};

// ============================================================================
// GRID STRUCTURES
// ============================================================================

/**
 * @struct TimeBinGrid
 * @brief Lưới time-bin của một pha
 *
 * time holds the target times relative to the phase start (0 ... T).
 */
struct TimeBinGrid {
    std::vector<double> time;       ///< Thời điểm mục tiêu (tương đối)
    std::vector<double> volume;     ///< Thể tích nội suy
    std::vector<double> flow;       ///< Lưu lượng nội suy

    size_t size() const { return time.size(); }
};

/**
 * @struct VolumeBinGrid
 * @brief Lưới volume-bin của một pha
 *
 * time holds the derived times relative to the phase start.
 */
struct VolumeBinGrid {
    std::vector<double> volume;     ///< Thể tích mục tiêu
    std::vector<double> time;       ///< Thời điểm tương ứng (tương đối)
    std::vector<double> flow;       ///< Lưu lượng nội suy

    size_t size() const { return volume.size(); }
};

/**
 * @struct BreathTimeBins
 * @brief Kết quả time-bin của một nhịp thở
 */
struct BreathTimeBins {
    size_t breathIndex;
    TimeBinGrid inspiration;                ///< Chưa chuẩn hóa
    TimeBinGrid expiration;                 ///< Chưa chuẩn hóa
    std::vector<double> normalizedInspVolume;   ///< Thể tích hít vào đã chuẩn hóa theo Vt
    std::vector<double> normalizedExpVolume;    ///< Thể tích thở ra đã chuẩn hóa theo Vt
    double inspTidalVolume;
    double expTidalVolume;
    double inspDuration;
    double expDuration;

    BreathTimeBins()
        : breathIndex(0)
        , inspTidalVolume(0.0), expTidalVolume(0.0)
        , inspDuration(0.0), expDuration(0.0) {}
};

/**
 * @struct BreathVolumeBins
 * @brief Kết quả volume-bin của một nhịp thở
 */
struct BreathVolumeBins {
    size_t breathIndex;
    VolumeBinGrid inspiration;
    VolumeBinGrid expiration;

    BreathVolumeBins() : breathIndex(0) {}
};

/**
 * @struct TimeBinSet
 * @brief Toàn bộ kết quả time-bin cho tất cả các nhịp
 */
struct TimeBinSet {
    std::vector<BreathTimeBins> breaths;
    double avgInspTidalVolume;      ///< Vt hít vào trung bình
    double avgExpTidalVolume;       ///< Vt thở ra trung bình
    double meanShift;               ///< Mean_shift áp dụng cho thể tích trung bình
    bool normalized;

    TimeBinSet()
        : avgInspTidalVolume(0.0), avgExpTidalVolume(0.0)
        , meanShift(0.0), normalized(false) {}
};

// ============================================================================
// TIME-BIN RESAMPLER
// ============================================================================

/**
 * @class TimeBinResampler
 * @brief Nội suy volume và flow tại các mốc thời gian cách đều của mỗi pha
 */
class TimeBinResampler {
public:
    explicit TimeBinResampler(const ResamplingConfig& config = ResamplingConfig());

    /**
     * @brief Nội suy một pha lên lưới N+1 điểm theo thời gian
     *
     * Target j is at j/N of the phase duration. The bracketing pair
     * satisfies time[k] <= target <= time[k+1];
     * value = v1 + ((v2 - v1) / (t2 - t1)) * (target - t1).
     */
    static TimeBinGrid resamplePhase(const PhaseSegment& phase, int intervals);

    /**
     * @brief Nội suy cả hai pha của một nhịp (chưa chuẩn hóa)
     */
    BreathTimeBins resampleBreath(const Breath& breath) const;

    /**
     * @brief Chuẩn hóa thể tích theo Vt trung bình và tính Mean_shift
     *
     * Inspiration grids are shifted so their end volume is 0, expiration
     * grids so their start volume is 0, then scaled by avgVt / Vt_breath.
     * Mean_shift = mean of (insp end volume + exp start volume) over 2n.
     *
     * @return false nếu tập rỗng
     */
    bool normalize(TimeBinSet& set) const;

    /**
     * @brief Nội suy và chuẩn hóa tất cả các nhịp (tuần tự)
     */
    bool resample(const std::vector<Breath>& breaths, TimeBinSet& set) const;

    const ResamplingConfig& getConfig() const { return m_config; }

private:
    ResamplingConfig m_config;
};

// ============================================================================
// VOLUME-BIN RESAMPLER
// ============================================================================

/**
 * @class VolumeBinResampler
 * @brief Nội suy time và flow tại các mốc thể tích cách đều của mỗi pha
 *
 * Target volumes run from the phase start volume towards its end volume
 * in steps of Vt/N. For the default convention inspiration volume falls
 * (start - Vt/N * j) and expiration volume rises.
 */
class VolumeBinResampler {
public:
    explicit VolumeBinResampler(const ResamplingConfig& config = ResamplingConfig());

    /**
     * @brief Nội suy một pha lên lưới N+1 điểm theo thể tích
     *
     * The first sample pair (in sample order) whose volumes bracket the
     * target is used:
     *   target_time = t1 + ((target - v1) / (v2 - v1)) * (t2 - t1)
     * then flow is interpolated in time between the same pair.
     */
    static VolumeBinGrid resamplePhase(const PhaseSegment& phase, int intervals);

    BreathVolumeBins resampleBreath(const Breath& breath) const;

    /**
     * @brief Nội suy tất cả các nhịp (tuần tự)
     */
    bool resample(const std::vector<Breath>& breaths,
                  std::vector<BreathVolumeBins>& grids) const;

    const ResamplingConfig& getConfig() const { return m_config; }

private:
    ResamplingConfig m_config;
};

} // namespace fvavg

#endif // FVAVG_RESAMPLING_HPP
