/**
 * @file Aggregator.hpp
 * @brief Cross-breath statistics over resampled grids
 *
 * Với mỗi chỉ số lưới j (0..intervals) tính trung bình, độ lệch chuẩn
 * mẫu (n-1), sai số chuẩn SEM = std / sqrt(n) và số nhịp đóng góp.
 * std và SEM không xác định (NaN) khi n < 2.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_AGGREGATOR_HPP
#define FVAVG_AGGREGATOR_HPP

#include "fvavg/Common.h"
#include "fvavg/Resampling.hpp"

#include <string>
#include <vector>

namespace fvavg {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct AggregateRecord
 * @brief Thống kê tại một chỉ số lưới
 */
struct AggregateRecord {
    double mean;
    double stdDev;      ///< Độ lệch chuẩn mẫu (n-1), NaN nếu n < 2
    double sem;         ///< std / sqrt(n), NaN nếu n < 2
    size_t count;       ///< Số nhịp đóng góp

    AggregateRecord()
        : mean(UNDEFINED_VALUE), stdDev(UNDEFINED_VALUE)
        , sem(UNDEFINED_VALUE), count(0) {}

    bool hasSpread() const { return count >= 2; }
};

/**
 * @struct AggregateSeries
 * @brief Chuỗi AggregateRecord theo chỉ số lưới
 */
struct AggregateSeries {
    std::string label;
    std::vector<AggregateRecord> records;

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }
};

/**
 * @struct TimeBinAverages
 * @brief Trung bình time-bin cho hai pha
 *
 * inspVolume / expVolume average the Vt-normalised grids with Mean_shift
 * added to the means. The *Raw series average the unnormalised grids.
 */
struct TimeBinAverages {
    AggregateSeries inspVolume;
    AggregateSeries expVolume;
    AggregateSeries inspVolumeRaw;
    AggregateSeries expVolumeRaw;
    AggregateSeries inspFlow;
    AggregateSeries expFlow;
    AggregateSeries inspVolumeAbsolute;     ///< Chỉ có khi capacityScale > 0
    AggregateSeries expVolumeAbsolute;
    double meanShift;
    bool hasAbsolute;

    TimeBinAverages() : meanShift(0.0), hasAbsolute(false) {}
};

/**
 * @struct VolumeBinAverages
 * @brief Trung bình volume-bin cho hai pha (không chuẩn hóa)
 */
struct VolumeBinAverages {
    AggregateSeries inspVolume;
    AggregateSeries expVolume;
    AggregateSeries inspTime;
    AggregateSeries expTime;
    AggregateSeries inspFlow;
    AggregateSeries expFlow;
    AggregateSeries inspVolumeAbsolute;
    AggregateSeries expVolumeAbsolute;
    bool hasAbsolute;

    VolumeBinAverages() : hasAbsolute(false) {}
};

// ============================================================================
// CORE STATISTICS
// ============================================================================

/**
 * @brief Thống kê của một tập giá trị
 *
 * Empty input gives count 0 and NaN everywhere.
 */
AggregateRecord summarize(const std::vector<double>& values);

/**
 * @brief Thống kê theo từng chỉ số qua nhiều lưới cùng độ dài
 *
 * @param grids Các lưới (mỗi nhịp một lưới), phải cùng độ dài
 * @param series Kết quả (output)
 * @param offset Hằng số cộng vào mean (Mean_shift); std/SEM không đổi
 * @return false nếu không có lưới nào hoặc độ dài không khớp
 */
bool aggregate(const std::vector<const std::vector<double>*>& grids,
               AggregateSeries& series, double offset = 0.0);

// ============================================================================
// UNIT CONVERSION
// ============================================================================

/**
 * @brief Chuyển giá trị phần trăm sang đơn vị tuyệt đối: value * scale / 100
 *
 * mean, stdDev and sem are all scaled; NaN stays NaN.
 */
AggregateSeries rescaleToAbsolute(const AggregateSeries& series, double scale);

/**
 * @brief Chuyển đổi ngược: value * 100 / capacity
 * @return NaN nếu capacity = 0
 */
double toPercentOfCapacity(double value, double capacity);

/**
 * @brief Ghép chuỗi hít vào và thở ra thành một chuỗi liên tục
 */
AggregateSeries concatenateSeries(const AggregateSeries& first, const AggregateSeries& second);

// ============================================================================
// PER-METHOD AVERAGING
// ============================================================================

/**
 * @brief Trung bình time-bin (yêu cầu tập đã chuẩn hóa)
 */
bool averageTimeBins(const TimeBinSet& set, TimeBinAverages& averages);

/**
 * @brief Trung bình volume-bin: thể tích mục tiêu, thời gian và flow
 */
bool averageVolumeBins(const std::vector<BreathVolumeBins>& grids, VolumeBinAverages& averages);

/**
 * @brief Thêm bản sao tuyệt đối cho các chuỗi thể tích khi scale > 0
 */
void applyCapacityScale(TimeBinAverages& averages, double scale);
void applyCapacityScale(VolumeBinAverages& averages, double scale);

} // namespace fvavg

#endif // FVAVG_AGGREGATOR_HPP
