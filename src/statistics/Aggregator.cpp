/**
 * @file Aggregator.cpp
 * @brief Implementation of cross-breath statistics
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/Aggregator.hpp"

#include <cmath>
#include <iostream>

namespace fvavg {

// ============================================================================
// CORE STATISTICS
// ============================================================================

AggregateRecord summarize(const std::vector<double>& values) {
    AggregateRecord record;
    const size_t n = values.size();
    record.count = n;
    if (n == 0) {
        return record;
    }

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    record.mean = sum / static_cast<double>(n);

    if (n < 2) {
        return record;
    }

    double sumSq = 0.0;
    for (double v : values) {
        double diff = v - record.mean;
        sumSq += diff * diff;
    }
    record.stdDev = std::sqrt(sumSq / static_cast<double>(n - 1));
    record.sem = record.stdDev / std::sqrt(static_cast<double>(n));

    return record;
}

bool aggregate(const std::vector<const std::vector<double>*>& grids,
               AggregateSeries& series, double offset) {
    series.records.clear();

    if (grids.empty() || grids.front() == nullptr) {
        return false;
    }

    const size_t length = grids.front()->size();
    for (const std::vector<double>* grid : grids) {
        if (grid == nullptr || grid->size() != length) {
            std::cerr << "[Aggregator] Error: grid length mismatch in series '"
                      << series.label << "'" << std::endl;
            return false;
        }
    }

    series.records.reserve(length);
    std::vector<double> column(grids.size());

    for (size_t j = 0; j < length; ++j) {
        for (size_t b = 0; b < grids.size(); ++b) {
            column[b] = (*grids[b])[j];
        }
        AggregateRecord record = summarize(column);
        record.mean += offset;
        series.records.push_back(record);
    }

    return true;
}

// ============================================================================
// UNIT CONVERSION
// ============================================================================

AggregateSeries rescaleToAbsolute(const AggregateSeries& series, double scale) {
    AggregateSeries scaled;
    scaled.label = series.label + "_abs";
    scaled.records.reserve(series.size());

    const double factor = scale / 100.0;
    for (const AggregateRecord& r : series.records) {
        AggregateRecord out = r;
        out.mean = r.mean * factor;
        out.stdDev = r.stdDev * factor;
        out.sem = r.sem * factor;
        scaled.records.push_back(out);
    }
    return scaled;
}

double toPercentOfCapacity(double value, double capacity) {
    if (std::fabs(capacity) < EPSILON) {
        return UNDEFINED_VALUE;
    }
    return value * 100.0 / capacity;
}

AggregateSeries concatenateSeries(const AggregateSeries& first, const AggregateSeries& second) {
    AggregateSeries combined;
    combined.label = first.label + "+" + second.label;
    combined.records.reserve(first.size() + second.size());
    combined.records.insert(combined.records.end(), first.records.begin(), first.records.end());
    combined.records.insert(combined.records.end(), second.records.begin(), second.records.end());
    return combined;
}

// ============================================================================
// PER-METHOD AVERAGING
// ============================================================================

bool averageTimeBins(const TimeBinSet& set, TimeBinAverages& averages) {
    averages = TimeBinAverages();
    if (set.breaths.empty()) {
        return false;
    }
    if (!set.normalized) {
        std::cerr << "[Aggregator] Error: time bins must be normalised before averaging" << std::endl;
        return false;
    }

    std::vector<const std::vector<double>*> inspNorm, expNorm, inspRaw, expRaw, inspFlow, expFlow;
    for (const BreathTimeBins& b : set.breaths) {
        inspNorm.push_back(&b.normalizedInspVolume);
        expNorm.push_back(&b.normalizedExpVolume);
        inspRaw.push_back(&b.inspiration.volume);
        expRaw.push_back(&b.expiration.volume);
        inspFlow.push_back(&b.inspiration.flow);
        expFlow.push_back(&b.expiration.flow);
    }

    averages.meanShift = set.meanShift;
    averages.inspVolume.label = "Insp_Volume";
    averages.expVolume.label = "Exp_Volume";
    averages.inspVolumeRaw.label = "Insp_Volume_Raw";
    averages.expVolumeRaw.label = "Exp_Volume_Raw";
    averages.inspFlow.label = "Insp_Flow";
    averages.expFlow.label = "Exp_Flow";

    // Mean_shift chỉ cộng vào thể tích đã chuẩn hóa
    return aggregate(inspNorm, averages.inspVolume, set.meanShift)
        && aggregate(expNorm, averages.expVolume, set.meanShift)
        && aggregate(inspRaw, averages.inspVolumeRaw)
        && aggregate(expRaw, averages.expVolumeRaw)
        && aggregate(inspFlow, averages.inspFlow)
        && aggregate(expFlow, averages.expFlow);
}

bool averageVolumeBins(const std::vector<BreathVolumeBins>& grids, VolumeBinAverages& averages) {
    averages = VolumeBinAverages();
    if (grids.empty()) {
        return false;
    }

    std::vector<const std::vector<double>*> inspVol, expVol, inspTime, expTime, inspFlow, expFlow;
    for (const BreathVolumeBins& b : grids) {
        inspVol.push_back(&b.inspiration.volume);
        expVol.push_back(&b.expiration.volume);
        inspTime.push_back(&b.inspiration.time);
        expTime.push_back(&b.expiration.time);
        inspFlow.push_back(&b.inspiration.flow);
        expFlow.push_back(&b.expiration.flow);
    }

    averages.inspVolume.label = "Insp_Volume";
    averages.expVolume.label = "Exp_Volume";
    averages.inspTime.label = "Insp_Time";
    averages.expTime.label = "Exp_Time";
    averages.inspFlow.label = "Insp_Flow";
    averages.expFlow.label = "Exp_Flow";

    return aggregate(inspVol, averages.inspVolume)
        && aggregate(expVol, averages.expVolume)
        && aggregate(inspTime, averages.inspTime)
        && aggregate(expTime, averages.expTime)
        && aggregate(inspFlow, averages.inspFlow)
        && aggregate(expFlow, averages.expFlow);
}

void applyCapacityScale(TimeBinAverages& averages, double scale) {
    averages.hasAbsolute = scale > 0.0;
    if (!averages.hasAbsolute) {
        averages.inspVolumeAbsolute = AggregateSeries();
        averages.expVolumeAbsolute = AggregateSeries();
        return;
    }
    averages.inspVolumeAbsolute = rescaleToAbsolute(averages.inspVolume, scale);
    averages.expVolumeAbsolute = rescaleToAbsolute(averages.expVolume, scale);
}

void applyCapacityScale(VolumeBinAverages& averages, double scale) {
    averages.hasAbsolute = scale > 0.0;
    if (!averages.hasAbsolute) {
        averages.inspVolumeAbsolute = AggregateSeries();
        averages.expVolumeAbsolute = AggregateSeries();
        return;
    }
    averages.inspVolumeAbsolute = rescaleToAbsolute(averages.inspVolume, scale);
    averages.expVolumeAbsolute = rescaleToAbsolute(averages.expVolume, scale);
}

} // namespace fvavg
