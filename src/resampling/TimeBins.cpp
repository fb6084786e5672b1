/**
 * @file TimeBins.cpp
 * @brief Time-bin resampling and tidal-volume normalisation
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/Resampling.hpp"

#include <iostream>

namespace fvavg {

TimeBinResampler::TimeBinResampler(const ResamplingConfig& config)
    : m_config(config)
{
}

// ============================================================================
// PER-PHASE RESAMPLING
// ============================================================================

TimeBinGrid TimeBinResampler::resamplePhase(const PhaseSegment& phase, int intervals) {
    TimeBinGrid grid;
    if (phase.empty() || intervals < 1) {
        return grid;
    }

    const size_t points = static_cast<size_t>(intervals) + 1;
    grid.time.reserve(points);
    grid.volume.reserve(points);
    grid.flow.reserve(points);

    const std::vector<double>& t = phase.time;
    const double start = phase.startTime();
    const double duration = phase.duration();
    const size_t last = phase.size() - 1;

    // Các mốc tăng dần nên con trỏ k chỉ tiến về phía trước
    size_t k = 0;

    for (size_t j = 0; j < points; ++j) {
        const double relative = duration * static_cast<double>(j) / static_cast<double>(intervals);
        const double target = start + relative;

        double volume;
        double flow;

        if (j == 0 || target <= t.front()) {
            volume = phase.volume.front();
            flow = phase.flow.front();
        } else if (j == points - 1 || target >= t[last]) {
            volume = phase.volume[last];
            flow = phase.flow[last];
        } else {
            while (k + 1 < last && t[k + 1] < target) {
                k++;
            }
            volume = interpolateLinear(t[k], phase.volume[k], t[k + 1], phase.volume[k + 1], target);
            flow = interpolateLinear(t[k], phase.flow[k], t[k + 1], phase.flow[k + 1], target);
        }

        grid.time.push_back(relative);
        grid.volume.push_back(volume);
        grid.flow.push_back(flow);
    }

    return grid;
}

BreathTimeBins TimeBinResampler::resampleBreath(const Breath& breath) const {
    BreathTimeBins bins;
    bins.breathIndex = breath.index;
    bins.inspiration = resamplePhase(breath.inspiration, m_config.intervals);
    bins.expiration = resamplePhase(breath.expiration, m_config.intervals);
    bins.inspTidalVolume = breath.inspiration.tidalVolume();
    bins.expTidalVolume = breath.expiration.tidalVolume();
    bins.inspDuration = breath.inspiration.duration();
    bins.expDuration = breath.expiration.duration();
    return bins;
}

// ============================================================================
// NORMALISATION
// ============================================================================

bool TimeBinResampler::normalize(TimeBinSet& set) const {
    /**
     * Chuẩn hóa:
     *   insp_norm[j] = (V[j] - V_end)   * avgVt_insp / Vt_insp
     *   exp_norm[j]  = (V[j] - V_start) * avgVt_exp  / Vt_exp
     * Mean_shift = sum(V_insp_end + V_exp_start) / (2n)
     */
    set.normalized = false;
    set.meanShift = 0.0;

    const size_t n = set.breaths.size();
    if (n == 0) {
        return false;
    }

    // ----- BƯỚC 1: Vt trung bình mỗi pha -----
    double sumInsp = 0.0;
    double sumExp = 0.0;
    double sumBoundary = 0.0;
    for (const BreathTimeBins& b : set.breaths) {
        sumInsp += b.inspTidalVolume;
        sumExp += b.expTidalVolume;
        if (!b.inspiration.volume.empty() && !b.expiration.volume.empty()) {
            sumBoundary += b.inspiration.volume.back() + b.expiration.volume.front();
        }
    }
    set.avgInspTidalVolume = sumInsp / static_cast<double>(n);
    set.avgExpTidalVolume = sumExp / static_cast<double>(n);

    // ----- BƯỚC 2: Chuẩn hóa từng nhịp -----
    for (BreathTimeBins& b : set.breaths) {
        const double inspScale = (b.inspTidalVolume > EPSILON)
            ? set.avgInspTidalVolume / b.inspTidalVolume : 1.0;
        const double expScale = (b.expTidalVolume > EPSILON)
            ? set.avgExpTidalVolume / b.expTidalVolume : 1.0;

        b.normalizedInspVolume.clear();
        b.normalizedExpVolume.clear();

        if (!b.inspiration.volume.empty()) {
            const double endVolume = b.inspiration.volume.back();
            b.normalizedInspVolume.reserve(b.inspiration.volume.size());
            for (double v : b.inspiration.volume) {
                b.normalizedInspVolume.push_back((v - endVolume) * inspScale);
            }
        }

        if (!b.expiration.volume.empty()) {
            const double startVolume = b.expiration.volume.front();
            b.normalizedExpVolume.reserve(b.expiration.volume.size());
            for (double v : b.expiration.volume) {
                b.normalizedExpVolume.push_back((v - startVolume) * expScale);
            }
        }
    }

    // ----- BƯỚC 3: Mean_shift -----
    if (m_config.applyMeanShift) {
        set.meanShift = m_config.useFixedMeanShift
            ? m_config.fixedMeanShift
            : sumBoundary / (2.0 * static_cast<double>(n));
    }

    set.normalized = true;

    if (m_config.verbose) {
        std::cout << "[TimeBinResampler] " << n << " breaths normalised, avg Vt insp="
                  << set.avgInspTidalVolume << ", exp=" << set.avgExpTidalVolume
                  << ", Mean_shift=" << set.meanShift << std::endl;
    }

    return true;
}

bool TimeBinResampler::resample(const std::vector<Breath>& breaths, TimeBinSet& set) const {
    set = TimeBinSet();
    if (m_config.intervals < 1) {
        std::cerr << "[TimeBinResampler] Error: intervals must be >= 1, got "
                  << m_config.intervals << std::endl;
        return false;
    }

    set.breaths.reserve(breaths.size());
    for (const Breath& breath : breaths) {
        set.breaths.push_back(resampleBreath(breath));
    }

    return normalize(set);
}

} // namespace fvavg
