/**
 * @file VolumeBins.cpp
 * @brief Volume-bin resampling
 *
 * Khác với time bins, các mốc ở đây cách đều theo thể tích nên pha có
 * lưu lượng thấp ở cuối (plateau) được lấy mẫu thưa hơn theo thời gian.
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/Resampling.hpp"

#include <algorithm>
#include <iostream>

namespace fvavg {

VolumeBinResampler::VolumeBinResampler(const ResamplingConfig& config)
    : m_config(config)
{
}

VolumeBinGrid VolumeBinResampler::resamplePhase(const PhaseSegment& phase, int intervals) {
    VolumeBinGrid grid;
    if (phase.empty() || intervals < 1) {
        return grid;
    }

    const size_t points = static_cast<size_t>(intervals) + 1;
    grid.volume.reserve(points);
    grid.time.reserve(points);
    grid.flow.reserve(points);

    const std::vector<double>& t = phase.time;
    const std::vector<double>& v = phase.volume;
    const std::vector<double>& f = phase.flow;
    const size_t last = phase.size() - 1;

    const double startVolume = phase.startVolume();
    const double endVolume = phase.endVolume();
    const double step = phase.tidalVolume() / static_cast<double>(intervals);
    const double sign = (endVolume >= startVolume) ? 1.0 : -1.0;

    for (size_t j = 0; j < points; ++j) {
        // Mốc cuối đặt đúng bằng thể tích cuối pha (tránh sai số cộng dồn)
        const double target = (j == points - 1)
            ? endVolume
            : startVolume + sign * step * static_cast<double>(j);

        double time = t.front();
        double flow = f.front();
        bool bracketed = false;

        // Cặp mẫu đầu tiên (theo thứ tự mẫu) bao quanh mốc thể tích
        for (size_t k = 0; k < last; ++k) {
            const double lo = std::min(v[k], v[k + 1]);
            const double hi = std::max(v[k], v[k + 1]);
            if (target < lo || target > hi) {
                continue;
            }

            time = interpolateLinear(v[k], t[k], v[k + 1], t[k + 1], target);
            flow = interpolateLinear(t[k], f[k], t[k + 1], f[k + 1], time);
            bracketed = true;
            break;
        }

        if (!bracketed) {
            // Không có cặp bao quanh: kẹp về biên gần nhất
            if (std::fabs(target - startVolume) <= std::fabs(target - endVolume)) {
                time = t.front();
                flow = f.front();
            } else {
                time = t[last];
                flow = f[last];
            }
        }

        grid.volume.push_back(target);
        grid.time.push_back(time - t.front());
        grid.flow.push_back(flow);
    }

    return grid;
}

BreathVolumeBins VolumeBinResampler::resampleBreath(const Breath& breath) const {
    BreathVolumeBins bins;
    bins.breathIndex = breath.index;
    bins.inspiration = resamplePhase(breath.inspiration, m_config.intervals);
    bins.expiration = resamplePhase(breath.expiration, m_config.intervals);
    return bins;
}

bool VolumeBinResampler::resample(const std::vector<Breath>& breaths,
                                  std::vector<BreathVolumeBins>& grids) const {
    grids.clear();
    if (m_config.intervals < 1) {
        std::cerr << "[VolumeBinResampler] Error: intervals must be >= 1, got "
                  << m_config.intervals << std::endl;
        return false;
    }

    grids.reserve(breaths.size());
    for (const Breath& breath : breaths) {
        grids.push_back(resampleBreath(breath));
    }

    if (m_config.verbose) {
        std::cout << "[VolumeBinResampler] " << grids.size() << " breaths resampled on "
                  << (m_config.intervals + 1) << " volume targets per phase" << std::endl;
    }

    return !grids.empty();
}

} // namespace fvavg
