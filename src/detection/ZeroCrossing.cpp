/**
 * @file ZeroCrossing.cpp
 * @brief Implementation of zero-flow crossing detection
 *
 * Triển khai thuật toán phát hiện điểm giao cắt không với hai cửa sổ
 * xác thực (nhìn trước 30 mẫu, nhìn lại 20 mẫu lệch 41 mẫu).
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/ZeroCrossing.hpp"

#include <algorithm>

#include <iostream>

namespace fvavg {

ZeroCrossingDetector::ZeroCrossingDetector(const DetectorConfig& config)
    : m_config(config)
{
}

// ============================================================================
// MAIN DETECTION LOOP
// ============================================================================

size_t ZeroCrossingDetector::detect(const Waveform& waveform,
                                    std::vector<ZeroCrossingEvent>& events) const {
    /**
     * Thuật toán:
     * 1. Với mỗi cặp mẫu kề nhau (i, i+1) có flow đổi dấu nghiêm ngặt
     * 2. Xác thực bằng cửa sổ nhìn trước và nhìn lại
     * 3. Nội suy thời điểm flow = 0 và thể tích tại đó
     * 4. Bỏ qua sự kiện trùng hướng với sự kiện trước (giữ tính luân phiên)
     */

    events.clear();

    const std::vector<double>& flow = waveform.flow;
    const size_t n = flow.size();
    if (n < 2) {
        return 0;
    }

    size_t candidates = 0;
    size_t rejected = 0;
    size_t repeated = 0;

    for (size_t i = 0; i + 1 < n; ++i) {
        CrossingDirection direction;

        if (flow[i] < 0.0 && flow[i + 1] > 0.0) {
            direction = CrossingDirection::NEG_TO_POS;
        } else if (flow[i] > 0.0 && flow[i + 1] < 0.0) {
            direction = CrossingDirection::POS_TO_NEG;
        } else {
            continue;
        }

        candidates++;

        if (!passesLookAhead(flow, i, direction) || !passesLookBack(flow, i, direction)) {
            rejected++;
            continue;
        }

        if (!events.empty() && events.back().direction == direction) {
            repeated++;
            continue;
        }

        events.push_back(interpolateCrossing(waveform, i, direction));
    }

    if (m_config.verbose) {
        std::cout << "[ZeroCrossingDetector] " << candidates << " sign changes, "
                  << events.size() << " validated, " << rejected << " rejected, "
                  << repeated << " repeated direction" << std::endl;
    }

    return events.size();
}

// ============================================================================
// VALIDATION WINDOWS
// ============================================================================

bool ZeroCrossingDetector::passesLookAhead(const std::vector<double>& flow, size_t i,
                                           CrossingDirection direction) const {
    // Cửa sổ nhìn trước: i+2 ... i+1+lookAhead
    // So sánh theo số mẫu còn lại để i + 1 + lookAhead không tràn số
    if (i + 1 >= flow.size() || m_config.lookAheadSamples >= flow.size() - i - 1) {
        return false;
    }
    const size_t first = i + 2;
    const size_t last = i + 1 + m_config.lookAheadSamples;

    for (size_t k = first; k <= last; ++k) {
        bool sameSign = (direction == CrossingDirection::NEG_TO_POS)
            ? (flow[k] > 0.0)
            : (flow[k] < 0.0);
        if (!sameSign) {
            return false;
        }
    }
    return true;
}

bool ZeroCrossingDetector::passesLookBack(const std::vector<double>& flow, size_t i,
                                          CrossingDirection direction) const {
    // Cửa sổ nhìn lại: i-offset ... i-offset-width+1, chỉ dùng các mẫu tồn tại
    double sum = 0.0;
    size_t count = 0;

    if (m_config.lookBackOffset <= i) {
        // Mẫu xa nhất tồn tại là flow[0], tức j = i - offset
        const size_t available = i - m_config.lookBackOffset + 1;
        const size_t width = std::min(m_config.lookBackWidth, available);
        for (size_t j = 0; j < width; ++j) {
            sum += flow[i - m_config.lookBackOffset - j];
            count++;
        }
    }

    if (count == 0) {
        return false;
    }

    double mean = sum / static_cast<double>(count);
    return (direction == CrossingDirection::NEG_TO_POS) ? (mean < 0.0) : (mean > 0.0);
}

// ============================================================================
// INTERPOLATION
// ============================================================================

ZeroCrossingEvent ZeroCrossingDetector::interpolateCrossing(const Waveform& waveform,
                                                            size_t i,
                                                            CrossingDirection direction) {
    /**
     * Nội suy tuyến tính flow theo thời gian:
     *   frac = (0 - f1) / (f2 - f1)      (0 < frac < 1 vì f1, f2 trái dấu)
     *   t0   = t1 + frac * (t2 - t1)
     *   v0   = v1 + frac * (v2 - v1)
     */
    const double t1 = waveform.time[i];
    const double t2 = waveform.time[i + 1];
    const double v1 = waveform.volume[i];
    const double v2 = waveform.volume[i + 1];
    const double f1 = waveform.flow[i];
    const double f2 = waveform.flow[i + 1];

    const double frac = -f1 / (f2 - f1);

    ZeroCrossingEvent event;
    event.time = t1 + frac * (t2 - t1);
    event.volume = v1 + frac * (v2 - v1);
    event.direction = direction;
    event.sampleIndex = i;
    event.interpolated = true;
    return event;
}

} // namespace fvavg
