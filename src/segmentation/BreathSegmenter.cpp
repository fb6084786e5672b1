/**
 * @file BreathSegmenter.cpp
 * @brief Implementation of breath segmentation
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/BreathSegmenter.hpp"

#include <iostream>

namespace fvavg {

BreathSegmenter::BreathSegmenter(const SegmenterConfig& config)
    : m_config(config)
{
}

// ============================================================================
// SEGMENTATION
// ============================================================================

size_t BreathSegmenter::segment(const Waveform& waveform,
                                const std::vector<ZeroCrossingEvent>& events,
                                std::vector<Breath>& breaths) const {
    /**
     * Quy trình:
     * 1. Bỏ qua các sự kiện đầu cho đến sự kiện bắt đầu hít vào
     * 2. Mỗi nhịp dùng 3 sự kiện liên tiếp E0 -> E1 -> E2
     * 3. Loại nhịp nếu một trong hai pha không hợp lệ
     * 4. E2 là điểm bắt đầu của nhịp kế tiếp
     */

    breaths.clear();

    const CrossingDirection inspStart = inspirationStartDirection(m_config.inspirationSign);

    size_t e = 0;
    while (e < events.size() && events[e].direction != inspStart) {
        e++;
    }

    size_t ordinal = 0;
    size_t dropped = 0;

    while (e + 2 < events.size()) {
        const ZeroCrossingEvent& e0 = events[e];
        const ZeroCrossingEvent& e1 = events[e + 1];
        const ZeroCrossingEvent& e2 = events[e + 2];

        // Sự kiện phải luân phiên; nếu không, tìm lại điểm bắt đầu hít vào
        if (e0.direction != inspStart || e1.direction == inspStart ||
            e2.direction != inspStart) {
            e++;
            continue;
        }

        Breath breath;
        breath.inspiration = extractPhase(waveform, e0, e1);
        breath.expiration = extractPhase(waveform, e1, e2);

        std::string reason;
        if (!isPhaseUsable(breath.inspiration, reason)) {
            std::cerr << "[BreathSegmenter] Warning: dropping breath candidate " << ordinal
                      << " (inspiration " << reason << ")" << std::endl;
            dropped++;
        } else if (!isPhaseUsable(breath.expiration, reason)) {
            std::cerr << "[BreathSegmenter] Warning: dropping breath candidate " << ordinal
                      << " (expiration " << reason << ")" << std::endl;
            dropped++;
        } else {
            breath.index = breaths.size();
            breaths.push_back(std::move(breath));
        }

        ordinal++;
        e += 2;
    }

    if (m_config.verbose) {
        std::cout << "[BreathSegmenter] " << events.size() << " events -> "
                  << breaths.size() << " breaths (" << dropped << " dropped)" << std::endl;
    }

    return breaths.size();
}

PhaseSegment BreathSegmenter::extractPhase(const Waveform& waveform,
                                           const ZeroCrossingEvent& start,
                                           const ZeroCrossingEvent& end) {
    PhaseSegment phase;

    const size_t first = start.sampleIndex + 1;
    const size_t last = end.sampleIndex;
    const size_t interior = (last >= first) ? (last - first + 1) : 0;

    phase.time.reserve(interior + 2);
    phase.volume.reserve(interior + 2);
    phase.flow.reserve(interior + 2);

    // Điểm biên đầu (flow = 0)
    phase.time.push_back(start.time);
    phase.volume.push_back(start.volume);
    phase.flow.push_back(0.0);

    // Các mẫu gốc nằm giữa hai điểm biên
    for (size_t k = first; k <= last && k < waveform.size(); ++k) {
        phase.time.push_back(waveform.time[k]);
        phase.volume.push_back(waveform.volume[k]);
        phase.flow.push_back(waveform.flow[k]);
    }

    // Điểm biên cuối (flow = 0)
    phase.time.push_back(end.time);
    phase.volume.push_back(end.volume);
    phase.flow.push_back(0.0);

    phase.firstSampleIndex = first;
    phase.lastSampleIndex = last;

    return phase;
}

bool BreathSegmenter::isPhaseUsable(const PhaseSegment& phase, std::string& reason) const {
    if (phase.size() < m_config.minPhasePoints || phase.size() < 2) {
        reason = "has fewer than " + std::to_string(m_config.minPhasePoints) + " points";
        return false;
    }
    if (phase.duration() <= 0.0) {
        reason = "has zero duration";
        return false;
    }
    // Vt = 0 làm phép chuẩn hóa theo thể tích khí lưu thông không xác định
    if (phase.tidalVolume() < EPSILON) {
        reason = "has zero tidal volume";
        return false;
    }
    return true;
}

// ============================================================================
// ZEROED WAVEFORM
// ============================================================================

Waveform BreathSegmenter::buildZeroedWaveform(const Waveform& waveform,
                                              const std::vector<ZeroCrossingEvent>& events) {
    Waveform zeroed;
    zeroed.sourceName = waveform.sourceName;
    zeroed.reserve(waveform.size() + events.size());

    size_t e = 0;
    for (size_t i = 0; i < waveform.size(); ++i) {
        zeroed.append(waveform.time[i], waveform.volume[i], waveform.flow[i]);

        // Chèn điểm flow = 0 nằm giữa mẫu i và i+1
        while (e < events.size() && events[e].sampleIndex == i) {
            zeroed.append(events[e].time, events[e].volume, 0.0);
            e++;
        }
    }

    return zeroed;
}

} // namespace fvavg
