/**
 * @file BreathSegmenter.hpp
 * @brief Partition a waveform into breaths using validated zero crossings
 *
 * Mỗi nhịp thở gồm hai pha: hít vào (Inspiration) và thở ra (Expiration).
 * Mỗi pha được giới hạn bởi hai điểm giao cắt không liên tiếp; dữ liệu
 * của pha = điểm biên đầu (nội suy) + các mẫu gốc nằm giữa + điểm biên cuối.
 *
 * The segmenter never mutates its inputs: phases are built from explicit
 * boundary indices over the immutable waveform, so re-running it on the
 * same input is deterministic.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_BREATH_SEGMENTER_HPP
#define FVAVG_BREATH_SEGMENTER_HPP

#include "fvavg/Common.h"
#include "fvavg/Waveform.hpp"
#include "fvavg/ZeroCrossing.hpp"

#include <string>
#include <vector>

namespace fvavg {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Số điểm tối thiểu của một pha (bao gồm hai điểm biên)
constexpr size_t DEFAULT_MIN_PHASE_POINTS = 2;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct SegmenterConfig
 * @brief Cấu hình cho bộ phân đoạn nhịp thở
 */
struct SegmenterConfig {
    FlowSign inspirationSign = FlowSign::NEGATIVE;
    size_t minPhasePoints = DEFAULT_MIN_PHASE_POINTS;
    bool verbose = false;

    SegmenterConfig() = default;
};

/**
 * @struct PhaseSegment
 * @brief Dữ liệu của một pha (hít vào hoặc thở ra)
 *
 * Point 0 and the last point are the interpolated zero-flow boundaries
 * (flow = 0). Times are absolute waveform times.
 */
struct PhaseSegment {
    std::vector<double> time;       ///< Thời gian (tuyệt đối)
    std::vector<double> volume;     ///< Thể tích
    std::vector<double> flow;       ///< Lưu lượng
    size_t firstSampleIndex;        ///< Chỉ số mẫu gốc đầu tiên bên trong pha
    size_t lastSampleIndex;         ///< Chỉ số mẫu gốc cuối cùng bên trong pha

    PhaseSegment() : firstSampleIndex(0), lastSampleIndex(0) {}

    size_t size() const { return time.size(); }
    bool empty() const { return time.empty(); }

    double startTime() const { return time.front(); }
    double endTime() const { return time.back(); }
    double startVolume() const { return volume.front(); }
    double endVolume() const { return volume.back(); }

    /// Thời lượng pha (giây)
    double duration() const { return time.empty() ? 0.0 : time.back() - time.front(); }

    /// Thể tích khí lưu thông của pha: |V(cuối) - V(đầu)|
    double tidalVolume() const {
        return volume.empty() ? 0.0 : std::fabs(volume.back() - volume.front());
    }
};

/**
 * @struct Breath
 * @brief Một nhịp thở hoàn chỉnh: hít vào rồi thở ra
 */
struct Breath {
    size_t index;                   ///< Số thứ tự (theo thời gian, bắt đầu từ 0)
    PhaseSegment inspiration;       ///< Pha hít vào
    PhaseSegment expiration;        ///< Pha thở ra

    Breath() : index(0) {}

    const PhaseSegment& phase(BreathPhase which) const {
        return (which == BreathPhase::INSPIRATION) ? inspiration : expiration;
    }

    double totalDuration() const { return inspiration.duration() + expiration.duration(); }
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class BreathSegmenter
 * @brief Chuyển danh sách sự kiện giao cắt không thành danh sách nhịp thở
 *
 * A breath spans three consecutive events: E0 (inspiration start, whose
 * direction matches the inspiration sign convention), E1 (inspiration end
 * and expiration start) and E2 (expiration end). E2 starts the next
 * breath. Partial breaths at either end of the recording are dropped.
 */
class BreathSegmenter {
public:
    explicit BreathSegmenter(const SegmenterConfig& config = SegmenterConfig());

    /**
     * @brief Phân đoạn dạng sóng thành các nhịp thở
     *
     * @param waveform Dạng sóng gốc (không bị thay đổi)
     * @param events Các sự kiện giao cắt không, theo thứ tự thời gian
     * @param breaths Vector nhịp thở (output, bị xóa trước)
     * @return Số nhịp thở hợp lệ
     */
    size_t segment(const Waveform& waveform,
                   const std::vector<ZeroCrossingEvent>& events,
                   std::vector<Breath>& breaths) const;

    /**
     * @brief Cắt một pha giữa hai sự kiện liên tiếp
     *
     * Builds [start boundary] + samples (start.sampleIndex, end.sampleIndex]
     * + [end boundary].
     */
    static PhaseSegment extractPhase(const Waveform& waveform,
                                     const ZeroCrossingEvent& start,
                                     const ZeroCrossingEvent& end);

    /**
     * @brief Kiểm tra một pha có dùng được cho nội suy hay không
     * @param reason Lý do không hợp lệ (nếu có)
     */
    bool isPhaseUsable(const PhaseSegment& phase, std::string& reason) const;

    /**
     * @brief Tạo dạng sóng "zeroed": mẫu gốc xen kẽ các điểm flow = 0 nội suy
     *
     * Non-destructive merge of the raw samples and the event boundary
     * points, in time order.
     */
    static Waveform buildZeroedWaveform(const Waveform& waveform,
                                        const std::vector<ZeroCrossingEvent>& events);

    const SegmenterConfig& getConfig() const { return m_config; }

private:
    SegmenterConfig m_config;
};

} // namespace fvavg

#endif // FVAVG_BREATH_SEGMENTER_HPP
