/**
 * @file Common.h
 * @brief Common definitions and types for Flow-Volume Averaging
 *
 * Chứa các định nghĩa chung, types, và constants được sử dụng
 * xuyên suốt dự án.
 */

#ifndef FVAVG_COMMON_H
#define FVAVG_COMMON_H

#include <cstddef>
#include <cstdint>
#include <vector>
#include <string>
#include <cmath>
#include <limits>

namespace fvavg {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Epsilon để tránh chia cho 0
constexpr double EPSILON = 1e-12;

/// Giá trị "không xác định" cho thống kê (std/SEM khi n < 2)
constexpr double UNDEFINED_VALUE = std::numeric_limits<double>::quiet_NaN();

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @enum CrossingDirection
 * @brief Hướng đổi dấu của flow tại điểm giao cắt không
 */
enum class CrossingDirection {
    NEG_TO_POS = 0,       ///< flow[i] < 0 < flow[i+1]
    POS_TO_NEG = 1        ///< flow[i] > 0 > flow[i+1]
};

/**
 * @enum FlowSign
 * @brief Quy ước dấu của flow trong pha hít vào
 */
enum class FlowSign {
    NEGATIVE = 0,         ///< Hít vào = flow âm (mặc định)
    POSITIVE = 1          ///< Hít vào = flow dương
};

/**
 * @enum BreathPhase
 * @brief Pha của một nhịp thở
 */
enum class BreathPhase {
    INSPIRATION = 0,      ///< Hít vào
    EXPIRATION = 1        ///< Thở ra
};

/**
 * @enum AnalysisStatus
 * @brief Kết quả tổng thể của một lần phân tích
 *
 * NO_BREATHS_DETECTED is not a failure: the waveform was valid but no
 * complete breath survived detection and segmentation.
 */
enum class AnalysisStatus {
    OK = 0,
    NO_BREATHS_DETECTED = 1,
    MALFORMED_INPUT = 2,
    INVALID_CONFIG = 3,
    IO_ERROR = 4,
    CANCELLED = 5
};

/**
 * @enum ProcessingStage
 * @brief Các giai đoạn xử lý trong pipeline
 */
enum class ProcessingStage {
    LOADING = 0,          ///< Đang tải file
    VALIDATING = 1,       ///< Kiểm tra dữ liệu đầu vào
    DETECTING = 2,        ///< Tìm điểm giao cắt không
    SEGMENTING = 3,       ///< Phân đoạn nhịp thở
    TIME_BINNING = 4,     ///< Nội suy theo thời gian
    VOLUME_BINNING = 5,   ///< Nội suy theo thể tích
    AGGREGATING = 6,      ///< Tính trung bình / SEM
    COMPLETE = 7          ///< Hoàn thành
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline std::string phaseToString(BreathPhase phase) {
    switch (phase) {
        case BreathPhase::INSPIRATION: return "Insp";
        case BreathPhase::EXPIRATION: return "Exp";
        default: return "Unknown";
    }
}

/**
 * @brief Chuyển đổi AnalysisStatus sang string
 */
inline std::string statusToString(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::OK: return "OK";
        case AnalysisStatus::NO_BREATHS_DETECTED: return "No breaths detected";
        case AnalysisStatus::MALFORMED_INPUT: return "Malformed input";
        case AnalysisStatus::INVALID_CONFIG: return "Invalid configuration";
        case AnalysisStatus::IO_ERROR: return "I/O error";
        case AnalysisStatus::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

/**
 * @brief Chuyển đổi ProcessingStage sang string
 */
inline std::string stageToString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::LOADING: return "Loading";
        case ProcessingStage::VALIDATING: return "Validating";
        case ProcessingStage::DETECTING: return "Zero-Crossing Detection";
        case ProcessingStage::SEGMENTING: return "Segmenting";
        case ProcessingStage::TIME_BINNING: return "Time Bins";
        case ProcessingStage::VOLUME_BINNING: return "Volume Bins";
        case ProcessingStage::AGGREGATING: return "Aggregating";
        case ProcessingStage::COMPLETE: return "Complete";
        default: return "Unknown Stage";
    }
}

/**
 * @brief Hướng crossing bắt đầu pha hít vào theo quy ước dấu
 *
 * Inspiration with negative flow starts where flow leaves the positive
 * side, i.e. at a POS_TO_NEG crossing.
 */
inline CrossingDirection inspirationStartDirection(FlowSign inspirationSign) {
    return (inspirationSign == FlowSign::NEGATIVE)
        ? CrossingDirection::POS_TO_NEG
        : CrossingDirection::NEG_TO_POS;
}

/**
 * @brief Nội suy tuyến tính y tại x giữa (x1, y1) và (x2, y2)
 *
 * value = y1 + ((y2 - y1) / (x2 - x1)) * (x - x1)
 * Trả về y1 nếu x2 == x1 (đoạn suy biến).
 */
inline double interpolateLinear(double x1, double y1, double x2, double y2, double x) {
    double dx = x2 - x1;
    if (std::fabs(dx) < EPSILON) {
        return y1;
    }
    return y1 + ((y2 - y1) / dx) * (x - x1);
}

} // namespace fvavg

#endif // FVAVG_COMMON_H
