/**
 * @file Waveform.hpp
 * @brief Raw respiratory waveform container (time, volume, flow)
 *
 * Dữ liệu đầu vào của toàn bộ pipeline: ba dãy số cùng độ dài,
 * lấy mẫu tại các khoảng thời gian cố định (ví dụ 0.01s).
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FVAVG_WAVEFORM_HPP
#define FVAVG_WAVEFORM_HPP

#include "fvavg/Common.h"

#include <string>
#include <vector>

namespace fvavg {

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct Waveform
 * @brief Dạng sóng hô hấp hoàn chỉnh, lưu dạng structure-of-arrays
 *
 * The three sequences are aligned index-for-index. The container is
 * treated as immutable once handed to the analysis pipeline.
 */
struct Waveform {
    std::vector<double> time;       ///< Thời gian, tăng dần nghiêm ngặt
    std::vector<double> volume;     ///< Thể tích
    std::vector<double> flow;       ///< Lưu lượng
    std::string sourceName;         ///< Tên nguồn (file) để truy vết

    size_t size() const { return flow.size(); }
    bool empty() const { return flow.empty(); }

    void append(double t, double v, double f) {
        time.push_back(t);
        volume.push_back(v);
        flow.push_back(f);
    }

    void reserve(size_t n) {
        time.reserve(n);
        volume.reserve(n);
        flow.reserve(n);
    }

    void clear() {
        time.clear();
        volume.clear();
        flow.clear();
        sourceName.clear();
    }
};

// ============================================================================
// VALIDATION
// ============================================================================

/**
 * @brief Kiểm tra cấu trúc dạng sóng trước khi phân tích
 *
 * Fails when the three sequences differ in length, hold fewer than 2
 * samples, contain non-finite values, or time is not strictly increasing.
 *
 * @param waveform Dạng sóng cần kiểm tra
 * @param errorMessage Mô tả lỗi (nếu có)
 * @return true nếu dạng sóng hợp lệ
 */
bool validateWaveform(const Waveform& waveform, std::string& errorMessage);

/**
 * @brief Ước lượng chu kỳ lấy mẫu danh định (median của dt)
 * @return 0.0 nếu có ít hơn 2 mẫu
 */
double estimateSampleInterval(const Waveform& waveform);

} // namespace fvavg

#endif // FVAVG_WAVEFORM_HPP
