/**
 * @file Waveform.cpp
 * @brief Validation helpers for raw respiratory waveforms
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/Waveform.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace fvavg {

// ============================================================================
// VALIDATION
// ============================================================================

bool validateWaveform(const Waveform& waveform, std::string& errorMessage) {
    errorMessage.clear();

    const size_t n = waveform.flow.size();

    // ----- BƯỚC 1: Độ dài các dãy phải khớp nhau -----
    if (waveform.time.size() != n || waveform.volume.size() != n) {
        std::ostringstream oss;
        oss << "Mismatched sequence lengths (time=" << waveform.time.size()
            << ", volume=" << waveform.volume.size()
            << ", flow=" << n << ")";
        errorMessage = oss.str();
        return false;
    }

    // ----- BƯỚC 2: Cần ít nhất 2 mẫu -----
    if (n < 2) {
        std::ostringstream oss;
        oss << "At least 2 samples required, got " << n;
        errorMessage = oss.str();
        return false;
    }

    // ----- BƯỚC 3: Giá trị hữu hạn, thời gian tăng dần -----
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(waveform.time[i]) ||
            !std::isfinite(waveform.volume[i]) ||
            !std::isfinite(waveform.flow[i])) {
            std::ostringstream oss;
            oss << "Non-finite value at sample " << i;
            errorMessage = oss.str();
            return false;
        }

        if (i > 0 && waveform.time[i] <= waveform.time[i - 1]) {
            std::ostringstream oss;
            oss << "Time not strictly increasing at sample " << i
                << " (" << waveform.time[i - 1] << " -> " << waveform.time[i] << ")";
            errorMessage = oss.str();
            return false;
        }
    }

    return true;
}

double estimateSampleInterval(const Waveform& waveform) {
    if (waveform.time.size() < 2) {
        return 0.0;
    }

    std::vector<double> deltas(waveform.time.size() - 1);
    for (size_t i = 1; i < waveform.time.size(); ++i) {
        deltas[i - 1] = waveform.time[i] - waveform.time[i - 1];
    }

    // Median: ít bị ảnh hưởng bởi các khoảng trống trong dữ liệu
    size_t mid = deltas.size() / 2;
    std::nth_element(deltas.begin(), deltas.begin() + mid, deltas.end());
    return deltas[mid];
}

} // namespace fvavg
