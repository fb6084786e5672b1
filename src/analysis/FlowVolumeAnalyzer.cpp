/**
 * @file FlowVolumeAnalyzer.cpp
 * @brief Implementation of the flow-volume averaging pipeline
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/FlowVolumeAnalyzer.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>

#ifdef FVAVG_USE_OPENMP
#include <omp.h>
#endif

namespace fvavg {

namespace {

DetectorConfig makeDetectorConfig(const AnalysisConfig& config) {
    DetectorConfig detector = config.detector;
    detector.verbose = detector.verbose || config.verbose;
    return detector;
}

SegmenterConfig makeSegmenterConfig(const AnalysisConfig& config) {
    SegmenterConfig segmenter = config.segmenter;
    segmenter.verbose = segmenter.verbose || config.verbose;
    return segmenter;
}

ResamplingConfig makeResamplingConfig(const AnalysisConfig& config) {
    ResamplingConfig resampling = config.resampling;
    resampling.verbose = resampling.verbose || config.verbose;
    return resampling;
}

} // anonymous namespace

// ============================================================================
// CONFIGURATION
// ============================================================================

bool AnalysisConfig::validate(std::string& errorMessage) const {
    std::ostringstream oss;

    if (resampling.intervals < 1) {
        oss << "intervals must be >= 1 (got " << resampling.intervals << ")";
    } else if (detector.lookAheadSamples == 0) {
        oss << "look-ahead window must hold at least 1 sample";
    } else if (detector.lookAheadSamples > MAX_WINDOW_SAMPLES) {
        oss << "look-ahead window must not exceed " << MAX_WINDOW_SAMPLES
            << " samples (got " << detector.lookAheadSamples << ")";
    } else if (detector.lookBackWidth == 0) {
        oss << "look-back window must hold at least 1 sample";
    } else if (detector.lookBackWidth > MAX_WINDOW_SAMPLES ||
               detector.lookBackOffset > MAX_WINDOW_SAMPLES) {
        oss << "look-back width and offset must not exceed " << MAX_WINDOW_SAMPLES
            << " samples (got " << detector.lookBackWidth << " @ "
            << detector.lookBackOffset << ")";
    } else if (segmenter.minPhasePoints < 2) {
        oss << "minimum phase points must be >= 2 (got " << segmenter.minPhasePoints << ")";
    } else if (capacityScale < 0.0) {
        oss << "capacity scale must not be negative (got " << capacityScale << ")";
    }

    errorMessage = oss.str();
    return errorMessage.empty();
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

FlowVolumeAnalyzer::FlowVolumeAnalyzer(const AnalysisConfig& config)
    : m_config(config)
    , m_detector(makeDetectorConfig(config))
    , m_segmenter(makeSegmenterConfig(config))
    , m_timeBins(makeResamplingConfig(config))
    , m_volumeBins(makeResamplingConfig(config))
{
}

// ============================================================================
// MAIN PIPELINE
// ============================================================================

bool FlowVolumeAnalyzer::processFile(const std::string& filePath, AnalysisResult& result) const {
    result.clear();
    logStage(ProcessingStage::LOADING);

    ReaderConfig readerConfig = m_config.reader;
    readerConfig.verbose = readerConfig.verbose || m_config.verbose;
    WaveformReader reader(readerConfig);

    Waveform waveform;
    if (!reader.readFile(filePath, waveform)) {
        result.sourceName = filePath;
        return fail(result, AnalysisStatus::IO_ERROR, "Cannot read waveform from " + filePath);
    }

    return analyze(waveform, result);
}

bool FlowVolumeAnalyzer::analyze(const Waveform& waveform, AnalysisResult& result) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    result.clear();
    result.sourceName = waveform.sourceName;

    // ----- BƯỚC 1: Kiểm tra cấu hình và dữ liệu -----
    logStage(ProcessingStage::VALIDATING);

    std::string error;
    if (!m_config.validate(error)) {
        return fail(result, AnalysisStatus::INVALID_CONFIG, error);
    }
    if (!validateWaveform(waveform, error)) {
        return fail(result, AnalysisStatus::MALFORMED_INPUT, error);
    }
    if (m_config.verbose) {
        std::cout << "[FlowVolumeAnalyzer] " << waveform.size() << " samples, dt ~ "
                  << estimateSampleInterval(waveform) << " s" << std::endl;
    }

    // ----- BƯỚC 2: Phát hiện giao cắt không -----
    logStage(ProcessingStage::DETECTING);
    m_detector.detect(waveform, result.events);
    result.zeroed = BreathSegmenter::buildZeroedWaveform(waveform, result.events);

    // ----- BƯỚC 3: Phân đoạn nhịp thở -----
    logStage(ProcessingStage::SEGMENTING);
    m_segmenter.segment(waveform, result.events, result.breaths);

    if (result.breaths.empty()) {
        result.status = AnalysisStatus::NO_BREATHS_DETECTED;
        std::ostringstream oss;
        oss << "No complete breath found (" << result.events.size() << " zero crossings)";
        result.message = oss.str();
        std::cout << "[FlowVolumeAnalyzer] " << result.message << std::endl;
        return true;
    }

    // ----- BƯỚC 4: Nội suy time bins và volume bins -----
    logStage(ProcessingStage::TIME_BINNING);
    logStage(ProcessingStage::VOLUME_BINNING);
    if (!resampleBreaths(result)) {
        return false;
    }

    // ----- BƯỚC 5: Thống kê -----
    logStage(ProcessingStage::AGGREGATING);
    summarizeBreaths(result);

    if (!averageTimeBins(result.timeBins, result.timeBinAverages) ||
        !averageVolumeBins(result.volumeBins, result.volumeBinAverages)) {
        // Lưới luôn có cùng độ dài intervals + 1, lỗi ở đây là lỗi nội bộ
        return fail(result, AnalysisStatus::MALFORMED_INPUT, "Cannot aggregate resampled grids");
    }

    applyCapacityScale(result.timeBinAverages, m_config.capacityScale);
    applyCapacityScale(result.volumeBinAverages, m_config.capacityScale);

    auto endTime = std::chrono::high_resolution_clock::now();
    result.processingTimeMs = std::chrono::duration<float, std::milli>(
        endTime - startTime).count();

    result.status = AnalysisStatus::OK;
    std::ostringstream oss;
    oss << result.breaths.size() << " breaths averaged";
    result.message = oss.str();

    logStage(ProcessingStage::COMPLETE);
    if (m_config.verbose) {
        std::cout << "[FlowVolumeAnalyzer] " << result.message << " in "
                  << result.processingTimeMs << " ms" << std::endl;
    }

    return true;
}

// ============================================================================
// STAGES
// ============================================================================

bool FlowVolumeAnalyzer::resampleBreaths(AnalysisResult& result) const {
    const int count = static_cast<int>(result.breaths.size());

    std::vector<BreathTimeBins> timeBins(count);
    std::vector<BreathVolumeBins> volumeBins(count);

    std::atomic<bool> cancelled(false);
    size_t completed = 0;

#ifdef FVAVG_USE_OPENMP
    if (m_config.verbose) {
        std::cout << "[FlowVolumeAnalyzer] OpenMP threads: " << omp_get_max_threads() << std::endl;
    }
#endif

    // Mỗi nhịp độc lập: ghi vào vị trí riêng trong hai vector kết quả
    #ifdef FVAVG_USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (int b = 0; b < count; ++b) {
        if (cancelled.load()) {
            continue;
        }

        timeBins[b] = m_timeBins.resampleBreath(result.breaths[b]);
        volumeBins[b] = m_volumeBins.resampleBreath(result.breaths[b]);

        #ifdef FVAVG_USE_OPENMP
        #pragma omp critical(fvavg_progress)
        #endif
        {
            completed++;
            if (m_progressCallback) {
                m_progressCallback(completed, static_cast<size_t>(count));
            }
            if (m_cancellationCheck && m_cancellationCheck()) {
                cancelled.store(true);
            }
        }
    }

    if (cancelled.load()) {
        return fail(result, AnalysisStatus::CANCELLED, "Analysis cancelled during resampling");
    }

    result.timeBins = TimeBinSet();
    result.timeBins.breaths = std::move(timeBins);
    result.volumeBins = std::move(volumeBins);

    if (!m_timeBins.normalize(result.timeBins)) {
        return fail(result, AnalysisStatus::NO_BREATHS_DETECTED, "No time-bin grid to normalise");
    }
    return true;
}

void FlowVolumeAnalyzer::summarizeBreaths(AnalysisResult& result) const {
    result.summaries.clear();
    result.summaries.reserve(result.breaths.size());

    double sumInsp = 0.0;
    double sumExp = 0.0;
    double sumTime = 0.0;

    for (const Breath& breath : result.breaths) {
        BreathSummary s;
        s.breathIndex = breath.index;
        s.inspTidalVolume = breath.inspiration.tidalVolume();
        s.expTidalVolume = breath.expiration.tidalVolume();
        s.inspTime = breath.inspiration.duration();
        s.expTime = breath.expiration.duration();
        s.totalTime = breath.totalDuration();

        sumInsp += s.inspTidalVolume;
        sumExp += s.expTidalVolume;
        sumTime += s.totalTime;
        result.summaries.push_back(s);
    }

    const double n = static_cast<double>(result.summaries.size());
    if (n > 0.0) {
        result.meanInspTidalVolume = sumInsp / n;
        result.meanExpTidalVolume = sumExp / n;
        result.meanBreathTime = sumTime / n;
    }
}

bool FlowVolumeAnalyzer::fail(AnalysisResult& result, AnalysisStatus status,
                              const std::string& message) const {
    result.status = status;
    result.message = message;
    std::cerr << "[FlowVolumeAnalyzer] Error: " << statusToString(status)
              << ": " << message << std::endl;
    return false;
}

void FlowVolumeAnalyzer::logStage(ProcessingStage stage) const {
    if (m_config.verbose) {
        std::cout << "[FlowVolumeAnalyzer] Stage: " << stageToString(stage) << std::endl;
    }
}

} // namespace fvavg
