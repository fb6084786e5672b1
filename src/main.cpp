/**
 * @file main.cpp
 * @brief Command-line entry point for Flow-Volume Averaging
 *
 * Đọc một hoặc nhiều file dạng sóng hô hấp (time, volume, flow), tự động
 * phân đoạn nhịp thở, nội suy theo time bins / volume bins và ghi các bảng
 * trung bình ra thư mục đầu ra.
 *
 * Pipeline:
 *   Step 1: Zero-crossing detection (look-ahead 30, look-back 20 @ 41)
 *   Step 2: Breath segmentation (inspiration + expiration)
 *   Step 3: Time-bin and volume-bin resampling
 *   Step 4: Mean / std / SEM per grid index
 *
 * Usage:
 *   ./fvavg_analysis <file.csv> [more files...]
 *   ./fvavg_analysis --intervals 50 --output results <file.csv>
 */

#include "fvavg/FlowVolumeAnalyzer.hpp"
#include "fvavg/TabularIO.hpp"
#include "fvavg/Common.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace fvavg;

namespace {

const char* DEFAULT_OUTPUT_DIR = "fvavg_results";

bool parseDouble(const char* text, double& value) {
    char* end = nullptr;
    value = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool parseSize(const char* text, size_t& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed < 0) {
        return false;
    }
    value = static_cast<size_t>(parsed);
    return true;
}

} // anonymous namespace

void printUsage(const char* programName) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║     Flow-Volume Averaging - Breath Segmentation Engine       ║\n";
    std::cout << "║     Time-bin and volume-bin averaging of breath shapes       ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << "\n";
    std::cout << "Usage: " << programName << " [options] <input.csv> [more inputs...]\n";
    std::cout << "\n";
    std::cout << "Input: delimited text (comma, semicolon or tab) with a header row\n";
    std::cout << "       containing 'time', 'vol' and 'flow' columns.\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h                Show this help message\n";
    std::cout << "  --intervals <n>           Intervals per phase (default " << DEFAULT_INTERVALS << ")\n";
    std::cout << "  --insp-sign <neg|pos>     Flow sign during inspiration (default neg)\n";
    std::cout << "  --look-ahead <n>          Look-ahead samples (default " << DEFAULT_LOOK_AHEAD_SAMPLES << ")\n";
    std::cout << "  --look-back-width <n>     Look-back window width (default " << DEFAULT_LOOK_BACK_WIDTH << ")\n";
    std::cout << "  --look-back-offset <n>    Look-back window offset (default " << DEFAULT_LOOK_BACK_OFFSET << ")\n";
    std::cout << "  --mean-shift <v>          Use a fixed Mean_shift instead of the computed one\n";
    std::cout << "  --no-mean-shift           Do not add Mean_shift to averaged volumes\n";
    std::cout << "  --scale <v>               Capacity scale for absolute volumes (value * v / 100)\n";
    std::cout << "  --output <dir>            Output directory (default " << DEFAULT_OUTPUT_DIR << ")\n";
    std::cout << "  --quiet                   Only print errors and the summary\n";
    std::cout << "\n";
    std::cout << "Output tables (<input>_<table>.csv):\n";
    std::cout << "  zeroed, breaths, time_bins, volume_bins, tidal,\n";
    std::cout << "  avg_time_bins, avg_volume_bins\n";
    std::cout << "\n";
}

/**
 * @brief Phân tích một file và ghi kết quả
 * @return 0 nếu thành công (kể cả khi không có nhịp nào), 1 nếu lỗi
 */
int processSingleFile(const FlowVolumeAnalyzer& analyzer, const std::string& filePath,
                      const std::string& outputDir, bool verbose) {
    std::cout << "\n[Mode] Single File Processing\n";
    std::cout << "Input: " << filePath << "\n";

    AnalysisResult result;
    if (!analyzer.processFile(filePath, result)) {
        std::cerr << "Error: " << statusToString(result.status) << ": " << result.message << "\n";
        return 1;
    }

    if (!result.hasBreaths()) {
        std::cout << "Warning: " << result.message << ", nothing to average\n";
        return 0;
    }

    const std::string baseName = fs::path(filePath).stem().string();
    ResultWriter writer(outputDir, verbose);
    size_t tables = writer.writeAll(result, baseName);
    if (tables == 0) {
        std::cerr << "Error: Failed to write results to " << outputDir << "\n";
        return 1;
    }

    std::cout << "\n";
    std::cout << "╔═══════════════════════════════════════╗\n";
    std::cout << "║         Analysis Results              ║\n";
    std::cout << "╠═══════════════════════════════════════╣\n";
    std::cout << "║  Zero crossings:  " << std::setw(8) << result.events.size() << "            ║\n";
    std::cout << "║  Breaths:         " << std::setw(8) << result.breaths.size() << "            ║\n";
    std::cout << "║  Tables written:  " << std::setw(8) << tables << "            ║\n";
    std::cout << "╚═══════════════════════════════════════╝\n";

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "  Mean Vt (insp/exp): " << result.meanInspTidalVolume << " / "
              << result.meanExpTidalVolume << "\n";
    std::cout << "  Mean breath time:   " << result.meanBreathTime << " s\n";
    std::cout << "  Mean_shift:         " << result.timeBinAverages.meanShift << "\n";
    std::cout.unsetf(std::ios::floatfield);

    // In chi tiết các nhịp đầu tiên
    std::cout << "\nBreaths:\n";
    for (size_t i = 0; i < result.summaries.size() && i < 10; ++i) {
        const BreathSummary& s = result.summaries[i];
        std::cout << "  [" << s.breathIndex << "] Vt insp=" << std::fixed << std::setprecision(3)
                  << s.inspTidalVolume << ", exp=" << s.expTidalVolume
                  << ", T=" << std::setprecision(2) << s.totalTime << "s\n";
    }
    if (result.summaries.size() > 10) {
        std::cout << "  ... and " << (result.summaries.size() - 10) << " more breaths\n";
    }
    std::cout.unsetf(std::ios::floatfield);

    return 0;
}

int main(int argc, char* argv[]) {
    AnalysisConfig config;
    std::string outputDir = DEFAULT_OUTPUT_DIR;
    bool quiet = false;
    std::vector<std::string> inputFiles;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--intervals" && hasValue) {
            size_t intervals = 0;
            if (!parseSize(argv[++i], intervals) ||
                intervals > static_cast<size_t>(std::numeric_limits<int>::max())) {
                std::cerr << "Error: Invalid value for --intervals: " << argv[i] << "\n";
                return 1;
            }
            config.resampling.intervals = static_cast<int>(intervals);
        }
        else if (arg == "--insp-sign" && hasValue) {
            std::string sign = argv[++i];
            if (sign == "neg" || sign == "negative") {
                config.segmenter.inspirationSign = FlowSign::NEGATIVE;
            } else if (sign == "pos" || sign == "positive") {
                config.segmenter.inspirationSign = FlowSign::POSITIVE;
            } else {
                std::cerr << "Error: --insp-sign expects 'neg' or 'pos', got " << sign << "\n";
                return 1;
            }
        }
        else if (arg == "--look-ahead" && hasValue) {
            if (!parseSize(argv[++i], config.detector.lookAheadSamples)) {
                std::cerr << "Error: Invalid value for --look-ahead: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--look-back-width" && hasValue) {
            if (!parseSize(argv[++i], config.detector.lookBackWidth)) {
                std::cerr << "Error: Invalid value for --look-back-width: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--look-back-offset" && hasValue) {
            if (!parseSize(argv[++i], config.detector.lookBackOffset)) {
                std::cerr << "Error: Invalid value for --look-back-offset: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--mean-shift" && hasValue) {
            if (!parseDouble(argv[++i], config.resampling.fixedMeanShift)) {
                std::cerr << "Error: Invalid value for --mean-shift: " << argv[i] << "\n";
                return 1;
            }
            config.resampling.useFixedMeanShift = true;
        }
        else if (arg == "--no-mean-shift") {
            config.resampling.applyMeanShift = false;
        }
        else if (arg == "--scale" && hasValue) {
            if (!parseDouble(argv[++i], config.capacityScale)) {
                std::cerr << "Error: Invalid value for --scale: " << argv[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--output" && hasValue) {
            outputDir = argv[++i];
        }
        else if (arg == "--quiet") {
            quiet = true;
        }
        else if (arg.find("-") != 0) {
            // Không phải option -> file đầu vào
            inputFiles.push_back(arg);
        }
        else {
            std::cerr << "Error: Unknown or incomplete option " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    config.verbose = !quiet;

    std::string configError;
    if (!config.validate(configError)) {
        std::cerr << "Error: " << statusToString(AnalysisStatus::INVALID_CONFIG)
                  << ": " << configError << "\n";
        return 1;
    }

    if (inputFiles.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║     Flow-Volume Averaging v1.0                               ║\n";
    std::cout << "║     Zero Crossings | Time Bins | Volume Bins | Mean / SEM    ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    FlowVolumeAnalyzer analyzer(config);
    if (!quiet) {
        analyzer.setProgressCallback([](size_t current, size_t total) {
            if (current % 10 == 0 || current == total) {
                float percent = 100.0f * current / total;
                std::cout << "\r  Progress: " << current << "/" << total
                          << " (" << std::fixed << std::setprecision(1)
                          << percent << "%)    " << std::flush;
                std::cout.unsetf(std::ios::floatfield);
                if (current == total) {
                    std::cout << "\n";
                }
            }
        });
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    size_t failures = 0;
    for (const std::string& file : inputFiles) {
        if (processSingleFile(analyzer, file, outputDir, !quiet) != 0) {
            failures++;
        }
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    std::cout << "\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";
    std::cout << "                      PROCESSING COMPLETE                       \n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";
    std::cout << "  Files processed: " << (inputFiles.size() - failures) << "/" << inputFiles.size() << "\n";
    std::cout << "  Output dir:      " << outputDir << "\n";
    std::cout << "  Processing time: " << duration.count() / 1000.0 << " seconds\n";
    std::cout << "═══════════════════════════════════════════════════════════════\n";

    return (failures == 0) ? 0 : 1;
}
