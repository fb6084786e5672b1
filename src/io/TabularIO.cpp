/**
 * @file TabularIO.cpp
 * @brief Implementation of the waveform reader and the result writer
 *
 * @author Research Team
 * @date 2026
 */

#include "fvavg/TabularIO.hpp"
#include "fvavg/FlowVolumeAnalyzer.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace fvavg {

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\"'";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

bool parseNumber(const std::string& cell, double& value) {
    std::istringstream iss(cell);
    if (!(iss >> value)) {
        return false;
    }
    // Không cho phép ký tự thừa sau số
    iss >> std::ws;
    return iss.eof();
}

/// NaN được ghi là "NaN" (không phụ thuộc thư viện chuẩn)
std::string formatValue(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

void writeRecord(std::ostream& out, const AggregateRecord& r) {
    out << "," << formatValue(r.mean)
        << "," << formatValue(r.stdDev)
        << "," << formatValue(r.sem);
}

bool openTable(std::ofstream& file, const std::string& path) {
    file.open(path);
    if (!file.is_open()) {
        std::cerr << "[ResultWriter] Error: cannot create " << path << std::endl;
        return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// READER
// ============================================================================

WaveformReader::WaveformReader(const ReaderConfig& config)
    : m_config(config)
{
}

bool WaveformReader::readFile(const std::string& filePath, Waveform& waveform) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "[WaveformReader] Error: cannot open " << filePath << std::endl;
        return false;
    }

    std::string sourceName = fs::path(filePath).stem().string();
    bool ok = read(file, waveform, sourceName);
    file.close();
    return ok;
}

bool WaveformReader::read(std::istream& input, Waveform& waveform,
                          const std::string& sourceName) const {
    waveform.clear();
    waveform.sourceName = sourceName;

    std::string line;
    int lineNumber = 0;

    // ----- BƯỚC 1: Dòng tiêu đề (dòng không trống đầu tiên) -----
    std::string header;
    while (std::getline(input, line)) {
        lineNumber++;
        if (line.find_first_not_of(" \t\r\n") != std::string::npos) {
            header = line;
            break;
        }
    }

    if (header.empty()) {
        std::cerr << "[WaveformReader] Error: " << sourceName << " has no header line" << std::endl;
        return false;
    }

    const char delimiter = (m_config.delimiter != '\0') ? m_config.delimiter : detectDelimiter(header);
    const std::vector<std::string> headers = splitLine(header, delimiter);

    // ----- BƯỚC 2: Tìm các cột theo mẫu tên -----
    const int timeCol = findColumn(headers, m_config.timePatterns);
    const int volumeCol = findColumn(headers, m_config.volumePatterns);
    const int flowCol = findColumn(headers, m_config.flowPatterns);

    if (timeCol < 0 || volumeCol < 0 || flowCol < 0) {
        std::cerr << "[WaveformReader] Error: " << sourceName << " is missing column(s):"
                  << (timeCol < 0 ? " time" : "")
                  << (volumeCol < 0 ? " volume" : "")
                  << (flowCol < 0 ? " flow" : "") << std::endl;
        return false;
    }

    const size_t required = static_cast<size_t>(std::max(timeCol, std::max(volumeCol, flowCol))) + 1;
    size_t skipped = 0;

    // ----- BƯỚC 3: Đọc từng dòng dữ liệu -----
    while (std::getline(input, line)) {
        lineNumber++;

        // Bỏ qua dòng trống
        if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        std::vector<std::string> cells = splitLine(line, delimiter);
        double t = 0.0;
        double v = 0.0;
        double f = 0.0;

        if (cells.size() < required ||
            !parseNumber(cells[timeCol], t) ||
            !parseNumber(cells[volumeCol], v) ||
            !parseNumber(cells[flowCol], f)) {
            std::cerr << "[WaveformReader] Parse error at line " << lineNumber
                      << ": " << line << std::endl;
            skipped++;
            continue;
        }

        waveform.append(t, v, f);
    }

    if (m_config.verbose) {
        std::cout << "[WaveformReader] " << sourceName << ": " << waveform.size()
                  << " samples (" << skipped << " rows skipped), columns '"
                  << headers[timeCol] << "', '" << headers[volumeCol] << "', '"
                  << headers[flowCol] << "'" << std::endl;
    }

    if (waveform.empty()) {
        std::cerr << "[WaveformReader] Error: " << sourceName << " contains no samples" << std::endl;
        return false;
    }

    return true;
}

char WaveformReader::detectDelimiter(const std::string& headerLine) {
    if (headerLine.find('\t') != std::string::npos) {
        return '\t';
    }
    if (headerLine.find(';') != std::string::npos) {
        return ';';
    }
    return ',';
}

std::vector<std::string> WaveformReader::splitLine(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream iss(line);
    while (std::getline(iss, cell, delimiter)) {
        cells.push_back(trim(cell));
    }
    // Dòng kết thúc bằng dấu phân cách -> ô trống cuối
    if (!line.empty() && line.back() == delimiter) {
        cells.push_back("");
    }
    return cells;
}

int WaveformReader::findColumn(const std::vector<std::string>& headers,
                               const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        return -1;
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        const std::string name = toLower(headers[c]);
        bool all = true;
        for (const std::string& pattern : patterns) {
            if (name.find(toLower(pattern)) == std::string::npos) {
                all = false;
                break;
            }
        }
        if (all) {
            return static_cast<int>(c);
        }
    }
    return -1;
}

// ============================================================================
// WRITER
// ============================================================================

ResultWriter::ResultWriter(const std::string& outputDir, bool verbose)
    : m_outputDir(outputDir)
    , m_verbose(verbose)
{
}

std::string ResultWriter::tablePath(const std::string& baseName, const std::string& table) const {
    return (fs::path(m_outputDir) / (baseName + "_" + table + ".csv")).string();
}

size_t ResultWriter::writeAll(const AnalysisResult& result, const std::string& baseName) const {
    std::error_code ec;
    fs::create_directories(m_outputDir, ec);
    if (ec) {
        std::cerr << "[ResultWriter] Error: cannot create directory " << m_outputDir
                  << ": " << ec.message() << std::endl;
        return 0;
    }

    size_t written = 0;
    written += writeZeroed(result, tablePath(baseName, "zeroed")) ? 1 : 0;
    written += writeBreaths(result, tablePath(baseName, "breaths")) ? 1 : 0;
    written += writeTimeBins(result, tablePath(baseName, "time_bins")) ? 1 : 0;
    written += writeVolumeBins(result, tablePath(baseName, "volume_bins")) ? 1 : 0;
    written += writeTidal(result, tablePath(baseName, "tidal")) ? 1 : 0;
    written += writeAverageTimeBins(result, tablePath(baseName, "avg_time_bins")) ? 1 : 0;
    written += writeAverageVolumeBins(result, tablePath(baseName, "avg_volume_bins")) ? 1 : 0;

    if (m_verbose) {
        std::cout << "[ResultWriter] " << written << " tables written to " << m_outputDir << std::endl;
    }
    return written;
}

bool ResultWriter::writeZeroed(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    file << "Time,Volume,Flow\n";
    const Waveform& z = result.zeroed;
    for (size_t i = 0; i < z.size(); ++i) {
        file << formatValue(z.time[i]) << "," << formatValue(z.volume[i])
             << "," << formatValue(z.flow[i]) << "\n";
    }
    return file.good();
}

bool ResultWriter::writeBreaths(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    file << "Breath,Phase,Time,Volume,Flow\n";
    for (const Breath& breath : result.breaths) {
        for (BreathPhase which : {BreathPhase::INSPIRATION, BreathPhase::EXPIRATION}) {
            const PhaseSegment& phase = breath.phase(which);
            for (size_t k = 0; k < phase.size(); ++k) {
                file << breath.index << "," << phaseToString(which)
                     << "," << formatValue(phase.time[k])
                     << "," << formatValue(phase.volume[k])
                     << "," << formatValue(phase.flow[k]) << "\n";
            }
        }
    }
    return file.good();
}

bool ResultWriter::writeTimeBins(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    file << "Breath,Phase,Index,Time,Volume,Flow,Normalized_Volume\n";
    for (const BreathTimeBins& b : result.timeBins.breaths) {
        const TimeBinGrid* grids[2] = {&b.inspiration, &b.expiration};
        const std::vector<double>* normalized[2] = {&b.normalizedInspVolume, &b.normalizedExpVolume};
        const BreathPhase phases[2] = {BreathPhase::INSPIRATION, BreathPhase::EXPIRATION};

        for (int p = 0; p < 2; ++p) {
            const TimeBinGrid& g = *grids[p];
            for (size_t j = 0; j < g.size(); ++j) {
                double norm = (j < normalized[p]->size()) ? (*normalized[p])[j] : UNDEFINED_VALUE;
                file << b.breathIndex << "," << phaseToString(phases[p]) << "," << j
                     << "," << formatValue(g.time[j])
                     << "," << formatValue(g.volume[j])
                     << "," << formatValue(g.flow[j])
                     << "," << formatValue(norm) << "\n";
            }
        }
    }
    return file.good();
}

bool ResultWriter::writeVolumeBins(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    file << "Breath,Phase,Index,Volume,Time,Flow\n";
    for (const BreathVolumeBins& b : result.volumeBins) {
        const VolumeBinGrid* grids[2] = {&b.inspiration, &b.expiration};
        const BreathPhase phases[2] = {BreathPhase::INSPIRATION, BreathPhase::EXPIRATION};

        for (int p = 0; p < 2; ++p) {
            const VolumeBinGrid& g = *grids[p];
            for (size_t j = 0; j < g.size(); ++j) {
                file << b.breathIndex << "," << phaseToString(phases[p]) << "," << j
                     << "," << formatValue(g.volume[j])
                     << "," << formatValue(g.time[j])
                     << "," << formatValue(g.flow[j]) << "\n";
            }
        }
    }
    return file.good();
}

bool ResultWriter::writeTidal(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    file << "Breath,Insp_Vt,Exp_Vt,Insp_Time,Exp_Time,Total_Time\n";
    double sumInspTime = 0.0;
    double sumExpTime = 0.0;
    for (const BreathSummary& s : result.summaries) {
        file << s.breathIndex
             << "," << formatValue(s.inspTidalVolume)
             << "," << formatValue(s.expTidalVolume)
             << "," << formatValue(s.inspTime)
             << "," << formatValue(s.expTime)
             << "," << formatValue(s.totalTime) << "\n";
        sumInspTime += s.inspTime;
        sumExpTime += s.expTime;
    }

    if (!result.summaries.empty()) {
        const double n = static_cast<double>(result.summaries.size());
        file << "Mean"
             << "," << formatValue(result.meanInspTidalVolume)
             << "," << formatValue(result.meanExpTidalVolume)
             << "," << formatValue(sumInspTime / n)
             << "," << formatValue(sumExpTime / n)
             << "," << formatValue(result.meanBreathTime) << "\n";
    }
    return file.good();
}

bool ResultWriter::writeAverageTimeBins(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    const TimeBinAverages& avg = result.timeBinAverages;

    file << "Phase,Index,Percent,Volume_Mean,Volume_Std,Volume_SEM,"
         << "Flow_Mean,Flow_Std,Flow_SEM,Raw_Volume_Mean,Count";
    if (avg.hasAbsolute) {
        file << ",Abs_Volume_Mean,Abs_Volume_Std,Abs_Volume_SEM";
    }
    file << "\n";

    struct PhaseColumns {
        BreathPhase phase;
        const AggregateSeries* volume;
        const AggregateSeries* flow;
        const AggregateSeries* raw;
        const AggregateSeries* absolute;
    };
    const PhaseColumns columns[2] = {
        {BreathPhase::INSPIRATION, &avg.inspVolume, &avg.inspFlow, &avg.inspVolumeRaw, &avg.inspVolumeAbsolute},
        {BreathPhase::EXPIRATION, &avg.expVolume, &avg.expFlow, &avg.expVolumeRaw, &avg.expVolumeAbsolute}
    };

    for (const PhaseColumns& c : columns) {
        const size_t points = c.volume->size();
        for (size_t j = 0; j < points; ++j) {
            double percent = (points > 1) ? 100.0 * static_cast<double>(j) / static_cast<double>(points - 1) : 0.0;
            file << phaseToString(c.phase) << "," << j << "," << formatValue(percent);
            writeRecord(file, c.volume->records[j]);
            writeRecord(file, c.flow->records[j]);
            file << "," << formatValue(c.raw->records[j].mean)
                 << "," << c.volume->records[j].count;
            if (avg.hasAbsolute) {
                writeRecord(file, c.absolute->records[j]);
            }
            file << "\n";
        }
    }
    return file.good();
}

bool ResultWriter::writeAverageVolumeBins(const AnalysisResult& result, const std::string& path) const {
    std::ofstream file;
    if (!openTable(file, path)) {
        return false;
    }

    const VolumeBinAverages& avg = result.volumeBinAverages;

    file << "Phase,Index,Percent,Volume_Mean,Volume_Std,Volume_SEM,"
         << "Time_Mean,Time_Std,Time_SEM,Flow_Mean,Flow_Std,Flow_SEM,Count";
    if (avg.hasAbsolute) {
        file << ",Abs_Volume_Mean,Abs_Volume_Std,Abs_Volume_SEM";
    }
    file << "\n";

    struct PhaseColumns {
        BreathPhase phase;
        const AggregateSeries* volume;
        const AggregateSeries* time;
        const AggregateSeries* flow;
        const AggregateSeries* absolute;
    };
    const PhaseColumns columns[2] = {
        {BreathPhase::INSPIRATION, &avg.inspVolume, &avg.inspTime, &avg.inspFlow, &avg.inspVolumeAbsolute},
        {BreathPhase::EXPIRATION, &avg.expVolume, &avg.expTime, &avg.expFlow, &avg.expVolumeAbsolute}
    };

    for (const PhaseColumns& c : columns) {
        const size_t points = c.volume->size();
        for (size_t j = 0; j < points; ++j) {
            double percent = (points > 1) ? 100.0 * static_cast<double>(j) / static_cast<double>(points - 1) : 0.0;
            file << phaseToString(c.phase) << "," << j << "," << formatValue(percent);
            writeRecord(file, c.volume->records[j]);
            writeRecord(file, c.time->records[j]);
            writeRecord(file, c.flow->records[j]);
            file << "," << c.volume->records[j].count;
            if (avg.hasAbsolute) {
                writeRecord(file, c.absolute->records[j]);
            }
            file << "\n";
        }
    }
    return file.good();
}

} // namespace fvavg
