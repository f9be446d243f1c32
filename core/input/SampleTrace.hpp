#pragma once
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "core/motion/FilterState.hpp"
#include "utils/Logger.hpp"

namespace st {

// Recorded stream of timestamped 3D samples, stored as x,y,z,t CSV lines.
class SampleTrace {
public:
    void addSample(float x, float y, float z, double timestamp) {
        m_samples.push_back({Vector3(x, y, z), timestamp});
    }

    void addSample(const PositionSample& sample) { m_samples.push_back(sample); }

    const std::vector<PositionSample>& samples() const { return m_samples; }
    size_t size() const { return m_samples.size(); }
    bool empty() const { return m_samples.empty(); }
    void clear() { m_samples.clear(); }

    std::vector<Vector3> positions() const {
        std::vector<Vector3> out;
        out.reserve(m_samples.size());
        for (const auto& s : m_samples)
            out.push_back(s.position);
        return out;
    }

    // Replaces the current samples. Blank and '#' lines are skipped, as are
    // malformed lines (with a warning). Returns false if the file can't be read.
    bool loadCSV(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open())
            return false;
        m_samples.clear();
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty() || line[0] == '#')
                continue;
            PositionSample sample;
            if (!parseLine(line, sample)) {
                ST_LOG(LogLevel::Warn, path + ":" + std::to_string(lineNo) +
                                           ": skipping malformed sample \"" + line + "\"");
                continue;
            }
            m_samples.push_back(sample);
        }
        return true;
    }

    bool exportCSV(const std::string& path) const {
        std::ofstream out(path);
        if (!out.is_open())
            return false;
        out << std::setprecision(9);
        for (const auto& s : m_samples) {
            out << s.position.x << ',' << s.position.y << ',' << s.position.z << ','
                << std::setprecision(17) << s.timestamp << std::setprecision(9) << '\n';
        }
        return static_cast<bool>(out);
    }

private:
    static bool parseLine(const std::string& line, PositionSample& sample) {
        std::stringstream ss(line);
        std::string field;
        double values[4];
        size_t count = 0;
        while (std::getline(ss, field, ',')) {
            if (count == 4)
                return false;
            std::istringstream fs(field);
            double v = 0.0;
            if (!(fs >> v))
                return false;
            fs >> std::ws;
            if (!fs.eof())
                return false;
            values[count++] = v;
        }
        if (count != 4)
            return false;
        sample.position = Vector3(static_cast<float>(values[0]), static_cast<float>(values[1]),
                                  static_cast<float>(values[2]));
        sample.timestamp = values[3];
        return true;
    }

    std::vector<PositionSample> m_samples;
};

} // namespace st
