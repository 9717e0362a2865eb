#include "zscan/zscan.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace zscan {

const char* toString(ChannelRole role) {
    switch (role) {
        case ChannelRole::ClosedAperture: return "Closed aperture";
        case ChannelRole::Reference:      return "Reference";
        case ChannelRole::OpenAperture:   return "Open aperture";
        case ChannelRole::Empty:          return "Empty channel";
    }
    return "Unknown";
}

ChannelRoles::ChannelRoles(const std::array<ChannelRole, kChannelCount>& roles)
    : roles_(roles) {
    for (std::size_t i = 0; i < kChannelCount; ++i) {
        for (std::size_t j = i + 1; j < kChannelCount; ++j) {
            if (roles_[i] == roles_[j]) {
                throw std::invalid_argument(std::string("Channel role assigned twice: ") + toString(roles_[i]));
            }
        }
    }
}

ChannelRole ChannelRoles::roleOf(std::size_t slot) const {
    return roles_.at(slot);
}

std::size_t ChannelRoles::slotOf(ChannelRole role) const {
    // Four distinct roles over four slots, so every role is present
    auto it = std::find(roles_.begin(), roles_.end(), role);
    return static_cast<std::size_t>(it - roles_.begin());
}

ParseError::ParseError(const std::string& message, std::size_t line)
    : Error(line ? message + " (line " + std::to_string(line) + ")" : message), line_(line) {}

namespace analysis {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Lowercase with runs of whitespace collapsed to one space
std::string normalizeLabel(const std::string& s) {
    std::istringstream words(s);
    std::string word, out;
    while (words >> word) {
        if (!out.empty()) {
            out += ' ';
        }
        out += lowercase(word);
    }
    return out;
}

bool isSeparator(const std::string& line) {
    if (line.empty()) {
        return true;
    }
    return std::all_of(line.begin(), line.end(), [](char c) { return c == '-' || c == '='; });
}

bool parseDouble(const std::string& token, double& value) {
    if (token.empty()) {
        return false;
    }
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    value = std::strtod(begin, &end);
    return end == begin + token.size() && errno != ERANGE && std::isfinite(value);
}

bool parseInt(const std::string& token, int& value) {
    if (token.empty()) {
        return false;
    }
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(begin, &end, 10);
    if (end != begin + token.size() || errno == ERANGE ||
        parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

// Leading number followed by nothing or one of the accepted units
double parseQuantity(const std::string& value, const std::vector<std::string>& units,
                     const std::string& field, std::size_t line) {
    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(parsed)) {
        throw ParseError("Malformed " + field + ": '" + value + "'", line);
    }
    std::string unit = normalizeLabel(std::string(end));
    if (!unit.empty() && std::find(units.begin(), units.end(), unit) == units.end()) {
        throw ParseError("Unexpected unit for " + field + ": '" + unit + "'", line);
    }
    return parsed;
}

bool parseRole(const std::string& value, ChannelRole& role) {
    const std::string label = normalizeLabel(value);
    if (label == "closed aperture") {
        role = ChannelRole::ClosedAperture;
    } else if (label == "reference") {
        role = ChannelRole::Reference;
    } else if (label == "open aperture") {
        role = ChannelRole::OpenAperture;
    } else if (label == "empty channel" || label == "empty") {
        role = ChannelRole::Empty;
    } else {
        return false;
    }
    return true;
}

struct HeaderFields {
    std::optional<std::string> code;
    std::optional<double> concentration;
    std::optional<double> wavelength_nm;
    std::optional<double> start_pos;
    std::optional<double> end_pos;
    std::array<std::optional<ChannelRole>, kChannelCount> roles;
    std::optional<double> silica_thickness_mm;
    int scans_averaged = 1;
    std::string description;
};

template <typename T>
void assignOnce(std::optional<T>& field, const T& value, const std::string& name, std::size_t line) {
    if (field) {
        throw ParseError("Duplicate header field '" + name + "'", line);
    }
    field = value;
}

// "The data is the arithmetic mean of N scans performed in one go."
bool parseAveragedScans(const std::string& line, int& scans) {
    const std::string marker = "arithmetic mean of";
    auto pos = lowercase(line).find(marker);
    if (pos == std::string::npos) {
        return false;
    }
    std::istringstream rest(line.substr(pos + marker.size()));
    int n = 0;
    if (!(rest >> n) || n < 1) {
        return false;
    }
    scans = n;
    return true;
}

} // namespace

MeasurementRecord parseRecord(const std::string& text) {
    std::vector<std::string> lines;
    {
        std::istringstream stream(text);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(line);
        }
    }

    HeaderFields header;
    std::size_t table_start = 0;
    bool in_description = false;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::size_t line_no = i + 1;
        const std::string line = trim(lines[i]);

        if (line.compare(0, 3, "SNo") == 0) {
            table_start = i + 1;
            break;
        }

        // Free text up to the separator, blank lines and colons included
        if (in_description) {
            if (isSeparator(line) || parseAveragedScans(line, header.scans_averaged)) {
                in_description = false;
            } else if (!header.description.empty() || !line.empty()) {
                if (!header.description.empty()) {
                    header.description += '\n';
                }
                header.description += line;
            }
            continue;
        }

        if (parseAveragedScans(line, header.scans_averaged)) {
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = normalizeLabel(line.substr(0, colon));
        const std::string value = trim(line.substr(colon + 1));

        if (key == "code") {
            if (value.empty()) {
                throw ParseError("Empty sample code", line_no);
            }
            assignOnce(header.code, value, "Code", line_no);
        } else if (key == "concentration") {
            assignOnce(header.concentration, parseQuantity(value, {"%"}, "concentration", line_no),
                       "Concentration", line_no);
        } else if (key == "wavelength") {
            double wavelength = parseQuantity(value, {"nm"}, "wavelength", line_no);
            if (wavelength <= 0.0) {
                throw ParseError("Wavelength must be positive", line_no);
            }
            assignOnce(header.wavelength_nm, wavelength, "Wavelength", line_no);
        } else if (key == "starting pos") {
            assignOnce(header.start_pos, parseQuantity(value, {"mm"}, "starting position", line_no),
                       "Starting pos", line_no);
        } else if (key == "ending pos") {
            assignOnce(header.end_pos, parseQuantity(value, {"mm"}, "ending position", line_no),
                       "Ending pos", line_no);
        } else if (key == "silica thickness") {
            assignOnce(header.silica_thickness_mm, parseQuantity(value, {"mm"}, "silica thickness", line_no),
                       "Silica thickness", line_no);
        } else if (key == "experiment description") {
            in_description = true;
            if (!value.empty()) {
                header.description = value;
            }
        } else if (key.size() == 3 && key.compare(0, 2, "ch") == 0 && key[2] >= '1' && key[2] <= '4') {
            const std::size_t slot = static_cast<std::size_t>(key[2] - '1');
            ChannelRole role;
            if (!parseRole(value, role)) {
                throw ParseError("Unknown channel role '" + value + "'", line_no);
            }
            assignOnce(header.roles[slot], role, "CH" + std::to_string(slot + 1), line_no);
        }
    }

    while (!header.description.empty() && header.description.back() == '\n') {
        header.description.pop_back();
    }

    if (!header.code) throw ParseError("Missing header field 'Code'");
    if (!header.concentration) throw ParseError("Missing header field 'Concentration'");
    if (!header.wavelength_nm) throw ParseError("Missing header field 'Wavelength'");
    if (!header.start_pos) throw ParseError("Missing header field 'Starting pos'");
    if (!header.end_pos) throw ParseError("Missing header field 'Ending pos'");

    std::array<ChannelRole, kChannelCount> roles{};
    for (std::size_t slot = 0; slot < kChannelCount; ++slot) {
        if (!header.roles[slot]) {
            throw ParseError("Missing channel role table entry 'CH" + std::to_string(slot + 1) + "'");
        }
        roles[slot] = *header.roles[slot];
    }
    for (std::size_t i = 0; i < kChannelCount; ++i) {
        for (std::size_t j = i + 1; j < kChannelCount; ++j) {
            if (roles[i] == roles[j]) {
                throw ParseError(std::string("Channel role '") + toString(roles[i]) + "' assigned to CH" +
                                 std::to_string(i + 1) + " and CH" + std::to_string(j + 1));
            }
        }
    }

    if (table_start == 0) {
        throw ParseError("Missing sample table (no 'SNo.' column header)");
    }

    std::vector<Sample> samples;
    for (std::size_t i = table_start; i < lines.size(); ++i) {
        const std::size_t line_no = i + 1;
        const std::string line = trim(lines[i]);
        if (isSeparator(line)) {
            continue;
        }

        std::istringstream fields(line);
        std::vector<std::string> tokens;
        std::string token;
        while (fields >> token) {
            tokens.push_back(token);
        }
        if (tokens.size() != kChannelCount + 1) {
            throw ParseError("Expected " + std::to_string(kChannelCount + 1) + " columns, found " +
                             std::to_string(tokens.size()), line_no);
        }

        Sample sample{};
        if (!parseInt(tokens[0], sample.index)) {
            throw ParseError("Malformed sample index '" + tokens[0] + "'", line_no);
        }
        for (std::size_t ch = 0; ch < kChannelCount; ++ch) {
            if (!parseDouble(tokens[ch + 1], sample.volts[ch])) {
                throw ParseError("Malformed voltage '" + tokens[ch + 1] + "'", line_no);
            }
        }
        if (!samples.empty() && sample.index <= samples.back().index) {
            throw ParseError("Sample index not strictly increasing", line_no);
        }
        samples.push_back(sample);
    }

    if (samples.empty()) {
        throw ParseError("Sample table is empty");
    }
    if (samples.size() < 2) {
        throw ParseError("Sample table has fewer than 2 rows");
    }
    if (*header.start_pos == *header.end_pos) {
        throw ParseError("Starting and ending positions coincide");
    }

    return MeasurementRecord{
        *header.code,
        *header.concentration,
        *header.wavelength_nm,
        *header.start_pos,
        *header.end_pos,
        ChannelRoles(roles),
        std::move(samples),
        header.silica_thickness_mm,
        header.scans_averaged,
        header.description
    };
}

std::string loadFileText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ParseError("Could not open file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw ParseError("Could not read file: " + path);
    }
    return contents.str();
}

MeasurementRecord loadRecord(const std::string& path) {
    return parseRecord(loadFileText(path));
}

double positionAt(const MeasurementRecord& record, std::size_t i) {
    const auto& samples = record.samples;
    const double first = samples.front().index;
    const double last = samples.back().index;
    const double fraction = (samples.at(i).index - first) / (last - first);
    return record.start_pos + (record.end_pos - record.start_pos) * fraction;
}

MeasurementRecord averageRecords(const std::vector<MeasurementRecord>& records) {
    if (records.empty()) {
        throw std::invalid_argument("No records to average");
    }

    const MeasurementRecord& first = records.front();
    for (const auto& other : records) {
        if (other.code != first.code || other.concentration != first.concentration ||
            other.wavelength_nm != first.wavelength_nm || other.start_pos != first.start_pos ||
            other.end_pos != first.end_pos) {
            throw std::invalid_argument("Records to average have different metadata");
        }
        for (std::size_t slot = 0; slot < kChannelCount; ++slot) {
            if (other.roles.roleOf(slot) != first.roles.roleOf(slot)) {
                throw std::invalid_argument("Records to average have different channel roles");
            }
        }
        if (other.samples.size() != first.samples.size()) {
            throw std::invalid_argument("Records to average have different sample counts");
        }
        for (std::size_t i = 0; i < first.samples.size(); ++i) {
            if (other.samples[i].index != first.samples[i].index) {
                throw std::invalid_argument("Records to average have different sample indices");
            }
        }
    }

    // Each input is weighted by the number of scans already averaged into it
    std::vector<Sample> mean = first.samples;
    int scans = 0;
    for (auto& s : mean) {
        s.volts.fill(0.0);
    }
    for (const auto& record : records) {
        scans += record.scans_averaged;
        for (std::size_t i = 0; i < mean.size(); ++i) {
            for (std::size_t ch = 0; ch < kChannelCount; ++ch) {
                mean[i].volts[ch] += record.samples[i].volts[ch] * record.scans_averaged;
            }
        }
    }
    for (auto& s : mean) {
        for (auto& v : s.volts) {
            v /= scans;
        }
    }

    return MeasurementRecord{
        first.code,
        first.concentration,
        first.wavelength_nm,
        first.start_pos,
        first.end_pos,
        first.roles,
        std::move(mean),
        first.silica_thickness_mm,
        scans,
        first.description
    };
}

} // namespace analysis

} // namespace zscan
