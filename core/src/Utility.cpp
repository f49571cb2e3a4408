#include "arcfortune/Utility.h"
#include "arcfortune/Errors.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arcfortune {

std::string curve_kind_to_string(CurveKind kind) {
    switch (kind) {
        case CurveKind::RawScore:
            return "raw_score";
        case CurveKind::Rolling:
            return "rolling";
        case CurveKind::Smoothed:
            return "savgol";
        case CurveKind::Cumulative:
            return "cumulative";
        case CurveKind::CumulativeRolling:
            return "cumulative_rolling";
        case CurveKind::CumulativeSmoothed:
            return "cumulative_savgol";
        case CurveKind::MacroArc:
            return "macro_arc";
    }
    return "raw_score";
}

CurveKind curve_kind_from_string(const std::string& value) {
    if (value == "raw_score") {
        return CurveKind::RawScore;
    }
    if (value == "rolling") {
        return CurveKind::Rolling;
    }
    if (value == "savgol") {
        return CurveKind::Smoothed;
    }
    if (value == "cumulative") {
        return CurveKind::Cumulative;
    }
    if (value == "cumulative_rolling") {
        return CurveKind::CumulativeRolling;
    }
    if (value == "cumulative_savgol") {
        return CurveKind::CumulativeSmoothed;
    }
    if (value == "macro_arc") {
        return CurveKind::MacroArc;
    }
    throw std::runtime_error("Unknown curve kind: " + value);
}

std::string curve_name(const CurveSeries& curve) {
    switch (curve.kind) {
        case CurveKind::Rolling:
        case CurveKind::Smoothed:
        case CurveKind::CumulativeRolling:
        case CurveKind::CumulativeSmoothed:
            return curve_kind_to_string(curve.kind) + "_" + std::to_string(curve.requestedWindow);
        default:
            return curve_kind_to_string(curve.kind);
    }
}

std::string work_id_from_path(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

std::string title_from_work_id(const std::string& workId) {
    std::string title;
    title.reserve(workId.size());
    bool wordStart = true;
    for (char c : workId) {
        const char ch = (c == '_') ? ' ' : c;
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalpha(uc)) {
            title.push_back(static_cast<char>(wordStart ? std::toupper(uc) : std::tolower(uc)));
            wordStart = false;
        } else {
            title.push_back(ch);
            wordStart = true;
        }
    }
    return title;
}

std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IngestionError("Could not open input file: '" + path + "'");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IngestionError("Failed reading input file: '" + path + "'");
    }
    std::string text = buffer.str();
    if (trim(text).empty()) {
        throw IngestionError("Input file is empty: '" + path + "'");
    }
    return text;
}

std::string trim(const std::string& s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    std::string current;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) out.push_back(std::move(current));
    return out;
}

}  // namespace arcfortune
