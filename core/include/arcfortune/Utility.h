#pragma once

#include "arcfortune/FortuneTypes.h"

#include <string>
#include <vector>

namespace arcfortune {

std::string curve_kind_to_string(CurveKind kind);
CurveKind curve_kind_from_string(const std::string& value);

// Stable export name, e.g. "rolling_20", "savgol_51", "macro_arc".
std::string curve_name(const CurveSeries& curve);

// "plays/romeo_and_juliet.txt" -> "romeo_and_juliet"
std::string work_id_from_path(const std::string& path);

// "romeo_and_juliet" -> "Romeo And Juliet"
std::string title_from_work_id(const std::string& workId);

// Whole file as bytes. Throws IngestionError if unreadable or blank.
std::string read_text_file(const std::string& path);

std::string trim(const std::string& s);
std::vector<std::string> split_whitespace(const std::string& s);

}
