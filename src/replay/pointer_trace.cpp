// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointer_trace.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace gridsnake {

namespace {

constexpr double PI = 3.14159265358979323846;

/// Strip a trailing '#' comment and surrounding whitespace
std::string strip_line(const std::string& line) {
    std::string s = line.substr(0, line.find('#'));
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

} // namespace

bool parse_pointer_trace(std::istream& in, std::vector<PointerSample>& out, std::string& error) {
    out.clear();
    error.clear();

    std::string line;
    int line_no = 0;
    long long last_ms = 0;

    while (std::getline(in, line)) {
        line_no++;
        std::string content = strip_line(line);
        if (content.empty()) {
            continue;
        }

        std::istringstream fields(content);
        long long t_ms = 0;
        std::string x_field;
        if (!(fields >> t_ms >> x_field)) {
            error = "line " + std::to_string(line_no) + ": expected '<t_ms> <x> <y>' or '<t_ms> -'";
            return false;
        }
        if (t_ms < 0) {
            error = "line " + std::to_string(line_no) + ": negative timestamp";
            return false;
        }
        if (!out.empty() && t_ms < last_ms) {
            error = "line " + std::to_string(line_no) + ": timestamp " + std::to_string(t_ms) +
                    " goes backwards (previous " + std::to_string(last_ms) + ")";
            return false;
        }

        PointerSample sample;
        sample.at = Millis(t_ms);

        if (x_field != "-") {
            std::istringstream x_stream(x_field);
            double x = 0.0;
            double y = 0.0;
            if (!(x_stream >> x) || !x_stream.eof() || !(fields >> y)) {
                error = "line " + std::to_string(line_no) + ": invalid pointer coordinates";
                return false;
            }
            sample.pointer = PixelPoint{x, y};
        }

        std::string trailing;
        if (fields >> trailing) {
            error = "line " + std::to_string(line_no) + ": unexpected '" + trailing + "'";
            return false;
        }

        out.push_back(sample);
        last_ms = t_ms;
    }

    return true;
}

bool load_pointer_trace(const std::string& path, std::vector<PointerSample>& out,
                        std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }

    if (!parse_pointer_trace(in, out, error)) {
        error = path + ": " + error;
        return false;
    }

    spdlog::debug("[PointerTrace] Loaded {} samples from {}", out.size(), path);
    return true;
}

std::vector<PointerSample> circling_trace(const PixelPoint& center, double radius,
                                          Millis duration, Millis poll_period,
                                          Millis revolution) {
    std::vector<PointerSample> samples;
    if (poll_period.count() <= 0 || revolution.count() <= 0) {
        return samples;
    }

    for (Millis t{0}; t <= duration; t += poll_period) {
        double angle = 2.0 * PI * static_cast<double>(t.count()) /
                       static_cast<double>(revolution.count());
        PointerSample sample;
        sample.at = t;
        sample.pointer = PixelPoint{center.x + radius * std::cos(angle),
                                    center.y + radius * std::sin(angle)};
        samples.push_back(sample);
    }
    return samples;
}

} // namespace gridsnake
