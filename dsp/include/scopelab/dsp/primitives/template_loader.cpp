// ==============================================================================
// Layer 1: DSP Primitive - Matched-Filter Template Loader (implementation)
// ==============================================================================

#include <scopelab/dsp/primitives/template_loader.h>

#include <scopelab/dsp/core/analysis_errors.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string_view>

namespace Scopelab::DSP {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    const bool delimited = line.find_first_of(",;\t") != std::string_view::npos;

    size_t start = 0;
    while (start <= line.size()) {
        size_t end = delimited ? line.find_first_of(",;\t", start)
                               : line.find_first_of(" ", start);
        if (end == std::string_view::npos) end = line.size();
        const std::string_view field = trim(line.substr(start, end - start));
        if (delimited || !field.empty()) fields.push_back(field);
        start = end + 1;
    }
    return fields;
}

std::optional<double> parseNumber(std::string_view field) noexcept {
    if (field.empty()) return std::nullopt;
    if (field.front() == '+') field.remove_prefix(1);

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool isHeaderName(std::string_view field, std::string_view name) noexcept {
    if (field.size() != name.size()) return false;
    for (size_t i = 0; i < field.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(field[i])) != name[i]) return false;
    }
    return true;
}

} // anonymous namespace

std::vector<float> parseTemplate(std::istream& input) {
    std::vector<float> samples;
    std::optional<size_t> column;
    bool sawData = false;
    std::string line;

    while (std::getline(input, line)) {
        const std::string_view view = trim(line);
        if (view.empty() || view.front() == '#') continue;

        const auto fields = splitFields(view);
        if (fields.empty()) continue;

        if (!sawData && !parseNumber(fields.back()).has_value()) {
            // Header row: remember the "y" column if present
            for (size_t i = 0; i < fields.size(); ++i) {
                if (isHeaderName(fields[i], "y")) column = i;
            }
            continue;
        }

        const size_t index = column.value_or(fields.size() - 1);
        if (index >= fields.size()) continue;
        if (const auto value = parseNumber(fields[index])) {
            samples.push_back(static_cast<float>(*value));
            sawData = true;
        }
    }

    if (samples.empty()) {
        throw AnalysisError(ErrorKind::EmptyTemplate, "template contains no numeric samples");
    }
    return samples;
}

std::vector<float> loadTemplate(const std::string& path) {
    if (path.empty()) {
        throw AnalysisError(ErrorKind::TemplateNotFound, "template path is empty");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw AnalysisError(ErrorKind::TemplateNotFound, "template file not found: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw AnalysisError(ErrorKind::TemplateNotFound, "cannot open template file: " + path);
    }
    return parseTemplate(file);
}

} // namespace Scopelab::DSP
