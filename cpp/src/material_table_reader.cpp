#include "glasscheck/material_table_reader.hpp"
#include "glasscheck/errors.hpp"
#include "glasscheck/logging.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>

namespace glasscheck {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool skip_line(const std::string& line) {
    const std::string t = trim(line);
    return t.empty() || t[0] == '#';
}

// Strict number parse: the whole cell must be consumed.
bool parse_number(const std::string& cell, double& value) {
    const std::string t = trim(cell);
    if (t.empty()) return false;
    try {
        size_t pos = 0;
        value = std::stod(t, &pos);
        return pos == t.size() && std::isfinite(value);
    } catch (const std::exception&) {
        return false;
    }
}

DurationClass parse_duration_cell(const std::string& cell, int line) {
    try {
        return parse_duration_class(trim(cell));
    } catch (const DesignException&) {
        DesignError err = DesignError::invalid_table(
            "unknown duration '" + trim(cell) + "'", line);
        throw DesignException(err);
    }
}

// Duration class of a wide-format column, or nullopt for other durations
std::optional<DurationClass> duration_column(const std::string& cell) {
    try {
        return parse_duration_class(trim(cell));
    } catch (const DesignException&) {
        return std::nullopt;
    }
}

} // namespace

MaterialTableReader::MaterialTableReader(Settings settings)
    : settings_(settings) {}

std::vector<std::string> MaterialTableReader::split(const std::string& line) const {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream ss(line);
    while (std::getline(ss, cell, settings_.delimiter)) {
        if (!cell.empty() && cell.back() == '\r') cell.pop_back();
        cells.push_back(cell);
    }
    // Trailing delimiter means a trailing empty cell
    if (!line.empty() && line.back() == settings_.delimiter) {
        cells.emplace_back();
    }
    return cells;
}

std::vector<MaterialSample> MaterialTableReader::read_long(std::istream& in) const {
    std::vector<MaterialSample> samples;
    std::string line;
    int line_no = 0;
    bool header_seen = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (skip_line(line)) continue;

        auto cells = split(line);
        if (!header_seen) {
            header_seen = true;
            if (cells.size() != 4) {
                throw DesignException(DesignError::invalid_table(
                    "expected header product,temperature_c,duration,shear_modulus_mpa", line_no));
            }
            continue;
        }

        if (cells.size() != 4) {
            throw DesignException(DesignError::invalid_table(
                "expected 4 columns, got " + std::to_string(cells.size()), line_no));
        }

        const std::string product = trim(cells[0]);
        if (product.empty()) {
            throw DesignException(DesignError::invalid_table("empty product id", line_no));
        }

        double temperature = 0.0;
        if (!parse_number(cells[1], temperature)) {
            throw DesignException(DesignError::invalid_table(
                "non-numeric temperature '" + trim(cells[1]) + "'", line_no));
        }

        DurationClass duration = parse_duration_cell(cells[2], line_no);

        double modulus = 0.0;
        if (!parse_number(cells[3], modulus)) {
            throw DesignException(DesignError::invalid_table(
                "non-numeric shear modulus '" + trim(cells[3]) + "'", line_no));
        }

        samples.emplace_back(product, temperature, duration, modulus);
    }

    if (!header_seen) {
        throw DesignException(DesignError::invalid_table("empty table"));
    }

    logger()->info("Read {} interlayer samples (long format)", samples.size());
    return samples;
}

std::vector<MaterialSample> MaterialTableReader::read_wide(const std::string& product_id,
                                                           std::istream& in,
                                                           WarningList* warnings) const {
    std::vector<MaterialSample> samples;
    std::vector<std::optional<DurationClass>> columns;
    std::vector<std::string> column_labels;
    std::string line;
    int line_no = 0;
    bool header_seen = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (skip_line(line)) continue;

        auto cells = split(line);
        if (!header_seen) {
            header_seen = true;
            if (cells.size() < 2) {
                throw DesignException(DesignError::invalid_table(
                    "header needs a temperature column and at least one duration", line_no));
            }
            size_t mapped = 0;
            for (size_t i = 1; i < cells.size(); ++i) {
                columns.push_back(duration_column(cells[i]));
                column_labels.push_back(trim(cells[i]));
                if (columns.back()) {
                    ++mapped;
                } else {
                    logger()->warn("{}: column '{}' is not a duration class, skipped",
                                   product_id, column_labels.back());
                }
            }
            if (mapped == 0) {
                throw DesignException(DesignError::invalid_table(
                    "header has no duration class column", line_no));
            }
            continue;
        }

        if (cells.size() > columns.size() + 1) {
            throw DesignException(DesignError::invalid_table(
                "row has more cells than the header", line_no));
        }

        double temperature = 0.0;
        if (!parse_number(cells[0], temperature)) {
            throw DesignException(DesignError::invalid_table(
                "non-numeric temperature '" + trim(cells[0]) + "'", line_no));
        }

        for (size_t c = 0; c < columns.size(); ++c) {
            if (!columns[c]) continue;

            double modulus = 0.0;
            const bool present = c + 1 < cells.size() && parse_number(cells[c + 1], modulus);
            if (!present) {
                if (settings_.reject_missing_values) {
                    DesignError err = DesignError::invalid_table(
                        "missing shear modulus", line_no);
                    err.details["column"] = column_labels[c];
                    throw DesignException(err);
                }
                modulus = settings_.missing_modulus_fill_mpa;
                logger()->warn("{}: line {} column '{}' missing, using {} MPa",
                               product_id, line_no, column_labels[c], modulus);
                if (warnings) {
                    warnings->add(DesignWarning::missing_modulus_filled(
                        product_id, line_no, column_labels[c], modulus));
                }
            }
            samples.emplace_back(product_id, temperature, *columns[c], modulus);
        }
    }

    if (!header_seen) {
        throw DesignException(DesignError::invalid_table("empty table"));
    }

    logger()->info("Read {} samples for '{}' (wide format)", samples.size(), product_id);
    return samples;
}

std::vector<MaterialSample> MaterialTableReader::read_long_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file) {
        DesignError err(ErrorCode::FILE_NOT_FOUND, "Cannot open material table file");
        err.details["path"] = path;
        throw DesignException(err);
    }
    return read_long(file);
}

std::vector<MaterialSample> MaterialTableReader::read_wide_file(const std::string& product_id,
                                                                const std::string& path,
                                                                WarningList* warnings) const {
    std::ifstream file(path);
    if (!file) {
        DesignError err(ErrorCode::FILE_NOT_FOUND, "Cannot open material table file");
        err.details["path"] = path;
        throw DesignException(err);
    }
    return read_wide(product_id, file, warnings);
}

std::shared_ptr<const MaterialPropertyTable> load_material_table(
    std::istream& in, const MaterialTableReaderSettings& settings)
{
    MaterialTableReader reader(settings);
    return std::make_shared<MaterialPropertyTable>(reader.read_long(in));
}

std::shared_ptr<const MaterialPropertyTable> load_material_table(
    const std::string& path, const MaterialTableReaderSettings& settings)
{
    MaterialTableReader reader(settings);
    return std::make_shared<MaterialPropertyTable>(reader.read_long_file(path));
}

} // namespace glasscheck
