#include "glasscheck/material.hpp"
#include "glasscheck/errors.hpp"

#include <algorithm>
#include <cmath>

namespace glasscheck {

MaterialPropertyTable::MaterialPropertyTable(const std::vector<MaterialSample>& samples) {
    for (const auto& s : samples) {
        if (s.product_id.empty()) {
            throw DesignException(DesignError::invalid_request("sample with empty product id"));
        }
        if (!std::isfinite(s.temperature_c)) {
            DesignError err = DesignError::invalid_request("non-finite sample temperature");
            err.details["product"] = s.product_id;
            throw DesignException(err);
        }
        if (!std::isfinite(s.shear_modulus_mpa) || s.shear_modulus_mpa < 0.0) {
            DesignError err = DesignError::invalid_request(
                "shear modulus must be finite and non-negative");
            err.details["product"] = s.product_id;
            err.details["temperature_c"] = std::to_string(s.temperature_c);
            err.details["duration"] = to_string(s.duration);
            throw DesignException(err);
        }

        auto& points = data_[s.product_id][s.duration];
        for (const auto& p : points) {
            if (p.temperature_c == s.temperature_c) {
                DesignError err(ErrorCode::DUPLICATE_SAMPLE,
                    "Duplicate sample for product '" + s.product_id + "'");
                err.details["product"] = s.product_id;
                err.details["temperature_c"] = std::to_string(s.temperature_c);
                err.details["duration"] = to_string(s.duration);
                throw DesignException(err);
            }
        }
        points.push_back({s.temperature_c, s.shear_modulus_mpa});
        ++size_;
    }

    for (auto& product : data_) {
        for (auto& entry : product.second) {
            auto& points = entry.second;
            std::sort(points.begin(), points.end(),
                      [](const ModulusPoint& a, const ModulusPoint& b) {
                          return a.temperature_c < b.temperature_c;
                      });
        }
    }
}

const MaterialPropertyTable::DurationMap&
MaterialPropertyTable::product_data(const std::string& product_id) const {
    auto it = data_.find(product_id);
    if (it == data_.end()) {
        throw DesignException(DesignError::unknown_product(product_id));
    }
    return it->second;
}

std::optional<MaterialSample> MaterialPropertyTable::lookup(const std::string& product_id,
                                                            double temperature_c,
                                                            DurationClass duration) const {
    const DurationMap& product = product_data(product_id);
    auto it = product.find(duration);
    if (it == product.end()) {
        return std::nullopt;
    }
    for (const auto& p : it->second) {
        if (p.temperature_c == temperature_c) {
            return MaterialSample(product_id, p.temperature_c, duration, p.shear_modulus_mpa);
        }
    }
    return std::nullopt;
}

bool MaterialPropertyTable::has_product(const std::string& product_id) const {
    return data_.find(product_id) != data_.end();
}

std::vector<std::string> MaterialPropertyTable::products() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& product : data_) {
        result.push_back(product.first);
    }
    return result;
}

std::vector<DurationClass> MaterialPropertyTable::durations(const std::string& product_id) const {
    std::vector<DurationClass> result;
    for (const auto& entry : product_data(product_id)) {
        result.push_back(entry.first);
    }
    return result;
}

const std::vector<ModulusPoint>& MaterialPropertyTable::points(const std::string& product_id,
                                                               DurationClass duration) const {
    static const std::vector<ModulusPoint> empty;
    const DurationMap& product = product_data(product_id);
    auto it = product.find(duration);
    return it == product.end() ? empty : it->second;
}

std::pair<double, double> MaterialPropertyTable::temperature_range(
    const std::string& product_id, DurationClass duration) const
{
    const auto& pts = points(product_id, duration);
    if (pts.empty()) {
        throw DesignException(
            DesignError::unsupported_duration(product_id, to_string(duration)));
    }
    return {pts.front().temperature_c, pts.back().temperature_c};
}

std::vector<MaterialSample> MaterialPropertyTable::samples() const {
    std::vector<MaterialSample> result;
    result.reserve(size_);
    for (const auto& product : data_) {
        for (const auto& entry : product.second) {
            for (const auto& p : entry.second) {
                result.emplace_back(product.first, p.temperature_c, entry.first,
                                    p.shear_modulus_mpa);
            }
        }
    }
    return result;
}

} // namespace glasscheck
