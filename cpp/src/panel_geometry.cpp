#include "glasscheck/panel_geometry.hpp"
#include "glasscheck/errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace glasscheck {

namespace {

/// kPa to N/mm²
constexpr double kKpaToMpa = 1.0e-3;

struct PlateCoefficient {
    double ratio;  ///< long side / short side
    double beta;   ///< stress coefficient
    double alpha;  ///< deflection coefficient
};

// Roark, rectangular plate, all edges simply supported, uniform load (nu = 0.3)
constexpr std::array<PlateCoefficient, 9> kFourEdgeTable = {{
    {1.0, 0.2874, 0.0444},
    {1.2, 0.3762, 0.0616},
    {1.4, 0.4530, 0.0770},
    {1.6, 0.5172, 0.0906},
    {1.8, 0.5688, 0.1017},
    {2.0, 0.6102, 0.1110},
    {3.0, 0.7134, 0.1335},
    {4.0, 0.7410, 0.1400},
    {5.0, 0.7476, 0.1417},
}};

// Linear interpolation in the aspect ratio, clamped at both table ends
PlateCoefficient four_edge_coefficients(double ratio) {
    if (ratio <= kFourEdgeTable.front().ratio) return kFourEdgeTable.front();
    if (ratio >= kFourEdgeTable.back().ratio) return kFourEdgeTable.back();

    for (size_t i = 1; i < kFourEdgeTable.size(); ++i) {
        const auto& hi = kFourEdgeTable[i];
        if (ratio <= hi.ratio) {
            const auto& lo = kFourEdgeTable[i - 1];
            const double w = (ratio - lo.ratio) / (hi.ratio - lo.ratio);
            return {ratio,
                    lo.beta + w * (hi.beta - lo.beta),
                    lo.alpha + w * (hi.alpha - lo.alpha)};
        }
    }
    return kFourEdgeTable.back();
}

} // namespace

bool PanelGeometry::is_valid() const {
    const bool span_ok = std::isfinite(span_mm) && span_mm > 0.0;
    if (support != SupportCondition::FourEdgeSimplySupported) {
        return span_ok;
    }
    return span_ok && std::isfinite(width_mm) && width_mm > 0.0;
}

void PanelGeometry::validate() const {
    if (!is_valid()) {
        DesignError err = DesignError::invalid_request("panel dimensions must be positive");
        err.details["span_mm"] = std::to_string(span_mm);
        err.details["width_mm"] = std::to_string(width_mm);
        err.details["support"] = support_condition_to_string(support);
        throw DesignException(err);
    }
}

double PanelGeometry::characteristic_span() const {
    if (support == SupportCondition::FourEdgeSimplySupported) {
        return std::min(span_mm, width_mm);
    }
    return span_mm;
}

double PanelGeometry::aspect_ratio() const {
    const double lo = std::min(span_mm, width_mm);
    const double hi = std::max(span_mm, width_mm);
    return lo > 0.0 ? hi / lo : 1.0;
}

double PanelGeometry::stress_coefficient() const {
    switch (support) {
        case SupportCondition::TwoEdgeSimplySupported: return 0.75;
        case SupportCondition::Cantilever: return 3.0;
        case SupportCondition::FourEdgeSimplySupported:
            return four_edge_coefficients(aspect_ratio()).beta;
    }
    return 0.75;
}

double PanelGeometry::deflection_coefficient() const {
    switch (support) {
        case SupportCondition::TwoEdgeSimplySupported: return 5.0 * 12.0 / 384.0;
        case SupportCondition::Cantilever: return 12.0 / 8.0;
        case SupportCondition::FourEdgeSimplySupported:
            return four_edge_coefficients(aspect_ratio()).alpha;
    }
    return 5.0 * 12.0 / 384.0;
}

double PanelGeometry::bending_stress(double pressure_kpa, double thickness_mm) const {
    const double L = characteristic_span();
    return stress_coefficient() * pressure_kpa * kKpaToMpa * L * L /
           (thickness_mm * thickness_mm);
}

double PanelGeometry::pressure_capacity(double stress_mpa, double thickness_mm) const {
    const double L = characteristic_span();
    return stress_mpa * thickness_mm * thickness_mm /
           (stress_coefficient() * L * L * kKpaToMpa);
}

double PanelGeometry::deflection(double pressure_kpa, double thickness_mm,
                                 double youngs_modulus_mpa) const {
    const double L = characteristic_span();
    return deflection_coefficient() * pressure_kpa * kKpaToMpa * std::pow(L, 4) /
           (youngs_modulus_mpa * std::pow(thickness_mm, 3));
}

} // namespace glasscheck
