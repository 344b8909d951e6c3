#include "glasscheck/effective_thickness.hpp"
#include "glasscheck/errors.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <vector>

namespace glasscheck {

namespace {

/**
 * @brief Ply geometry of a laminate relative to the glass-only neutral axis
 */
struct PlyLayout {
    Eigen::VectorXd h;  ///< Ply thicknesses [mm]
    Eigen::VectorXd d;  ///< Ply mid-plane offsets from the neutral axis [mm]
    double Is = 0.0;    ///< Steiner term sum(h_i d_i^2) [mm³]
    double hs = 0.0;    ///< Distance between outer ply mid-planes [mm]
    double hv = 0.0;    ///< Mean interlayer thickness [mm]
};

PlyLayout ply_layout(const LaminateStack& stack) {
    const auto& layers = stack.layers();
    const auto plies = stack.ply_thicknesses();
    const Eigen::Index n = static_cast<Eigen::Index>(plies.size());

    PlyLayout layout;
    layout.h = Eigen::Map<const Eigen::VectorXd>(plies.data(), n);

    Eigen::VectorXd z(n);
    double position = 0.0;
    Eigen::Index ply = 0;
    for (const auto& layer : layers) {
        if (layer.is_ply()) {
            z(ply++) = position + 0.5 * layer.thickness_mm;
        }
        position += layer.thickness_mm;
    }

    const double z_bar = layout.h.dot(z) / layout.h.sum();
    layout.d = z.array() - z_bar;
    layout.Is = (layout.h.array() * layout.d.array().square()).sum();
    layout.hs = z(n - 1) - z(0);

    const auto interlayers = stack.interlayer_thicknesses();
    if (!interlayers.empty()) {
        double sum = 0.0;
        for (double t : interlayers) sum += t;
        layout.hv = sum / static_cast<double>(interlayers.size());
    }
    return layout;
}

std::vector<double> ply_stress_thickness(const PlyLayout& layout, double gamma, double hw3) {
    std::vector<double> h_sigma(static_cast<size_t>(layout.h.size()));
    for (Eigen::Index i = 0; i < layout.h.size(); ++i) {
        const double denom = layout.h(i) + 2.0 * gamma * std::abs(layout.d(i));
        h_sigma[static_cast<size_t>(i)] = std::sqrt(hw3 / denom);
    }
    return h_sigma;
}

double smallest(const std::vector<double>& values) {
    return *std::min_element(values.begin(), values.end());
}

EffectiveThickness thickness_from_layout(const PlyLayout& layout, double gamma) {
    EffectiveThickness eff;
    eff.shear_transfer = gamma;

    const double sum_h3 = layout.h.array().cube().sum();
    const double hw3 = sum_h3 + 12.0 * gamma * layout.Is;
    eff.deflection_mm = std::cbrt(hw3);
    eff.stress_mm = ply_stress_thickness(layout, gamma, hw3);

    // The smallest ply value peaks between the limits when the plies differ,
    // so the design value is taken on the straight line between the limits
    const double layered = smallest(ply_stress_thickness(layout, 0.0, sum_h3));
    const double full = smallest(ply_stress_thickness(layout, 1.0, sum_h3 + 12.0 * layout.Is));
    eff.bending_design_mm = (1.0 - gamma) * layered + gamma * full;
    return eff;
}

EffectiveThickness monolithic_thickness(const LaminateStack& stack) {
    EffectiveThickness eff;
    const double h = stack.glass_thickness();
    eff.deflection_mm = h;
    eff.stress_mm = {h};
    eff.bending_design_mm = h;
    eff.shear_transfer = 1.0;
    return eff;
}

} // namespace

double EffectiveThickness::ply_bending_mm(size_t ply) const {
    const double governing = stress_mm.at(governing_ply());
    return stress_mm.at(ply) * bending_design_mm / governing;
}

size_t EffectiveThickness::governing_ply() const {
    if (stress_mm.empty()) return 0;
    return static_cast<size_t>(
        std::min_element(stress_mm.begin(), stress_mm.end()) - stress_mm.begin());
}

EffectiveThicknessResolver::EffectiveThicknessResolver(double youngs_modulus_mpa)
    : youngs_modulus_(youngs_modulus_mpa) {}

double EffectiveThicknessResolver::shear_transfer_coefficient(const LaminateStack& stack,
                                                              double shear_modulus_mpa,
                                                              const PanelGeometry& geometry) const {
    stack.validate();
    if (stack.is_monolithic()) {
        return 1.0;
    }

    if (std::isnan(shear_modulus_mpa) || shear_modulus_mpa < 0.0) {
        DesignError err = DesignError::invalid_request("shear modulus must be non-negative");
        err.details["shear_modulus_mpa"] = std::to_string(shear_modulus_mpa);
        throw DesignException(err);
    }
    geometry.validate();

    if (shear_modulus_mpa == 0.0) return 0.0;
    if (std::isinf(shear_modulus_mpa)) return 1.0;

    const PlyLayout layout = ply_layout(stack);
    const double a = geometry.characteristic_span();
    const double compliance = 9.6 * youngs_modulus_ * layout.Is * layout.hv /
                              (shear_modulus_mpa * layout.hs * layout.hs * a * a);
    return 1.0 / (1.0 + compliance);
}

EffectiveThickness EffectiveThicknessResolver::resolve(const LaminateStack& stack,
                                                       double shear_modulus_mpa,
                                                       const PanelGeometry& geometry) const {
    stack.validate();
    if (stack.is_monolithic()) {
        return monolithic_thickness(stack);
    }
    const double gamma = shear_transfer_coefficient(stack, shear_modulus_mpa, geometry);
    return thickness_from_layout(ply_layout(stack), gamma);
}

EffectiveThickness EffectiveThicknessResolver::at_shear_transfer(const LaminateStack& stack,
                                                                 double gamma) const {
    stack.validate();
    if (stack.is_monolithic()) {
        return monolithic_thickness(stack);
    }
    if (!(gamma >= 0.0 && gamma <= 1.0)) {
        DesignError err = DesignError::invalid_request("shear transfer coefficient outside [0, 1]");
        err.details["gamma"] = std::to_string(gamma);
        throw DesignException(err);
    }
    return thickness_from_layout(ply_layout(stack), gamma);
}

EffectiveThickness EffectiveThicknessResolver::layered_limit(const LaminateStack& stack) const {
    return at_shear_transfer(stack, 0.0);
}

EffectiveThickness EffectiveThicknessResolver::monolithic_limit(const LaminateStack& stack) const {
    return at_shear_transfer(stack, 1.0);
}

} // namespace glasscheck
