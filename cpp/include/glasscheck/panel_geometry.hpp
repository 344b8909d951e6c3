#pragma once

#include <string>

namespace glasscheck {

/**
 * @brief Support arrangement of a rectangular pane
 */
enum class SupportCondition {
    TwoEdgeSimplySupported,   ///< One-way span between two opposite supported edges
    FourEdgeSimplySupported,  ///< Linear supports on all four edges
    Cantilever                ///< One edge clamped, span measured from the clamp
};

inline std::string support_condition_to_string(SupportCondition support) {
    switch (support) {
        case SupportCondition::TwoEdgeSimplySupported: return "TwoEdgeSimplySupported";
        case SupportCondition::FourEdgeSimplySupported: return "FourEdgeSimplySupported";
        case SupportCondition::Cantilever: return "Cantilever";
        default: return "unknown";
    }
}

/**
 * @brief Pane dimensions and supports
 *
 * Units:
 * - span_mm: Span a [mm] (for one-way and cantilever panes, the bending span)
 * - width_mm: Width b [mm] (other edge; used by four-edge support)
 *
 * Stress and deflection for a uniform pressure q on a pane of thickness h
 * (per unit width, linear small-deflection plate theory):
 *
 * - TwoEdgeSimplySupported: sigma = 0.75 q L^2 / h^2,  w = 0.15625 q L^4 / (E h^3)
 * - Cantilever:             sigma = 3 q L^2 / h^2,     w = 1.5 q L^4 / (E h^3)
 * - FourEdgeSimplySupported (Roark, b = shorter side, r = long/short):
 *                           sigma = beta(r) q b^2 / h^2, w = alpha(r) q b^4 / (E h^3)
 */
struct PanelGeometry {
    double span_mm = 0.0;   ///< Span a [mm]
    double width_mm = 0.0;  ///< Width b [mm]
    SupportCondition support = SupportCondition::TwoEdgeSimplySupported;

    PanelGeometry() = default;

    PanelGeometry(double span_mm, double width_mm, SupportCondition support)
        : span_mm(span_mm), width_mm(width_mm), support(support) {}

    /**
     * @brief Check dimensions are positive and finite
     * @throws DesignException INVALID_REQUEST
     */
    void validate() const;

    /**
     * @brief Whether span and width are positive and finite
     */
    bool is_valid() const;

    /**
     * @brief Length governing shear coupling and bending [mm]
     *
     * The shorter side for four-edge support, otherwise the span.
     */
    double characteristic_span() const;

    /**
     * @brief Aspect ratio long side / short side (>= 1)
     */
    double aspect_ratio() const;

    /**
     * @brief Dimensionless stress coefficient k_sigma in sigma = k_sigma q L^2 / h^2
     */
    double stress_coefficient() const;

    /**
     * @brief Dimensionless deflection coefficient k_w in w = k_w q L^4 / (E h^3)
     */
    double deflection_coefficient() const;

    /**
     * @brief Maximum bending stress [MPa]
     * @param pressure_kpa Uniform pressure [kPa]
     * @param thickness_mm Stress effective thickness [mm]
     */
    double bending_stress(double pressure_kpa, double thickness_mm) const;

    /**
     * @brief Uniform pressure producing a given bending stress [kPa]
     * @param stress_mpa Bending stress [MPa]
     * @param thickness_mm Stress effective thickness [mm]
     */
    double pressure_capacity(double stress_mpa, double thickness_mm) const;

    /**
     * @brief Maximum deflection [mm]
     * @param pressure_kpa Uniform pressure [kPa]
     * @param thickness_mm Deflection effective thickness [mm]
     * @param youngs_modulus_mpa Glass Young's modulus [MPa]
     */
    double deflection(double pressure_kpa, double thickness_mm,
                      double youngs_modulus_mpa) const;
};

} // namespace glasscheck
