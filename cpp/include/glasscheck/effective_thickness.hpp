#pragma once

#include "glasscheck/laminate.hpp"
#include "glasscheck/panel_geometry.hpp"

#include <vector>

namespace glasscheck {

/// Young's modulus of soda lime silicate glass [MPa] (EN 572-1)
constexpr double kGlassYoungsModulus = 70000.0;

/**
 * @brief Effective thicknesses of a pane
 *
 * Units: [mm]
 */
struct EffectiveThickness {
    /// Effective thickness for deflection design h_ef,w
    double deflection_mm = 0.0;

    /// Stress effective thickness per ply h_ef,sigma,i (closed form)
    std::vector<double> stress_mm;

    /// Bending-design effective thickness h_ef,sigma
    double bending_design_mm = 0.0;

    /// Shear transfer coefficient Gamma in [0, 1] (1 for monolithic panes)
    double shear_transfer = 1.0;

    /**
     * @brief Bending-design effective thickness
     */
    double bending_mm() const { return bending_design_mm; }

    /**
     * @brief Bending-design thickness of one ply
     *
     * The closed-form ply value scaled so that the governing ply gets
     * bending_mm(). Keeps the ratios between plies.
     * @throws std::out_of_range for an invalid ply index
     */
    double ply_bending_mm(size_t ply) const;

    /**
     * @brief Index of the ply with the smallest stress effective thickness
     */
    size_t governing_ply() const;
};

/**
 * @brief Effective thickness of monolithic and laminated panes
 *
 * Shear transfer model of EN 16612 (Wölfel-Bennison), written for n plies:
 *
 *   z_i      mid-plane of ply i, z_bar = sum(h_i z_i) / sum(h_i)
 *   d_i      = z_i - z_bar
 *   I_s      = sum(h_i d_i^2)
 *   h_s      distance between the mid-planes of the outer plies
 *   h_v      mean interlayer thickness
 *   Gamma    = 1 / (1 + 9.6 E I_s h_v / (G h_s^2 a^2))
 *   h_ef,w   = (sum(h_i^3) + 12 Gamma I_s)^(1/3)
 *   h_ef,s,i = sqrt(h_ef,w^3 / (h_i + 2 Gamma |d_i|))
 *   h_ef,s   = (1 - Gamma) min_i h_ef,s,i(0) + Gamma min_i h_ef,s,i(1)
 *
 * with a the characteristic span of the pane. For two plies h_ef,w and
 * h_ef,s,i are the closed forms given in the standard. Gamma = 0 is the
 * layered limit (plies act independently), Gamma = 1 the monolithic limit
 * (full composite action). Gamma increases strictly with G, so h_ef,w and
 * h_ef,s are bracketed by the two limits. min_i h_ef,s,i itself is not:
 * for unequal plies it peaks above the monolithic limit.
 *
 * Usage:
 *   EffectiveThicknessResolver resolver;
 *   EffectiveThickness eff = resolver.resolve(stack, G, geometry);
 *   double h_sigma = eff.bending_mm();
 *   double h_w = eff.deflection_mm;
 */
class EffectiveThicknessResolver {
public:
    /**
     * @brief Construct resolver
     * @param youngs_modulus_mpa Glass Young's modulus [MPa]
     */
    explicit EffectiveThicknessResolver(double youngs_modulus_mpa = kGlassYoungsModulus);

    /**
     * @brief Effective thicknesses for a stack and interlayer modulus
     * @param stack Layer stack (validated here)
     * @param shear_modulus_mpa Interlayer shear modulus [MPa], >= 0 (+inf allowed);
     *        ignored for monolithic stacks
     * @param geometry Pane geometry; only used for laminated stacks
     * @throws DesignException INVALID_STACK_CONFIGURATION, or INVALID_REQUEST
     *         for a bad modulus or geometry of a laminated stack
     */
    EffectiveThickness resolve(const LaminateStack& stack,
                               double shear_modulus_mpa,
                               const PanelGeometry& geometry) const;

    /**
     * @brief Shear transfer coefficient Gamma (1 for monolithic stacks)
     */
    double shear_transfer_coefficient(const LaminateStack& stack,
                                      double shear_modulus_mpa,
                                      const PanelGeometry& geometry) const;

    /**
     * @brief Effective thicknesses for a prescribed Gamma in [0, 1]
     */
    EffectiveThickness at_shear_transfer(const LaminateStack& stack, double gamma) const;

    /**
     * @brief Layered limit (Gamma = 0)
     */
    EffectiveThickness layered_limit(const LaminateStack& stack) const;

    /**
     * @brief Monolithic limit (Gamma = 1)
     */
    EffectiveThickness monolithic_limit(const LaminateStack& stack) const;

    double youngs_modulus() const { return youngs_modulus_; }

private:
    double youngs_modulus_;
};

} // namespace glasscheck
