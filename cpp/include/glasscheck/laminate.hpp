#pragma once

#include "glasscheck/categories.hpp"

#include <string>
#include <vector>

namespace glasscheck {

/**
 * @brief Role of a layer in a pane build-up
 */
enum class LayerRole {
    StructuralPly,  ///< Glass ply
    Interlayer      ///< Polymer bonding layer (PVB, ionoplast, EVA, ...)
};

/**
 * @brief One layer of a pane
 *
 * Units:
 * - thickness_mm: Nominal thickness [mm]
 *
 * glass_type is meaningful for plies, product_id for interlayers.
 */
struct PaneLayer {
    double thickness_mm = 0.0;                 ///< Nominal thickness [mm]
    LayerRole role = LayerRole::StructuralPly; ///< Ply or interlayer
    GlassType glass_type = GlassType::Annealed;///< Glass type (plies)
    std::string product_id;                    ///< Interlayer product (interlayers)

    /**
     * @brief Create a glass ply
     */
    static PaneLayer ply(double thickness_mm, GlassType type);

    /**
     * @brief Create an interlayer
     */
    static PaneLayer interlayer(double thickness_mm, const std::string& product_id);

    bool is_ply() const { return role == LayerRole::StructuralPly; }
};

/**
 * @brief Ordered layer build-up of a glass pane
 *
 * Supported configurations:
 * - monolithic: a single ply
 * - laminated: ply, interlayer, ply [, interlayer, ply ...], all
 *   interlayers of one product
 *
 * Layers are ordered from one face to the other.
 *
 * Usage:
 *   LaminateStack stack;
 *   stack.add_ply(10.0, GlassType::HeatStrengthened)
 *        .add_interlayer(1.52, "PVB-A")
 *        .add_ply(10.0, GlassType::HeatStrengthened);
 *   stack.validate();
 */
class LaminateStack {
public:
    LaminateStack() = default;

    explicit LaminateStack(std::vector<PaneLayer> layers);

    /**
     * @brief Monolithic pane of one ply
     */
    static LaminateStack monolithic(double thickness_mm, GlassType type);

    /**
     * @brief Two-ply laminate with identical glass type
     */
    static LaminateStack two_ply(double h1_mm, double h2_mm, double interlayer_mm,
                                 const std::string& product_id, GlassType type);

    LaminateStack& add_ply(double thickness_mm, GlassType type);

    LaminateStack& add_interlayer(double thickness_mm, const std::string& product_id);

    /**
     * @brief Check the layer ordering and layer data
     * @throws DesignException INVALID_STACK_CONFIGURATION
     */
    void validate() const;

    const std::vector<PaneLayer>& layers() const { return layers_; }

    /**
     * @brief Glass plies in stack order
     */
    std::vector<PaneLayer> plies() const;

    /**
     * @brief Ply thicknesses in stack order [mm]
     */
    std::vector<double> ply_thicknesses() const;

    /**
     * @brief Interlayer thicknesses in stack order [mm]
     */
    std::vector<double> interlayer_thicknesses() const;

    size_t ply_count() const;

    size_t interlayer_count() const;

    bool is_monolithic() const { return ply_count() == 1 && interlayer_count() == 0; }

    /**
     * @brief Interlayer product shared by all interlayers ("" if monolithic)
     */
    std::string interlayer_product() const;

    /**
     * @brief Sum of glass ply thicknesses [mm]
     */
    double glass_thickness() const;

    /**
     * @brief Sum of all layer thicknesses [mm]
     */
    double total_thickness() const;

    /**
     * @brief Short description such as "10.0 HS / 1.52 PVB-A / 10.0 HS"
     */
    std::string description() const;

private:
    std::vector<PaneLayer> layers_;
};

} // namespace glasscheck
