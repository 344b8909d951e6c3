#include "glasscheck/laminate.hpp"
#include "glasscheck/errors.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace glasscheck {

namespace {

std::string glass_abbreviation(GlassType type) {
    switch (type) {
        case GlassType::Annealed: return "AN";
        case GlassType::HeatStrengthened: return "HS";
        case GlassType::Toughened: return "FT";
        case GlassType::ChemicallyStrengthened: return "CS";
    }
    return "?";
}

} // namespace

PaneLayer PaneLayer::ply(double thickness_mm, GlassType type) {
    PaneLayer layer;
    layer.thickness_mm = thickness_mm;
    layer.role = LayerRole::StructuralPly;
    layer.glass_type = type;
    return layer;
}

PaneLayer PaneLayer::interlayer(double thickness_mm, const std::string& product_id) {
    PaneLayer layer;
    layer.thickness_mm = thickness_mm;
    layer.role = LayerRole::Interlayer;
    layer.product_id = product_id;
    return layer;
}

LaminateStack::LaminateStack(std::vector<PaneLayer> layers)
    : layers_(std::move(layers)) {}

LaminateStack LaminateStack::monolithic(double thickness_mm, GlassType type) {
    LaminateStack stack;
    stack.add_ply(thickness_mm, type);
    return stack;
}

LaminateStack LaminateStack::two_ply(double h1_mm, double h2_mm, double interlayer_mm,
                                     const std::string& product_id, GlassType type) {
    LaminateStack stack;
    stack.add_ply(h1_mm, type).add_interlayer(interlayer_mm, product_id).add_ply(h2_mm, type);
    return stack;
}

LaminateStack& LaminateStack::add_ply(double thickness_mm, GlassType type) {
    layers_.push_back(PaneLayer::ply(thickness_mm, type));
    return *this;
}

LaminateStack& LaminateStack::add_interlayer(double thickness_mm, const std::string& product_id) {
    layers_.push_back(PaneLayer::interlayer(thickness_mm, product_id));
    return *this;
}

void LaminateStack::validate() const {
    if (ply_count() == 0) {
        throw DesignException(DesignError::invalid_stack("no structural plies"));
    }

    for (size_t i = 0; i < layers_.size(); ++i) {
        const PaneLayer& layer = layers_[i];
        if (!std::isfinite(layer.thickness_mm) || layer.thickness_mm <= 0.0) {
            DesignError err = DesignError::invalid_stack("layer thickness must be positive");
            err.details["layer"] = std::to_string(i);
            throw DesignException(err);
        }

        // Plies sit at even positions, interlayers at odd positions
        const bool expect_ply = (i % 2 == 0);
        if (layer.is_ply() != expect_ply) {
            DesignError err = DesignError::invalid_stack(
                expect_ply ? "expected a ply, found an interlayer"
                           : "expected an interlayer between plies");
            err.details["layer"] = std::to_string(i);
            throw DesignException(err);
        }

        if (!layer.is_ply() && layer.product_id.empty()) {
            DesignError err = DesignError::invalid_stack("interlayer without product id");
            err.details["layer"] = std::to_string(i);
            throw DesignException(err);
        }
    }

    if (!layers_.back().is_ply()) {
        throw DesignException(DesignError::invalid_stack("stack must end with a ply"));
    }

    const std::string product = interlayer_product();
    for (const auto& layer : layers_) {
        if (!layer.is_ply() && layer.product_id != product) {
            DesignError err = DesignError::invalid_stack("interlayers of different products");
            err.details["products"] = product + ", " + layer.product_id;
            throw DesignException(err);
        }
    }
}

std::vector<PaneLayer> LaminateStack::plies() const {
    std::vector<PaneLayer> result;
    for (const auto& layer : layers_) {
        if (layer.is_ply()) result.push_back(layer);
    }
    return result;
}

std::vector<double> LaminateStack::ply_thicknesses() const {
    std::vector<double> result;
    for (const auto& layer : layers_) {
        if (layer.is_ply()) result.push_back(layer.thickness_mm);
    }
    return result;
}

std::vector<double> LaminateStack::interlayer_thicknesses() const {
    std::vector<double> result;
    for (const auto& layer : layers_) {
        if (!layer.is_ply()) result.push_back(layer.thickness_mm);
    }
    return result;
}

size_t LaminateStack::ply_count() const {
    size_t n = 0;
    for (const auto& layer : layers_) {
        if (layer.is_ply()) ++n;
    }
    return n;
}

size_t LaminateStack::interlayer_count() const {
    return layers_.size() - ply_count();
}

std::string LaminateStack::interlayer_product() const {
    for (const auto& layer : layers_) {
        if (!layer.is_ply()) return layer.product_id;
    }
    return "";
}

double LaminateStack::glass_thickness() const {
    double sum = 0.0;
    for (const auto& layer : layers_) {
        if (layer.is_ply()) sum += layer.thickness_mm;
    }
    return sum;
}

double LaminateStack::total_thickness() const {
    double sum = 0.0;
    for (const auto& layer : layers_) {
        sum += layer.thickness_mm;
    }
    return sum;
}

std::string LaminateStack::description() const {
    std::ostringstream oss;
    for (size_t i = 0; i < layers_.size(); ++i) {
        if (i > 0) oss << " / ";
        const PaneLayer& layer = layers_[i];
        if (layer.is_ply()) {
            oss << std::fixed << std::setprecision(1) << layer.thickness_mm << " "
                << glass_abbreviation(layer.glass_type);
        } else {
            oss << std::fixed << std::setprecision(2) << layer.thickness_mm << " "
                << layer.product_id;
        }
    }
    return oss.str();
}

} // namespace glasscheck
