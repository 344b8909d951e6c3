#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "glasscheck/categories.hpp"
#include "glasscheck/errors.hpp"
#include "glasscheck/warnings.hpp"
#include "glasscheck/logging.hpp"
#include "glasscheck/material.hpp"
#include "glasscheck/material_table_reader.hpp"
#include "glasscheck/modulus_interpolator.hpp"
#include "glasscheck/laminate.hpp"
#include "glasscheck/panel_geometry.hpp"
#include "glasscheck/effective_thickness.hpp"
#include "glasscheck/factors.hpp"
#include "glasscheck/load_case.hpp"
#include "glasscheck/design_calculator.hpp"

#include <sstream>

namespace py = pybind11;

/**
 * glasscheck C++ Python bindings module.
 * This module exposes the design strength engine to Python via pybind11.
 */
PYBIND11_MODULE(_glasscheck_cpp, m) {
    m.doc() = "glasscheck C++ core module - structural glass design strength engine";

    // Version information
    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    static py::exception<glasscheck::DesignException> design_exception(
        m, "DesignException", PyExc_RuntimeError);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const glasscheck::DesignException& e) {
            py::object exc = design_exception;
            py::object instance = exc(e.what());
            instance.attr("code") = py::cast(e.code());
            instance.attr("load_case_index") = e.error().load_case_index;
            instance.attr("details") = py::cast(e.error().details);
            PyErr_SetObject(design_exception.ptr(), instance.ptr());
        }
    });

    py::enum_<glasscheck::ErrorCode>(m, "ErrorCode",
        "Error codes for glasscheck failures")
        .value("OK", glasscheck::ErrorCode::OK, "No error")
        .value("UNKNOWN_PRODUCT", glasscheck::ErrorCode::UNKNOWN_PRODUCT,
               "Interlayer product not in the material table")
        .value("UNSUPPORTED_DURATION_CLASS", glasscheck::ErrorCode::UNSUPPORTED_DURATION_CLASS,
               "Product has no samples for the duration class")
        .value("DUPLICATE_SAMPLE", glasscheck::ErrorCode::DUPLICATE_SAMPLE,
               "Repeated (temperature, duration) sample of a product")
        .value("INVALID_TABLE_FORMAT", glasscheck::ErrorCode::INVALID_TABLE_FORMAT,
               "Tabular source could not be parsed")
        .value("FILE_NOT_FOUND", glasscheck::ErrorCode::FILE_NOT_FOUND,
               "Tabular source file could not be opened")
        .value("INVALID_STACK_CONFIGURATION", glasscheck::ErrorCode::INVALID_STACK_CONFIGURATION,
               "Invalid laminate stack")
        .value("UNSUPPORTED_COMBINATION", glasscheck::ErrorCode::UNSUPPORTED_COMBINATION,
               "Combination not covered by the standard")
        .value("INVALID_REQUEST", glasscheck::ErrorCode::INVALID_REQUEST,
               "Malformed request")
        .value("UNKNOWN_ERROR", glasscheck::ErrorCode::UNKNOWN_ERROR,
               "Unknown error")
        .export_values();

    py::class_<glasscheck::DesignError>(m, "DesignError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<glasscheck::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &glasscheck::DesignError::code, "Error code")
        .def_readwrite("message", &glasscheck::DesignError::message, "Error message")
        .def_readwrite("load_case_index", &glasscheck::DesignError::load_case_index,
                       "Failing load case (-1 if none)")
        .def_readwrite("details", &glasscheck::DesignError::details,
                       "Additional diagnostic details (key-value pairs)")
        .def_readwrite("suggestion", &glasscheck::DesignError::suggestion,
                       "Suggested fix for the error")
        .def("is_ok", &glasscheck::DesignError::is_ok)
        .def("is_error", &glasscheck::DesignError::is_error)
        .def("code_string", &glasscheck::DesignError::code_string)
        .def("to_string", &glasscheck::DesignError::to_string)
        .def("__repr__", [](const glasscheck::DesignError &e) {
            if (e.is_ok()) return std::string("<DesignError OK>");
            return "<DesignError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &glasscheck::DesignError::to_string);

    py::enum_<glasscheck::WarningCode>(m, "WarningCode",
        "Warning codes for non-fatal design conditions")
        .value("OUT_OF_RANGE_EXTRAPOLATION", glasscheck::WarningCode::OUT_OF_RANGE_EXTRAPOLATION,
               "Nearest boundary sample used outside the sampled temperature range")
        .value("MISSING_MODULUS_FILLED", glasscheck::WarningCode::MISSING_MODULUS_FILLED,
               "Missing table cell replaced by the fill value")
        .value("DEFLECTION_LIMIT_EXCEEDED", glasscheck::WarningCode::DEFLECTION_LIMIT_EXCEEDED,
               "Deflection exceeds the span limit")
        .value("UTILIZATION_EXCEEDED", glasscheck::WarningCode::UTILIZATION_EXCEEDED,
               "Utilization above 1")
        .export_values();

    py::enum_<glasscheck::WarningSeverity>(m, "WarningSeverity",
        "Warning severity levels")
        .value("Low", glasscheck::WarningSeverity::Low, "Minor issue")
        .value("Medium", glasscheck::WarningSeverity::Medium, "Review recommended")
        .value("High", glasscheck::WarningSeverity::High, "Check not satisfied")
        .export_values();

    py::class_<glasscheck::DesignWarning>(m, "DesignWarning",
        "Structured warning information")
        .def_readwrite("code", &glasscheck::DesignWarning::code, "Warning code")
        .def_readwrite("severity", &glasscheck::DesignWarning::severity, "Severity level")
        .def_readwrite("message", &glasscheck::DesignWarning::message, "Warning message")
        .def_readwrite("load_case_index", &glasscheck::DesignWarning::load_case_index)
        .def_readwrite("details", &glasscheck::DesignWarning::details)
        .def_readwrite("suggestion", &glasscheck::DesignWarning::suggestion)
        .def("code_string", &glasscheck::DesignWarning::code_string)
        .def("severity_string", &glasscheck::DesignWarning::severity_string)
        .def("to_string", &glasscheck::DesignWarning::to_string)
        .def("__repr__", [](const glasscheck::DesignWarning &w) {
            return "<DesignWarning [" + w.severity_string() + "] " +
                   w.code_string() + ": " + w.message + ">";
        });

    py::class_<glasscheck::WarningList>(m, "WarningList",
        "Collection of warnings")
        .def(py::init<>())
        .def_readonly("warnings", &glasscheck::WarningList::warnings)
        .def("has_warnings", &glasscheck::WarningList::has_warnings)
        .def("count", &glasscheck::WarningList::count)
        .def("count_by_code", &glasscheck::WarningList::count_by_code, py::arg("code"))
        .def("summary", &glasscheck::WarningList::summary)
        .def("__len__", &glasscheck::WarningList::count);

    m.def("set_log_level", [](const std::string& level) {
              glasscheck::set_log_level(spdlog::level::from_str(level));
          },
          py::arg("level"),
          "Set library log level: trace, debug, info, warning, error, critical, off");

    // ========================================================================
    // Categorical inputs
    // ========================================================================

    py::enum_<glasscheck::Standard>(m, "Standard", "Design standard")
        .value("EN16612", glasscheck::Standard::EN16612)
        .value("IStructE", glasscheck::Standard::IStructE);

    py::enum_<glasscheck::GlassType>(m, "GlassType", "Glass product by process")
        .value("Annealed", glasscheck::GlassType::Annealed)
        .value("HeatStrengthened", glasscheck::GlassType::HeatStrengthened)
        .value("Toughened", glasscheck::GlassType::Toughened)
        .value("ChemicallyStrengthened", glasscheck::GlassType::ChemicallyStrengthened);

    py::enum_<glasscheck::EdgeCondition>(m, "EdgeCondition", "Edge working")
        .value("Polished", glasscheck::EdgeCondition::Polished)
        .value("Ground", glasscheck::EdgeCondition::Ground)
        .value("Arrissed", glasscheck::EdgeCondition::Arrissed)
        .value("AsCut", glasscheck::EdgeCondition::AsCut);

    py::enum_<glasscheck::SurfaceProfile>(m, "SurfaceProfile", "Glass surface profile")
        .value("Float", glasscheck::SurfaceProfile::Float)
        .value("DrawnSheet", glasscheck::SurfaceProfile::DrawnSheet)
        .value("Enamelled", glasscheck::SurfaceProfile::Enamelled)
        .value("Patterned", glasscheck::SurfaceProfile::Patterned)
        .value("EnamelledPatterned", glasscheck::SurfaceProfile::EnamelledPatterned)
        .value("PolishedWired", glasscheck::SurfaceProfile::PolishedWired)
        .value("PatternedWired", glasscheck::SurfaceProfile::PatternedWired);

    py::enum_<glasscheck::SurfaceFinish>(m, "SurfaceFinish", "Surface treatment")
        .value("None", glasscheck::SurfaceFinish::None)
        .value("SandBlasted", glasscheck::SurfaceFinish::SandBlasted)
        .value("AcidEtched", glasscheck::SurfaceFinish::AcidEtched);

    py::enum_<glasscheck::TougheningProcess>(m, "TougheningProcess", "Toughening process")
        .value("Horizontal", glasscheck::TougheningProcess::Horizontal)
        .value("Vertical", glasscheck::TougheningProcess::Vertical);

    py::enum_<glasscheck::ConsequenceClass>(m, "ConsequenceClass", "Consequence class")
        .value("CC1", glasscheck::ConsequenceClass::CC1)
        .value("CC2", glasscheck::ConsequenceClass::CC2)
        .value("CC3", glasscheck::ConsequenceClass::CC3);

    py::enum_<glasscheck::DurationClass>(m, "DurationClass", "Load duration class")
        .value("Short", glasscheck::DurationClass::Short, "3 s")
        .value("Medium", glasscheck::DurationClass::Medium, "10 min")
        .value("Day", glasscheck::DurationClass::Day, "1 day")
        .value("Long", glasscheck::DurationClass::Long, "6 months")
        .value("Permanent", glasscheck::DurationClass::Permanent, "50 years");

    m.def("duration_label", &glasscheck::duration_label, py::arg("duration"));
    m.def("parse_duration_class", &glasscheck::parse_duration_class, py::arg("text"));
    m.def("parse_standard", &glasscheck::parse_standard, py::arg("text"));
    m.def("parse_glass_type", &glasscheck::parse_glass_type, py::arg("text"));

    // ========================================================================
    // Material data
    // ========================================================================

    py::class_<glasscheck::MaterialSample>(m, "MaterialSample",
        "Interlayer shear modulus measurement")
        .def(py::init<>())
        .def(py::init<std::string, double, glasscheck::DurationClass, double>(),
             py::arg("product_id"), py::arg("temperature_c"),
             py::arg("duration"), py::arg("shear_modulus_mpa"))
        .def_readwrite("product_id", &glasscheck::MaterialSample::product_id)
        .def_readwrite("temperature_c", &glasscheck::MaterialSample::temperature_c,
                       "Temperature [°C]")
        .def_readwrite("duration", &glasscheck::MaterialSample::duration)
        .def_readwrite("shear_modulus_mpa", &glasscheck::MaterialSample::shear_modulus_mpa,
                       "Shear modulus [MPa]")
        .def("__repr__", [](const glasscheck::MaterialSample &s) {
            std::ostringstream oss;
            oss << "<MaterialSample " << s.product_id << " T=" << s.temperature_c
                << " " << glasscheck::duration_label(s.duration)
                << " G=" << s.shear_modulus_mpa << ">";
            return oss.str();
        });

    py::class_<glasscheck::MaterialPropertyTable,
               std::shared_ptr<glasscheck::MaterialPropertyTable>>(m, "MaterialPropertyTable",
        "Immutable interlayer shear modulus dataset")
        .def(py::init<const std::vector<glasscheck::MaterialSample>&>(), py::arg("samples"))
        .def("lookup", &glasscheck::MaterialPropertyTable::lookup,
             py::arg("product_id"), py::arg("temperature_c"), py::arg("duration"),
             "Exact-match lookup (None if not sampled)")
        .def("has_product", &glasscheck::MaterialPropertyTable::has_product)
        .def("products", &glasscheck::MaterialPropertyTable::products)
        .def("durations", &glasscheck::MaterialPropertyTable::durations)
        .def("temperature_range", &glasscheck::MaterialPropertyTable::temperature_range)
        .def("samples", &glasscheck::MaterialPropertyTable::samples)
        .def("__len__", &glasscheck::MaterialPropertyTable::size);

    py::class_<glasscheck::MaterialTableReaderSettings>(m, "MaterialTableReaderSettings")
        .def(py::init<>())
        .def_readwrite("missing_modulus_fill_mpa",
                       &glasscheck::MaterialTableReaderSettings::missing_modulus_fill_mpa)
        .def_readwrite("reject_missing_values",
                       &glasscheck::MaterialTableReaderSettings::reject_missing_values)
        .def_readwrite("delimiter", &glasscheck::MaterialTableReaderSettings::delimiter);

    py::class_<glasscheck::MaterialTableReader>(m, "MaterialTableReader",
        "CSV reader for interlayer tables")
        .def(py::init<glasscheck::MaterialTableReaderSettings>(),
             py::arg("settings") = glasscheck::MaterialTableReaderSettings{})
        .def("read_long_file", &glasscheck::MaterialTableReader::read_long_file, py::arg("path"))
        .def("read_wide_file",
             [](const glasscheck::MaterialTableReader &r, const std::string& product,
                const std::string& path) {
                 glasscheck::WarningList warnings;
                 auto samples = r.read_wide_file(product, path, &warnings);
                 return py::make_tuple(samples, warnings);
             },
             py::arg("product_id"), py::arg("path"),
             "Read a wide-format file; returns (samples, warnings)");

    m.def("load_material_table",
          [](const std::string& path, const glasscheck::MaterialTableReaderSettings& settings) {
              auto table = glasscheck::load_material_table(path, settings);
              return std::const_pointer_cast<glasscheck::MaterialPropertyTable>(table);
          },
          py::arg("path"), py::arg("settings") = glasscheck::MaterialTableReaderSettings{},
          "Load a long-format CSV file into a table");

    py::enum_<glasscheck::InterpolationMethod>(m, "InterpolationMethod")
        .value("Exact", glasscheck::InterpolationMethod::Exact)
        .value("Interpolated", glasscheck::InterpolationMethod::Interpolated)
        .value("ClampedLow", glasscheck::InterpolationMethod::ClampedLow)
        .value("ClampedHigh", glasscheck::InterpolationMethod::ClampedHigh);

    py::class_<glasscheck::ModulusEstimate>(m, "ModulusEstimate")
        .def_readonly("shear_modulus_mpa", &glasscheck::ModulusEstimate::shear_modulus_mpa)
        .def_readonly("method", &glasscheck::ModulusEstimate::method)
        .def_readonly("extrapolated", &glasscheck::ModulusEstimate::extrapolated)
        .def_readonly("query_temperature_c", &glasscheck::ModulusEstimate::query_temperature_c)
        .def_readonly("used_temperature_c", &glasscheck::ModulusEstimate::used_temperature_c);

    // ========================================================================
    // Pane
    // ========================================================================

    py::enum_<glasscheck::LayerRole>(m, "LayerRole")
        .value("StructuralPly", glasscheck::LayerRole::StructuralPly)
        .value("Interlayer", glasscheck::LayerRole::Interlayer);

    py::class_<glasscheck::PaneLayer>(m, "PaneLayer", "Glass ply or interlayer")
        .def_readwrite("thickness_mm", &glasscheck::PaneLayer::thickness_mm)
        .def_readwrite("role", &glasscheck::PaneLayer::role)
        .def_readwrite("glass_type", &glasscheck::PaneLayer::glass_type)
        .def_readwrite("product_id", &glasscheck::PaneLayer::product_id)
        .def_static("ply", &glasscheck::PaneLayer::ply, py::arg("thickness_mm"),
                    py::arg("glass_type") = glasscheck::GlassType::Annealed)
        .def_static("interlayer", &glasscheck::PaneLayer::interlayer,
                    py::arg("thickness_mm"), py::arg("product_id"));

    py::class_<glasscheck::LaminateStack>(m, "LaminateStack",
        "Ordered layers of a monolithic or laminated pane")
        .def(py::init<>())
        .def(py::init<std::vector<glasscheck::PaneLayer>>(), py::arg("layers"))
        .def_static("monolithic", &glasscheck::LaminateStack::monolithic,
                    py::arg("thickness_mm"), py::arg("glass_type"))
        .def_static("two_ply", &glasscheck::LaminateStack::two_ply,
                    py::arg("h1_mm"), py::arg("h2_mm"), py::arg("interlayer_mm"),
                    py::arg("product_id"), py::arg("glass_type"))
        .def("add_ply", &glasscheck::LaminateStack::add_ply,
             py::arg("thickness_mm"), py::arg("glass_type"),
             py::return_value_policy::reference_internal)
        .def("add_interlayer", &glasscheck::LaminateStack::add_interlayer,
             py::arg("thickness_mm"), py::arg("product_id"),
             py::return_value_policy::reference_internal)
        .def("validate", &glasscheck::LaminateStack::validate)
        .def("is_monolithic", &glasscheck::LaminateStack::is_monolithic)
        .def("ply_count", &glasscheck::LaminateStack::ply_count)
        .def("interlayer_product", &glasscheck::LaminateStack::interlayer_product)
        .def("glass_thickness", &glasscheck::LaminateStack::glass_thickness)
        .def("total_thickness", &glasscheck::LaminateStack::total_thickness)
        .def("__repr__", [](const glasscheck::LaminateStack &s) {
            return "<LaminateStack " + s.description() + ">";
        });

    py::enum_<glasscheck::SupportCondition>(m, "SupportCondition")
        .value("TwoEdgeSimplySupported", glasscheck::SupportCondition::TwoEdgeSimplySupported)
        .value("FourEdgeSimplySupported", glasscheck::SupportCondition::FourEdgeSimplySupported)
        .value("Cantilever", glasscheck::SupportCondition::Cantilever);

    py::class_<glasscheck::PanelGeometry>(m, "PanelGeometry", "Pane dimensions and supports")
        .def(py::init<>())
        .def(py::init<double, double, glasscheck::SupportCondition>(),
             py::arg("span_mm"), py::arg("width_mm"),
             py::arg("support") = glasscheck::SupportCondition::TwoEdgeSimplySupported)
        .def_readwrite("span_mm", &glasscheck::PanelGeometry::span_mm, "Span [mm]")
        .def_readwrite("width_mm", &glasscheck::PanelGeometry::width_mm, "Width [mm]")
        .def_readwrite("support", &glasscheck::PanelGeometry::support)
        .def("characteristic_span", &glasscheck::PanelGeometry::characteristic_span);

    py::class_<glasscheck::EffectiveThickness>(m, "EffectiveThickness")
        .def_readonly("deflection_mm", &glasscheck::EffectiveThickness::deflection_mm)
        .def_readonly("stress_mm", &glasscheck::EffectiveThickness::stress_mm)
        .def_readonly("bending_design_mm", &glasscheck::EffectiveThickness::bending_design_mm)
        .def_readonly("shear_transfer", &glasscheck::EffectiveThickness::shear_transfer)
        .def("bending_mm", &glasscheck::EffectiveThickness::bending_mm)
        .def("ply_bending_mm", &glasscheck::EffectiveThickness::ply_bending_mm)
        .def("governing_ply", &glasscheck::EffectiveThickness::governing_ply);

    // ========================================================================
    // Factors
    // ========================================================================

    py::class_<glasscheck::FactorInputs>(m, "FactorInputs")
        .def(py::init<>())
        .def_readwrite("standard", &glasscheck::FactorInputs::standard)
        .def_readwrite("edge", &glasscheck::FactorInputs::edge)
        .def_readwrite("surface_profile", &glasscheck::FactorInputs::surface_profile)
        .def_readwrite("surface_finish", &glasscheck::FactorInputs::surface_finish)
        .def_readwrite("toughening", &glasscheck::FactorInputs::toughening)
        .def_readwrite("consequence", &glasscheck::FactorInputs::consequence);

    py::class_<glasscheck::FactorSet>(m, "FactorSet", "Resolved coefficients")
        .def_readonly("standard", &glasscheck::FactorSet::standard)
        .def_readonly("glass_type", &glasscheck::FactorSet::glass_type)
        .def_readonly("duration", &glasscheck::FactorSet::duration)
        .def_readonly("f_gk", &glasscheck::FactorSet::f_gk)
        .def_readonly("f_bk", &glasscheck::FactorSet::f_bk)
        .def_readonly("k_mod", &glasscheck::FactorSet::k_mod)
        .def_readonly("k_sp", &glasscheck::FactorSet::k_sp)
        .def_readonly("k_sp_finish", &glasscheck::FactorSet::k_sp_finish)
        .def_readonly("k_v", &glasscheck::FactorSet::k_v)
        .def_readonly("k_e", &glasscheck::FactorSet::k_e)
        .def_readonly("k_fi", &glasscheck::FactorSet::k_fi)
        .def_readonly("gamma_MA", &glasscheck::FactorSet::gamma_MA)
        .def_readonly("gamma_Mv", &glasscheck::FactorSet::gamma_Mv);

    // ========================================================================
    // Calculator
    // ========================================================================

    py::enum_<glasscheck::ActionKind>(m, "ActionKind")
        .value("Stress", glasscheck::ActionKind::Stress, "Applied principal stress [MPa]")
        .value("UniformPressure", glasscheck::ActionKind::UniformPressure,
               "Applied uniform pressure [kPa]");

    py::class_<glasscheck::LoadCase>(m, "LoadCase", "Design situation of a pane")
        .def(py::init<>())
        .def(py::init<const std::string&, glasscheck::DurationClass, double, double,
                      glasscheck::ActionKind>(),
             py::arg("name"), py::arg("duration"), py::arg("applied_value"),
             py::arg("temperature_c"), py::arg("kind") = glasscheck::ActionKind::Stress)
        .def_readwrite("name", &glasscheck::LoadCase::name)
        .def_readwrite("duration", &glasscheck::LoadCase::duration)
        .def_readwrite("applied_value", &glasscheck::LoadCase::applied_value)
        .def_readwrite("temperature_c", &glasscheck::LoadCase::temperature_c)
        .def_readwrite("kind", &glasscheck::LoadCase::kind);

    py::class_<glasscheck::DesignRequest>(m, "DesignRequest")
        .def(py::init<>())
        .def_readwrite("load_cases", &glasscheck::DesignRequest::load_cases)
        .def_readwrite("stack", &glasscheck::DesignRequest::stack)
        .def_readwrite("geometry", &glasscheck::DesignRequest::geometry)
        .def_readwrite("factors", &glasscheck::DesignRequest::factors);

    py::class_<glasscheck::DesignResult>(m, "DesignResult", "Outcome of one load case")
        .def_readonly("load_case", &glasscheck::DesignResult::load_case)
        .def_readonly("effective_thickness", &glasscheck::DesignResult::effective_thickness)
        .def_readonly("bending_thickness_mm", &glasscheck::DesignResult::bending_thickness_mm)
        .def_readonly("deflection_thickness_mm", &glasscheck::DesignResult::deflection_thickness_mm)
        .def_readonly("shear_modulus_mpa", &glasscheck::DesignResult::shear_modulus_mpa)
        .def_readonly("modulus", &glasscheck::DesignResult::modulus)
        .def_readonly("factors", &glasscheck::DesignResult::factors)
        .def_readonly("characteristic_resistance",
                      &glasscheck::DesignResult::characteristic_resistance)
        .def_readonly("design_resistance", &glasscheck::DesignResult::design_resistance)
        .def_readonly("utilization", &glasscheck::DesignResult::utilization)
        .def_readonly("governing_ply", &glasscheck::DesignResult::governing_ply)
        .def_readonly("deflection_mm", &glasscheck::DesignResult::deflection_mm)
        .def_readonly("deflection_limit_mm", &glasscheck::DesignResult::deflection_limit_mm)
        .def_readonly("extrapolated", &glasscheck::DesignResult::extrapolated)
        .def_readonly("warnings", &glasscheck::DesignResult::warnings)
        .def("passes", &glasscheck::DesignResult::passes);

    py::class_<glasscheck::DesignReport>(m, "DesignReport", "Results of all load cases")
        .def_readonly("standard", &glasscheck::DesignReport::standard)
        .def_readonly("results", &glasscheck::DesignReport::results)
        .def_readonly("governing_index", &glasscheck::DesignReport::governing_index)
        .def_readonly("warnings", &glasscheck::DesignReport::warnings)
        .def("governing", &glasscheck::DesignReport::governing,
             py::return_value_policy::reference_internal)
        .def("passes", &glasscheck::DesignReport::passes)
        .def("has_extrapolation", &glasscheck::DesignReport::has_extrapolation)
        .def("max_utilization", &glasscheck::DesignReport::max_utilization)
        .def("summary", &glasscheck::DesignReport::summary)
        .def("__str__", &glasscheck::DesignReport::summary);

    py::class_<glasscheck::CalculatorSettings>(m, "CalculatorSettings")
        .def(py::init<>())
        .def_readwrite("deflection_span_ratio", &glasscheck::CalculatorSettings::deflection_span_ratio)
        .def_readwrite("warn_on_utilization_exceeded",
                       &glasscheck::CalculatorSettings::warn_on_utilization_exceeded);

    py::class_<glasscheck::DesignStrengthCalculator>(m, "DesignStrengthCalculator",
        "Design strength and utilization of glass panes")
        .def(py::init([](std::shared_ptr<glasscheck::MaterialPropertyTable> table,
                         const glasscheck::CalculatorSettings& settings) {
                 return glasscheck::DesignStrengthCalculator(std::move(table), settings);
             }),
             py::arg("table"), py::arg("settings") = glasscheck::CalculatorSettings{})
        .def("evaluate", &glasscheck::DesignStrengthCalculator::evaluate, py::arg("request"))
        .def("design_strength_table",
             [](const glasscheck::DesignStrengthCalculator &c,
                const glasscheck::FactorInputs& inputs, glasscheck::GlassType type) {
                 py::list rows;
                 for (const auto& row : c.design_strength_table(inputs, type)) {
                     rows.append(py::make_tuple(row.duration, row.k_mod, row.design_strength_mpa));
                 }
                 return rows;
             },
             py::arg("inputs"), py::arg("glass_type"),
             "List of (duration, k_mod, f_gd) for every duration class")
        .def("set_material_table",
             [](glasscheck::DesignStrengthCalculator &c,
                std::shared_ptr<glasscheck::MaterialPropertyTable> table) {
                 c.set_material_table(std::move(table));
             },
             py::arg("table"));
}
