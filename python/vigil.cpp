/*
 * vigil.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Python bindings for validation and sanitization

**************************************************/

#include "vigil/vigil.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace vigil;
using json = nlohmann::json;

namespace {
// Python data crosses the boundary as JSON text.
auto toNative(const py::object& obj) -> json {
    auto dumps = py::module_::import("json").attr("dumps");
    return json::parse(py::cast<std::string>(dumps(obj)));
}

auto toPython(const json& doc) -> py::object {
    auto loads = py::module_::import("json").attr("loads");
    return loads(doc.dump());
}

auto sharedEngine() -> const schema::Engine& {
    static const schema::Engine engine;
    return engine;
}
}  // namespace

PYBIND11_MODULE(vigil, m) {
    m.doc() = "Runtime validation, transformation and sanitization of untrusted data";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const error::TransformError& e) {
            PyErr_SetString(PyExc_RuntimeError, e.getMessage().c_str());
        } catch (const error::ValueTypeError& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        } catch (const json::exception& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const std::invalid_argument& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const std::exception& e) {
            PyErr_SetString(PyExc_Exception, e.what());
        }
    });

    m.def(
        "validate",
        [](const py::object& data, const py::object& schemaDoc,
           const py::object& options) {
            auto node = schema::schemaFromJson(toNative(schemaDoc));
            auto opts = options.is_none()
                            ? schema::ValidateOptions{}
                            : schema::ValidateOptions::fromJson(
                                  toNative(options));
            auto result = sharedEngine().validate(
                type::fromJson(toNative(data)), node, opts);
            return toPython(result.toJson());
        },
        py::arg("data"), py::arg("schema"), py::arg("options") = py::none(),
        R"(Validate data against a schema descriptor.

Args:
    data: JSON-compatible data to validate
    schema: Schema descriptor, e.g. {"email": {"type": "string", "customType": "email"}}
    options: Optional dict with strict, transform, failFast, applyDefaults, maxErrors

Returns:
    dict: {"valid": bool, "errors": [...], "warnings": [...], "transformed": ...}

Examples:
    >>> import vigil
    >>> vigil.validate({"age": "x"}, {"age": {"type": "number"}})["valid"]
    False
)");

    m.def(
        "sanitize",
        [](const py::object& data, const py::object& config) {
            auto cfg = config.is_none()
                           ? sanitize::SanitizationConfig::defaults()
                           : sanitize::SanitizationConfig::fromJson(
                                 toNative(config));
            auto result =
                sanitize::sanitize(type::fromJson(toNative(data)), cfg);
            return toPython(result.toJson());
        },
        py::arg("data"), py::arg("config") = py::none(),
        R"(Sanitize every string (and key) inside data.

Returns:
    dict: {"sanitized": ..., "removed": [...], "warnings": [...]}
)");

    m.def("sanitize_html", &sanitize::sanitizeHtml, py::arg("html"),
          py::arg("allowed_tags") = std::vector<std::string>{},
          py::arg("allowed_attributes") = std::vector<std::string>{},
          "Keep only allow-listed tags and attributes of an HTML fragment.");

    m.def("escape_html", &sanitize::escapeHtml, py::arg("text"),
          "Escape & < > \" ' and / as HTML entities.");
}
