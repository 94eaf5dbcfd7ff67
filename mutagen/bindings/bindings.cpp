// mutagen/bindings/bindings.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "mutagen/mutagen.hpp"
#include "mutagen/debug.hpp"

namespace py = pybind11;

PYBIND11_MODULE(mutagen_core, m) {
    m.doc() = "Mutagen seeded text generator bindings";

    m.attr("VERSION") = std::string(mutagen::Version::string());

    // --- Diagnostics ---
    py::enum_<mutagen::Severity>(m, "Severity")
        .value("Error", mutagen::Severity::Error)
        .value("Warning", mutagen::Severity::Warning)
        .export_values();

    py::class_<mutagen::Diagnostic>(m, "Diagnostic")
        .def_readonly("severity", &mutagen::Diagnostic::severity)
        .def_readonly("code", &mutagen::Diagnostic::code)
        .def_readonly("message", &mutagen::Diagnostic::message)
        .def_readonly("filename", &mutagen::Diagnostic::filename)
        .def_property_readonly("line", [](const mutagen::Diagnostic& d) {
            return d.location.line;
        })
        .def_property_readonly("column", [](const mutagen::Diagnostic& d) {
            return d.location.column;
        })
        .def("to_json", &mutagen::format_diagnostic_json)
        .def("__repr__", [](const mutagen::Diagnostic& d) {
            return "<Diagnostic " + d.code + ": " + d.message + ">";
        });

    m.def("format_diagnostic", &mutagen::format_diagnostic,
          py::arg("diagnostic"), py::arg("source") = "");

    // --- Generator ---
    py::class_<mutagen::Generator>(m, "Generator")
        .def("generate", py::overload_cast<std::uint64_t>(&mutagen::Generator::generate),
             py::arg("seed"))
        .def("generate_many", [](mutagen::Generator& gen, std::uint64_t first, std::uint32_t count) {
            std::vector<std::string> out;
            out.reserve(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                out.push_back(gen.generate(first + i));
            }
            return out;
        }, py::arg("first_seed"), py::arg("count") = 5)
        .def("reset_session", &mutagen::Generator::reset_session)
        .def("dump", [](const mutagen::Generator& gen) {
            return mutagen::serialize_compiled_json(gen.grammar());
        })
        .def_property_readonly("cycles_used", [](const mutagen::Generator& gen) {
            return gen.grammar().cycles_used;
        })
        .def_property_readonly("label_count", [](const mutagen::Generator& gen) {
            return gen.grammar().label_count;
        });

    // --- Compilation ---
    py::class_<mutagen::GrammarResult>(m, "GrammarResult")
        .def_readonly("success", &mutagen::GrammarResult::success)
        .def_readonly("rule", &mutagen::GrammarResult::rule)
        .def_readonly("diagnostics", &mutagen::GrammarResult::diagnostics)
        .def_property_readonly("generator", [](mutagen::GrammarResult& r) -> mutagen::Generator* {
            return r.generator ? &*r.generator : nullptr;
        }, py::return_value_policy::reference_internal);

    m.def("compile_grammar", [](const std::string& source, const std::string& rule,
                                const std::string& filename) {
        return mutagen::compile_grammar(source, rule, filename);
    }, py::arg("source"), py::arg("rule") = "", py::arg("filename") = "<input>");

    m.def("compile_grammar_file", [](const std::string& path, const std::string& rule) {
        return mutagen::compile_grammar_file(path, rule);
    }, py::arg("path"), py::arg("rule") = "");
}
