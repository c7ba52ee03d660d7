#include <pybind11/pybind11.h>
#include "partforge/cad/BuildEngine.hpp"
#include "partforge/io/ResultJson.hpp"

namespace py = pybind11;
namespace pf = partforge::cad;

namespace {

// Result JSON text, same document the CLI prints
std::string buildPart(const std::string& requestJson, const std::string& buildId,
                      const std::string& engine, const std::string& outputDir) {
    pf::BuildOptions options;
    options.outputDir = outputDir;
    options.verbose = false;

    if (!engine.empty()) {
        auto kind = pf::parseEngine(engine);
        if (!kind.has_value()) {
            throw py::value_error("engine must be brep, workplane or mesh");
        }
        options.engineOverride = kind;
    }

    pf::BuildResult result;
    {
        // Builds can take seconds; let other Python threads run
        py::gil_scoped_release release;
        pf::BuildEngine buildEngine(options);
        result = buildEngine.buildFromJson(requestJson, buildId);
    }

    nlohmann::json out = result;
    return out.dump();
}

} // anonymous namespace

PYBIND11_MODULE(partforge_py, m) {
    m.doc() = "partforge: parametric part builds over OCCT and Manifold";

    m.def("build", &buildPart,
          "Build one part from a JSON request and return the result JSON",
          py::arg("request_json"),
          py::arg("build_id"),
          py::arg("engine") = "",
          py::arg("output_dir") = ".");

    m.def("version", &pf::BuildEngine::getVersion,
          "Library version and compiled-in kernels");
}
