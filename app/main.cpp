/**
 * partforge-build - build one part from a JSON request on stdin
 *
 *   partforge-build <build_id> [--engine brep|workplane|mesh]
 *                   [--output-dir DIR] [--quiet]
 *
 * The BuildResult JSON is the only thing written to stdout; progress goes
 * to stderr. Exit status: 0 built, 1 build failed, 2 usage error.
 */

#include "partforge/cad/BuildEngine.hpp"
#include "partforge/io/ResultJson.hpp"

#include <iostream>
#include <iterator>
#include <string>

namespace {

constexpr int kExitBuildFailed = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    std::cerr << "Usage: partforge-build <build_id> [--engine brep|workplane|mesh] "
                 "[--output-dir DIR] [--quiet]\n"
                 "Reads the design request JSON from stdin.\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace partforge::cad;

    BuildOptions options;
    std::string buildId;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--engine" && i + 1 < argc) {
            std::string name = argv[++i];
            auto engine = parseEngine(name);
            if (!engine.has_value()) {
                std::cerr << "Unknown engine: " << name << "\n";
                printUsage();
                return kExitUsage;
            }
            options.engineOverride = engine;
        } else if (arg == "--output-dir" && i + 1 < argc) {
            options.outputDir = argv[++i];
        } else if (arg == "--quiet") {
            options.verbose = false;
        } else if (arg == "--version") {
            std::cout << BuildEngine::getVersion() << std::endl;
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && buildId.empty()) {
            buildId = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            printUsage();
            return kExitUsage;
        }
    }

    if (buildId.empty()) {
        printUsage();
        return kExitUsage;
    }

    std::string request((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());

    BuildEngine engine(options);
    BuildResult result = engine.buildFromJson(request, buildId);

    nlohmann::json out = result;
    std::cout << out.dump(2) << std::endl;

    return result.success ? 0 : kExitBuildFailed;
}
