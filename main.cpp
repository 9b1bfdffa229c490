#include <iostream>
#include <string>
#include <filesystem>

#include "analysis.hpp"
#include "config_io.hpp"
#include "scene_io.hpp"
#include "errors.hpp"

using namespace wayfinder;

int main(int argc, char** argv)
{
    if(argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <scene.yaml> [config.yaml]" << std::endl;
        return 1;
    }

    std::string sceneFile = argv[1];
    // Config file from the command line, otherwise "default.yml"
    std::string configFile = (argc >= 3) ? argv[2] : "default.yml";

    try {
        AnalyzerConfig config;
        if (argc >= 3 || std::filesystem::exists(configFile)) {
            config = loadConfig(configFile);
            std::cout << "Loaded config from: " << configFile << std::endl;
        } else {
            std::cout << "No " << configFile << " found, using built-in defaults" << std::endl;
        }

        Scene scene = loadScene(sceneFile);
        std::cout << "Loaded scene from: " << sceneFile << " ("
                  << scene.nodes.size() << " nodes, " << scene.edges.size() << " edges, "
                  << scene.walls.size() << " walls, " << scene.scenarios.size() << " scenarios)"
                  << std::endl;

        AnalysisReport report = runAnalysis(scene, config);
        printReport(std::cout, report);
    } catch (const AnalysisError& e) {
        std::cerr << "Analysis rejected input: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
