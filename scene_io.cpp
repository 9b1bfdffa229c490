/*-----------------------------------------------------------------------------
 *  scene_io.cpp
 *---------------------------------------------------------------------------*/
#include "scene_io.hpp"

#include "errors.hpp"

namespace wayfinder {

namespace {

cv::Point2d readPoint(const YAML::Node& n)
{
    if (n.IsSequence() && n.size() >= 2)
        return {n[0].as<double>(), n[1].as<double>()};
    return {n["x"].as<double>(), n["y"].as<double>()};
}

NodeSpec readNode(const YAML::Node& n)
{
    NodeSpec spec;
    spec.id       = n["id"].as<std::string>();
    spec.position = n["position"] ? readPoint(n["position"]) : readPoint(n);
    if (n["tag"])
    {
        const auto name = n["tag"].as<std::string>();
        const auto tag = nodeTagFromString(name);
        if (!tag)
            throw AnalysisError(Guard::InvalidConfig, spec.id, "unknown node tag '" + name + "'");
        spec.tag = *tag;
    }
    return spec;
}

EdgeSpec readEdge(const YAML::Node& n)
{
    EdgeSpec spec;
    if (n.IsSequence())
    {
        spec.a = n[0].as<std::string>();
        spec.b = n[1].as<std::string>();
        if (n.size() > 2)
            spec.weight = n[2].as<double>();
        return spec;
    }
    spec.a = n["from"].as<std::string>();
    spec.b = n["to"].as<std::string>();
    if (n["weight"])
        spec.weight = n["weight"].as<double>();
    return spec;
}

WallSegment readWall(const YAML::Node& n)
{
    if (n.IsSequence() && n.size() == 4)
        return {{n[0].as<double>(), n[1].as<double>()},
                {n[2].as<double>(), n[3].as<double>()}};
    if (n.IsSequence() && n.size() == 2)
        return {readPoint(n[0]), readPoint(n[1])};
    return {readPoint(n["a"]), readPoint(n["b"])};
}

SignageItem readSignage(const YAML::Node& n)
{
    SignageItem item;
    item.position = n["position"] ? readPoint(n["position"]) : readPoint(n);
    if (n["kind"])
    {
        const auto name = n["kind"].as<std::string>();
        const auto kind = signageKindFromString(name);
        if (!kind)
            throw AnalysisError(Guard::InvalidConfig, "signage", "unknown signage kind '" + name + "'");
        item.kind = *kind;
    }
    if (n["label"])
        item.label = n["label"].as<std::string>();
    return item;
}

Scenario readScenario(const YAML::Node& n, std::size_t index)
{
    Scenario s;
    s.name        = n["name"] ? n["name"].as<std::string>() : "scenario_" + std::to_string(index);
    s.origin      = n["origin"].as<std::string>();
    s.destination = n["destination"].as<std::string>();
    if (n["runs"])
        s.runCount = n["runs"].as<std::size_t>();

    if (!n["population"])
        return s;
    for (const auto& kv : n["population"])
    {
        const auto name = kv.first.as<std::string>();
        const auto type = agentTypeFromString(name);
        if (!type)
            throw AnalysisError(Guard::InvalidConfig, s.name, "unknown agent type '" + name + "'");
        s.population[*type] += kv.second.as<std::size_t>();
    }
    return s;
}

} // namespace

Scene parseScene(const YAML::Node& root)
{
    Scene scene;
    try {
        if (!root || root.IsNull())
            return scene;

        if (root["nodes"])
            for (const auto& n : root["nodes"])    scene.nodes.push_back(readNode(n));
        if (root["edges"])
            for (const auto& n : root["edges"])    scene.edges.push_back(readEdge(n));
        if (root["walls"])
            for (const auto& n : root["walls"])    scene.walls.push_back(readWall(n));
        if (root["boundary"])
            for (const auto& n : root["boundary"]) scene.boundary.push_back(readPoint(n));
        if (root["signage"])
            for (const auto& n : root["signage"])  scene.signage.push_back(readSignage(n));

        if (root["scenarios"])
        {
            std::size_t i = 0;
            for (const auto& n : root["scenarios"])
                scene.scenarios.push_back(readScenario(n, i++));
        }

        if (const YAML::Node ext = root["external_scores"])
        {
            if (ext["signage"])       scene.external.signage       = ext["signage"].as<double>();
            if (ext["accessibility"]) scene.external.accessibility = ext["accessibility"].as<double>();
        }
    } catch (const YAML::Exception& e) {
        throw AnalysisError(Guard::InvalidConfig, "scene", e.what());
    }
    return scene;
}

Scene loadScene(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw AnalysisError(Guard::InvalidConfig, path, e.what());
    }
    return parseScene(root);
}

} // namespace wayfinder
