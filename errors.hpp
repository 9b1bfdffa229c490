#pragma once
/*-----------------------------------------------------------------------------
 *  errors.hpp
 *
 *  Structured failures and recoverable diagnostics shared by all analyzers.
 *  Fatal input problems are thrown as AnalysisError; everything the engine
 *  can work around is recorded as a Diagnostic next to the result.
 *---------------------------------------------------------------------------*/
#include <stdexcept>
#include <string>
#include <vector>
#include <iostream>

namespace wayfinder {

/** Which input guard rejected the request. */
enum class Guard
{
    UnknownNode,
    DuplicateNode,
    InvalidEdge,
    TooFewNodes,
    EmptySampling,
    InvalidConfig,
    InvalidScenario
};

inline const char* guardName(Guard g) noexcept
{
    switch (g)
    {
        case Guard::UnknownNode:     return "UnknownNode";
        case Guard::DuplicateNode:   return "DuplicateNode";
        case Guard::InvalidEdge:     return "InvalidEdge";
        case Guard::TooFewNodes:     return "TooFewNodes";
        case Guard::EmptySampling:   return "EmptySampling";
        case Guard::InvalidConfig:   return "InvalidConfig";
        case Guard::InvalidScenario: return "InvalidScenario";
    }
    return "Unknown";
}

/**
 * @brief Fatal rejection of an input.
 *
 * what() reads "<Guard> [<entity>]: <message>" so the calling application can
 * show it as-is; guard() and entity() give the structured form.
 */
class AnalysisError : public std::runtime_error
{
public:
    AnalysisError(Guard guard, std::string entity, const std::string& message)
        : std::runtime_error(std::string(guardName(guard)) + " [" + entity + "]: " + message)
        , guard_{guard}
        , entity_{std::move(entity)}
    {}

    Guard              guard()  const noexcept { return guard_; }
    const std::string& entity() const noexcept { return entity_; }

private:
    Guard       guard_;
    std::string entity_;
};

/** One recoverable condition: logged, then kept as data. */
struct Diagnostic
{
    std::string component; ///< "navgraph", "spacesyntax", "vga", "simulation", "wes"
    std::string entity;    ///< node / sample / scenario id, empty for global notes
    std::string message;
};

using Diagnostics = std::vector<Diagnostic>;

/** Record a recoverable condition and echo it on stderr. */
inline void warn(Diagnostics& out,
                 const std::string& component,
                 const std::string& entity,
                 const std::string& message)
{
    std::cerr << "[" << component << "] warning";
    if (!entity.empty())
        std::cerr << " (" << entity << ")";
    std::cerr << ": " << message << std::endl;
    out.push_back({component, entity, message});
}

} // namespace wayfinder
