#pragma once
/*-----------------------------------------------------------------------------
 *  agentprofile.hpp
 *
 *  Closed set of pedestrian types used by the simulator. Each type carries a
 *  small attribute record; behaviour switches over the tag.
 *---------------------------------------------------------------------------*/
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace wayfinder {

enum class AgentType : std::uint8_t
{
    Familiar = 0,      ///< daily user, knows the building
    FirstTimeVisitor,  ///< no prior knowledge
    Elderly,           ///< slower, more error prone
    MobilityImpaired   ///< slowest walker
};

constexpr std::size_t kAgentTypeCount = 4;

constexpr std::array<AgentType, kAgentTypeCount> kAllAgentTypes = {
    AgentType::Familiar,
    AgentType::FirstTimeVisitor,
    AgentType::Elderly,
    AgentType::MobilityImpaired
};

/** Attributes of one agent type. */
struct AgentProfile
{
    double baseErrorRate = 0.25; ///< error probability at a plain two-way junction
    double speed         = 1.0;  ///< walking speed, m/s
};

using AgentProfileTable = std::array<AgentProfile, kAgentTypeCount>;

/** Default table: familiar 0.05/1.4, first-time 0.25/1.0, elderly 0.35/0.8, mobility-impaired 0.30/0.6. */
AgentProfileTable defaultAgentProfiles();

inline std::size_t agentTypeIndex(AgentType t) noexcept
{
    return static_cast<std::size_t>(t);
}

inline const AgentProfile& profileFor(const AgentProfileTable& table, AgentType t) noexcept
{
    return table[agentTypeIndex(t)];
}

/** Canonical snake_case name, used in YAML files and reports. */
const char* agentTypeName(AgentType t) noexcept;

/** Parse a type name; accepts the canonical names plus "first_time". */
std::optional<AgentType> agentTypeFromString(const std::string& name);

} // namespace wayfinder
