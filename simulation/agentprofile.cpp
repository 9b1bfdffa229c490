/*-----------------------------------------------------------------------------
 *  agentprofile.cpp
 *---------------------------------------------------------------------------*/
#include "agentprofile.hpp"

#include <algorithm>
#include <cctype>

namespace wayfinder {

AgentProfileTable defaultAgentProfiles()
{
    AgentProfileTable t;
    t[agentTypeIndex(AgentType::Familiar)]         = {0.05, 1.4};
    t[agentTypeIndex(AgentType::FirstTimeVisitor)] = {0.25, 1.0};
    t[agentTypeIndex(AgentType::Elderly)]          = {0.35, 0.8};
    t[agentTypeIndex(AgentType::MobilityImpaired)] = {0.30, 0.6};
    return t;
}

const char* agentTypeName(AgentType t) noexcept
{
    switch (t)
    {
        case AgentType::Familiar:         return "familiar";
        case AgentType::FirstTimeVisitor: return "first_time_visitor";
        case AgentType::Elderly:          return "elderly";
        case AgentType::MobilityImpaired: return "mobility_impaired";
    }
    return "unknown";
}

std::optional<AgentType> agentTypeFromString(const std::string& name)
{
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return c == '-' ? '_' : std::tolower(c); });

    if (s == "first_time")
        return AgentType::FirstTimeVisitor;

    for (AgentType t : kAllAgentTypes)
        if (s == agentTypeName(t))
            return t;
    return std::nullopt;
}

} // namespace wayfinder
