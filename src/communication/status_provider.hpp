#pragma once
#include <optional>
#include <nlohmann/json.hpp>

// Read-only pull interface for dashboards. Polled, never pushed.
class StatusProvider
{
public:
    virtual ~StatusProvider() = default;

    // Most recent reconstructed state, nullopt before the first one
    virtual std::optional<nlohmann::json> currentGameState() const = 0;

    virtual nlohmann::json performanceStats() const = 0;

    // Empty object when no session is active
    virtual nlohmann::json sessionStats() const = 0;
};
