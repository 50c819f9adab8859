#pragma once

#include <string>

namespace matchmaking::domain {

/**
 * @brief Роль участника в предложении обмена
 */
enum class PartyRole {
    PROPOSER,
    RECEIVER
};

inline std::string toString(PartyRole role) {
    switch (role) {
        case PartyRole::PROPOSER: return "proposer";
        case PartyRole::RECEIVER: return "receiver";
    }
    return "unknown";
}

} // namespace matchmaking::domain
