#include "gambit/core/tournament/TournamentTypes.h"

#include <algorithm>
#include <sstream>

namespace gambit::core::tournament {

std::string PairingIdFor(int round_number, const std::string& a, const std::string& b) {
    const std::string& low = std::min(a, b);
    const std::string& high = std::max(a, b);
    std::ostringstream out;
    out << "r" << round_number << "_pair_" << low << "_" << high;
    return out.str();
}

}  // namespace gambit::core::tournament
