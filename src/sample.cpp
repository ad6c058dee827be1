#include "imuskel/sample.hpp"
#include <algorithm>

namespace imuskel {
namespace limb {

const std::array<const char*, 12> kAll = {
    HIPS, SP, SP2, H,
    RA, RFA,
    LA, LFA,
    RUL, RL,
    LUL, LL
};

const std::array<const char*, 8> kSensored = {
    RA, RFA, LA, LFA, RUL, RL, LUL, LL
};

bool is_known(const std::string& label) {
    return std::any_of(kAll.begin(), kAll.end(),
                       [&](const char* l) { return label == l; });
}

} // namespace limb
} // namespace imuskel
