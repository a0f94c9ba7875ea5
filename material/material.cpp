#include "material.hpp"

namespace damascus {

const char* to_string(MaterialKind kind) {
    switch (kind) {
        case MaterialKind::HighNickel: return "high_nickel";
        case MaterialKind::HighCarbon: return "high_carbon";
    }
    return "unknown";
}

}  // namespace damascus
