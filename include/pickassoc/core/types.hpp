#pragma once

#include <cctype>
#include <chrono>
#include <string>

namespace pickassoc {

// Wall-clock time, handled at microsecond precision
using TimePoint = std::chrono::system_clock::time_point;

// Phase types
enum class PhaseType {
    P,      // Primary/compressional
    S,      // Secondary/shear
    Pn,     // P refracted at Moho
    Sn,     // S refracted at Moho
    Pg,     // P in crust
    Sg,     // S in crust
    Unknown
};

inline std::string phaseTypeToString(PhaseType pt) {
    switch (pt) {
        case PhaseType::P: return "P";
        case PhaseType::S: return "S";
        case PhaseType::Pn: return "Pn";
        case PhaseType::Sn: return "Sn";
        case PhaseType::Pg: return "Pg";
        case PhaseType::Sg: return "Sg";
        default: return "?";
    }
}

// Accepts the lowercase codes produced by the pick feature converter
inline PhaseType stringToPhaseType(const std::string& s) {
    std::string code = s;
    if (!code.empty()) {
        code[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(code[0])));
    }
    if (code == "P") return PhaseType::P;
    if (code == "S") return PhaseType::S;
    if (code == "Pn") return PhaseType::Pn;
    if (code == "Sn") return PhaseType::Sn;
    if (code == "Pg") return PhaseType::Pg;
    if (code == "Sg") return PhaseType::Sg;
    return PhaseType::Unknown;
}

inline bool isPPhase(PhaseType pt) {
    return pt == PhaseType::P || pt == PhaseType::Pn || pt == PhaseType::Pg;
}

inline bool isSPhase(PhaseType pt) {
    return pt == PhaseType::S || pt == PhaseType::Sn || pt == PhaseType::Sg;
}

} // namespace pickassoc
