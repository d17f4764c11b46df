// General MIDI program names used to label decoded tracks.

#ifndef REMI_CORE_GM_PROGRAM_H
#define REMI_CORE_GM_PROGRAM_H

#include <cstdint>

namespace remi {

/// General MIDI program numbers (0-indexed, as sent in Program Change).
namespace GmProgram {

constexpr int kFirst = 0;
constexpr int kLast = 127;
constexpr int kPiano = 0;  // Acoustic Grand Piano

}  // namespace GmProgram

/// @brief Get the General MIDI instrument name for a program.
/// @param program GM program [0,127], or kDrumProgram (-1) for percussion.
/// @return "Drums" for -1, the GM Level 1 name for 0-127, "Unknown" otherwise.
const char* gmProgramName(int program);

}  // namespace remi

#endif  // REMI_CORE_GM_PROGRAM_H
