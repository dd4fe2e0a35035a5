#include "MissionConfig.h"
#include <stddef.h>

const char* phaseName(MissionPhase p) {
  switch (p) {
    case MissionPhase::WaitForStart:     return "WaitForStart";
    case MissionPhase::ApproachObstacle: return "ApproachObstacle";
    case MissionPhase::ClimbUp:          return "ClimbUp";
    case MissionPhase::ClimbOver:        return "ClimbOver";
    case MissionPhase::ClimbDown:        return "ClimbDown";
    case MissionPhase::ScanForTarget:    return "ScanForTarget";
    case MissionPhase::ApproachTarget:   return "ApproachTarget";
  }
  return "?";
}

const ClimbStep* MissionConfig::stepFor(MissionPhase p) const {
  for (uint8_t i = 0; i < CLIMB_STEP_COUNT; i++) {
    if (climb[i].phase == p) return &climb[i];
  }
  return nullptr;
}

MissionConfig::MissionConfig() {
  //          phase                          guard                 pitch   deb  spd  hold   next
  climb[0] = { MissionPhase::ApproachObstacle, PitchGuard::AtLeast,  15.0f,    0,  60, true,  MissionPhase::ClimbUp };
  climb[1] = { MissionPhase::ClimbUp,          PitchGuard::AtMost,    5.0f,  200, 100, false, MissionPhase::ClimbOver };
  climb[2] = { MissionPhase::ClimbOver,        PitchGuard::AtMost,  -15.0f,  200,  40, false, MissionPhase::ClimbDown };
  climb[3] = { MissionPhase::ClimbDown,        PitchGuard::AtLeast,  -3.0f,  300,  30, false, MissionPhase::ScanForTarget };
}
