#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(RAIDLINK_ENABLE_TELEMETRY_L1)
    #define RL_TL1(expr) expr
#else
    #define RL_TL1(expr) ((void)0)
#endif
