#pragma once

#include "Intersection.hpp"

namespace edgesim
{
    enum class SignalAxis
    {
        NorthSouth,
        EastWest
    };

    struct SignalTiming
    {
        double green_seconds = 10.0;
        double orange_seconds = 2.0;
    };

    // Two-phase fixed-time signal for one intersection.
    class SignalController
    {
    public:
        explicit SignalController(SignalTiming timing = SignalTiming{});

        // Advance time by dt_seconds; may trigger several phase changes
        void tick(double dt_seconds);

        LightState getState(SignalAxis axis) const;

        // Back to NS green
        void reset();

    private:
        enum Phase
        {
            NS_GREEN,
            NS_ORANGE,
            EW_GREEN,
            EW_ORANGE
        };

        double phaseDuration(Phase phase) const;
        static Phase nextPhase(Phase phase);

        SignalTiming timing;
        Phase current_phase;
        double phase_elapsed; // time spent in current phase
    };

} // namespace edgesim
