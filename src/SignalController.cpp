#include "SignalController.hpp"

namespace edgesim
{

    SignalController::SignalController(SignalTiming timing)
        : timing(timing), current_phase(NS_GREEN), phase_elapsed(0.0)
    {
        reset();
    }

    void SignalController::reset()
    {
        current_phase = NS_GREEN;
        phase_elapsed = 0.0;
    }

    double SignalController::phaseDuration(Phase phase) const
    {
        switch (phase)
        {
        case NS_GREEN:
        case EW_GREEN:
            return timing.green_seconds;
        case NS_ORANGE:
        case EW_ORANGE:
            return timing.orange_seconds;
        }
        return timing.green_seconds;
    }

    SignalController::Phase SignalController::nextPhase(Phase phase)
    {
        switch (phase)
        {
        case NS_GREEN:
            return NS_ORANGE;
        case NS_ORANGE:
            return EW_GREEN;
        case EW_GREEN:
            return EW_ORANGE;
        case EW_ORANGE:
            return NS_GREEN;
        }
        return NS_GREEN;
    }

    void SignalController::tick(double dt_seconds)
    {
        // Without a positive green the cycle cannot advance.
        if (timing.green_seconds <= 0.0)
        {
            return;
        }

        phase_elapsed += dt_seconds;

        // Zero-length orange phases are passed straight through.
        double phase_duration = phaseDuration(current_phase);
        while (phase_elapsed >= phase_duration)
        {
            phase_elapsed -= phase_duration;
            current_phase = nextPhase(current_phase);
            phase_duration = phaseDuration(current_phase);
        }
    }

    LightState SignalController::getState(SignalAxis axis) const
    {
        const bool ns = axis == SignalAxis::NorthSouth;
        switch (current_phase)
        {
        case NS_GREEN:
            return ns ? LightState::Green : LightState::Red;
        case NS_ORANGE:
            return ns ? LightState::Orange : LightState::Red;
        case EW_GREEN:
            return ns ? LightState::Red : LightState::Green;
        case EW_ORANGE:
            return ns ? LightState::Red : LightState::Orange;
        }
        return LightState::Red;
    }

} // namespace edgesim
