/*---------------------------------------------------------------------------
           _              ____        _
 ___  ___ | | __ _ _ __  | __ )  __ _| | __ _ _ __   ___ ___
/ __|/ _ \| |/ _` | '__| |  _ \ / _` | |/ _` | '_ \ / __/ _ \
\__ \ (_) | | (_| | |    | |_) | (_| | | (_| | | | | (_|  __/
|___/\___/|_|\__,_|_|    |____/ \__,_|_|\__,_|_| |_|\___\___|

                         Daily PV / battery energy balance

Copyright (c) 2021 European Union

Redistribution and use in source and binary forms, with or without modification,
are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its contributors
   may be used to endorse or promote products derived from this software without
   specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED.
IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT,
INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING,
BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE
OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED
OF THE POSSIBILITY OF SUCH DAMAGE.

---------------------------------------------------------------------------*/

#include <math.h>

#include "constants.H"
#include "battery.H"


DispatchState dispatch_step (const DispatchState &state, double load, double threshold, DispatchStep *step)
{
    DispatchState next = state;

    next.load += load * k_hours_per_sample;
    if (load > threshold)
    {
        double excess = load - threshold;
        double energy_needed = excess * k_hours_per_sample;
        double discharge = fmin (state.remaining, energy_needed);

        next.remaining = state.remaining - discharge;
        next.discharged = state.discharged + discharge;
        next.above_threshold = state.above_threshold + energy_needed;
        step->discharge_power = discharge / k_hours_per_sample;
        step->effective_power = threshold + fmax (0., excess - step->discharge_power);
    }
    else
    {
        step->discharge_power = 0.;
        step->effective_power = load;
    }
    next.effective_load += step->effective_power * k_hours_per_sample;
    return next;
}


Battery::Battery()
{
    available = 0.;
    discharged = 0.;
    above_threshold = 0.;
    load_energy = 0.;
    effective_load_energy = 0.;
}


// Only the energy stored during the day can be discharged, no more than the
// battery holds if its size is given (round trip losses are neglected)

double Battery::available_energy (double excess_energy, double battery_size)
{
    if (battery_size > 0.) return fmin (excess_energy, battery_size);
    return excess_energy;
}


bool Battery::in_window (double hour)
{
    int h = (int)floor (hour);
    return h >= k_evening_begin && h < k_evening_end;
}


void Battery::simulate (const double *hours, const double *load, int num,
                        double excess_energy, const AnalysisConfiguration &config)
{
    DispatchState state;
    DispatchStep step;

    index.clear();
    discharge_power.clear();
    remaining.clear();
    effective_power.clear();

    available = available_energy (excess_energy, config.battery_size);
    state.remaining = available;
    state.discharged = 0.;
    state.above_threshold = 0.;
    state.load = 0.;
    state.effective_load = 0.;

    for (int i=0; i<num; i++)
    {
        if (!in_window (hours[i])) continue;
        state = dispatch_step (state, load[i], config.threshold, &step);
        index.push_back (i);
        discharge_power.push_back (step.discharge_power);
        remaining.push_back (state.remaining);
        effective_power.push_back (step.effective_power);
    }
    discharged = state.discharged;
    above_threshold = state.above_threshold;
    load_energy = state.load;
    effective_load_energy = state.effective_load;
}
