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

#include <stdio.h>
#include <math.h>

#include "proto.H"
#include "solarmodule.H"
#include "timeseries.H"


double curve_power (double hour, double peak, double width, double sunrise, double sunset)
{
    double z;

    if (hour < sunrise || hour > sunset) return 0.;
    z = (hour - 0.5*(sunrise + sunset)) / width;
    return peak * exp (-0.5*z*z);
}


// Daily energy of the quarter-hour sampled curve (trapezoidal rule)

double curve_energy (double width, double peak, double sunrise, double sunset)
{
    double curve[k_samples_per_day];

    for (int i=0; i<k_samples_per_day; i++)
    {
        curve[i] = curve_power (i*k_hours_per_sample, peak, width, sunrise, sunset);
    }
    return integrate (curve, k_samples_per_day, k_hours_per_sample);
}


// The upper bracket is doubled until it reaches the limit, so the widest
// curve the solver can produce is the first doubling at or above the limit.

double widest_bound (double upper, double upper_limit)
{
    while (upper < upper_limit) upper *= 2.;
    return upper;
}


ErrorCode solve_width (double target, double peak, double sunrise, double sunset,
                       double lower, double upper, double upper_limit, int iterations,
                       double *width)
{
    double mid;

    if (curve_energy (lower, peak, sunrise, sunset) > target) return CONVERGENCE_ERROR;
    while (curve_energy (upper, peak, sunrise, sunset) < target && upper < upper_limit) upper *= 2.;
    if (curve_energy (upper, peak, sunrise, sunset) < target) return CONVERGENCE_ERROR;

    for (int i=0; i<iterations; i++)
    {
        mid = 0.5 * (lower + upper);
        if (curve_energy (mid, peak, sunrise, sunset) < target) lower = mid;
        else upper = mid;
    }
    *width = 0.5 * (lower + upper);
    return NO_ERROR;
}


SolarModule::SolarModule()
{
    capacity = 0.;
    peak = 0.;
    sunrise = k_sunrise;
    sunset = k_sunset;
    requested_energy = 0.;
    target_energy = 0.;
    max_energy = 0.;
    width = 0.;
    clamped = false;
}


ErrorCode SolarModule::synthesize (const AnalysisConfiguration &config, FILE *log_fp)
{
    ErrorCode error;

    error = check_configuration (&config, log_fp);
    if (error != NO_ERROR) return error;

    capacity = config.capacity;
    peak = capacity * k_peak_factor;
    requested_energy = capacity * config.sun_hours;
    max_energy = curve_energy (widest_bound (k_width_upper, k_width_upper_limit), peak, sunrise, sunset);
    clamped = requested_energy > max_energy;
    if (clamped)
    {
        if (log_fp) fprintf (log_fp, "Warning: the daily energy %.1lf kWh exceeds the maximum of %.1lf kWh "
                                     "for a peak of %.1lf kW and is reduced\n",
                             requested_energy, max_energy, peak);
        target_energy = max_energy;
    }
    else target_energy = requested_energy;

    error = solve_width (target_energy, peak, sunrise, sunset,
                         k_width_lower, k_width_upper, k_width_upper_limit, k_width_iterations, &width);
    if (error != NO_ERROR && log_fp)
    {
        fprintf (log_fp, "The curve width for a daily energy of %.1lf kWh could not be bracketed\n", target_energy);
    }
    return error;
}


double SolarModule::power (double hour) const
{
    return curve_power (hour, peak, width, sunrise, sunset);
}


double SolarModule::daily_energy() const
{
    return curve_energy (width, peak, sunrise, sunset);
}


void SolarModule::daily_curve (double curve[k_samples_per_day]) const
{
    for (int i=0; i<k_samples_per_day; i++) curve[i] = power (i*k_hours_per_sample);
}


// Sample the curve at the time of day of every normalized sample. Each date
// gets exactly as many values as it has samples, which keeps the solar series
// aligned with the consumption series even when a day is incomplete.

void SolarModule::replicate (const TimeSeries &series, std::vector<double> *solar) const
{
    solar->resize (series.num_samples());
    for (int i=0; i<series.num_samples(); i++) (*solar)[i] = power (series.samples[i].hour());
}
