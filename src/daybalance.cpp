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

#include "proto.H"
#include "constants.H"
#include "daybalance.H"


DayBalance::DayBalance()
{
    date.day = date.month = date.year = 0;
    num_samples = 0;
    max_excess = 0.;
    max_deficit = 0.;
    battery_size_needed = 0.;
    optimal_battery_size = 0.;
    total_excess = 0.;
    total_deficit = 0.;
    net_balance = 0.;
    consumption_energy = 0.;
    solar_energy = 0.;
    solar_consumed_directly = 0.;
    solar_above_threshold = 0.;
}


void DayBalance::calculate (const Date &day, const double *hours, const double *consumption,
                            const double *solar, int num, const AnalysisConfiguration &config)
{
    std::vector<double> excess (num), deficit (num);

    date = day;
    num_samples = num;
    power_difference.resize (num);
    cumulative_balance.resize (num);
    solar_consumed_directly = 0.;
    solar_above_threshold = 0.;
    for (int i=0; i<num; i++)
    {
        power_difference[i] = solar[i] - consumption[i];
        excess[i] = fmax (0., power_difference[i]);
        deficit[i] = fmax (0., -power_difference[i]);
        solar_consumed_directly += fmin (solar[i], consumption[i]) * k_hours_per_sample;
        if (solar[i] > config.threshold) solar_above_threshold += (solar[i] - config.threshold) * k_hours_per_sample;
    }
    integrate_cumulative (power_difference.data(), num, k_hours_per_sample, cumulative_balance.data());

    max_excess = 0.;
    max_deficit = 0.;
    for (int i=0; i<num; i++)
    {
        if (i == 0 || cumulative_balance[i] > max_excess) max_excess = cumulative_balance[i];
        if (i == 0 || cumulative_balance[i] < max_deficit) max_deficit = cumulative_balance[i];
    }
    battery_size_needed = fmax (fabs (max_excess), fabs (max_deficit));
    if (config.battery_size > 0.) optimal_battery_size = config.battery_size;
    else optimal_battery_size = k_auto_battery_factor * battery_size_needed;

    total_excess = integrate (excess.data(), num, k_hours_per_sample);
    total_deficit = integrate (deficit.data(), num, k_hours_per_sample);
    net_balance = total_excess - total_deficit;
    consumption_energy = integrate (consumption, num, k_hours_per_sample);
    solar_energy = integrate (solar, num, k_hours_per_sample);

    // The energy stored during the day feeds the evening discharge
    battery.simulate (hours, consumption, num, total_excess, config);
}


// Scalar results in a fixed order, used to exchange days between processes

void DayBalance::pack (double metrics[k_num_day_metrics]) const
{
    int i = 0;

    metrics[i++] = num_samples;
    metrics[i++] = max_excess;
    metrics[i++] = max_deficit;
    metrics[i++] = battery_size_needed;
    metrics[i++] = optimal_battery_size;
    metrics[i++] = total_excess;
    metrics[i++] = total_deficit;
    metrics[i++] = net_balance;
    metrics[i++] = consumption_energy;
    metrics[i++] = solar_energy;
    metrics[i++] = solar_consumed_directly;
    metrics[i++] = solar_above_threshold;
    metrics[i++] = battery.available;
    metrics[i++] = battery.discharged;
    metrics[i++] = battery.above_threshold;
    metrics[i++] = battery.load_energy;
    metrics[i++] = battery.effective_load_energy;
}


void DayBalance::unpack (const double metrics[k_num_day_metrics])
{
    int i = 0;

    num_samples = (int)metrics[i++];
    max_excess = metrics[i++];
    max_deficit = metrics[i++];
    battery_size_needed = metrics[i++];
    optimal_battery_size = metrics[i++];
    total_excess = metrics[i++];
    total_deficit = metrics[i++];
    net_balance = metrics[i++];
    consumption_energy = metrics[i++];
    solar_energy = metrics[i++];
    solar_consumed_directly = metrics[i++];
    solar_above_threshold = metrics[i++];
    battery.available = metrics[i++];
    battery.discharged = metrics[i++];
    battery.above_threshold = metrics[i++];
    battery.load_energy = metrics[i++];
    battery.effective_load_energy = metrics[i++];
}
