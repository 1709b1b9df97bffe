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

#include "proto.H"
#include "constants.H"
#include "daybalance.H"
#include "summary.H"


Summary::Summary()
{
    num_days = 0;
    first_date.day = first_date.month = first_date.year = 0;
    last_date = first_date;
    consumption_energy = solar_energy = 0.;
    total_excess = total_deficit = net_balance = 0.;
    optimal_battery_size = 0.;
    evening_discharge = evening_above_threshold = 0.;
    solar_consumed_directly = 0.;
    avg_consumption_energy = avg_solar_energy = 0.;
    avg_total_excess = avg_total_deficit = avg_net_balance = 0.;
    avg_optimal_battery_size = 0.;
    avg_evening_discharge = avg_evening_above_threshold = 0.;
    avg_solar_consumed_directly = 0.;
}


void Summary::aggregate (const std::vector<DayBalance> &days, int first, int num)
{
    *this = Summary();
    if (first < 0 || num <= 0 || first + num > (int)days.size()) return;

    num_days = num;
    first_date = days[first].date;
    last_date = days[first+num-1].date;
    for (int d=first; d<first+num; d++)
    {
        consumption_energy += days[d].consumption_energy;
        solar_energy += days[d].solar_energy;
        total_excess += days[d].total_excess;
        total_deficit += days[d].total_deficit;
        net_balance += days[d].net_balance;
        optimal_battery_size += days[d].optimal_battery_size;
        evening_discharge += days[d].battery.discharged;
        evening_above_threshold += days[d].battery.above_threshold;
        solar_consumed_directly += days[d].solar_consumed_directly;
    }
    avg_consumption_energy = consumption_energy / num_days;
    avg_solar_energy = solar_energy / num_days;
    avg_total_excess = total_excess / num_days;
    avg_total_deficit = total_deficit / num_days;
    avg_net_balance = net_balance / num_days;
    avg_optimal_battery_size = optimal_battery_size / num_days;
    avg_evening_discharge = evening_discharge / num_days;
    avg_evening_above_threshold = evening_above_threshold / num_days;
    avg_solar_consumed_directly = solar_consumed_directly / num_days;
}


void Summary::print (FILE *fp, const char title[]) const
{
    char date_1[16], date_2[16];

    fprintf (fp, "\n%s\n", title);
    fprintf (fp, "------------------------------------------------------------\n");
    if (!has_data())
    {
        fprintf (fp, "No data\n");
        return;
    }
    format_date (&first_date, date_1, sizeof (date_1));
    format_date (&last_date, date_2, sizeof (date_2));
    fprintf (fp, "%s - %s (%d days)\n\n", date_1, date_2, num_days);
    fprintf (fp, "%24s %17s %17s\n", "", "Total", "Per day");
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Consumption", consumption_energy, avg_consumption_energy);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Solar production", solar_energy, avg_solar_energy);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Solar used directly", solar_consumed_directly, avg_solar_consumed_directly);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Excess", total_excess, avg_total_excess);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Deficit", total_deficit, avg_total_deficit);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Net balance", net_balance, avg_net_balance);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Evening load > threshold", evening_above_threshold, avg_evening_above_threshold);
    fprintf (fp, "%24s %13.3lf kWh %13.3lf kWh\n", "Evening discharge", evening_discharge, avg_evening_discharge);
    fprintf (fp, "%24s %17s %13.3lf kWh\n", "Battery size", "", avg_optimal_battery_size);
}


// Whole run and the most recent days (all days if there are fewer)

void summarize (const std::vector<DayBalance> &days, Summary *overall, Summary *recent)
{
    int num = (int)days.size();
    int first = num > k_summary_window_days ? num - k_summary_window_days : 0;

    overall->aggregate (days, 0, num);
    recent->aggregate (days, first, num - first);
}
