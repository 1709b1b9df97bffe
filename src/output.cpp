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
#include "analysis.H"
#include "output.H"


Output::Output()
{
    prefix[0] = '\0';
}


void Output::print_days (FILE *fp, const Analysis &analysis) const
{
    char date_str[16];
    const char *battery_header = analysis.config.battery_size > 0. ? "Battery (set)" : "Battery (opt.)";

    fprintf (fp, "\n%-12s %14s %14s %12s %12s %16s %18s\n",
             "Date", "Load [kWh]", "Solar [kWh]", "Excess", "Deficit", battery_header, "Evening discharge");
    fprintf (fp, "------------------------------------------------------------------------------------------------------\n");
    for (size_t d=0; d<analysis.days.size(); d++)
    {
        const DayBalance &day = analysis.days[d];
        format_date (&day.date, date_str, sizeof (date_str));
        fprintf (fp, "%-12s %14.0lf %14.0lf %12.0lf %12.0lf %16.0lf %18.0lf\n",
                 date_str,
                 day.consumption_energy,
                 day.solar_energy,
                 day.total_excess,
                 day.total_deficit,
                 day.optimal_battery_size,
                 day.battery.discharged);
    }
}


// One line per sample: time, load, solar, difference, cumulative balance and,
// inside the evening window, discharge power, stored energy and grid load

void Output::print_daily_file (const Analysis &analysis, int d) const
{
    FILE *fp = NULL;
    char file_name[k_max_path], date_str[16];
    const DayRange &range = analysis.series.days[d];
    const DayBalance &day = analysis.days[d];
    size_t w = 0;

    if ((int)day.power_difference.size() != range.num) return;     // calculated by another process
    format_date (&range.date, date_str, sizeof (date_str));
    snprintf (file_name, sizeof (file_name), "%sdaily.%s", prefix, date_str);
    open_file (&fp, file_name, "w");
    fprintf (fp, "# %s  max. excess %.3lf kWh  max. deficit %.3lf kWh  battery %.3lf kWh  net %.3lf kWh\n",
             date_str, day.max_excess, day.max_deficit, day.optimal_battery_size, day.net_balance);
    fprintf (fp, "# time load solar difference cumulative discharge stored grid\n");
    for (int i=0; i<range.num; i++)
    {
        const Sample &sample = analysis.series.samples[range.first+i];
        fprintf (fp, "%02d:%02d %lf %lf %lf %lf", sample.minute/60, sample.minute%60,
                 sample.consumption, analysis.solar[range.first+i],
                 day.power_difference[i], day.cumulative_balance[i]);
        if (w < day.battery.index.size() && day.battery.index[w] == i)
        {
            fprintf (fp, " %lf %lf %lf\n", day.battery.discharge_power[w],
                     day.battery.remaining[w], day.battery.effective_power[w]);
            w++;
        }
        else fprintf (fp, " - - -\n");
    }
    fclose (fp);
}


void Output::print_daily_files (const Analysis &analysis) const
{
    for (int d=0; d<analysis.series.num_days(); d++) print_daily_file (analysis, d);
}


void Output::print_solar_module (FILE *fp, const Analysis &analysis) const
{
    const SolarModule &sm = analysis.solar_module;

    fprintf (fp, "\n%24s\n", "Solar Module");
    fprintf (fp, "------------------------------------------------------------\n");
    fprintf (fp, "%24s %13.3lf kW\n", "Capacity", sm.capacity);
    fprintf (fp, "%24s %13.3lf kW\n", "Peak power", sm.peak);
    fprintf (fp, "%24s %13.3lf h\n", "Curve width", sm.width);
    fprintf (fp, "%24s %13.3lf kWh", "Daily energy", sm.daily_energy());
    if (sm.clamped) fprintf (fp, "  (reduced from %.3lf kWh)\n", sm.requested_energy);
    else fprintf (fp, "\n");
}


void Output::print_summary (const char *file_name, const Analysis &analysis) const
{
    FILE *fp = NULL;
    char name[k_max_path];

    snprintf (name, sizeof (name), "%s%s", prefix, file_name);
    open_file (&fp, name, "w");
    print_solar_module (fp, analysis);
    print_days (fp, analysis);
    analysis.overall.print (fp, "All days");
    analysis.recent.print (fp, "Last 7 days");
    fclose (fp);
}
