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
#include <string.h>
#ifdef PARALLEL
#   include <mpi.h>
#endif

#include "proto.H"
#include "analysis.H"


Analysis::Analysis()
{
    memset (&config, 0, sizeof (config));
    process = 0;
    num_processes = 1;
}


ErrorCode Analysis::run (const std::vector<RawRow> &rows, const AnalysisConfiguration &configuration, FILE *log_fp)
{
    ErrorCode error;

    config = configuration;
    series = TimeSeries();
    days.clear();
    solar.clear();
    overall = Summary();
    recent = Summary();

    error = check_configuration (&config, log_fp);
    if (error != NO_ERROR) return error;
    error = series.normalize (rows, log_fp);
    if (error != NO_ERROR)
    {
        if (log_fp) fprintf (log_fp, "No usable rows left after normalization\n");
        return error;
    }
    error = solar_module.synthesize (config, log_fp);
    if (error != NO_ERROR) return error;
    solar_module.replicate (series, &solar);

    process = 0;
    num_processes = 1;
#ifdef PARALLEL
    int initialized;
    MPI_Initialized (&initialized);
    if (initialized)
    {
        MPI_Comm_rank (MPI_COMM_WORLD, &process);
        MPI_Comm_size (MPI_COMM_WORLD, &num_processes);
    }
#endif

    // Days are independent of each other and are distributed round-robin
    days.resize (series.num_days());
    for (int d=0; d<series.num_days(); d++)
    {
        days[d].date = series.days[d].date;
        if (owns_day (d)) calculate_day (d);
    }
    if (num_processes > 1) exchange_days();
    summarize (days, &overall, &recent);
    return NO_ERROR;
}


void Analysis::calculate_day (int d)
{
    const DayRange &range = series.days[d];
    std::vector<double> hours (range.num), consumption;

    for (int i=0; i<range.num; i++) hours[i] = series.samples[range.first+i].hour();
    series.day_consumption (d, &consumption);
    days[d].calculate (range.date, hours.data(), consumption.data(), solar.data() + range.first,
                       range.num, config);
}


// Every process ends up with the scalar results of all days. The arrays of
// a day stay with the process that has calculated it.

void Analysis::exchange_days()
{
#ifdef PARALLEL
    int num_days = (int)days.size();
    std::vector<double> metrics (num_days * k_num_day_metrics, 0.);

    for (int d=0; d<num_days; d++)
    {
        if (owns_day (d)) days[d].pack (&metrics[d*k_num_day_metrics]);
    }
    MPI_Allreduce (MPI_IN_PLACE, metrics.data(), num_days * k_num_day_metrics, MPI_DOUBLE, MPI_SUM, MPI_COMM_WORLD);
    for (int d=0; d<num_days; d++)
    {
        if (!owns_day (d)) days[d].unpack (&metrics[d*k_num_day_metrics]);
    }
#endif
}
