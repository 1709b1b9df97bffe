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
#include <stdlib.h>
#include <string.h>
#ifdef PARALLEL
#include <mpi.h>
#endif

#include "configuration.H"
#include "analysis.H"
#include "output.H"
#include "proto.H"
#include "globals.H"

// Global variable definition
int rank, num_processes;
bool silent_mode;

static void finish (int status);


int main (int argc, char **argv)
{
    class Configuration config;
    class Analysis analysis;
    class Output output;
    std::vector<RawRow> rows;
    char csv_file_name[k_max_path] = "";
    ErrorCode error;

#ifdef PARALLEL
    MPI_Init (&argc, &argv);
    MPI_Comm_rank (MPI_COMM_WORLD, &rank);
    MPI_Comm_size (MPI_COMM_WORLD, &num_processes);
#else
    rank = 0;
    num_processes = 1;
#endif
    parse_arguments (argc, argv, csv_file_name, sizeof (csv_file_name), &silent_mode);

    error = config.read (k_json_file_name);
    if (error != NO_ERROR)
    {
        fprintf (stderr, "%s: %s\n", k_json_file_name, error_name (error));
        finish (1);
    }
    if (strlen (csv_file_name)) snprintf (config.input_file_name, sizeof (config.input_file_name), "%s", csv_file_name);
    if (rank == 0) config.print_log (k_log_file_name);

    if (!silent_mode && rank == 0)
    {
        printf ("Reading consumption data from '%s'\n", config.input_file_name); fflush (stdout);
    }
    error = read_csv (config.input_file_name, config.input_header, &rows, stderr);
    if (error == NO_ERROR)
    {
        error = analysis.run (rows, config.analysis(), rank == 0 ? stderr : NULL);
    }
    if (error != NO_ERROR)
    {
        if (rank == 0) fprintf (stderr, "Analysis aborted: %s\n", error_name (error));
        finish (1);
    }

    if (!silent_mode && rank == 0)
    {
        printf ("%d samples, %d days, solar curve width %.3lf h, daily solar energy %.1lf kWh\n",
                analysis.series.num_samples(), analysis.series.num_days(),
                analysis.solar_module.width, analysis.solar_module.daily_energy());
        output.print_days (stdout, analysis);
        analysis.overall.print (stdout, "All days");
        analysis.recent.print (stdout, "Last 7 days");
        printf ("\n"); fflush (stdout);
    }
    if (config.daily_files) output.print_daily_files (analysis);
    if (rank == 0) output.print_summary ("summary", analysis);
    finish (0);
    return 0;
}


static void finish (int status)
{
#ifdef PARALLEL
    if (status) MPI_Abort (MPI_COMM_WORLD, status);
    MPI_Finalize();
#endif
    exit (status);
}
