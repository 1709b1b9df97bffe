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

#include "proto.H"
#include "constants.H"


void open_file (FILE **fp, const char *file_name, const char *mode)
{
    *fp = fopen (file_name, mode);
    if (!*fp)
    {
        fprintf (stderr, "Could not open file '%s'\n", file_name);
        exit (1);
    }
}


const char *error_name (ErrorCode error)
{
    switch (error)
    {
        case NO_ERROR:            return "no error";
        case DATA_ERROR:          return "data error";
        case CONFIGURATION_ERROR: return "configuration error";
        case CONVERGENCE_ERROR:   return "convergence error";
    }
    return "unknown error";
}


ErrorCode check_configuration (const AnalysisConfiguration *config, FILE *log_fp)
{
    const char *problem = NULL;

    if (!(config->capacity > 0.)) problem = "The array capacity must be > 0";
    else if (!(config->sun_hours > 0.) || config->sun_hours > k_max_sun_hours) problem = "The sun hours must be > 0 and <= 12";
    else if (!(config->threshold >= 0.)) problem = "The discharge threshold must be >= 0";
    else if (!(config->battery_size >= 0.)) problem = "The battery size must be >= 0";
    if (problem)
    {
        if (log_fp) fprintf (log_fp, "%s\n", problem);
        return CONFIGURATION_ERROR;
    }
    return NO_ERROR;
}
