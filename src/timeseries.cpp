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
#include <ctype.h>
#include <math.h>
#include <algorithm>

#include "proto.H"
#include "timeseries.H"

static bool sample_before (const Sample &s1, const Sample &s2)
{
    int cmp = compare_dates (&s1.date, &s2.date);
    if (cmp) return cmp < 0;
    return s1.minute < s2.minute;
}


TimeSeries::TimeSeries()
{
    num_dropped = 0;
}


ErrorCode TimeSeries::normalize (const std::vector<RawRow> &rows, FILE *log_fp)
{
    Sample sample;

    samples.clear();
    days.clear();
    num_dropped = 0;
    if (rows.empty()) return DATA_ERROR;

    samples.reserve (rows.size());
    for (size_t r=0; r<rows.size(); r++)
    {
        if (!parse_timestamp (rows[r].timestamp, &sample.date, &sample.minute))
        {
            num_dropped++;
            continue;
        }
        sample.consumption = 0.;
        for (int c=0; c<3; c++)
        {
            sample.rate[c] = parse_channel (rows[r].channel[c]);
            sample.consumption += sample.rate[c];
        }
        samples.push_back (sample);
    }
    if (num_dropped && log_fp)
    {
        fprintf (log_fp, "Warning: %d rows with an invalid timestamp have been removed\n", num_dropped);
    }
    if (samples.empty()) return DATA_ERROR;

    // Equal timestamps keep their input order, duplicates are not removed
    std::stable_sort (samples.begin(), samples.end(), sample_before);

    for (int i=0; i<(int)samples.size(); i++)
    {
        if (days.empty() || compare_dates (&days.back().date, &samples[i].date))
        {
            DayRange range;
            range.date = samples[i].date;
            range.first = i;
            range.num = 0;
            days.push_back (range);
        }
        days.back().num++;
    }
    return NO_ERROR;
}


void TimeSeries::day_consumption (int d, std::vector<double> *values) const
{
    const DayRange &range = days[d];

    values->resize (range.num);
    for (int i=0; i<range.num; i++) (*values)[i] = samples[range.first+i].consumption;
}


// Accepted formats are "DD/MM/YYYY HH.MM" and "DD/MM/YYYY HH:MM".
// Buddhist years (> 2500) are converted to the Gregorian calendar and a
// time of 24:00 is taken as midnight of the following day.

bool TimeSeries::parse_timestamp (const char *text, Date *date, int *minute)
{
    int d, m, y, hh, mm, length = 0;
    char separator;

    if (sscanf (text, " %d/%d/%d %d%c%d%n", &d, &m, &y, &hh, &separator, &mm, &length) != 6) return false;
    for (const char *p = text+length; *p; p++)
    {
        if (!isspace ((unsigned char)*p)) return false;
    }
    if (separator != '.' && separator != ':') return false;
    if (y > 2500) y -= 543;

    date->day = d;
    date->month = m;
    date->year = y;
    if (!check_date (date)) return false;
    if (mm < 0 || mm > 59 || hh < 0 || hh > 24) return false;
    if (hh == 24)
    {
        if (mm != 0) return false;
        next_day (date);
        hh = 0;
    }
    *minute = hh*60 + mm;
    return true;
}


// Missing, non-numeric or non-finite channel values count as zero

double TimeSeries::parse_channel (const char *text)
{
    char *end;
    double value;

    while (isspace ((unsigned char)*text)) text++;
    if (*text == '\0') return 0.;
    value = strtod (text, &end);
    if (end == text) return 0.;
    while (isspace ((unsigned char)*end)) end++;
    if (*end != '\0' || !isfinite (value)) return 0.;
    return value;
}
