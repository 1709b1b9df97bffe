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
#include "types.H"


bool is_leap_year (int year)
{
    return year%4==0 && (year%100>0 || year%400==0);
}


int days_in_month (int month, int year)
{
    switch (month)
    {
        case JANUARY:
        case MARCH:
        case MAY:
        case JULY:
        case AUGUST:
        case OCTOBER:
        case DECEMBER:
            return 31;
        case APRIL:
        case JUNE:
        case SEPTEMBER:
        case NOVEMBER:
            return 30;
        case FEBRUARY:
            return is_leap_year (year) ? 29 : 28;
    }
    return 0;
}


bool check_date (const Date *date)
{
    if (date->month < JANUARY || date->month > DECEMBER) return false;
    if (date->year < 1) return false;
    return date->day >= 1 && date->day <= days_in_month (date->month, date->year);
}


// Advance the date by one calendar day, rolling over month and year

void next_day (Date *date)
{
    date->day++;
    if (date->day > days_in_month (date->month, date->year))
    {
        date->day = 1;
        date->month = date->month % 12 + 1;
        if (date->month == JANUARY) date->year++;
    }
}


int compare_dates (const Date *date_1, const Date *date_2)
{
    if (date_1->year != date_2->year) return date_1->year < date_2->year ? -1 : 1;
    if (date_1->month != date_2->month) return date_1->month < date_2->month ? -1 : 1;
    if (date_1->day != date_2->day) return date_1->day < date_2->day ? -1 : 1;
    return 0;
}


void format_date (const Date *date, char str[], size_t length)
{
    snprintf (str, length, "%04d-%02d-%02d", date->year, date->month, date->day);
}
