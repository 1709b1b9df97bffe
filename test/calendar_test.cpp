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

/*
 * Calendar arithmetic and trapezoidal integration.
 */

#include <gtest/gtest.h>

#include "proto.H"


TEST(Calendar,LeapYears)
{
    EXPECT_TRUE(is_leap_year(2020));
    EXPECT_TRUE(is_leap_year(2000));
    EXPECT_FALSE(is_leap_year(1900));
    EXPECT_FALSE(is_leap_year(2021));
    EXPECT_EQ(29, days_in_month(FEBRUARY, 2020));
    EXPECT_EQ(28, days_in_month(FEBRUARY, 2021));
    EXPECT_EQ(30, days_in_month(APRIL, 2021));
}

TEST(Calendar,CheckDate)
{
    Date ok = {29, 2, 2020};
    Date bad_day = {29, 2, 2021};
    Date bad_month = {1, 13, 2021};
    EXPECT_TRUE(check_date(&ok));
    EXPECT_FALSE(check_date(&bad_day));
    EXPECT_FALSE(check_date(&bad_month));
}

// Day, month and year roll over
TEST(Calendar,NextDay)
{
    Date date = {31, 12, 2020};
    next_day(&date);
    EXPECT_EQ(1, date.day);
    EXPECT_EQ(1, date.month);
    EXPECT_EQ(2021, date.year);

    date.day = 28; date.month = 2; date.year = 2021;
    next_day(&date);
    EXPECT_EQ(1, date.day);
    EXPECT_EQ(3, date.month);
}

TEST(Calendar,CompareAndFormat)
{
    Date d1 = {5, 3, 2021};
    Date d2 = {6, 3, 2021};
    char str[16];

    EXPECT_LT(compare_dates(&d1, &d2), 0);
    EXPECT_GT(compare_dates(&d2, &d1), 0);
    EXPECT_EQ(0, compare_dates(&d1, &d1));
    format_date(&d1, str, sizeof(str));
    EXPECT_STREQ("2021-03-05", str);
}


TEST(Integrate,Trapezoid)
{
    const double values[] = {0., 1., 2., 3.};
    EXPECT_DOUBLE_EQ(4.5, integrate(values, 4, 1.));
    EXPECT_DOUBLE_EQ(1.125, integrate(values, 4, 0.25));
    // A single sample spans no interval.
    EXPECT_DOUBLE_EQ(0., integrate(values, 1, 1.));
    EXPECT_DOUBLE_EQ(0., integrate(values, 0, 1.));
}

TEST(Integrate,CumulativeEndsAtTotal)
{
    const double values[] = {2., -1., 4., 0., 3.};
    double result[5];

    integrate_cumulative(values, 5, 0.25, result);
    EXPECT_DOUBLE_EQ(0., result[0]);
    EXPECT_DOUBLE_EQ(0.125, result[1]);
    EXPECT_NEAR(integrate(values, 5, 0.25), result[4], 1e-12);
}
