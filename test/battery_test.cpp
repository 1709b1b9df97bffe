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
 * Evening peak shaving with the energy stored during the day.
 */

#include <gtest/gtest.h>

#include "battery.H"
#include "test_helpers.H"

// One full day of quarter hours with a constant load
static void make_day (double load, std::vector<double> *hours, std::vector<double> *values)
{
    hours->resize(96);
    values->assign(96, load);
    for (int i=0; i<96; i++) (*hours)[i] = i * 0.25;
}


TEST(Battery,Window)
{
    EXPECT_FALSE(Battery::in_window(15.75));
    EXPECT_TRUE(Battery::in_window(16.));
    EXPECT_TRUE(Battery::in_window(21.75));
    EXPECT_FALSE(Battery::in_window(22.));
    EXPECT_FALSE(Battery::in_window(3.));
}

TEST(Battery,AvailableEnergy)
{
    EXPECT_DOUBLE_EQ(80., Battery::available_energy(80., 0.));
    EXPECT_DOUBLE_EQ(50., Battery::available_energy(80., 50.));
    EXPECT_DOUBLE_EQ(30., Battery::available_energy(30., 50.));
}

TEST(Battery,StepAboveThreshold)
{
    DispatchState state = {1000., 0., 0., 0., 0.};
    DispatchStep step;

    DispatchState next = dispatch_step(state, 2000., 1500., &step);
    EXPECT_DOUBLE_EQ(500., step.discharge_power);
    EXPECT_DOUBLE_EQ(1500., step.effective_power);
    EXPECT_DOUBLE_EQ(875., next.remaining);
    EXPECT_DOUBLE_EQ(125., next.discharged);
    EXPECT_DOUBLE_EQ(125., next.above_threshold);
    EXPECT_DOUBLE_EQ(500., next.load);
    EXPECT_DOUBLE_EQ(375., next.effective_load);
    // The input state is left alone.
    EXPECT_DOUBLE_EQ(1000., state.remaining);
}

TEST(Battery,StepBelowThreshold)
{
    DispatchState state = {1000., 0., 0., 0., 0.};
    DispatchStep step;

    DispatchState next = dispatch_step(state, 1200., 1500., &step);
    EXPECT_DOUBLE_EQ(0., step.discharge_power);
    EXPECT_DOUBLE_EQ(1200., step.effective_power);
    EXPECT_DOUBLE_EQ(1000., next.remaining);
    EXPECT_DOUBLE_EQ(0., next.above_threshold);
}

// Only what is left can be discharged, the grid covers the rest
TEST(Battery,StepNearlyEmpty)
{
    DispatchState state = {50., 0., 0., 0., 0.};
    DispatchStep step;

    DispatchState next = dispatch_step(state, 2000., 1500., &step);
    EXPECT_DOUBLE_EQ(200., step.discharge_power);
    EXPECT_DOUBLE_EQ(1800., step.effective_power);
    EXPECT_DOUBLE_EQ(0., next.remaining);
    EXPECT_DOUBLE_EQ(50., next.discharged);
    EXPECT_DOUBLE_EQ(125., next.above_threshold);
}

TEST(Battery,FixedSizeCapsDischarge)
{
    std::vector<double> hours, load;
    Battery battery;

    make_day(2000., &hours, &load);
    battery.simulate(hours.data(), load.data(), 96, 80., make_config(3000., 4., 0., 50.));
    EXPECT_DOUBLE_EQ(50., battery.available);
    EXPECT_DOUBLE_EQ(50., battery.discharged);
    EXPECT_DOUBLE_EQ(0., battery.remaining.back());
}

TEST(Battery,SimulateWindowOnly)
{
    std::vector<double> hours, load;
    Battery battery;

    make_day(2000., &hours, &load);
    battery.simulate(hours.data(), load.data(), 96, 1e6, make_config(3000., 4., 1500., 0.));
    ASSERT_EQ(24u, battery.index.size());
    EXPECT_EQ(64, battery.index.front());
    EXPECT_EQ(87, battery.index.back());
    EXPECT_DOUBLE_EQ(24 * 125., battery.discharged);
    EXPECT_DOUBLE_EQ(24 * 125., battery.above_threshold);
    EXPECT_DOUBLE_EQ(24 * 500., battery.load_energy);
    EXPECT_DOUBLE_EQ(24 * 375., battery.effective_load_energy);
    for (size_t w=0; w<battery.effective_power.size(); w++)
    {
        EXPECT_DOUBLE_EQ(1500., battery.effective_power[w]);
    }
}

// Stored energy never grows and never drops below zero
TEST(Battery,RemainingMonotonic)
{
    std::vector<double> hours, load;
    Battery battery;

    make_day(0., &hours, &load);
    for (int i=0; i<96; i++) load[i] = 1000. + 150. * (i % 7);
    battery.simulate(hours.data(), load.data(), 96, 600., make_config(3000., 4., 1400., 0.));
    ASSERT_FALSE(battery.remaining.empty());
    double previous = battery.available;
    for (size_t w=0; w<battery.remaining.size(); w++)
    {
        EXPECT_LE(battery.remaining[w], previous);
        EXPECT_GE(battery.remaining[w], 0.);
        EXPECT_GE(battery.discharge_power[w], 0.);
        previous = battery.remaining[w];
    }
    EXPECT_LE(battery.discharged, battery.available + 1e-9);
    EXPECT_LE(battery.discharged, battery.above_threshold + 1e-9);
}

TEST(Battery,NothingStored)
{
    std::vector<double> hours, load;
    Battery battery;

    make_day(2000., &hours, &load);
    battery.simulate(hours.data(), load.data(), 96, 0., make_config(3000., 4., 1500., 0.));
    EXPECT_DOUBLE_EQ(0., battery.discharged);
    EXPECT_DOUBLE_EQ(24 * 125., battery.above_threshold);
    EXPECT_DOUBLE_EQ(2000., battery.effective_power.front());
}
