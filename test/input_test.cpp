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
 * Reading the meter export.
 */

#include <stdio.h>
#include <unistd.h>
#include <malloc.h>
#include <gtest/gtest.h>

#include "proto.H"

static void write_file (const char *file_name, const char *content)
{
    FILE *fp = fopen(file_name, "w");
    ASSERT_TRUE(fp != NULL);
    fputs(content, fp);
    fclose(fp);
}


TEST(Input,ChannelColumns)
{
    const char *file_name = "input_test_channels.csv";
    std::vector<RawRow> rows;

    write_file(file_name,
               "\xEF\xBB\xBF" "Date/Time,A,,B,,C,\n"
               "01/03/2021 00.00,1.5,,2.5,,3.5,\r\n"
               "\n"
               "\"01/03/2021 00.15\",\"4\",,5\n"
               "01/03/2021 00.30\n");
    ASSERT_EQ(NO_ERROR, read_csv(file_name, true, &rows, NULL));
    ASSERT_EQ(3u, rows.size());
    EXPECT_STREQ("01/03/2021 00.00", rows[0].timestamp);
    EXPECT_STREQ("1.5", rows[0].channel[0]);
    EXPECT_STREQ("2.5", rows[0].channel[1]);
    EXPECT_STREQ("3.5", rows[0].channel[2]);
    EXPECT_STREQ("01/03/2021 00.15", rows[1].timestamp);
    EXPECT_STREQ("4", rows[1].channel[0]);
    EXPECT_STREQ("5", rows[1].channel[1]);
    EXPECT_STREQ("", rows[1].channel[2]);
    EXPECT_STREQ("", rows[2].channel[0]);
    unlink(file_name);
}

TEST(Input,WithoutHeader)
{
    const char *file_name = "input_test_no_header.csv";
    std::vector<RawRow> rows;

    write_file(file_name, "01/03/2021 00.00,1,,2,,3,\n");
    ASSERT_EQ(NO_ERROR, read_csv(file_name, false, &rows, NULL));
    ASSERT_EQ(1u, rows.size());
    EXPECT_STREQ("3", rows[0].channel[2]);
    unlink(file_name);
}

TEST(Input,NoData)
{
    const char *file_name = "input_test_empty.csv";
    std::vector<RawRow> rows;

    write_file(file_name, "Date/Time,A,,B,,C,\n");
    EXPECT_EQ(DATA_ERROR, read_csv(file_name, true, &rows, NULL));
    EXPECT_TRUE(rows.empty());
    unlink(file_name);
    EXPECT_EQ(DATA_ERROR, read_csv("no_such_file.csv", true, &rows, NULL));
}

// The line buffer is reused while reading, nothing is left on the heap
TEST(Input,NoLeakPerLine)
{
    const char *file_name = "input_test_large.csv";
    FILE *fp = fopen(file_name, "w");
    size_t before, after;

    ASSERT_TRUE(fp != NULL);
    fprintf(fp, "Date/Time,A,,B,,C,\n");
    for (int i=0; i<20000; i++)
    {
        fprintf(fp, "%02d/03/2021 %02d.%02d,1.5,,2.5,,3.5,\n", i/96 % 28 + 1, i/4 % 24, (i%4)*15);
    }
    fclose(fp);

    {
        std::vector<RawRow> rows;
        ASSERT_EQ(NO_ERROR, read_csv(file_name, true, &rows, NULL));
    }
    before = mallinfo2().uordblks;
    {
        std::vector<RawRow> rows;
        ASSERT_EQ(NO_ERROR, read_csv(file_name, true, &rows, NULL));
        EXPECT_EQ(20000u, rows.size());
    }
    after = mallinfo2().uordblks;
    EXPECT_LT(after, before + 65536) << "heap grew by " << (after - before) << " bytes";
    unlink(file_name);
}
