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

#include "proto.H"

static void copy_field (char dest[], size_t length, const char *begin, const char *end);


// The buffer and its size are reused from one call to the next, the caller
// frees *line when done

int read_line (FILE *fp, char **line, size_t *line_length)
{
    return getline (line, line_length, fp);
}


// The meter export has the layout
//   datetime, rate_a, <empty>, rate_b, <empty>, rate_c, <empty>
// Columns that are missing in a line are passed on as empty fields.

ErrorCode read_csv (const char *file_name, bool has_header, std::vector<RawRow> *rows, FILE *log_fp)
{
    const int channel_column[3] = {1, 3, 5};
    FILE *fp;
    char *line = NULL;
    size_t line_length = 0;
    int line_number = 0;

    rows->clear();
    fp = fopen (file_name, "r");
    if (!fp)
    {
        if (log_fp) fprintf (log_fp, "Could not open file '%s'\n", file_name);
        return DATA_ERROR;
    }
    while (read_line (fp, &line, &line_length) != -1)
    {
        char *begin = line;
        RawRow row;
        int column = 0;

        line_number++;
        if (line_number == 1)
        {
            if (!strncmp (begin, "\xEF\xBB\xBF", 3)) begin += 3;    // UTF-8 byte order mark
            if (has_header) continue;
        }
        begin[strcspn (begin, "\r\n")] = '\0';
        if (strspn (begin, " \t,") == strlen (begin)) continue;     // blank line

        memset (&row, 0, sizeof (row));
        while (begin)
        {
            char *end = strchr (begin, ',');
            const char *stop = end ? end : begin + strlen (begin);
            if (column == 0) copy_field (row.timestamp, sizeof (row.timestamp), begin, stop);
            for (int c=0; c<3; c++)
            {
                if (column == channel_column[c]) copy_field (row.channel[c], sizeof (row.channel[c]), begin, stop);
            }
            column++;
            begin = end ? end+1 : NULL;
        }
        rows->push_back (row);
    }
    free (line);
    fclose (fp);
    if (rows->empty())
    {
        if (log_fp) fprintf (log_fp, "File '%s' does not contain any data\n", file_name);
        return DATA_ERROR;
    }
    return NO_ERROR;
}


void set_raw_row (RawRow *row, const char *timestamp, const char *channel_a,
                  const char *channel_b, const char *channel_c)
{
    memset (row, 0, sizeof (*row));
    snprintf (row->timestamp, sizeof (row->timestamp), "%s", timestamp);
    snprintf (row->channel[0], sizeof (row->channel[0]), "%s", channel_a);
    snprintf (row->channel[1], sizeof (row->channel[1]), "%s", channel_b);
    snprintf (row->channel[2], sizeof (row->channel[2]), "%s", channel_c);
}


// Copy [begin, end) without surrounding quotes, truncated to the field size

static void copy_field (char dest[], size_t length, const char *begin, const char *end)
{
    size_t n;

    if (end > begin && *begin == '"') begin++;
    if (end > begin && *(end-1) == '"') end--;
    n = (size_t)(end - begin);
    if (n > length-1) n = length-1;
    memcpy (dest, begin, n);
    dest[n] = '\0';
}
