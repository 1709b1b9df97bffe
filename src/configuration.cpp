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
#include <sys/stat.h>
#include <float.h>
#include <ctype.h>
#include <jsmn.h>

#include "configuration.H"
#include "proto.H"
#include "version.H"

static int skip_value (const jsmntok_t *tokens, int num_tokens, int t);

static int compare_keys (const void *kvp_1, const void *kvp_2)
{
    return strcmp (((const KeyValuePair *)kvp_1)->key, ((const KeyValuePair *)kvp_2)->key);
}


Configuration::Configuration()
{
    dictionary = NULL;
    num_entries = 0;
    json_file_name = k_json_file_name;
    status = NO_ERROR;

    // Defaults
    strncpy (input_file_name, "data/kw.csv", sizeof (input_file_name));
    input_header = true;
    daily_files = true;
    solar.capacity = 3000.;
    solar.sun_hours = 4.;
    battery.threshold = 1500.;
    battery.size = 0.;
}


Configuration::~Configuration()
{
    delete [] dictionary;
}


ErrorCode Configuration::read (const char *file_name)
{
    json_file_name = file_name;
    status = NO_ERROR;
    if (!create_dictionary (file_name)) return status;

    lookup_string ("input.file_name", input_file_name, sizeof (input_file_name));
    lookup_boolean ("input.header", &input_header);
    lookup_boolean ("output.daily_files", &daily_files);
    lookup_decimal ("solar.capacity", &solar.capacity, 0., DBL_MAX, false);
    lookup_decimal ("solar.sun_hours", &solar.sun_hours, 0., k_max_sun_hours, false);
    lookup_decimal ("battery.threshold", &battery.threshold, 0., DBL_MAX, true);
    lookup_decimal ("battery.size", &battery.size, 0., DBL_MAX, true);
    return status;
}


AnalysisConfiguration Configuration::analysis() const
{
    AnalysisConfiguration config;

    config.capacity = solar.capacity;
    config.sun_hours = solar.sun_hours;
    config.threshold = battery.threshold;
    config.battery_size = battery.size;
    return config;
}


// Write the settings that are actually used as JSON

void Configuration::print_log (const char *file_name) const
{
    FILE *fp = NULL;

    open_file (&fp, file_name, "w");
    fprintf (fp, "{\n");
    log (fp, "version", VERSION, 2);
    fprintf (fp, "  \"input\":\n  {\n");
    log (fp, "file_name", input_file_name, 4);
    log (fp, "header", input_header, 4);
    fseek (fp, -2, SEEK_CUR);
    fprintf (fp, "\n  },\n");

    fprintf (fp, "  \"solar\":\n  {\n");
    log (fp, "capacity", solar.capacity, 3, 4);
    log (fp, "sun_hours", solar.sun_hours, 3, 4);
    fseek (fp, -2, SEEK_CUR);
    fprintf (fp, "\n  },\n");

    fprintf (fp, "  \"battery\":\n  {\n");
    log (fp, "threshold", battery.threshold, 3, 4);
    log (fp, "size", battery.size, 3, 4);
    fseek (fp, -2, SEEK_CUR);
    fprintf (fp, "\n  },\n");

    fprintf (fp, "  \"output\":\n  {\n");
    log (fp, "daily_files", daily_files, 4);
    fseek (fp, -2, SEEK_CUR);
    fprintf (fp, "\n  }\n}\n");
    fclose (fp);
}


// Read the JSON file into a sorted list of "group.key" / value pairs.
// Returns false if there is nothing to look up.

bool Configuration::create_dictionary (const char *file_name)
{
    FILE *fp = NULL;
    char *buffer = NULL;
    char group_name[64] = "", setting_name[64];
    struct stat st;
    int index = 0, num_tokens, group_size, length;
    jsmn_parser parser;
    jsmntok_t *tokens = NULL;

    delete [] dictionary;
    dictionary = NULL;
    num_entries = 0;

    fp = fopen (file_name, "r");
    if (!fp || stat (file_name, &st))
    {
        if (fp) fclose (fp);
        fprintf (stderr, "Could not open file '%s'. Using default configuration.\n", file_name);
        return false;
    }
    buffer = (char *) malloc (st.st_size + 1);
    length = (int)fread (buffer, 1, st.st_size, fp);
    buffer[length] = '\0';
    fclose (fp);

    // Parsing with 'tokens' set to NULL returns the number of tokens.
    // num_tokens < 0 indicates a problem with the JSON file

    jsmn_init (&parser);
    num_tokens = jsmn_parse (&parser, buffer, strlen(buffer), tokens, 0);
    if (num_tokens < 0)
    {
        switch (num_tokens)
        {
            case JSMN_ERROR_INVAL:
                fprintf (stderr, "Bad JSON file '%s'. Please check the file's format.\n", file_name);
                break;
            case JSMN_ERROR_NOMEM:
                fprintf (stderr, "Not enough tokens for parsing JSON file '%s'.\n", file_name);
                break;
            case JSMN_ERROR_PART:
                fprintf (stderr, "JSON file '%s' is too short.\n", file_name);
                break;
        }
        free (buffer);
        status = CONFIGURATION_ERROR;
        return false;
    }
    if (num_tokens == 0)
    {
        free (buffer);
        return false;
    }

    tokens = (jsmntok_t *) malloc (num_tokens * sizeof (jsmntok_t));
    jsmn_init (&parser);
    jsmn_parse (&parser, buffer, strlen(buffer), tokens, num_tokens);

    for (int t=0; t<num_tokens; t++)
    {
        if (tokens[t].type != JSMN_STRING || t+1 >= num_tokens || tokens[t+1].type == JSMN_OBJECT) continue;
        if (tokens[t+1].type == JSMN_STRING || tokens[t+1].type == JSMN_PRIMITIVE) num_entries++;
        t = skip_value (tokens, num_tokens, t+1) - 1;
    }
    dictionary = new KeyValuePair [num_entries > 0 ? num_entries : 1];

    group_size = 0;
    for (int t=0; t<num_tokens && index<num_entries; t++)
    {
        if (tokens[t].type != JSMN_STRING || t+1 >= num_tokens) continue;

        length = tokens[t].end - tokens[t].start;
        if (length > (int)sizeof (setting_name) - 1) length = sizeof (setting_name) - 1;
        if (tokens[t+1].type == JSMN_OBJECT)  // token[t] is the name of a group of settings
        {
            group_size = tokens[t+1].size;
            strncpy (group_name, buffer+tokens[t].start, length);
            group_name[length] = '\0';
            t++;
        }
        else if (tokens[t+1].type == JSMN_STRING || tokens[t+1].type == JSMN_PRIMITIVE)
        {
            strncpy (setting_name, buffer+tokens[t].start, length);
            setting_name[length] = '\0';
            if (group_size)
            {
                snprintf (dictionary[index].key, sizeof(dictionary[index].key), "%s.%s", group_name, setting_name);
                group_size--;
            }
            else
            {
                snprintf (dictionary[index].key, sizeof(dictionary[index].key), "%s", setting_name);
            }
            t++;
            length = tokens[t].end - tokens[t].start;
            if (length > (int)sizeof (dictionary[index].value_str) - 1) length = sizeof (dictionary[index].value_str) - 1;
            strncpy (dictionary[index].value_str, buffer+tokens[t].start, length);
            dictionary[index].value_str[length] = '\0';
            index++;
        }
        else  // arrays are not used by any setting
        {
            if (group_size) group_size--;
            t = skip_value (tokens, num_tokens, t+1) - 1;
        }
    }
    num_entries = index;
    free (buffer);
    free (tokens);
    qsort (dictionary, (size_t)num_entries, sizeof (KeyValuePair), compare_keys);
    return true;
}


KeyValuePair *Configuration::find (const char *key) const
{
    KeyValuePair kvp;

    if (!dictionary || !num_entries) return NULL;
    snprintf (kvp.key, sizeof (kvp.key), "%s", key);
    return (KeyValuePair *) bsearch (&kvp, dictionary, (size_t)num_entries, sizeof (KeyValuePair), compare_keys);
}


void Configuration::lookup_decimal (const char *key, double *setting, double min, double max, bool min_inclusive)
{
    KeyValuePair *result = find (key);
    double value;

    if (!result) return;
    if (sscanf (result->value_str, "%lf", &value) != 1)
    {
        fprintf (stderr, "%s: The setting '%s' must be a number\n", json_file_name, key);
        status = CONFIGURATION_ERROR;
        return;
    }
    if ((min_inclusive ? value >= min : value > min) && value <= max) *setting = value;
    else
    {
        if (max == DBL_MAX)
            fprintf (stderr, "%s: The setting '%s' must be %s %lf\n",
                     json_file_name, key, min_inclusive ? ">=" : ">", min);
        else
            fprintf (stderr, "%s: The setting '%s' must be a value %s %lf and <= %lf\n",
                     json_file_name, key, min_inclusive ? ">=" : ">", min, max);
        status = CONFIGURATION_ERROR;
    }
}


void Configuration::lookup_boolean (const char *key, bool *setting)
{
    KeyValuePair *result = find (key);

    if (!result) return;
    for (unsigned int i=0; i<strlen(result->value_str); i++)
        result->value_str[i] = tolower (result->value_str[i]);
    if      (!strcmp (result->value_str, "true")) *setting = true;
    else if (!strcmp (result->value_str, "false")) *setting = false;
    else
    {
        fprintf (stderr, "%s: The setting '%s' must be either 'true' or 'false'\n", json_file_name, key);
        status = CONFIGURATION_ERROR;
    }
}


bool Configuration::lookup_string (const char *key, char setting[], size_t setting_length)
{
    KeyValuePair *result = find (key);

    if (!result) return false;
    if (strlen (result->value_str) + 1 > setting_length)
    {
        fprintf (stderr, "%s: The setting '%s' is too long\n", json_file_name, key);
        status = CONFIGURATION_ERROR;
        return false;
    }
    strcpy (setting, result->value_str);
    return true;
}


void Configuration::log (FILE *fp, const char *key, bool value, int tab) const
{
    for (int i=0; i<tab; i++) fputc (' ', fp);
    if (value) fprintf (fp, "\"%s\": true,\n", key);
    else       fprintf (fp, "\"%s\": false,\n", key);
}

void Configuration::log (FILE *fp, const char *key, const char *value, int tab) const
{
    for (int i=0; i<tab; i++) fputc (' ', fp);
    fprintf (fp, "\"%s\": \"%s\",\n", key, value);
}

void Configuration::log (FILE *fp, const char *key, double value, int precision, int tab) const
{
    char format_str[32];
    char value_str[32];

    for (int i=0; i<tab; i++) fputc (' ', fp);
    snprintf (format_str, sizeof(format_str), "%%.%dlf", precision);
    snprintf (value_str, sizeof(value_str), format_str, value);
    fprintf (fp, "\"%s\": %s,\n", key, value_str);
}


// Index of the first token behind the value at position t (including all
// tokens nested in it)

static int skip_value (const jsmntok_t *tokens, int num_tokens, int t)
{
    int end = tokens[t].end;

    t++;
    while (t < num_tokens && tokens[t].start < end) t++;
    return t;
}
