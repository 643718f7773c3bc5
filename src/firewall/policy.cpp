/*
 * Copyright © 2021, Radu-Alexandru Mantu <andru.mantu@gmail.com>
 *
 * This file is part of nodefw.
 *
 * nodefw is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * nodefw is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with nodefw. If not, see <https://www.gnu.org/licenses/>.
 */

#include <string.h>         /* strlen             */
#include <strings.h>        /* strcasecmp         */
#include <stdlib.h>         /* strtoul            */

#include <string>           /* string */

#include "policy.h"
#include "util.h"

using namespace std;

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _isnumber - checks if string is numeric
 *  @s : string
 *
 *  @return : 1 if the string represents a number; 0 otherwise
 */
static int32_t _isnumber(const char *s)
{
    /* null string is not a number */
    if (!*s)
        return 0;

    for (; *s; ++s)
        if (*s < '0' || *s > '9')
            return 0;

    return 1;
}

/* _parse_u8 - extracts a decimal byte value
 *  @str : numeric string
 *  @val : ptr to destination
 *
 *  @return : 0 if everything went well
 */
static int32_t _parse_u8(const char *str, uint8_t *val)
{
    unsigned long number;

    RET(!_isnumber(str) || strlen(str) > 3, -EINVAL,
        "invalid numeric value \"%s\"", str);

    number = strtoul(str, NULL, 10);
    RET(number > 0xff, -EINVAL, "value %lu does not fit in 8 bits", number);

    *val = (uint8_t) number;
    return 0;
}

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* pol_proto_name - human readable protocol tag
 *  @proto : protocol tag
 *
 *  @return : static string
 */
const char *
pol_proto_name(policy_proto proto)
{
    switch (proto) {
        case POL_TCP:    return "TCP";
        case POL_UDP:    return "UDP";
        case POL_SCTP:   return "SCTP";
        case POL_ICMP:   return "ICMP";
        case POL_ICMPV6: return "ICMPv6";
    }

    return "UNKNOWN";
}

/* pol_parse_rule - parses a command line rule description
 *  @text : "ORDER:PROTO:ACTION[:ARG]"
 *  @rule : ptr to destination rule
 *
 *  @return : 0 if everything went well; -EINVAL otherwise
 *
 * PROTO is one of {tcp,udp,sctp,icmp,icmpv6} and ACTION one of {allow,deny}
 * (case insensitive). For port based protocols, ARG is kept verbatim and only
 * checked by the rule compiler. For ICMP, ARG is TYPE[/CODE].
 */
int32_t
pol_parse_rule(const char *text, struct protocol_rule *rule)
{
    string           buf(text);     /* mutable copy of text      */
    vector<string>   fields;        /* ':' separated fields      */
    size_t           start, pos;    /* field boundaries          */
    unsigned long    order;         /* rule order (pre-check)    */
    int32_t          ans;           /* answer                    */

    /* split on ':'; the optional 4th field may contain no further ':' */
    for (start = 0; (pos = buf.find(':', start)) != string::npos;
         start = pos + 1)
        fields.push_back(buf.substr(start, pos - start));
    fields.push_back(buf.substr(start));

    RET(fields.size() < 3 || fields.size() > 4, -EINVAL,
        "malformed rule \"%s\" (expected ORDER:PROTO:ACTION[:ARG])", text);

    /* rule order */
    RET(!_isnumber(fields[0].c_str()) || fields[0].size() > 10, -EINVAL,
        "invalid rule order \"%s\"", fields[0].c_str());
    order = strtoul(fields[0].c_str(), NULL, 10);
    RET(order > UINT32_MAX, -EINVAL, "rule order %lu out of range", order);
    rule->order = (uint32_t) order;

    /* protocol */
    if (!strcasecmp(fields[1].c_str(), "tcp"))
        rule->protocol = POL_TCP;
    elif (!strcasecmp(fields[1].c_str(), "udp"))
        rule->protocol = POL_UDP;
    elif (!strcasecmp(fields[1].c_str(), "sctp"))
        rule->protocol = POL_SCTP;
    elif (!strcasecmp(fields[1].c_str(), "icmp"))
        rule->protocol = POL_ICMP;
    elif (!strcasecmp(fields[1].c_str(), "icmpv6"))
        rule->protocol = POL_ICMPV6;
    else
        RET(1, -EINVAL, "unknown protocol \"%s\"", fields[1].c_str());

    /* action */
    if (!strcasecmp(fields[2].c_str(), "allow"))
        rule->action = POL_ALLOW;
    elif (!strcasecmp(fields[2].c_str(), "deny"))
        rule->action = POL_DENY;
    else
        RET(1, -EINVAL, "unknown action \"%s\"", fields[2].c_str());

    /* protocol specific argument */
    switch (rule->protocol) {
        case POL_TCP:
        case POL_UDP:
        case POL_SCTP:
            RET(fields.size() != 4, -EINVAL, "%s rule requires ports",
                pol_proto_name(rule->protocol));
            rule->match = port_match{ fields[3] };

            break;
        case POL_ICMP:
        case POL_ICMPV6: {
            icmp_match im = { 0, 0 };

            if (fields.size() == 4) {
                string &arg = fields[3];
                size_t slash = arg.find('/');

                ans = _parse_u8(arg.substr(0, slash).c_str(), &im.type);
                RET(ans, ans, "invalid icmp type in \"%s\"", text);

                if (slash != string::npos) {
                    ans = _parse_u8(arg.substr(slash + 1).c_str(), &im.code);
                    RET(ans, ans, "invalid icmp code in \"%s\"", text);
                }
            }

            rule->match = im;
            break;
        }
    }

    return 0;
}
