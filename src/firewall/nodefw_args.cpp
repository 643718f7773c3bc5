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

#include <stdio.h>              /* sscanf */

#include "nodefw_args.h"
#include "ingress_ctl.h"        /* NODEFW_PIN_DIR */
#include "util.h"

/* argp API global variables */
const char *argp_program_version     = "version 1.0";
const char *argp_program_bug_address = "<andru.mantu@gmail.com>";

/* argument identifiers with no shorthand */
enum {
    ARG_SYSLOG_PATH    = 600,   /* syslog socket path          */
    ARG_SYSLOG_TAG     = 601,   /* syslog tag                  */
    ARG_SYSLOG_RETRY   = 602,   /* sink connection interval    */
    ARG_SYSLOG_TIMEOUT = 603,   /* sink connection budget      */
    ARG_PERF_PAGES     = 700,   /* per-CPU perf buffer size    */
};

/* command line arguments */
static struct argp_option options[] = {
    { NULL, 0, NULL, 0, "Core functionality" },
    { "ebpf-obj", 'e', "OBJ", 0,
      "compiled XDP ingress firewall object" },
    { "pin-dir", 'P', "DIR", 0,
      "pin base directory "
      "(default: " NODEFW_PIN_DIR ")" },
    { "iface", 'i', "NAME", 0,
      "interface to attach to (repeatable)" },
    { "detach", 'D', NULL, 0,
      "detach from the listed interfaces and exit (default: no)" },

    { NULL, 0, NULL, 0, "Firewall rules" },
    { "src-cidr", 's', "CIDR", 0,
      "source address range the rules apply to (repeatable)" },
    { "rule", 'r', "RULE", 0,
      "protocol rule shared by all source ranges (repeatable)" },
    { "delete", 'd', NULL, 0,
      "remove rules of the source ranges instead (default: no)" },

    { NULL, 0, NULL, 0, "Event logging" },
    { "no-events", 'n', NULL, 0,
      "do not log filtering events (default: no)" },
    { "syslog-path", ARG_SYSLOG_PATH, "PATH", 0,
      "syslog socket (repeatable; default: /dev/log, /var/run/syslog, "
      "/var/run/log)" },
    { "syslog-tag", ARG_SYSLOG_TAG, "TAG", 0,
      "syslog tag of audit messages (default: nodefw)" },
    { "syslog-retry", ARG_SYSLOG_RETRY, "NUM", 0,
      "syslog connection retry interval (default: 1000) [ms]" },
    { "syslog-timeout", ARG_SYSLOG_TIMEOUT, "NUM", 0,
      "syslog connection timeout (default: 30000) [ms]" },
    { "perf-pages", ARG_PERF_PAGES, "NUM", 0,
      "per-CPU perf buffer size, power of 2 (default: 1) [pages]" },
    { "verbose", 'v', NULL, 0,
      "show debug messages (default: no)" },

    { 0 }
};

/* argument parser prototype */
static error_t parse_opt(int, char *, struct argp_state *);

/* description of accepted non-option arguments */
static char args_doc[] = "";

/* program documentation */
static char doc[] = "Per-node ingress firewall: loads the XDP filtering program,"
                    " reconciles its rule table and logs filtering events"
                    "\v"
                    "RULE=ORDER:PROTO:ACTION[:ARG]\n"
                    "PROTO={tcp,udp,sctp,icmp,icmpv6}\n"
                    "ACTION={allow,deny}\n"
                    "ARG=PORT[-PORT] for tcp, udp, sctp\n"
                    "ARG=TYPE[/CODE] for icmp, icmpv6";

/* declaration of relevant structures */
struct argp   argp = { options, parse_opt, args_doc, doc };
struct config cfg  = {
    .ebpf_path      = NULL,
    .pin_dir        = (char *) NODEFW_PIN_DIR,
    .syslog_tag     = (char *) "nodefw",
    .syslog_retry   = 1'000,
    .syslog_timeout = 30'000,
    .perf_pages     = 1,
    .delete_rules   = 0,
    .detach         = 0,
    .no_events      = 0,
    .verbose        = 0,
};

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* parse_opt - parses one argument and updates relevant structures
 *  @key   : argument id
 *  @arg   : pointer to actual argument
 *  @state : parsing state
 *
 *  @return : 0 if everything ok
 */
static error_t parse_opt(int key, char *arg, struct argp_state *state)
{
    struct protocol_rule rule;  /* parsed rule */
    int32_t              ans;   /* answer      */

    switch (key) {
        /* ebpf object */
        case 'e':
            cfg.ebpf_path = arg;
            break;
        /* pin base directory */
        case 'P':
            cfg.pin_dir = arg;
            break;
        /* interface */
        case 'i':
            cfg.ifaces.emplace_back(arg);
            break;
        /* detach and exit */
        case 'D':
            cfg.detach = 1;
            break;
        /* source address range */
        case 's':
            cfg.policy.source_cidrs.emplace_back(arg);
            break;
        /* protocol rule */
        case 'r':
            ans = pol_parse_rule(arg, &rule);
            RET(ans, EINVAL, "invalid rule \"%s\"", arg);

            cfg.policy.rules.push_back(rule);
            break;
        /* delete mode */
        case 'd':
            cfg.delete_rules = 1;
            break;
        /* no event pipeline */
        case 'n':
            cfg.no_events = 1;
            break;
        /* syslog socket path */
        case ARG_SYSLOG_PATH:
            cfg.syslog_paths.emplace_back(arg);
            break;
        /* syslog tag */
        case ARG_SYSLOG_TAG:
            cfg.syslog_tag = arg;
            break;
        /* sink connection interval */
        case ARG_SYSLOG_RETRY:
            RET(sscanf(arg, "%u", &cfg.syslog_retry) != 1, EINVAL,
                "invalid syslog retry interval");
            break;
        /* sink connection budget */
        case ARG_SYSLOG_TIMEOUT:
            RET(sscanf(arg, "%u", &cfg.syslog_timeout) != 1, EINVAL,
                "invalid syslog timeout");
            break;
        /* perf buffer size */
        case ARG_PERF_PAGES:
            RET(sscanf(arg, "%u", &cfg.perf_pages) != 1, EINVAL,
                "invalid number of perf buffer pages");
            break;
        /* debug messages */
        case 'v':
            cfg.verbose = 1;
            break;
        /* this is invoked after all arguments have been parsed */
        case ARGP_KEY_END:
            /* final sanity check */
            RET(!cfg.ebpf_path, EINVAL, "no eBPF object specified (-e)");

            RET(cfg.detach && cfg.ifaces.empty(), EINVAL,
                "detaching requires at least one interface");

            RET(!cfg.policy.rules.empty() && cfg.policy.source_cidrs.empty(),
                EINVAL, "rules require at least one source range");

            RET(!cfg.perf_pages || (cfg.perf_pages & (cfg.perf_pages - 1)),
                EINVAL, "perf buffer pages must be a power of 2");

            RET(!cfg.syslog_retry, EINVAL,
                "syslog retry interval must be positive");

            break;
        /* unknown argument */
        default:
            return ARGP_ERR_UNKNOWN;
    }

    return 0;
}
