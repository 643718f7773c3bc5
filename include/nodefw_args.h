#pragma once

#include <argp.h>       /* argp API  */
#include <stdint.h>     /* [u]int*_t */
#include <string>       /* string    */
#include <vector>       /* vector    */

#include "policy.h"     /* policy_rule_set */

/* structure holding cli arguments information */
struct config {
    char                     *ebpf_path;         /* path to ebpf object          */
    char                     *pin_dir;           /* pin base directory           */
    std::vector<std::string> ifaces;             /* interfaces to (de)attach     */
    struct policy_rule_set   policy;             /* source ranges & rules        */
    std::vector<std::string> syslog_paths;       /* syslog socket search list    */
    char                     *syslog_tag;        /* audit log tag                */
    uint32_t                 syslog_retry;       /* sink retry interval [ms]     */
    uint32_t                 syslog_timeout;     /* sink retry budget [ms]       */
    uint32_t                 perf_pages;         /* per-CPU perf buffer pages    */
    uint8_t                  delete_rules  : 1;  /* reconcile in delete mode     */
    uint8_t                  detach        : 1;  /* full cleanup, then exit      */
    uint8_t                  no_events     : 1;  /* skip event pipeline          */
    uint8_t                  verbose       : 1;  /* enable DEBUG output          */
};

extern struct argp   argp;
extern struct config cfg;
