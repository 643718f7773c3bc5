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

#include <stdio.h>
#include <stdint.h>             /* [u]int*_t                 */
#include <signal.h>             /* sigset_t, SIGINT, SIGTERM */
#include <pthread.h>            /* pthread_sigmask           */

#include "nodefw_args.h"
#include "ingress_ctl.h"
#include "util.h"

using namespace std;

/******************************************************************************
 **************************** PROGRAM ENTRY POINT *****************************
 ******************************************************************************/

/* main - program entry point
 *  @argc : number of command line arguments & program name
 *  @argv : array of command line arguments & program name
 *
 *  @return : 0 if everything went well
 */
int32_t
main(int argc, char *argv[])
{
    int32_t            ans;         /* answer                 */
    int32_t            ret = 0;     /* exit code              */
    sigset_t           sigs;        /* termination signals    */
    struct ctl_params  params;      /* controller parameters  */
    struct ingress_ctl ctl;         /* lifecycle controller   */

    /* parse command line arguments */
    ans = argp_parse(&argp, argc, argv, 0, 0, &cfg);
    DIE(ans, "error parsing cli arguments");
    debug_en = cfg.verbose;
    INFO("parsed cli arguments");

    /* termination signals are only ever consumed by the event pipeline */
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    ans = pthread_sigmask(SIG_BLOCK, &sigs, NULL);
    DIE(ans, "unable to block termination signals (%s)", strerror(ans));

    /* load filtering program & rule table */
    params.obj_path       = cfg.ebpf_path;
    params.pin_dir        = cfg.pin_dir;
    params.perf_pages     = cfg.perf_pages;
    params.syslog_paths   = cfg.syslog_paths;
    params.syslog_tag     = cfg.syslog_tag;
    params.evp.signals    = { SIGINT, SIGTERM };
    params.evp.retry_ms   = cfg.syslog_retry;
    params.evp.timeout_ms = cfg.syslog_timeout;

    ans = ctl_create(&ctl, params);
    DIE(ans, "unable to create ingress firewall controller");
    INFO("created ingress firewall controller");

    /* full cleanup */
    if (cfg.detach) {
        ans = ctl_attach_interfaces(&ctl, cfg.ifaces, true);
        GOTO(ans, clean_ctl_err, "failed to detach ingress node firewall");
        INFO("detached ingress node firewall");

        goto clean_ctl;
    }

    /* reconcile rule table with command line policy */
    if (!cfg.policy.source_cidrs.empty()) {
        ans = ctl_reconcile_rules(&ctl, cfg.policy, cfg.delete_rules);
        GOTO(ans, clean_ctl_err, "failed to reconcile firewall rules");
        INFO("reconciled %zu source ranges", cfg.policy.source_cidrs.size());
    }

    /* attach to interfaces */
    if (!cfg.ifaces.empty()) {
        ans = ctl_attach_interfaces(&ctl, cfg.ifaces, false);
        GOTO(ans, clean_ctl_err, "failed to attach to interfaces");
        INFO("attached to %zu interfaces", cfg.ifaces.size());
    }

    if (cfg.no_events)
        goto clean_ctl;

    /* log filtering events until SIGINT / SIGTERM */
    ans = ctl_start_events(&ctl);
    GOTO(ans, clean_ctl_err, "failed to start event logging");

    ctl_wait_events(&ctl);
    WAR("event pipeline stopped");

    /******************************** cleanup *********************************/

    goto clean_ctl;

clean_ctl_err:
    ret = -1;

clean_ctl:
    /* links & maps remain pinned */
    ctl_destroy(&ctl);
    INFO("released ingress firewall controller");

    return ret;
}
