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

#include <string.h>             /* memset, strerror         */
#include <sys/stat.h>           /* mkdir                    */
#include <sys/resource.h>       /* setrlimit                */
#include <bpf/libbpf.h>         /* bpf_object__*, bpf_map__* */

#include "ingress_ctl.h"
#include "rule_compiler.h"
#include "util.h"

using namespace std;

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _stop_events - stops the event pipeline and drops its resources
 *  @ctl : controller
 */
static void
_stop_events(struct ingress_ctl *ctl)
{
    int32_t ans;    /* answer */

    if (ctl->pipeline) {
        ans = ctl->pipeline->stop();
        ALERT(ans, "unable to stop event pipeline");
        ctl->pipeline->wait();
    }

    ctl->pipeline.reset();
    ctl->sink.reset();
    ctl->reader.reset();
}

/* _close_object - releases table & program handles
 *  @ctl : controller
 */
static void
_close_object(struct ingress_ctl *ctl)
{
    ctl->store.reset();

    if (ctl->obj) {
        bpf_object__close(ctl->obj);
        DEBUG("closed eBPF object");
    }

    ctl->obj        = NULL;
    ctl->prog       = NULL;
    ctl->table_map  = NULL;
    ctl->events_map = NULL;
}

/* _cleanup - unpins & releases links, then table & program
 *  @ctl : controller (lock held)
 *
 *  @return : 0 if everything went well; last unpin error otherwise
 */
static int32_t
_cleanup(struct ingress_ctl *ctl)
{
    int32_t ans;    /* answer */

    _stop_events(ctl);
    ans = att_detach_all(&ctl->reg);
    _close_object(ctl);

    return ans;
}

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* ctl_create - loads the filtering program and locates its maps
 *  @ctl    : controller (not yet loaded)
 *  @params : controller parameters
 *
 *  @return : 0 if everything went well; -errno otherwise
 *
 * Maps declared as pinned by name are created in (or reused from) the pin
 * base directory.
 */
int32_t
ctl_create(struct ingress_ctl *ctl, const struct ctl_params &params)
{
    struct bpf_object_open_opts opts;   /* object open options */
    struct rlimit               rlim;   /* resource limit      */
    int32_t                     ans;    /* answer              */

    RET(ctl->obj, -EALREADY, "controller already loaded");

    ctl->params      = params;
    ctl->reg.pin_dir = params.pin_dir;

    /* increase resource limit for eBPF maps */
    rlim = {RLIM_INFINITY, RLIM_INFINITY};
    ans = setrlimit(RLIMIT_MEMLOCK, &rlim) ? -errno : 0;
    RET(ans, ans, "unable to set resource limit (%s)", strerror(-ans));
    DEBUG("set new resource limits");

    /* pin base directory */
    ans = mkdir(params.pin_dir.c_str(), 0700) ? -errno : 0;
    RET(ans && ans != -EEXIST, ans, "unable to create %s (%s)",
        params.pin_dir.c_str(), strerror(-ans));

    /* open eBPF object file */
    memset(&opts, 0, sizeof(opts));
    opts.sz            = sizeof(opts);
    opts.pin_root_path = ctl->params.pin_dir.c_str();

    ctl->obj = bpf_object__open_file(params.obj_path.c_str(), &opts);
    ans = libbpf_get_error(ctl->obj);
    if (ans) {
        ctl->obj = NULL;
        RET(1, ans, "unable to open eBPF object %s (%s)",
            params.obj_path.c_str(), strerror(-ans));
    }
    INFO("opened eBPF object file");

    /* load eBPF object into kernel verifier */
    ans = bpf_object__load(ctl->obj);
    GOTO(ans, clean_obj, "unable to load eBPF object (%s)", strerror(-ans));
    INFO("loaded eBPF object file (passed verification)");

    /* get references to program & maps */
    ans = -ENOENT;
    ctl->prog = bpf_object__find_program_by_name(ctl->obj, NODEFW_PROG_NAME);
    GOTO(!ctl->prog, clean_obj, "unable to find program " NODEFW_PROG_NAME);

    ctl->table_map = bpf_object__find_map_by_name(ctl->obj,
                                                  NODEFW_TABLE_MAP_NAME);
    GOTO(!ctl->table_map, clean_obj,
         "unable to find map " NODEFW_TABLE_MAP_NAME);

    ctl->events_map = bpf_object__find_map_by_name(ctl->obj,
                                                   NODEFW_EVENTS_MAP_NAME);
    GOTO(!ctl->events_map, clean_obj,
         "unable to find map " NODEFW_EVENTS_MAP_NAME);

    /* validate against compiled-in layout */
    ans = lpm_check_geometry(ctl->table_map);
    GOTO(ans, clean_obj, "rule table does not match the expected layout");

    ans = -EINVAL;
    GOTO(bpf_map__type(ctl->events_map) != BPF_MAP_TYPE_PERF_EVENT_ARRAY,
         clean_obj, "event channel is not a perf event array");

    ctl->store = make_unique<bpf_lpm_store>(bpf_map__fd(ctl->table_map));
    INFO("got rule table and event channel maps");

    return 0;

clean_obj:
    _close_object(ctl);
    return ans;
}

/* ctl_reconcile_rules - applies a policy to the rule table
 *  @ctl       : controller
 *  @policy    : source ranges & protocol rules
 *  @is_delete : remove the listed ranges
 *
 *  @return : 0 if everything went well; -EINVAL on malformed policy; -errno
 *            on rule table failure
 */
int32_t
ctl_reconcile_rules(struct ingress_ctl           *ctl,
                    const struct policy_rule_set &policy,
                    bool                         is_delete)
{
    lock_guard<mutex> guard(ctl->lock);
    struct lpm_info   info;     /* rule table metadata */
    int32_t           ans;      /* answer              */

    RET(!ctl->store, -EBADF, "controller not loaded");

    ans = ctl->store->info(&info);
    RET(ans, ans, "unable to query rule table info");
    INFO("rule table %s: id %u type %u key %u value %u max entries %u "
         "flags %#x", info.name, info.id, info.type, info.key_size,
         info.value_size, info.max_entries, info.map_flags);

    return rc_apply(*ctl->store, policy, is_delete);
}

/* ctl_attach_interfaces - attaches or detaches the filtering program
 *  @ctl       : controller
 *  @if_names  : interface names
 *  @is_delete : perform full cleanup instead of attaching
 *
 *  @return : 0 if everything went well; -ENODEV if a name does not resolve;
 *            -errno otherwise
 *
 * Detaching is not selective: links pinned for @if_names by an earlier run
 * are taken over, then every tracked attachment is removed and the table &
 * program are released.
 */
int32_t
ctl_attach_interfaces(struct ingress_ctl   *ctl,
                      const vector<string> &if_names,
                      bool                 is_delete)
{
    lock_guard<mutex> guard(ctl->lock);
    vector<uint32_t>  indices;  /* resolved interface indices */
    int32_t           ans;      /* answer                     */

    if (is_delete) {
        ans = att_resolve(if_names, &indices);
        RET(ans, ans, "unable to resolve interfaces");

        ans = att_adopt(&ctl->reg, if_names, indices);
        RET(ans, ans, "unable to take over pinned attachments");

        return _cleanup(ctl);
    }

    RET(!ctl->prog, -EBADF, "controller not loaded");

    return att_attach(&ctl->reg, bpf_program__fd(ctl->prog), if_names);
}

/* ctl_start_events - starts the event pipeline
 *  @ctl : controller
 *
 *  @return : 0 if everything went well or already running; -errno otherwise
 */
int32_t
ctl_start_events(struct ingress_ctl *ctl)
{
    lock_guard<mutex> guard(ctl->lock);
    int32_t           ans;      /* answer */

    if (ctl->pipeline)
        return 0;

    RET(!ctl->events_map, -EBADF, "controller not loaded");

    ctl->reader = make_unique<perf_reader>();
    ans = ctl->reader->open(bpf_map__fd(ctl->events_map),
                            ctl->params.perf_pages);
    GOTO(ans, clean_reader, "failed creating perf event reader");

    ctl->sink = make_unique<syslog_sink>(
            ctl->params.syslog_paths.empty() ? syslog_sink::default_paths
                                             : ctl->params.syslog_paths,
            ctl->params.syslog_tag);

    ctl->pipeline = make_unique<event_pipeline>(*ctl->reader, *ctl->sink,
                                                ctl->params.evp);
    ans = ctl->pipeline->start();
    GOTO(ans, clean_reader, "unable to start event pipeline");

    return 0;

clean_reader:
    ctl->pipeline.reset();
    ctl->sink.reset();
    ctl->reader.reset();
    return ans;
}

/* ctl_wait_events - blocks until the event pipeline stops
 *  @ctl : controller
 *
 * Runs without the controller lock, so that reconcile & attach stay usable
 * while events are logged. Only the thread owning @ctl may call this, and
 * never concurrently with ctl_cleanup() or ctl_destroy().
 */
void
ctl_wait_events(struct ingress_ctl *ctl)
{
    if (ctl->pipeline)
        ctl->pipeline->wait();
}

/* ctl_cleanup - removes every attachment and releases all handles
 *  @ctl : controller
 *
 *  @return : 0 if everything went well; last unpin error otherwise
 *
 * Idempotent.
 */
int32_t
ctl_cleanup(struct ingress_ctl *ctl)
{
    lock_guard<mutex> guard(ctl->lock);

    return _cleanup(ctl);
}

/* ctl_destroy - releases all handles, keeping attachments pinned
 *  @ctl : controller
 */
void
ctl_destroy(struct ingress_ctl *ctl)
{
    lock_guard<mutex> guard(ctl->lock);

    _stop_events(ctl);
    att_release(&ctl->reg);
    _close_object(ctl);
}
