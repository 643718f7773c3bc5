#pragma once

#include <stdint.h>         /* [u]int*_t  */
#include <string>           /* string     */
#include <vector>           /* vector     */
#include <memory>           /* unique_ptr */
#include <mutex>            /* mutex      */

#include "policy.h"
#include "lpm_map.h"
#include "xdp_attach.h"
#include "perf_reader.h"
#include "audit_sink.h"
#include "event_pipeline.h"

/* object names in the compiled filtering program */
#define NODEFW_PROG_NAME        "ingres_node_firewall_process"
#define NODEFW_TABLE_MAP_NAME   "ingress_node_firewall_table_map"
#define NODEFW_EVENTS_MAP_NAME  "ingress_node_firewall_events_map"

/* pin base directory */
#define NODEFW_PIN_DIR          "/sys/fs/bpf/xdp_ingress_node_firewall_process"

struct bpf_object;
struct bpf_program;
struct bpf_map;

struct ctl_params {
    std::string              obj_path;                  /* XDP object file */
    std::string              pin_dir    = NODEFW_PIN_DIR;
    uint32_t                 perf_pages = 1;            /* per CPU         */
    std::vector<std::string> syslog_paths;              /* empty: builtin  */
    std::string              syslog_tag = "nodefw";
    struct evp_params        evp;
};

/* lifecycle controller; owns every kernel side handle */
struct ingress_ctl {
    struct ctl_params               params;
    struct bpf_object               *obj        = NULL;
    struct bpf_program              *prog       = NULL;
    struct bpf_map                  *table_map  = NULL;
    struct bpf_map                  *events_map = NULL;
    std::unique_ptr<bpf_lpm_store>  store;
    struct att_registry             reg;
    std::unique_ptr<perf_reader>    reader;
    std::unique_ptr<syslog_sink>    sink;
    std::unique_ptr<event_pipeline> pipeline;
    std::mutex                      lock;       /* reconcile & attach */
};

int32_t ctl_create(struct ingress_ctl *ctl, const struct ctl_params &params);
int32_t ctl_reconcile_rules(struct ingress_ctl *ctl,
                            const struct policy_rule_set &policy,
                            bool is_delete);
int32_t ctl_attach_interfaces(struct ingress_ctl *ctl,
                              const std::vector<std::string> &if_names,
                              bool is_delete);
int32_t ctl_start_events(struct ingress_ctl *ctl);
/* owner thread only; must not race ctl_cleanup() / ctl_destroy() */
void    ctl_wait_events(struct ingress_ctl *ctl);
int32_t ctl_cleanup(struct ingress_ctl *ctl);
void    ctl_destroy(struct ingress_ctl *ctl);
