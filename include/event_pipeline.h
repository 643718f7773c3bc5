#pragma once

#include <stdint.h>         /* [u]int*_t */
#include <signal.h>         /* sigset_t, SIG* */
#include <string>           /* string    */
#include <vector>           /* vector    */
#include <thread>           /* thread    */
#include <atomic>           /* atomic    */

#include "perf_reader.h"
#include "audit_sink.h"

/* pipeline life cycle; only ever moves forward */
enum evp_state {
    EVP_IDLE,       /* not started (or start failed)      */
    EVP_RUNNING,    /* sink connected, threads running    */
    EVP_CLOSING,    /* termination requested              */
    EVP_STOPPED,    /* reader observed the closed source  */
};

/* interface index to name resolver
 *  @return : 0 if everything went well; -errno otherwise
 */
typedef int32_t (*evp_resolver)(uint32_t if_index, std::string *if_name);

int32_t evp_resolve_ifname(uint32_t if_index, std::string *if_name);

struct evp_params {
    std::vector<int32_t> signals    = { SIGINT, SIGTERM };  /* stop requests */
    uint32_t             retry_ms   = 1'000;    /* sink connection interval */
    uint32_t             timeout_ms = 30'000;   /* sink connection budget   */
    evp_resolver         resolve    = evp_resolve_ifname;
};

std::string evp_action_name(uint8_t action);

/* event channel to audit log
 *
 * Two threads run while the pipeline is active: the reader, which blocks on
 * the record source, and the signal watcher, which is the only one to close
 * the record source.
 */
class event_pipeline {
public:
    event_pipeline(record_source &src, audit_sink &sink,
                   const struct evp_params &params);
    ~event_pipeline();

    event_pipeline(const event_pipeline &) = delete;
    event_pipeline &operator=(const event_pipeline &) = delete;

    int32_t   start();
    void      wait();
    int32_t   stop();
    evp_state state() const { return st.load(); }

    void handle_record(const struct evt_record &rec);

private:
    int32_t _connect_sink();
    void    _watch();
    void    _read_loop();

    record_source          &src;        /* event channel            */
    audit_sink             &sink;       /* audit log                */
    struct evp_params      params;      /* behaviour knobs          */
    sigset_t               sigs;        /* termination signals      */
    std::atomic<evp_state> st;          /* current state            */
    std::thread            watcher;     /* signal watcher thread    */
    std::thread            reader;      /* record reader thread     */
};
