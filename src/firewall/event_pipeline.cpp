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

#include <stdio.h>          /* snprintf                    */
#include <string.h>         /* strerror                    */
#include <net/if.h>         /* if_indextoname, IF_NAMESIZE */
#include <pthread.h>        /* pthread_sigmask, pthread_kill */

#include <chrono>           /* milliseconds, steady_clock  */

#include "event_pipeline.h"
#include "pkt_decode.h"
#include "bpf_abi.h"
#include "util.h"

using namespace std;

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* evp_resolve_ifname - default resolver, backed by the kernel
 *  @if_index : interface index
 *  @if_name  : ptr to destination name
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
evp_resolve_ifname(uint32_t if_index, string *if_name)
{
    char buf[IF_NAMESIZE];  /* interface name */

    if (!if_indextoname(if_index, buf))
        return -errno;

    *if_name = buf;
    return 0;
}

/* evp_action_name - renders an XDP action byte
 *  @action : action byte from the event header
 *
 *  @return : "Allow", "Drop" or "Invalid action <action>"
 */
string
evp_action_name(uint8_t action)
{
    switch (action) {
        case XDP_ACT_DENY:
            return "Drop";
        case XDP_ACT_ALLOW:
            return "Allow";
    }

    return "Invalid action " + to_string(action);
}

event_pipeline::event_pipeline(record_source           &src,
                               audit_sink              &sink,
                               const struct evp_params &params)
    : src(src), sink(sink), params(params), st(EVP_IDLE)
{
    sigemptyset(&sigs);
    for (auto sig : this->params.signals)
        sigaddset(&sigs, sig);
}

event_pipeline::~event_pipeline()
{
    int32_t ans;    /* answer */

    ans = stop();
    ALERT(ans, "unable to stop event pipeline");
    wait();
}

/* start - connects audit sink and spawns reader & signal watcher
 *
 *  @return : 0 if everything went well; -EALREADY if not idle; -errno of the
 *            last sink connection attempt otherwise (record source is closed)
 *
 * The termination signals are blocked in the calling thread, so that only
 * the watcher receives them.
 */
int32_t
event_pipeline::start()
{
    int32_t ans;    /* answer */

    RET(st.load() != EVP_IDLE, -EALREADY, "event pipeline already started");
    RET(params.signals.empty(), -EINVAL, "no termination signal configured");

    ans = pthread_sigmask(SIG_BLOCK, &sigs, NULL);
    RET(ans, -ans, "unable to block termination signals (%s)", strerror(ans));

    ans = _connect_sink();
    if (ans) {
        ERROR("failed to connect to syslog (%s)", strerror(-ans));
        ALERT(src.close(), "closing perf event reader failed");
        return ans;
    }

    st.store(EVP_RUNNING);
    watcher = thread(&event_pipeline::_watch, this);
    reader  = thread(&event_pipeline::_read_loop, this);

    INFO("listening for events..");
    return 0;
}

/* wait - blocks until both worker threads have exited */
void
event_pipeline::wait()
{
    if (watcher.joinable())
        watcher.join();
    if (reader.joinable())
        reader.join();
}

/* stop - requests termination through the signal watcher
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
event_pipeline::stop()
{
    int32_t ans;    /* answer */

    if (!watcher.joinable() || st.load() != EVP_RUNNING)
        return 0;

    ans = pthread_kill(watcher.native_handle(), params.signals[0]);
    RET(ans, -ans, "unable to signal watcher thread (%s)", strerror(ans));

    return 0;
}

/* handle_record - turns one record into audit log lines
 *  @rec : record from the event channel
 *
 * Failures are logged and the record is dropped.
 */
void
event_pipeline::handle_record(const struct evt_record &rec)
{
    struct event_hdr hdr;       /* decoded event header */
    string           if_name;   /* ingress interface    */
    char             buf[256];  /* summary line         */
    int32_t          ans;       /* answer               */

    if (rec.lost) {
        WAR("Perf event ring buffer full, dropped %llu samples",
            (unsigned long long) rec.lost);
        return;
    }

    ans = abi_decode_event_hdr(rec.raw.data(), rec.raw.size(), &hdr);
    if (ans) {
        ERROR("parsing perf event header err (%s)", strerror(-ans));
        return;
    }

    if (rec.raw.size() - EVT_HDR_SZ < hdr.pkt_length) {
        ERROR("parsing perf event packet: %zu bytes, expected %u",
              rec.raw.size() - EVT_HDR_SZ, hdr.pkt_length);
        return;
    }

    ans = params.resolve(hdr.if_id, &if_name);
    if (ans) {
        ERROR("lookup network iface %u: %s", hdr.if_id, strerror(-ans));
        return;
    }

    snprintf(buf, sizeof(buf), "ruleId %u action %s len %u if %s",
             hdr.rule_id, evp_action_name(hdr.action).c_str(), hdr.pkt_length,
             if_name.c_str());
    ans = sink.info(buf);
    ALERT(ans, "audit line dropped");

    for (auto &line : pkt_summarize(rec.raw.data() + EVT_HDR_SZ,
                                    hdr.pkt_length)) {
        ans = sink.info(line);
        ALERT(ans, "audit line dropped");
    }
}

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _connect_sink - bounded retry of the audit sink connection
 *
 *  @return : 0 if connected; -errno of the last attempt otherwise
 *
 * First attempt is immediate; the next ones are spaced by the retry interval
 * until the timeout elapses.
 */
int32_t
event_pipeline::_connect_sink()
{
    auto    deadline = chrono::steady_clock::now()
                     + chrono::milliseconds(params.timeout_ms);
    int32_t ans;    /* answer */

    while (1) {
        ans = sink.connect();
        if (!ans)
            return 0;

        if (chrono::steady_clock::now()
            + chrono::milliseconds(params.retry_ms) > deadline)
            return ans;

        WAR("failed to connect to syslog (%s); retrying...", strerror(-ans));
        this_thread::sleep_for(chrono::milliseconds(params.retry_ms));
    }
}

/* _watch - signal watcher thread; single closer of the record source */
void
event_pipeline::_watch()
{
    int32_t sig;    /* received signal */
    int32_t ans;    /* answer          */

    do {
        ans = sigwait(&sigs, &sig);
    } while (ans == EINTR);
    ALERT(ans, "sigwait failed (%s); closing anyway", strerror(ans));

    if (!ans)
        INFO("received signal %d, exiting..", sig);

    st.store(EVP_CLOSING);

    ans = src.close();
    ALERT(ans, "closing perf event reader failed (%s)", strerror(-ans));
}

/* _read_loop - reader thread; exits once the record source is closed */
void
event_pipeline::_read_loop()
{
    struct evt_record rec;  /* current record */
    int32_t           ans;  /* answer         */

    while (1) {
        ans = src.read(&rec);
        if (ans == RD_CLOSED)
            break;
        if (ans < 0) {
            ERROR("reading from perf event reader (%s)", strerror(-ans));
            continue;
        }

        handle_record(rec);
    }

    st.store(EVP_STOPPED);
}
