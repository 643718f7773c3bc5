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

#include <net/if.h>             /* if_nametoindex                     */
#include <string.h>             /* strerror                           */
#include <unistd.h>             /* access, unlink, close              */
#include <bpf/bpf.h>            /* bpf_link_create, bpf_obj_pin / get */

#include "xdp_attach.h"
#include "util.h"

using namespace std;

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _unpin - removes a link pin and drops the link fd
 *  @rec : attachment record
 *
 *  @return : 0 if everything went well; -errno of the unpin otherwise
 *
 * The fd is closed even if the unpin failed.
 */
static int32_t
_unpin(struct att_record &rec)
{
    int32_t ans;    /* answer */

    ans = unlink(rec.pin_path.c_str()) ? -errno : 0;
    close(rec.link_fd);

    return ans;
}

/* _rollback - undoes attachments made past a registry mark
 *  @reg  : attachment registry
 *  @mark : number of records to keep
 */
static void
_rollback(struct att_registry *reg, size_t mark)
{
    int32_t ans;    /* answer */

    while (reg->records.size() > mark) {
        struct att_record &rec = reg->records.back();

        ans = _unpin(rec);
        ALERT(ans, "unable to unpin %s (%s)", rec.pin_path.c_str(),
              strerror(-ans));
        WAR("rolled back attachment to %s", rec.if_name.c_str());
        reg->records.pop_back();
    }
}

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* att_pin_path - derives the link pin location of an interface
 *  @pin_dir : pin base directory
 *  @if_name : interface name
 *
 *  @return : "<pin_dir>/<if_name>_link"
 */
string
att_pin_path(const string &pin_dir, const string &if_name)
{
    return pin_dir + "/" + if_name + "_link";
}

/* att_resolve - resolves interface names to indices
 *  @if_names   : interface names
 *  @if_indices : ptr to destination indices (same order as @if_names)
 *
 *  @return : 0 if every name resolved; -ENODEV otherwise
 */
int32_t
att_resolve(const vector<string> &if_names, vector<uint32_t> *if_indices)
{
    if_indices->clear();

    for (auto &name : if_names) {
        uint32_t idx = if_nametoindex(name.c_str());
        RET(!idx, -ENODEV, "lookup network iface \"%s\": no such device",
            name.c_str());

        if_indices->push_back(idx);
    }

    return 0;
}

/* att_attach - attaches XDP program to interfaces and pins the links
 *  @reg      : attachment registry
 *  @prog_fd  : loaded XDP program
 *  @if_names : interface names
 *
 *  @return : 0 if everything went well; -ENODEV if a name does not resolve;
 *            -errno from the kernel otherwise
 *
 * All names are resolved before the first attachment. On a kernel failure,
 * the links created by this call are unpinned and released, leaving @reg as
 * it was before the call.
 */
int32_t
att_attach(struct att_registry *reg, int32_t prog_fd,
           const vector<string> &if_names)
{
    vector<uint32_t> indices;       /* resolved if indices */
    size_t           mark;          /* rollback point      */
    int32_t          link_fd;       /* new attachment      */
    string           pin_path;      /* link pin location   */
    int32_t          ans;           /* answer              */

    ans = att_resolve(if_names, &indices);
    RET(ans, ans, "unable to resolve interfaces");

    mark = reg->records.size();

    for (size_t i = 0; i < if_names.size(); ++i) {
        pin_path = att_pin_path(reg->pin_dir, if_names[i]);

        /* attach program to interface */
        link_fd = bpf_link_create(prog_fd, indices[i], BPF_XDP, NULL);
        if (link_fd < 0) {
            ans = -errno;
            ERROR("could not attach XDP program to %s (%s)",
                  if_names[i].c_str(), strerror(-ans));
            goto rollback;
        }

        /* persist attachment past process lifetime */
        ans = bpf_obj_pin(link_fd, pin_path.c_str()) ? -errno : 0;
        if (ans) {
            ERROR("failed to pin link to %s (%s)", pin_path.c_str(),
                  strerror(-ans));
            close(link_fd);
            goto rollback;
        }

        reg->records.push_back({
            .if_name  = if_names[i],
            .if_index = indices[i],
            .link_fd  = link_fd,
            .pin_path = pin_path,
        });
        INFO("attached ingress node firewall program to iface %s (index %u)",
             if_names[i].c_str(), indices[i]);
    }

    return 0;

rollback:
    _rollback(reg, mark);
    return ans;
}

/* att_adopt - takes over links pinned by a previous run
 *  @reg        : attachment registry
 *  @if_names   : interface names
 *  @if_indices : resolved indices (same order as @if_names)
 *
 *  @return : 0 if everything went well; -errno otherwise
 *
 * Interfaces already tracked or without a pinned link are skipped. Adopted
 * links keep their pin, so att_detach_all() removes them like any other.
 */
int32_t
att_adopt(struct att_registry *reg, const vector<string> &if_names,
          const vector<uint32_t> &if_indices)
{
    int32_t link_fd;        /* pinned attachment */
    string  pin_path;       /* link pin location */
    int32_t ans;            /* answer            */

    for (size_t i = 0; i < if_names.size(); ++i) {
        bool tracked = false;

        for (auto &rec : reg->records)
            tracked |= rec.if_name == if_names[i];
        if (tracked)
            continue;

        pin_path = att_pin_path(reg->pin_dir, if_names[i]);
        if (access(pin_path.c_str(), F_OK)) {
            DEBUG("no pinned link for iface %s", if_names[i].c_str());
            continue;
        }

        link_fd = bpf_obj_get(pin_path.c_str());
        ans = link_fd < 0 ? -errno : 0;
        RET(ans, ans, "unable to open pinned link %s (%s)", pin_path.c_str(),
            strerror(-ans));

        reg->records.push_back({
            .if_name  = if_names[i],
            .if_index = if_indices[i],
            .link_fd  = link_fd,
            .pin_path = pin_path,
        });
        DEBUG("adopted pinned link of iface %s", if_names[i].c_str());
    }

    return 0;
}

/* att_detach_all - unpins and releases every tracked attachment
 *  @reg : attachment registry
 *
 *  @return : 0 if every link was unpinned; last unpin error otherwise
 *
 * Links are released and the registry emptied regardless of unpin errors.
 * Calling this with an empty registry is a no-op.
 */
int32_t
att_detach_all(struct att_registry *reg)
{
    int32_t ret = 0;    /* return value */
    int32_t ans;        /* answer       */

    for (auto &rec : reg->records) {
        INFO("unattaching ingress node firewall program from iface %s "
             "(index %u)", rec.if_name.c_str(), rec.if_index);

        ans = _unpin(rec);
        if (ans) {
            ERROR("unable to unpin %s (%s)", rec.pin_path.c_str(),
                  strerror(-ans));
            ret = ans;
        }
    }

    reg->records.clear();
    return ret;
}

/* att_release - drops link fds, leaving pinned attachments in place
 *  @reg : attachment registry
 */
void
att_release(struct att_registry *reg)
{
    for (auto &rec : reg->records) {
        DEBUG("releasing link of %s (pinned at %s)", rec.if_name.c_str(),
              rec.pin_path.c_str());
        close(rec.link_fd);
    }

    reg->records.clear();
}
