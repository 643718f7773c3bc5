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

#include <unistd.h>         /* close, getpid        */
#include <time.h>           /* time, localtime_r    */
#include <string.h>         /* strerror, strncpy    */
#include <sys/socket.h>     /* socket, connect      */
#include <sys/un.h>         /* sockaddr_un          */

#include "audit_sink.h"
#include "util.h"

using namespace std;

const vector<string> syslog_sink::default_paths = {
    "/dev/log",
    "/var/run/syslog",
    "/var/run/log",
};

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

syslog_sink::syslog_sink(const vector<string> &paths, const string &tag,
                         int32_t priority)
    : paths(paths), tag(tag), priority(priority), sock_fd(-1)
{}

syslog_sink::~syslog_sink()
{
    _close();
}

/* connect - (re)establishes the connection to the syslog daemon
 *
 *  @return : 0 if everything went well; -errno of the last attempt otherwise
 */
int32_t
syslog_sink::connect()
{
    lock_guard<mutex> guard(lock);

    return _dial();
}

/* info - sends one message at the configured priority
 *  @msg : message body (no trailing newline)
 *
 *  @return : 0 if everything went well; -errno otherwise
 *
 * A failed write is retried once over a fresh connection. A partial write
 * is not: the connection is dropped and the next message reconnects.
 */
int32_t
syslog_sink::info(const string &msg)
{
    lock_guard<mutex> guard(lock);
    char              stamp[32];    /* "Mmm dd hh:mm:ss" */
    char              hdr[64];      /* "<PRI>STAMP "     */
    struct tm         tm;           /* broken down time  */
    time_t            now;          /* current time      */
    string            frame;        /* full message      */
    int32_t           ans;          /* answer            */

    now = time(NULL);
    localtime_r(&now, &tm);
    strftime(stamp, sizeof(stamp), "%b %e %H:%M:%S", &tm);
    snprintf(hdr, sizeof(hdr), "<%d>%s ", priority, stamp);

    frame = hdr + tag + "[" + to_string(getpid()) + "]: " + msg + "\n";

    ans = _send(frame);
    if (!ans)
        return 0;

    /* part of the frame already reached the daemon; never resend it */
    if (ans == -EIO) {
        _close();
        RET(1, ans, "partial write to syslog; message truncated");
    }

    /* one reconnect attempt */
    DEBUG("syslog write failed (%s); reconnecting", strerror(-ans));
    ans = _dial();
    RET(ans, ans, "unable to reconnect to syslog (%s)", strerror(-ans));

    ans = _send(frame);
    RET(ans, ans, "unable to write to syslog (%s)", strerror(-ans));

    return 0;
}

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _dial - connects to the first reachable socket of the search list
 *
 *  @return : 0 if everything went well; -errno of the last attempt otherwise
 *
 * Each path is tried as a datagram socket first, then as a stream socket.
 * Caller must hold the lock.
 */
int32_t
syslog_sink::_dial()
{
    static const int32_t types[] = { SOCK_DGRAM, SOCK_STREAM };
    struct sockaddr_un   addr;              /* daemon address */
    int32_t              ans = -ENOENT;     /* answer         */

    _close();

    for (auto &path : paths) {
        RET(path.size() >= sizeof(addr.sun_path), -ENAMETOOLONG,
            "syslog socket path too long: %s", path.c_str());

        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

        for (auto type : types) {
            sock_fd = socket(AF_UNIX, type | SOCK_CLOEXEC, 0);
            if (sock_fd == -1) {
                ans = -errno;
                continue;
            }

            if (!::connect(sock_fd, (struct sockaddr *) &addr, sizeof(addr))) {
                DEBUG("connected to syslog at %s (%s)", path.c_str(),
                      type == SOCK_DGRAM ? "dgram" : "stream");
                return 0;
            }

            ans = -errno;
            _close();
        }
    }

    return ans;
}

/* _send - writes one complete frame to the current socket
 *  @frame : formatted message
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
syslog_sink::_send(const string &frame)
{
    ssize_t wb;     /* written bytes */

    if (sock_fd == -1)
        return -ENOTCONN;

    wb = send(sock_fd, frame.data(), frame.size(), MSG_NOSIGNAL);
    if (wb == -1)
        return -errno;
    if ((size_t) wb != frame.size())
        return -EIO;

    return 0;
}

/* _close - drops current connection, if any */
void
syslog_sink::_close()
{
    if (sock_fd != -1) {
        close(sock_fd);
        sock_fd = -1;
    }
}
