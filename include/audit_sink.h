#pragma once

#include <stdint.h>     /* [u]int*_t */
#include <syslog.h>     /* LOG_*     */
#include <string>       /* string    */
#include <vector>       /* vector    */
#include <mutex>        /* mutex     */

/* destination of per-event audit lines
 *
 * connect : 0 once the sink accepts messages; -errno otherwise
 * info    : emit one informational message
 */
class audit_sink {
public:
    virtual ~audit_sink() = default;

    virtual int32_t connect() = 0;
    virtual int32_t info(const std::string &msg) = 0;
};

/* local syslog daemon over a UNIX socket */
class syslog_sink : public audit_sink {
public:
    static const std::vector<std::string> default_paths;

    syslog_sink(const std::vector<std::string> &paths, const std::string &tag,
                int32_t priority = LOG_INFO | LOG_DAEMON);
    ~syslog_sink() override;

    syslog_sink(const syslog_sink &) = delete;
    syslog_sink &operator=(const syslog_sink &) = delete;

    int32_t connect() override;
    int32_t info(const std::string &msg) override;

private:
    int32_t _dial();
    int32_t _send(const std::string &frame);
    void    _close();

    std::vector<std::string> paths;     /* socket search list   */
    std::string              tag;       /* message tag          */
    int32_t                  priority;  /* facility | severity  */
    int32_t                  sock_fd;   /* connected socket     */
    std::mutex               lock;      /* serializes writers   */
};
