#pragma once

#include <stdint.h>     /* [u]int*_t */

#include "bpf_abi.h"

struct bpf_map;

/* rule table metadata (diagnostics only) */
struct lpm_info {
    uint32_t type;
    uint32_t id;
    uint32_t key_size;
    uint32_t value_size;
    uint32_t max_entries;
    uint32_t map_flags;
    char     name[16];
};

/* operations against the LPM rule table
 *
 * upsert : replace-or-insert; -errno if the table is unavailable
 * remove : 0 also when the key is absent (deleting a missing key is a no-op)
 * lookup : longest prefix match for key's address; -ENOENT if nothing matches
 * info   : table metadata
 */
class lpm_store {
public:
    virtual ~lpm_store() = default;

    virtual int32_t upsert(const struct lpm_key &key,
                           const struct rules_val &val) = 0;
    virtual int32_t remove(const struct lpm_key &key) = 0;
    virtual int32_t lookup(const struct lpm_key &key, struct rules_val *val) = 0;
    virtual int32_t info(struct lpm_info *info) = 0;
};

/* kernel resident table; does not own the map fd */
class bpf_lpm_store : public lpm_store {
public:
    explicit bpf_lpm_store(int32_t map_fd) : map_fd(map_fd) {}

    int32_t upsert(const struct lpm_key &key,
                   const struct rules_val &val) override;
    int32_t remove(const struct lpm_key &key) override;
    int32_t lookup(const struct lpm_key &key, struct rules_val *val) override;
    int32_t info(struct lpm_info *info) override;

    int32_t fd() const { return map_fd; }

private:
    int32_t map_fd;
};

int32_t lpm_check_geometry(const struct bpf_map *map);
