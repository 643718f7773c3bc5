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

#include <string.h>             /* memset, strncpy */
#include <bpf/bpf.h>            /* bpf_map_*_elem  */
#include <bpf/libbpf.h>         /* bpf_map__*      */

#include "lpm_map.h"
#include "util.h"

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* upsert - inserts or replaces the rule list of a key
 *  @key : LPM key
 *  @val : rule list
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
bpf_lpm_store::upsert(const struct lpm_key &key, const struct rules_val &val)
{
    uint8_t kbuf[KEY_SZ];   /* serialized key   */
    uint8_t vbuf[VAL_SZ];   /* serialized value */
    int32_t ans;            /* answer           */

    abi_encode_key(&key, kbuf);
    abi_encode_val(&val, vbuf);

    ans = bpf_map_update_elem(map_fd, kbuf, vbuf, BPF_ANY) ? -errno : 0;
    RET(ans, ans, "unable to update rule table (%s)", strerror(-ans));

    return 0;
}

/* remove - deletes the rule list of a key
 *  @key : LPM key
 *
 *  @return : 0 if everything went well or key was absent; -errno otherwise
 */
int32_t
bpf_lpm_store::remove(const struct lpm_key &key)
{
    uint8_t kbuf[KEY_SZ];   /* serialized key */
    int32_t ans;            /* answer         */

    abi_encode_key(&key, kbuf);

    ans = bpf_map_delete_elem(map_fd, kbuf) ? -errno : 0;
    if (ans == -ENOENT) {
        DEBUG("rule table key (prefix len %u) not present; nothing to delete",
              key.prefix_len);
        return 0;
    }
    RET(ans, ans, "unable to delete from rule table (%s)", strerror(-ans));

    return 0;
}

/* lookup - fetches the rule list matching the address in key
 *  @key : LPM key (prefix_len should be the full address width)
 *  @val : ptr to destination rule list
 *
 *  @return : 0 if found; -ENOENT if no entry matches; -errno otherwise
 */
int32_t
bpf_lpm_store::lookup(const struct lpm_key &key, struct rules_val *val)
{
    uint8_t kbuf[KEY_SZ];   /* serialized key   */
    uint8_t vbuf[VAL_SZ];   /* serialized value */
    int32_t ans;            /* answer           */

    abi_encode_key(&key, kbuf);

    ans = bpf_map_lookup_elem(map_fd, kbuf, vbuf);
    if (ans)
        return -errno;

    return abi_decode_val(vbuf, val);
}

/* info - retrieves kernel metadata of the rule table
 *  @info : ptr to destination structure
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
bpf_lpm_store::info(struct lpm_info *info)
{
    struct bpf_map_info minfo;  /* kernel map info */
    uint32_t            len;    /* info length     */
    int32_t             ans;    /* answer          */

    memset(&minfo, 0, sizeof(minfo));
    len = sizeof(minfo);

    ans = bpf_obj_get_info_by_fd(map_fd, &minfo, &len) ? -errno : 0;
    RET(ans, ans, "cannot get map info (%s)", strerror(-ans));

    info->type        = minfo.type;
    info->id          = minfo.id;
    info->key_size    = minfo.key_size;
    info->value_size  = minfo.value_size;
    info->max_entries = minfo.max_entries;
    info->map_flags   = minfo.map_flags;
    strncpy(info->name, minfo.name, sizeof(info->name) - 1);
    info->name[sizeof(info->name) - 1] = '\0';

    return 0;
}

/* lpm_check_geometry - verifies rule table against the compiled-in ABI
 *  @map : rule table map from the loaded object
 *
 *  @return : 0 if key / value sizes and map type match; -EINVAL otherwise
 */
int32_t
lpm_check_geometry(const struct bpf_map *map)
{
    RET(bpf_map__type(map) != BPF_MAP_TYPE_LPM_TRIE, -EINVAL,
        "rule table is not an LPM trie (type %d)", bpf_map__type(map));
    RET(bpf_map__key_size(map) != KEY_SZ, -EINVAL,
        "rule table key size %u != %d", bpf_map__key_size(map), KEY_SZ);
    RET(bpf_map__value_size(map) != VAL_SZ, -EINVAL,
        "rule table value size %u != %d", bpf_map__value_size(map), VAL_SZ);

    return 0;
}
