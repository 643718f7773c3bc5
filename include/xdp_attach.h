#pragma once

#include <stdint.h>     /* [u]int*_t */
#include <string>       /* string    */
#include <vector>       /* vector    */

/* one attached interface; link fd is owned by the registry */
struct att_record {
    std::string if_name;
    uint32_t    if_index;
    int32_t     link_fd;
    std::string pin_path;
};

/* attachment registry; owned by the lifecycle controller */
struct att_registry {
    std::string                    pin_dir;  /* link pin base directory */
    std::vector<struct att_record> records;  /* in attach order         */
};

std::string att_pin_path(const std::string &pin_dir, const std::string &if_name);

int32_t att_resolve(const std::vector<std::string> &if_names,
                    std::vector<uint32_t> *if_indices);
int32_t att_attach(struct att_registry *reg, int32_t prog_fd,
                   const std::vector<std::string> &if_names);
int32_t att_adopt(struct att_registry *reg,
                  const std::vector<std::string> &if_names,
                  const std::vector<uint32_t> &if_indices);
int32_t att_detach_all(struct att_registry *reg);
void    att_release(struct att_registry *reg);
